#ifndef WEFT_CORE_ERRORS_H
#define WEFT_CORE_ERRORS_H

#include <stdexcept>
#include <string>

namespace weft {

/**
 * Base class for every error raised by weft. Errors are programming or data
 * corruption conditions reported synchronously at the offending call.
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Invalid renderer configuration: missing font, sizer or rasterizer,
 * invalid align or quantization, negative limits, unknown effect keys.
 */
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message) : Error(message) {}
};

/**
 * The active font has no glyph for a code point and no miss handler
 * has been installed.
 */
class MissingGlyphError : public Error {
public:
    MissingGlyphError(char32_t codePoint, const std::string& message)
        : Error(message), codePoint_(codePoint) {}

    char32_t codePoint() const { return codePoint_; }

private:
    char32_t codePoint_;
};

/**
 * Twine buffer that can't be interpreted: unknown control codes,
 * truncated payloads, unbalanced pops or bad spacing blocks.
 */
class MalformedTwineError : public Error {
public:
    explicit MalformedTwineError(const std::string& message) : Error(message) {}
};

/**
 * Operation combination that exists in the API but has no implementation.
 */
class UnimplementedError : public Error {
public:
    explicit UnimplementedError(const std::string& message) : Error(message) {}
};

} // namespace weft

#endif // WEFT_CORE_ERRORS_H
