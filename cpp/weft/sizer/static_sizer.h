#ifndef WEFT_SIZER_STATIC_SIZER_H
#define WEFT_SIZER_STATIC_SIZER_H

#include "weft/sizer/default_sizer.h"

namespace weft {

/**
 * StaticSizer: vertical metrics defined as multipliers of the scaled size
 * instead of read from the font. Advances and kerning still come from the
 * font. A multiplier of 1.0 is fract::kOne.
 */
class StaticSizer : public DefaultSizer {
public:
    struct Config {
        fract::Unit ascentMult = 51;   // ~0.8
        fract::Unit descentMult = 13;  // ~0.2
        fract::Unit lineGapMult = 0;
    };

    StaticSizer() = default;
    explicit StaticSizer(const Config& config) : config_(config) {}

    // Takes effect on the next notifyChange().
    void setConfig(const Config& config) { config_ = config; }
    const Config& config() const { return config_; }

    void notifyChange(const Font& font, fract::Unit size) override;

private:
    Config config_;
};

} // namespace weft

#endif // WEFT_SIZER_STATIC_SIZER_H
