#include "weft/fract/fract.h"
#include "weft/core/errors.h"

#include <cmath>
#include <cstdio>

namespace weft::fract {

Unit fromFloatUp(double value) {
    return static_cast<Unit>(std::ceil(value * 64.0));
}

Unit fromFloatDown(double value) {
    return static_cast<Unit>(std::floor(value * 64.0));
}

bool isValidStep(Unit step) {
    return step >= 1 && step <= 64 && (step & (step - 1)) == 0;
}

Unit quantizeUp(Unit value, Unit step) {
    if (!isValidStep(step)) {
        throw ConfigError("invalid quantization step " + std::to_string(step));
    }
    Unit mod = fractShift(value) % step;
    if (mod == 0) return value;
    return value - mod + step;
}

Unit quantizeDown(Unit value, Unit step) {
    if (!isValidStep(step)) {
        throw ConfigError("invalid quantization step " + std::to_string(step));
    }
    return value - fractShift(value) % step;
}

Unit mul(Unit a, Unit b) {
    std::int64_t m = static_cast<std::int64_t>(a) * static_cast<std::int64_t>(b);
    if (m >= 0) return static_cast<Unit>((m + 32) >> 6);
    return static_cast<Unit>((m + 31) >> 6);
}

Unit mulUp(Unit a, Unit b) {
    std::int64_t m = static_cast<std::int64_t>(a) * static_cast<std::int64_t>(b);
    return static_cast<Unit>((m + 32) >> 6);
}

Unit mulDown(Unit a, Unit b) {
    std::int64_t m = static_cast<std::int64_t>(a) * static_cast<std::int64_t>(b);
    return static_cast<Unit>((m + 31) >> 6);
}

Unit div(Unit a, Unit b) {
    std::int64_t num = static_cast<std::int64_t>(a) << 7;
    std::int64_t den = static_cast<std::int64_t>(b) << 1;
    if ((a >= 0) == (b >= 0)) {
        num += b;
    } else {
        num -= b;
    }
    return static_cast<Unit>(num / den);
}

Unit rescale(Unit value, Unit from, Unit to) {
    std::int64_t num = (static_cast<std::int64_t>(value) * static_cast<std::int64_t>(to)) * 2;
    std::int64_t den = static_cast<std::int64_t>(from) * 2;
    if ((num >= 0) == (from >= 0)) {
        num += from;
    } else {
        num -= from;
    }
    return static_cast<Unit>(num / den);
}

std::string toString(Unit value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f", toFloat(value));
    return buffer;
}

std::string toString(const Point& point) {
    return "(" + toString(point.x) + ", " + toString(point.y) + ")";
}

std::string toString(const Rect& rect) {
    return "[" + toString(rect.min) + " - " + toString(rect.max) + "]";
}

} // namespace weft::fract
