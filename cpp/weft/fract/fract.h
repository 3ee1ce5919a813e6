#ifndef WEFT_FRACT_FRACT_H
#define WEFT_FRACT_FRACT_H

#include <cstdint>
#include <string>

namespace weft::fract {

/**
 * Fixed point value with 6 fractional bits: 64 units per pixel.
 * Positions, advances, sizes and paddings are all expressed in Units.
 */
using Unit = std::int32_t;

constexpr Unit kOne = 64;
constexpr Unit kFractMask = 0x3F;

// =============================================================================
// Conversions
// =============================================================================

constexpr Unit fromInt(int value) { return static_cast<Unit>(value * 64); }
Unit fromFloatUp(double value);
Unit fromFloatDown(double value);

constexpr double toFloat(Unit value) { return static_cast<double>(value) / 64.0; }
constexpr int toIntFloor(Unit value) { return value >> 6; }
constexpr int toIntCeil(Unit value) { return (value + 63) >> 6; }
constexpr int toIntHalfUp(Unit value) { return (value + 32) >> 6; }
constexpr int toIntHalfDown(Unit value) { return (value + 31) >> 6; }

// =============================================================================
// Rounding
// =============================================================================

constexpr bool isWhole(Unit value) { return (value & kFractMask) == 0; }

// Fractional part in [0, 63], also for negative values.
constexpr Unit fractShift(Unit value) { return value & kFractMask; }
constexpr Unit floor(Unit value) { return value & ~kFractMask; }
constexpr Unit ceil(Unit value) { return floor(value + kFractMask); }
constexpr Unit abs(Unit value) { return value >= 0 ? value : -value; }

/**
 * Round up to the next multiple of step (toward +infinity).
 * @param step Granularity in units, a power of two between 1 and 64
 * @throws ConfigError if step is not a valid granularity
 */
Unit quantizeUp(Unit value, Unit step);

/**
 * Round down to the previous multiple of step (toward -infinity).
 * @throws ConfigError if step is not a valid granularity
 */
Unit quantizeDown(Unit value, Unit step);

bool isValidStep(Unit step);

// =============================================================================
// Arithmetic
// =============================================================================

// Fixed point product, ties rounded away from zero.
Unit mul(Unit a, Unit b);
// Fixed point product, ties rounded up.
Unit mulUp(Unit a, Unit b);
// Fixed point product, ties rounded down.
Unit mulDown(Unit a, Unit b);
// Fixed point division, ties rounded away from zero.
Unit div(Unit a, Unit b);
// value * to / from with rounding, for values that scale linearly with size.
Unit rescale(Unit value, Unit from, Unit to);

// =============================================================================
// Points and rects
// =============================================================================

struct Point {
    Unit x = 0;
    Unit y = 0;

    Point() = default;
    Point(Unit px, Unit py) : x(px), y(py) {}

    static Point fromInts(int px, int py) { return Point(fromInt(px), fromInt(py)); }

    Point operator+(const Point& other) const { return Point(x + other.x, y + other.y); }
    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point& other) const { return !(*this == other); }
};

/**
 * Axis aligned rectangle. Min is inclusive, max exclusive.
 */
struct Rect {
    Point min;
    Point max;

    Rect() = default;
    Rect(Point pmin, Point pmax) : min(pmin), max(pmax) {}
    Rect(Unit minX, Unit minY, Unit maxX, Unit maxY) : min(minX, minY), max(maxX, maxY) {}

    static Rect fromInts(int minX, int minY, int maxX, int maxY) {
        return Rect(fromInt(minX), fromInt(minY), fromInt(maxX), fromInt(maxY));
    }

    Unit width() const { return max.x - min.x; }
    Unit height() const { return max.y - min.y; }
    bool empty() const { return min.x >= max.x || min.y >= max.y; }

    bool operator==(const Rect& other) const { return min == other.min && max == other.max; }
    bool operator!=(const Rect& other) const { return !(*this == other); }
};

std::string toString(Unit value);
std::string toString(const Point& point);
std::string toString(const Rect& rect);

} // namespace weft::fract

#endif // WEFT_FRACT_FRACT_H
