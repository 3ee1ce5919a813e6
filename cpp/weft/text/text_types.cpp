#include "weft/text/text_types.h"

namespace weft {

bool isValidAlign(Align align) {
    std::uint8_t vert = static_cast<std::uint8_t>(vertOf(align));
    std::uint8_t horz = static_cast<std::uint8_t>(horzOf(align));
    if (vert == 0 && horz == 0) return false;
    if (vert > static_cast<std::uint8_t>(Align::LastBaseline)) return false;
    return horz == 0
        || horz == static_cast<std::uint8_t>(Align::Left)
        || horz == static_cast<std::uint8_t>(Align::HorzCenter)
        || horz == static_cast<std::uint8_t>(Align::Right);
}

Align adjustedAlign(Align current, Align next) {
    Align vert = vertOf(next) != Align::None ? vertOf(next) : vertOf(current);
    Align horz = horzOf(next) != Align::None ? horzOf(next) : horzOf(current);
    return vert | horz;
}

std::string toString(Align align) {
    std::string out;
    switch (vertOf(align)) {
        case Align::Top: out = "Top"; break;
        case Align::CapLine: out = "CapLine"; break;
        case Align::Midline: out = "Midline"; break;
        case Align::VertCenter: out = "VertCenter"; break;
        case Align::Baseline: out = "Baseline"; break;
        case Align::Bottom: out = "Bottom"; break;
        case Align::LastBaseline: out = "LastBaseline"; break;
        default: break;
    }
    const char* horz = nullptr;
    switch (horzOf(align)) {
        case Align::Left: horz = "Left"; break;
        case Align::HorzCenter: horz = "HorzCenter"; break;
        case Align::Right: horz = "Right"; break;
        default: break;
    }
    if (horz) {
        if (!out.empty()) out += " | ";
        out += horz;
    }
    return out.empty() ? "None" : out;
}

} // namespace weft
