#include "weft/sizer/static_sizer.h"

namespace weft {

void StaticSizer::notifyChange(const Font& font, fract::Unit size) {
    DefaultSizer::notifyChange(font, size);
    cachedAscent_ = fract::mulUp(size, config_.ascentMult);
    cachedDescent_ = fract::mulUp(size, config_.descentMult);
    cachedLineHeight_ = fract::mulUp(size, config_.lineGapMult) + cachedAscent_ + cachedDescent_;
}

} // namespace weft
