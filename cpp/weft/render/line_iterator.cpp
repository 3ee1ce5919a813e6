#include "weft/render/line_iterator.h"

namespace weft {

bool LineIterator::next(std::string_view& line, bool& endsWithBreak) {
    if (done_) {
        return false;
    }

    std::size_t brk = text_.find('\n', pos_);
    if (brk == std::string_view::npos) {
        line = text_.substr(pos_);
        endsWithBreak = false;
        pos_ = text_.size();
        done_ = true;
        return true;
    }

    line = text_.substr(pos_, brk - pos_);
    endsWithBreak = true;
    pos_ = brk + 1;
    return true;
}

} // namespace weft
