#include "weft/twine/effect_list.h"
#include "weft/core/errors.h"

namespace weft {

void EffectList::clear() {
    entries_.clear();
    activeHead_ = kNone;
    activeCount_ = 0;
    activeDoublePassCount_ = 0;
}

void EffectList::push(const EffectOperation& operation) {
    entries_.push_back(operation);
    entries_.back().softPopped = false;
    activeHead_ = entries_.size() - 1;
    onActivated(entries_.back());
}

EffectOperation* EffectList::tryRecallNext() {
    const std::size_t index = activeHead_ == kNone ? 0 : activeHead_ + 1;
    if (index >= entries_.size()) {
        return nullptr;
    }

    EffectOperation& operation = entries_[index];
    if (!operation.softPopped) {
        throw MalformedTwineError("effect stack out of sync: recalled effect is still active");
    }
    operation.softPopped = false;
    activeHead_ = index;
    onActivated(operation);
    return &operation;
}

EffectOperation& EffectList::softPop() {
    if (activeHead_ == kNone) {
        throw MalformedTwineError("unbalanced pop: no active effects left");
    }

    EffectOperation& operation = entries_[activeHead_];
    operation.softPopped = true;
    onDeactivated(operation);
    refreshActiveHead(activeHead_);
    return operation;
}

void EffectList::hardPop() {
    if (activeHead_ == kNone) {
        throw MalformedTwineError("unbalanced pop: no active effects left");
    }

    const std::size_t index = activeHead_;
    onDeactivated(entries_[index]);
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(index));
    refreshActiveHead(index);
}

EffectOperation* EffectList::head() {
    return activeHead_ == kNone ? nullptr : &entries_[activeHead_];
}

void EffectList::rewind(std::size_t count) {
    while (activeCount_ > 0) {
        softPop();
    }
    for (std::size_t i = 0; i < count; ++i) {
        if (!tryRecallNext()) {
            throw MalformedTwineError("effect stack out of sync: missing line start effects");
        }
    }
}

void EffectList::forEachActive(const std::function<void(EffectOperation&)>& fn) {
    for (EffectOperation& operation : entries_) {
        if (!operation.softPopped) {
            fn(operation);
        }
    }
}

void EffectList::forEachActiveReverse(const std::function<void(EffectOperation&)>& fn) {
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (!it->softPopped) {
            fn(*it);
        }
    }
}

// Sets the active head to the newest active entry before index.
void EffectList::refreshActiveHead(std::size_t from) {
    std::size_t index = from;
    while (index > 0) {
        --index;
        if (!entries_[index].softPopped) {
            activeHead_ = index;
            return;
        }
    }
    activeHead_ = kNone;
}

void EffectList::onActivated(const EffectOperation& operation) {
    ++activeCount_;
    if (operation.mode == EffectMode::DoublePass) {
        ++activeDoublePassCount_;
    }
}

void EffectList::onDeactivated(const EffectOperation& operation) {
    --activeCount_;
    if (operation.mode == EffectMode::DoublePass) {
        --activeDoublePassCount_;
    }
}

} // namespace weft
