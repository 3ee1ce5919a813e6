#ifndef WEFT_TWINE_EFFECT_LIST_H
#define WEFT_TWINE_EFFECT_LIST_H

#include "weft/fract/fract.h"
#include "weft/twine/effect_spacing.h"
#include "weft/twine/twine.h"
#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

namespace weft {

/**
 * An effect pushed by a twine, with its bookkeeping for the current line.
 */
struct EffectOperation {
    EffectKey key = 0;
    EffectMode mode = EffectMode::SinglePass;
    std::size_t payloadStart = 0;
    std::size_t payloadEnd = 0;
    std::optional<EffectSpacing> spacing;

    fract::Point origin;
    fract::Unit contentStartX = 0;
    fract::Unit knownWidth = 0;
    bool forceLineBreakPostPad = false;

    bool softPopped = false;
};

/**
 * EffectList: stack of effects supporting reversible pops.
 *
 * Entries are kept in push order. A soft pop only deactivates the head so
 * it can be recalled later in the same order; a hard pop removes it.
 * While measuring a line pops are soft, and before drawing the line the
 * stack is rewound to the effects active at the line start.
 */
class EffectList {
public:
    void clear();

    void push(const EffectOperation& operation);

    /**
     * Reactivate the soft popped entry that follows the active head.
     * @return The recalled entry, or nullptr if there is none
     * @throws MalformedTwineError if the following entry is still active
     */
    EffectOperation* tryRecallNext();

    // @throws MalformedTwineError if no effect is active
    EffectOperation& softPop();
    void hardPop();

    // Newest active entry, or nullptr.
    EffectOperation* head();

    /**
     * Soft pop every active entry, then recall the first count entries.
     * @throws MalformedTwineError if fewer than count entries exist
     */
    void rewind(std::size_t count);

    std::size_t activeCount() const { return activeCount_; }
    std::size_t totalCount() const { return entries_.size(); }
    std::size_t activeDoublePassCount() const { return activeDoublePassCount_; }

    // Active entries, oldest first.
    void forEachActive(const std::function<void(EffectOperation&)>& fn);
    // Active entries, newest first.
    void forEachActiveReverse(const std::function<void(EffectOperation&)>& fn);

private:
    static constexpr std::size_t kNone = static_cast<std::size_t>(-1);

    void refreshActiveHead(std::size_t from);
    void onActivated(const EffectOperation& operation);
    void onDeactivated(const EffectOperation& operation);

    std::vector<EffectOperation> entries_;
    std::size_t activeHead_ = kNone;
    std::size_t activeCount_ = 0;
    std::size_t activeDoublePassCount_ = 0;
};

} // namespace weft

#endif // WEFT_TWINE_EFFECT_LIST_H
