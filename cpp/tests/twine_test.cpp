#include <gtest/gtest.h>
#include "weft/core/errors.h"
#include "weft/twine/effect.h"
#include "weft/twine/effect_list.h"
#include "weft/twine/effect_spacing.h"
#include "weft/twine/twine.h"
#include <string>
#include <vector>

using namespace weft;

namespace {

std::vector<int> bytesOf(const std::string& buffer) {
    std::vector<int> out;
    for (char c : buffer) {
        out.push_back(static_cast<std::uint8_t>(c));
    }
    return out;
}

std::vector<int> bytesOf(const Twine& twine) {
    return bytesOf(twine.buffer());
}

} // namespace

// =============================================================================
// Twine encoding
// =============================================================================

TEST(TwineEncodingTest, TextAndGlyphModes) {
    Twine twine;
    twine.add("ab").addGlyph(5).addGlyph(0).add("c");
    const std::vector<int> expected = {
        'a', 'b',
        0x1F, 0x03,       // switch to glyph mode
        0x05, 0x00,
        0x00, 0x00, 0x00, // glyph 0
        0x00, 0x00, 0x1F, 0x04,
        'c',
    };
    EXPECT_EQ(bytesOf(twine), expected);
    EXPECT_FALSE(twine.inGlyphMode());
}

TEST(TwineEncodingTest, ControlCodeInGlyphMode) {
    Twine twine;
    twine.addGlyphs({0x0102}).pop();
    const std::vector<int> expected = {0x1F, 0x03, 0x02, 0x01, 0x00, 0x00, 0x1F, 0x00};
    EXPECT_EQ(bytesOf(twine), expected);
    EXPECT_TRUE(twine.inGlyphMode());
}

TEST(TwineEncodingTest, BuiltinEffects) {
    EXPECT_EQ(bytesOf(Twine().pushColor(Color{1, 2, 3, 4})),
              (std::vector<int>{0x1F, 0x05, kEffectPushColor, 4, 1, 2, 3, 4}));
    EXPECT_EQ(bytesOf(Twine().pushFont(2)), (std::vector<int>{0x1F, 0x06, kEffectPushFont, 1, 2}));
    EXPECT_EQ(bytesOf(Twine().shiftSize(-2)), (std::vector<int>{0x1F, 0x06, kEffectShiftSize, 1, 0xFE}));
    EXPECT_EQ(bytesOf(Twine().setSize(20.0f)), (std::vector<int>{0x1F, 0x06, kEffectSetSize, 3, 0x00, 0x05, 0x00}));
}

TEST(TwineEncodingTest, PlainControlCodes) {
    Twine twine;
    twine.pop().popAll().refreshLineMetrics().pushLineRestartMarker().clearLineRestartMarker().pushMotion(3, {9});
    const std::vector<int> expected = {
        0x1F, 0x00, 0x1F, 0x01, 0x1F, 0x02, 0x1F, 0x09, 0x1F, 0x0A,
        0x1F, 0x08, 3, 1, 9,
    };
    EXPECT_EQ(bytesOf(twine), expected);
}

TEST(TwineEncodingTest, EffectWithSpacing) {
    EffectSpacing spacing;
    spacing.prePad = 64;
    spacing.postPad = -64;

    Twine twine;
    twine.pushEffectWithSpacing(7, EffectMode::SinglePass, spacing);
    const std::vector<int> expected = {
        0x1F, 0x07,
        0x02, 0x40, 0x00, 0x00, 0xC0, 0xFF, 0xFF,
        0x05, 7, 0,
    };
    EXPECT_EQ(bytesOf(twine), expected);
}

TEST(TwineEncodingTest, RejectsInvalidInput) {
    Twine twine;
    twine.add("ok");
    EXPECT_THROW(twine.add("a\x1F"), ConfigError);
    EXPECT_THROW(twine.addRune(0x1F), ConfigError);
    EXPECT_THROW(twine.pushEffect(1, EffectMode::SinglePass, std::vector<std::uint8_t>(256, 0)), ConfigError);
    EXPECT_THROW(twine.pushEffectWithSpacing(1, EffectMode::SinglePass, EffectSpacing()), ConfigError);
    EXPECT_EQ(twine.buffer(), "ok");
}

TEST(TwineEncodingTest, Reset) {
    Twine twine;
    twine.addGlyph(3);
    twine.reset();
    EXPECT_TRUE(twine.empty());
    EXPECT_FALSE(twine.inGlyphMode());
}

// =============================================================================
// Effect spacing
// =============================================================================

TEST(EffectSpacingTest, PartCountFollowsFields) {
    struct Case {
        EffectSpacing spacing;
        int parts;
    };
    EffectSpacing minWidthOnly;
    minWidthOnly.minWidth = 100;
    EffectSpacing pads;
    pads.postPad = 5;
    EffectSpacing padsAndMinWidth = pads;
    padsAndMinWidth.minWidth = 100;
    EffectSpacing linePads;
    linePads.lineBreakPad = 3;
    EffectSpacing all = padsAndMinWidth;
    all.lineStartPad = 2;

    const Case cases[] = {{minWidthOnly, 1}, {pads, 2}, {padsAndMinWidth, 3}, {linePads, 4}, {all, 5}};
    for (const Case& c : cases) {
        std::string buffer;
        c.spacing.appendTo(buffer);
        ASSERT_EQ(buffer.size(), 1u + 3u * static_cast<std::size_t>(c.parts));
        EXPECT_EQ(static_cast<std::uint8_t>(buffer[0]) & 0x3F, c.parts);

        std::size_t pos = 0;
        EXPECT_EQ(EffectSpacing::decode(buffer, pos), c.spacing);
        EXPECT_EQ(pos, buffer.size());
    }
}

TEST(EffectSpacingTest, LogicalFlags) {
    EffectSpacing spacing;
    spacing.prePad = 64;
    spacing.minWidth = 128;
    spacing.arePadsLogical = true;
    spacing.isMinWidthLogical = true;

    std::string buffer;
    spacing.appendTo(buffer);
    EXPECT_EQ(static_cast<std::uint8_t>(buffer[0]) & 0xC0, 0xC0);

    std::size_t pos = 0;
    const EffectSpacing decoded = EffectSpacing::decode(buffer, pos);
    EXPECT_TRUE(decoded.arePadsLogical);
    EXPECT_TRUE(decoded.isMinWidthLogical);
}

TEST(EffectSpacingTest, LogicalValuesScaleFrom16px) {
    EffectSpacing spacing;
    spacing.prePad = 64;
    spacing.postPad = 32;
    spacing.minWidth = 64;
    spacing.arePadsLogical = true;

    EXPECT_EQ(spacing.prePadAt(fract::fromInt(32)), 128);
    EXPECT_EQ(spacing.postPadAt(fract::fromInt(8)), 16);
    EXPECT_EQ(spacing.minWidthAt(fract::fromInt(32)), 64);
}

TEST(EffectSpacingTest, SignedRangeLimits) {
    for (fract::Unit value : {kMaxEncodedUnit, -kMaxEncodedUnit, -1, 0, 12345}) {
        std::string buffer;
        appendUnit24(buffer, value);
        ASSERT_EQ(buffer.size(), 3u);
        EXPECT_EQ(readUnit24(buffer, 0), value);
    }

    std::string buffer;
    EXPECT_THROW(appendUnit24(buffer, kMaxEncodedUnit + 1), ConfigError);
    EXPECT_THROW(appendUnit24(buffer, -kMaxEncodedUnit - 1), ConfigError);
    EXPECT_TRUE(buffer.empty());
}

TEST(EffectSpacingTest, MalformedBlocks) {
    std::size_t pos = 0;
    EXPECT_THROW(EffectSpacing::decode(std::string(), pos), MalformedTwineError);

    const std::string zeroParts("\x00", 1);
    pos = 0;
    EXPECT_THROW(EffectSpacing::decode(zeroParts, pos), MalformedTwineError);

    const std::string sixParts = "\x06" + std::string(18, '\0');
    pos = 0;
    EXPECT_THROW(EffectSpacing::decode(sixParts, pos), MalformedTwineError);

    const std::string truncated("\x02\x01\x00\x00", 4);
    pos = 0;
    EXPECT_THROW(EffectSpacing::decode(truncated, pos), MalformedTwineError);
}

// =============================================================================
// Effect list
// =============================================================================

namespace {

EffectOperation operation(EffectKey key, EffectMode mode = EffectMode::SinglePass) {
    EffectOperation op;
    op.key = key;
    op.mode = mode;
    op.payloadStart = key;
    return op;
}

std::vector<int> activeKeys(EffectList& list) {
    std::vector<int> keys;
    list.forEachActive([&](EffectOperation& op) { keys.push_back(op.key); });
    return keys;
}

} // namespace

TEST(EffectListTest, PushAndHardPop) {
    EffectList list;
    list.push(operation(1));
    list.push(operation(2, EffectMode::DoublePass));
    EXPECT_EQ(list.activeCount(), 2u);
    EXPECT_EQ(list.activeDoublePassCount(), 1u);
    EXPECT_EQ(list.head()->key, 2);

    list.hardPop();
    EXPECT_EQ(list.totalCount(), 1u);
    EXPECT_EQ(list.activeDoublePassCount(), 0u);
    EXPECT_EQ(list.head()->key, 1);

    list.hardPop();
    EXPECT_EQ(list.head(), nullptr);
    EXPECT_THROW(list.hardPop(), MalformedTwineError);
    EXPECT_THROW(list.softPop(), MalformedTwineError);
}

TEST(EffectListTest, SoftPopThenRecall) {
    EffectList list;
    list.push(operation(1));
    list.push(operation(2));
    list.softPop();
    list.softPop();
    EXPECT_EQ(list.activeCount(), 0u);
    EXPECT_EQ(list.totalCount(), 2u);

    EffectOperation* recalled = list.tryRecallNext();
    ASSERT_NE(recalled, nullptr);
    EXPECT_EQ(recalled->key, 1);
    recalled = list.tryRecallNext();
    ASSERT_NE(recalled, nullptr);
    EXPECT_EQ(recalled->key, 2);
    EXPECT_EQ(list.tryRecallNext(), nullptr);
}

TEST(EffectListTest, HardPopAfterRecall) {
    EffectList list;
    list.push(operation(1));
    list.push(operation(2));
    list.rewind(0);
    EXPECT_EQ(activeKeys(list), std::vector<int>());

    list.tryRecallNext();
    list.hardPop();
    EXPECT_EQ(list.totalCount(), 1u);
    EXPECT_EQ(list.head(), nullptr);
    EXPECT_EQ(list.tryRecallNext()->key, 2);
    EXPECT_EQ(list.head()->key, 2);
}

TEST(EffectListTest, RewindToLineStart) {
    EffectList list;
    list.push(operation(1));
    list.push(operation(2));
    list.softPop();
    list.push(operation(3));

    // two entries were active when the line started
    list.rewind(2);
    EXPECT_EQ(activeKeys(list), (std::vector<int>{1, 2}));
    EXPECT_EQ(list.head()->key, 2);
    EXPECT_EQ(list.tryRecallNext()->key, 3);

    EXPECT_THROW(list.rewind(5), MalformedTwineError);
}

TEST(EffectListTest, ReverseIteration) {
    EffectList list;
    list.push(operation(1));
    list.push(operation(2));
    list.push(operation(3));
    list.softPop();

    std::vector<int> keys;
    list.forEachActiveReverse([&](EffectOperation& op) { keys.push_back(op.key); });
    EXPECT_EQ(keys, (std::vector<int>{2, 1}));

    list.clear();
    EXPECT_EQ(list.totalCount(), 0u);
    EXPECT_EQ(list.head(), nullptr);
}

// =============================================================================
// Effect arguments
// =============================================================================

TEST(EffectArgsTest, ContentRect) {
    EffectArgs args;
    args.origin = fract::Point(100, 50);
    args.prePad = 10;
    args.knownWidth = 30;
    args.lineAscent = 12;
    args.lineDescent = 4;
    EXPECT_EQ(args.contentRect(), fract::Rect(110, 38, 140, 54));

    args.rightToLeft = true;
    EXPECT_EQ(args.contentRect(), fract::Rect(60, 38, 90, 54));
}

TEST(EffectArgsTest, PayloadSize) {
    const std::uint8_t bytes[] = {1, 2};
    EffectArgs args;
    args.payload = PayloadView{bytes, 2};
    EXPECT_NO_THROW(args.requirePayloadSize(2));
    EXPECT_THROW(args.requirePayloadSize(3), MalformedTwineError);
    EXPECT_EQ(args.payload[1], 2);
    EXPECT_TRUE(args.drawing());
    EXPECT_STREQ(toString(EffectTrigger::LineBreak), "LineBreak");
}
