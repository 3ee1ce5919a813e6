#include "tests/test_fixtures.h"
#include "weft/core/errors.h"
#include <algorithm>
#include <string>

using namespace weft_test;

class MeasureTest : public RendererFixture {};

// =============================================================================
// Plain measuring
// =============================================================================

TEST_F(MeasureTest, EmptyText) {
    EXPECT_EQ(renderer.measure(""), fract::Rect());
}

TEST_F(MeasureTest, SingleLine) {
    const fract::Rect rect = renderer.measure("hey");
    EXPECT_EQ(rect.min, fract::Point(0, 0));
    EXPECT_EQ(rect.width(), 3 * kAdvance);
    EXPECT_EQ(rect.height(), kLineHeight);
}

TEST_F(MeasureTest, WidthGrowsWithText) {
    const fract::Rect shorter = renderer.measure("hey h");
    const fract::Rect longer = renderer.measure("hey ho");
    EXPECT_GT(longer.width(), shorter.width());
    EXPECT_EQ(longer.height(), shorter.height());
}

TEST_F(MeasureTest, PeriodAddsWidth) {
    EXPECT_GT(width("hey ho.hey ho"), 2 * width("hey ho"));
}

TEST_F(MeasureTest, LoneBreakTakesOneLine) {
    EXPECT_EQ(height("\n"), height("A"));
    EXPECT_EQ(width("\n"), 0);
}

TEST_F(MeasureTest, ConsecutiveBreaks) {
    EXPECT_EQ(height("\n\n"), 2 * kLineHeight);
    EXPECT_EQ(height("a\n\nb"), 3 * kLineHeight);
    EXPECT_EQ(height("a\n"), 2 * kLineHeight);
}

TEST_F(MeasureTest, WidestLineWins) {
    const fract::Rect rect = renderer.measure("ab\nabcd\nabc");
    EXPECT_EQ(rect.width(), 4 * kAdvance);
    EXPECT_EQ(rect.height(), 3 * kLineHeight);
}

TEST_F(MeasureTest, KerningApplied) {
    // 8.25 + 8 - 1, quantized at every kern
    EXPECT_EQ(width("AV"), fract::quantizeUp(kAAdvance + kAVKern, 64) + kAdvance);
    EXPECT_LT(width("AV"), width("VA"));
}

TEST_F(MeasureTest, QuantizationRoundsWidth) {
    EXPECT_EQ(width("A"), fract::quantizeUp(kAAdvance, 64));
    renderer.setQuantization(Quantization::None, Quantization::None);
    EXPECT_EQ(width("A"), kAAdvance);
}

TEST_F(MeasureTest, DirectionSymmetry) {
    renderer.setQuantization(Quantization::None, Quantization::None);
    const std::string texts[] = {"hello", "AVA. V", "a b  c", "AAV\nVA"};
    for (const std::string& text : texts) {
        std::string reversed(text.rbegin(), text.rend());
        renderer.setDirection(Direction::LeftToRight);
        const fract::Rect ltr = renderer.measure(text);
        renderer.setDirection(Direction::RightToLeft);
        const fract::Rect rtl = renderer.measure(reversed);
        EXPECT_EQ(ltr.width(), rtl.width()) << text;
        EXPECT_EQ(ltr.height(), rtl.height()) << text;
    }
}

TEST_F(MeasureTest, ScaleAffectsMetrics) {
    renderer.setScale(2.0f);
    EXPECT_EQ(renderer.fract().scaledSize(), 2 * kSize16);
    EXPECT_EQ(width("ab"), 4 * kAdvance);
    EXPECT_EQ(height("ab"), 2 * kLineHeight);
}

TEST_F(MeasureTest, MissingGlyphThrows) {
    try {
        renderer.measure("a\xC3\xA9");
        FAIL() << "expected MissingGlyphError";
    } catch (const MissingGlyphError& e) {
        EXPECT_EQ(e.codePoint(), U'é');
    }
}

TEST_F(MeasureTest, MissHandlerSubstitutesOrSkips) {
    renderer.glyph().setMissHandler([](const Font&, char32_t) { return std::optional<GlyphIndex>('?'); });
    EXPECT_EQ(width("a\xC3\xA9"), 2 * kAdvance);

    renderer.glyph().setMissHandler([](const Font&, char32_t) { return std::optional<GlyphIndex>(); });
    EXPECT_EQ(width("a\xC3\xA9"), kAdvance);
}

TEST_F(MeasureTest, RequiresFont) {
    renderer.setFont(nullptr);
    EXPECT_THROW(renderer.measure("a"), ConfigError);
    EXPECT_THROW(renderer.lineHeight(), ConfigError);
}

TEST_F(MeasureTest, MetricPassthroughs) {
    EXPECT_EQ(renderer.ascent(), kAscent);
    EXPECT_EQ(renderer.descent(), kDescent);
    EXPECT_EQ(renderer.lineHeight(), kLineHeight);
    EXPECT_EQ(renderer.lineAdvance(2), kLineHeight);
    EXPECT_EQ(renderer.xHeight(), kXHeight);
    EXPECT_EQ(renderer.capHeight(), kCapHeight);
}

// =============================================================================
// Measuring with wrap
// =============================================================================

TEST_F(MeasureTest, WrapMatchesExplicitBreaks) {
    const fract::Unit limit = width("hello world");
    const fract::Rect wrapped = renderer.fract().measureWithWrap(
        "hello world hello world hello world\ngoodbye", limit);
    EXPECT_EQ(wrapped.width(), width("hello world"));
    EXPECT_EQ(wrapped.height(), height("hello world\nhello world\nhello world\ngoodbye"));
}

TEST_F(MeasureTest, WrapAlwaysPlacesOneGlyph) {
    const fract::Rect wrapped = renderer.measureWithWrap(".", 0);
    EXPECT_EQ(wrapped.height(), height("\n"));
    EXPECT_EQ(wrapped.width(), width("."));

    const fract::Rect letters = renderer.measureWithWrap("abc", 0);
    EXPECT_EQ(letters.width(), kAdvance);
    EXPECT_EQ(letters.height(), 3 * kLineHeight);
}

TEST_F(MeasureTest, WrapWithHugeLimitMatchesMeasure) {
    const std::string texts[] = {"hey ho", "AV a.b\nxy", "a  b", "\nab\n"};
    for (const std::string& text : texts) {
        EXPECT_EQ(renderer.measureWithWrap(text, 100000).width(), width(text)) << text;
        EXPECT_EQ(renderer.measureWithWrap(text, 100000).height(), height(text)) << text;
    }
}

TEST_F(MeasureTest, WrapBreaksAtLastSpace) {
    // "ab cd" does not fit in 4 glyphs; the break goes after "ab"
    const fract::Rect rect = renderer.fract().measureWithWrap("ab cd", 4 * kAdvance);
    EXPECT_EQ(rect.width(), 2 * kAdvance);
    EXPECT_EQ(rect.height(), 2 * kLineHeight);
}

TEST_F(MeasureTest, WrapInsideLongWord) {
    const fract::Rect rect = renderer.fract().measureWithWrap("abcde", 2 * kAdvance);
    EXPECT_EQ(rect.width(), 2 * kAdvance);
    EXPECT_EQ(rect.height(), 3 * kLineHeight);
}

TEST_F(MeasureTest, TrailingElidedSpaceAddsNoLine) {
    const fract::Rect rect = renderer.fract().measureWithWrap("ab ", 2 * kAdvance);
    EXPECT_EQ(rect.width(), 2 * kAdvance);
    EXPECT_EQ(rect.height(), kLineHeight);
}

TEST_F(MeasureTest, WrapRightToLeft) {
    renderer.setDirection(Direction::RightToLeft);
    const fract::Rect rect = renderer.fract().measureWithWrap("ab cd", 4 * kAdvance);
    EXPECT_EQ(rect.width(), 2 * kAdvance);
    EXPECT_EQ(rect.height(), 2 * kLineHeight);
}

TEST_F(MeasureTest, WrapNegativeLimitThrows) {
    EXPECT_THROW(renderer.measureWithWrap("a", -1), ConfigError);
}
