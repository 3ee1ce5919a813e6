#include "tests/test_fixtures.h"
#include "weft/core/errors.h"
#include "weft/render/feed.h"

using namespace weft_test;

class FeedTest : public RendererFixture {
protected:
    DrawRecorder recorder{renderer};
    Feed feed{renderer};
};

TEST_F(FeedTest, AtBaselineKeepsY) {
    feed.at(10, 20);
    EXPECT_EQ(feed.position, fract::Point::fromInts(10, 20));
    EXPECT_EQ(feed.lineBreakX, fract::fromInt(10));
    EXPECT_EQ(feed.lineBreakAcc, -1);

    feed.fractAt(0, 1300);
    EXPECT_EQ(feed.position.y, 1300);
}

TEST_F(FeedTest, AtResolvesVerticalAlign) {
    renderer.setAlign(Align::Top);
    feed.at(10, 20);
    EXPECT_EQ(feed.position.y, fract::fromInt(20) + kAscent);

    renderer.setAlign(Align::VertCenter);
    feed.at(10, 20);
    EXPECT_EQ(feed.position.y, fract::fromInt(20) + kAscent - kLineHeight / 2);

    renderer.setAlign(Align::LastBaseline);
    feed.at(10, 20);
    EXPECT_EQ(feed.position.y, fract::fromInt(20));
}

TEST_F(FeedTest, DrawsWithKerningAndQuantization) {
    feed.at(10, 20);
    feed.draw(target, 'A');
    feed.draw(target, 'V');

    ASSERT_EQ(recorder.glyphs.size(), 2u);
    EXPECT_EQ(recorder.glyphs[0].origin.x, fract::fromInt(10));
    EXPECT_EQ(recorder.glyphs[1].origin.x, fract::quantizeUp(fract::fromInt(10) + kAAdvance + kAVKern, 64));
    EXPECT_EQ(feed.position.x, recorder.glyphs[1].origin.x + kAdvance);
    EXPECT_EQ(feed.lineBreakAcc, 0);
    EXPECT_EQ(feed.prevGlyph, static_cast<GlyphIndex>('V'));
}

TEST_F(FeedTest, QuantizesFractionalY) {
    feed.fractAt(0, 1300);
    feed.draw(target, 'a');
    EXPECT_EQ(recorder.glyphs[0].origin.y, fract::quantizeUp(1300, 64));
}

TEST_F(FeedTest, LineBreaks) {
    feed.at(10, 20);
    feed.draw(target, 'A');
    feed.lineBreak();
    EXPECT_EQ(feed.position, fract::Point(fract::fromInt(10), fract::fromInt(20) + kLineHeight));
    EXPECT_EQ(feed.lineBreakAcc, 1);

    feed.advance('\n');
    EXPECT_EQ(feed.lineBreakAcc, 2);
    EXPECT_EQ(feed.position.y, fract::fromInt(20) + 2 * kLineHeight);

    // no kerning with the glyph before the break
    feed.draw(target, 'V');
    EXPECT_EQ(recorder.glyphs.back().origin.x, fract::fromInt(10));
}

TEST_F(FeedTest, AdvanceMatchesDrawWithoutDrawing) {
    feed.at(0, 20);
    feed.advance('A');
    feed.advanceGlyph('V');
    EXPECT_TRUE(recorder.glyphs.empty());

    Feed drawing(renderer);
    drawing.at(0, 20);
    drawing.draw(target, 'A');
    drawing.drawGlyph(target, 'V');
    EXPECT_EQ(feed.position, drawing.position);
}

TEST_F(FeedTest, RightToLeft) {
    renderer.setDirection(Direction::RightToLeft);
    feed.at(100, 20);
    feed.draw(target, 'a');
    feed.draw(target, 'b');
    EXPECT_EQ(recorder.glyphs[0].origin.x, fract::fromInt(100) - kAdvance);
    EXPECT_EQ(recorder.glyphs[1].origin.x, fract::fromInt(100) - 2 * kAdvance);
    EXPECT_EQ(feed.position.x, recorder.glyphs[1].origin.x);
}

TEST_F(FeedTest, SkippedCodePointDoesNotMove) {
    renderer.glyph().setMissHandler([](const Font&, char32_t) { return std::optional<GlyphIndex>(); });
    feed.at(10, 20);
    feed.draw(target, U'é');
    EXPECT_TRUE(recorder.glyphs.empty());
    EXPECT_EQ(feed.position.x, fract::fromInt(10));
}

TEST_F(FeedTest, Reset) {
    feed.at(10, 20);
    feed.draw(target, 'a');
    feed.reset();
    EXPECT_EQ(feed.position, fract::Point());
    EXPECT_EQ(feed.lineBreakX, 0);
    EXPECT_EQ(feed.lineBreakAcc, -1);
    EXPECT_EQ(feed.prevGlyph, 0);
    EXPECT_EQ(&feed.renderer(), &renderer);
}

TEST_F(FeedTest, RequiresFont) {
    renderer.setFont(nullptr);
    EXPECT_THROW(feed.advance('a'), ConfigError);
    EXPECT_THROW(feed.lineBreak(), ConfigError);
}
