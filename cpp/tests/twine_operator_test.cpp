#include "weft/twine/twine_operator.h"
#include "tests/test_fixtures.h"
#include "weft/core/utf8.h"
#include "weft/twine/twine_context.h"
#include <string>
#include <vector>

using namespace weft_test;

class TwineOperatorTest : public RendererFixture {
protected:
    TwineContext context;
    std::vector<std::string> calls;

    void SetUp() override {
        RendererFixture::SetUp();
        registerBuiltinEffects(context);
        context.effects[1] = [this](Renderer&, Target*, const EffectArgs& args) {
            calls.push_back(std::string(toString(args.trigger)) + (args.measuring ? "(m)" : "(d)"));
        };
    }
};

TEST_F(TwineOperatorTest, MeasureLineByLine) {
    Twine twine;
    twine.add("ab\nc");
    TwineOperator op(renderer, context, twine);
    LayoutCursor cursor;

    const TwineOperator::LineMeasure first = op.measureLine(cursor);
    EXPECT_EQ(first.width, 2 * kAdvance);
    EXPECT_EQ(first.terminal, U'\n');
    EXPECT_TRUE(first.hasContent);

    cursor.increaseLineBreakNth();
    EXPECT_EQ(op.advanceLine(0, cursor.lineBreakNth), kLineHeight);

    const TwineOperator::LineMeasure second = op.measureLine(cursor);
    EXPECT_EQ(second.width, kAdvance);
    EXPECT_EQ(second.terminal, utf8::kEndOfText);
}

TEST_F(TwineOperatorTest, MeasureAheadSkipsSinglePassEffects) {
    Twine twine;
    twine.pushEffect(1, EffectMode::SinglePass).add("a").pop();

    TwineOperator ahead(renderer, context, twine);
    LayoutCursor cursor;
    EXPECT_EQ(ahead.measureLine(cursor, false).width, kAdvance);
    EXPECT_TRUE(calls.empty());

    TwineOperator standalone(renderer, context, twine);
    LayoutCursor other;
    EXPECT_EQ(standalone.measureLine(other).width, kAdvance);
    const std::vector<std::string> expected = {"Push(m)", "Pop(m)"};
    EXPECT_EQ(calls, expected);
}

TEST_F(TwineOperatorTest, MeasureAheadKeepsDoublePassEffects) {
    Twine twine;
    twine.pushEffect(1, EffectMode::DoublePass).add("a").pop();

    TwineOperator op(renderer, context, twine);
    LayoutCursor cursor;
    op.measureLine(cursor, false);
    const std::vector<std::string> expected = {"Push(m)", "Pop(m)"};
    EXPECT_EQ(calls, expected);
}
