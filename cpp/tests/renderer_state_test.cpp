#include "tests/test_fixtures.h"
#include "weft/core/errors.h"

using namespace weft_test;

class RendererStateTest : public RendererFixture {
protected:
    RecordingCacheHandler cache;

    void SetUp() override {
        RendererFixture::SetUp();
        renderer.setCacheHandler(&cache);
        cache.resetCounts();
        sizer.notifyCount = 0;
    }

    void TearDown() override {
        renderer.setCacheHandler(nullptr);
    }
};

TEST_F(RendererStateTest, Defaults) {
    Renderer fresh;
    EXPECT_EQ(fresh.font(), nullptr);
    EXPECT_FLOAT_EQ(fresh.size(), 16.0f);
    EXPECT_FLOAT_EQ(fresh.scale(), 1.0f);
    EXPECT_EQ(fresh.align(), Align::Baseline | Align::Left);
    EXPECT_EQ(fresh.direction(), Direction::LeftToRight);
    EXPECT_EQ(fresh.horzQuantization(), Quantization::Full);
    EXPECT_EQ(fresh.vertQuantization(), Quantization::Full);
    EXPECT_EQ(fresh.color(), Color{});
    EXPECT_EQ(fresh.blendMode(), BlendMode::Over);
    EXPECT_NE(fresh.sizer(), nullptr);
    EXPECT_NE(fresh.rasterizer(), nullptr);
    EXPECT_EQ(fresh.cacheHandler(), nullptr);
}

TEST_F(RendererStateTest, UnchangedStateNotifiesNothing) {
    renderer.applyState(renderer.state());
    renderer.setScale(1.0f);
    EXPECT_EQ(sizer.notifyCount, 0);
    EXPECT_EQ(cache.fontChanges, 0);
    EXPECT_EQ(cache.sizeChanges, 0);
    EXPECT_EQ(cache.rasterizerChanges, 0);
}

TEST_F(RendererStateTest, SizeChangeNotifiesOnce) {
    renderer.setSize(20.0f);
    EXPECT_EQ(sizer.notifyCount, 1);
    EXPECT_EQ(sizer.lastSize, fract::fromInt(20));
    EXPECT_EQ(cache.sizeChanges, 1);
    EXPECT_EQ(cache.size(), fract::fromInt(20));
    EXPECT_EQ(cache.fontChanges, 0);
}

TEST_F(RendererStateTest, FontChangeNotifiesSizerAndCache) {
    FixtureFont other(2);
    renderer.setFont(&other);
    EXPECT_EQ(sizer.notifyCount, 1);
    EXPECT_EQ(sizer.lastFont, &other);
    EXPECT_EQ(cache.fontChanges, 1);
    EXPECT_EQ(cache.font(), &other);
    renderer.setFont(&font);
}

TEST_F(RendererStateTest, CombinedChangeInOneStep) {
    FixtureFont other(2);
    RenderState next = renderer.state();
    next.font = &other;
    next.logicalSize = fract::fromInt(24);
    next.color = Color{1, 2, 3, 4};
    renderer.applyState(next);

    EXPECT_EQ(sizer.notifyCount, 1);
    EXPECT_EQ(cache.fontChanges, 1);
    EXPECT_EQ(cache.sizeChanges, 1);
    EXPECT_EQ(renderer.color(), (Color{1, 2, 3, 4}));
    renderer.setFont(&font);
}

TEST_F(RendererStateTest, NonMetricSettersDoNotNotify) {
    renderer.setColor(Color{0, 0, 0, 255});
    renderer.setBlendMode(BlendMode::Replace);
    renderer.setAlign(Align::Center);
    renderer.setDirection(Direction::RightToLeft);
    renderer.setQuantization(Quantization::Quarter, Quantization::Half);
    EXPECT_EQ(sizer.notifyCount, 0);
    EXPECT_EQ(cache.fontChanges + cache.sizeChanges + cache.rasterizerChanges, 0);
    EXPECT_EQ(renderer.horzQuantization(), Quantization::Quarter);
}

TEST_F(RendererStateTest, CacheHandlerSynchronizedOnAttach) {
    RecordingCacheHandler other;
    renderer.setCacheHandler(&other);
    EXPECT_EQ(other.fontChanges, 1);
    EXPECT_EQ(other.font(), &font);
    EXPECT_EQ(other.sizeChanges, 1);
    EXPECT_EQ(other.size(), kSize16);
    EXPECT_EQ(other.rasterizerChanges, 1);
    EXPECT_EQ(other.signature(), rasterizer.signature());
    ASSERT_EQ(other.fracts.size(), 1u);
    EXPECT_EQ(other.fracts[0], fract::Point());
    renderer.setCacheHandler(&cache);
}

TEST_F(RendererStateTest, RasterizerConfigChangeReachesCache) {
    rasterizer.setSignature(7);
    EXPECT_EQ(cache.rasterizerChanges, 1);
    EXPECT_EQ(cache.signature(), 7u);
}

TEST_F(RendererStateTest, ReplacedRasterizerIsUnhooked) {
    FixtureRasterizer other;
    renderer.setRasterizer(&other);
    EXPECT_EQ(cache.rasterizerChanges, 1);

    rasterizer.setSignature(9);
    EXPECT_EQ(cache.rasterizerChanges, 1);

    renderer.setRasterizer(nullptr);
    EXPECT_NE(renderer.rasterizer(), nullptr);
    EXPECT_NE(renderer.rasterizer(), &other);
    EXPECT_EQ(cache.rasterizerChanges, 2);
}

TEST_F(RendererStateTest, RasterizerReleasedBeforeDestruction) {
    {
        FixtureRasterizer scoped;
        renderer.setRasterizer(&scoped);
        scoped.setSignature(4);
        EXPECT_EQ(cache.rasterizerChanges, 2);

        renderer.setRasterizer(nullptr);
    }
    EXPECT_NE(renderer.rasterizer(), nullptr);
    EXPECT_EQ(cache.rasterizerChanges, 3);

    renderer.setRasterizer(&rasterizer);
    EXPECT_EQ(cache.rasterizerChanges, 4);
}

TEST_F(RendererStateTest, DestroyedRendererUnhooksRasterizer) {
    FixtureRasterizer shared;
    RecordingCacheHandler otherCache;
    {
        Renderer other;
        other.setSizer(&sizer);
        other.setRasterizer(&shared);
        other.setFont(&font);
        other.setCacheHandler(&otherCache);
        otherCache.resetCounts();

        shared.setSignature(5);
        EXPECT_EQ(otherCache.rasterizerChanges, 1);
        other.setCacheHandler(nullptr);
    }
    shared.setSignature(6);
    EXPECT_EQ(otherCache.rasterizerChanges, 1);
}

TEST_F(RendererStateTest, RejectedStateKeepsOldOne) {
    const RenderState before = renderer.state();

    RenderState badQuantization = before;
    badQuantization.horzQuantization = static_cast<Quantization>(3);
    EXPECT_THROW(renderer.applyState(badQuantization), ConfigError);

    RenderState badSize = before;
    badSize.logicalSize = 0;
    EXPECT_THROW(renderer.applyState(badSize), ConfigError);

    RenderState badAlign = before;
    badAlign.align = Align::Left;
    EXPECT_THROW(renderer.applyState(badAlign), ConfigError);

    EXPECT_EQ(renderer.state().horzQuantization, before.horzQuantization);
    EXPECT_EQ(renderer.state().logicalSize, before.logicalSize);
    EXPECT_EQ(renderer.state().align, before.align);
    EXPECT_EQ(cache.sizeChanges, 0);
}

TEST_F(RendererStateTest, SizerRejectingFontKeepsOldSizer) {
    // the built-in sizer needs fonts loaded through a FontManager
    EXPECT_THROW(renderer.setSizer(nullptr), ConfigError);
    EXPECT_EQ(renderer.sizer(), &sizer);
}

TEST_F(RendererStateTest, FractGateway) {
    renderer.fract().setSize(fract::fromInt(24));
    EXPECT_EQ(renderer.fract().size(), fract::fromInt(24));
    EXPECT_FLOAT_EQ(renderer.size(), 24.0f);

    renderer.fract().setScale(fract::kOne / 2);
    EXPECT_EQ(renderer.fract().scale(), 32);
    EXPECT_EQ(renderer.fract().scaledSize(), fract::fromInt(12));
    EXPECT_EQ(cache.size(), fract::fromInt(12));
}

TEST_F(RendererStateTest, ErrorsShareBase) {
    try {
        renderer.setAlign(Align::None);
        FAIL() << "expected ConfigError";
    } catch (const Error& e) {
        EXPECT_NE(std::string(e.what()).find("align"), std::string::npos);
    }
}
