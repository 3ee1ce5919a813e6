#ifndef WEFT_CACHE_DEFAULT_CACHE_H
#define WEFT_CACHE_DEFAULT_CACHE_H

#include "weft/cache/glyph_cache_handler.h"
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace weft {

using GlyphCacheKey = std::array<std::uint64_t, 3>;

struct GlyphCacheKeyHash {
    std::size_t operator()(const GlyphCacheKey& key) const noexcept {
        std::uint64_t h = key[0] * 0x9E3779B97F4A7C15ull;
        h ^= key[1] + 0x9E3779B97F4A7C15ull + (h << 6) + (h >> 2);
        h ^= key[2] + 0x9E3779B97F4A7C15ull + (h << 6) + (h >> 2);
        return static_cast<std::size_t>(h);
    }
};

class DefaultCacheHandler;

/**
 * DefaultCache: byte-capacity glyph mask cache shared by any number of
 * handlers. Thread safe.
 *
 * When a new mask doesn't fit, entries are evicted by sampling a few of
 * them and dropping the least recently accessed one, up to a few times.
 * Masks larger than the whole capacity are never stored.
 */
class DefaultCache {
public:
    /**
     * Configuration for cache creation.
     */
    struct Config {
        std::size_t capacityBytes = 16u * 1024u * 1024u;
        std::size_t evictionSamples = 10;    // Entries compared per eviction
        std::size_t evictionAttempts = 5;    // Evictions tried per insertion
    };

    DefaultCache();
    // @throws ConfigError if capacityBytes is zero
    explicit DefaultCache(const Config& config);

    // Non-copyable
    DefaultCache(const DefaultCache&) = delete;
    DefaultCache& operator=(const DefaultCache&) = delete;

    std::shared_ptr<const GlyphMask> getMask(const GlyphCacheKey& key);
    void passMask(const GlyphCacheKey& key, std::shared_ptr<const GlyphMask> mask);

    std::size_t capacity() const { return config_.capacityBytes; }
    std::size_t currentSize() const;
    std::size_t peakSize() const;
    std::size_t numEntries() const;

    // Handler bound to this cache. The cache must outlive it.
    std::unique_ptr<DefaultCacheHandler> newHandler();

private:
    struct Entry {
        std::shared_ptr<const GlyphMask> mask;
        std::uint64_t lastAccess = 0;
        std::size_t byteSize = 0;
    };

    bool hasRoomFor(std::size_t byteSize) const;
    void evictOldSample();
    std::uint64_t nextAccessTick();

    Config config_;
    mutable std::mutex mutex_;
    std::unordered_map<GlyphCacheKey, Entry, GlyphCacheKeyHash> entries_;
    std::size_t currentSize_ = 0;
    std::size_t peakSize_ = 0;
    std::atomic<std::uint64_t> accessTick_{0};
};

/**
 * DefaultCacheHandler: tracks the renderer state as a cache key.
 *
 * key[0] font id, key[1] rasterizer signature, key[2] packs the size
 * (bits 32-63), the x and y sub-pixel offsets (bits 22-27 and 16-21)
 * and the glyph index (bits 0-15).
 */
class DefaultCacheHandler : public GlyphCacheHandler {
public:
    explicit DefaultCacheHandler(DefaultCache& cache) : cache_(cache) {}

    void notifyFontChange(const Font* font) override;
    void notifySizeChange(fract::Unit size) override;
    void notifyRasterizerChange(const Rasterizer& rasterizer) override;
    void notifyFractChange(fract::Point position) override;

    std::shared_ptr<const GlyphMask> getMask(GlyphIndex glyph) override;
    void passMask(GlyphIndex glyph, std::shared_ptr<const GlyphMask> mask) override;

    DefaultCache& cache() { return cache_; }
    const GlyphCacheKey& activeKey() const { return activeKey_; }

private:
    void setGlyph(GlyphIndex glyph);

    DefaultCache& cache_;
    GlyphCacheKey activeKey_{};
};

} // namespace weft

#endif // WEFT_CACHE_DEFAULT_CACHE_H
