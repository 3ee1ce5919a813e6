#include "weft/cache/default_cache.h"
#include "weft/core/errors.h"
#include "weft/core/logging.h"

#include <limits>

namespace weft {

DefaultCache::DefaultCache() : DefaultCache(Config{}) {}

DefaultCache::DefaultCache(const Config& config) : config_(config) {
    if (config_.capacityBytes == 0) {
        throw ConfigError("cache capacity must be positive");
    }
    if (config_.evictionSamples == 0) {
        config_.evictionSamples = 1;
    }
    entries_.reserve(128);
}

std::uint64_t DefaultCache::nextAccessTick() {
    return accessTick_.fetch_add(1, std::memory_order_relaxed) + 1;
}

std::shared_ptr<const GlyphMask> DefaultCache::getMask(const GlyphCacheKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return nullptr;
    }
    it->second.lastAccess = nextAccessTick();
    return it->second.mask;
}

void DefaultCache::passMask(const GlyphCacheKey& key, std::shared_ptr<const GlyphMask> mask) {
    if (!mask) {
        return;
    }

    std::size_t byteSize = mask->byteSize();
    if (byteSize > config_.capacityBytes) {
        WEFT_LOG_DEBUG("mask of %zu bytes exceeds cache capacity, not cached", byteSize);
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto existing = entries_.find(key);
    if (existing != entries_.end()) {
        currentSize_ -= existing->second.byteSize;
        entries_.erase(existing);
    }

    for (std::size_t attempt = 0; attempt < config_.evictionAttempts; ++attempt) {
        if (hasRoomFor(byteSize)) {
            break;
        }
        evictOldSample();
    }

    if (!hasRoomFor(byteSize)) {
        return;
    }

    Entry entry;
    entry.mask = std::move(mask);
    entry.lastAccess = nextAccessTick();
    entry.byteSize = byteSize;
    entries_.emplace(key, std::move(entry));

    currentSize_ += byteSize;
    if (currentSize_ > peakSize_) {
        peakSize_ = currentSize_;
    }
}

// Precondition: mutex_ held.
bool DefaultCache::hasRoomFor(std::size_t byteSize) const {
    if (config_.capacityBytes < byteSize) {
        return false;
    }
    return currentSize_ <= config_.capacityBytes - byteSize;
}

// Precondition: mutex_ held.
void DefaultCache::evictOldSample() {
    if (entries_.empty()) {
        return;
    }

    // unordered_map iteration order is arbitrary enough to act as a sample
    auto oldest = entries_.end();
    std::uint64_t oldestAccess = std::numeric_limits<std::uint64_t>::max();
    std::size_t sampled = 0;
    for (auto it = entries_.begin(); it != entries_.end() && sampled < config_.evictionSamples; ++it, ++sampled) {
        if (it->second.lastAccess <= oldestAccess) {
            oldestAccess = it->second.lastAccess;
            oldest = it;
        }
    }

    currentSize_ -= oldest->second.byteSize;
    entries_.erase(oldest);
}

std::size_t DefaultCache::currentSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentSize_;
}

std::size_t DefaultCache::peakSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peakSize_;
}

std::size_t DefaultCache::numEntries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::unique_ptr<DefaultCacheHandler> DefaultCache::newHandler() {
    return std::make_unique<DefaultCacheHandler>(*this);
}

// =============================================================================
// DefaultCacheHandler
// =============================================================================

void DefaultCacheHandler::notifyFontChange(const Font* font) {
    activeKey_[0] = font ? font->id() : 0;
}

void DefaultCacheHandler::notifySizeChange(fract::Unit size) {
    activeKey_[2] = (activeKey_[2] & 0x00000000FFFFFFFFull)
        | (static_cast<std::uint64_t>(static_cast<std::uint32_t>(size)) << 32);
}

void DefaultCacheHandler::notifyRasterizerChange(const Rasterizer& rasterizer) {
    activeKey_[1] = rasterizer.signature();
}

void DefaultCacheHandler::notifyFractChange(fract::Point position) {
    std::uint64_t bits = static_cast<std::uint64_t>(fract::fractShift(position.y)) << 16;
    bits |= static_cast<std::uint64_t>(fract::fractShift(position.x)) << 22;
    activeKey_[2] = (activeKey_[2] & ~0x000000000FFF0000ull) | bits;
}

void DefaultCacheHandler::setGlyph(GlyphIndex glyph) {
    activeKey_[2] = (activeKey_[2] & ~0x000000000000FFFFull) | static_cast<std::uint64_t>(glyph);
}

std::shared_ptr<const GlyphMask> DefaultCacheHandler::getMask(GlyphIndex glyph) {
    setGlyph(glyph);
    return cache_.getMask(activeKey_);
}

void DefaultCacheHandler::passMask(GlyphIndex glyph, std::shared_ptr<const GlyphMask> mask) {
    setGlyph(glyph);
    cache_.passMask(activeKey_, std::move(mask));
}

} // namespace weft
