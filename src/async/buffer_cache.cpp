#include "csvsplit/buffer_cache.hpp"

#include <stdexcept>
#include <utility>

#include "csvsplit/errors.hpp"
#include "csvsplit/performance_counters.hpp"

namespace csvsplit {

namespace {

const BufferCacheConfig& validated(const BufferCacheConfig& config) {
    if (config.queue_depth == 0 || config.buffer_size == 0) {
        throw std::invalid_argument("BufferCache needs at least one non-empty buffer");
    }
    return config;
}

AsyncIOConfig ring_config(const BufferCacheConfig& config) {
    AsyncIOConfig ring;
    ring.queue_depth = config.queue_depth;
    ring.use_sqpoll = config.use_sqpoll;
    return ring;
}

}  // namespace

BufferCache::BufferCache(const BufferCacheConfig& config, const std::string& first_path)
    : config_(validated(config)),
      targets_(first_path),
      pool_(config.queue_depth, config.buffer_size, config.dialect),
      engine_(ring_config(config), config.max_retries) {}

RecordBuffer BufferCache::pop() {
    if (pool_.empty()) {
        if (engine_.in_flight() == 0) {
            throw EngineError("All buffers are held by the caller; nothing to reclaim");
        }

        CSVSPLIT_SCOPED_TIMER("buffer_cache_drain");
        engine_.drain(pool_);
        targets_.release_superseded();
    }

    return pool_.pop();
}

uint64_t BufferCache::submit(RecordBuffer buffer) {
    return engine_.submit(targets_.active(), std::move(buffer));
}

RecordBuffer BufferCache::submit_and_pop(RecordBuffer buffer) {
    submit(std::move(buffer));
    return pop();
}

void BufferCache::recycle(RecordBuffer buffer) {
    pool_.push(std::move(buffer));
}

void BufferCache::rotate(const std::string& path) {
    targets_.rotate(path);
}

void BufferCache::sync() {
    CSVSPLIT_SCOPED_TIMER("buffer_cache_sync");
    engine_.drain(pool_);
    targets_.release_superseded();
}

}  // namespace csvsplit
