/*
 * segdl/src/downloader/chunk_progress.cpp
 *
 * In-memory per-chunk progress table (per engine instance).
 *
 * - Thread-safe with shared_mutex; readers (aggregation, snapshots) take shared locks
 * - Survives pause/resume; cleared by the engine when a fresh transfer begins
 * - Never persisted: crash recovery from disk is out of scope
 */

#include <segdl/downloader/chunk_progress.hpp>

#include <mutex>

namespace segdl::downloader {

std::uint64_t ChunkProgressMap::add(int chunkIndex, std::uint64_t delta) {
    std::unique_lock lk(mutex_);
    auto& v = table_[chunkIndex];
    v += delta;
    return v;
}

void ChunkProgressMap::set(int chunkIndex, std::uint64_t value) {
    std::unique_lock lk(mutex_);
    table_[chunkIndex] = value;
}

std::uint64_t ChunkProgressMap::get(int chunkIndex) const {
    std::shared_lock lk(mutex_);
    auto it = table_.find(chunkIndex);
    return it == table_.end() ? 0 : it->second;
}

std::uint64_t ChunkProgressMap::total() const {
    std::shared_lock lk(mutex_);
    std::uint64_t sum = 0;
    for (const auto& [index, bytes] : table_) {
        (void)index;
        sum += bytes;
    }
    return sum;
}

std::vector<std::pair<int, std::uint64_t>> ChunkProgressMap::snapshot() const {
    std::shared_lock lk(mutex_);
    return {table_.begin(), table_.end()};
}

bool ChunkProgressMap::empty() const {
    std::shared_lock lk(mutex_);
    return table_.empty();
}

void ChunkProgressMap::clear() {
    std::unique_lock lk(mutex_);
    table_.clear();
}

} // namespace segdl::downloader
