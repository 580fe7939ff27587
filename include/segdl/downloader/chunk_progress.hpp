#pragma once

/*
 * Per-chunk progress table shared by the workers of one transfer.
 *
 * Each chunk index is written by exactly one worker, but entries may be
 * inserted concurrently, so the table itself is guarded by a shared_mutex.
 * Values count bytes written since the chunk's own start offset.
 */

#include <cstdint>
#include <map>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace segdl::downloader {

class ChunkProgressMap {
public:
    ChunkProgressMap() = default;
    ChunkProgressMap(const ChunkProgressMap&) = delete;
    ChunkProgressMap& operator=(const ChunkProgressMap&) = delete;

    // Adds delta to the entry and returns the new value.
    std::uint64_t add(int chunkIndex, std::uint64_t delta);
    void set(int chunkIndex, std::uint64_t value);

    // 0 when the chunk has no entry yet.
    [[nodiscard]] std::uint64_t get(int chunkIndex) const;
    [[nodiscard]] std::uint64_t total() const;
    [[nodiscard]] std::vector<std::pair<int, std::uint64_t>> snapshot() const;
    [[nodiscard]] bool empty() const;

    void clear();

private:
    std::map<int, std::uint64_t> table_;
    mutable std::shared_mutex mutex_;
};

} // namespace segdl::downloader
