/*
 * segdl/src/downloader/chunk_planner.cpp
 *
 * Splits [0, totalLength) into contiguous inclusive ranges, one per worker slot.
 * Pure arithmetic: no I/O, no logging.
 */

#include <segdl/downloader/downloader.hpp>

namespace segdl::downloader {

ChunkPlan planChunks(std::int64_t totalLength, int concurrency) {
    ChunkPlan plan;
    if (totalLength <= 0)
        return plan;

    if (concurrency <= 1) {
        plan.push_back(ChunkRange{0, 0, totalLength - 1});
        return plan;
    }

    const std::int64_t chunkSize = totalLength / concurrency;
    plan.reserve(static_cast<std::size_t>(concurrency));
    for (int i = 0; i < concurrency; ++i) {
        const std::int64_t start = static_cast<std::int64_t>(i) * chunkSize;
        // Last chunk absorbs the remainder
        const std::int64_t end = (i == concurrency - 1) ? totalLength - 1 : start + chunkSize - 1;
        plan.push_back(ChunkRange{i, start, end});
    }
    return plan;
}

} // namespace segdl::downloader
