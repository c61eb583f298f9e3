#pragma once

#include "export.hpp"
#include "split_policy.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace filechunker {

/**
 * @brief Units covered by one chunk: [firstUnit, firstUnit + unitCount)
 */
struct ChunkExtent {
    std::uint64_t firstUnit = 0;
    std::uint64_t unitCount = 0;
};

/**
 * @brief How a source of unitCount units (bytes or pages) is partitioned.
 *
 * chunkCount is never zero; an empty source still yields one chunk.
 */
struct FILECHUNKER_API ChunkPlan {
    std::uint64_t unitCount = 0;
    std::uint64_t chunkCount = 1;
    std::uint64_t unitsPerChunk = 0;

    static ChunkPlan compute(std::uint64_t total, const SplitPolicy& policy);

    // Fixed units-per-chunk variant; used by the page splitter's size fallback
    static ChunkPlan withUnitsPerChunk(std::uint64_t total, std::uint64_t unitsPerChunk);

    /**
     * @brief Extent of the 1-based chunk index.
     *
     * Non-final chunks cover unitsPerChunk units clamped to the end of the
     * source; the final chunk covers whatever remains.
     */
    ChunkExtent extentOf(std::uint64_t index) const;
};

struct ChunkEstimate {
    std::uint64_t count = 0;
    std::string description;
    bool approximate = false;
};

/**
 * @brief Preview of a split without touching the file system.
 *
 * Shares ChunkPlan::compute with the real split, so the count always matches
 * what the binary strategy produces.
 */
FILECHUNKER_API ChunkEstimate estimateChunks(std::uint64_t totalBytes, const SplitPolicy& policy);

/**
 * @brief Preview for a file on disk. Throws NotFoundError when the path is not
 * a regular file.
 *
 * A PDF under a part count is decoded to count its pages (DecodeError when it
 * cannot be), so the count equals what the page strategy writes. Under a size
 * policy a PDF estimate is marked approximate.
 */
FILECHUNKER_API ChunkEstimate estimateChunks(const std::filesystem::path& source, const SplitPolicy& policy);

} // namespace filechunker
