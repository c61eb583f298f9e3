#pragma once

#include "export.hpp"
#include "chunk_plan.hpp"
#include "file_splitter.hpp"

namespace filechunker {

/**
 * @brief Page-structured strategy: every chunk is a standalone PDF holding a
 * contiguous run of whole pages of the source, in original order.
 *
 * Under PartCount(n) each chunk holds ceil(pages / n) pages, so fewer than n
 * chunks can come out (10 pages, 6 parts -> 5 chunks of 2). Under a byte-size
 * policy a byte target has no page meaning, and pages are grouped by
 * max(1, pages / 10). That fallback is an approximation, not an exact mapping.
 *
 * A document without pages produces no chunks at all.
 */
class FILECHUNKER_API PageSplitter : public FileSplitter {
public:
    explicit PageSplitter(const SplitPolicy& policy);

    std::vector<ChunkRecord> split(const std::filesystem::path& source,
                                   const std::filesystem::path& outputDir,
                                   const ProgressCallback& onProgress) override;

    const char* name() const override { return "paged"; }

    // Grouping used for a document of pageCount pages under the held policy
    ChunkPlan planFor(std::uint64_t pageCount) const;

    static std::uint64_t countPages(const std::filesystem::path& source);

    static constexpr std::uint64_t kSizeFallbackDivisor = 10;
};

} // namespace filechunker
