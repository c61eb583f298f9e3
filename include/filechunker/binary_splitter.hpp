#pragma once

#include "export.hpp"
#include "file_splitter.hpp"

#include <cstddef>

namespace filechunker {

/**
 * @brief Byte-range strategy for arbitrary and plain-text files.
 *
 * Streams the source once. Non-final chunks get exactly unitsPerChunk bytes
 * (fewer only once the source is exhausted), the final chunk gets the exact
 * remainder. Empty chunks are still written so indices stay contiguous.
 * A failure mid-stream leaves the chunks already written on disk.
 */
class FILECHUNKER_API BinarySplitter : public FileSplitter {
public:
    explicit BinarySplitter(const SplitPolicy& policy, std::size_t bufferSize = kDefaultBufferSize);

    std::vector<ChunkRecord> split(const std::filesystem::path& source,
                                   const std::filesystem::path& outputDir,
                                   const ProgressCallback& onProgress) override;

    const char* name() const override { return "binary"; }

    static constexpr std::size_t kDefaultBufferSize = 4 * 1024 * 1024;

private:
    std::size_t bufferSize_;
};

} // namespace filechunker
