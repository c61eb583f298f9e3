#pragma once

#include "export.hpp"
#include "split_policy.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace filechunker {

/**
 * @brief One produced output file. Created once the file is closed.
 */
struct ChunkRecord {
    std::uint64_t index = 0;          // 1-based
    std::uint64_t totalDeclared = 0;  // denominator used in the file name
    std::filesystem::path path;
    std::uint64_t byteSize = 0;
    std::uint64_t firstUnit = 0;      // first byte or page covered
    std::uint64_t unitCount = 0;      // bytes or pages covered
};

struct ProgressEvent {
    std::uint64_t unitsDone = 0;
    std::uint64_t unitsTotal = 0;
    std::string label;
};

using ProgressCallback = std::function<void(const ProgressEvent& event)>;

/**
 * @brief Split strategy interface. One instance holds one policy and can be
 * reused for several sources, one at a time.
 */
class FILECHUNKER_API FileSplitter {
public:
    explicit FileSplitter(const SplitPolicy& policy) : policy_(policy) {}
    virtual ~FileSplitter() = default;

    FileSplitter(const FileSplitter&) = delete;
    FileSplitter& operator=(const FileSplitter&) = delete;

    /**
     * @brief Splits source into chunk files under outputDir.
     * @param source Existing regular file (NotFoundError otherwise)
     * @param outputDir Created when missing; must be writable (PermissionError)
     * @param onProgress Called once per chunk after its file is closed; may be empty
     * @return Records in index order
     */
    virtual std::vector<ChunkRecord> split(const std::filesystem::path& source,
                                           const std::filesystem::path& outputDir,
                                           const ProgressCallback& onProgress) = 0;

    virtual const char* name() const = 0;

    const SplitPolicy& policy() const { return policy_; }

protected:
    static void requireSourceFile(const std::filesystem::path& source);

    // Creates the directory and probes it with a scratch file
    static void ensureOutputDir(const std::filesystem::path& outputDir);

    static std::uint64_t fileSizeOf(const std::filesystem::path& path);

    SplitPolicy policy_;
};

} // namespace filechunker
