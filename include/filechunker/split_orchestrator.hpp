#pragma once

#include "export.hpp"
#include "chunk_plan.hpp"
#include "progress_channel.hpp"
#include "split_manifest.hpp"
#include "split_policy.hpp"

#include <atomic>
#include <filesystem>
#include <future>
#include <mutex>

namespace filechunker {

struct OrchestratorOptions {
    std::size_t progressCapacity = ProgressChannel::kDefaultCapacity;
};

/**
 * @brief Drives one split at a time on a dedicated worker.
 *
 * Resolves the source, picks the strategy from its extension, delegates, and
 * hands back the manifest. Failures reach the caller unchanged through the
 * returned future; chunks written before a failure are left on disk and are
 * not part of any result.
 *
 * Progress events of the active run are delivered through progress(). The
 * channel is reset when a run starts and closed when it ends.
 */
class FILECHUNKER_API SplitOrchestrator {
public:
    explicit SplitOrchestrator(OrchestratorOptions options = OrchestratorOptions());
    ~SplitOrchestrator();

    SplitOrchestrator(const SplitOrchestrator&) = delete;
    SplitOrchestrator& operator=(const SplitOrchestrator&) = delete;

    /**
     * @brief Starts a split and returns immediately.
     *
     * Throws ConfigurationError for empty paths and std::logic_error when a
     * run is already active.
     */
    std::future<SplitManifest> start(const std::filesystem::path& source,
                                     const std::filesystem::path& outputDir,
                                     const SplitPolicy& policy);

    // Blocking form of start()
    SplitManifest run(const std::filesystem::path& source,
                      const std::filesystem::path& outputDir,
                      const SplitPolicy& policy);

    ProgressChannel& progress() { return progress_; }

    bool isRunning() const { return running_.load(); }

    ChunkEstimate estimate(const std::filesystem::path& source, const SplitPolicy& policy) const;

    const OrchestratorOptions& options() const { return options_; }

private:
    SplitManifest execute(const std::filesystem::path& source,
                          const std::filesystem::path& outputDir,
                          const SplitPolicy& policy);

    OrchestratorOptions options_;
    ProgressChannel progress_;
    std::atomic<bool> running_{false};
    std::mutex startMutex_;
    std::future<void> worker_;
};

} // namespace filechunker
