#include "filechunker/split_orchestrator.hpp"
#include "filechunker/errors.hpp"
#include "filechunker/logger.hpp"
#include "filechunker/strategy_selector.hpp"

#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>

namespace filechunker
{

SplitOrchestrator::SplitOrchestrator(OrchestratorOptions options)
    : options_(options), progress_(options.progressCapacity)
{
}

SplitOrchestrator::~SplitOrchestrator()
{
    if (worker_.valid())
    {
        worker_.wait();
    }
}

std::future<SplitManifest> SplitOrchestrator::start(const std::filesystem::path &source,
                                                    const std::filesystem::path &outputDir,
                                                    const SplitPolicy &policy)
{
    if (source.empty())
    {
        throw ConfigurationError("Input file not specified");
    }
    if (outputDir.empty())
    {
        throw ConfigurationError("Please select an output directory");
    }

    std::lock_guard<std::mutex> lock(startMutex_);
    if (running_.load())
    {
        throw std::logic_error("A split is already running on this orchestrator");
    }
    if (worker_.valid())
    {
        worker_.wait();
    }

    running_.store(true);
    progress_.reset();

    auto promise = std::make_shared<std::promise<SplitManifest>>();
    std::future<SplitManifest> result = promise->get_future();

    worker_ = std::async(std::launch::async, [this, promise, source, outputDir, policy]()
                         {
        std::optional<SplitManifest> manifest;
        std::exception_ptr failure;
        try
        {
            manifest = execute(source, outputDir, policy);
        }
        catch (...)
        {
            failure = std::current_exception();
        }

        progress_.close();
        running_.store(false);

        if (failure)
        {
            promise->set_exception(failure);
        }
        else
        {
            promise->set_value(std::move(*manifest));
        } });

    return result;
}

SplitManifest SplitOrchestrator::run(const std::filesystem::path &source,
                                     const std::filesystem::path &outputDir,
                                     const SplitPolicy &policy)
{
    return start(source, outputDir, policy).get();
}

ChunkEstimate SplitOrchestrator::estimate(const std::filesystem::path &source, const SplitPolicy &policy) const
{
    return estimateChunks(source, policy);
}

SplitManifest SplitOrchestrator::execute(const std::filesystem::path &source,
                                         const std::filesystem::path &outputDir,
                                         const SplitPolicy &policy)
{
    try
    {
        Logger::logInfo("Starting: %s", source.filename().string().c_str());

        const SourceDescriptor descriptor = SourceDescriptor::resolve(source);
        const SplitStrategy strategy = StrategySelector::strategyFor(descriptor.contentClass);
        auto splitter = StrategySelector::makeSplitter(strategy, policy);

        Logger::logInfo("Mode: %s, strategy: %s (%s content, %llu bytes)",
                        policy.describe().c_str(), splitter->name(),
                        contentClassName(descriptor.contentClass),
                        static_cast<unsigned long long>(descriptor.sizeBytes));

        SplitManifest manifest;
        manifest.source = descriptor.path;
        manifest.contentClass = descriptor.contentClass;
        manifest.strategy = strategy;
        manifest.sourceBytes = descriptor.sizeBytes;

        manifest.chunks = splitter->split(descriptor.path, outputDir,
                                          [this](const ProgressEvent &event)
                                          {
                                              Logger::logDebug("Progress: %llu/%llu %s",
                                                               static_cast<unsigned long long>(event.unitsDone),
                                                               static_cast<unsigned long long>(event.unitsTotal),
                                                               event.label.c_str());
                                              progress_.push(event);
                                          });

        if (strategy == SplitStrategy::Paged)
        {
            manifest.unitsTotal = manifest.chunks.empty()
                                      ? 0
                                      : manifest.chunks.back().firstUnit + manifest.chunks.back().unitCount;
        }
        else
        {
            manifest.unitsTotal = descriptor.sizeBytes;
        }

        Logger::logInfo("Successfully created %zu chunks", manifest.chunks.size());
        return manifest;
    }
    catch (const SplitError &e)
    {
        Logger::logError("%s: %s", SplitError::kindName(e.kind()), e.what());
        throw;
    }
    catch (const std::exception &e)
    {
        Logger::logError("Split failed: %s", e.what());
        throw;
    }
}

} // namespace filechunker
