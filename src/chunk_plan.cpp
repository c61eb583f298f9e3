#include "filechunker/chunk_plan.hpp"
#include "filechunker/errors.hpp"
#include "filechunker/page_splitter.hpp"
#include "filechunker/strategy_selector.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace filechunker
{

namespace
{
    std::uint64_t ceilDiv(std::uint64_t numerator, std::uint64_t denominator)
    {
        return numerator / denominator + (numerator % denominator != 0 ? 1 : 0);
    }
} // namespace

ChunkPlan ChunkPlan::compute(std::uint64_t total, const SplitPolicy &policy)
{
    ChunkPlan plan;
    plan.unitCount = total;

    if (policy.isPartCount())
    {
        plan.chunkCount = std::max<std::uint64_t>(1, policy.value());
        plan.unitsPerChunk = ceilDiv(total, plan.chunkCount);
    }
    else
    {
        plan.unitsPerChunk = policy.value();
        plan.chunkCount = std::max<std::uint64_t>(1, ceilDiv(total, plan.unitsPerChunk));
    }
    return plan;
}

ChunkPlan ChunkPlan::withUnitsPerChunk(std::uint64_t total, std::uint64_t unitsPerChunk)
{
    ChunkPlan plan;
    plan.unitCount = total;
    plan.unitsPerChunk = std::max<std::uint64_t>(1, unitsPerChunk);
    plan.chunkCount = std::max<std::uint64_t>(1, ceilDiv(total, plan.unitsPerChunk));
    return plan;
}

ChunkExtent ChunkPlan::extentOf(std::uint64_t index) const
{
    ChunkExtent extent;
    if (index < 1 || index > chunkCount)
    {
        return extent;
    }

    const std::uint64_t start = std::min(unitCount, (index - 1) * unitsPerChunk);
    const std::uint64_t end = index == chunkCount
                                  ? unitCount
                                  : std::min(unitCount, index * unitsPerChunk);
    extent.firstUnit = start;
    extent.unitCount = end - start;
    return extent;
}

ChunkEstimate estimateChunks(std::uint64_t totalBytes, const SplitPolicy &policy)
{
    const ChunkPlan plan = ChunkPlan::compute(totalBytes, policy);

    ChunkEstimate estimate;
    estimate.count = plan.chunkCount;

    std::ostringstream desc;
    if (policy.isPartCount())
    {
        desc << policy.value() << " parts (requested)";
    }
    else
    {
        desc << "~" << std::fixed << std::setprecision(1)
             << static_cast<double>(policy.value()) / (1024.0 * 1024.0) << " MB each";
    }
    estimate.description = desc.str();
    return estimate;
}

ChunkEstimate estimateChunks(const std::filesystem::path &source, const SplitPolicy &policy)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec))
    {
        throw NotFoundError("File not found: " + source.string());
    }
    const auto size = std::filesystem::file_size(source, ec);
    if (ec)
    {
        throw IOError("Cannot read size of " + source.string() + ": " + ec.message());
    }

    ChunkEstimate estimate = estimateChunks(static_cast<std::uint64_t>(size), policy);
    if (StrategySelector::select(source) != SplitStrategy::Paged)
    {
        return estimate;
    }

    if (policy.isByteSize())
    {
        // Page chunks under a size policy follow the pages / 10 fallback, not bytes
        estimate.approximate = true;
        estimate.description += " (approximate for page-structured documents)";
        return estimate;
    }

    // Page runs can produce fewer documents than requested
    const std::uint64_t pages = PageSplitter::countPages(source);
    estimate.count = pages == 0 ? 0 : PageSplitter(policy).planFor(pages).chunkCount;
    if (estimate.count != policy.value())
    {
        estimate.description += ", " + std::to_string(estimate.count) + " from " +
                                std::to_string(pages) + " pages";
    }
    return estimate;
}

} // namespace filechunker
