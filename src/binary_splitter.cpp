#include "filechunker/binary_splitter.hpp"
#include "filechunker/chunk_plan.hpp"
#include "filechunker/errors.hpp"
#include "filechunker/logger.hpp"
#include "filechunker/name_formatter.hpp"

#include <algorithm>
#include <fstream>
#include <vector>

namespace filechunker
{

BinarySplitter::BinarySplitter(const SplitPolicy &policy, std::size_t bufferSize)
    : FileSplitter(policy), bufferSize_(bufferSize == 0 ? kDefaultBufferSize : bufferSize)
{
}

std::vector<ChunkRecord> BinarySplitter::split(const std::filesystem::path &source,
                                               const std::filesystem::path &outputDir,
                                               const ProgressCallback &onProgress)
{
    requireSourceFile(source);
    ensureOutputDir(outputDir);

    const std::uint64_t totalSize = fileSizeOf(source);
    const ChunkPlan plan = ChunkPlan::compute(totalSize, policy_);

    Logger::logDebug("Binary split of %s: %llu bytes into %llu chunks of %llu bytes",
                     source.string().c_str(),
                     static_cast<unsigned long long>(totalSize),
                     static_cast<unsigned long long>(plan.chunkCount),
                     static_cast<unsigned long long>(plan.unitsPerChunk));

    std::ifstream input(source, std::ios::binary);
    if (!input.is_open())
    {
        throw IOError("Failed to open source file: " + source.string());
    }

    std::vector<char> buffer(static_cast<std::size_t>(
        std::min<std::uint64_t>(bufferSize_, std::max<std::uint64_t>(plan.unitsPerChunk, 1))));

    std::vector<ChunkRecord> records;
    records.reserve(static_cast<std::size_t>(plan.chunkCount));

    std::uint64_t consumed = 0;
    for (std::uint64_t index = 1; index <= plan.chunkCount; ++index)
    {
        // Final chunk takes the exact remainder; others never read past EOF
        const std::uint64_t wanted = index < plan.chunkCount
                                         ? std::min(plan.unitsPerChunk, totalSize - consumed)
                                         : totalSize - consumed;

        const auto chunkPath = NameFormatter::chunkPath(outputDir, source, index, plan.chunkCount);
        std::ofstream output(chunkPath, std::ios::binary | std::ios::trunc);
        if (!output.is_open())
        {
            throw IOError("Failed to open chunk file for writing: " + chunkPath.string());
        }

        std::uint64_t remaining = wanted;
        while (remaining > 0)
        {
            const auto step = static_cast<std::streamsize>(std::min<std::uint64_t>(remaining, buffer.size()));
            input.read(buffer.data(), step);
            const std::streamsize got = input.gcount();
            if (got != step)
            {
                throw IOError("Unexpected end of source " + source.string() + " at byte " +
                              std::to_string(consumed + (wanted - remaining) + static_cast<std::uint64_t>(got)));
            }
            output.write(buffer.data(), got);
            if (!output)
            {
                throw IOError("Failed to write chunk file: " + chunkPath.string());
            }
            remaining -= static_cast<std::uint64_t>(got);
        }

        output.close();
        if (output.fail())
        {
            throw IOError("Failed to close chunk file: " + chunkPath.string());
        }

        ChunkRecord record;
        record.index = index;
        record.totalDeclared = plan.chunkCount;
        record.path = chunkPath;
        record.byteSize = wanted;
        record.firstUnit = consumed;
        record.unitCount = wanted;
        records.push_back(record);

        consumed += wanted;

        Logger::logInfo("Wrote chunk %llu/%llu: %s (%llu bytes)",
                        static_cast<unsigned long long>(index),
                        static_cast<unsigned long long>(plan.chunkCount),
                        chunkPath.filename().string().c_str(),
                        static_cast<unsigned long long>(wanted));

        if (onProgress)
        {
            onProgress(ProgressEvent{consumed, totalSize,
                                     "Chunk " + std::to_string(index) + "/" + std::to_string(plan.chunkCount)});
        }
    }

    return records;
}

} // namespace filechunker
