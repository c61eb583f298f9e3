#include "filechunker/page_splitter.hpp"
#include "filechunker/errors.hpp"
#include "filechunker/logger.hpp"
#include "filechunker/name_formatter.hpp"

#include <podofo/podofo.h>

#include <algorithm>

using namespace PoDoFo;

namespace filechunker
{

namespace
{
    // Loads the document and touches every page so a broken page tree fails
    // here, before any chunk is written.
    void loadDocument(PdfMemDocument &doc, const std::filesystem::path &source)
    {
        try
        {
            doc.Load(source.string());
            auto &pages = doc.GetPages();
            const unsigned count = pages.GetCount();
            for (unsigned i = 0; i < count; ++i)
            {
                (void)pages.GetPageAt(i);
            }
        }
        catch (const PdfError &e)
        {
            throw DecodeError("Cannot decode PDF " + source.string() + ": " + e.what());
        }
        catch (const std::exception &e)
        {
            throw DecodeError("Cannot decode PDF " + source.string() + ": " + e.what());
        }
    }
} // namespace

PageSplitter::PageSplitter(const SplitPolicy &policy) : FileSplitter(policy)
{
}

ChunkPlan PageSplitter::planFor(std::uint64_t pageCount) const
{
    if (policy_.isPartCount())
    {
        // Count is derived from the ceiling page run, not the request
        const ChunkPlan requested = ChunkPlan::compute(pageCount, policy_);
        return ChunkPlan::withUnitsPerChunk(pageCount, requested.unitsPerChunk);
    }
    return ChunkPlan::withUnitsPerChunk(pageCount,
                                        std::max<std::uint64_t>(1, pageCount / kSizeFallbackDivisor));
}

std::uint64_t PageSplitter::countPages(const std::filesystem::path &source)
{
    requireSourceFile(source);
    PdfMemDocument doc;
    loadDocument(doc, source);
    return doc.GetPages().GetCount();
}

std::vector<ChunkRecord> PageSplitter::split(const std::filesystem::path &source,
                                             const std::filesystem::path &outputDir,
                                             const ProgressCallback &onProgress)
{
    requireSourceFile(source);
    ensureOutputDir(outputDir);

    PdfMemDocument doc;
    loadDocument(doc, source);

    const std::uint64_t totalPages = doc.GetPages().GetCount();
    std::vector<ChunkRecord> records;
    if (totalPages == 0)
    {
        Logger::logWarning("PDF %s has no pages, nothing to split", source.string().c_str());
        return records;
    }

    const ChunkPlan plan = planFor(totalPages);
    if (policy_.isByteSize())
    {
        Logger::logInfo("Byte-size policy on a PDF: grouping %llu pages per chunk (approximate)",
                        static_cast<unsigned long long>(plan.unitsPerChunk));
    }
    records.reserve(static_cast<std::size_t>(plan.chunkCount));

    std::uint64_t pageIndex = 0;
    std::uint64_t chunkNo = 1;
    while (pageIndex < totalPages)
    {
        const std::uint64_t end = std::min(pageIndex + plan.unitsPerChunk, totalPages);
        const auto chunkPath = NameFormatter::chunkPath(outputDir, source, chunkNo, plan.chunkCount);

        PdfMemDocument chunk;
        try
        {
            chunk.GetPages().AppendDocumentPages(doc,
                                                 static_cast<unsigned>(pageIndex),
                                                 static_cast<unsigned>(end - pageIndex));
        }
        catch (const PdfError &e)
        {
            throw DecodeError("Cannot copy pages " + std::to_string(pageIndex + 1) + "-" +
                              std::to_string(end) + " of " + source.string() + ": " + e.what());
        }

        try
        {
            chunk.Save(chunkPath.string());
        }
        catch (const PdfError &e)
        {
            throw IOError("Failed to write chunk file " + chunkPath.string() + ": " + e.what());
        }

        ChunkRecord record;
        record.index = chunkNo;
        record.totalDeclared = plan.chunkCount;
        record.path = chunkPath;
        record.byteSize = fileSizeOf(chunkPath);
        record.firstUnit = pageIndex;
        record.unitCount = end - pageIndex;
        records.push_back(record);

        Logger::logInfo("Wrote chunk %llu/%llu: %s (pages %llu-%llu)",
                        static_cast<unsigned long long>(chunkNo),
                        static_cast<unsigned long long>(plan.chunkCount),
                        chunkPath.filename().string().c_str(),
                        static_cast<unsigned long long>(pageIndex + 1),
                        static_cast<unsigned long long>(end));

        pageIndex = end;
        ++chunkNo;

        if (onProgress)
        {
            onProgress(ProgressEvent{pageIndex, totalPages,
                                     "Pages " + std::to_string(pageIndex) + "/" + std::to_string(totalPages)});
        }
    }

    return records;
}

} // namespace filechunker
