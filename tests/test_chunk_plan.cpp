#include "test_common.h"
#include "filechunker/chunk_plan.hpp"

using namespace filechunker;

static std::vector<std::uint64_t> extents(const ChunkPlan &plan) {
    std::vector<std::uint64_t> sizes;
    for (std::uint64_t i = 1; i <= plan.chunkCount; ++i) sizes.push_back(plan.extentOf(i).unitCount);
    return sizes;
}

static std::uint64_t sum(const std::vector<std::uint64_t> &v) {
    std::uint64_t s = 0;
    for (auto x : v) s += x;
    return s;
}

int main() {
    // 2500 bytes at 1 KiB
    {
        auto plan = ChunkPlan::compute(2500, SplitPolicy::byteSize(1024));
        if (extents(plan) != std::vector<std::uint64_t>{1024, 1024, 452}) return fail(64, "2500/1024 extents");
        if (plan.extentOf(3).firstUnit != 2048) return fail(65, "third extent offset");
    }

    // Byte size: count is ceil(t/s), non-final extents are exactly s
    for (std::uint64_t s : {1024ull, 1500ull, 4096ull}) {
        for (std::uint64_t t : {0ull, 1ull, 1023ull, 1024ull, 1025ull, 4096ull, 10000ull, 65537ull}) {
            auto plan = ChunkPlan::compute(t, SplitPolicy::byteSize(s));
            std::uint64_t expected = t == 0 ? 1 : (t + s - 1) / s;
            if (plan.chunkCount != expected) return fail(66, "byte size count t=" + std::to_string(t) + " s=" + std::to_string(s));
            auto sizes = extents(plan);
            if (sum(sizes) != t) return fail(67, "byte size sum t=" + std::to_string(t));
            for (size_t i = 0; i + 1 < sizes.size(); ++i)
                if (sizes[i] != s) return fail(68, "non-final extent differs from s");
            if (sizes.back() > s) return fail(69, "final extent larger than s");
        }
    }

    // Part count: exactly n chunks covering t
    for (std::uint64_t n = 1; n <= 8; ++n) {
        for (std::uint64_t t = 0; t <= 60; ++t) {
            auto plan = ChunkPlan::compute(t, SplitPolicy::partCount(n));
            if (plan.chunkCount != n) return fail(70, "part count n=" + std::to_string(n));
            auto sizes = extents(plan);
            if (sum(sizes) != t) return fail(71, "part sum t=" + std::to_string(t) + " n=" + std::to_string(n));
            for (size_t i = 0; i + 1 < sizes.size(); ++i)
                if (sizes[i] > plan.unitsPerChunk) return fail(72, "extent above units per chunk");
        }
    }

    // Ceiling runs leave the short chunk at the end
    if (extents(ChunkPlan::compute(10, SplitPolicy::partCount(3))) != std::vector<std::uint64_t>{4, 4, 2})
        return fail(73, "10 in 3 parts");
    if (extents(ChunkPlan::compute(10, SplitPolicy::partCount(4))) != std::vector<std::uint64_t>{3, 3, 3, 1})
        return fail(74, "10 in 4 parts");
    if (extents(ChunkPlan::compute(3, SplitPolicy::partCount(5))) != std::vector<std::uint64_t>{1, 1, 1, 0, 0})
        return fail(75, "3 in 5 parts");

    // Empty source
    {
        auto bytes = ChunkPlan::compute(0, SplitPolicy::byteSize(1024));
        if (bytes.chunkCount != 1 || bytes.extentOf(1).unitCount != 0) return fail(76, "empty source byte size");
        auto parts = ChunkPlan::compute(0, SplitPolicy::partCount(4));
        if (parts.chunkCount != 4 || parts.unitsPerChunk != 0 || sum(extents(parts)) != 0) return fail(77, "empty source parts");
    }

    // Explicit units per chunk
    {
        auto plan = ChunkPlan::withUnitsPerChunk(25, 2);
        if (plan.chunkCount != 13 || plan.extentOf(13).unitCount != 1) return fail(78, "25 pages by 2");
        auto clamped = ChunkPlan::withUnitsPerChunk(5, 0);
        if (clamped.unitsPerChunk != 1 || clamped.chunkCount != 5) return fail(79, "zero units per chunk clamps to 1");
        if (plan.extentOf(0).unitCount != 0 || plan.extentOf(14).unitCount != 0) return fail(80, "out of range extent");
    }

    // Preview matches the real plan
    for (std::uint64_t t : {0ull, 999ull, 2500ull, 5ull * 1024 * 1024 + 3}) {
        auto policy = SplitPolicy::byteSize(1024 * 1024);
        if (estimateChunks(t, policy).count != ChunkPlan::compute(t, policy).chunkCount) return fail(81, "estimate mismatch");
    }
    {
        auto est = estimateChunks(1000, SplitPolicy::partCount(7));
        if (est.count != 7 || est.description != "7 parts (requested)" || est.approximate) return fail(82, "part estimate: " + est.description);
        auto sized = estimateChunks(10ull * 1024 * 1024, SplitPolicy::fromSize(2.5, SizeUnit::MB));
        if (sized.count != 4 || sized.description != "~2.5 MB each") return fail(83, "size estimate: " + sized.description);
    }

    // Preview from disk
    {
        quiet_logs();
        TempDir dir("plan");
        write_file(dir / "data.bin", pattern_bytes(2500));
        write_file(dir / "doc.PDF", pattern_bytes(100));
        auto est = estimateChunks(dir / "data.bin", SplitPolicy::byteSize(1024));
        if (est.count != 3 || est.approximate) return fail(84, "file estimate");
        auto pdf = estimateChunks(dir / "doc.PDF", SplitPolicy::byteSize(1024));
        if (!pdf.approximate || pdf.description.find("approximate") == std::string::npos) return fail(85, "paged estimate should be approximate");
        // A part-count preview of a PDF reads its pages, so an undecodable one fails like a split
        if (!throws<DecodeError>([&] { estimateChunks(dir / "doc.PDF", SplitPolicy::partCount(2)); }))
            return fail(86, "part estimate of an undecodable pdf");
        if (!throws<NotFoundError>([&] { estimateChunks(dir / "missing.bin", SplitPolicy::partCount(2)); }))
            return fail(87, "missing file estimate");
    }

    std::cout << "[TEST] OK chunk plan" << std::endl;
    return 0;
}
