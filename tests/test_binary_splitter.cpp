#include "test_common.h"
#include "filechunker/binary_splitter.hpp"

using namespace filechunker;

static std::vector<char> concat(const std::vector<ChunkRecord> &records) {
    std::vector<char> all;
    for (const auto &r : records) {
        auto part = read_file(r.path);
        all.insert(all.end(), part.begin(), part.end());
    }
    return all;
}

int main() {
    quiet_logs();

    // 2500 bytes at 1 KiB, with a buffer smaller than a chunk
    {
        TempDir dir("binary_kib");
        auto data = pattern_bytes(2500);
        write_file(dir / "blob.dat", data);
        BinarySplitter splitter(SplitPolicy::byteSize(1024), 300);
        std::vector<ProgressEvent> events;
        auto records = splitter.split(dir / "blob.dat", dir / "out", [&](const ProgressEvent &e) { events.push_back(e); });

        if (records.size() != 3) return fail(64, "expected 3 chunks");
        std::vector<std::uint64_t> sizes;
        for (const auto &r : records) sizes.push_back(fs::file_size(r.path));
        if (sizes != std::vector<std::uint64_t>{1024, 1024, 452}) return fail(65, "chunk sizes");
        if (records[2].path.filename() != "blob_part_03-of-03.dat") return fail(66, "chunk name " + records[2].path.filename().string());
        if (records[1].firstUnit != 1024 || records[2].byteSize != 452) return fail(67, "record extents");
        if (concat(records) != data) return fail(68, "round trip");

        if (events.size() != 3) return fail(69, "one progress event per chunk");
        for (size_t i = 0; i < events.size(); ++i) {
            if (events[i].unitsTotal != 2500) return fail(70, "progress total");
            if (i > 0 && events[i].unitsDone <= events[i - 1].unitsDone) return fail(71, "progress not increasing");
        }
        if (events.back().unitsDone != 2500 || events.back().label != "Chunk 3/3") return fail(72, "last progress event");
    }

    // Part count round trip, no extension, larger source
    {
        TempDir dir("binary_parts");
        auto data = pattern_bytes(1000003);
        write_file(dir / "payload", data);
        BinarySplitter splitter(SplitPolicy::partCount(7));
        auto records = splitter.split(dir / "payload", dir / "parts", nullptr);
        if (records.size() != 7) return fail(73, "expected 7 parts");
        if (list_files(dir / "parts").size() != 7) return fail(74, "files on disk");
        if (records[0].path.filename() != "payload_part_01-of-07") return fail(75, "name without extension");
        if (concat(records) != data) return fail(76, "part round trip");
        for (size_t i = 0; i < records.size(); ++i) {
            if (records[i].index != i + 1 || records[i].totalDeclared != 7) return fail(77, "record numbering");
        }
    }

    // Zero byte source
    {
        TempDir dir("binary_empty");
        write_file(dir / "empty.txt", {});
        BinarySplitter bySize(SplitPolicy::byteSize(4096));
        auto one = bySize.split(dir / "empty.txt", dir / "a", nullptr);
        if (one.size() != 1 || fs::file_size(one[0].path) != 0) return fail(78, "one empty chunk under byte size");

        BinarySplitter byParts(SplitPolicy::partCount(3));
        auto three = byParts.split(dir / "empty.txt", dir / "b", nullptr);
        if (three.size() != 3) return fail(79, "three empty chunks under part count");
        for (const auto &r : three)
            if (!fs::exists(r.path) || fs::file_size(r.path) != 0) return fail(80, "empty chunk file");
    }

    // More parts than bytes
    {
        TempDir dir("binary_tiny");
        write_file(dir / "tiny.bin", pattern_bytes(3));
        BinarySplitter splitter(SplitPolicy::partCount(5));
        auto records = splitter.split(dir / "tiny.bin", dir / "out", nullptr);
        if (records.size() != 5) return fail(81, "five records");
        std::vector<std::uint64_t> sizes;
        for (const auto &r : records) sizes.push_back(r.byteSize);
        if (sizes != std::vector<std::uint64_t>{1, 1, 1, 0, 0}) return fail(82, "tiny sizes");
    }

    // Missing source
    {
        TempDir dir("binary_missing");
        std::string message;
        BinarySplitter splitter(SplitPolicy::partCount(2));
        if (!throws<NotFoundError>([&] { splitter.split(dir / "nope.bin", dir / "out", nullptr); }, &message))
            return fail(83, "missing source");
        if (message.find("nope.bin") == std::string::npos) return fail(84, "message names the file: " + message);
        if (fs::exists(dir / "out")) return fail(85, "output created for missing source");
    }

    // Output location is a regular file
    {
        TempDir dir("binary_perm");
        write_file(dir / "src.bin", pattern_bytes(2048));
        write_file(dir / "blocker", pattern_bytes(1));
        BinarySplitter splitter(SplitPolicy::partCount(2));
        if (!throws<PermissionError>([&] { splitter.split(dir / "src.bin", dir / "blocker", nullptr); }))
            return fail(86, "file as output dir");
        if (list_files(dir.path()).size() != 2) return fail(87, "partial output written");
    }

    // Output directory is created, nested
    {
        TempDir dir("binary_nested");
        write_file(dir / "n.bin", pattern_bytes(1500));
        BinarySplitter splitter(SplitPolicy::byteSize(1024));
        auto records = splitter.split(dir / "n.bin", dir / "a" / "b" / "c", nullptr);
        if (records.size() != 2 || !fs::is_directory(dir / "a" / "b" / "c")) return fail(88, "nested output");
        if (list_files(dir / "a" / "b" / "c").size() != 2) return fail(89, "no probe file left behind");
    }

    std::cout << "[TEST] OK binary splitter" << std::endl;
    return 0;
}
