#include "test_common.h"
#include "filechunker/name_formatter.hpp"
#include <set>

using namespace filechunker;

int main() {
    if (NameFormatter::chunkName("report.pdf", 1, 3) != "report_part_01-of-03.pdf") return fail(64, "basic name");
    if (NameFormatter::chunkName("data.bin", 7, std::nullopt) != "data_part_07-of-??.bin") return fail(65, "unknown total");
    if (NameFormatter::chunkName("big.iso", 100, 100) != "big_part_100-of-100.iso") return fail(66, "wide index");
    if (NameFormatter::chunkName("README", 2, 12) != "README_part_02-of-12") return fail(67, "no extension");
    if (NameFormatter::chunkName("archive.tar.gz", 1, 2) != "archive.tar_part_01-of-02.gz") return fail(68, "last extension only");

    auto path = NameFormatter::chunkPath("out", "/data/in/video.mp4", 3, 10);
    if (path != fs::path("out") / "video_part_03-of-10.mp4") return fail(69, "chunk path: " + path.string());

    std::set<std::string> seen;
    for (std::uint64_t i = 1; i <= 250; ++i) {
        if (!seen.insert(NameFormatter::chunkName("x.bin", i, 250)).second) return fail(70, "duplicate name at " + std::to_string(i));
    }

    std::cout << "[TEST] OK name formatter" << std::endl;
    return 0;
}
