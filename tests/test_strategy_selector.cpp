#include "test_common.h"
#include "filechunker/strategy_selector.hpp"
#include <cstring>

using namespace filechunker;

int main() {
    quiet_logs();

    if (StrategySelector::classify("a.pdf") != ContentClass::Paged) return fail(64, ".pdf");
    if (StrategySelector::classify("A.PDF") != ContentClass::Paged) return fail(65, "case insensitive");
    for (const char *name : {"n.txt", "n.log", "n.csv", "n.json", "n.MD"})
        if (StrategySelector::classify(name) != ContentClass::Text) return fail(66, std::string("text: ") + name);
    for (const char *name : {"n.bin", "n.mp4", "n.zip", "noext", ".hidden", "n.pdf.gz"})
        if (StrategySelector::classify(name) != ContentClass::Binary) return fail(67, std::string("binary: ") + name);

    if (StrategySelector::select("notes.txt") != SplitStrategy::Binary) return fail(68, "text uses binary strategy");
    if (StrategySelector::select("scan.pdf") != SplitStrategy::Paged) return fail(69, "pdf uses paged strategy");

    auto paged = StrategySelector::makeSplitter(SplitStrategy::Paged, SplitPolicy::partCount(2));
    auto binary = StrategySelector::makeSplitter(SplitStrategy::Binary, SplitPolicy::byteSize(4096));
    if (!paged || std::strcmp(paged->name(), "paged") != 0) return fail(70, "paged splitter");
    if (!binary || std::strcmp(binary->name(), "binary") != 0) return fail(71, "binary splitter");
    if (binary->policy().value() != 4096) return fail(72, "policy carried by splitter");

    if (std::string(contentClassName(ContentClass::Text)) != "text") return fail(73, "class name");
    if (std::string(splitStrategyName(SplitStrategy::Paged)) != "paged") return fail(74, "strategy name");

    {
        TempDir dir("selector");
        write_file(dir / "Report.Csv", pattern_bytes(77));
        auto descriptor = SourceDescriptor::resolve(dir / "Report.Csv");
        if (!descriptor.path.is_absolute()) return fail(75, "absolute path");
        if (descriptor.sizeBytes != 77 || descriptor.contentClass != ContentClass::Text) return fail(76, "descriptor fields");

        if (!throws<NotFoundError>([&] { SourceDescriptor::resolve(dir / "missing.bin"); })) return fail(77, "missing file");
        if (!throws<NotFoundError>([&] { SourceDescriptor::resolve(""); })) return fail(78, "empty path");
        if (!throws<NotFoundError>([&] { SourceDescriptor::resolve(dir.path()); })) return fail(79, "directory is not a file");
    }

    std::cout << "[TEST] OK strategy selector" << std::endl;
    return 0;
}
