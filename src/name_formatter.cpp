#include "filechunker/name_formatter.hpp"

#include <iomanip>
#include <sstream>

namespace filechunker
{

std::string NameFormatter::chunkName(const std::string &originalFileName,
                                     std::uint64_t index,
                                     std::optional<std::uint64_t> totalChunks)
{
    const std::filesystem::path original(originalFileName);
    const std::string stem = original.stem().string();
    const std::string extension = original.extension().string();

    std::ostringstream name;
    name << stem << "_part_" << std::setfill('0') << std::setw(2) << index << "-of-";
    if (totalChunks)
    {
        name << std::setw(2) << *totalChunks;
    }
    else
    {
        name << kUnknownTotal;
    }
    name << extension;
    return name.str();
}

std::filesystem::path NameFormatter::chunkPath(const std::filesystem::path &outputDir,
                                               const std::filesystem::path &source,
                                               std::uint64_t index,
                                               std::optional<std::uint64_t> totalChunks)
{
    return outputDir / chunkName(source.filename().string(), index, totalChunks);
}

} // namespace filechunker
