#include "filechunker/split_manifest.hpp"
#include "filechunker/logger.hpp"

#include <fstream>

namespace filechunker
{

std::uint64_t SplitManifest::totalBytes() const
{
    std::uint64_t total = 0;
    for (const auto &chunk : chunks)
    {
        total += chunk.byteSize;
    }
    return total;
}

std::vector<std::pair<std::string, std::uint64_t>> SplitManifest::entries() const
{
    std::vector<std::pair<std::string, std::uint64_t>> out;
    out.reserve(chunks.size());
    for (const auto &chunk : chunks)
    {
        out.emplace_back(chunk.path.filename().string(), chunk.byteSize);
    }
    return out;
}

nlohmann::json SplitManifest::to_json() const
{
    nlohmann::json j;
    j["source"] = source.string();
    j["content_class"] = contentClassName(contentClass);
    j["strategy"] = splitStrategyName(strategy);
    j["units_total"] = unitsTotal;
    j["source_bytes"] = sourceBytes;
    j["total_bytes"] = totalBytes();

    nlohmann::json list = nlohmann::json::array();
    for (const auto &chunk : chunks)
    {
        list.push_back({{"index", chunk.index},
                        {"total", chunk.totalDeclared},
                        {"file_name", chunk.path.filename().string()},
                        {"path", chunk.path.string()},
                        {"byte_size", chunk.byteSize},
                        {"first_unit", chunk.firstUnit},
                        {"unit_count", chunk.unitCount}});
    }
    j["chunks"] = list;
    return j;
}

bool SplitManifest::saveToFile(const std::string &path) const
{
    try
    {
        std::ofstream out(path, std::ios::trunc);
        if (!out.is_open())
        {
            Logger::logError("Failed to open manifest file: %s", path.c_str());
            return false;
        }
        out << to_json().dump(2) << std::endl;
        if (!out)
        {
            Logger::logError("Failed to write manifest file: %s", path.c_str());
            return false;
        }
        return true;
    }
    catch (const std::exception &e)
    {
        Logger::logError("Failed to write manifest file %s: %s", path.c_str(), e.what());
        return false;
    }
}

} // namespace filechunker
