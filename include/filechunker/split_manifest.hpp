#ifndef FILECHUNKER_SPLIT_MANIFEST_HPP
#define FILECHUNKER_SPLIT_MANIFEST_HPP

#include "export.hpp"
#include "file_splitter.hpp"
#include "strategy_selector.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace filechunker
{

/**
 * @brief Result of a successful split run
 *
 * Records are kept in the order the splitter emitted them, which is index order.
 */
class FILECHUNKER_API SplitManifest
{
public:
    // Absolute path of the split source
    std::filesystem::path source;

    ContentClass contentClass = ContentClass::Binary;
    SplitStrategy strategy = SplitStrategy::Binary;

    // Bytes or pages, depending on the strategy
    std::uint64_t unitsTotal = 0;

    std::uint64_t sourceBytes = 0;

    std::vector<ChunkRecord> chunks;

    std::size_t size() const { return chunks.size(); }
    bool empty() const { return chunks.empty(); }

    std::uint64_t totalBytes() const;

    /**
     * @brief (file name, byte size) pairs for display
     */
    std::vector<std::pair<std::string, std::uint64_t>> entries() const;

    /**
     * @brief Converts the manifest to JSON
     * @return JSON representation
     */
    nlohmann::json to_json() const;

    /**
     * @brief Writes to_json() to a file, pretty printed
     * @return false when the file cannot be written
     */
    bool saveToFile(const std::string& path) const;
};

} // namespace filechunker

#endif // FILECHUNKER_SPLIT_MANIFEST_HPP
