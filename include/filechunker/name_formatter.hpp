#pragma once

#include "export.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace filechunker {

/**
 * @brief Deterministic chunk file names: {stem}_part_{NN}-of-{MM}{ext}
 *
 * NN and MM are zero-padded to two digits; wider values are printed as is
 * ("100"). When the total is not known yet the MM field is rendered as "??".
 * Names are unique per index within one run. A second run into the same
 * directory reuses the same names and overwrites earlier chunks.
 */
class FILECHUNKER_API NameFormatter {
public:
    static std::string chunkName(const std::string& originalFileName,
                                 std::uint64_t index,
                                 std::optional<std::uint64_t> totalChunks);

    static std::filesystem::path chunkPath(const std::filesystem::path& outputDir,
                                           const std::filesystem::path& source,
                                           std::uint64_t index,
                                           std::optional<std::uint64_t> totalChunks);

    static constexpr const char* kUnknownTotal = "??";
};

} // namespace filechunker
