#pragma once

#include "export.hpp"
#include "file_splitter.hpp"
#include "split_policy.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace filechunker {

enum class ContentClass {
    Binary,
    Text,
    Paged
};

enum class SplitStrategy {
    Binary,
    Paged
};

FILECHUNKER_API const char* contentClassName(ContentClass cls);
FILECHUNKER_API const char* splitStrategyName(SplitStrategy strategy);

/**
 * @brief Source facts resolved once at the start of a split.
 */
struct FILECHUNKER_API SourceDescriptor {
    std::filesystem::path path;   // absolute
    std::uint64_t sizeBytes = 0;
    ContentClass contentClass = ContentClass::Binary;

    // Throws NotFoundError when path is not an existing regular file
    static SourceDescriptor resolve(const std::filesystem::path& path);
};

/**
 * @brief Extension-only dispatch; every path maps to exactly one strategy.
 *
 * Text and binary content share the byte splitter. The text class is kept
 * apart only so callers can report it.
 */
class FILECHUNKER_API StrategySelector {
public:
    static ContentClass classify(const std::filesystem::path& path);

    static SplitStrategy select(const std::filesystem::path& path);

    static SplitStrategy strategyFor(ContentClass cls);

    static std::unique_ptr<FileSplitter> makeSplitter(SplitStrategy strategy, const SplitPolicy& policy);
};

} // namespace filechunker
