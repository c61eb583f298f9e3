#pragma once

#include "export.hpp"

#include <cstdint>
#include <string>
#include <vector>
#include <optional>

namespace filechunker {

// Smallest accepted ByteSize target
constexpr std::uint64_t kMinChunkBytes = 1024;

enum class SizeUnit {
    KB,
    MB,
    GB,
    Kb,
    Mb,
    Gb
};

/**
 * @brief Multiplier in bytes for a unit. Bit units are the byte value / 8.
 */
FILECHUNKER_API std::uint64_t sizeUnitBytes(SizeUnit unit);

FILECHUNKER_API std::string sizeUnitName(SizeUnit unit);

FILECHUNKER_API std::vector<std::string> sizeUnitNames();

/**
 * @brief Parses a unit name.
 *
 * Exact names win ("Mb" is megabits, "MB" megabytes); any other casing falls
 * back to the byte unit ("mb" -> MB). Throws ConfigurationError otherwise.
 */
FILECHUNKER_API SizeUnit parseSizeUnit(const std::string& name);

/**
 * @brief Chunk sizing rule: exactly one of a byte size or a part count.
 *
 * A SplitPolicy is always well-formed; every factory validates and throws
 * ConfigurationError on bad input.
 */
class FILECHUNKER_API SplitPolicy {
public:
    enum class Kind {
        ByteSize,
        PartCount
    };

    static SplitPolicy byteSize(std::uint64_t bytes);
    static SplitPolicy partCount(std::uint64_t parts);

    // value * unit, truncated to whole bytes
    static SplitPolicy fromSize(double value, SizeUnit unit);

    // Exactly one of the two must be set
    static SplitPolicy fromOptions(std::optional<std::uint64_t> bytesPerChunk,
                                   std::optional<std::uint64_t> numberOfChunks);

    Kind kind() const { return kind_; }
    bool isByteSize() const { return kind_ == Kind::ByteSize; }
    bool isPartCount() const { return kind_ == Kind::PartCount; }

    // Bytes per chunk for ByteSize, number of parts for PartCount
    std::uint64_t value() const { return value_; }

    std::string describe() const;

private:
    SplitPolicy(Kind kind, std::uint64_t value) : kind_(kind), value_(value) {}

    Kind kind_;
    std::uint64_t value_;
};

} // namespace filechunker
