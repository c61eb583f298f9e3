#include "filechunker/split_policy.hpp"
#include "filechunker/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace filechunker
{

namespace
{
    struct UnitEntry
    {
        SizeUnit unit;
        const char *name;
        std::uint64_t bytes;
    };

    const UnitEntry kUnits[] = {
        {SizeUnit::KB, "KB", 1024ull},
        {SizeUnit::MB, "MB", 1024ull * 1024},
        {SizeUnit::GB, "GB", 1024ull * 1024 * 1024},
        {SizeUnit::Kb, "Kb", 1024ull / 8},
        {SizeUnit::Mb, "Mb", 1024ull * 1024 / 8},
        {SizeUnit::Gb, "Gb", 1024ull * 1024 * 1024 / 8},
    };
} // namespace

std::uint64_t sizeUnitBytes(SizeUnit unit)
{
    for (const auto &entry : kUnits)
    {
        if (entry.unit == unit)
            return entry.bytes;
    }
    return 1;
}

std::string sizeUnitName(SizeUnit unit)
{
    for (const auto &entry : kUnits)
    {
        if (entry.unit == unit)
            return entry.name;
    }
    return "?";
}

std::vector<std::string> sizeUnitNames()
{
    std::vector<std::string> names;
    for (const auto &entry : kUnits)
    {
        names.emplace_back(entry.name);
    }
    return names;
}

SizeUnit parseSizeUnit(const std::string &name)
{
    for (const auto &entry : kUnits)
    {
        if (name == entry.name)
            return entry.unit;
    }

    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "KB")
        return SizeUnit::KB;
    if (upper == "MB")
        return SizeUnit::MB;
    if (upper == "GB")
        return SizeUnit::GB;

    std::string valid;
    for (const auto &unitName : sizeUnitNames())
    {
        if (!valid.empty())
            valid += ", ";
        valid += unitName;
    }
    throw ConfigurationError("Invalid unit '" + name + "'. Allowed: " + valid);
}

SplitPolicy SplitPolicy::byteSize(std::uint64_t bytes)
{
    if (bytes < kMinChunkBytes)
    {
        throw ConfigurationError("Chunk size must be at least 1KB (got " + std::to_string(bytes) + " bytes)");
    }
    return SplitPolicy(Kind::ByteSize, bytes);
}

SplitPolicy SplitPolicy::partCount(std::uint64_t parts)
{
    if (parts < 1)
    {
        throw ConfigurationError("Number of parts must be >= 1");
    }
    return SplitPolicy(Kind::PartCount, parts);
}

SplitPolicy SplitPolicy::fromSize(double value, SizeUnit unit)
{
    if (!std::isfinite(value) || value <= 0.0)
    {
        throw ConfigurationError("Chunk size must be a positive number");
    }
    const double bytes = value * static_cast<double>(sizeUnitBytes(unit));
    if (bytes >= 18446744073709551615.0)
    {
        throw ConfigurationError("Chunk size is too large");
    }
    return byteSize(static_cast<std::uint64_t>(bytes));
}

SplitPolicy SplitPolicy::fromOptions(std::optional<std::uint64_t> bytesPerChunk,
                                     std::optional<std::uint64_t> numberOfChunks)
{
    if (!bytesPerChunk && !numberOfChunks)
    {
        throw ConfigurationError("Must specify either bytes per chunk or number of chunks");
    }
    if (bytesPerChunk && numberOfChunks)
    {
        throw ConfigurationError("Specify only one of bytes per chunk or number of chunks");
    }
    return bytesPerChunk ? byteSize(*bytesPerChunk) : partCount(*numberOfChunks);
}

std::string SplitPolicy::describe() const
{
    std::ostringstream oss;
    if (kind_ == Kind::PartCount)
    {
        oss << value_ << " parts";
    }
    else
    {
        oss << value_ << " bytes per chunk";
    }
    return oss.str();
}

} // namespace filechunker
