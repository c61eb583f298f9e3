#include "filechunker/file_splitter.hpp"
#include "filechunker/errors.hpp"
#include "filechunker/logger.hpp"

#include <fstream>
#include <system_error>

namespace filechunker
{

void FileSplitter::requireSourceFile(const std::filesystem::path &source)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec))
    {
        throw NotFoundError("File not found: " + source.string());
    }
}

void FileSplitter::ensureOutputDir(const std::filesystem::path &outputDir)
{
    std::error_code ec;
    std::filesystem::create_directories(outputDir, ec);
    if (ec || !std::filesystem::is_directory(outputDir))
    {
        throw PermissionError("Cannot create output directory: " + outputDir.string() +
                              (ec ? " (" + ec.message() + ")" : std::string()));
    }

    const auto probe = outputDir / ".filechunker_write_probe";
    {
        std::ofstream ofs(probe, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open())
        {
            throw PermissionError("Cannot write to directory: " + outputDir.string());
        }
    }
    std::filesystem::remove(probe, ec);
    if (ec)
    {
        Logger::logWarning("Could not remove write probe in %s: %s",
                           outputDir.string().c_str(), ec.message().c_str());
    }
}

std::uint64_t FileSplitter::fileSizeOf(const std::filesystem::path &path)
{
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec)
    {
        throw IOError("Cannot read size of " + path.string() + ": " + ec.message());
    }
    return static_cast<std::uint64_t>(size);
}

} // namespace filechunker
