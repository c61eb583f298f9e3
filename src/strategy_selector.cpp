#include "filechunker/strategy_selector.hpp"
#include "filechunker/binary_splitter.hpp"
#include "filechunker/errors.hpp"
#include "filechunker/page_splitter.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <unordered_set>

namespace filechunker
{

namespace
{
    std::string lowerExtension(const std::filesystem::path &path)
    {
        std::string extension = path.extension().string();
        std::transform(extension.begin(), extension.end(), extension.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return extension;
    }

    const std::unordered_set<std::string> &pagedExtensions()
    {
        static const std::unordered_set<std::string> extensions{".pdf"};
        return extensions;
    }

    const std::unordered_set<std::string> &textExtensions()
    {
        static const std::unordered_set<std::string> extensions{".txt", ".log", ".csv", ".json", ".md"};
        return extensions;
    }
} // namespace

const char *contentClassName(ContentClass cls)
{
    switch (cls)
    {
    case ContentClass::Text:
        return "text";
    case ContentClass::Paged:
        return "paged";
    case ContentClass::Binary:
    default:
        return "binary";
    }
}

const char *splitStrategyName(SplitStrategy strategy)
{
    return strategy == SplitStrategy::Paged ? "paged" : "binary";
}

SourceDescriptor SourceDescriptor::resolve(const std::filesystem::path &path)
{
    std::error_code ec;
    if (path.empty() || !std::filesystem::is_regular_file(path, ec))
    {
        throw NotFoundError("File not found: " + path.string());
    }

    SourceDescriptor descriptor;
    descriptor.path = std::filesystem::absolute(path, ec);
    if (ec)
    {
        descriptor.path = path;
    }

    const auto size = std::filesystem::file_size(path, ec);
    if (ec)
    {
        throw IOError("Cannot read size of " + path.string() + ": " + ec.message());
    }
    descriptor.sizeBytes = static_cast<std::uint64_t>(size);
    descriptor.contentClass = StrategySelector::classify(path);
    return descriptor;
}

ContentClass StrategySelector::classify(const std::filesystem::path &path)
{
    const std::string extension = lowerExtension(path);
    if (pagedExtensions().count(extension))
    {
        return ContentClass::Paged;
    }
    if (textExtensions().count(extension))
    {
        return ContentClass::Text;
    }
    return ContentClass::Binary;
}

SplitStrategy StrategySelector::strategyFor(ContentClass cls)
{
    return cls == ContentClass::Paged ? SplitStrategy::Paged : SplitStrategy::Binary;
}

SplitStrategy StrategySelector::select(const std::filesystem::path &path)
{
    return strategyFor(classify(path));
}

std::unique_ptr<FileSplitter> StrategySelector::makeSplitter(SplitStrategy strategy, const SplitPolicy &policy)
{
    switch (strategy)
    {
    case SplitStrategy::Paged:
        return std::make_unique<PageSplitter>(policy);
    case SplitStrategy::Binary:
    default:
        return std::make_unique<BinarySplitter>(policy);
    }
}

} // namespace filechunker
