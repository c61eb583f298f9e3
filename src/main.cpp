#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

#include "filechunker/logger.hpp"
#include "filechunker/preferences.hpp"
#include "filechunker/split_orchestrator.hpp"
#include "filechunker/splitter_config.hpp"

using namespace filechunker;

namespace
{
    constexpr int kExitOk = 0;
    constexpr int kExitError = 1;
    constexpr int kExitUsage = 2;

    std::string formatMegabytes(std::uint64_t bytes)
    {
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%.2f MB", static_cast<double>(bytes) / (1024.0 * 1024.0));
        return buffer;
    }

    // -o, then the config file, then the last used folder, then <input>_chunks beside the input
    std::filesystem::path resolveOutputDir(const SplitterConfig &config, const Preferences &prefs)
    {
        if (!config.outputDir.empty())
        {
            return config.outputDir;
        }

        std::string last = prefs.get(Preferences::kLastOutputDir);
        if (!last.empty())
        {
            Logger::logInfo("No output folder given, using last used folder: %s", last.c_str());
            return last;
        }

        std::filesystem::path input(config.inputPath);
        return input.parent_path() / (input.stem().string() + "_chunks");
    }

    void printSummary(const SplitManifest &manifest)
    {
        std::cout << "\nCreated " << manifest.size() << " chunk(s) from "
                  << manifest.source.filename().string() << ":" << std::endl;

        std::size_t width = 4;
        for (const auto &entry : manifest.entries())
        {
            width = std::max(width, entry.first.size());
        }

        std::cout << "  " << std::left << std::setw(static_cast<int>(width)) << "Name"
                  << "  " << std::right << std::setw(12) << "Size" << std::endl;
        for (const auto &entry : manifest.entries())
        {
            std::cout << "  " << std::left << std::setw(static_cast<int>(width)) << entry.first
                      << "  " << std::right << std::setw(12) << formatMegabytes(entry.second) << std::endl;
        }
        std::cout << "  Total: " << formatMegabytes(manifest.totalBytes()) << std::endl;
    }
}

int main(int argc, char *argv[])
{
    SplitterConfig config;
    if (!config.loadFromArgs(argc, argv))
    {
        if (config.helpOrVersionShown)
        {
            return kExitOk;
        }
        std::cerr << "Run 'filechunker --help' for usage." << std::endl;
        return kExitUsage;
    }

    auto &logger = Logger::instance();
    LogLevel logLevel = LogLevel::LOG_INFO;
    if (Logger::parseLevel(config.logLevel, logLevel))
    {
        logger.setLevel(logLevel);
    }
    logger.setQuietMode(config.quietMode);

    if (!config.logFile.empty())
    {
        if (!logger.setLogFile(config.logFile))
        {
            std::cerr << "Warning: Failed to open log file: " << config.logFile << std::endl;
        }
    }

    if (!config.saveConfigFile.empty())
    {
        if (config.saveToFile(config.saveConfigFile))
        {
            Logger::logInfo("Configuration saved to %s", config.saveConfigFile.c_str());
        }
        else
        {
            std::cerr << "Warning: Failed to save configuration to " << config.saveConfigFile << std::endl;
        }
    }

    const std::string prefsPath = config.preferencesFile.empty() ? Preferences::defaultPath() : config.preferencesFile;
    Preferences prefs;
    if (!prefs.load(prefsPath))
    {
        Logger::logWarning("Ignoring unreadable preferences file %s", prefsPath.c_str());
    }

    OrchestratorOptions options;
    options.progressCapacity = config.progressCapacity;
    SplitOrchestrator orchestrator(options);

    try
    {
        const SplitPolicy policy = config.buildPolicy();

        if (config.previewOnly)
        {
            ChunkEstimate estimate = orchestrator.estimate(config.inputPath, policy);
            std::cout << "Estimated chunks: " << estimate.count << " (" << estimate.description << ")" << std::endl;
            return kExitOk;
        }

        const std::filesystem::path outputDir = resolveOutputDir(config, prefs);

        auto result = orchestrator.start(config.inputPath, outputDir, policy);

        ProgressChannel &progress = orchestrator.progress();
        while (true)
        {
            auto event = progress.waitPop(std::chrono::milliseconds(100));
            if (event)
            {
                if (!config.quietMode)
                {
                    int percent = event->unitsTotal == 0
                                      ? 100
                                      : static_cast<int>(event->unitsDone * 100 / event->unitsTotal);
                    std::cout << "[" << std::setw(3) << percent << "%] " << event->label << std::endl;
                }
            }
            else if (progress.closed() && progress.size() == 0)
            {
                break;
            }
        }

        SplitManifest manifest = result.get();
        printSummary(manifest);

        if (progress.dropped() > 0)
        {
            Logger::logDebug("%zu progress event(s) dropped", progress.dropped());
        }

        if (!config.manifestFile.empty())
        {
            if (!manifest.saveToFile(config.manifestFile))
            {
                std::cerr << "Error: Failed to write manifest " << config.manifestFile << std::endl;
                return kExitError;
            }
            Logger::logInfo("Manifest written to %s", config.manifestFile.c_str());
        }

        prefs.set(Preferences::kLastOutputDir, std::filesystem::absolute(outputDir).string());
        if (config.mode == "size")
        {
            prefs.set(Preferences::kLastUnit, config.sizeUnit);
        }
        if (!prefs.save(prefsPath))
        {
            Logger::logWarning("Failed to save preferences to %s", prefsPath.c_str());
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitError;
    }

    return kExitOk;
}
