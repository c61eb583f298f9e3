#include "filechunker/splitter_config.hpp"
#include "filechunker/errors.hpp"
#include "filechunker/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <fstream>
#include <iostream>

namespace filechunker
{

bool SplitterConfig::loadFromArgs(int argc, char *argv[])
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        try
        {
            if ((arg == "-c" || arg == "--config") && i + 1 < argc)
            {
                std::string configFile = argv[++i];
                if (!loadFromFile(configFile))
                {
                    return false;
                }
                currentConfigFilePath = std::filesystem::absolute(configFile).string();
                Logger::instance().debug("Loaded configuration from " + configFile);
            }
            else if ((arg == "-o" || arg == "--output") && i + 1 < argc)
            {
                outputDir = argv[++i];
            }

            // Split mode
            else if ((arg == "-s" || arg == "--size") && i + 1 < argc)
            {
                sizeValue = std::stod(argv[++i]);
                mode = "size";
                sizeFlagGiven = true;
            }
            else if ((arg == "-u" || arg == "--unit") && i + 1 < argc)
            {
                sizeUnit = argv[++i];
            }
            else if ((arg == "-n" || arg == "--parts") && i + 1 < argc)
            {
                parts = std::stoll(argv[++i]);
                mode = "parts";
                partsFlagGiven = true;
            }
            else if ((arg == "--mode") && i + 1 < argc)
            {
                mode = argv[++i];
            }
            else if (arg == "--preview")
            {
                previewOnly = true;
            }
            else if ((arg == "--manifest") && i + 1 < argc)
            {
                manifestFile = argv[++i];
            }

            // Logging options
            else if ((arg == "--log-level") && i + 1 < argc)
            {
                logLevel = argv[++i];
            }
            else if ((arg == "--log-file") && i + 1 < argc)
            {
                logFile = argv[++i];
            }
            else if (arg == "-q" || arg == "--quiet")
            {
                quietMode = true;
            }
            else if ((arg == "--progress-capacity") && i + 1 < argc)
            {
                long long capacity = std::stoll(argv[++i]);
                if (capacity < 1)
                {
                    std::cerr << "Error: Progress channel capacity must be at least 1" << std::endl;
                    return false;
                }
                progressCapacity = static_cast<std::size_t>(capacity);
            }
            else if ((arg == "--preferences") && i + 1 < argc)
            {
                preferencesFile = argv[++i];
            }
            else if ((arg == "--save-config") && i + 1 < argc)
            {
                saveConfigFile = argv[++i];
            }

            // Help and version
            else if (arg == "-h" || arg == "--help")
            {
                printHelp();
                helpOrVersionShown = true;
                return false;
            }
            else if (arg == "-v" || arg == "--version")
            {
                printVersion();
                helpOrVersionShown = true;
                return false;
            }
            else if (!arg.empty() && arg.front() == '-')
            {
                std::cerr << "Unknown option: " << arg << std::endl;
                return false;
            }
            else if (inputPath.empty())
            {
                inputPath = arg;
            }
            else
            {
                std::cerr << "Unexpected argument: " << arg << std::endl;
                return false;
            }
        }
        catch (const std::exception &)
        {
            std::cerr << "Error: Invalid value for " << arg << std::endl;
            return false;
        }
    }

    return validate();
}

bool SplitterConfig::loadFromFile(const std::string &configFile)
{
    try
    {
        YAML::Node config = YAML::LoadFile(configFile);

        if (config["split"])
        {
            auto split = config["split"];
            if (split["mode"])
                mode = split["mode"].as<std::string>();
            if (split["size"])
                sizeValue = split["size"].as<double>();
            if (split["unit"])
                sizeUnit = split["unit"].as<std::string>();
            if (split["parts"])
                parts = split["parts"].as<long long>();
            if (split["output_dir"])
                outputDir = split["output_dir"].as<std::string>();
        }

        if (config["logging"])
        {
            auto logging = config["logging"];
            if (logging["level"])
                logLevel = logging["level"].as<std::string>();
            if (logging["file"])
                logFile = logging["file"].as<std::string>();
            if (logging["quiet_mode"])
                quietMode = logging["quiet_mode"].as<bool>();
        }

        if (config["progress"])
        {
            auto progress = config["progress"];
            if (progress["channel_capacity"])
                progressCapacity = progress["channel_capacity"].as<std::size_t>();
        }

        if (config["manifest"])
        {
            auto manifest = config["manifest"];
            if (manifest["file"])
                manifestFile = manifest["file"].as<std::string>();
        }

        if (config["preferences"])
        {
            auto preferences = config["preferences"];
            if (preferences["file"])
                preferencesFile = preferences["file"].as<std::string>();
        }

        return true;
    }
    catch (const YAML::Exception &e)
    {
        std::cerr << "Error parsing config file " << configFile << ": " << e.what() << std::endl;
        return false;
    }
}

bool SplitterConfig::saveToFile(const std::string &configFile) const
{
    try
    {
        YAML::Node config;
        config["split"]["mode"] = mode;
        config["split"]["size"] = sizeValue;
        config["split"]["unit"] = sizeUnit;
        config["split"]["parts"] = parts;
        config["split"]["output_dir"] = outputDir;

        config["logging"]["level"] = logLevel;
        config["logging"]["file"] = logFile;
        config["logging"]["quiet_mode"] = quietMode;

        config["progress"]["channel_capacity"] = progressCapacity;

        config["manifest"]["file"] = manifestFile;
        config["preferences"]["file"] = preferencesFile;

        std::filesystem::path path(configFile);
        if (path.has_parent_path())
        {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(configFile);
        if (!file.is_open())
        {
            Logger::logError("Failed to open config file for writing: %s", configFile.c_str());
            return false;
        }
        file << config;
        return static_cast<bool>(file);
    }
    catch (const std::exception &e)
    {
        Logger::logError("Failed to save config to %s: %s", configFile.c_str(), e.what());
        return false;
    }
}

bool SplitterConfig::validate() const
{
    if (inputPath.empty())
    {
        std::cerr << "Error: Input file not specified" << std::endl;
        return false;
    }

    if (mode != "size" && mode != "parts")
    {
        std::cerr << "Error: Invalid mode: " << mode << " (expected size or parts)" << std::endl;
        return false;
    }

    LogLevel level;
    if (!Logger::parseLevel(logLevel, level))
    {
        std::cerr << "Error: Invalid log level: " << logLevel << std::endl;
        return false;
    }

    if (progressCapacity == 0)
    {
        std::cerr << "Error: Progress channel capacity must be at least 1" << std::endl;
        return false;
    }

    try
    {
        (void)buildPolicy();
    }
    catch (const ConfigurationError &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return false;
    }

    return true;
}

SplitPolicy SplitterConfig::buildPolicy() const
{
    if (sizeFlagGiven && partsFlagGiven)
    {
        throw ConfigurationError("Specify either --size or --parts, not both");
    }
    if (mode == "parts")
    {
        if (parts < 1)
        {
            throw ConfigurationError("Number of parts must be at least 1");
        }
        return SplitPolicy::partCount(static_cast<std::uint64_t>(parts));
    }
    if (mode == "size")
    {
        return SplitPolicy::fromSize(sizeValue, parseSizeUnit(sizeUnit));
    }
    throw ConfigurationError("Invalid mode: " + mode);
}

void SplitterConfig::printHelp()
{
    std::cout << "File Chunker v1.0.0 - split a file into smaller parts\n\n";
    std::cout << "USAGE:\n";
    std::cout << "    filechunker <input-file> [OPTIONS]\n\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  Split:\n";
    std::cout << "    -o, --output DIR          Output folder (default: last used, else <input>_chunks)\n";
    std::cout << "    -s, --size N              Split by size, N units per chunk (default: 500)\n";
    std::cout << "    -u, --unit UNIT           Size unit: KB, MB, GB, Kb, Mb, Gb (default: MB)\n";
    std::cout << "    -n, --parts N             Split into N parts\n";
    std::cout << "    --mode size|parts         Select the split mode explicitly\n";
    std::cout << "    --preview                 Print the estimated chunk count and exit\n";
    std::cout << "    --manifest FILE           Write a JSON manifest of the produced chunks\n";
    std::cout << "    -c, --config FILE         Load configuration from YAML file\n";
    std::cout << "    --save-config FILE        Save the effective configuration to YAML file\n";
    std::cout << "    --preferences FILE        Preferences file (default: ~/.filechunker/preferences.yaml)\n\n";

    std::cout << "  Logging:\n";
    std::cout << "    --log-level LEVEL         Log level: DEBUG, INFO, WARN, ERROR (default: INFO)\n";
    std::cout << "    --log-file FILE           Also append log lines to FILE\n";
    std::cout << "    -q, --quiet               Hide per-chunk progress lines\n";
    std::cout << "    --progress-capacity N     Progress channel capacity (default: 1024)\n\n";

    std::cout << "  Help:\n";
    std::cout << "    -h, --help                Show this help message\n";
    std::cout << "    -v, --version             Show version information\n\n";

    std::cout << "Chunks are named <stem>_part_NN-of-MM<ext>. PDF files are split on page\n";
    std::cout << "boundaries; with --size a PDF is grouped by pages/10, an approximation.\n\n";

    std::cout << "EXAMPLES:\n";
    std::cout << "  # 100 MB chunks\n";
    std::cout << "  filechunker backup.tar -o parts --size 100 --unit MB\n\n";
    std::cout << "  # Split a PDF into 4 documents\n";
    std::cout << "  filechunker report.pdf -o parts --parts 4\n\n";
    std::cout << "  # Preview only\n";
    std::cout << "  filechunker video.mp4 --size 1 --unit GB --preview\n\n";
}

void SplitterConfig::printVersion()
{
    std::cout << "File Chunker v1.0.0\n";
    std::cout << "Splits files by size or number of parts; PDFs by whole pages\n";
    std::cout << "Built with C++17, PDF support through PoDoFo\n";
}

} // namespace filechunker
