#pragma once

#include "export.hpp"
#include "split_policy.hpp"

#include <cstddef>
#include <string>

namespace filechunker {

/**
 * @brief Settings of one command-line split run
 *
 * Populated from a YAML file and/or command-line arguments; arguments are
 * applied in order, so a later flag overrides a config file given earlier.
 */
struct FILECHUNKER_API SplitterConfig {
#ifdef _WIN32
#pragma warning(push)
#pragma warning(disable: 4251)
#endif
    std::string inputPath;
    std::string outputDir;

    // "size" or "parts"
    std::string mode = "size";
    double sizeValue = 500.0;
    std::string sizeUnit = "MB";
    long long parts = 5;

    // Logging configuration
    std::string logLevel = "INFO";    // DEBUG, INFO, WARN, ERROR
    std::string logFile = "";         // Empty means console only
    bool quietMode = false;           // Suppress per-chunk progress lines

    std::size_t progressCapacity = 1024;

    std::string manifestFile = "";    // Empty means no JSON manifest
    std::string preferencesFile = ""; // Empty means Preferences::defaultPath()
    std::string saveConfigFile = "";

    bool previewOnly = false;

    // Internal flags
    bool helpOrVersionShown = false;
    bool sizeFlagGiven = false;   // --size seen on the command line
    bool partsFlagGiven = false;  // --parts seen on the command line

    // Path of the YAML file loaded through --config, if any
    std::string currentConfigFilePath;
#ifdef _WIN32
#pragma warning(pop)
#endif

    SplitterConfig() = default;

    /**
     * @brief Load configuration from command line arguments
     * @param argc Argument count
     * @param argv Argument values
     * @return True if configuration was loaded and validated
     */
    bool loadFromArgs(int argc, char* argv[]);

    /**
     * @brief Load configuration from YAML file
     * @param configFile Path to configuration file
     * @return True if configuration was loaded successfully
     */
    bool loadFromFile(const std::string& configFile);

    /**
     * @brief Save current configuration to YAML file
     * @param configFile Path to save configuration
     * @return True if configuration was saved successfully
     */
    bool saveToFile(const std::string& configFile) const;

    /**
     * @brief Validate the configuration
     * @return True if configuration is valid
     */
    bool validate() const;

    /**
     * @brief Policy for the configured mode. Throws ConfigurationError, also
     * when both --size and --parts were given.
     */
    SplitPolicy buildPolicy() const;

    static void printHelp();

    static void printVersion();
};

} // namespace filechunker
