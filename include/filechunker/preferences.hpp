#pragma once

#include "export.hpp"

#include <map>
#include <string>

namespace filechunker {

/**
 * @brief Flat YAML key-value store for user preferences
 *
 * Front-end state only (appearance, last used output directory and unit).
 * The split engine never reads it.
 */
class FILECHUNKER_API Preferences {
public:
    static constexpr const char* kAppearanceMode = "appearance_mode";
    static constexpr const char* kColorTheme = "color_theme";
    static constexpr const char* kLastOutputDir = "last_output_dir";
    static constexpr const char* kLastUnit = "last_unit";

    Preferences();

    /**
     * @brief Loads key-value pairs from a YAML file, replacing current values
     * @return false when the file exists but cannot be parsed. A missing file
     *         leaves the defaults in place and returns true.
     */
    bool load(const std::string& path);

    /**
     * @brief Writes all values to a YAML file, creating parent directories
     */
    bool save(const std::string& path) const;

    std::string get(const std::string& key, const std::string& defaultValue = "") const;
    void set(const std::string& key, const std::string& value);
    bool contains(const std::string& key) const;

    const std::map<std::string, std::string>& values() const { return values_; }

    // ~/.filechunker/preferences.yaml, or %USERPROFILE%\.filechunker on Windows
    static std::string defaultPath();

private:
#ifdef _WIN32
#pragma warning(push)
#pragma warning(disable: 4251)
#endif
    std::map<std::string, std::string> values_;
#ifdef _WIN32
#pragma warning(pop)
#endif
};

} // namespace filechunker
