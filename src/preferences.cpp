#include "filechunker/preferences.hpp"
#include "filechunker/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace filechunker
{

Preferences::Preferences()
{
    values_[kAppearanceMode] = "System";
    values_[kColorTheme] = "blue";
}

bool Preferences::load(const std::string &path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        Logger::logDebug("No preferences file at %s, using defaults", path.c_str());
        return true;
    }

    try
    {
        YAML::Node root = YAML::LoadFile(path);
        if (!root.IsDefined() || root.IsNull())
        {
            return true;
        }
        if (!root.IsMap())
        {
            Logger::logWarning("Preferences file %s is not a key-value map", path.c_str());
            return false;
        }

        for (const auto &item : root)
        {
            if (item.second.IsScalar())
            {
                values_[item.first.as<std::string>()] = item.second.as<std::string>();
            }
        }
        return true;
    }
    catch (const YAML::Exception &e)
    {
        Logger::logWarning("Failed to parse preferences %s: %s", path.c_str(), e.what());
        return false;
    }
}

bool Preferences::save(const std::string &path) const
{
    try
    {
        std::filesystem::path target(path);
        if (target.has_parent_path())
        {
            std::filesystem::create_directories(target.parent_path());
        }

        YAML::Node root;
        for (const auto &kv : values_)
        {
            root[kv.first] = kv.second;
        }

        std::ofstream file(path);
        if (!file.is_open())
        {
            Logger::logWarning("Failed to open preferences file for writing: %s", path.c_str());
            return false;
        }
        file << root;
        return static_cast<bool>(file);
    }
    catch (const std::exception &e)
    {
        Logger::logWarning("Failed to save preferences to %s: %s", path.c_str(), e.what());
        return false;
    }
}

std::string Preferences::get(const std::string &key, const std::string &defaultValue) const
{
    auto it = values_.find(key);
    return it != values_.end() ? it->second : defaultValue;
}

void Preferences::set(const std::string &key, const std::string &value)
{
    values_[key] = value;
}

bool Preferences::contains(const std::string &key) const
{
    return values_.find(key) != values_.end();
}

std::string Preferences::defaultPath()
{
#ifdef _WIN32
    const char *homeDir = getenv("USERPROFILE");
#else
    const char *homeDir = getenv("HOME");
#endif
    if (homeDir)
    {
        return (std::filesystem::path(homeDir) / ".filechunker" / "preferences.yaml").string();
    }
    return "preferences.yaml";
}

} // namespace filechunker
