#pragma once
#include <unordered_map>
#include <string>
#include <functional>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <vector>
#include <stdexcept>
#include <mutex>
#include <cstdlib>
#include <type_traits>

namespace whodat {

namespace ConfigPaths {
    static const std::string MAIN_CONFIG = "whodat.cfg";

    // $XDG_CONFIG_HOME/whodat/whodat.cfg, falling back to ~/.config
    inline std::string GetDefaultConfigPath() {
        namespace fs = std::filesystem;
        if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
            return (fs::path(xdg) / "whodat" / MAIN_CONFIG).string();
        }
        if (const char* home = std::getenv("HOME"); home && *home) {
            return (fs::path(home) / ".config" / "whodat" / MAIN_CONFIG).string();
        }
        return MAIN_CONFIG;
    }
}

// INI-style settings store: "[Section]" headers, "Key=value" lines,
// addressed as "Section.Key".
class Configs {
public:
    static inline const std::string DEFAULT_LOG_LEVEL = "info";

    static Configs& Get() {
        static Configs instance;
        return instance;
    }

    // Returns false when the file does not exist; a missing config is not an error.
    bool Load(const std::string& path = ConfigPaths::GetDefaultConfigPath()) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return false;
        }

        std::lock_guard<std::mutex> lock(mutex);
        std::string line, currentSection;
        while (std::getline(file, line)) {
            line = Trim(line);
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            if (line[0] == '[') {
                size_t close = line.find(']');
                if (close == std::string::npos) {
                    throw std::runtime_error("Unterminated section header in " + path + ": " + line);
                }
                currentSection = Trim(line.substr(1, close - 1));
            } else {
                size_t delim = line.find('=');
                if (delim != std::string::npos) {
                    std::string key = Trim(line.substr(0, delim));
                    if (!currentSection.empty()) key = currentSection + "." + key;
                    settings[key] = Trim(line.substr(delim + 1));
                }
            }
        }
        loadedPath = path;
        return true;
    }

    std::string getPath() const {
        std::lock_guard<std::mutex> lock(mutex);
        return loadedPath.empty() ? ConfigPaths::GetDefaultConfigPath() : loadedPath;
    }

    template<typename T>
    T Get(const std::string& key, T defaultValue) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = settings.find(key);
        if (it == settings.end()) return defaultValue;
        return Convert<T>(it->second);
    }

    template<typename T>
    void Set(const std::string& key, T value) {
        std::ostringstream oss;
        oss << value;
        std::vector<std::function<void(std::string, std::string)>> callbacks;
        std::string oldValue, newValue;
        {
            std::lock_guard<std::mutex> lock(mutex);
            oldValue = settings[key];
            settings[key] = oss.str();
            newValue = settings[key];
            auto it = watchers.find(key);
            if (it != watchers.end()) callbacks = it->second;
        }
        for (auto& watcher : callbacks) {
            watcher(oldValue, newValue);
        }
    }

    template<typename T>
    void Watch(const std::string& key, std::function<void(T,T)> callback) {
        std::lock_guard<std::mutex> lock(mutex);
        watchers[key].push_back([=](const std::string& oldVal, const std::string& newVal) {
            callback(Convert<T>(oldVal), Convert<T>(newVal));
        });
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(mutex);
        settings.clear();
        loadedPath.clear();
    }

    std::string GetLogLevel() const { return Get<std::string>("Log.Level", DEFAULT_LOG_LEVEL); }
    std::string GetLogFile() const { return Get<std::string>("Log.File", ""); }
    bool GetLogColored() const { return Get<bool>("Log.Colored", true); }
    std::string GetOverrideFile() const { return Get<std::string>("Database.OverrideFile", ""); }

private:
    mutable std::mutex mutex;
    std::unordered_map<std::string, std::string> settings;
    std::unordered_map<std::string, std::vector<std::function<void(std::string, std::string)>>> watchers;
    std::string loadedPath;

    static std::string Trim(const std::string& s) {
        size_t start = s.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return "";
        size_t end = s.find_last_not_of(" \t\r\n");
        return s.substr(start, end - start + 1);
    }

    template<typename T>
    static T Convert(const std::string& val) {
        if constexpr (std::is_same_v<T, std::string>) {
            return val;
        } else if constexpr (std::is_same_v<T, bool>) {
            return val == "true" || val == "1" || val == "yes";
        } else {
            std::istringstream iss(val);
            T result{};
            iss >> result;
            return result;
        }
    }
};

} // namespace whodat
