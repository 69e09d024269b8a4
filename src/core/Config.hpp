#pragma once

/**
 * Config.hpp
 *
 * Engine settings as one JSON document addressed with dot keys
 * ("downloads.maxConcurrent"). A config file only has to name the keys it
 * changes; everything else keeps its default.
 */

#include "Logger.hpp"
#include "../utils/FileUtils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <mutex>
#include <string>

namespace tapedeck::core {

using json = nlohmann::json;

class Config {
public:
    static Config& instance() {
        static Config instance;
        return instance;
    }

    /**
     * Merge a config file over the current values. Keys whose type does
     * not match the default are logged and reset to the default.
     * @return false when the file is missing or is not valid JSON
     */
    bool load(const std::filesystem::path& path) {
        auto content = utils::FileUtils::readFile(path);
        if (!content) {
            return false;
        }

        json loaded;
        try {
            loaded = json::parse(*content);
        } catch (const json::parse_error& e) {
            Logger::instance().error("Config {} is not valid JSON: {}", path.string(), e.what());
            return false;
        }
        if (!loaded.is_object()) {
            Logger::instance().error("Config {} must hold a JSON object", path.string());
            return false;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_config.merge_patch(loaded);
        restoreMistyped(defaults(), m_config, "");
        return true;
    }

    /**
     * Write the current values, replacing the file atomically
     */
    bool save(const std::filesystem::path& path) const {
        std::string content;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            content = m_config.dump(4);
        }
        return utils::FileUtils::writeFileAtomic(path, content);
    }

    void setDefaults() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = defaults();
    }

    /**
     * Typed lookup; a missing key or a value of the wrong type yields
     * defaultValue.
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        try {
            auto pointer = toPointer(key);
            if (m_config.contains(pointer)) {
                return m_config.at(pointer).get<T>();
            }
        } catch (const json::exception&) {
            // wrong type
        }
        return defaultValue;
    }

    /**
     * get() clamped from below
     */
    template<typename T>
    T getAtLeast(const std::string& key, const T& defaultValue, const T& minimum) const {
        return std::max(get<T>(key, defaultValue), minimum);
    }

    /**
     * @return false if the key cannot be addressed
     */
    template<typename T>
    bool set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        try {
            m_config[toPointer(key)] = value;
            return true;
        } catch (const json::exception&) {
            return false;
        }
    }

private:
    Config() {
        setDefaults();
    }

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    static json defaults() {
        return {
            {"downloads", {
                {"maxConcurrent", 3},
                {"maxRetries", 3},
                {"retryDelay", 0},
                {"autoRetry", true},
                {"wifiOnly", true},
                {"directory", ""},
                {"formatPreferences", {"Ogg Vorbis", "VBR MP3", "MP3", "Flac"}},
                {"verifyChecksums", true},
                {"timeout", 30000},
                {"progressFlushInterval", 2000}
            }},
            {"scheduler", {
                {"safetyInterval", 60}
            }},
            {"storage", {
                {"lowSpaceThresholdMB", 500},
                {"quotaMB", 0}
            }},
            {"deletion", {
                {"gracePeriodHours", 168},
                {"lowSpaceGracePeriodHours", 0}
            }},
            {"logging", {
                {"level", "info"},
                {"directory", ""},
                {"maxFileMB", 5},
                {"maxFiles", 3}
            }}
        };
    }

    static bool sameKind(const json& a, const json& b) {
        if (a.is_number() && b.is_number()) {
            return a.is_number_float() || !b.is_number_float();
        }
        return a.type() == b.type();
    }

    static void restoreMistyped(const json& reference, json& actual, const std::string& prefix) {
        for (auto it = reference.begin(); it != reference.end(); ++it) {
            auto key = prefix.empty() ? it.key() : prefix + "." + it.key();
            auto found = actual.find(it.key());
            if (found == actual.end()) {
                actual[it.key()] = it.value();
            } else if (!sameKind(it.value(), *found)) {
                Logger::instance().warn("Config key {} has the wrong type, using the default {}",
                                        key, it.value().dump());
                *found = it.value();
            } else if (it.value().is_object()) {
                restoreMistyped(it.value(), *found, key);
            }
        }
    }

    static json::json_pointer toPointer(const std::string& key) {
        std::string pointer = "/" + key;
        std::replace(pointer.begin(), pointer.end(), '.', '/');
        return json::json_pointer(pointer);
    }

    mutable std::mutex m_mutex;
    json m_config;
};

} // namespace tapedeck::core
