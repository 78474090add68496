#pragma once

#include "rendering/IRenderer.hpp"

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace ghostwatch {

/// Read-only JSON configuration with dot-notation key paths
/// ("window.width"). Every getter takes a default that is returned
/// when the key is missing or holds the wrong type.
class Config {
public:
    /// Load configuration from a JSON file. Returns false if the file
    /// cannot be read or parsed; the previous contents are kept.
    bool loadFromFile(const std::string& path);

    /// Load configuration from a JSON string (useful for testing).
    bool loadFromString(const std::string& jsonStr);

    /// Merge another JSON file on top of the current configuration.
    /// Keys in the overlay win; nested objects are merged key by key.
    /// Returns false if the file cannot be read or parsed (the current
    /// config is unchanged on failure).
    bool mergeFromFile(const std::string& path);

    std::string getString(const std::string& key, const std::string& defaultVal = "") const;
    int         getInt(const std::string& key, int defaultVal = 0) const;
    int64_t     getInt64(const std::string& key, int64_t defaultVal = 0) const;
    float       getFloat(const std::string& key, float defaultVal = 0.0f) const;
    bool        getBool(const std::string& key, bool defaultVal = false) const;

    /// Read an [r, g, b] or [r, g, b, a] array. Components are clamped
    /// to 0..255; any other shape yields the default.
    Color getColor(const std::string& key, const Color& defaultVal) const;

    bool hasKey(const std::string& key) const;

    /// Derive the per-device overlay path: "dir/config.json" -> "dir/config.local.json".
    static std::string localOverlayPath(const std::string& basePath);

private:
    const nlohmann::json* resolve(const std::string& key) const;

    static void mergeJson(nlohmann::json& base, const nlohmann::json& overlay);

    nlohmann::json m_data = nlohmann::json::object();
};

} // namespace ghostwatch
