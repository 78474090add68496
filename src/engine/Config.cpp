#include "engine/Config.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace ghostwatch {

namespace {

bool parseStream(std::istream& in, nlohmann::json& out) {
    try {
        out = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_WARN("Config: parse error: {}", e.what());
        return false;
    }
    return true;
}

uint8_t toChannel(const nlohmann::json& value) {
    double v = value.get<double>();
    return static_cast<uint8_t>(std::clamp(v, 0.0, 255.0));
}

} // namespace

bool Config::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    nlohmann::json parsed;
    if (!parseStream(file, parsed)) {
        return false;
    }
    m_data = std::move(parsed);
    return true;
}

bool Config::loadFromString(const std::string& jsonStr) {
    std::istringstream in(jsonStr);
    nlohmann::json parsed;
    if (!parseStream(in, parsed)) {
        return false;
    }
    m_data = std::move(parsed);
    return true;
}

bool Config::mergeFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    nlohmann::json overlay;
    if (!parseStream(file, overlay)) {
        return false;
    }

    nlohmann::json merged = m_data;
    mergeJson(merged, overlay);
    m_data = std::move(merged);
    return true;
}

std::string Config::localOverlayPath(const std::string& basePath) {
    namespace fs = std::filesystem;
    fs::path base(basePath);
    fs::path local = base.parent_path()
        / (base.stem().string() + ".local" + base.extension().string());
    return local.string();
}

// ---------------------------------------------------------------------------
// Key resolution
// ---------------------------------------------------------------------------

const nlohmann::json* Config::resolve(const std::string& key) const {
    const nlohmann::json* current = &m_data;
    std::istringstream stream(key);
    std::string segment;

    while (std::getline(stream, segment, '.')) {
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(segment);
        if (it == current->end()) {
            return nullptr;
        }
        current = &(*it);
    }
    return current;
}

bool Config::hasKey(const std::string& key) const {
    return resolve(key) != nullptr;
}

// ---------------------------------------------------------------------------
// Getters
// ---------------------------------------------------------------------------

std::string Config::getString(const std::string& key, const std::string& defaultVal) const {
    const auto* val = resolve(key);
    if (val && val->is_string()) {
        return val->get<std::string>();
    }
    return defaultVal;
}

int Config::getInt(const std::string& key, int defaultVal) const {
    int64_t wide = getInt64(key, static_cast<int64_t>(defaultVal));
    if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
        return defaultVal;
    }
    return static_cast<int>(wide);
}

int64_t Config::getInt64(const std::string& key, int64_t defaultVal) const {
    const auto* val = resolve(key);
    if (!val || !val->is_number_integer()) {
        return defaultVal;
    }
    if (val->is_number_unsigned() &&
        val->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return defaultVal;
    }
    return val->get<int64_t>();
}

float Config::getFloat(const std::string& key, float defaultVal) const {
    const auto* val = resolve(key);
    if (val && val->is_number()) {
        return val->get<float>();
    }
    return defaultVal;
}

bool Config::getBool(const std::string& key, bool defaultVal) const {
    const auto* val = resolve(key);
    if (val && val->is_boolean()) {
        return val->get<bool>();
    }
    return defaultVal;
}

Color Config::getColor(const std::string& key, const Color& defaultVal) const {
    const auto* val = resolve(key);
    if (!val || !val->is_array() || (val->size() != 3 && val->size() != 4)) {
        return defaultVal;
    }
    for (const auto& c : *val) {
        if (!c.is_number_integer()) {
            return defaultVal;
        }
    }

    Color color(toChannel((*val)[0]), toChannel((*val)[1]), toChannel((*val)[2]));
    if (val->size() == 4) {
        color.a = toChannel((*val)[3]);
    }
    return color;
}

// ---------------------------------------------------------------------------
// JSON merge
// ---------------------------------------------------------------------------

void Config::mergeJson(nlohmann::json& base, const nlohmann::json& overlay) {
    if (!overlay.is_object()) {
        base = overlay;
        return;
    }
    if (!base.is_object()) {
        base = nlohmann::json::object();
    }
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        if (it->is_object() && base.contains(it.key()) && base[it.key()].is_object()) {
            mergeJson(base[it.key()], *it);
        } else {
            base[it.key()] = *it;
        }
    }
}

} // namespace ghostwatch
