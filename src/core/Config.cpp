#include "core/Config.hpp"
#include "core/Log.hpp"

#include <array>
#include <fstream>
#include <sstream>

namespace trellis {

namespace {

const std::array<const char*, 7> LogLevels = {"trace", "debug", "info", "warn", "error", "critical", "off"};

} // namespace

bool Config::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Config: cannot open '{}', using defaults", path);
        return false;
    }
    std::stringstream contents;
    contents << file.rdbuf();

    nlohmann::json data;
    if (!parse(contents.str(), path, data)) {
        return false;
    }
    m_data = std::move(data);
    LOG_DEBUG("Config: loaded '{}'", path);
    return true;
}

bool Config::loadFromString(const std::string& jsonStr) {
    nlohmann::json data;
    if (!parse(jsonStr, "settings string", data)) {
        return false;
    }
    m_data = std::move(data);
    return true;
}

bool Config::parse(const std::string& source, const std::string& what, nlohmann::json& out) const {
    try {
        out = nlohmann::json::parse(source);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_WARN("Config: failed to parse {}: {}", what, e.what());
        return false;
    }
    if (!out.is_object()) {
        LOG_WARN("Config: {} is not a JSON object", what);
        return false;
    }
    return true;
}

const nlohmann::json* Config::resolve(const std::string& key) const {
    const nlohmann::json* current = &m_data;
    std::istringstream stream(key);
    std::string segment;

    while (std::getline(stream, segment, '.')) {
        if (!current->is_object() || !current->contains(segment)) {
            return nullptr;
        }
        current = &(*current)[segment];
    }
    return current;
}

bool Config::hasKey(const std::string& key) const {
    return resolve(key) != nullptr;
}

std::string Config::getString(const std::string& key, const std::string& defaultVal) const {
    const auto* val = resolve(key);
    if (val && val->is_string()) {
        return val->get<std::string>();
    }
    return defaultVal;
}

int Config::getInt(const std::string& key, int defaultVal) const {
    const auto* val = resolve(key);
    if (val && val->is_number_integer()) {
        return val->get<int>();
    }
    return defaultVal;
}

// ---------------------------------------------------------------------------
// Canvas settings
// ---------------------------------------------------------------------------

int Config::readInt(const std::string& key, int defaultVal, int minVal, int maxVal) const {
    const auto* val = resolve(key);
    if (!val) {
        return defaultVal;
    }
    if (!val->is_number_integer()) {
        LOG_WARN("Config: '{}' is not an integer, using {}", key, defaultVal);
        return defaultVal;
    }
    int value = val->get<int>();
    if (value < minVal || value > maxVal) {
        LOG_WARN("Config: '{}' = {} is outside [{}, {}], using {}", key, value, minVal, maxVal, defaultVal);
        return defaultVal;
    }
    return value;
}

std::string Config::readLogLevel(const std::string& key, const std::string& defaultVal) const {
    if (!hasKey(key)) {
        return defaultVal;
    }
    std::string level = getString(key);
    for (const char* known : LogLevels) {
        if (level == known) return level;
    }
    LOG_WARN("Config: '{}' is not a log level, using '{}'", key, defaultVal);
    return defaultVal;
}

CanvasSettings Config::settings() const {
    CanvasSettings s;
    s.repaintThreads = readInt("render.repaint_threads", s.repaintThreads, 1, 64);
    s.maxFrameRate = readInt("render.max_frame_rate", s.maxFrameRate, 1, 1000);
    s.splitterSnapTolerance = readInt("splitter.snap_tolerance", s.splitterSnapTolerance, 0, 1000);
    s.splitterHitTolerance = readInt("splitter.hit_tolerance", s.splitterHitTolerance, 1, 1000);
    s.wheelStep = readInt("scroll.wheel_step", s.wheelStep, 1, 1000);
    s.logLevel = readLogLevel("log.level", s.logLevel);
    s.logFile = getString("log.file", s.logFile);
    return s;
}

} // namespace trellis
