#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace trellis {

/// Typed view of the settings the canvas engine reads from configuration.
struct CanvasSettings {
    int repaintThreads = 2;
    int maxFrameRate = 40;
    int splitterSnapTolerance = 12;
    int splitterHitTolerance = 6;
    int wheelStep = 1;
    std::string logLevel = "info";
    std::string logFile;
};

/// JSON settings file. Keys are read with dot-notation paths such as
/// "render.repaint_threads".
class Config {
public:
    /// Load configuration from a JSON file. Returns false if the file
    /// cannot be read or parsed; the previous contents are kept.
    bool loadFromFile(const std::string& path);

    /// Load configuration from a JSON string.
    bool loadFromString(const std::string& jsonStr);

    std::string getString(const std::string& key, const std::string& defaultVal = "") const;
    int         getInt(const std::string& key, int defaultVal = 0) const;

    bool hasKey(const std::string& key) const;

    /// Read the canvas settings, falling back to defaults for missing,
    /// mistyped or out-of-range values. Every fallback for a present key is
    /// logged.
    CanvasSettings settings() const;

private:
    bool parse(const std::string& source, const std::string& what, nlohmann::json& out) const;
    const nlohmann::json* resolve(const std::string& key) const;

    int readInt(const std::string& key, int defaultVal, int minVal, int maxVal) const;
    std::string readLogLevel(const std::string& key, const std::string& defaultVal) const;

    nlohmann::json m_data = nlohmann::json::object();
};

} // namespace trellis
