#pragma once

#include <vellum/result.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace vellum {

//-----------------------------------------------------------------------------
// Config - layered settings tree
//
// Defaults, then the YAML file ($XDG_CONFIG_HOME/vellum/config.yaml unless a
// path is given), then environment (render/atlas-size is read from
// VELLUM_RENDER_ATLAS_SIZE), then command line overrides. Keys are
// slash-separated paths.
//-----------------------------------------------------------------------------
class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // nullopt if the key is missing or does not convert to T
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    bool has(const std::string& path) const;

    Result<void> set(const std::string& path, const YAML::Node& value);

    const YAML::Node& root() const { return _root; }

    // Path of the file that was loaded, empty if none
    const std::string& loadedFrom() const { return _loadedFrom; }

    static std::filesystem::path getXDGConfigPath();

    // Env var for a key: "render/atlas-size" -> "VELLUM_RENDER_ATLAS_SIZE"
    static std::string pathToEnvVar(const std::string& path);

    static constexpr const char* ENV_PREFIX = "VELLUM_";

    static constexpr const char* KEY_WINDOW_WIDTH = "window/width";
    static constexpr const char* KEY_WINDOW_HEIGHT = "window/height";
    static constexpr const char* KEY_WINDOW_TITLE = "window/title";
    static constexpr const char* KEY_CLEAR_COLOR = "render/clear-color";
    static constexpr const char* KEY_ATLAS_SIZE = "render/atlas-size";
    static constexpr const char* KEY_INITIAL_CAPACITY = "render/initial-capacity";
    static constexpr const char* KEY_SORT_RECTS = "render/sort-rects-by-z";
    static constexpr const char* KEY_PRESENT_MODE = "render/present-mode";
    static constexpr const char* KEY_SHADERS_PATH = "shaders/path";
    static constexpr const char* KEY_LOG_LEVEL = "log/level";
    static constexpr const char* KEY_DEMO_PEERS = "demo/peers";

private:
    Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept;
    Result<void> init() noexcept;

    void loadDefaults();
    Result<void> loadFile(const std::string& path);
    void applyEnvOverrides(YAML::Node node, const std::string& prefix);

    YAML::Node getNode(const std::string& path) const;

    static void mergeNodes(YAML::Node target, const YAML::Node& source);

    YAML::Node _root;
    std::string _configPath;
    YAML::Node _cmdOverrides;
    std::string _loadedFrom;
};

template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    return get<T>(path).value_or(defaultValue);
}

} // namespace vellum
