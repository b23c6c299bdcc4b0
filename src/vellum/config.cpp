#include <vellum/config.h>
#include <ytrace/ytrace.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace vellum {

// Split a slash-separated path into components
static std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

Config::Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
    : _root(YAML::NodeType::Map)
    , _configPath(configPath)
    , _cmdOverrides(cmdOverrides) {}

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(config));
}

Result<void> Config::init() noexcept {
    try {
        loadDefaults();

        std::string effectivePath = _configPath;
        if (effectivePath.empty()) {
            auto xdgPath = getXDGConfigPath();
            if (std::filesystem::exists(xdgPath)) {
                effectivePath = xdgPath.string();
            }
        }

        if (!effectivePath.empty()) {
            if (auto res = loadFile(effectivePath); !res) {
                // An explicitly requested file must exist and parse
                if (!_configPath.empty()) {
                    return Err<void>("Failed to load config file " + effectivePath, res);
                }
                ywarn("Failed to load config file {}: {}", effectivePath, error_msg(res));
            } else {
                _loadedFrom = effectivePath;
                yinfo("Loaded config from: {}", effectivePath);
            }
        }

        applyEnvOverrides(_root, "");

        if (_cmdOverrides && _cmdOverrides.IsMap()) {
            mergeNodes(_root, _cmdOverrides);
        }
    } catch (const YAML::Exception& e) {
        return Err<void>(std::string("Config: ") + e.what());
    }
    return Ok();
}

void Config::loadDefaults() {
    YAML::Node window;
    window["width"] = 1280;
    window["height"] = 800;
    window["title"] = "vellum";
    _root["window"] = window;

    YAML::Node render;
    YAML::Node clear(YAML::NodeType::Sequence);
    clear.push_back(0.12);
    clear.push_back(0.12);
    clear.push_back(0.13);
    clear.push_back(1.0);
    render["clear-color"] = clear;
    render["atlas-size"] = 256;
    render["initial-capacity"] = 256;
    render["sort-rects-by-z"] = true;
    render["present-mode"] = "fifo";
    _root["render"] = render;

    YAML::Node shaders;
    shaders["path"] = "";
    _root["shaders"] = shaders;

    YAML::Node log;
    log["level"] = "info";
    _root["log"] = log;

    YAML::Node demo;
    demo["peers"] = 3;
    _root["demo"] = demo;
}

Result<void> Config::loadFile(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            return Err<void>("Cannot open config file: " + path);
        }
        YAML::Node fileConfig = YAML::Load(file);
        if (fileConfig && fileConfig.IsMap()) {
            mergeNodes(_root, fileConfig);
        } else if (fileConfig && !fileConfig.IsNull()) {
            return Err<void>("Config file is not a mapping: " + path);
        }
        return Ok();
    } catch (const YAML::Exception& e) {
        return Err<void>("YAML parse error: " + std::string(e.what()));
    }
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '/' || c == '-') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

void Config::applyEnvOverrides(YAML::Node node, const std::string& prefix) {
    std::vector<std::string> keys;
    for (auto it = node.begin(); it != node.end(); ++it) {
        keys.push_back(it->first.as<std::string>());
    }

    for (const auto& key : keys) {
        std::string fullPath = prefix.empty() ? key : prefix + "/" + key;
        YAML::Node child = node[key];

        if (child.IsMap()) {
            applyEnvOverrides(child, fullPath);
            continue;
        }

        std::string envVar = pathToEnvVar(fullPath);
        const char* val = std::getenv(envVar.c_str());
        if (!val) continue;

        try {
            node[key] = YAML::Load(val);
            ydebug("Config override from env: {}={}", envVar, val);
        } catch (const YAML::Exception& e) {
            ywarn("Config: ignoring {}: {}", envVar, e.what());
        }
    }
}

void Config::mergeNodes(YAML::Node target, const YAML::Node& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        const std::string key = it->first.as<std::string>();
        const YAML::Node& value = it->second;
        YAML::Node existing = target[key];
        if (value.IsMap() && existing.IsMap()) {
            mergeNodes(existing, value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

YAML::Node Config::getNode(const std::string& path) const {
    auto parts = splitPath(path);
    YAML::Node current = YAML::Clone(_root);
    for (const auto& part : parts) {
        if (!current.IsMap()) return YAML::Node();
        const YAML::Node& view = current;
        YAML::Node next = view[part];
        if (!next) return YAML::Node();
        current.reset(next);
    }
    return current;
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node && !node.IsNull();
}

Result<void> Config::set(const std::string& path, const YAML::Node& value) {
    auto parts = splitPath(path);
    if (parts.empty()) return Err<void>("Config::set: need a key");

    try {
        YAML::Node current;
        current.reset(_root);
        for (size_t i = 0; i + 1 < parts.size(); ++i) {
            YAML::Node next = current[parts[i]];
            if (!next.IsMap()) {
                next = YAML::Node(YAML::NodeType::Map);
            }
            current.reset(next);
        }
        current[parts.back()] = YAML::Clone(value);
    } catch (const YAML::Exception& e) {
        return Err<void>("Config::set " + path + ": " + e.what());
    }
    return Ok();
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path configDir;
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        configDir = xdgConfig;
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            configDir = std::filesystem::path(home) / ".config";
        } else {
            configDir = std::filesystem::current_path();
        }
    }
    return configDir / "vellum" / "config.yaml";
}

} // namespace vellum
