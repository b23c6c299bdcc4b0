//=============================================================================
// Config Tests
//
// Layering of defaults, YAML file, environment and command line overrides.
//=============================================================================

#include <boost/ut.hpp>
#include <vellum/config.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace boost::ut;
using namespace vellum;

namespace {

std::filesystem::path writeTempConfig(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

suite config_tests = [] {
    "defaults are present"_test = [] {
        auto config = Config::create("", YAML::Node());
        expect(config.has_value());
        auto cfg = *config;
        expect(cfg->get<uint32_t>(Config::KEY_ATLAS_SIZE, 0) == 256_u);
        expect(cfg->get<bool>(Config::KEY_SORT_RECTS, false));
        expect(cfg->get<std::string>(Config::KEY_PRESENT_MODE, "") == "fifo");
        auto clear = cfg->get<std::vector<float>>(Config::KEY_CLEAR_COLOR);
        expect(clear.has_value());
        expect(clear->size() == 4_u);
    };

    "missing keys fall back"_test = [] {
        auto cfg = *Config::create();
        expect(!cfg->has("no/such/key"));
        expect(!cfg->get<int>("no/such/key").has_value());
        expect(cfg->get<int>("no/such/key", 5) == 5_i);
    };

    "wrong type yields nullopt"_test = [] {
        auto cfg = *Config::create();
        expect(!cfg->get<int>(Config::KEY_PRESENT_MODE).has_value());
    };

    "file overrides defaults"_test = [] {
        auto path = writeTempConfig("vellum-config-test.yaml",
                                    "render:\n  atlas-size: 512\nwindow:\n  title: test\n");
        auto config = Config::create(path.string());
        std::filesystem::remove(path);
        expect(config.has_value());
        auto cfg = *config;
        expect(cfg->get<uint32_t>(Config::KEY_ATLAS_SIZE, 0) == 512_u);
        expect(cfg->get<std::string>(Config::KEY_WINDOW_TITLE, "") == "test");
        // Untouched defaults survive the merge
        expect(cfg->get<uint32_t>(Config::KEY_WINDOW_WIDTH, 0) == 1280_u);
        expect(cfg->loadedFrom() == path.string());
    };

    "explicit missing file is an error"_test = [] {
        auto config = Config::create("/nonexistent/vellum/config.yaml");
        expect(!config.has_value());
    };

    "malformed file is an error"_test = [] {
        auto path = writeTempConfig("vellum-config-bad.yaml", "render: [unclosed\n");
        auto config = Config::create(path.string());
        std::filesystem::remove(path);
        expect(!config.has_value());
    };

    "command line wins over the file"_test = [] {
        auto path = writeTempConfig("vellum-config-cmd.yaml", "window:\n  width: 900\n");
        YAML::Node overrides;
        overrides["window"]["width"] = 640;
        auto config = Config::create(path.string(), overrides);
        std::filesystem::remove(path);
        expect(config.has_value());
        expect((*config)->get<uint32_t>(Config::KEY_WINDOW_WIDTH, 0) == 640_u);
    };

    "environment overrides defaults"_test = [] {
        ::setenv("VELLUM_DEMO_PEERS", "7", 1);
        auto config = Config::create();
        ::unsetenv("VELLUM_DEMO_PEERS");
        expect(config.has_value());
        expect((*config)->get<uint32_t>(Config::KEY_DEMO_PEERS, 0) == 7_u);
    };

    "env var names"_test = [] {
        expect(Config::pathToEnvVar("render/atlas-size") == "VELLUM_RENDER_ATLAS_SIZE");
        expect(Config::pathToEnvVar("log/level") == "VELLUM_LOG_LEVEL");
    };

    "set creates intermediate maps"_test = [] {
        auto cfg = *Config::create();
        expect(cfg->set("plugins/extra/enabled", YAML::Node(true)).has_value());
        expect(cfg->get<bool>("plugins/extra/enabled", false));
        expect(cfg->has("plugins/extra"));
    };
};
