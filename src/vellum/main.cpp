//=============================================================================
// vellum - GPU instanced canvas renderer
//
// Main entry point. Creates and runs the Vellum application.
//=============================================================================

#include <vellum/vellum.h>
#include <ytrace/ytrace.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <string>

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::cfg::load_env_levels();

    auto result = vellum::Vellum::create(argc, argv);
    if (!result) {
        std::string msg = result.error().message();
        if (msg == "Help requested") {
            return 0;
        }
        yerror("Failed to initialize vellum: {}", vellum::error_msg(result));
        return 1;
    }
    auto app = *result;
    auto runResult = app->run();
    app->shutdown();
    if (!runResult) {
        yerror("Vellum run failed: {}", vellum::error_msg(runResult));
        return 1;
    }
    return 0;
}
