#pragma once

//=============================================================================
// Vellum application
//
// Owns the window, the GPU context and compositor, the demo scene and the
// producer thread that turns scene state into frame snapshots. Three modes:
// - desktop: GLFW window, interactive pan / zoom / hover / select
// - headless: offscreen WebGPU rendering, last frame written as PNG
// - software: CPU reference rasterizer, last frame written as PNG
//=============================================================================

#include <vellum/camera.h>
#include <vellum/config.h>
#include <vellum/demo-scene.h>
#include <vellum/frame-compositor.h>
#include <vellum/frame-exchange.h>
#include <vellum/result.hpp>
#include <vellum/webgpu-context.h>
#include <GLFW/glfw3.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace vellum {

class Vellum {
public:
    using Ptr = std::shared_ptr<Vellum>;

    enum class Mode { Desktop, Headless, Software };

    static Result<Ptr> create(int argc, char* argv[]) noexcept;

    ~Vellum();

    Vellum(const Vellum&) = delete;
    Vellum& operator=(const Vellum&) = delete;

    Result<void> run() noexcept;
    void shutdown() noexcept;

    Config::Ptr config() const noexcept { return _config; }
    Mode mode() const noexcept { return _mode; }

private:
    Vellum() = default;

    Result<void> init(int argc, char* argv[]) noexcept;
    Result<void> parseArgs(int argc, char* argv[]) noexcept;
    Result<void> initScene() noexcept;
    Result<void> initWindow() noexcept;
    Result<void> initGraphics() noexcept;
    void initCallbacks() noexcept;

    Result<void> runDesktop() noexcept;
    Result<void> runHeadless() noexcept;
    Result<void> runSoftware() noexcept;

    // Publishes a snapshot of the current scene state about every 16 ms
    void producerLoop();
    FrameSnapshot::Ptr buildSnapshot(double time);

    void handleResize(int width, int height);
    void onMouseMove(double x, double y);
    void onMouseButton(int button, int action);
    void onScroll(double yoffset);
    void onKey(int key, int action);

    glm::vec2 toFramebuffer(double x, double y) const;
    void reportStats(const FrameStats& stats);

    CompositorOptions compositorOptions() const;

    Config::Ptr _config;
    Mode _mode = Mode::Desktop;
    std::string _outputPath;
    uint32_t _frames = 1;
    uint32_t _width = 0;
    uint32_t _height = 0;

    GLFWwindow* _window = nullptr;
    WebGPUContext::Ptr _ctx;
    FrameCompositor::Ptr _compositor;

    // Scene state shared between input handling and the producer
    std::mutex _sceneMutex;
    std::optional<DemoScene> _scene;
    std::optional<Camera> _camera;

    FrameExchange _exchange;
    std::thread _producer;
    std::atomic<bool> _running{false};
    std::atomic<uint64_t> _nextFrameId{1};
    std::chrono::steady_clock::time_point _start;

    // Pointer state, framebuffer pixels
    glm::vec2 _pointer{0.0f};
    glm::vec2 _pressAt{0.0f};
    bool _leftDown = false;
    bool _dragging = false;

    bool _atlasEnabled = true;

    // Stats window
    uint64_t _statsFrames = 0;
    uint64_t _statsDropped = 0;
    double _statsSince = 0.0;
};

} // namespace vellum
