#include <vellum/vellum.h>
#include <vellum/image.h>
#include <vellum/software-rasterizer.h>
#include <args.hxx>
#include <spdlog/spdlog.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <iostream>
#include <vector>

namespace vellum {

namespace {

constexpr auto kProducerInterval = std::chrono::milliseconds(16);
constexpr auto kFrameWait = std::chrono::milliseconds(16);
constexpr double kStatsInterval = 2.0;
constexpr double kHeadlessFrameTime = 1.0 / 60.0;
// Pointer travel before a press turns into a drag
constexpr float kDragThreshold = 3.0f;
constexpr float kZoomStep = 1.1f;

} // namespace

Result<Vellum::Ptr> Vellum::create(int argc, char* argv[]) noexcept {
    auto app = Ptr(new Vellum());
    // Init errors pass through unwrapped so main can tell "Help requested" apart
    if (auto res = app->init(argc, argv); !res) {
        return std::unexpected(res.error());
    }
    return Ok(std::move(app));
}

Vellum::~Vellum() {
    shutdown();
}

Result<void> Vellum::init(int argc, char* argv[]) noexcept {
    if (auto res = parseArgs(argc, argv); !res) {
        return res;
    }
    if (auto res = initScene(); !res) {
        return res;
    }
    if (_mode == Mode::Software) {
        return Ok();
    }
    if (_mode == Mode::Desktop) {
        if (auto res = initWindow(); !res) {
            return res;
        }
    }
    if (auto res = initGraphics(); !res) {
        return res;
    }
    if (_mode == Mode::Desktop) {
        initCallbacks();
    }
    return Ok();
}

Result<void> Vellum::parseArgs(int argc, char* argv[]) noexcept {
    args::ArgumentParser parser("vellum - GPU instanced canvas renderer");
    args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"});

    args::ValueFlag<std::string> configFile(parser, "path", "Config file path", {'c', "config"});
    args::ValueFlag<uint32_t> widthArg(parser, "width", "Viewport width in pixels", {'W', "width"});
    args::ValueFlag<uint32_t> heightArg(parser, "height", "Viewport height in pixels", {'H', "height"});
    args::ValueFlag<std::string> logLevelArg(parser, "level",
                                             "Log level (trace, debug, info, warn, error)",
                                             {"log-level"});

    args::Flag headlessFlag(parser, "headless", "Render offscreen with WebGPU and write a PNG",
                            {"headless"});
    args::Flag softwareFlag(parser, "software", "Render with the CPU reference rasterizer and write a PNG",
                            {"software"});
    args::ValueFlag<std::string> outputArg(parser, "file", "PNG output for headless and software modes",
                                           {'o', "output"});
    args::ValueFlag<uint32_t> framesArg(parser, "count", "Frames to render before writing the PNG",
                                        {'n', "frames"});

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return Err<void>("Help requested");
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return Err<void>(std::string("Parse error: ") + e.what());
    } catch (const args::ValidationError& e) {
        std::cerr << e.what() << std::endl;
        return Err<void>(std::string("Invalid arguments: ") + e.what());
    }

    if (headlessFlag && softwareFlag) {
        return Err<void>("--headless and --software are exclusive");
    }

    YAML::Node cmdOverrides;
    if (widthArg) cmdOverrides["window"]["width"] = args::get(widthArg);
    if (heightArg) cmdOverrides["window"]["height"] = args::get(heightArg);
    if (logLevelArg) cmdOverrides["log"]["level"] = args::get(logLevelArg);

    std::string configPath = configFile ? args::get(configFile) : "";
    auto configResult = Config::create(configPath, cmdOverrides);
    if (!configResult) {
        return Err<void>("Failed to create config", configResult);
    }
    _config = *configResult;

    auto level = spdlog::level::from_str(_config->get<std::string>(Config::KEY_LOG_LEVEL, "info"));
    spdlog::set_level(level);

    _mode = headlessFlag ? Mode::Headless : softwareFlag ? Mode::Software : Mode::Desktop;
    _outputPath = outputArg ? args::get(outputArg) : std::string("vellum.png");
    _frames = framesArg ? std::max(1u, args::get(framesArg)) : 1;
    _width = _config->get<uint32_t>(Config::KEY_WINDOW_WIDTH, 1280);
    _height = _config->get<uint32_t>(Config::KEY_WINDOW_HEIGHT, 800);
    if (_width == 0) _width = 1280;
    if (_height == 0) _height = 800;

    return Ok();
}

Result<void> Vellum::initScene() noexcept {
    auto atlasSize = _config->get<uint32_t>(Config::KEY_ATLAS_SIZE, 256);
    auto peers = _config->get<uint32_t>(Config::KEY_DEMO_PEERS, 3);

    auto scene = DemoScene::create(atlasSize, peers);
    if (!scene) {
        return Err<void>("Failed to build demo scene", scene);
    }
    _scene.emplace(std::move(*scene));
    _camera.emplace(_width, _height);
    yinfo("Demo scene: {} nodes, {} peers, {}x{} atlas",
          _scene->nodes().size(), _scene->peers().size(), atlasSize, atlasSize);
    return Ok();
}

Result<void> Vellum::initWindow() noexcept {
    if (!glfwInit()) {
        return Err<void>("Failed to initialize GLFW");
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);

    std::string title = _config->get<std::string>(Config::KEY_WINDOW_TITLE, "vellum");
    _window = glfwCreateWindow(static_cast<int>(_width), static_cast<int>(_height),
                               title.c_str(), nullptr, nullptr);
    if (!_window) {
        glfwTerminate();
        return Err<void>("Failed to create window");
    }

    // Render at framebuffer resolution
    int fbWidth = 0;
    int fbHeight = 0;
    glfwGetFramebufferSize(_window, &fbWidth, &fbHeight);
    if (fbWidth > 0 && fbHeight > 0) {
        _width = static_cast<uint32_t>(fbWidth);
        _height = static_cast<uint32_t>(fbHeight);
        _camera->resize(_width, _height);
    }
    return Ok();
}

CompositorOptions Vellum::compositorOptions() const {
    CompositorOptions options;
    auto clear = _config->get<std::vector<float>>(Config::KEY_CLEAR_COLOR);
    if (clear && clear->size() == 4) {
        options.clearColor = {(*clear)[0], (*clear)[1], (*clear)[2], (*clear)[3]};
    } else if (clear) {
        ywarn("Config {} needs 4 components, got {}", Config::KEY_CLEAR_COLOR, clear->size());
    }
    options.initialCapacity = _config->get<uint32_t>(Config::KEY_INITIAL_CAPACITY, kMinInstanceCapacity);
    options.sortRectsByZ = _config->get<bool>(Config::KEY_SORT_RECTS, true);
    options.shaderDir = _config->get<std::string>(Config::KEY_SHADERS_PATH, "");
    options.width = _width;
    options.height = _height;
    return options;
}

Result<void> Vellum::initGraphics() noexcept {
    if (_mode == Mode::Desktop) {
        auto presentMode = _config->get<std::string>(Config::KEY_PRESENT_MODE, "fifo");
        auto ctxResult = WebGPUContext::createWindowed(_window, _width, _height, presentMode);
        if (!ctxResult) {
            return Err<void>("Failed to initialize WebGPU", ctxResult);
        }
        _ctx = *ctxResult;
    } else {
        auto ctxResult = WebGPUContext::createHeadless();
        if (!ctxResult) {
            return Err<void>("Failed to initialize headless WebGPU", ctxResult);
        }
        _ctx = *ctxResult;
    }

    auto compositorResult = FrameCompositor::create(_ctx, compositorOptions());
    if (!compositorResult) {
        return Err<void>("Failed to create compositor", compositorResult);
    }
    _compositor = *compositorResult;

    if (auto res = _compositor->uploadAtlas(_scene->font().atlas()); !res) {
        return Err<void>("Failed to upload glyph atlas", res);
    }
    return Ok();
}

void Vellum::initCallbacks() noexcept {
    glfwSetWindowUserPointer(_window, this);

    glfwSetFramebufferSizeCallback(_window, [](GLFWwindow* w, int newWidth, int newHeight) {
        auto* app = static_cast<Vellum*>(glfwGetWindowUserPointer(w));
        if (app) app->handleResize(newWidth, newHeight);
    });

    glfwSetCursorPosCallback(_window, [](GLFWwindow* w, double x, double y) {
        auto* app = static_cast<Vellum*>(glfwGetWindowUserPointer(w));
        if (app) app->onMouseMove(x, y);
    });

    glfwSetMouseButtonCallback(_window, [](GLFWwindow* w, int button, int action, int) {
        auto* app = static_cast<Vellum*>(glfwGetWindowUserPointer(w));
        if (app) app->onMouseButton(button, action);
    });

    glfwSetScrollCallback(_window, [](GLFWwindow* w, double, double yoffset) {
        auto* app = static_cast<Vellum*>(glfwGetWindowUserPointer(w));
        if (app) app->onScroll(yoffset);
    });

    glfwSetKeyCallback(_window, [](GLFWwindow* w, int key, int, int action, int) {
        auto* app = static_cast<Vellum*>(glfwGetWindowUserPointer(w));
        if (app) app->onKey(key, action);
    });
}

//=============================================================================
// Input
//=============================================================================

glm::vec2 Vellum::toFramebuffer(double x, double y) const {
    int winWidth = 0;
    int winHeight = 0;
    int fbWidth = 0;
    int fbHeight = 0;
    glfwGetWindowSize(_window, &winWidth, &winHeight);
    glfwGetFramebufferSize(_window, &fbWidth, &fbHeight);
    if (winWidth <= 0 || winHeight <= 0) {
        return {static_cast<float>(x), static_cast<float>(y)};
    }
    return {static_cast<float>(x * fbWidth / winWidth), static_cast<float>(y * fbHeight / winHeight)};
}

void Vellum::handleResize(int width, int height) {
    if (width <= 0 || height <= 0) return;
    {
        std::lock_guard<std::mutex> lock(_sceneMutex);
        _camera->resize(static_cast<uint32_t>(width), static_cast<uint32_t>(height));
    }
    _compositor->resize(static_cast<uint32_t>(width), static_cast<uint32_t>(height));
    ydebug("Resized to {}x{}", width, height);
}

void Vellum::onMouseMove(double x, double y) {
    glm::vec2 pos = toFramebuffer(x, y);
    glm::vec2 delta = pos - _pointer;
    _pointer = pos;

    std::lock_guard<std::mutex> lock(_sceneMutex);
    if (_leftDown && !_dragging && glm::length(pos - _pressAt) > kDragThreshold) {
        _dragging = true;
    }
    if (_dragging) {
        _camera->panBy(delta.x, delta.y);
        return;
    }
    _scene->updateHover(_camera->screenToWorld(pos.x, pos.y));
}

void Vellum::onMouseButton(int button, int action) {
    if (button != GLFW_MOUSE_BUTTON_LEFT) return;

    if (action == GLFW_PRESS) {
        _leftDown = true;
        _dragging = false;
        _pressAt = _pointer;
        return;
    }
    if (action != GLFW_RELEASE) return;

    std::lock_guard<std::mutex> lock(_sceneMutex);
    if (!_dragging) {
        glm::vec2 world = _camera->screenToWorld(_pointer.x, _pointer.y);
        if (_scene->selectAt(world)) {
            auto selected = _scene->interaction().selected;
            ydebug("Selected {}", selected ? std::to_string(*selected) : std::string("nothing"));
        }
    }
    _leftDown = false;
    _dragging = false;
}

void Vellum::onScroll(double yoffset) {
    if (yoffset == 0.0) return;
    float factor = yoffset > 0.0 ? kZoomStep : 1.0f / kZoomStep;
    std::lock_guard<std::mutex> lock(_sceneMutex);
    _camera->zoomAt(_pointer.x, _pointer.y, factor);
}

void Vellum::onKey(int key, int action) {
    if (action != GLFW_PRESS) return;

    switch (key) {
        case GLFW_KEY_ESCAPE:
            glfwSetWindowShouldClose(_window, GLFW_TRUE);
            break;
        case GLFW_KEY_R: {
            std::lock_guard<std::mutex> lock(_sceneMutex);
            _camera->setPan({0.0f, 0.0f});
            _camera->setZoom(1.0f);
            break;
        }
        case GLFW_KEY_G:
            _atlasEnabled = !_atlasEnabled;
            if (_atlasEnabled) {
                if (auto res = _compositor->uploadAtlas(_scene->font().atlas()); !res) {
                    yerror("Atlas upload failed: {}", error_msg(res));
                }
            } else {
                _compositor->unbindAtlas();
            }
            yinfo("Glyph atlas {}", _atlasEnabled ? "bound" : "unbound");
            break;
        case GLFW_KEY_L:
            ywarn("Simulating device loss");
            _ctx->loseDevice();
            break;
        default:
            break;
    }
}

//=============================================================================
// Frames
//=============================================================================

FrameSnapshot::Ptr Vellum::buildSnapshot(double time) {
    std::lock_guard<std::mutex> lock(_sceneMutex);
    return _scene->snapshot(*_camera, time, _nextFrameId++);
}

void Vellum::producerLoop() {
    ydebug("Producer thread started");
    auto next = std::chrono::steady_clock::now();
    while (_running) {
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - _start;
        _exchange.publish(buildSnapshot(elapsed.count()));
        next += kProducerInterval;
        std::this_thread::sleep_until(next);
    }
    ydebug("Producer thread stopped");
}

void Vellum::reportStats(const FrameStats& stats) {
    ++_statsFrames;
    if (stats.dropped) ++_statsDropped;
    if (stats.recovered) {
        yinfo("Frame {}: recovered from device loss", stats.frameId);
    }

    double now = glfwGetTime();
    if (now - _statsSince < kStatsInterval) return;

    yinfo("{:.1f} fps, last frame {} rects / {} glyphs / {} cursors in {} draws; "
          "{} dropped by renderer, {} superseded in exchange",
          _statsFrames / (now - _statsSince), stats.rects, stats.glyphs, stats.cursors,
          stats.drawCalls, _statsDropped, _exchange.droppedCount());
    _statsFrames = 0;
    _statsDropped = 0;
    _statsSince = now;
}

Result<void> Vellum::run() noexcept {
    switch (_mode) {
        case Mode::Desktop:  return runDesktop();
        case Mode::Headless: return runHeadless();
        case Mode::Software: return runSoftware();
    }
    return Ok();
}

Result<void> Vellum::runDesktop() noexcept {
    _start = std::chrono::steady_clock::now();
    _statsSince = glfwGetTime();
    _running = true;
    _producer = std::thread(&Vellum::producerLoop, this);

    Result<void> result = Ok();
    while (!glfwWindowShouldClose(_window)) {
        glfwPollEvents();

        auto snapshot = _exchange.waitAndTake(kFrameWait);
        if (!snapshot) continue;

        auto stats = _compositor->render(*snapshot);
        if (!stats) {
            result = Err<void>("Rendering stopped", stats);
            break;
        }
        reportStats(*stats);
    }

    _running = false;
    _exchange.close();
    if (_producer.joinable()) _producer.join();

    yinfo("Rendered {} frames, {} dropped, {} device recoveries, {} snapshots superseded",
          _compositor->framesSubmitted(), _compositor->framesDropped(),
          _compositor->recoveries(), _exchange.droppedCount());
    return result;
}

Result<void> Vellum::runHeadless() noexcept {
    FrameStats last;
    for (uint32_t i = 0; i < _frames; ++i) {
        auto snapshot = buildSnapshot(i * kHeadlessFrameTime);
        auto stats = _compositor->render(*snapshot);
        if (!stats) {
            return Err<void>("Headless render failed", stats);
        }
        last = *stats;
    }
    if (last.dropped) {
        return Err<void>("Last headless frame " + std::to_string(last.frameId) + " was dropped");
    }

    auto pixels = _compositor->readback();
    if (!pixels) {
        return Err<void>("Readback failed", pixels);
    }
    if (auto res = writePng(_outputPath, _compositor->targetWidth(), _compositor->targetHeight(), *pixels);
        !res) {
        return res;
    }
    yinfo("Headless: {} frames, last drew {} rects / {} glyphs / {} cursors",
          _frames, last.rects, last.glyphs, last.cursors);
    return Ok();
}

Result<void> Vellum::runSoftware() noexcept {
    SoftwareRasterizer rasterizer(_width, _height);
    auto options = compositorOptions();
    rasterizer.setClearColor(options.clearColor);
    rasterizer.setSortRectsByZ(options.sortRectsByZ);
    rasterizer.bindAtlas(_scene->font().atlas());

    FrameStats last;
    for (uint32_t i = 0; i < _frames; ++i) {
        auto snapshot = buildSnapshot(i * kHeadlessFrameTime);
        auto stats = rasterizer.render(*snapshot);
        if (!stats) {
            return Err<void>("Software render failed", stats);
        }
        last = *stats;
    }

    const Image& image = rasterizer.image();
    if (auto res = writePng(_outputPath, image.width, image.height, image.toRgba8()); !res) {
        return res;
    }
    yinfo("Software: {} frames, last drew {} rects / {} glyphs / {} cursors",
          _frames, last.rects, last.glyphs, last.cursors);
    return Ok();
}

void Vellum::shutdown() noexcept {
    _running = false;
    _exchange.close();
    if (_producer.joinable()) _producer.join();

    _compositor.reset();
    _ctx.reset();
    if (_window) {
        glfwDestroyWindow(_window);
        _window = nullptr;
        glfwTerminate();
    }
}

} // namespace vellum
