#pragma once

#include <vellum/result.hpp>
#include <webgpu/webgpu.h>
#include <GLFW/glfw3.h>
#include <atomic>
#include <memory>
#include <string>

namespace vellum {

//-----------------------------------------------------------------------------
// WebGPUContext - instance, adapter, device and queue, plus the window
// surface when there is one.
//
// Headless contexts have no surface and render into offscreen targets.
// The device-lost callback only raises a flag; the render thread notices it
// at the start of the next frame and calls recreateDevice().
//-----------------------------------------------------------------------------
class WebGPUContext {
public:
    using Ptr = std::shared_ptr<WebGPUContext>;

    static Result<Ptr> createWindowed(GLFWwindow* window, uint32_t width, uint32_t height,
                                      const std::string& presentMode = "fifo") noexcept;
    static Result<Ptr> createHeadless() noexcept;

    ~WebGPUContext();

    WebGPUContext(const WebGPUContext&) = delete;
    WebGPUContext& operator=(const WebGPUContext&) = delete;

    void resize(uint32_t width, uint32_t height) noexcept;

    WGPUDevice getDevice() const noexcept { return device_; }
    WGPUQueue getQueue() const noexcept { return queue_; }
    WGPUSurface getSurface() const noexcept { return surface_; }
    bool headless() const noexcept { return surface_ == nullptr; }

    // Format of the presentable target (RGBA8Unorm when headless)
    WGPUTextureFormat colorFormat() const noexcept { return colorFormat_; }

    uint32_t width() const noexcept { return width_; }
    uint32_t height() const noexcept { return height_; }

    Result<WGPUTextureView> getCurrentTextureView() noexcept;
    void present() noexcept;

    // Blocks until all submitted work has completed
    void waitIdle() noexcept;

    bool deviceLost() const noexcept { return lost_.load(); }

    // Drops the device and requests a fresh one from the adapter. Every
    // resource created on the old device is invalid afterwards.
    Result<void> recreateDevice() noexcept;

    // Destroys the device as a driver reset would
    void loseDevice() noexcept;

    uint64_t deviceGeneration() const noexcept { return generation_; }

private:
    WebGPUContext(GLFWwindow* window, uint32_t width, uint32_t height,
                  WGPUPresentMode presentMode) noexcept;

    Result<void> init() noexcept;
    Result<void> requestAdapter() noexcept;
    Result<void> requestDevice() noexcept;
    void releaseDevice() noexcept;
    void configureSurface(uint32_t width, uint32_t height) noexcept;

    GLFWwindow* window_ = nullptr;

    WGPUInstance instance_ = nullptr;
    WGPUAdapter adapter_ = nullptr;
    WGPUDevice device_ = nullptr;
    WGPUQueue queue_ = nullptr;
    WGPUSurface surface_ = nullptr;
    WGPUTextureFormat colorFormat_ = WGPUTextureFormat_RGBA8Unorm;
    WGPUPresentMode presentMode_ = WGPUPresentMode_Fifo;

    uint32_t width_ = 0;
    uint32_t height_ = 0;

    std::atomic<bool> lost_{false};
    bool releasing_ = false;
    uint64_t generation_ = 0;

    // Acquired surface texture and its view, held until present()
    WGPUTexture currentTexture_ = nullptr;
    WGPUTextureView currentTextureView_ = nullptr;
};

WGPUPresentMode presentModeFromString(const std::string& mode);

} // namespace vellum
