#include <vellum/webgpu-context.h>
#include <vellum/wgpu-compat.h>
#include <glfw3webgpu.h>
#include <ytrace/ytrace.hpp>

namespace vellum {

namespace {

std::string toString(WGPUStringView message) {
    if (!message.data) return "unknown";
    if (message.length == WGPU_STRLEN) return std::string(message.data);
    return std::string(message.data, message.length);
}

} // namespace

WGPUPresentMode presentModeFromString(const std::string& mode) {
    if (mode == "immediate") return WGPUPresentMode_Immediate;
    if (mode == "mailbox") return WGPUPresentMode_Mailbox;
    if (mode != "fifo") {
        ywarn("Unknown present mode '{}', using fifo", mode);
    }
    return WGPUPresentMode_Fifo;
}

Result<WebGPUContext::Ptr> WebGPUContext::createWindowed(GLFWwindow* window, uint32_t width, uint32_t height,
                                                         const std::string& presentMode) noexcept {
    if (!window) {
        return Err<Ptr>("WebGPUContext: null window");
    }
    auto ctx = Ptr(new WebGPUContext(window, width, height, presentModeFromString(presentMode)));
    if (auto res = ctx->init(); !res) {
        return Err<Ptr>("Failed to initialize WebGPUContext", res);
    }
    return Ok(std::move(ctx));
}

Result<WebGPUContext::Ptr> WebGPUContext::createHeadless() noexcept {
    auto ctx = Ptr(new WebGPUContext(nullptr, 0, 0, WGPUPresentMode_Fifo));
    if (auto res = ctx->init(); !res) {
        return Err<Ptr>("Failed to initialize headless WebGPUContext", res);
    }
    return Ok(std::move(ctx));
}

WebGPUContext::WebGPUContext(GLFWwindow* window, uint32_t width, uint32_t height,
                             WGPUPresentMode presentMode) noexcept
    : window_(window), presentMode_(presentMode), width_(width), height_(height) {}

WebGPUContext::~WebGPUContext() {
    if (currentTextureView_) wgpuTextureViewRelease(currentTextureView_);
    if (currentTexture_) wgpuTextureRelease(currentTexture_);
    releaseDevice();
    if (adapter_) wgpuAdapterRelease(adapter_);
    if (surface_) wgpuSurfaceRelease(surface_);
    if (instance_) wgpuInstanceRelease(instance_);
}

Result<void> WebGPUContext::init() noexcept {
    WGPUInstanceDescriptor instanceDesc = {};
    instance_ = wgpuCreateInstance(&instanceDesc);
    if (!instance_) {
        return Err<void>("Failed to create WebGPU instance");
    }

    if (window_) {
        surface_ = glfwCreateWindowWGPUSurface(instance_, window_);
        if (!surface_) {
            return Err<void>("Failed to create WebGPU surface");
        }
    }

    if (auto res = requestAdapter(); !res) {
        return res;
    }
    if (auto res = requestDevice(); !res) {
        return res;
    }

    if (surface_) {
        WGPUSurfaceCapabilities caps = {};
        wgpuSurfaceGetCapabilities(surface_, adapter_, &caps);
        colorFormat_ = caps.formatCount > 0 ? caps.formats[0] : WGPUTextureFormat_BGRA8Unorm;
        wgpuSurfaceCapabilitiesFreeMembers(caps);
        configureSurface(width_, height_);
    }

    yinfo("WebGPU initialized ({}, format {})",
          surface_ ? "windowed" : "headless", static_cast<int>(colorFormat_));
    return Ok();
}

Result<void> WebGPUContext::requestAdapter() noexcept {
    WGPURequestAdapterOptions adapterOpts = {};
    adapterOpts.compatibleSurface = surface_;
    adapterOpts.powerPreference = WGPUPowerPreference_HighPerformance;

    WGPURequestAdapterCallbackInfo adapterCallbackInfo = {};
    adapterCallbackInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    adapterCallbackInfo.callback = [](WGPURequestAdapterStatus status, WGPUAdapter adapter,
                                      WGPUStringView message, void* userdata1, void*) {
        if (status == WGPURequestAdapterStatus_Success) {
            *static_cast<WGPUAdapter*>(userdata1) = adapter;
        } else {
            yerror("Failed to get WebGPU adapter: {}", toString(message));
        }
    };
    adapterCallbackInfo.userdata1 = &adapter_;
    wgpuInstanceRequestAdapter(instance_, &adapterOpts, adapterCallbackInfo);

    if (!adapter_) {
        return Err<void>("Failed to get WebGPU adapter");
    }
    return Ok();
}

Result<void> WebGPUContext::requestDevice() noexcept {
    WGPUDeviceDescriptor deviceDesc = {};
    deviceDesc.label = WGPU_STR("vellum device");
    deviceDesc.requiredFeatureCount = 0;
    deviceDesc.requiredLimits = nullptr;
    deviceDesc.defaultQueue.label = WGPU_STR("default queue");
    deviceDesc.uncapturedErrorCallbackInfo.callback = [](WGPUDevice const*, WGPUErrorType type,
                                                         WGPUStringView message, void*, void*) {
        yerror("WebGPU error ({}): {}", static_cast<int>(type), toString(message));
    };

    deviceDesc.deviceLostCallbackInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    deviceDesc.deviceLostCallbackInfo.callback = [](WGPUDevice const*, WGPUDeviceLostReason reason,
                                                    WGPUStringView message, void* userdata1, void*) {
        auto* self = static_cast<WebGPUContext*>(userdata1);
        // Our own release also reports a loss
        if (self->releasing_) return;
        ywarn("WebGPU device lost ({}): {}", static_cast<int>(reason), toString(message));
        self->lost_ = true;
    };
    deviceDesc.deviceLostCallbackInfo.userdata1 = this;

    WGPURequestDeviceCallbackInfo deviceCallbackInfo = {};
    deviceCallbackInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    deviceCallbackInfo.callback = [](WGPURequestDeviceStatus status, WGPUDevice device,
                                     WGPUStringView message, void* userdata1, void*) {
        if (status == WGPURequestDeviceStatus_Success) {
            *static_cast<WGPUDevice*>(userdata1) = device;
        } else {
            yerror("Failed to get WebGPU device: {}", toString(message));
        }
    };
    deviceCallbackInfo.userdata1 = &device_;
    wgpuAdapterRequestDevice(adapter_, &deviceDesc, deviceCallbackInfo);

    if (!device_) {
        return Err<void>("Failed to get WebGPU device");
    }

    queue_ = wgpuDeviceGetQueue(device_);
    if (!queue_) {
        return Err<void>("Failed to get WebGPU queue");
    }
    lost_ = false;
    ++generation_;
    return Ok();
}

void WebGPUContext::releaseDevice() noexcept {
    releasing_ = true;
    if (queue_) {
        wgpuQueueRelease(queue_);
        queue_ = nullptr;
    }
    if (device_) {
        wgpuDeviceRelease(device_);
        device_ = nullptr;
    }
    releasing_ = false;
}

Result<void> WebGPUContext::recreateDevice() noexcept {
    ywarn("WebGPUContext: recreating device (generation {})", generation_);

    if (currentTextureView_) {
        wgpuTextureViewRelease(currentTextureView_);
        currentTextureView_ = nullptr;
    }
    if (currentTexture_) {
        wgpuTextureRelease(currentTexture_);
        currentTexture_ = nullptr;
    }
    if (surface_) {
        wgpuSurfaceUnconfigure(surface_);
    }
    releaseDevice();

    if (auto res = requestDevice(); !res) {
        // The adapter may have gone with the device
        if (adapter_) {
            wgpuAdapterRelease(adapter_);
            adapter_ = nullptr;
        }
        if (auto adapterRes = requestAdapter(); !adapterRes) {
            return Err<void>("WebGPUContext: adapter unavailable after device loss", adapterRes);
        }
        if (auto retry = requestDevice(); !retry) {
            return Err<void>("WebGPUContext: failed to recreate device", retry);
        }
    }

    if (surface_) {
        configureSurface(width_, height_);
    }
    yinfo("WebGPUContext: device recreated (generation {})", generation_);
    return Ok();
}

void WebGPUContext::loseDevice() noexcept {
    if (device_) {
        wgpuDeviceDestroy(device_);
    }
}

void WebGPUContext::configureSurface(uint32_t width, uint32_t height) noexcept {
    if (!surface_ || width == 0 || height == 0) return;

    WGPUSurfaceConfiguration config = {};
    config.nextInChain = nullptr;
    config.device = device_;
    config.format = colorFormat_;
    config.usage = WGPUTextureUsage_RenderAttachment;
    config.viewFormatCount = 0;
    config.viewFormats = nullptr;
    config.alphaMode = WGPUCompositeAlphaMode_Auto;
    config.presentMode = presentMode_;
    config.width = width;
    config.height = height;
    wgpuSurfaceConfigure(surface_, &config);
}

void WebGPUContext::resize(uint32_t width, uint32_t height) noexcept {
    if (width == 0 || height == 0) return;
    width_ = width;
    height_ = height;
    configureSurface(width, height);
}

Result<WGPUTextureView> WebGPUContext::getCurrentTextureView() noexcept {
    if (!surface_) {
        return Err<WGPUTextureView>("WebGPUContext: headless context has no surface");
    }
    if (currentTextureView_) {
        return Ok(currentTextureView_);
    }

    WGPUSurfaceTexture surfaceTexture = {};
    wgpuSurfaceGetCurrentTexture(surface_, &surfaceTexture);

    if (surfaceTexture.status != WGPUSurfaceGetCurrentTextureStatus_SuccessOptimal &&
        surfaceTexture.status != WGPUSurfaceGetCurrentTextureStatus_SuccessSuboptimal) {
        if (surfaceTexture.texture) wgpuTextureRelease(surfaceTexture.texture);
        return Err<WGPUTextureView>("Failed to get surface texture (status " +
                                    std::to_string(static_cast<int>(surfaceTexture.status)) + ")");
    }

    currentTexture_ = surfaceTexture.texture;

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = colorFormat_;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.baseMipLevel = 0;
    viewDesc.mipLevelCount = 1;
    viewDesc.baseArrayLayer = 0;
    viewDesc.arrayLayerCount = 1;
    viewDesc.aspect = WGPUTextureAspect_All;

    currentTextureView_ = wgpuTextureCreateView(currentTexture_, &viewDesc);
    if (!currentTextureView_) {
        return Err<WGPUTextureView>("Failed to create texture view");
    }
    return Ok(currentTextureView_);
}

void WebGPUContext::present() noexcept {
    if (!surface_) return;

    if (currentTextureView_) {
        wgpuTextureViewRelease(currentTextureView_);
        currentTextureView_ = nullptr;
    }
    wgpuSurfacePresent(surface_);
    if (currentTexture_) {
        wgpuTextureRelease(currentTexture_);
        currentTexture_ = nullptr;
    }
}

void WebGPUContext::waitIdle() noexcept {
    if (!queue_ || lost_) return;

    std::atomic<bool> done{false};
    WGPUQueueWorkDoneCallbackInfo cbInfo = {};
    cbInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    cbInfo.callback = [](WGPUQueueWorkDoneStatus, WGPUStringView, void* ud1, void*) {
        *static_cast<std::atomic<bool>*>(ud1) = true;
    };
    cbInfo.userdata1 = &done;
    wgpuQueueOnSubmittedWorkDone(queue_, cbInfo);
    while (!done && !lost_) WGPU_DEVICE_TICK(device_);
}

} // namespace vellum
