#pragma once

#include <vellum/gpu-allocator.h>
#include <vellum/result.hpp>
#include <webgpu/webgpu.h>
#include <cstdint>
#include <memory>
#include <vector>

namespace vellum {

//-----------------------------------------------------------------------------
// RenderTarget - offscreen RGBA8Unorm color texture with CPU readback
//-----------------------------------------------------------------------------
class RenderTarget {
public:
    using Ptr = std::unique_ptr<RenderTarget>;

    static constexpr WGPUTextureFormat kFormat = WGPUTextureFormat_RGBA8Unorm;

    static Result<Ptr> create(GpuAllocator& allocator, uint32_t width, uint32_t height);

    ~RenderTarget();

    RenderTarget(const RenderTarget&) = delete;
    RenderTarget& operator=(const RenderTarget&) = delete;

    WGPUTextureView view() const { return _view; }
    uint32_t width() const { return _width; }
    uint32_t height() const { return _height; }

    // Copies the texture out and waits for the map. Tightly packed RGBA8 rows.
    Result<std::vector<uint8_t>> readback(WGPUDevice device, WGPUQueue queue);

    // Rows of a texture-to-buffer copy are padded to 256 bytes
    static uint32_t alignedBytesPerRow(uint32_t width);

private:
    RenderTarget(GpuAllocator& allocator, uint32_t width, uint32_t height)
        : _allocator(allocator), _width(width), _height(height) {}

    Result<void> init();

    GpuAllocator& _allocator;
    uint32_t _width;
    uint32_t _height;
    WGPUTexture _texture = nullptr;
    WGPUTextureView _view = nullptr;
    WGPUBuffer _readbackBuffer = nullptr;
};

} // namespace vellum
