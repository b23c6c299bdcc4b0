#include <vellum/render-target.h>
#include <vellum/wgpu-compat.h>
#include <ytrace/ytrace.hpp>
#include <atomic>
#include <cstring>

namespace vellum {

uint32_t RenderTarget::alignedBytesPerRow(uint32_t width) {
    return (width * 4 + 255) & ~255u;
}

Result<RenderTarget::Ptr> RenderTarget::create(GpuAllocator& allocator, uint32_t width, uint32_t height) {
    if (width == 0 || height == 0) {
        return Err<Ptr>("RenderTarget: zero-sized target");
    }
    auto target = Ptr(new RenderTarget(allocator, width, height));
    if (auto res = target->init(); !res) {
        return Err<Ptr>("Failed to create RenderTarget", res);
    }
    return Ok(std::move(target));
}

RenderTarget::~RenderTarget() {
    _allocator.releaseBuffer(_readbackBuffer);
    if (_view) wgpuTextureViewRelease(_view);
    _allocator.releaseTexture(_texture);
}

Result<void> RenderTarget::init() {
    WGPUTextureDescriptor texDesc = {};
    texDesc.label = WGPU_STR("offscreen color");
    texDesc.size = {_width, _height, 1};
    texDesc.mipLevelCount = 1;
    texDesc.sampleCount = 1;
    texDesc.dimension = WGPUTextureDimension_2D;
    texDesc.format = kFormat;
    texDesc.usage = WGPUTextureUsage_RenderAttachment | WGPUTextureUsage_CopySrc;
    _texture = _allocator.createTexture(texDesc);
    if (!_texture) {
        return Err<void>("RenderTarget: failed to create texture");
    }

    _view = wgpuTextureCreateView(_texture, nullptr);
    if (!_view) {
        return Err<void>("RenderTarget: failed to create view");
    }

    WGPUBufferDescriptor bufDesc = {};
    bufDesc.label = WGPU_STR("offscreen readback");
    bufDesc.size = static_cast<uint64_t>(alignedBytesPerRow(_width)) * _height;
    bufDesc.usage = WGPUBufferUsage_CopyDst | WGPUBufferUsage_MapRead;
    _readbackBuffer = _allocator.createBuffer(bufDesc);
    if (!_readbackBuffer) {
        return Err<void>("RenderTarget: failed to create readback buffer");
    }
    return Ok();
}

Result<std::vector<uint8_t>> RenderTarget::readback(WGPUDevice device, WGPUQueue queue) {
    const uint32_t alignedRow = alignedBytesPerRow(_width);
    const uint64_t bufSize = static_cast<uint64_t>(alignedRow) * _height;

    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(device, nullptr);
    if (!encoder) {
        return Err<std::vector<uint8_t>>("RenderTarget: failed to create command encoder");
    }

    WGPUTexelCopyTextureInfo src = {};
    src.texture = _texture;
    src.aspect = WGPUTextureAspect_All;
    WGPUTexelCopyBufferInfo dst = {};
    dst.buffer = _readbackBuffer;
    dst.layout.bytesPerRow = alignedRow;
    dst.layout.rowsPerImage = _height;
    WGPUExtent3D copySize = {_width, _height, 1};
    wgpuCommandEncoderCopyTextureToBuffer(encoder, &src, &dst, &copySize);

    WGPUCommandBuffer cmd = wgpuCommandEncoderFinish(encoder, nullptr);
    wgpuCommandEncoderRelease(encoder);
    if (!cmd) {
        return Err<std::vector<uint8_t>>("RenderTarget: failed to finish readback commands");
    }
    wgpuQueueSubmit(queue, 1, &cmd);
    wgpuCommandBufferRelease(cmd);

    std::atomic<bool> done{false};
    WGPUMapAsyncStatus status = WGPUMapAsyncStatus_Error;
    WGPUBufferMapCallbackInfo cbInfo = {};
    cbInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    cbInfo.callback = [](WGPUMapAsyncStatus s, WGPUStringView, void* ud1, void* ud2) {
        *static_cast<WGPUMapAsyncStatus*>(ud2) = s;
        *static_cast<std::atomic<bool>*>(ud1) = true;
    };
    cbInfo.userdata1 = &done;
    cbInfo.userdata2 = &status;
    wgpuBufferMapAsync(_readbackBuffer, WGPUMapMode_Read, 0, bufSize, cbInfo);
    while (!done) WGPU_DEVICE_TICK(device);

    if (status != WGPUMapAsyncStatus_Success) {
        return Err<std::vector<uint8_t>>("RenderTarget: map failed (status " +
                                         std::to_string(static_cast<int>(status)) + ")");
    }

    const auto* mapped = static_cast<const uint8_t*>(
        wgpuBufferGetConstMappedRange(_readbackBuffer, 0, bufSize));
    if (!mapped) {
        wgpuBufferUnmap(_readbackBuffer);
        return Err<std::vector<uint8_t>>("RenderTarget: no mapped range");
    }

    const uint32_t row = _width * 4;
    std::vector<uint8_t> pixels(static_cast<size_t>(row) * _height);
    for (uint32_t y = 0; y < _height; y++) {
        std::memcpy(pixels.data() + static_cast<size_t>(y) * row,
                    mapped + static_cast<size_t>(y) * alignedRow, row);
    }
    wgpuBufferUnmap(_readbackBuffer);

    ydebug("RenderTarget: read back {}x{}", _width, _height);
    return Ok(std::move(pixels));
}

} // namespace vellum
