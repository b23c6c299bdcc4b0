#include <vellum/gpu-allocator.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>

namespace vellum {

namespace {

std::string labelToString(WGPUStringView label) {
    if (!label.data) return "(unnamed)";
    if (label.length == WGPU_STRLEN) return std::string(label.data);
    return std::string(label.data, label.length);
}

constexpr double kKiB = 1024.0;

} // namespace

GpuAllocator::GpuAllocator(WGPUDevice device)
    : _device(device) {}

WGPUBuffer GpuAllocator::createBuffer(const WGPUBufferDescriptor& desc) {
    std::string name = labelToString(desc.label);
    WGPUBuffer buffer = wgpuDeviceCreateBuffer(_device, &desc);
    if (!buffer) {
        yerror("GpuAllocator: failed to create buffer '{}'", name);
        return nullptr;
    }
    track(buffer, std::move(name), desc.size, false);
    return buffer;
}

void GpuAllocator::releaseBuffer(WGPUBuffer buffer) {
    if (!buffer) return;
    untrack(buffer, false);
    wgpuBufferRelease(buffer);
}

WGPUTexture GpuAllocator::createTexture(const WGPUTextureDescriptor& desc) {
    std::string name = labelToString(desc.label);
    WGPUTexture texture = wgpuDeviceCreateTexture(_device, &desc);
    if (!texture) {
        yerror("GpuAllocator: failed to create texture '{}'", name);
        return nullptr;
    }
    uint64_t size = static_cast<uint64_t>(desc.size.width)
                  * desc.size.height
                  * desc.size.depthOrArrayLayers
                  * bytesPerPixel(desc.format);
    track(texture, std::move(name), size, true);
    return texture;
}

void GpuAllocator::releaseTexture(WGPUTexture texture) {
    if (!texture) return;
    untrack(texture, true);
    wgpuTextureRelease(texture);
}

void GpuAllocator::track(void* handle, std::string name, uint64_t size, bool texture) {
    _totalBytes += size;
    _peakBytes = std::max(_peakBytes, _totalBytes);
    ydebug("GPU [+] {} '{}': {:.2f} KB, total {:.2f} KB",
           texture ? "texture" : "buffer", name, size / kKiB, _totalBytes / kKiB);
    _allocations[handle] = Allocation{std::move(name), size, texture};
}

void GpuAllocator::untrack(void* handle, bool texture) {
    auto it = _allocations.find(handle);
    if (it == _allocations.end() || it->second.texture != texture) {
        ywarn("GpuAllocator: release of untracked {}", texture ? "texture" : "buffer");
        return;
    }
    _totalBytes -= it->second.size;
    ydebug("GPU [-] {} '{}': {:.2f} KB, total {:.2f} KB",
           texture ? "texture" : "buffer", it->second.name,
           it->second.size / kKiB, _totalBytes / kKiB);
    _allocations.erase(it);
}

void GpuAllocator::dumpAllocations() const {
    yinfo("GPU allocations: {} live, {:.2f} KB (peak {:.2f} KB)",
          _allocations.size(), _totalBytes / kKiB, _peakBytes / kKiB);
    for (const auto& [handle, a] : _allocations) {
        yinfo("  {:>8} {:>10} bytes  {}", a.texture ? "texture" : "buffer", a.size, a.name);
    }
}

void GpuAllocator::forget() {
    if (!_allocations.empty()) {
        ywarn("GpuAllocator: forgetting {} allocations ({:.2f} KB)",
              _allocations.size(), _totalBytes / kKiB);
    }
    _allocations.clear();
    _totalBytes = 0;
}

uint32_t GpuAllocator::bytesPerPixel(WGPUTextureFormat format) {
    switch (format) {
        case WGPUTextureFormat_R8Unorm:
            return 1;
        case WGPUTextureFormat_RGBA8Unorm:
        case WGPUTextureFormat_RGBA8UnormSrgb:
        case WGPUTextureFormat_BGRA8Unorm:
        case WGPUTextureFormat_BGRA8UnormSrgb:
        case WGPUTextureFormat_Depth24Plus:
        case WGPUTextureFormat_Depth32Float:
            return 4;
        case WGPUTextureFormat_RGBA16Float:
            return 8;
        case WGPUTextureFormat_RGBA32Float:
            return 16;
        default:
            return 4;
    }
}

} // namespace vellum
