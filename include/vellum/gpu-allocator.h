#pragma once

#include <vellum/wgpu-compat.h>
#include <webgpu/webgpu.h>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

namespace vellum {

//-----------------------------------------------------------------------------
// GpuAllocator - creates and releases buffers and textures for one device,
// keeping a labelled ledger of live allocations.
//
// All handles created here must be released here. Recreate the allocator
// after the device is lost; forget() drops the ledger without releasing.
//-----------------------------------------------------------------------------
class GpuAllocator {
public:
    using Ptr = std::shared_ptr<GpuAllocator>;

    explicit GpuAllocator(WGPUDevice device);
    ~GpuAllocator() = default;

    GpuAllocator(const GpuAllocator&) = delete;
    GpuAllocator& operator=(const GpuAllocator&) = delete;

    // Name is taken from desc.label. nullptr on failure.
    WGPUBuffer createBuffer(const WGPUBufferDescriptor& desc);
    void releaseBuffer(WGPUBuffer buffer);

    WGPUTexture createTexture(const WGPUTextureDescriptor& desc);
    void releaseTexture(WGPUTexture texture);

    uint64_t totalBytes() const { return _totalBytes; }
    uint64_t peakBytes() const { return _peakBytes; }
    size_t allocationCount() const { return _allocations.size(); }

    void dumpAllocations() const;

    void forget();

    static uint32_t bytesPerPixel(WGPUTextureFormat format);

private:
    struct Allocation {
        std::string name;
        uint64_t size;
        bool texture;
    };

    void track(void* handle, std::string name, uint64_t size, bool texture);
    void untrack(void* handle, bool texture);

    WGPUDevice _device;
    std::unordered_map<void*, Allocation> _allocations;
    uint64_t _totalBytes = 0;
    uint64_t _peakBytes = 0;
};

} // namespace vellum
