#pragma once

#include <vellum/gpu-allocator.h>
#include <vellum/result.hpp>
#include <webgpu/webgpu.h>
#include <array>
#include <cstdint>
#include <string>

namespace vellum {

//-----------------------------------------------------------------------------
// InstanceBuffer - double-buffered vertex buffer of per-instance records
//
// Frame N writes slot N % 2 while the GPU may still read the other slot.
// A slot grows before an upload that would overflow it; contents are not
// preserved across growth since every frame rewrites its slot whole.
//-----------------------------------------------------------------------------
class InstanceBuffer {
public:
    static constexpr uint32_t kSlots = 2;

    InstanceBuffer(GpuAllocator& allocator, std::string label, uint32_t stride);
    ~InstanceBuffer();

    InstanceBuffer(const InstanceBuffer&) = delete;
    InstanceBuffer& operator=(const InstanceBuffer&) = delete;

    Result<void> reserve(uint32_t slot, uint32_t count);

    // Grows the slot if needed, then queues the copy
    Result<void> write(WGPUQueue queue, uint32_t slot, const void* data, uint32_t count);

    WGPUBuffer buffer(uint32_t slot) const { return _slots[slot].buffer; }
    uint32_t capacity(uint32_t slot) const { return _slots[slot].capacity; }
    uint32_t stride() const { return _stride; }
    uint32_t growCount() const { return _growCount; }

    void release();

private:
    struct Slot {
        WGPUBuffer buffer = nullptr;
        uint32_t capacity = 0;
    };

    GpuAllocator& _allocator;
    std::string _label;
    uint32_t _stride;
    std::array<Slot, kSlots> _slots{};
    uint32_t _growCount = 0;
};

} // namespace vellum
