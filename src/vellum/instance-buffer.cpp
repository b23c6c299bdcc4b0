#include <vellum/instance-buffer.h>
#include <vellum/instances.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>

namespace vellum {

InstanceBuffer::InstanceBuffer(GpuAllocator& allocator, std::string label, uint32_t stride)
    : _allocator(allocator)
    , _label(std::move(label))
    , _stride(stride) {}

InstanceBuffer::~InstanceBuffer() {
    release();
}

void InstanceBuffer::release() {
    for (Slot& slot : _slots) {
        _allocator.releaseBuffer(slot.buffer);
        slot.buffer = nullptr;
        slot.capacity = 0;
    }
}

Result<void> InstanceBuffer::reserve(uint32_t slotIndex, uint32_t count) {
    if (slotIndex >= kSlots) {
        return Err<void>("InstanceBuffer: bad slot " + std::to_string(slotIndex));
    }
    Slot& slot = _slots[slotIndex];
    uint32_t capacity = instanceCapacityFor(count, slot.capacity);
    if (!slot.buffer) {
        capacity = std::max(capacity, kMinInstanceCapacity);
    }
    if (slot.buffer && capacity == slot.capacity) {
        return Ok();
    }

    std::string name = _label + "[" + std::to_string(slotIndex) + "]";
    WGPUBufferDescriptor desc = {};
    desc.label = {.data = name.c_str(), .length = name.size()};
    desc.size = static_cast<uint64_t>(capacity) * _stride;
    desc.usage = WGPUBufferUsage_Vertex | WGPUBufferUsage_CopyDst;
    desc.mappedAtCreation = false;

    WGPUBuffer buffer = _allocator.createBuffer(desc);
    if (!buffer) {
        return Err<void>("InstanceBuffer: failed to allocate " + name +
                         " for " + std::to_string(capacity) + " instances");
    }

    if (slot.buffer) {
        ++_growCount;
        ydebug("InstanceBuffer: {} grew {} -> {} instances", name, slot.capacity, capacity);
        _allocator.releaseBuffer(slot.buffer);
    }
    slot.buffer = buffer;
    slot.capacity = capacity;
    return Ok();
}

Result<void> InstanceBuffer::write(WGPUQueue queue, uint32_t slotIndex, const void* data, uint32_t count) {
    if (auto res = reserve(slotIndex, count); !res) {
        return res;
    }
    if (count == 0) {
        return Ok();
    }
    wgpuQueueWriteBuffer(queue, _slots[slotIndex].buffer, 0, data,
                         static_cast<size_t>(count) * _stride);
    return Ok();
}

} // namespace vellum
