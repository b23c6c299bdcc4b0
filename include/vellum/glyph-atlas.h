#pragma once

#include <vellum/atlas-image.h>
#include <vellum/gpu-allocator.h>
#include <vellum/result.hpp>
#include <webgpu/webgpu.h>
#include <memory>

namespace vellum {

//-----------------------------------------------------------------------------
// GlyphAtlas - R8Unorm coverage texture, linear clamp-to-edge sampler and
// the group 1 bind group the glyph pipeline samples through.
//-----------------------------------------------------------------------------
class GlyphAtlas {
public:
    using Ptr = std::unique_ptr<GlyphAtlas>;

    static Result<Ptr> create(GpuAllocator& allocator, WGPUDevice device, WGPUQueue queue,
                              WGPUBindGroupLayout layout, const AtlasImage& image);

    ~GlyphAtlas();

    GlyphAtlas(const GlyphAtlas&) = delete;
    GlyphAtlas& operator=(const GlyphAtlas&) = delete;

    // Same-size images are written in place
    Result<void> update(WGPUQueue queue, const AtlasImage& image);

    WGPUBindGroup bindGroup() const { return _bindGroup; }
    uint32_t width() const { return _width; }
    uint32_t height() const { return _height; }

private:
    explicit GlyphAtlas(GpuAllocator& allocator) : _allocator(allocator) {}

    Result<void> init(WGPUDevice device, WGPUQueue queue, WGPUBindGroupLayout layout,
                      const AtlasImage& image);

    GpuAllocator& _allocator;
    WGPUTexture _texture = nullptr;
    WGPUTextureView _view = nullptr;
    WGPUSampler _sampler = nullptr;
    WGPUBindGroup _bindGroup = nullptr;
    uint32_t _width = 0;
    uint32_t _height = 0;
};

} // namespace vellum
