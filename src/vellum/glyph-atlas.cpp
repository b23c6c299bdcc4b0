#include <vellum/glyph-atlas.h>
#include <vellum/wgpu-compat.h>
#include <ytrace/ytrace.hpp>

namespace vellum {

Result<GlyphAtlas::Ptr> GlyphAtlas::create(GpuAllocator& allocator, WGPUDevice device, WGPUQueue queue,
                                           WGPUBindGroupLayout layout, const AtlasImage& image) {
    auto atlas = Ptr(new GlyphAtlas(allocator));
    if (auto res = atlas->init(device, queue, layout, image); !res) {
        return Err<Ptr>("Failed to create GlyphAtlas", res);
    }
    return Ok(std::move(atlas));
}

GlyphAtlas::~GlyphAtlas() {
    if (_bindGroup) wgpuBindGroupRelease(_bindGroup);
    if (_sampler) wgpuSamplerRelease(_sampler);
    if (_view) wgpuTextureViewRelease(_view);
    _allocator.releaseTexture(_texture);
}

Result<void> GlyphAtlas::init(WGPUDevice device, WGPUQueue queue, WGPUBindGroupLayout layout,
                              const AtlasImage& image) {
    if (image.empty() || image.coverage.size() != static_cast<size_t>(image.width) * image.height) {
        return Err<void>("GlyphAtlas: invalid atlas image");
    }
    if (!layout) {
        return Err<void>("GlyphAtlas: no bind group layout");
    }

    _width = image.width;
    _height = image.height;

    WGPUTextureDescriptor texDesc = {};
    texDesc.label = WGPU_STR("glyph atlas");
    texDesc.size = {_width, _height, 1};
    texDesc.mipLevelCount = 1;
    texDesc.sampleCount = 1;
    texDesc.dimension = WGPUTextureDimension_2D;
    texDesc.format = WGPUTextureFormat_R8Unorm;
    texDesc.usage = WGPUTextureUsage_TextureBinding | WGPUTextureUsage_CopyDst;
    _texture = _allocator.createTexture(texDesc);
    if (!_texture) {
        return Err<void>("GlyphAtlas: failed to create texture");
    }

    _view = wgpuTextureCreateView(_texture, nullptr);
    if (!_view) {
        return Err<void>("GlyphAtlas: failed to create texture view");
    }

    WGPUSamplerDescriptor samplerDesc = {};
    samplerDesc.label = WGPU_STR("glyph atlas sampler");
    samplerDesc.addressModeU = WGPUAddressMode_ClampToEdge;
    samplerDesc.addressModeV = WGPUAddressMode_ClampToEdge;
    samplerDesc.addressModeW = WGPUAddressMode_ClampToEdge;
    samplerDesc.magFilter = WGPUFilterMode_Linear;
    samplerDesc.minFilter = WGPUFilterMode_Linear;
    samplerDesc.mipmapFilter = WGPUMipmapFilterMode_Nearest;
    samplerDesc.lodMinClamp = 0.0f;
    samplerDesc.lodMaxClamp = 1.0f;
    samplerDesc.maxAnisotropy = 1;
    _sampler = wgpuDeviceCreateSampler(device, &samplerDesc);
    if (!_sampler) {
        return Err<void>("GlyphAtlas: failed to create sampler");
    }

    WGPUBindGroupEntry entries[2] = {};
    entries[0].binding = 0;
    entries[0].textureView = _view;
    entries[1].binding = 1;
    entries[1].sampler = _sampler;

    WGPUBindGroupDescriptor bgDesc = {};
    bgDesc.label = WGPU_STR("glyph atlas bind group");
    bgDesc.layout = layout;
    bgDesc.entryCount = 2;
    bgDesc.entries = entries;
    _bindGroup = wgpuDeviceCreateBindGroup(device, &bgDesc);
    if (!_bindGroup) {
        return Err<void>("GlyphAtlas: failed to create bind group");
    }

    if (auto res = update(queue, image); !res) {
        return res;
    }
    yinfo("GlyphAtlas: {}x{} uploaded", _width, _height);
    return Ok();
}

Result<void> GlyphAtlas::update(WGPUQueue queue, const AtlasImage& image) {
    if (image.width != _width || image.height != _height) {
        return Err<void>("GlyphAtlas: size changed from " + std::to_string(_width) + "x" +
                         std::to_string(_height) + " to " + std::to_string(image.width) + "x" +
                         std::to_string(image.height));
    }

    WGPUTexelCopyTextureInfo dest = {};
    dest.texture = _texture;
    dest.mipLevel = 0;
    dest.origin = {0, 0, 0};
    dest.aspect = WGPUTextureAspect_All;

    WGPUTexelCopyBufferLayout layout = {};
    layout.offset = 0;
    layout.bytesPerRow = _width;
    layout.rowsPerImage = _height;

    WGPUExtent3D extent = {_width, _height, 1};
    wgpuQueueWriteTexture(queue, &dest, image.coverage.data(), image.coverage.size(), &layout, &extent);
    return Ok();
}

} // namespace vellum
