#pragma once

#include <vellum/frame-batch.h>
#include <vellum/instances.h>
#include <vellum/result.hpp>
#include <vellum/shader-loader.h>
#include <webgpu/webgpu.h>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace vellum {

// Everything a pipeline needs from the compositor to build itself
struct PipelineContext {
    WGPUDevice device = nullptr;
    WGPUTextureFormat colorFormat = WGPUTextureFormat_RGBA8Unorm;
    WGPUTextureFormat depthFormat = WGPUTextureFormat_Depth32Float;
    WGPUBindGroupLayout cameraLayout = nullptr;
    ShaderLoader* shaders = nullptr;
};

WGPUVertexFormat vertexFormatFor(const AttributeSpec& attr);
WGPUCompareFunction compareFunctionFor(DepthCompare compare);

//-----------------------------------------------------------------------------
// InstancedPipeline - one render pipeline drawing the shared unit quad once
// per instance.
//
// Vertex buffer 0 is the quad (quad_pos @location 0), vertex buffer 1 the
// instance records. Group 0 is the camera uniform; the compositor binds it
// once per pass. Alpha blending and depth state are fixed per kind.
//-----------------------------------------------------------------------------
class InstancedPipeline {
public:
    using Ptr = std::unique_ptr<InstancedPipeline>;

    virtual ~InstancedPipeline();

    InstancedPipeline(const InstancedPipeline&) = delete;
    InstancedPipeline& operator=(const InstancedPipeline&) = delete;

    PipelineKind kind() const { return _kind; }
    WGPURenderPipeline handle() const { return _pipeline; }

    // Sets the pipeline and instance buffer, then draws `count` quads.
    // Quad buffers and group 0 must already be bound on the pass.
    virtual void encode(WGPURenderPassEncoder pass, WGPUBuffer instances, uint32_t count);

    virtual void dispose();

protected:
    explicit InstancedPipeline(PipelineKind kind) : _kind(kind) {}

    Result<void> build(const PipelineContext& ctx, const std::string& shaderName,
                       std::span<const AttributeSpec> attributes, uint32_t stride,
                       const std::vector<WGPUBindGroupLayout>& extraLayouts);

private:
    PipelineKind _kind;
    WGPUShaderModule _shader = nullptr;
    WGPUPipelineLayout _pipelineLayout = nullptr;
    WGPURenderPipeline _pipeline = nullptr;
};

class RectPipeline : public InstancedPipeline {
public:
    static Result<Ptr> create(const PipelineContext& ctx);

private:
    RectPipeline() : InstancedPipeline(PipelineKind::Rect) {}
};

//-----------------------------------------------------------------------------
// GlyphPipeline - owns the group 1 layout (atlas texture + sampler). Draws
// only when an atlas bind group has been set.
//-----------------------------------------------------------------------------
class GlyphPipeline : public InstancedPipeline {
public:
    static Result<std::unique_ptr<GlyphPipeline>> create(const PipelineContext& ctx);

    ~GlyphPipeline() override;

    WGPUBindGroupLayout atlasLayout() const { return _atlasLayout; }

    // Not owned; nullptr unbinds
    void setAtlasBindGroup(WGPUBindGroup group) { _atlasGroup = group; }

    void encode(WGPURenderPassEncoder pass, WGPUBuffer instances, uint32_t count) override;
    void dispose() override;

private:
    GlyphPipeline() : InstancedPipeline(PipelineKind::Glyph) {}

    WGPUBindGroupLayout _atlasLayout = nullptr;
    WGPUBindGroup _atlasGroup = nullptr;
};

class CursorPipeline : public InstancedPipeline {
public:
    static Result<Ptr> create(const PipelineContext& ctx);

private:
    CursorPipeline() : InstancedPipeline(PipelineKind::Cursor) {}
};

} // namespace vellum
