#include <vellum/pipelines.h>
#include <vellum/wgpu-compat.h>
#include <ytrace/ytrace.hpp>

namespace vellum {

WGPUVertexFormat vertexFormatFor(const AttributeSpec& attr) {
    switch (attr.components) {
        case 1: return WGPUVertexFormat_Float32;
        case 2: return WGPUVertexFormat_Float32x2;
        case 3: return WGPUVertexFormat_Float32x3;
        default: return WGPUVertexFormat_Float32x4;
    }
}

WGPUCompareFunction compareFunctionFor(DepthCompare compare) {
    switch (compare) {
        case DepthCompare::Always:    return WGPUCompareFunction_Always;
        case DepthCompare::LessEqual: return WGPUCompareFunction_LessEqual;
    }
    return WGPUCompareFunction_Always;
}

//=============================================================================
// InstancedPipeline
//=============================================================================

InstancedPipeline::~InstancedPipeline() {
    InstancedPipeline::dispose();
}

void InstancedPipeline::dispose() {
    if (_pipeline) {
        wgpuRenderPipelineRelease(_pipeline);
        _pipeline = nullptr;
    }
    if (_pipelineLayout) {
        wgpuPipelineLayoutRelease(_pipelineLayout);
        _pipelineLayout = nullptr;
    }
    if (_shader) {
        wgpuShaderModuleRelease(_shader);
        _shader = nullptr;
    }
}

Result<void> InstancedPipeline::build(const PipelineContext& ctx, const std::string& shaderName,
                                      std::span<const AttributeSpec> attributes, uint32_t stride,
                                      const std::vector<WGPUBindGroupLayout>& extraLayouts) {
    const std::string name(pipelineName(_kind));
    if (!ctx.device || !ctx.cameraLayout || !ctx.shaders) {
        return Err<void>("InstancedPipeline(" + name + "): incomplete pipeline context");
    }

    auto shader = ctx.shaders->compile(ctx.device, shaderName);
    if (!shader) {
        return Err<void>("InstancedPipeline(" + name + "): failed to load " + shaderName, shader);
    }
    _shader = *shader;

    // Group 0 camera, then whatever the pipeline adds
    std::vector<WGPUBindGroupLayout> layouts;
    layouts.push_back(ctx.cameraLayout);
    layouts.insert(layouts.end(), extraLayouts.begin(), extraLayouts.end());

    WGPUPipelineLayoutDescriptor plDesc = {};
    plDesc.bindGroupLayoutCount = layouts.size();
    plDesc.bindGroupLayouts = layouts.data();
    _pipelineLayout = wgpuDeviceCreatePipelineLayout(ctx.device, &plDesc);
    if (!_pipelineLayout) {
        return Err<void>("InstancedPipeline(" + name + "): failed to create pipeline layout");
    }

    WGPUVertexAttribute quadAttr = {};
    quadAttr.format = WGPUVertexFormat_Float32x2;
    quadAttr.offset = 0;
    quadAttr.shaderLocation = 0;

    std::vector<WGPUVertexAttribute> instanceAttrs;
    instanceAttrs.reserve(attributes.size());
    for (const AttributeSpec& spec : attributes) {
        WGPUVertexAttribute attr = {};
        attr.format = vertexFormatFor(spec);
        attr.offset = spec.offset;
        attr.shaderLocation = spec.location;
        instanceAttrs.push_back(attr);
    }

    WGPUVertexBufferLayout buffers[2] = {};
    buffers[0].stepMode = WGPUVertexStepMode_Vertex;
    buffers[0].arrayStride = sizeof(QuadVertex);
    buffers[0].attributeCount = 1;
    buffers[0].attributes = &quadAttr;
    buffers[1].stepMode = WGPUVertexStepMode_Instance;
    buffers[1].arrayStride = stride;
    buffers[1].attributeCount = instanceAttrs.size();
    buffers[1].attributes = instanceAttrs.data();

    WGPURenderPipelineDescriptor pipelineDesc = {};
    pipelineDesc.label = {.data = name.c_str(), .length = name.size()};
    pipelineDesc.layout = _pipelineLayout;

    pipelineDesc.vertex.module = _shader;
    pipelineDesc.vertex.entryPoint = WGPU_STR("vs_main");
    pipelineDesc.vertex.bufferCount = 2;
    pipelineDesc.vertex.buffers = buffers;

    // Premultiplied-style alpha accumulation, source-over for color
    WGPUBlendState blend = {};
    blend.color.srcFactor = WGPUBlendFactor_SrcAlpha;
    blend.color.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    blend.color.operation = WGPUBlendOperation_Add;
    blend.alpha.srcFactor = WGPUBlendFactor_One;
    blend.alpha.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    blend.alpha.operation = WGPUBlendOperation_Add;

    WGPUColorTargetState colorTarget = {};
    colorTarget.format = ctx.colorFormat;
    colorTarget.blend = &blend;
    colorTarget.writeMask = WGPUColorWriteMask_All;

    WGPUFragmentState fragState = {};
    fragState.module = _shader;
    fragState.entryPoint = WGPU_STR("fs_main");
    fragState.targetCount = 1;
    fragState.targets = &colorTarget;
    pipelineDesc.fragment = &fragState;

    const DepthState depthState = depthStateFor(_kind);
    WGPUStencilFaceState stencilFace = {};
    stencilFace.compare = WGPUCompareFunction_Always;
    stencilFace.failOp = WGPUStencilOperation_Keep;
    stencilFace.depthFailOp = WGPUStencilOperation_Keep;
    stencilFace.passOp = WGPUStencilOperation_Keep;

    WGPUDepthStencilState depthStencil = {};
    depthStencil.format = ctx.depthFormat;
    depthStencil.depthWriteEnabled = depthState.write ? WGPUOptionalBool_True : WGPUOptionalBool_False;
    depthStencil.depthCompare = compareFunctionFor(depthState.compare);
    depthStencil.stencilFront = stencilFace;
    depthStencil.stencilBack = stencilFace;
    depthStencil.stencilReadMask = 0;
    depthStencil.stencilWriteMask = 0;
    pipelineDesc.depthStencil = &depthStencil;

    pipelineDesc.primitive.topology = WGPUPrimitiveTopology_TriangleList;
    pipelineDesc.primitive.frontFace = WGPUFrontFace_CCW;
    pipelineDesc.primitive.cullMode = WGPUCullMode_None;

    pipelineDesc.multisample.count = 1;
    pipelineDesc.multisample.mask = 0xFFFFFFFF;

    _pipeline = wgpuDeviceCreateRenderPipeline(ctx.device, &pipelineDesc);
    if (!_pipeline) {
        return Err<void>("InstancedPipeline(" + name + "): failed to create render pipeline");
    }

    ydebug("InstancedPipeline: {} pipeline created ({} instance attributes, stride {})",
           name, instanceAttrs.size(), stride);
    return Ok();
}

void InstancedPipeline::encode(WGPURenderPassEncoder pass, WGPUBuffer instances, uint32_t count) {
    if (!_pipeline || !instances || count == 0) return;
    wgpuRenderPassEncoderSetPipeline(pass, _pipeline);
    wgpuRenderPassEncoderSetVertexBuffer(pass, 1, instances, 0, WGPU_WHOLE_SIZE);
    wgpuRenderPassEncoderDrawIndexed(pass, static_cast<uint32_t>(kQuadIndices.size()), count, 0, 0, 0);
}

//=============================================================================
// Rect / cursor
//=============================================================================

Result<InstancedPipeline::Ptr> RectPipeline::create(const PipelineContext& ctx) {
    std::unique_ptr<RectPipeline> pipeline(new RectPipeline());
    if (auto res = pipeline->build(ctx, "rect.wgsl", kRectAttributes, sizeof(RectInstance), {}); !res) {
        return Err<Ptr>("Failed to create RectPipeline", res);
    }
    return Ok(Ptr(std::move(pipeline)));
}

Result<InstancedPipeline::Ptr> CursorPipeline::create(const PipelineContext& ctx) {
    std::unique_ptr<CursorPipeline> pipeline(new CursorPipeline());
    if (auto res = pipeline->build(ctx, "cursor.wgsl", kCursorAttributes, sizeof(CursorInstance), {}); !res) {
        return Err<Ptr>("Failed to create CursorPipeline", res);
    }
    return Ok(Ptr(std::move(pipeline)));
}

//=============================================================================
// GlyphPipeline
//=============================================================================

Result<std::unique_ptr<GlyphPipeline>> GlyphPipeline::create(const PipelineContext& ctx) {
    using GlyphPtr = std::unique_ptr<GlyphPipeline>;
    auto pipeline = GlyphPtr(new GlyphPipeline());

    WGPUBindGroupLayoutEntry entries[2] = {};
    entries[0].binding = 0;
    entries[0].visibility = WGPUShaderStage_Fragment;
    entries[0].texture.sampleType = WGPUTextureSampleType_Float;
    entries[0].texture.viewDimension = WGPUTextureViewDimension_2D;
    entries[0].texture.multisampled = false;
    entries[1].binding = 1;
    entries[1].visibility = WGPUShaderStage_Fragment;
    entries[1].sampler.type = WGPUSamplerBindingType_Filtering;

    WGPUBindGroupLayoutDescriptor bglDesc = {};
    bglDesc.label = WGPU_STR("glyph atlas layout");
    bglDesc.entryCount = 2;
    bglDesc.entries = entries;
    pipeline->_atlasLayout = wgpuDeviceCreateBindGroupLayout(ctx.device, &bglDesc);
    if (!pipeline->_atlasLayout) {
        return Err<GlyphPtr>("GlyphPipeline: failed to create atlas bind group layout");
    }

    if (auto res = pipeline->build(ctx, "glyph.wgsl", kGlyphAttributes, sizeof(GlyphInstance),
                                   {pipeline->_atlasLayout}); !res) {
        return Err<GlyphPtr>("Failed to create GlyphPipeline", res);
    }
    return Ok(std::move(pipeline));
}

GlyphPipeline::~GlyphPipeline() {
    GlyphPipeline::dispose();
}

void GlyphPipeline::dispose() {
    _atlasGroup = nullptr;
    InstancedPipeline::dispose();
    if (_atlasLayout) {
        wgpuBindGroupLayoutRelease(_atlasLayout);
        _atlasLayout = nullptr;
    }
}

void GlyphPipeline::encode(WGPURenderPassEncoder pass, WGPUBuffer instances, uint32_t count) {
    if (!_atlasGroup) {
        ydebug("GlyphPipeline: no atlas bind group, skipping {} glyphs", count);
        return;
    }
    wgpuRenderPassEncoderSetBindGroup(pass, 1, _atlasGroup, 0, nullptr);
    InstancedPipeline::encode(pass, instances, count);
}

} // namespace vellum
