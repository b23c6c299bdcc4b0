#include <vellum/frame-compositor.h>
#include <vellum/wgpu-compat.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>

namespace vellum {

Result<FrameCompositor::Ptr> FrameCompositor::create(WebGPUContext::Ptr ctx,
                                                     const CompositorOptions& options) noexcept {
    if (!ctx) {
        return Err<Ptr>("FrameCompositor: null context");
    }
    auto compositor = Ptr(new FrameCompositor(std::move(ctx), options));
    if (auto res = compositor->init(); !res) {
        return Err<Ptr>("Failed to initialize FrameCompositor", res);
    }
    return Ok(std::move(compositor));
}

Result<FrameCompositor::Ptr> FrameCompositor::createForTest(const CompositorOptions& options) noexcept {
    auto compositor = Ptr(new FrameCompositor(nullptr, options));
    compositor->_offscreenWidth = options.width;
    compositor->_offscreenHeight = options.height;
    return Ok(std::move(compositor));
}

FrameCompositor::FrameCompositor(WebGPUContext::Ptr ctx, const CompositorOptions& options)
    : _ctx(std::move(ctx))
    , _options(options)
    , _shaders(options.shaderDir) {
    for (auto& idle : _slotIdle) idle = true;
}

FrameCompositor::~FrameCompositor() {
    // Work-done callbacks point into this object
    if (_ctx) _ctx->waitIdle();
    releaseResources();
}

Result<void> FrameCompositor::init() {
    if (_ctx->headless()) {
        if (_options.width == 0 || _options.height == 0) {
            return Err<void>("FrameCompositor: headless rendering needs a target size");
        }
        _offscreenWidth = _options.width;
        _offscreenHeight = _options.height;
    }
    if (auto res = createResources(); !res) {
        return res;
    }
    yinfo("FrameCompositor: ready, target {}x{}, shaders from {}",
          targetWidth(), targetHeight(), _shaders.directory());
    return Ok();
}

//=============================================================================
// Resources
//=============================================================================

Result<void> FrameCompositor::createResources() {
    _allocator = std::make_unique<GpuAllocator>(_ctx->getDevice());

    if (auto res = createCameraBinding(); !res) return res;
    if (auto res = createQuadBuffers(); !res) return res;
    if (auto res = createPipelines(); !res) return res;

    _rectInstances = std::make_unique<InstanceBuffer>(*_allocator, "rect instances", sizeof(RectInstance));
    _glyphInstances = std::make_unique<InstanceBuffer>(*_allocator, "glyph instances", sizeof(GlyphInstance));
    _cursorInstances = std::make_unique<InstanceBuffer>(*_allocator, "cursor instances", sizeof(CursorInstance));
    for (uint32_t slot = 0; slot < InstanceBuffer::kSlots; ++slot) {
        for (InstanceBuffer* buffer : {_rectInstances.get(), _glyphInstances.get(), _cursorInstances.get()}) {
            if (auto res = buffer->reserve(slot, _options.initialCapacity); !res) {
                return Err<void>("FrameCompositor: failed to allocate instance buffers", res);
            }
        }
    }

    if (_offscreenWidth > 0 && _offscreenHeight > 0) {
        auto target = RenderTarget::create(*_allocator, _offscreenWidth, _offscreenHeight);
        if (!target) {
            return Err<void>("FrameCompositor: failed to create offscreen target", target);
        }
        _offscreen = std::move(*target);
    }

    if (_atlasImage) {
        AtlasImage image = *_atlasImage;
        if (auto res = uploadAtlas(image); !res) {
            return Err<void>("FrameCompositor: failed to restore glyph atlas", res);
        }
    }

    for (auto& idle : _slotIdle) idle = true;
    _slot = 0;
    return Ok();
}

bool FrameCompositor::resourcesValid() const {
    return _allocator && _cameraGroup && _quadVertices && _quadIndices &&
           _rectPipeline && _glyphPipeline && _cursorPipeline &&
           _rectInstances && _glyphInstances && _cursorInstances;
}

void FrameCompositor::releaseResources() {
    if (_glyphPipeline) _glyphPipeline->setAtlasBindGroup(nullptr);
    _atlas.reset();
    _offscreen.reset();
    _rectInstances.reset();
    _glyphInstances.reset();
    _cursorInstances.reset();
    _rectPipeline.reset();
    _glyphPipeline.reset();
    _cursorPipeline.reset();

    if (_allocator) {
        _allocator->releaseTexture(_depthTexture);
        _allocator->releaseBuffer(_quadIndices);
        _allocator->releaseBuffer(_quadVertices);
        _allocator->releaseBuffer(_cameraBuffer);
    }
    if (_depthView) wgpuTextureViewRelease(_depthView);
    if (_cameraGroup) wgpuBindGroupRelease(_cameraGroup);
    if (_cameraLayout) wgpuBindGroupLayoutRelease(_cameraLayout);

    _depthTexture = nullptr;
    _depthView = nullptr;
    _depthWidth = 0;
    _depthHeight = 0;
    _quadIndices = nullptr;
    _quadVertices = nullptr;
    _cameraBuffer = nullptr;
    _cameraGroup = nullptr;
    _cameraLayout = nullptr;

    if (_allocator && _allocator->allocationCount() > 0) {
        _allocator->dumpAllocations();
    }
    _allocator.reset();
}

Result<void> FrameCompositor::createCameraBinding() {
    WGPUDevice device = _ctx->getDevice();

    WGPUBufferDescriptor bufDesc = {};
    bufDesc.label = WGPU_STR("camera uniform");
    bufDesc.size = sizeof(CameraUniform);
    bufDesc.usage = WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst;
    _cameraBuffer = _allocator->createBuffer(bufDesc);
    if (!_cameraBuffer) {
        return Err<void>("FrameCompositor: failed to create camera uniform buffer");
    }

    CameraUniform initial = CameraUniform::identity(
        static_cast<float>(std::max(1u, targetWidth())), static_cast<float>(std::max(1u, targetHeight())));
    wgpuQueueWriteBuffer(_ctx->getQueue(), _cameraBuffer, 0, &initial, sizeof(initial));

    WGPUBindGroupLayoutEntry bindingEntry = {};
    bindingEntry.binding = 0;
    bindingEntry.visibility = WGPUShaderStage_Vertex | WGPUShaderStage_Fragment;
    bindingEntry.buffer.type = WGPUBufferBindingType_Uniform;
    bindingEntry.buffer.minBindingSize = sizeof(CameraUniform);

    WGPUBindGroupLayoutDescriptor bglDesc = {};
    bglDesc.label = WGPU_STR("camera layout");
    bglDesc.entryCount = 1;
    bglDesc.entries = &bindingEntry;
    _cameraLayout = wgpuDeviceCreateBindGroupLayout(device, &bglDesc);
    if (!_cameraLayout) {
        return Err<void>("FrameCompositor: failed to create camera bind group layout");
    }

    WGPUBindGroupEntry bgEntry = {};
    bgEntry.binding = 0;
    bgEntry.buffer = _cameraBuffer;
    bgEntry.offset = 0;
    bgEntry.size = sizeof(CameraUniform);

    WGPUBindGroupDescriptor bgDesc = {};
    bgDesc.label = WGPU_STR("camera bind group");
    bgDesc.layout = _cameraLayout;
    bgDesc.entryCount = 1;
    bgDesc.entries = &bgEntry;
    _cameraGroup = wgpuDeviceCreateBindGroup(device, &bgDesc);
    if (!_cameraGroup) {
        return Err<void>("FrameCompositor: failed to create camera bind group");
    }
    return Ok();
}

Result<void> FrameCompositor::createQuadBuffers() {
    WGPUQueue queue = _ctx->getQueue();

    WGPUBufferDescriptor vbDesc = {};
    vbDesc.label = WGPU_STR("unit quad vertices");
    vbDesc.size = sizeof(kQuadVertices);
    vbDesc.usage = WGPUBufferUsage_Vertex | WGPUBufferUsage_CopyDst;
    _quadVertices = _allocator->createBuffer(vbDesc);
    if (!_quadVertices) {
        return Err<void>("FrameCompositor: failed to create quad vertex buffer");
    }
    wgpuQueueWriteBuffer(queue, _quadVertices, 0, kQuadVertices.data(), sizeof(kQuadVertices));

    // Copy sizes must be a multiple of 4
    constexpr uint64_t indexBytes = (sizeof(kQuadIndices) + 3) & ~uint64_t{3};
    std::array<uint16_t, indexBytes / sizeof(uint16_t)> indices{};
    std::copy(kQuadIndices.begin(), kQuadIndices.end(), indices.begin());

    WGPUBufferDescriptor ibDesc = {};
    ibDesc.label = WGPU_STR("unit quad indices");
    ibDesc.size = indexBytes;
    ibDesc.usage = WGPUBufferUsage_Index | WGPUBufferUsage_CopyDst;
    _quadIndices = _allocator->createBuffer(ibDesc);
    if (!_quadIndices) {
        return Err<void>("FrameCompositor: failed to create quad index buffer");
    }
    wgpuQueueWriteBuffer(queue, _quadIndices, 0, indices.data(), indexBytes);
    return Ok();
}

Result<void> FrameCompositor::createPipelines() {
    PipelineContext pctx;
    pctx.device = _ctx->getDevice();
    pctx.colorFormat = _offscreenWidth > 0 ? RenderTarget::kFormat : _ctx->colorFormat();
    pctx.depthFormat = kDepthFormat;
    pctx.cameraLayout = _cameraLayout;
    pctx.shaders = &_shaders;

    auto rect = RectPipeline::create(pctx);
    if (!rect) return Err<void>("FrameCompositor: rect pipeline", rect);
    _rectPipeline = std::move(*rect);

    auto glyph = GlyphPipeline::create(pctx);
    if (!glyph) return Err<void>("FrameCompositor: glyph pipeline", glyph);
    _glyphPipeline = std::move(*glyph);

    auto cursor = CursorPipeline::create(pctx);
    if (!cursor) return Err<void>("FrameCompositor: cursor pipeline", cursor);
    _cursorPipeline = std::move(*cursor);

    return Ok();
}

Result<void> FrameCompositor::ensureDepth(uint32_t width, uint32_t height) {
    if (_depthTexture && _depthWidth == width && _depthHeight == height) {
        return Ok();
    }
    if (_depthView) {
        wgpuTextureViewRelease(_depthView);
        _depthView = nullptr;
    }
    _allocator->releaseTexture(_depthTexture);
    _depthTexture = nullptr;

    WGPUTextureDescriptor texDesc = {};
    texDesc.label = WGPU_STR("depth");
    texDesc.size = {width, height, 1};
    texDesc.mipLevelCount = 1;
    texDesc.sampleCount = 1;
    texDesc.dimension = WGPUTextureDimension_2D;
    texDesc.format = kDepthFormat;
    texDesc.usage = WGPUTextureUsage_RenderAttachment;
    _depthTexture = _allocator->createTexture(texDesc);
    if (!_depthTexture) {
        return Err<void>("FrameCompositor: failed to create depth texture");
    }
    _depthView = wgpuTextureCreateView(_depthTexture, nullptr);
    if (!_depthView) {
        return Err<void>("FrameCompositor: failed to create depth view");
    }
    _depthWidth = width;
    _depthHeight = height;
    return Ok();
}

Result<void> FrameCompositor::recover() {
    ++_recoveries;
    ywarn("FrameCompositor: device lost, rebuilding GPU resources (recovery #{})", _recoveries);

    releaseResources();
    if (auto res = _ctx->recreateDevice(); !res) {
        return Err<void>("FrameCompositor: no device to recover onto", res);
    }
    if (auto res = createResources(); !res) {
        return Err<void>("FrameCompositor: failed to rebuild resources", res);
    }
    yinfo("FrameCompositor: recovered on device generation {}", _ctx->deviceGeneration());
    return Ok();
}

//=============================================================================
// Atlas / target
//=============================================================================

Result<void> FrameCompositor::uploadAtlas(const AtlasImage& image) {
    if (image.empty()) {
        return Err<void>("FrameCompositor: empty atlas image");
    }
    _atlasImage = image;
    if (!resourcesValid()) {
        return Err<void>("FrameCompositor: no GPU resources for the atlas upload");
    }

    if (_atlas && _atlas->width() == image.width && _atlas->height() == image.height) {
        return _atlas->update(_ctx->getQueue(), image);
    }

    auto atlas = GlyphAtlas::create(*_allocator, _ctx->getDevice(), _ctx->getQueue(),
                                    _glyphPipeline->atlasLayout(), image);
    if (!atlas) {
        return Err<void>("FrameCompositor: atlas upload failed", atlas);
    }
    _atlas = std::move(*atlas);
    _glyphPipeline->setAtlasBindGroup(_atlas->bindGroup());
    return Ok();
}

void FrameCompositor::unbindAtlas() {
    if (_glyphPipeline) _glyphPipeline->setAtlasBindGroup(nullptr);
    _atlas.reset();
    _atlasImage.reset();
}

void FrameCompositor::resize(uint32_t width, uint32_t height) {
    if (width == 0 || height == 0 || !_ctx) return;

    if (!_ctx->headless()) {
        _ctx->resize(width, height);
        return;
    }
    if (width == _offscreenWidth && height == _offscreenHeight) return;
    if (!_allocator) {
        ywarn("FrameCompositor: offscreen resize to {}x{} without GPU resources", width, height);
        return;
    }

    _ctx->waitIdle();
    _offscreen.reset();
    auto target = RenderTarget::create(*_allocator, width, height);
    if (!target) {
        yerror("FrameCompositor: offscreen resize to {}x{} failed: {}", width, height, error_msg(target));
        return;
    }
    _offscreen = std::move(*target);
    _offscreenWidth = width;
    _offscreenHeight = height;
}

uint32_t FrameCompositor::targetWidth() const {
    return !_ctx || _ctx->headless() ? _offscreenWidth : _ctx->width();
}

uint32_t FrameCompositor::targetHeight() const {
    return !_ctx || _ctx->headless() ? _offscreenHeight : _ctx->height();
}

Result<std::vector<uint8_t>> FrameCompositor::readback() {
    if (!_offscreen) {
        return Err<std::vector<uint8_t>>("FrameCompositor: readback needs a headless context");
    }
    return _offscreen->readback(_ctx->getDevice(), _ctx->getQueue());
}

//=============================================================================
// Frame
//=============================================================================

InstanceBuffer* FrameCompositor::instancesFor(PipelineKind kind) {
    switch (kind) {
        case PipelineKind::Rect:   return _rectInstances.get();
        case PipelineKind::Glyph:  return _glyphInstances.get();
        case PipelineKind::Cursor: return _cursorInstances.get();
    }
    return nullptr;
}

InstancedPipeline* FrameCompositor::pipelineFor(PipelineKind kind) {
    switch (kind) {
        case PipelineKind::Rect:   return _rectPipeline.get();
        case PipelineKind::Glyph:  return _glyphPipeline.get();
        case PipelineKind::Cursor: return _cursorPipeline.get();
    }
    return nullptr;
}

FrameStats FrameCompositor::droppedStats(uint64_t frameId) {
    ++_framesDropped;
    FrameStats stats;
    stats.frameId = frameId;
    stats.dropped = true;
    return stats;
}

void FrameCompositor::waitForSlot(uint32_t slot) {
    while (!_slotIdle[slot] && !_ctx->deviceLost()) {
        WGPU_DEVICE_TICK(_ctx->getDevice());
    }
}

void FrameCompositor::fenceSlot(uint32_t slot) {
    _slotIdle[slot] = false;

    WGPUQueueWorkDoneCallbackInfo cbInfo = {};
    cbInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    cbInfo.callback = [](WGPUQueueWorkDoneStatus, WGPUStringView, void* ud1, void*) {
        *static_cast<std::atomic<bool>*>(ud1) = true;
    };
    cbInfo.userdata1 = &_slotIdle[slot];
    wgpuQueueOnSubmittedWorkDone(_ctx->getQueue(), cbInfo);
}

Result<void> FrameCompositor::upload(uint32_t slot) {
    WGPUQueue queue = _ctx->getQueue();

    // The one camera write of this frame; every draw below reads it
    const CameraUniform& camera = _batch.camera();
    wgpuQueueWriteBuffer(queue, _cameraBuffer, 0, &camera, sizeof(CameraUniform));

    for (const DrawCall& draw : _batch.drawList()) {
        InstanceBuffer* buffer = instancesFor(draw.pipeline);
        const void* data = nullptr;
        switch (draw.pipeline) {
            case PipelineKind::Rect:   data = _batch.rects().data(); break;
            case PipelineKind::Glyph:  data = _batch.glyphs().data(); break;
            case PipelineKind::Cursor: data = _batch.cursors().data(); break;
        }
        if (auto res = buffer->write(queue, slot, data, draw.instanceCount); !res) {
            return Err<void>("FrameCompositor: " + std::string(pipelineName(draw.pipeline)) +
                             " upload failed", res);
        }
    }
    return Ok();
}

Result<void> FrameCompositor::encode(WGPUTextureView target, uint32_t slot) {
    WGPUCommandEncoderDescriptor encoderDesc = {};
    encoderDesc.label = WGPU_STR("frame");
    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(_ctx->getDevice(), &encoderDesc);
    if (!encoder) {
        return Err<void>("FrameCompositor: failed to create command encoder");
    }

    const glm::vec4& clear = _options.clearColor;
    WGPURenderPassColorAttachment colorAttachment = {};
    colorAttachment.view = target;
    colorAttachment.loadOp = WGPULoadOp_Clear;
    colorAttachment.storeOp = WGPUStoreOp_Store;
    colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
    WGPU_COLOR_ATTACHMENT_CLEAR(colorAttachment, clear.r, clear.g, clear.b, clear.a);

    WGPURenderPassDepthStencilAttachment depthAttachment = {};
    depthAttachment.view = _depthView;
    depthAttachment.depthLoadOp = WGPULoadOp_Clear;
    depthAttachment.depthStoreOp = WGPUStoreOp_Discard;
    depthAttachment.depthClearValue = 1.0f;
    depthAttachment.depthReadOnly = false;

    WGPURenderPassDescriptor passDesc = {};
    passDesc.colorAttachmentCount = 1;
    passDesc.colorAttachments = &colorAttachment;
    passDesc.depthStencilAttachment = &depthAttachment;

    WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &passDesc);
    if (!pass) {
        wgpuCommandEncoderRelease(encoder);
        return Err<void>("FrameCompositor: failed to begin render pass");
    }

    if (!_batch.drawList().empty()) {
        wgpuRenderPassEncoderSetBindGroup(pass, 0, _cameraGroup, 0, nullptr);
        wgpuRenderPassEncoderSetVertexBuffer(pass, 0, _quadVertices, 0, sizeof(kQuadVertices));
        wgpuRenderPassEncoderSetIndexBuffer(pass, _quadIndices, WGPUIndexFormat_Uint16, 0,
                                            sizeof(kQuadIndices));
        for (const DrawCall& draw : _batch.drawList()) {
            pipelineFor(draw.pipeline)->encode(pass, instancesFor(draw.pipeline)->buffer(slot),
                                               draw.instanceCount);
        }
    }

    wgpuRenderPassEncoderEnd(pass);
    wgpuRenderPassEncoderRelease(pass);

    WGPUCommandBufferDescriptor cmdDesc = {};
    WGPUCommandBuffer cmdBuffer = wgpuCommandEncoderFinish(encoder, &cmdDesc);
    wgpuCommandEncoderRelease(encoder);
    if (!cmdBuffer) {
        return Err<void>("FrameCompositor: failed to finish command encoder");
    }

    wgpuQueueSubmit(_ctx->getQueue(), 1, &cmdBuffer);
    wgpuCommandBufferRelease(cmdBuffer);
    return Ok();
}

Result<FrameStats> FrameCompositor::render(const FrameSnapshot& snapshot) {
    if (!resourcesValid()) {
        if (!_ctx) {
            return Err<FrameStats>("FrameCompositor: no GPU resources to render with");
        }
        if (auto res = recover(); !res) {
            return Err<FrameStats>("FrameCompositor: device recovery failed", res);
        }
        FrameStats stats = droppedStats(snapshot.frameId);
        stats.recovered = true;
        return Ok(stats);
    }

    if (_ctx->deviceLost()) {
        if (auto res = recover(); !res) {
            return Err<FrameStats>("FrameCompositor: device recovery failed", res);
        }
        FrameStats stats = droppedStats(snapshot.frameId);
        stats.recovered = true;
        return Ok(stats);
    }

    const uint32_t width = targetWidth();
    const uint32_t height = targetHeight();
    if (auto res = validateProjection(snapshot, width, height); !res) {
        ywarn("FrameCompositor: dropping frame: {}", error_msg(res));
        return Ok(droppedStats(snapshot.frameId));
    }

    BatchOptions options;
    options.sortRectsByZ = _options.sortRectsByZ;
    options.atlasBound = atlasBound();
    _batch.assemble(snapshot, options);

    WGPUTextureView target = nullptr;
    if (_offscreen) {
        target = _offscreen->view();
    } else {
        auto view = _ctx->getCurrentTextureView();
        if (!view) {
            ywarn("FrameCompositor: no surface texture for frame {}: {}",
                  snapshot.frameId, error_msg(view));
            return Ok(droppedStats(snapshot.frameId));
        }
        target = *view;
    }

    if (auto res = ensureDepth(width, height); !res) {
        return Err<FrameStats>("FrameCompositor: depth target", res);
    }

    const uint32_t slot = _slot;
    waitForSlot(slot);

    if (auto res = upload(slot); !res) {
        return Err<FrameStats>("FrameCompositor: upload failed", res);
    }
    if (auto res = encode(target, slot); !res) {
        return Err<FrameStats>("FrameCompositor: encode failed", res);
    }
    fenceSlot(slot);
    _slot = (slot + 1) % InstanceBuffer::kSlots;
    ++_framesSubmitted;

    if (!_offscreen) {
        _ctx->present();
    }

    FrameStats stats = _batch.stats();
    ytrace("FrameCompositor: frame {} drew {} rects, {} glyphs, {} cursors in {} calls",
           stats.frameId, stats.rects, stats.glyphs, stats.cursors, stats.drawCalls);
    return Ok(stats);
}

} // namespace vellum
