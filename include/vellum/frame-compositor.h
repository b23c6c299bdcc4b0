#pragma once

#include <vellum/atlas-image.h>
#include <vellum/frame-batch.h>
#include <vellum/frame-snapshot.h>
#include <vellum/glyph-atlas.h>
#include <vellum/gpu-allocator.h>
#include <vellum/instance-buffer.h>
#include <vellum/pipelines.h>
#include <vellum/render-target.h>
#include <vellum/result.hpp>
#include <vellum/shader-loader.h>
#include <vellum/webgpu-context.h>
#include <glm/glm.hpp>
#include <array>
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vellum {

struct CompositorOptions {
    glm::vec4 clearColor{0.12f, 0.12f, 0.13f, 1.0f};
    uint32_t initialCapacity = kMinInstanceCapacity;
    bool sortRectsByZ = true;
    std::string shaderDir;
    // Offscreen target size for headless contexts
    uint32_t width = 0;
    uint32_t height = 0;
};

//-----------------------------------------------------------------------------
// FrameCompositor - draws whole frame snapshots with the three instanced
// pipelines.
//
// Per frame: camera uniform written once, instance lists uploaded into this
// frame's buffer slot, one render pass with a draw per non-empty list in
// rect, glyph, cursor order. Windowed contexts render to the surface and
// present; headless contexts render to an offscreen target that can be read
// back.
//
// A lost device is noticed at the start of render(): that frame is dropped,
// every GPU resource is rebuilt on a fresh device (the atlas from its CPU
// copy) and rendering resumes with the next snapshot.
//-----------------------------------------------------------------------------
class FrameCompositor {
public:
    using Ptr = std::shared_ptr<FrameCompositor>;

    static constexpr WGPUTextureFormat kDepthFormat = WGPUTextureFormat_Depth32Float;

    static Result<Ptr> create(WebGPUContext::Ptr ctx, const CompositorOptions& options) noexcept;

    // No context and no GPU resources, the state a failed recovery leaves
    // behind. Every GPU operation on it must fail cleanly.
    static Result<Ptr> createForTest(const CompositorOptions& options) noexcept;

    ~FrameCompositor();

    FrameCompositor(const FrameCompositor&) = delete;
    FrameCompositor& operator=(const FrameCompositor&) = delete;

    // Ok with stats.dropped for frames that were not drawn; Err only when
    // device recovery or resource creation fails. Without valid resources
    // (a previous recovery failed) recovery is retried first.
    Result<FrameStats> render(const FrameSnapshot& snapshot);

    bool resourcesValid() const;

    void resize(uint32_t width, uint32_t height);
    uint32_t targetWidth() const;
    uint32_t targetHeight() const;

    // The CPU copy is kept even when the upload fails, so a later recovery
    // restores it
    Result<void> uploadAtlas(const AtlasImage& image);
    void unbindAtlas();
    bool atlasBound() const { return _atlas != nullptr; }

    // Headless only: pixels of the last rendered frame
    Result<std::vector<uint8_t>> readback();

    void setClearColor(glm::vec4 color) { _options.clearColor = color; }
    void setSortRectsByZ(bool sort) { _options.sortRectsByZ = sort; }

    uint64_t framesSubmitted() const { return _framesSubmitted; }
    uint64_t framesDropped() const { return _framesDropped; }
    uint32_t recoveries() const { return _recoveries; }
    const GpuAllocator* allocator() const { return _allocator.get(); }

private:
    FrameCompositor(WebGPUContext::Ptr ctx, const CompositorOptions& options);

    Result<void> init();
    Result<void> createResources();
    void releaseResources();
    Result<void> createCameraBinding();
    Result<void> createQuadBuffers();
    Result<void> createPipelines();
    Result<void> ensureDepth(uint32_t width, uint32_t height);
    Result<void> recover();

    void waitForSlot(uint32_t slot);
    void fenceSlot(uint32_t slot);

    Result<void> upload(uint32_t slot);
    Result<void> encode(WGPUTextureView target, uint32_t slot);

    InstanceBuffer* instancesFor(PipelineKind kind);
    InstancedPipeline* pipelineFor(PipelineKind kind);

    FrameStats droppedStats(uint64_t frameId);

    WebGPUContext::Ptr _ctx;
    CompositorOptions _options;
    ShaderLoader _shaders;
    std::unique_ptr<GpuAllocator> _allocator;

    WGPUBindGroupLayout _cameraLayout = nullptr;
    WGPUBuffer _cameraBuffer = nullptr;
    WGPUBindGroup _cameraGroup = nullptr;
    WGPUBuffer _quadVertices = nullptr;
    WGPUBuffer _quadIndices = nullptr;

    WGPUTexture _depthTexture = nullptr;
    WGPUTextureView _depthView = nullptr;
    uint32_t _depthWidth = 0;
    uint32_t _depthHeight = 0;

    InstancedPipeline::Ptr _rectPipeline;
    std::unique_ptr<GlyphPipeline> _glyphPipeline;
    InstancedPipeline::Ptr _cursorPipeline;

    std::unique_ptr<InstanceBuffer> _rectInstances;
    std::unique_ptr<InstanceBuffer> _glyphInstances;
    std::unique_ptr<InstanceBuffer> _cursorInstances;

    GlyphAtlas::Ptr _atlas;
    std::optional<AtlasImage> _atlasImage;

    RenderTarget::Ptr _offscreen;
    uint32_t _offscreenWidth = 0;
    uint32_t _offscreenHeight = 0;

    FrameBatch _batch;

    // Set by the queue work-done callback of the last submit using the slot
    std::array<std::atomic<bool>, InstanceBuffer::kSlots> _slotIdle;
    uint32_t _slot = 0;

    uint64_t _framesSubmitted = 0;
    uint64_t _framesDropped = 0;
    uint32_t _recoveries = 0;
};

} // namespace vellum
