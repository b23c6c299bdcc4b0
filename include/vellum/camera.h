#pragma once

#include <glm/glm.hpp>
#include <cstdint>

namespace vellum {

// Canvas z_index values live in [0, kMaxCanvasZ]. Cursors sit above all
// canvas content, the UI overlay layer above cursors.
constexpr float kMaxCanvasZ = 65535.0f;
constexpr float kCursorZ = 65536.0f;
constexpr float kOverlayZ = 65537.0f;
constexpr float kDepthRange = 65538.0f;

//-----------------------------------------------------------------------------
// CameraUniform - the view-projection matrix bound at group 0 binding 0
//
// Column-major (matches WGSL mat4x4<f32>). World space is pixel-like with Y
// growing down. z maps to clip depth 1 - (z + 1) / kDepthRange, so a larger
// z lands closer to the viewer.
//-----------------------------------------------------------------------------
struct CameraUniform {
    glm::mat4 viewProj{1.0f};

    static CameraUniform orthographic(float width, float height,
                                      float panX, float panY, float zoom);

    // Pixel-space projection: no pan, zoom 1
    static CameraUniform identity(float width, float height);

    // Project a world point (x, y, z) to clip space
    glm::vec4 project(glm::vec2 world, float z) const {
        return viewProj * glm::vec4(world, z, 1.0f);
    }
};

static_assert(sizeof(CameraUniform) == 64, "CameraUniform must be a packed mat4");

//-----------------------------------------------------------------------------
// Camera - pan/zoom controller owning the viewport size
//-----------------------------------------------------------------------------
class Camera {
public:
    static constexpr float kMinZoom = 0.1f;
    static constexpr float kMaxZoom = 50.0f;

    Camera(uint32_t width, uint32_t height);

    // Zero sizes are ignored (minimized window)
    void resize(uint32_t width, uint32_t height);

    // Drag by a screen-space delta
    void panBy(float dx, float dy);

    // Scale by factor keeping the world point under (screenX, screenY) fixed
    void zoomAt(float screenX, float screenY, float factor);

    glm::vec2 screenToWorld(float screenX, float screenY) const;
    glm::vec2 worldToScreen(glm::vec2 world) const;

    void setPan(glm::vec2 pan) { _pan = pan; }
    void setZoom(float zoom);

    CameraUniform uniform() const;

    uint32_t width() const { return _width; }
    uint32_t height() const { return _height; }
    glm::vec2 pan() const { return _pan; }
    float zoom() const { return _zoom; }

private:
    uint32_t _width;
    uint32_t _height;
    glm::vec2 _pan{0.0f};
    float _zoom = 1.0f;
};

} // namespace vellum
