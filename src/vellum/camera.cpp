#include <vellum/camera.h>
#include <algorithm>

namespace vellum {

CameraUniform CameraUniform::orthographic(float width, float height,
                                          float panX, float panY, float zoom) {
    const float sx = 2.0f * zoom / width;
    const float sy = -2.0f * zoom / height;
    const float tx = -panX * sx - 1.0f;
    const float ty = -panY * sy + 1.0f;
    const float sz = -1.0f / kDepthRange;
    const float tz = 1.0f - 1.0f / kDepthRange;

    CameraUniform u;
    u.viewProj = glm::mat4(
        glm::vec4(sx, 0.0f, 0.0f, 0.0f),
        glm::vec4(0.0f, sy, 0.0f, 0.0f),
        glm::vec4(0.0f, 0.0f, sz, 0.0f),
        glm::vec4(tx, ty, tz, 1.0f));
    return u;
}

CameraUniform CameraUniform::identity(float width, float height) {
    return orthographic(width, height, 0.0f, 0.0f, 1.0f);
}

Camera::Camera(uint32_t width, uint32_t height)
    : _width(std::max(width, 1u))
    , _height(std::max(height, 1u)) {}

void Camera::resize(uint32_t width, uint32_t height) {
    if (width == 0 || height == 0) return;
    _width = width;
    _height = height;
}

void Camera::panBy(float dx, float dy) {
    _pan.x -= dx / _zoom;
    _pan.y -= dy / _zoom;
}

void Camera::zoomAt(float screenX, float screenY, float factor) {
    glm::vec2 anchor = screenToWorld(screenX, screenY);
    setZoom(_zoom * factor);
    _pan = anchor - glm::vec2(screenX, screenY) / _zoom;
}

void Camera::setZoom(float zoom) {
    _zoom = std::clamp(zoom, kMinZoom, kMaxZoom);
}

glm::vec2 Camera::screenToWorld(float screenX, float screenY) const {
    return _pan + glm::vec2(screenX, screenY) / _zoom;
}

glm::vec2 Camera::worldToScreen(glm::vec2 world) const {
    return (world - _pan) * _zoom;
}

CameraUniform Camera::uniform() const {
    return CameraUniform::orthographic(static_cast<float>(_width),
                                       static_cast<float>(_height),
                                       _pan.x, _pan.y, _zoom);
}

} // namespace vellum
