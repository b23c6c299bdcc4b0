#pragma once

// Helpers for the WGPUStringView based webgpu.h (Dawn and wgpu-native v27).

#include <webgpu/webgpu.h>

#define WGPU_DEVICE_TICK(device) wgpuDeviceTick(device)

#define WGPU_STR(s) (WGPUStringView{.data = (s), .length = WGPU_STRLEN})

// Shader code: WGPUStringView
#define WGPU_SHADER_CODE(desc, src)                                            \
  (desc).code = {.data = (src).c_str(), .length = (src).size()}

#define WGPU_COLOR_ATTACHMENT_CLEAR(attachment, r, g, b, a)                    \
  (attachment).clearValue = {(r), (g), (b), (a)}
