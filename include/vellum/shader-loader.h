#pragma once

#include <vellum/result.hpp>
#include <webgpu/webgpu.h>
#include <map>
#include <string>

namespace vellum {

//-----------------------------------------------------------------------------
// ShaderLoader - reads WGSL sources from the shader directory and compiles
// them into modules for a device.
//
// Sources are read once and kept, so modules can be rebuilt on a new
// device without touching the filesystem again.
//-----------------------------------------------------------------------------
class ShaderLoader {
public:
    // Empty dir means the directory baked in at build time
    explicit ShaderLoader(std::string shaderDir = "");

    const std::string& directory() const { return _dir; }

    Result<std::string> source(const std::string& name);

    // Caller owns the returned module
    Result<WGPUShaderModule> compile(WGPUDevice device, const std::string& name);

    static std::string defaultDirectory();

private:
    std::string _dir;
    std::map<std::string, std::string> _sources;
};

} // namespace vellum
