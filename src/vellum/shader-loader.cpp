#include <vellum/shader-loader.h>
#include <vellum/wgpu-compat.h>
#include <ytrace/ytrace.hpp>
#include <fstream>
#include <sstream>

#ifndef VELLUM_SHADERS_DIR
#define VELLUM_SHADERS_DIR "src/vellum/shaders"
#endif

namespace vellum {

ShaderLoader::ShaderLoader(std::string shaderDir)
    : _dir(shaderDir.empty() ? defaultDirectory() : std::move(shaderDir)) {}

std::string ShaderLoader::defaultDirectory() {
    return VELLUM_SHADERS_DIR;
}

Result<std::string> ShaderLoader::source(const std::string& name) {
    if (auto it = _sources.find(name); it != _sources.end()) {
        return Ok(it->second);
    }

    std::string path = _dir + "/" + name;
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<std::string>("ShaderLoader: cannot open " + path);
    }
    std::stringstream ss;
    ss << file.rdbuf();
    std::string code = ss.str();
    if (code.empty()) {
        return Err<std::string>("ShaderLoader: empty shader " + path);
    }

    ydebug("ShaderLoader: loaded {} ({} bytes)", path, code.size());
    _sources[name] = code;
    return Ok(std::move(code));
}

Result<WGPUShaderModule> ShaderLoader::compile(WGPUDevice device, const std::string& name) {
    auto src = source(name);
    if (!src) {
        return Err<WGPUShaderModule>("ShaderLoader: no source for " + name, src);
    }
    const std::string& code = *src;

    WGPUShaderSourceWGSL wgslDesc = {};
    wgslDesc.chain.sType = WGPUSType_ShaderSourceWGSL;
    WGPU_SHADER_CODE(wgslDesc, code);

    WGPUShaderModuleDescriptor shaderDesc = {};
    shaderDesc.label = {.data = name.c_str(), .length = name.size()};
    shaderDesc.nextInChain = &wgslDesc.chain;

    WGPUShaderModule module = wgpuDeviceCreateShaderModule(device, &shaderDesc);
    if (!module) {
        yerror("ShaderLoader: failed to compile {} - dumping source:", name);
        std::istringstream iss(code);
        std::string line;
        int lineNum = 1;
        while (std::getline(iss, line)) {
            yerror("{:4d}: {}", lineNum++, line);
        }
        return Err<WGPUShaderModule>("Failed to compile shader module " + name);
    }
    return Ok(module);
}

} // namespace vellum
