#pragma once

#include "Graphics/GpuResource.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace vu
{

// Shading language version reported by OpenGL ES 3 drivers.
extern const char* const GLSL_ES_300;

// Prefix shader source with the #version line (and default precision for ES)
// matching the driver's shading language version.
std::vector<std::string> addVersionPreamble(const std::vector<std::string>& source, const std::string& glsl_version);

// A vertex and fragment shader linked into one GPU program. After a
// successful bind the active uniforms and attributes are known by name.
class ShaderProgram : public GpuResource
{
private:
    std::vector<std::string> vertex_source;
    std::vector<std::string> fragment_source;
    GpuHandle program_id;
    std::unordered_map<std::string, int> uniforms;
    std::unordered_map<std::string, int> attributes;

    void ensureNewLines();
    std::string getVersion(IGraphicsContext& ctx) const;
    std::optional<RenderError> compileShader(IGraphicsContext& ctx, ShaderStage stage, GpuHandle shader_id,
                                             const std::vector<std::string>& source);
    std::optional<RenderError> linkProgram(IGraphicsContext& ctx, GpuHandle program);
    void loadUniforms(IGraphicsContext& ctx);
    void loadAttributes(IGraphicsContext& ctx);

public:
    explicit ShaderProgram(const std::string& name);
    ~ShaderProgram() override;

    // Each entry is one line of source; lines are trimmed and newline terminated.
    void setSource(const std::vector<std::string>& vertex_src, const std::vector<std::string>& fragment_src);
    const std::vector<std::string>& getVertexSource() const { return vertex_source; }
    const std::vector<std::string>& getFragmentSource() const { return fragment_source; }

    GpuHandle getProgramID() const { return program_id; }

    // Active uniform names (array subscripts removed) to locations
    const std::unordered_map<std::string, int>& getUniforms() const { return uniforms; }

    // Active vertex attribute names to layout locations
    const std::unordered_map<std::string, int>& getAttributes() const { return attributes; }

    int getUniformLocation(const std::string& uniform) const;
    int getAttributeLocation(const std::string& attribute) const;

    // Compile, link and introspect. On failure no program is left and the
    // error carries the driver log.
    std::optional<RenderError> bind(IGraphicsContext& ctx) override;
    void releaseGpu(IGraphicsContext& ctx) override;
    bool isBound() const override { return program_id != INVALID_HANDLE; }
};

}
