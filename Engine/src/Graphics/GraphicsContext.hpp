#pragma once

#include "Graphics/RenderTypes.hpp"
#include <glm/glm.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace vu
{

class VertexBuffer;
class IndexBuffer;

// One entry of a program's active uniform or attribute list.
struct ActiveVariable
{
    std::string name;
    int written = 0;   // characters written to name
    int size = 0;      // array length, 1 for non-arrays
    uint32_t type = 0; // driver type enum
};

// The GPU call layer. Constructed once per render surface and passed to every
// component that issues GPU calls. All calls must happen on the thread that
// owns the context.
class IGraphicsContext
{
public:
    virtual ~IGraphicsContext() = default;

    // Initialization and cleanup
    virtual bool initialize(WindowHandle window) = 0;
    virtual void shutdown() = 0;
    virtual const char* getAPIName() const = 0;
    virtual std::string getShadingLanguageVersion() = 0;

    // Returns and clears the oldest pending driver error
    virtual GpuError getError() = 0;

    // Shader objects
    virtual GpuHandle createShader(ShaderStage stage) = 0;
    virtual void shaderSource(GpuHandle shader, const std::vector<std::string>& fragments) = 0;
    virtual void compileShader(GpuHandle shader) = 0;
    virtual int getShaderParameter(GpuHandle shader, ShaderParameter param) = 0;
    virtual std::string getShaderInfoLog(GpuHandle shader, int maxLength) = 0;
    virtual void deleteShader(GpuHandle shader) = 0;

    // Program objects
    virtual GpuHandle createProgram() = 0;
    virtual void attachShader(GpuHandle program, GpuHandle shader) = 0;
    virtual void detachShader(GpuHandle program, GpuHandle shader) = 0;
    virtual void linkProgram(GpuHandle program) = 0;
    virtual int getProgramParameter(GpuHandle program, ProgramParameter param) = 0;
    virtual std::string getProgramInfoLog(GpuHandle program, int maxLength) = 0;
    virtual void deleteProgram(GpuHandle program) = 0;
    virtual void useProgram(GpuHandle program) = 0;

    // Program introspection
    virtual ActiveVariable getActiveUniform(GpuHandle program, uint32_t index, int bufSize) = 0;
    virtual ActiveVariable getActiveAttrib(GpuHandle program, uint32_t index, int bufSize) = 0;
    virtual int getUniformLocation(GpuHandle program, const std::string& name) = 0;
    virtual int getAttribLocation(GpuHandle program, const std::string& name) = 0;

    // Vertex data
    virtual GpuHandle createVertexArray() = 0;
    virtual void bindVertexArray(GpuHandle vao) = 0;
    virtual void deleteVertexArray(GpuHandle vao) = 0;
    virtual GpuHandle createBuffer() = 0;
    virtual void deleteBuffer(GpuHandle buffer) = 0;

    // Uploads to the buffer's GPU handle and sets up its attribute slot on the bound vertex array
    virtual void uploadVertexBuffer(const VertexBuffer& buffer) = 0;
    virtual void uploadIndexBuffer(const IndexBuffer& buffer) = 0;

    // Textures (RGBA8 images)
    virtual GpuHandle createTexture() = 0;
    virtual void uploadTexture(GpuHandle texture, int width, int height, const std::vector<uint8_t>& rgba) = 0;
    virtual void updateTextureMode(GpuHandle texture, bool repeat) = 0;
    virtual void deleteTexture(GpuHandle texture) = 0;
    virtual void bindTexture(GpuHandle texture) = 0;
    virtual void useTexture(int sampler, int unit, GpuHandle texture) = 0;

    // Uniforms on the program in use
    virtual void bindUniform(int location, UniformType type, int count, const float* data) = 0;
    virtual void bindUniform(int location, int value) = 0;

    // Frame and draw state
    virtual void setClearColor(const glm::vec4& color) = 0;
    virtual void clear() = 0;
    virtual void setViewport(int width, int height) = 0;
    virtual void setDepthTest(bool enabled) = 0;
    virtual void setCullFace(bool enabled) = 0;
    virtual void setBlend(bool enabled) = 0;
    virtual void setProgramPointSize(bool enabled) = 0;
    virtual void setLineMode(bool enabled) = 0;

    // Draws from the bound vertex array; elements use 16-bit indices
    virtual void drawElements(DrawMode mode, int count, int firstIndex) = 0;
    virtual void drawArrays(DrawMode mode, int first, int count) = 0;
};

enum class GraphicsContextType
{
    OpenGL,
    Headless
};

// Factory function to create graphics contexts
std::unique_ptr<IGraphicsContext> CreateGraphicsContext(GraphicsContextType type);

}
