#pragma once

#include "GraphicsContext.hpp"

typedef void* SDL_GLContext;

namespace vu
{

// Graphics context backed by an SDL created OpenGL 3.3+ (or ES 3) context
// with functions loaded through glad.
class OpenGLGraphicsContext : public IGraphicsContext
{
private:
    SDL_GLContext gl_context;
    bool owns_context;
    int active_unit;

    bool createOpenGLContext(WindowHandle window);
    void destroyOpenGLContext();

public:
    OpenGLGraphicsContext();
    ~OpenGLGraphicsContext() override;

    // A null window uses the context already current on this thread.
    bool initialize(WindowHandle window) override;
    void shutdown() override;
    const char* getAPIName() const override { return "OpenGL"; }
    std::string getShadingLanguageVersion() override;
    GpuError getError() override;

    GpuHandle createShader(ShaderStage stage) override;
    void shaderSource(GpuHandle shader, const std::vector<std::string>& fragments) override;
    void compileShader(GpuHandle shader) override;
    int getShaderParameter(GpuHandle shader, ShaderParameter param) override;
    std::string getShaderInfoLog(GpuHandle shader, int maxLength) override;
    void deleteShader(GpuHandle shader) override;

    GpuHandle createProgram() override;
    void attachShader(GpuHandle program, GpuHandle shader) override;
    void detachShader(GpuHandle program, GpuHandle shader) override;
    void linkProgram(GpuHandle program) override;
    int getProgramParameter(GpuHandle program, ProgramParameter param) override;
    std::string getProgramInfoLog(GpuHandle program, int maxLength) override;
    void deleteProgram(GpuHandle program) override;
    void useProgram(GpuHandle program) override;

    ActiveVariable getActiveUniform(GpuHandle program, uint32_t index, int bufSize) override;
    ActiveVariable getActiveAttrib(GpuHandle program, uint32_t index, int bufSize) override;
    int getUniformLocation(GpuHandle program, const std::string& name) override;
    int getAttribLocation(GpuHandle program, const std::string& name) override;

    GpuHandle createVertexArray() override;
    void bindVertexArray(GpuHandle vao) override;
    void deleteVertexArray(GpuHandle vao) override;
    GpuHandle createBuffer() override;
    void deleteBuffer(GpuHandle buffer) override;
    void uploadVertexBuffer(const VertexBuffer& buffer) override;
    void uploadIndexBuffer(const IndexBuffer& buffer) override;

    GpuHandle createTexture() override;
    void uploadTexture(GpuHandle texture, int width, int height, const std::vector<uint8_t>& rgba) override;
    void updateTextureMode(GpuHandle texture, bool repeat) override;
    void deleteTexture(GpuHandle texture) override;
    void bindTexture(GpuHandle texture) override;
    void useTexture(int sampler, int unit, GpuHandle texture) override;

    void bindUniform(int location, UniformType type, int count, const float* data) override;
    void bindUniform(int location, int value) override;

    void setClearColor(const glm::vec4& color) override;
    void clear() override;
    void setViewport(int width, int height) override;
    void setDepthTest(bool enabled) override;
    void setCullFace(bool enabled) override;
    void setBlend(bool enabled) override;
    void setProgramPointSize(bool enabled) override;
    void setLineMode(bool enabled) override;
    void drawElements(DrawMode mode, int count, int firstIndex) override;
    void drawArrays(DrawMode mode, int first, int count) override;
};

}
