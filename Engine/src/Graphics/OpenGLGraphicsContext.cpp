#include "OpenGLGraphicsContext.hpp"
#include "VertexBuffer.hpp"
#include "Utils/Log.hpp"
#include <glad/glad.h>
#include <SDL.h>

namespace vu
{

namespace
{
    GLenum toGL(ShaderStage stage)
    {
        return stage == ShaderStage::Vertex ? GL_VERTEX_SHADER : GL_FRAGMENT_SHADER;
    }

    GLenum toGL(UsageHint usage)
    {
        return usage == UsageHint::Dynamic ? GL_DYNAMIC_DRAW : GL_STATIC_DRAW;
    }

    GLenum toGL(DrawMode mode)
    {
        switch (mode)
        {
        case DrawMode::Points: return GL_POINTS;
        case DrawMode::Lines: return GL_LINES;
        default: return GL_TRIANGLES;
        }
    }

    void setCapability(GLenum capability, bool enabled)
    {
        if (enabled)
        {
            glEnable(capability);
        }
        else
        {
            glDisable(capability);
        }
    }

    const void* indexOffset(int firstIndex)
    {
        return reinterpret_cast<const void*>(static_cast<uintptr_t>(firstIndex) * sizeof(GLushort));
    }
}

OpenGLGraphicsContext::OpenGLGraphicsContext()
    : gl_context(nullptr), owns_context(false), active_unit(0)
{
}

OpenGLGraphicsContext::~OpenGLGraphicsContext()
{
    shutdown();
}

bool OpenGLGraphicsContext::initialize(WindowHandle window)
{
    if (window && !createOpenGLContext(window))
    {
        VU_LOG_ERROR("Failed to create OpenGL context");
        return false;
    }

    // Load all OpenGL function pointers with GLAD
    if (!gladLoadGL())
    {
        VU_LOG_ERROR("Failed to load OpenGL functions with GLAD");
        destroyOpenGLContext();
        return false;
    }

    VU_LOG_INFO("OpenGL Version: {}", reinterpret_cast<const char*>(glGetString(GL_VERSION)));
    VU_LOG_INFO("OpenGL Renderer: {}", reinterpret_cast<const char*>(glGetString(GL_RENDERER)));
    VU_LOG_INFO("GLSL Version: {}", getShadingLanguageVersion());
    return true;
}

bool OpenGLGraphicsContext::createOpenGLContext(WindowHandle window)
{
    // SDL_GL attributes are set by the application before the window is created
    gl_context = SDL_GL_CreateContext(window);
    if (!gl_context)
    {
        VU_LOG_ERROR("Failed to create OpenGL context: {}", SDL_GetError());
        return false;
    }

    if (SDL_GL_MakeCurrent(window, gl_context) != 0)
    {
        VU_LOG_ERROR("Failed to make OpenGL context current: {}", SDL_GetError());
        SDL_GL_DeleteContext(gl_context);
        gl_context = nullptr;
        return false;
    }
    owns_context = true;
    return true;
}

void OpenGLGraphicsContext::destroyOpenGLContext()
{
    if (gl_context && owns_context)
    {
        SDL_GL_DeleteContext(gl_context);
    }
    gl_context = nullptr;
    owns_context = false;
}

void OpenGLGraphicsContext::shutdown()
{
    destroyOpenGLContext();
}

std::string OpenGLGraphicsContext::getShadingLanguageVersion()
{
    const GLubyte* version = glGetString(GL_SHADING_LANGUAGE_VERSION);
    return version ? std::string(reinterpret_cast<const char*>(version)) : std::string();
}

GpuError OpenGLGraphicsContext::getError()
{
    return static_cast<GpuError>(glGetError());
}

GpuHandle OpenGLGraphicsContext::createShader(ShaderStage stage)
{
    return glCreateShader(toGL(stage));
}

void OpenGLGraphicsContext::shaderSource(GpuHandle shader, const std::vector<std::string>& fragments)
{
    std::vector<const GLchar*> lines;
    lines.reserve(fragments.size());
    for (const std::string& fragment : fragments)
    {
        lines.push_back(fragment.c_str());
    }
    glShaderSource(shader, static_cast<GLsizei>(lines.size()), lines.data(), nullptr);
}

void OpenGLGraphicsContext::compileShader(GpuHandle shader)
{
    glCompileShader(shader);
}

int OpenGLGraphicsContext::getShaderParameter(GpuHandle shader, ShaderParameter param)
{
    GLint value = 0;
    glGetShaderiv(shader, param == ShaderParameter::CompileStatus ? GL_COMPILE_STATUS : GL_INFO_LOG_LENGTH, &value);
    return value;
}

std::string OpenGLGraphicsContext::getShaderInfoLog(GpuHandle shader, int maxLength)
{
    if (maxLength <= 0)
    {
        return "";
    }
    std::string log(static_cast<size_t>(maxLength), '\0');
    GLsizei written = 0;
    glGetShaderInfoLog(shader, maxLength, &written, &log[0]);
    log.resize(static_cast<size_t>(written));
    return log;
}

void OpenGLGraphicsContext::deleteShader(GpuHandle shader)
{
    glDeleteShader(shader);
}

GpuHandle OpenGLGraphicsContext::createProgram()
{
    return glCreateProgram();
}

void OpenGLGraphicsContext::attachShader(GpuHandle program, GpuHandle shader)
{
    glAttachShader(program, shader);
}

void OpenGLGraphicsContext::detachShader(GpuHandle program, GpuHandle shader)
{
    glDetachShader(program, shader);
}

void OpenGLGraphicsContext::linkProgram(GpuHandle program)
{
    glLinkProgram(program);
}

int OpenGLGraphicsContext::getProgramParameter(GpuHandle program, ProgramParameter param)
{
    GLenum pname = GL_LINK_STATUS;
    switch (param)
    {
    case ProgramParameter::LinkStatus: pname = GL_LINK_STATUS; break;
    case ProgramParameter::InfoLogLength: pname = GL_INFO_LOG_LENGTH; break;
    case ProgramParameter::ActiveUniforms: pname = GL_ACTIVE_UNIFORMS; break;
    case ProgramParameter::ActiveUniformMaxLength: pname = GL_ACTIVE_UNIFORM_MAX_LENGTH; break;
    case ProgramParameter::ActiveAttributes: pname = GL_ACTIVE_ATTRIBUTES; break;
    case ProgramParameter::ActiveAttributeMaxLength: pname = GL_ACTIVE_ATTRIBUTE_MAX_LENGTH; break;
    }
    GLint value = 0;
    glGetProgramiv(program, pname, &value);
    return value;
}

std::string OpenGLGraphicsContext::getProgramInfoLog(GpuHandle program, int maxLength)
{
    if (maxLength <= 0)
    {
        return "";
    }
    std::string log(static_cast<size_t>(maxLength), '\0');
    GLsizei written = 0;
    glGetProgramInfoLog(program, maxLength, &written, &log[0]);
    log.resize(static_cast<size_t>(written));
    return log;
}

void OpenGLGraphicsContext::deleteProgram(GpuHandle program)
{
    glDeleteProgram(program);
}

void OpenGLGraphicsContext::useProgram(GpuHandle program)
{
    glUseProgram(program);
}

ActiveVariable OpenGLGraphicsContext::getActiveUniform(GpuHandle program, uint32_t index, int bufSize)
{
    ActiveVariable var;
    if (bufSize <= 0)
    {
        return var;
    }
    std::string name(static_cast<size_t>(bufSize), '\0');
    GLsizei written = 0;
    GLint size = 0;
    GLenum type = 0;
    glGetActiveUniform(program, index, bufSize, &written, &size, &type, &name[0]);
    name.resize(static_cast<size_t>(written));
    var.name = name;
    var.written = written;
    var.size = size;
    var.type = type;
    return var;
}

ActiveVariable OpenGLGraphicsContext::getActiveAttrib(GpuHandle program, uint32_t index, int bufSize)
{
    ActiveVariable var;
    if (bufSize <= 0)
    {
        return var;
    }
    std::string name(static_cast<size_t>(bufSize), '\0');
    GLsizei written = 0;
    GLint size = 0;
    GLenum type = 0;
    glGetActiveAttrib(program, index, bufSize, &written, &size, &type, &name[0]);
    name.resize(static_cast<size_t>(written));
    var.name = name;
    var.written = written;
    var.size = size;
    var.type = type;
    return var;
}

int OpenGLGraphicsContext::getUniformLocation(GpuHandle program, const std::string& name)
{
    return glGetUniformLocation(program, name.c_str());
}

int OpenGLGraphicsContext::getAttribLocation(GpuHandle program, const std::string& name)
{
    return glGetAttribLocation(program, name.c_str());
}

GpuHandle OpenGLGraphicsContext::createVertexArray()
{
    GLuint vao = 0;
    glGenVertexArrays(1, &vao);
    return vao;
}

void OpenGLGraphicsContext::bindVertexArray(GpuHandle vao)
{
    glBindVertexArray(vao);
}

void OpenGLGraphicsContext::deleteVertexArray(GpuHandle vao)
{
    glDeleteVertexArrays(1, &vao);
}

GpuHandle OpenGLGraphicsContext::createBuffer()
{
    GLuint buffer = 0;
    glGenBuffers(1, &buffer);
    return buffer;
}

void OpenGLGraphicsContext::deleteBuffer(GpuHandle buffer)
{
    glDeleteBuffers(1, &buffer);
}

void OpenGLGraphicsContext::uploadVertexBuffer(const VertexBuffer& buffer)
{
    glBindBuffer(GL_ARRAY_BUFFER, buffer.getHandle());
    const GLuint slot = buffer.getSlot();
    const GLenum usage = toGL(buffer.getUsage());
    if (const std::vector<float>* floats = buffer.getFloats())
    {
        if (buffer.getUsage() == UsageHint::Dynamic)
        {
            // Buffer orphaning: reallocate then fill, so the driver need not wait on the old data
            glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(buffer.getCapacityBytes()), nullptr, usage);
            glBufferSubData(GL_ARRAY_BUFFER, 0, static_cast<GLsizeiptr>(buffer.getByteSize()), floats->data());
        }
        else
        {
            glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(buffer.getByteSize()), floats->data(), usage);
        }
        glVertexAttribPointer(slot, buffer.getSpan(), GL_FLOAT, GL_FALSE, 0, nullptr);
    }
    else if (const std::vector<uint8_t>* bytes = buffer.getBytes())
    {
        glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(bytes->size()), bytes->data(), usage);
        glVertexAttribPointer(slot, buffer.getSpan(), GL_UNSIGNED_BYTE, buffer.isNormalized() ? GL_TRUE : GL_FALSE, 0, nullptr);
    }
    glEnableVertexAttribArray(slot);
}

void OpenGLGraphicsContext::uploadIndexBuffer(const IndexBuffer& buffer)
{
    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, buffer.getHandle());
    glBufferData(GL_ELEMENT_ARRAY_BUFFER, static_cast<GLsizeiptr>(buffer.getByteSize()),
                 buffer.getIndices().data(), toGL(buffer.getUsage()));
}

GpuHandle OpenGLGraphicsContext::createTexture()
{
    GLuint texture = 0;
    glGenTextures(1, &texture);
    return texture;
}

void OpenGLGraphicsContext::uploadTexture(GpuHandle texture, int width, int height, const std::vector<uint8_t>& rgba)
{
    glBindTexture(GL_TEXTURE_2D, texture);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, width, height, 0, GL_RGBA, GL_UNSIGNED_BYTE, rgba.data());
    glGenerateMipmap(GL_TEXTURE_2D);
}

void OpenGLGraphicsContext::updateTextureMode(GpuHandle texture, bool repeat)
{
    glBindTexture(GL_TEXTURE_2D, texture);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAX_LEVEL, 7);
    const GLint wrap = repeat ? GL_REPEAT : GL_CLAMP_TO_EDGE;
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, wrap);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, wrap);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST_MIPMAP_LINEAR);
}

void OpenGLGraphicsContext::deleteTexture(GpuHandle texture)
{
    glDeleteTextures(1, &texture);
}

void OpenGLGraphicsContext::bindTexture(GpuHandle texture)
{
    glBindTexture(GL_TEXTURE_2D, texture);
}

void OpenGLGraphicsContext::useTexture(int sampler, int unit, GpuHandle texture)
{
    glUniform1i(sampler, unit);
    glActiveTexture(GL_TEXTURE0 + static_cast<GLenum>(unit));
    glBindTexture(GL_TEXTURE_2D, texture);
    active_unit = unit;
}

void OpenGLGraphicsContext::bindUniform(int location, UniformType type, int count, const float* data)
{
    switch (type)
    {
    case UniformType::Int1:
        glUniform1i(location, static_cast<GLint>(data[0]));
        break;
    case UniformType::Float1:
        glUniform1fv(location, count, data);
        break;
    case UniformType::Float2:
        glUniform2fv(location, count, data);
        break;
    case UniformType::Float3:
        glUniform3fv(location, count, data);
        break;
    case UniformType::Float4:
        glUniform4fv(location, count, data);
        break;
    case UniformType::Mat3:
        glUniformMatrix3fv(location, count, GL_FALSE, data);
        break;
    case UniformType::Mat3x4:
        glUniformMatrix3x4fv(location, count, GL_FALSE, data);
        break;
    case UniformType::Mat4:
        glUniformMatrix4fv(location, count, GL_FALSE, data);
        break;
    }
}

void OpenGLGraphicsContext::bindUniform(int location, int value)
{
    glUniform1i(location, value);
}

void OpenGLGraphicsContext::setClearColor(const glm::vec4& color)
{
    glClearColor(color.r, color.g, color.b, color.a);
}

void OpenGLGraphicsContext::clear()
{
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
}

void OpenGLGraphicsContext::setViewport(int width, int height)
{
    glViewport(0, 0, width, height);
}

void OpenGLGraphicsContext::setDepthTest(bool enabled)
{
    setCapability(GL_DEPTH_TEST, enabled);
}

void OpenGLGraphicsContext::setCullFace(bool enabled)
{
    setCapability(GL_CULL_FACE, enabled);
}

void OpenGLGraphicsContext::setBlend(bool enabled)
{
    setCapability(GL_BLEND, enabled);
    if (enabled)
    {
        // Colour data is not pre-multiplied
        glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
    }
}

void OpenGLGraphicsContext::setProgramPointSize(bool enabled)
{
    setCapability(GL_PROGRAM_POINT_SIZE, enabled);
}

void OpenGLGraphicsContext::setLineMode(bool enabled)
{
    glPolygonMode(GL_FRONT_AND_BACK, enabled ? GL_LINE : GL_FILL);
}

void OpenGLGraphicsContext::drawElements(DrawMode mode, int count, int firstIndex)
{
    glDrawElements(toGL(mode), count, GL_UNSIGNED_SHORT, indexOffset(firstIndex));
}

void OpenGLGraphicsContext::drawArrays(DrawMode mode, int first, int count)
{
    glDrawArrays(toGL(mode), first, count);
}

}
