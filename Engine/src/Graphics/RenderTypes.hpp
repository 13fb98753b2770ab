#pragma once

#include <cstdint>
#include <string>

// Forward declaration for SDL
struct SDL_Window;

namespace vu
{

// Window handle - the OpenGL context is created for an SDL window
typedef SDL_Window* WindowHandle;

// GPU object name - 0 means "not bound"
typedef uint32_t GpuHandle;
const GpuHandle INVALID_HANDLE = 0;

// Driver error code - 0 means no error
typedef uint32_t GpuError;
const GpuError NO_GPU_ERROR = 0;

enum class ShaderStage
{
    Vertex,
    Fragment
};

enum class UsageHint
{
    Static,
    Dynamic
};

enum class DataKind
{
    Float,
    Byte
};

enum class DrawMode
{
    Triangles,
    Points,
    Lines
};

enum class UniformType
{
    Int1,
    Float1,
    Float2,
    Float3,
    Float4,
    Mat3,
    Mat3x4,
    Mat4
};

enum class ShaderParameter
{
    CompileStatus,
    InfoLogLength
};

enum class ProgramParameter
{
    LinkStatus,
    InfoLogLength,
    ActiveUniforms,
    ActiveUniformMaxLength,
    ActiveAttributes,
    ActiveAttributeMaxLength
};

enum class RenderErrorKind
{
    CompileError,
    LinkError,
    MissingUniform,
    MissingAttribute,
    InconsistentMesh,
    BindFailed,
    NoShader
};

// Returned (wrapped in std::optional) by operations that can fail.
struct RenderError
{
    RenderErrorKind kind = RenderErrorKind::BindFailed;
    std::string message;
    std::string resource;

    RenderError() = default;
    RenderError(RenderErrorKind k, const std::string& msg, const std::string& res = "")
        : kind(k), message(msg), resource(res) {}
};

inline const char* renderErrorKindToString(RenderErrorKind kind)
{
    switch (kind)
    {
    case RenderErrorKind::CompileError: return "CompileError";
    case RenderErrorKind::LinkError: return "LinkError";
    case RenderErrorKind::MissingUniform: return "MissingUniform";
    case RenderErrorKind::MissingAttribute: return "MissingAttribute";
    case RenderErrorKind::InconsistentMesh: return "InconsistentMesh";
    case RenderErrorKind::BindFailed: return "BindFailed";
    case RenderErrorKind::NoShader: return "NoShader";
    default: return "Unknown";
    }
}

inline const char* drawModeToString(DrawMode mode)
{
    switch (mode)
    {
    case DrawMode::Triangles: return "Triangles";
    case DrawMode::Points: return "Points";
    case DrawMode::Lines: return "Lines";
    default: return "Unknown";
    }
}

}
