#include "ShaderProgram.hpp"
#include "GraphicsContext.hpp"
#include "Console/ConVar.hpp"
#include "Utils/Log.hpp"

namespace vu
{

const char* const GLSL_ES_300 = "OpenGL ES GLSL ES 3.00";

namespace
{
    // Owns a new program object until release() hands it over.
    class ScopedProgram
    {
    public:
        explicit ScopedProgram(IGraphicsContext& ctx)
            : ctx(ctx), program_id(ctx.createProgram())
        {
        }

        ~ScopedProgram()
        {
            if (program_id != INVALID_HANDLE)
            {
                ctx.deleteProgram(program_id);
            }
        }

        ScopedProgram(const ScopedProgram&) = delete;
        ScopedProgram& operator=(const ScopedProgram&) = delete;

        GpuHandle get() const { return program_id; }

        GpuHandle release()
        {
            GpuHandle id = program_id;
            program_id = INVALID_HANDLE;
            return id;
        }

    private:
        IGraphicsContext& ctx;
        GpuHandle program_id;
    };

    // Shader objects are only needed until the link; detach and delete on scope exit.
    class ScopedShader
    {
    public:
        ScopedShader(IGraphicsContext& ctx, ShaderStage stage)
            : ctx(ctx), shader_id(ctx.createShader(stage)), attached_to(INVALID_HANDLE)
        {
        }

        ~ScopedShader()
        {
            if (attached_to != INVALID_HANDLE)
            {
                ctx.detachShader(attached_to, shader_id);
            }
            ctx.deleteShader(shader_id);
        }

        ScopedShader(const ScopedShader&) = delete;
        ScopedShader& operator=(const ScopedShader&) = delete;

        GpuHandle get() const { return shader_id; }

        void attachTo(GpuHandle program)
        {
            ctx.attachShader(program, shader_id);
            attached_to = program;
        }

    private:
        IGraphicsContext& ctx;
        GpuHandle shader_id;
        GpuHandle attached_to;
    };

    const char* stageName(ShaderStage stage)
    {
        return stage == ShaderStage::Vertex ? "Vertex" : "Fragment";
    }

    std::string trim(const std::string& line)
    {
        size_t start = line.find_first_not_of(" \t\r\n");
        if (start == std::string::npos)
        {
            return "";
        }
        size_t end = line.find_last_not_of(" \t\r\n");
        return line.substr(start, end - start + 1);
    }
}

std::vector<std::string> addVersionPreamble(const std::vector<std::string>& source, const std::string& glsl_version)
{
    std::vector<std::string> result;
    result.reserve(source.size() + 2);
    if (glsl_version == GLSL_ES_300)
    {
        result.push_back("#version 300 es\n");
        result.push_back("precision highp float;\n");
    }
    else
    {
        result.push_back("#version 330\n");
    }
    result.insert(result.end(), source.begin(), source.end());
    return result;
}

ShaderProgram::ShaderProgram(const std::string& name)
    : GpuResource(name), program_id(INVALID_HANDLE)
{
}

ShaderProgram::~ShaderProgram()
{
    if (program_id != INVALID_HANDLE)
    {
        VU_LOG_WARN("Shader '{}' destroyed with program {} still live", name, program_id);
    }
}

void ShaderProgram::setSource(const std::vector<std::string>& vertex_src, const std::vector<std::string>& fragment_src)
{
    vertex_source = vertex_src;
    fragment_source = fragment_src;
    ensureNewLines();
}

void ShaderProgram::ensureNewLines()
{
    for (std::string& line : vertex_source)
    {
        line = trim(line) + "\n";
    }
    for (std::string& line : fragment_source)
    {
        line = trim(line) + "\n";
    }
}

int ShaderProgram::getUniformLocation(const std::string& uniform) const
{
    auto it = uniforms.find(uniform);
    return it != uniforms.end() ? it->second : -1;
}

int ShaderProgram::getAttributeLocation(const std::string& attribute) const
{
    auto it = attributes.find(attribute);
    return it != attributes.end() ? it->second : -1;
}

std::string ShaderProgram::getVersion(IGraphicsContext& ctx) const
{
    ConVarBase* glsl_override = VU_CVAR_PTR(r_glsl_override);
    if (glsl_override && !glsl_override->getString().empty())
    {
        return glsl_override->getString();
    }
    return ctx.getShadingLanguageVersion();
}

std::optional<RenderError> ShaderProgram::compileShader(IGraphicsContext& ctx, ShaderStage stage, GpuHandle shader_id,
                                                        const std::vector<std::string>& source)
{
    ctx.shaderSource(shader_id, source);
    ctx.compileShader(shader_id);
    if (ctx.getShaderParameter(shader_id, ShaderParameter::CompileStatus) != 0)
    {
        return std::nullopt;
    }

    std::string message = std::string(stageName(stage)) + " shader compile failed\n";
    int log_length = ctx.getShaderParameter(shader_id, ShaderParameter::InfoLogLength);
    if (log_length > 0)
    {
        message += ctx.getShaderInfoLog(shader_id, log_length);
    }
    return RenderError(RenderErrorKind::CompileError, message, name);
}

std::optional<RenderError> ShaderProgram::linkProgram(IGraphicsContext& ctx, GpuHandle program)
{
    ctx.linkProgram(program);
    if (ctx.getProgramParameter(program, ProgramParameter::LinkStatus) != 0)
    {
        return std::nullopt;
    }

    std::string message = "Shader link failed\n";
    int log_length = ctx.getProgramParameter(program, ProgramParameter::InfoLogLength);
    if (log_length > 0)
    {
        message += ctx.getProgramInfoLog(program, log_length);
    }
    return RenderError(RenderErrorKind::LinkError, message, name);
}

std::optional<RenderError> ShaderProgram::bind(IGraphicsContext& ctx)
{
    // Clean up existing program if any
    if (program_id != INVALID_HANDLE)
    {
        releaseGpu(ctx);
    }

    if (vertex_source.empty() || fragment_source.empty())
    {
        VU_LOG_ERROR("Shader '{}' has no source", name);
        return RenderError(RenderErrorKind::CompileError, "Shader " + name + " has no source", name);
    }

    const std::string version = getVersion(ctx);
    const std::vector<std::string> vertex_src = addVersionPreamble(vertex_source, version);
    const std::vector<std::string> fragment_src = addVersionPreamble(fragment_source, version);

    // Declared first so it is deleted after the shaders are detached
    ScopedProgram program(ctx);

    ScopedShader vertex_shader(ctx, ShaderStage::Vertex);
    if (auto err = compileShader(ctx, ShaderStage::Vertex, vertex_shader.get(), vertex_src))
    {
        VU_LOG_ERROR("Shader '{}': {}", name, err->message);
        return err;
    }
    vertex_shader.attachTo(program.get());

    ScopedShader fragment_shader(ctx, ShaderStage::Fragment);
    if (auto err = compileShader(ctx, ShaderStage::Fragment, fragment_shader.get(), fragment_src))
    {
        VU_LOG_ERROR("Shader '{}': {}", name, err->message);
        return err;
    }
    fragment_shader.attachTo(program.get());

    // The program is not validated: validation needs a bound vertex array.
    if (auto err = linkProgram(ctx, program.get()))
    {
        VU_LOG_ERROR("Shader '{}': {}", name, err->message);
        return err;
    }

    program_id = program.release();
    loadUniforms(ctx);
    loadAttributes(ctx);

    VU_LOG_TRACE("Shader '{}' linked (ID: {}, {} uniforms, {} attributes)", name, program_id,
                 uniforms.size(), attributes.size());

    ConVarBase* developer = VU_CVAR_PTR(developer);
    if (developer && developer->getInt() != 0)
    {
        for (const auto& [uniform, location] : uniforms)
        {
            VU_LOG_TRACE("  uniform {} -> {}", uniform, location);
        }
        for (const auto& [attribute, location] : attributes)
        {
            VU_LOG_TRACE("  attribute {} -> {}", attribute, location);
        }
    }
    return std::nullopt;
}

// Expects a linked program; errors from the driver are not checked.
void ShaderProgram::loadUniforms(IGraphicsContext& ctx)
{
    uniforms.clear();
    int count = ctx.getProgramParameter(program_id, ProgramParameter::ActiveUniforms);
    int max_length = ctx.getProgramParameter(program_id, ProgramParameter::ActiveUniformMaxLength);
    for (int i = 0; i < count; i++)
    {
        ActiveVariable var = ctx.getActiveUniform(program_id, static_cast<uint32_t>(i), max_length);
        if (var.written <= 0)
        {
            continue;
        }

        std::string uniform = var.name.substr(0, static_cast<size_t>(var.written));
        int location = ctx.getUniformLocation(program_id, uniform);

        // "bpos[0]" and friends are stored as "bpos"
        size_t subscript = uniform.find('[');
        if (subscript != std::string::npos)
        {
            uniform.erase(subscript);
        }
        uniforms[uniform] = location;
    }
}

void ShaderProgram::loadAttributes(IGraphicsContext& ctx)
{
    attributes.clear();
    int count = ctx.getProgramParameter(program_id, ProgramParameter::ActiveAttributes);
    int max_length = ctx.getProgramParameter(program_id, ProgramParameter::ActiveAttributeMaxLength);
    for (int i = 0; i < count; i++)
    {
        ActiveVariable var = ctx.getActiveAttrib(program_id, static_cast<uint32_t>(i), max_length);
        if (var.written <= 0)
        {
            continue;
        }

        std::string attribute = var.name.substr(0, static_cast<size_t>(var.written));

        // Built-in inputs such as gl_VertexID have no buffer
        if (attribute.compare(0, 3, "gl_") == 0)
        {
            continue;
        }
        attributes[attribute] = ctx.getAttribLocation(program_id, attribute);
    }
}

void ShaderProgram::releaseGpu(IGraphicsContext& ctx)
{
    if (program_id != INVALID_HANDLE)
    {
        ctx.deleteProgram(program_id);
        program_id = INVALID_HANDLE;
    }
    uniforms.clear();
    attributes.clear();
}

}
