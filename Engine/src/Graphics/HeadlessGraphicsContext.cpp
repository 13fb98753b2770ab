#include "HeadlessGraphicsContext.hpp"
#include "VertexBuffer.hpp"
#include "Utils/Log.hpp"
#include <algorithm>
#include <cstring>
#include <iterator>
#include <regex>
#include <sstream>

namespace vu
{

namespace
{
    std::string stripComments(const std::string& source)
    {
        std::string out;
        out.reserve(source.size());
        size_t i = 0;
        while (i < source.size())
        {
            if (source.compare(i, 2, "//") == 0)
            {
                while (i < source.size() && source[i] != '\n')
                {
                    i++;
                }
            }
            else if (source.compare(i, 2, "/*") == 0)
            {
                i += 2;
                while (i < source.size() && source.compare(i, 2, "*/") != 0)
                {
                    // keep line numbers intact
                    if (source[i] == '\n')
                    {
                        out += '\n';
                    }
                    i++;
                }
                i = std::min(i + 2, source.size());
            }
            else
            {
                out += source[i++];
            }
        }
        return out;
    }

    // Returns an empty string when the source passes
    std::string checkSyntax(const std::string& source)
    {
        int braces = 0;
        int parens = 0;
        int line = 1;
        for (char c : source)
        {
            switch (c)
            {
            case '\n': line++; break;
            case '{': braces++; break;
            case '}': braces--; break;
            case '(': parens++; break;
            case ')': parens--; break;
            default: break;
            }
            if (braces < 0)
            {
                return "0:" + std::to_string(line) + ": error: unexpected '}'\n";
            }
            if (parens < 0)
            {
                return "0:" + std::to_string(line) + ": error: unexpected ')'\n";
            }
        }
        if (braces != 0)
        {
            return "0:" + std::to_string(line) + ": error: unbalanced braces\n";
        }
        if (parens != 0)
        {
            return "0:" + std::to_string(line) + ": error: unbalanced parentheses\n";
        }

        static const std::regex main_re(R"(\bvoid\s+main\s*\()");
        if (!std::regex_search(source, main_re))
        {
            return "0:0: error: no main function defined\n";
        }
        return "";
    }

    size_t countReferences(const std::string& source, const std::string& name)
    {
        const std::regex word_re("\\b" + name + "\\b");
        return static_cast<size_t>(std::distance(
            std::sregex_iterator(source.begin(), source.end(), word_re), std::sregex_iterator()));
    }

    uint32_t typeCode(const std::string& type)
    {
        static const std::map<std::string, uint32_t> codes = {
            { "int", GLType::INT },
            { "float", GLType::FLOAT },
            { "vec2", GLType::FLOAT_VEC2 },
            { "vec3", GLType::FLOAT_VEC3 },
            { "vec4", GLType::FLOAT_VEC4 },
            { "bool", GLType::BOOL },
            { "mat2", GLType::FLOAT_MAT2 },
            { "mat3", GLType::FLOAT_MAT3 },
            { "mat4", GLType::FLOAT_MAT4 },
            { "sampler2D", GLType::SAMPLER_2D },
            { "mat3x4", GLType::FLOAT_MAT3x4 },
        };
        auto it = codes.find(type);
        return it != codes.end() ? it->second : 0;
    }

    int floatsPerElement(UniformType type)
    {
        switch (type)
        {
        case UniformType::Int1: return 1;
        case UniformType::Float1: return 1;
        case UniformType::Float2: return 2;
        case UniformType::Float3: return 3;
        case UniformType::Float4: return 4;
        case UniformType::Mat3: return 9;
        case UniformType::Mat3x4: return 12;
        case UniformType::Mat4: return 16;
        }
        return 1;
    }

    template <typename T>
    std::vector<uint8_t> toBytes(const std::vector<T>& data)
    {
        std::vector<uint8_t> bytes(data.size() * sizeof(T));
        if (!bytes.empty())
        {
            std::memcpy(bytes.data(), data.data(), bytes.size());
        }
        return bytes;
    }

    std::string truncateName(const std::string& name, int bufSize)
    {
        if (bufSize <= 0)
        {
            return "";
        }
        return name.substr(0, static_cast<size_t>(bufSize - 1));
    }
}

HeadlessGraphicsContext::HeadlessGraphicsContext()
    : next_id(1), glsl_version("4.60 Headless"), fail_uploads(false),
      current_program(INVALID_HANDLE), current_vao(INVALID_HANDLE), active_unit(0),
      clear_color(0.0f), clear_count(0), viewport_width(0), viewport_height(0),
      depth_test(false), cull_face(false), blend(false), program_point_size(false), line_mode(false)
{
}

HeadlessGraphicsContext::~HeadlessGraphicsContext()
{
    shutdown();
}

bool HeadlessGraphicsContext::initialize(WindowHandle window)
{
    (void)window;
    VU_LOG_INFO("Headless graphics context initialized (GLSL {})", glsl_version);
    return true;
}

void HeadlessGraphicsContext::shutdown()
{
    const size_t live = shaders.size() + programs.size() + vertex_arrays.size() + buffers.size() + textures.size();
    if (live > 0)
    {
        VU_LOG_TRACE("Headless context shut down with {} live objects", live);
    }
    shaders.clear();
    programs.clear();
    vertex_arrays.clear();
    buffers.clear();
    textures.clear();
    uniform_values.clear();
    texture_units.clear();
    current_program = INVALID_HANDLE;
    current_vao = INVALID_HANDLE;
}

GpuError HeadlessGraphicsContext::getError()
{
    if (errors.empty())
    {
        return NO_GPU_ERROR;
    }
    GpuError error = errors.front();
    errors.pop_front();
    return error;
}

// ---------------------------------------------------------------------------
// Shaders

GpuHandle HeadlessGraphicsContext::createShader(ShaderStage stage)
{
    GpuHandle id = next_id++;
    shaders[id].stage = stage;
    return id;
}

void HeadlessGraphicsContext::shaderSource(GpuHandle shader, const std::vector<std::string>& fragments)
{
    auto it = shaders.find(shader);
    if (it == shaders.end())
    {
        raise(GLError::INVALID_VALUE);
        return;
    }
    std::string source;
    for (const std::string& fragment : fragments)
    {
        source += fragment;
    }
    it->second.source = source;
}

void HeadlessGraphicsContext::parseShader(ShaderRecord& shader)
{
    static const std::regex decl_re(
        R"(^\s*(?:layout\s*\(\s*location\s*=\s*(\d+)\s*\)\s*)?)"
        R"((?:(?:flat|smooth|noperspective|highp|mediump|lowp)\s+)*)"
        R"((uniform|in|out)\s+(?:(?:highp|mediump|lowp)\s+)?(\w+)\s+(\w+)\s*(?:\[\s*(\d+)\s*\])?\s*;)");

    const std::string source = stripComments(shader.source);
    shader.declarations.clear();
    shader.log = checkSyntax(source);
    shader.compiled = shader.log.empty();
    if (!shader.compiled)
    {
        return;
    }

    std::istringstream lines(source);
    std::string line;
    while (std::getline(lines, line))
    {
        std::smatch match;
        if (!std::regex_search(line, match, decl_re))
        {
            continue;
        }
        Declaration decl;
        decl.location = match[1].matched ? std::stoi(match[1].str()) : -1;
        decl.qualifier = match[2].str();
        decl.type = match[3].str();
        decl.name = match[4].str();
        decl.size = match[5].matched ? std::stoi(match[5].str()) : 1;
        decl.active = countReferences(source, decl.name) > 1;
        shader.declarations.push_back(decl);
    }
}

void HeadlessGraphicsContext::compileShader(GpuHandle shader)
{
    auto it = shaders.find(shader);
    if (it == shaders.end())
    {
        raise(GLError::INVALID_VALUE);
        return;
    }
    parseShader(it->second);
}

int HeadlessGraphicsContext::getShaderParameter(GpuHandle shader, ShaderParameter param)
{
    auto it = shaders.find(shader);
    if (it == shaders.end())
    {
        raise(GLError::INVALID_VALUE);
        return 0;
    }
    switch (param)
    {
    case ShaderParameter::CompileStatus:
        return it->second.compiled ? 1 : 0;
    case ShaderParameter::InfoLogLength:
        // includes the terminator
        return it->second.log.empty() ? 0 : static_cast<int>(it->second.log.size()) + 1;
    }
    return 0;
}

std::string HeadlessGraphicsContext::getShaderInfoLog(GpuHandle shader, int maxLength)
{
    auto it = shaders.find(shader);
    if (it == shaders.end())
    {
        raise(GLError::INVALID_VALUE);
        return "";
    }
    return truncateName(it->second.log, maxLength);
}

void HeadlessGraphicsContext::deleteShader(GpuHandle shader)
{
    if (shader == INVALID_HANDLE)
    {
        return;
    }
    if (shaders.erase(shader) == 0)
    {
        raise(GLError::INVALID_VALUE);
        return;
    }
    for (auto& [id, program] : programs)
    {
        program.shaders.erase(shader);
    }
}

std::vector<HeadlessGraphicsContext::Declaration> HeadlessGraphicsContext::getDeclarations(GpuHandle shader) const
{
    auto it = shaders.find(shader);
    return it != shaders.end() ? it->second.declarations : std::vector<Declaration>();
}

// ---------------------------------------------------------------------------
// Programs

GpuHandle HeadlessGraphicsContext::createProgram()
{
    GpuHandle id = next_id++;
    programs[id] = ProgramRecord();
    return id;
}

void HeadlessGraphicsContext::attachShader(GpuHandle program, GpuHandle shader)
{
    auto it = programs.find(program);
    if (it == programs.end() || shaders.count(shader) == 0)
    {
        raise(GLError::INVALID_VALUE);
        return;
    }
    it->second.shaders.insert(shader);
}

void HeadlessGraphicsContext::detachShader(GpuHandle program, GpuHandle shader)
{
    auto it = programs.find(program);
    if (it == programs.end())
    {
        raise(GLError::INVALID_VALUE);
        return;
    }
    if (it->second.shaders.erase(shader) == 0)
    {
        raise(GLError::INVALID_OPERATION);
    }
}

void HeadlessGraphicsContext::linkProgram(GpuHandle program)
{
    auto it = programs.find(program);
    if (it == programs.end())
    {
        raise(GLError::INVALID_VALUE);
        return;
    }
    ProgramRecord& record = it->second;
    record.linked = false;
    record.log.clear();
    record.uniforms.clear();
    record.attributes.clear();

    const ShaderRecord* vertex = nullptr;
    const ShaderRecord* fragment = nullptr;
    for (GpuHandle id : record.shaders)
    {
        const ShaderRecord& shader = shaders.at(id);
        if (shader.stage == ShaderStage::Vertex)
        {
            vertex = &shader;
        }
        else
        {
            fragment = &shader;
        }
    }
    if (!vertex || !fragment)
    {
        record.log = "error: program needs a vertex and a fragment shader\n";
        return;
    }
    if (!vertex->compiled || !fragment->compiled)
    {
        record.log = "error: attached shader is not compiled\n";
        return;
    }

    // Fragment inputs are fed by vertex outputs of the same name and type
    for (const Declaration& input : fragment->declarations)
    {
        if (input.qualifier != "in")
        {
            continue;
        }
        auto match = std::find_if(vertex->declarations.begin(), vertex->declarations.end(),
                                  [&](const Declaration& d) { return d.qualifier == "out" && d.name == input.name; });
        if (match == vertex->declarations.end())
        {
            record.log = "error: fragment input '" + input.name + "' has no matching vertex output\n";
            return;
        }
        if (match->type != input.type)
        {
            record.log = "error: type mismatch for '" + input.name + "' between vertex and fragment stages\n";
            return;
        }
    }

    // Uniforms are shared between the stages; only active ones get locations
    std::vector<Declaration> uniforms;
    for (const ShaderRecord* stage : { vertex, fragment })
    {
        for (const Declaration& decl : stage->declarations)
        {
            if (decl.qualifier != "uniform")
            {
                continue;
            }
            auto existing = std::find_if(uniforms.begin(), uniforms.end(),
                                         [&](const Declaration& d) { return d.name == decl.name; });
            if (existing == uniforms.end())
            {
                uniforms.push_back(decl);
            }
            else if (existing->type != decl.type || existing->size != decl.size)
            {
                record.log = "error: uniform '" + decl.name + "' declared differently in each stage\n";
                return;
            }
            else
            {
                existing->active = existing->active || decl.active;
            }
        }
    }
    int next_location = 0;
    for (const Declaration& decl : uniforms)
    {
        if (!decl.active)
        {
            continue;
        }
        ProgramVariable var;
        var.base = decl.name;
        var.name = decl.size > 1 ? decl.name + "[0]" : decl.name;
        var.size = decl.size;
        var.type = typeCode(decl.type);
        var.location = next_location;
        next_location += decl.size;
        record.uniforms.push_back(var);
    }

    // Vertex inputs: explicit layout locations first, the rest fill the gaps
    std::set<int> used;
    for (const Declaration& decl : vertex->declarations)
    {
        if (decl.qualifier == "in" && decl.active && decl.location >= 0)
        {
            if (!used.insert(decl.location).second)
            {
                record.log = "error: location " + std::to_string(decl.location) + " used by more than one input\n";
                record.attributes.clear();
                return;
            }
        }
    }
    for (const Declaration& decl : vertex->declarations)
    {
        if (decl.qualifier != "in" || !decl.active)
        {
            continue;
        }
        ProgramVariable var;
        var.base = decl.name;
        var.name = decl.name;
        var.type = typeCode(decl.type);
        var.location = decl.location;
        if (var.location < 0)
        {
            int slot = 0;
            while (used.count(slot))
            {
                slot++;
            }
            used.insert(slot);
            var.location = slot;
        }
        record.attributes.push_back(var);
    }

    record.linked = true;
}

int HeadlessGraphicsContext::getProgramParameter(GpuHandle program, ProgramParameter param)
{
    auto it = programs.find(program);
    if (it == programs.end())
    {
        raise(GLError::INVALID_VALUE);
        return 0;
    }
    const ProgramRecord& record = it->second;
    auto maxNameLength = [](const std::vector<ProgramVariable>& vars)
    {
        size_t longest = 0;
        for (const ProgramVariable& var : vars)
        {
            longest = std::max(longest, var.name.size());
        }
        return vars.empty() ? 0 : static_cast<int>(longest) + 1;
    };

    switch (param)
    {
    case ProgramParameter::LinkStatus:
        return record.linked ? 1 : 0;
    case ProgramParameter::InfoLogLength:
        return record.log.empty() ? 0 : static_cast<int>(record.log.size()) + 1;
    case ProgramParameter::ActiveUniforms:
        return static_cast<int>(record.uniforms.size());
    case ProgramParameter::ActiveUniformMaxLength:
        return maxNameLength(record.uniforms);
    case ProgramParameter::ActiveAttributes:
        return static_cast<int>(record.attributes.size());
    case ProgramParameter::ActiveAttributeMaxLength:
        return maxNameLength(record.attributes);
    }
    return 0;
}

std::string HeadlessGraphicsContext::getProgramInfoLog(GpuHandle program, int maxLength)
{
    auto it = programs.find(program);
    if (it == programs.end())
    {
        raise(GLError::INVALID_VALUE);
        return "";
    }
    return truncateName(it->second.log, maxLength);
}

void HeadlessGraphicsContext::deleteProgram(GpuHandle program)
{
    if (program == INVALID_HANDLE)
    {
        return;
    }
    if (programs.erase(program) == 0)
    {
        raise(GLError::INVALID_VALUE);
        return;
    }
    for (auto it = uniform_values.begin(); it != uniform_values.end();)
    {
        it = it->first.first == program ? uniform_values.erase(it) : std::next(it);
    }
    if (current_program == program)
    {
        current_program = INVALID_HANDLE;
    }
}

void HeadlessGraphicsContext::useProgram(GpuHandle program)
{
    if (program != INVALID_HANDLE)
    {
        auto it = programs.find(program);
        if (it == programs.end() || !it->second.linked)
        {
            raise(GLError::INVALID_OPERATION);
            return;
        }
    }
    current_program = program;
}

// ---------------------------------------------------------------------------
// Introspection

ActiveVariable HeadlessGraphicsContext::getActiveUniform(GpuHandle program, uint32_t index, int bufSize)
{
    ActiveVariable result;
    auto it = programs.find(program);
    if (it == programs.end() || index >= it->second.uniforms.size())
    {
        raise(GLError::INVALID_VALUE);
        return result;
    }
    const ProgramVariable& var = it->second.uniforms[index];
    result.name = truncateName(var.name, bufSize);
    result.written = static_cast<int>(result.name.size());
    result.size = var.size;
    result.type = var.type;
    return result;
}

ActiveVariable HeadlessGraphicsContext::getActiveAttrib(GpuHandle program, uint32_t index, int bufSize)
{
    ActiveVariable result;
    auto it = programs.find(program);
    if (it == programs.end() || index >= it->second.attributes.size())
    {
        raise(GLError::INVALID_VALUE);
        return result;
    }
    const ProgramVariable& var = it->second.attributes[index];
    result.name = truncateName(var.name, bufSize);
    result.written = static_cast<int>(result.name.size());
    result.size = var.size;
    result.type = var.type;
    return result;
}

const HeadlessGraphicsContext::ProgramVariable* HeadlessGraphicsContext::findVariable(
    const std::vector<ProgramVariable>& vars, const std::string& name, int& element)
{
    static const std::regex element_re(R"(^(\w+)\[(\d+)\]$)");
    std::string base = name;
    element = 0;
    std::smatch match;
    if (std::regex_match(name, match, element_re))
    {
        base = match[1].str();
        element = std::stoi(match[2].str());
    }
    for (const ProgramVariable& var : vars)
    {
        if (var.base == base && element < var.size)
        {
            return &var;
        }
    }
    return nullptr;
}

int HeadlessGraphicsContext::getUniformLocation(GpuHandle program, const std::string& name)
{
    auto it = programs.find(program);
    if (it == programs.end() || !it->second.linked)
    {
        raise(GLError::INVALID_OPERATION);
        return -1;
    }
    int element = 0;
    const ProgramVariable* var = findVariable(it->second.uniforms, name, element);
    return var ? var->location + element : -1;
}

int HeadlessGraphicsContext::getAttribLocation(GpuHandle program, const std::string& name)
{
    auto it = programs.find(program);
    if (it == programs.end() || !it->second.linked)
    {
        raise(GLError::INVALID_OPERATION);
        return -1;
    }
    int element = 0;
    const ProgramVariable* var = findVariable(it->second.attributes, name, element);
    return var ? var->location : -1;
}

// ---------------------------------------------------------------------------
// Vertex data

GpuHandle HeadlessGraphicsContext::createVertexArray()
{
    GpuHandle id = next_id++;
    vertex_arrays.insert(id);
    return id;
}

void HeadlessGraphicsContext::bindVertexArray(GpuHandle vao)
{
    if (vao != INVALID_HANDLE && vertex_arrays.count(vao) == 0)
    {
        raise(GLError::INVALID_OPERATION);
        return;
    }
    current_vao = vao;
}

void HeadlessGraphicsContext::deleteVertexArray(GpuHandle vao)
{
    if (vao == INVALID_HANDLE)
    {
        return;
    }
    vertex_arrays.erase(vao);
    if (current_vao == vao)
    {
        current_vao = INVALID_HANDLE;
    }
}

GpuHandle HeadlessGraphicsContext::createBuffer()
{
    GpuHandle id = next_id++;
    buffers[id] = BufferRecord();
    return id;
}

void HeadlessGraphicsContext::deleteBuffer(GpuHandle buffer)
{
    if (buffer != INVALID_HANDLE)
    {
        buffers.erase(buffer);
    }
}

void HeadlessGraphicsContext::uploadVertexBuffer(const VertexBuffer& buffer)
{
    auto it = buffers.find(buffer.getHandle());
    if (it == buffers.end() || current_vao == INVALID_HANDLE)
    {
        raise(GLError::INVALID_OPERATION);
        return;
    }
    if (fail_uploads)
    {
        raise(GLError::OUT_OF_MEMORY);
        return;
    }

    BufferRecord& record = it->second;
    record.slot = static_cast<int>(buffer.getSlot());
    record.span = buffer.getSpan();
    record.kind = buffer.getDataKind();
    record.normalized = buffer.isNormalized();
    record.data_bytes = buffer.getByteSize();
    if (const std::vector<float>* floats = buffer.getFloats())
    {
        record.orphaned = buffer.getUsage() == UsageHint::Dynamic;
        record.allocated_bytes = record.orphaned ? buffer.getCapacityBytes() : buffer.getByteSize();
        record.contents = toBytes(*floats);
    }
    else if (const std::vector<uint8_t>* bytes = buffer.getBytes())
    {
        record.orphaned = false;
        record.allocated_bytes = bytes->size();
        record.contents = *bytes;
    }
    record.upload_count++;
}

void HeadlessGraphicsContext::uploadIndexBuffer(const IndexBuffer& buffer)
{
    auto it = buffers.find(buffer.getHandle());
    if (it == buffers.end() || current_vao == INVALID_HANDLE)
    {
        raise(GLError::INVALID_OPERATION);
        return;
    }
    if (fail_uploads)
    {
        raise(GLError::OUT_OF_MEMORY);
        return;
    }

    BufferRecord& record = it->second;
    record.slot = -1;
    record.span = 1;
    record.allocated_bytes = buffer.getByteSize();
    record.data_bytes = buffer.getByteSize();
    record.contents = toBytes(buffer.getIndices());
    record.upload_count++;
}

const HeadlessGraphicsContext::BufferRecord* HeadlessGraphicsContext::getBufferRecord(GpuHandle buffer) const
{
    auto it = buffers.find(buffer);
    return it != buffers.end() ? &it->second : nullptr;
}

// ---------------------------------------------------------------------------
// Textures

GpuHandle HeadlessGraphicsContext::createTexture()
{
    GpuHandle id = next_id++;
    textures[id] = TextureRecord();
    return id;
}

void HeadlessGraphicsContext::uploadTexture(GpuHandle texture, int width, int height, const std::vector<uint8_t>& rgba)
{
    auto it = textures.find(texture);
    if (it == textures.end())
    {
        raise(GLError::INVALID_OPERATION);
        return;
    }
    if (width <= 0 || height <= 0 || rgba.size() < static_cast<size_t>(width) * static_cast<size_t>(height) * 4)
    {
        raise(GLError::INVALID_VALUE);
        return;
    }
    it->second.width = width;
    it->second.height = height;
    it->second.mipmaps = true;
    it->second.upload_count++;
    texture_units[active_unit] = texture;
}

void HeadlessGraphicsContext::updateTextureMode(GpuHandle texture, bool repeat)
{
    auto it = textures.find(texture);
    if (it == textures.end())
    {
        raise(GLError::INVALID_OPERATION);
        return;
    }
    it->second.repeat = repeat;
    it->second.max_level = 7;
    texture_units[active_unit] = texture;
}

void HeadlessGraphicsContext::deleteTexture(GpuHandle texture)
{
    if (texture == INVALID_HANDLE)
    {
        return;
    }
    textures.erase(texture);
    for (auto& [unit, bound] : texture_units)
    {
        if (bound == texture)
        {
            bound = INVALID_HANDLE;
        }
    }
}

void HeadlessGraphicsContext::bindTexture(GpuHandle texture)
{
    if (texture != INVALID_HANDLE && textures.count(texture) == 0)
    {
        raise(GLError::INVALID_OPERATION);
        return;
    }
    texture_units[active_unit] = texture;
}

void HeadlessGraphicsContext::useTexture(int sampler, int unit, GpuHandle texture)
{
    bindUniform(sampler, unit);
    active_unit = unit;
    bindTexture(texture);
}

const HeadlessGraphicsContext::TextureRecord* HeadlessGraphicsContext::getTextureRecord(GpuHandle texture) const
{
    auto it = textures.find(texture);
    return it != textures.end() ? &it->second : nullptr;
}

GpuHandle HeadlessGraphicsContext::getTextureUnit(int unit) const
{
    auto it = texture_units.find(unit);
    return it != texture_units.end() ? it->second : INVALID_HANDLE;
}

// ---------------------------------------------------------------------------
// Uniforms

void HeadlessGraphicsContext::bindUniform(int location, UniformType type, int count, const float* data)
{
    if (current_program == INVALID_HANDLE)
    {
        raise(GLError::INVALID_OPERATION);
        return;
    }
    // location -1 is silently ignored
    if (location < 0)
    {
        return;
    }
    if (count < 0)
    {
        raise(GLError::INVALID_VALUE);
        return;
    }
    UniformValue& value = uniform_values[{ current_program, location }];
    value.type = type;
    value.count = count;
    value.values.assign(data, data + static_cast<size_t>(count) * static_cast<size_t>(floatsPerElement(type)));
}

void HeadlessGraphicsContext::bindUniform(int location, int value)
{
    const float as_float = static_cast<float>(value);
    bindUniform(location, UniformType::Int1, 1, &as_float);
}

const HeadlessGraphicsContext::UniformValue* HeadlessGraphicsContext::getUniformValue(GpuHandle program, int location) const
{
    auto it = uniform_values.find({ program, location });
    return it != uniform_values.end() ? &it->second : nullptr;
}

// ---------------------------------------------------------------------------
// State and draws

void HeadlessGraphicsContext::setViewport(int width, int height)
{
    if (width < 0 || height < 0)
    {
        raise(GLError::INVALID_VALUE);
        return;
    }
    viewport_width = width;
    viewport_height = height;
}

void HeadlessGraphicsContext::recordDraw(DrawMode mode, bool indexed, int first, int count)
{
    if (current_program == INVALID_HANDLE || current_vao == INVALID_HANDLE)
    {
        raise(GLError::INVALID_OPERATION);
        return;
    }
    if (first < 0 || count < 0)
    {
        raise(GLError::INVALID_VALUE);
        return;
    }
    DrawCall call;
    call.mode = mode;
    call.indexed = indexed;
    call.first = first;
    call.count = count;
    call.program = current_program;
    call.vao = current_vao;
    call.texture = getTextureUnit(active_unit);
    call.depth_test = depth_test;
    call.cull_face = cull_face;
    call.line_mode = line_mode;
    call.program_point_size = program_point_size;
    draw_calls.push_back(call);
}

void HeadlessGraphicsContext::drawElements(DrawMode mode, int count, int firstIndex)
{
    recordDraw(mode, true, firstIndex, count);
}

void HeadlessGraphicsContext::drawArrays(DrawMode mode, int first, int count)
{
    recordDraw(mode, false, first, count);
}

}
