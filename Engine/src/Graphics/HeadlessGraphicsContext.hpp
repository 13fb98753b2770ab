#pragma once

#include "GraphicsContext.hpp"
#include <deque>
#include <map>
#include <set>
#include <utility>

namespace vu
{

// GL type enums reported by program introspection
namespace GLType
{
    const uint32_t INT = 0x1404;
    const uint32_t FLOAT = 0x1406;
    const uint32_t FLOAT_VEC2 = 0x8B50;
    const uint32_t FLOAT_VEC3 = 0x8B51;
    const uint32_t FLOAT_VEC4 = 0x8B52;
    const uint32_t BOOL = 0x8B56;
    const uint32_t FLOAT_MAT2 = 0x8B5A;
    const uint32_t FLOAT_MAT3 = 0x8B5B;
    const uint32_t FLOAT_MAT4 = 0x8B5C;
    const uint32_t SAMPLER_2D = 0x8B5E;
    const uint32_t FLOAT_MAT3x4 = 0x8B68;
}

// GL error codes raised by the headless driver
namespace GLError
{
    const GpuError INVALID_VALUE = 0x0501;
    const GpuError INVALID_OPERATION = 0x0502;
    const GpuError OUT_OF_MEMORY = 0x0505;
}

// Graphics context without a GPU. Objects live in memory and every call is
// recorded so tests can inspect what would have been sent to the driver.
//
// Shaders get a light syntax check (balanced brackets, a main function) and
// declarations of the forms
//     uniform <type> name[N];
//     [layout(location = N)] in|out <type> name;
// are picked up for introspection. A declaration is active when the name is
// referenced again in the same stage.
class HeadlessGraphicsContext : public IGraphicsContext
{
public:
    struct Declaration
    {
        std::string qualifier; // uniform, in or out
        std::string type;
        std::string name;
        int size = 1;
        int location = -1; // explicit layout location
        bool active = false;
    };

    struct BufferRecord
    {
        size_t allocated_bytes = 0; // storage size given to the driver
        size_t data_bytes = 0;      // bytes of vertex data written
        bool orphaned = false;      // storage reallocated before the write
        int upload_count = 0;
        int slot = -1;              // attribute slot, -1 for index buffers
        int span = 0;
        DataKind kind = DataKind::Float;
        bool normalized = false;
        std::vector<uint8_t> contents;
    };

    struct TextureRecord
    {
        int width = 0;
        int height = 0;
        bool repeat = false;
        int max_level = 0;
        bool mipmaps = false;
        int upload_count = 0;
    };

    struct DrawCall
    {
        DrawMode mode = DrawMode::Triangles;
        bool indexed = false;
        int first = 0;
        int count = 0;
        GpuHandle program = INVALID_HANDLE;
        GpuHandle vao = INVALID_HANDLE;
        GpuHandle texture = INVALID_HANDLE;
        bool depth_test = false;
        bool cull_face = false;
        bool line_mode = false;
        bool program_point_size = false;
    };

    struct UniformValue
    {
        UniformType type = UniformType::Float1;
        int count = 0;
        std::vector<float> values;
    };

private:
    struct ShaderRecord
    {
        ShaderStage stage = ShaderStage::Vertex;
        std::string source;
        bool compiled = false;
        std::string log;
        std::vector<Declaration> declarations;
    };

    struct ProgramVariable
    {
        std::string name; // arrays are reported as name[0]
        std::string base;
        int size = 1;
        uint32_t type = 0;
        int location = -1;
    };

    struct ProgramRecord
    {
        std::set<GpuHandle> shaders;
        bool linked = false;
        std::string log;
        std::vector<ProgramVariable> uniforms;
        std::vector<ProgramVariable> attributes;
    };

    GpuHandle next_id;
    std::string glsl_version;
    std::deque<GpuError> errors;
    bool fail_uploads;

    std::map<GpuHandle, ShaderRecord> shaders;
    std::map<GpuHandle, ProgramRecord> programs;
    std::set<GpuHandle> vertex_arrays;
    std::map<GpuHandle, BufferRecord> buffers;
    std::map<GpuHandle, TextureRecord> textures;

    // program, location
    std::map<std::pair<GpuHandle, int>, UniformValue> uniform_values;
    std::map<int, GpuHandle> texture_units;
    std::vector<DrawCall> draw_calls;

    GpuHandle current_program;
    GpuHandle current_vao;
    int active_unit;
    glm::vec4 clear_color;
    int clear_count;
    int viewport_width;
    int viewport_height;
    bool depth_test;
    bool cull_face;
    bool blend;
    bool program_point_size;
    bool line_mode;

    void raise(GpuError error) { errors.push_back(error); }
    void parseShader(ShaderRecord& shader);
    void recordDraw(DrawMode mode, bool indexed, int first, int count);
    static const ProgramVariable* findVariable(const std::vector<ProgramVariable>& vars, const std::string& name, int& element);

public:
    HeadlessGraphicsContext();
    ~HeadlessGraphicsContext() override;

    bool initialize(WindowHandle window) override;
    void shutdown() override;
    const char* getAPIName() const override { return "Headless"; }
    std::string getShadingLanguageVersion() override { return glsl_version; }
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

    void setClearColor(const glm::vec4& color) override { clear_color = color; }
    void clear() override { clear_count++; }
    void setViewport(int width, int height) override;
    void setDepthTest(bool enabled) override { depth_test = enabled; }
    void setCullFace(bool enabled) override { cull_face = enabled; }
    void setBlend(bool enabled) override { blend = enabled; }
    void setProgramPointSize(bool enabled) override { program_point_size = enabled; }
    void setLineMode(bool enabled) override { line_mode = enabled; }
    void drawElements(DrawMode mode, int count, int firstIndex) override;
    void drawArrays(DrawMode mode, int first, int count) override;

    // Test hooks
    void setShadingLanguageVersion(const std::string& version) { glsl_version = version; }
    void injectError(GpuError error) { raise(error); }
    // While set, every buffer upload raises OUT_OF_MEMORY
    void setFailUploads(bool fail) { fail_uploads = fail; }

    // Inspection
    size_t liveShaderCount() const { return shaders.size(); }
    size_t liveProgramCount() const { return programs.size(); }
    size_t liveVertexArrayCount() const { return vertex_arrays.size(); }
    size_t liveBufferCount() const { return buffers.size(); }
    size_t liveTextureCount() const { return textures.size(); }
    bool isProgram(GpuHandle program) const { return programs.count(program) != 0; }
    bool isTexture(GpuHandle texture) const { return textures.count(texture) != 0; }
    std::vector<Declaration> getDeclarations(GpuHandle shader) const;

    const BufferRecord* getBufferRecord(GpuHandle buffer) const;
    const TextureRecord* getTextureRecord(GpuHandle texture) const;
    const UniformValue* getUniformValue(GpuHandle program, int location) const;
    GpuHandle getTextureUnit(int unit) const;
    GpuHandle getCurrentProgram() const { return current_program; }

    const std::vector<DrawCall>& getDrawCalls() const { return draw_calls; }
    void clearDrawCalls() { draw_calls.clear(); }

    const glm::vec4& getClearColor() const { return clear_color; }
    int getClearCount() const { return clear_count; }
    int getViewportWidth() const { return viewport_width; }
    int getViewportHeight() const { return viewport_height; }
    bool isDepthTestEnabled() const { return depth_test; }
    bool isCullFaceEnabled() const { return cull_face; }
    bool isBlendEnabled() const { return blend; }
    bool isLineMode() const { return line_mode; }
};

}
