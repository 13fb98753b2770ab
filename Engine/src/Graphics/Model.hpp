#pragma once

#include "Graphics/RenderTypes.hpp"
#include <glm/glm.hpp>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace vu
{

class IGraphicsContext;
class ShaderProgram;
class Mesh;
class Texture;
class Animation;

// Where the value of an engine supplied uniform comes from.
enum class BuiltinSource
{
    ModelViewProjection,
    ModelView,
    NormalMatrix,
    Pose,
    TextureUnit,
    Scale,
    Alpha,
    Time
};

struct BuiltinUniform
{
    BuiltinSource source;
    UniformType type;
    int unit; // texture unit for TextureUnit sources
};

// Uniform names the engine supplies: mvpm, mvm, nm, bpos, uv, uv0-uv15,
// scale, alpha and time. Returns nullptr for any other name.
const BuiltinUniform* findBuiltinUniform(const std::string& uniform);

enum class UniformResolution
{
    Builtin,
    User,
    Missing
};

enum class TextureMode
{
    Clamp,
    Repeat
};

// One drawable instance: a shader, a mesh, textures and uniform values.
// Shaders, meshes and textures are shared between models and reference
// counted; call dispose() to give them back.
class Model
{
public:
    static const size_t MAX_TEXTURES = 16;

private:
    IGraphicsContext& ctx;
    ShaderProgram* shader;
    Mesh* mesh;
    std::vector<Texture*> textures;
    std::unordered_map<std::string, std::vector<float>> user_uniforms;

    // Engine uniform values
    glm::mat4 mv;
    glm::mat4 mvp;
    glm::vec3 scale;
    float alpha;
    std::chrono::steady_clock::time_point created;

    // Render directives
    DrawMode draw_mode;
    bool is_2d;
    bool cull;

    // Animation playback
    Animation* animation;
    double frame;
    int movement;
    int max_frames;
    std::vector<glm::mat3x4> pose;
    std::function<void()> loop_callback;

    void bindBuiltin(const BuiltinUniform& builtin, int location);
    void bindUserUniform(const std::string& uniform, int location, const std::vector<float>& values);
    void bindTexture(Texture* texture);
    void releaseMesh();
    void releaseShader();
    void releaseTexture(Texture* texture);

public:
    // Binds the shader when it is not yet bound.
    Model(IGraphicsContext& ctx, ShaderProgram* shader);
    ~Model();

    Model(const Model&) = delete;
    Model& operator=(const Model&) = delete;

    ShaderProgram* getShader() const { return shader; }

    // Replaces (and releases) the current mesh. Returns the model for chaining.
    Model& setMesh(Mesh* m);
    Mesh* getMesh() const { return mesh; }

    // Mesh name, or empty without a mesh
    std::string getName() const;

    // Textures, indexed by texture unit
    int addTexture(Texture* texture);
    int addModelTexture(Texture* texture, int f0, int fn);
    void useTexture(Texture* texture, int index);
    void removeTexture(int index);
    Texture* getTexture(int index) const;
    const std::vector<Texture*>& getTextures() const { return textures; }
    void setTextureMode(int index, TextureMode mode);
    void setImage(int index, int width, int height, const std::vector<uint8_t>& rgba);

    // User uniforms, 1 to 4 floats
    void setUniform(const std::string& uniform, const std::vector<float>& values);
    std::vector<float> getUniform(const std::string& uniform) const;

    // Engine uniforms
    void setMvTransform(const glm::mat4& transform) { mv = transform; }
    void setMvpTransform(const glm::mat4& transform) { mvp = transform; }
    const glm::mat4& getMvTransform() const { return mv; }
    const glm::mat4& getMvpTransform() const { return mvp; }
    void setScale(float x, float y, float z) { scale = glm::vec3(x, y, z); }
    const glm::vec3& getScale() const { return scale; }
    void setAlpha(float a) { alpha = a; }
    float getAlpha() const { return alpha; }

    // Render directives
    void setDrawMode(DrawMode mode);
    DrawMode getDrawMode() const { return draw_mode; }
    void set2D() { is_2d = true; }
    bool is2D() const { return is_2d; }
    void setCullOff() { cull = false; }
    bool isCullEnabled() const { return cull; }

    // Animation
    void setAnimation(Animation* anim);
    Animation* getAnimation() const { return animation; }
    void animate(double dt);
    bool playMovement(int index, std::function<void()> done = nullptr);
    std::vector<std::string> getMovements() const;
    double getFrame() const { return frame; }
    const std::vector<glm::mat3x4>& getPose() const { return pose; }

    UniformResolution resolveUniform(const std::string& uniform) const;

    // Send a value for every active shader uniform. Unresolved uniforms are
    // logged and skipped.
    void bindUniforms();

    // Checks every active uniform and attribute has a source, and that the
    // mesh is consistent. Run once after setup, before the first draw.
    std::optional<RenderError> verify() const;

    // Drop the references to shader, mesh and textures. GPU objects are
    // deleted for resources no other model references.
    void dispose();
};

}
