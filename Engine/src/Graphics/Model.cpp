#include "Model.hpp"
#include "GraphicsContext.hpp"
#include "ShaderProgram.hpp"
#include "Mesh.hpp"
#include "Texture.hpp"
#include "Animation.hpp"
#include "Console/ConVar.hpp"
#include "Utils/Log.hpp"
#include <glm/gtc/type_ptr.hpp>
#include <algorithm>

namespace vu
{

namespace
{
    const std::unordered_map<std::string, BuiltinUniform>& builtinUniforms()
    {
        static const std::unordered_map<std::string, BuiltinUniform> table = []()
        {
            std::unordered_map<std::string, BuiltinUniform> uniforms = {
                // transform matrices
                { "mvpm", { BuiltinSource::ModelViewProjection, UniformType::Mat4, 0 } },
                { "mvm", { BuiltinSource::ModelView, UniformType::Mat4, 0 } },
                { "nm", { BuiltinSource::NormalMatrix, UniformType::Mat3, 0 } },

                // joint poses for animated models
                { "bpos", { BuiltinSource::Pose, UniformType::Mat3x4, 0 } },

                // model size, alpha, and elapsed time
                { "scale", { BuiltinSource::Scale, UniformType::Float3, 0 } },
                { "alpha", { BuiltinSource::Alpha, UniformType::Float1, 0 } },
                { "time", { BuiltinSource::Time, UniformType::Float1, 0 } },

                { "uv", { BuiltinSource::TextureUnit, UniformType::Int1, 0 } },
            };
            for (int unit = 0; unit < static_cast<int>(Model::MAX_TEXTURES); unit++)
            {
                uniforms["uv" + std::to_string(unit)] = { BuiltinSource::TextureUnit, UniformType::Int1, unit };
            }
            return uniforms;
        }();
        return table;
    }

    bool uniformWarningsEnabled()
    {
        ConVarBase* warnings = VU_CVAR_PTR(r_uniform_warnings);
        return !warnings || warnings->getBool();
    }

    template <typename T>
    std::vector<std::string> sortedNames(const std::unordered_map<std::string, T>& table)
    {
        std::vector<std::string> names;
        names.reserve(table.size());
        for (const auto& entry : table)
        {
            names.push_back(entry.first);
        }
        std::sort(names.begin(), names.end());
        return names;
    }
}

const BuiltinUniform* findBuiltinUniform(const std::string& uniform)
{
    const auto& table = builtinUniforms();
    auto it = table.find(uniform);
    return it != table.end() ? &it->second : nullptr;
}

Model::Model(IGraphicsContext& ctx, ShaderProgram* shader)
    : ctx(ctx), shader(shader), mesh(nullptr),
      mv(1.0f), mvp(1.0f), scale(1.0f), alpha(1.0f), created(std::chrono::steady_clock::now()),
      draw_mode(DrawMode::Triangles), is_2d(false), cull(true),
      animation(nullptr), frame(0.0), movement(0), max_frames(0)
{
    if (!shader)
    {
        VU_LOG_ERROR("Model created without a shader");
        return;
    }
    if (!shader->isBound())
    {
        if (auto err = shader->bind(ctx))
        {
            VU_LOG_ERROR("Model could not bind shader '{}': {}", shader->getName(), err->message);
        }
    }
    shader->acquire();
}

Model::~Model()
{
    if (shader || mesh || !textures.empty())
    {
        VU_LOG_TRACE("Model '{}' destroyed without dispose", getName());
    }
}

Model& Model::setMesh(Mesh* m)
{
    releaseMesh();
    mesh = m;
    if (!mesh)
    {
        return *this;
    }

    if (!mesh->isBound())
    {
        if (!mesh->isValid())
        {
            VU_LOG_WARN("Model mesh '{}' is not valid and was not bound", mesh->getName());
        }
        else if (auto err = mesh->bind(ctx))
        {
            VU_LOG_ERROR("Model could not bind mesh '{}': {}", mesh->getName(), err->message);
        }
    }
    mesh->acquire();
    return *this;
}

std::string Model::getName() const
{
    return mesh ? mesh->getName() : "";
}

void Model::bindTexture(Texture* texture)
{
    if (texture->isBound())
    {
        return;
    }
    if (auto err = texture->bind(ctx))
    {
        VU_LOG_ERROR("Model could not bind texture '{}': {}", texture->getName(), err->message);
        return;
    }
    texture->freeImage();
}

int Model::addTexture(Texture* texture)
{
    if (!texture)
    {
        return -1;
    }
    if (textures.size() >= MAX_TEXTURES)
    {
        VU_LOG_WARN("Model '{}' already has {} textures, '{}' not added", getName(), MAX_TEXTURES, texture->getName());
        return -1;
    }
    bindTexture(texture);
    texture->acquire();
    textures.push_back(texture);
    return static_cast<int>(textures.size()) - 1;
}

int Model::addModelTexture(Texture* texture, int f0, int fn)
{
    if (texture)
    {
        texture->setFaceRange(f0, fn);
    }
    return addTexture(texture);
}

void Model::useTexture(Texture* texture, int index)
{
    if (!texture || index < 0 || index >= static_cast<int>(textures.size()))
    {
        return;
    }
    bindTexture(texture);

    // The replaced texture is released but not deleted here.
    if (Texture* old = textures[index])
    {
        texture->setFaceRange(old->getFirstFace(), old->getFaceCount());
        old->release();
    }
    texture->acquire();
    textures[index] = texture;
}

void Model::releaseTexture(Texture* texture)
{
    if (texture && texture->release())
    {
        texture->releaseGpu(ctx);
    }
}

void Model::removeTexture(int index)
{
    if (index < 0 || index >= static_cast<int>(textures.size()))
    {
        return;
    }
    releaseTexture(textures[index]);
    textures.erase(textures.begin() + index);
}

Texture* Model::getTexture(int index) const
{
    if (index >= 0 && index < static_cast<int>(textures.size()))
    {
        return textures[index];
    }
    return nullptr;
}

void Model::setTextureMode(int index, TextureMode mode)
{
    Texture* texture = getTexture(index);
    if (!texture)
    {
        return;
    }
    texture->setRepeat(mode == TextureMode::Repeat);
    if (texture->isBound())
    {
        ctx.updateTextureMode(texture->getTextureID(), texture->isRepeat());
    }
}

void Model::setImage(int index, int width, int height, const std::vector<uint8_t>& rgba)
{
    Texture* texture = getTexture(index);
    if (!texture || !texture->setImage(width, height, rgba))
    {
        return;
    }
    if (auto err = texture->bind(ctx))
    {
        VU_LOG_ERROR("Model could not bind image for texture '{}': {}", texture->getName(), err->message);
        return;
    }
    texture->freeImage();
}

void Model::setUniform(const std::string& uniform, const std::vector<float>& values)
{
    user_uniforms[uniform] = values;
}

std::vector<float> Model::getUniform(const std::string& uniform) const
{
    auto it = user_uniforms.find(uniform);
    return it != user_uniforms.end() ? it->second : std::vector<float>();
}

void Model::setDrawMode(DrawMode mode)
{
    switch (mode)
    {
    case DrawMode::Triangles:
    case DrawMode::Points:
    case DrawMode::Lines:
        draw_mode = mode;
        break;
    }
}

void Model::setAnimation(Animation* anim)
{
    if (!anim)
    {
        return;
    }
    animation = anim;
    movement = 0;
    frame = 0.0;
    max_frames = animation->maxFrames(0);
    pose.assign(animation->getJointCount(), toPoseMatrix(glm::mat4(1.0f)));
}

void Model::animate(double dt)
{
    if (!animation)
    {
        return;
    }
    frame = animation->animate(dt, frame, movement, pose);
    // An empty movement never completes
    if (max_frames > 0 && static_cast<int>(frame) >= max_frames)
    {
        frame = 0.0;
        if (loop_callback)
        {
            loop_callback();
        }
    }
}

bool Model::playMovement(int index, std::function<void()> done)
{
    loop_callback = nullptr;
    if (animation)
    {
        loop_callback = std::move(done);
        movement = animation->playMovement(index);
        max_frames = animation->maxFrames(movement);
        frame = 0.0;
    }
    return index == movement;
}

std::vector<std::string> Model::getMovements() const
{
    if (animation)
    {
        return animation->getMovementNames();
    }
    return {};
}

UniformResolution Model::resolveUniform(const std::string& uniform) const
{
    if (findBuiltinUniform(uniform))
    {
        return UniformResolution::Builtin;
    }
    if (user_uniforms.find(uniform) != user_uniforms.end())
    {
        return UniformResolution::User;
    }
    return UniformResolution::Missing;
}

void Model::bindBuiltin(const BuiltinUniform& builtin, int location)
{
    switch (builtin.source)
    {
    case BuiltinSource::ModelViewProjection:
        ctx.bindUniform(location, UniformType::Mat4, 1, glm::value_ptr(mvp));
        break;
    case BuiltinSource::ModelView:
        ctx.bindUniform(location, UniformType::Mat4, 1, glm::value_ptr(mv));
        break;
    case BuiltinSource::NormalMatrix:
    {
        glm::mat3 nm(mv);
        ctx.bindUniform(location, UniformType::Mat3, 1, glm::value_ptr(nm));
        break;
    }
    case BuiltinSource::Pose:
        if (!pose.empty())
        {
            ctx.bindUniform(location, UniformType::Mat3x4, static_cast<int>(pose.size()), glm::value_ptr(pose[0]));
        }
        break;
    case BuiltinSource::TextureUnit:
        if (Texture* texture = getTexture(builtin.unit))
        {
            ctx.useTexture(location, builtin.unit, texture->getTextureID());
        }
        else if (uniformWarningsEnabled())
        {
            VU_LOG_WARN("No texture at unit {} for mesh {} shader {}", builtin.unit, getName(), shader->getName());
        }
        break;
    case BuiltinSource::Scale:
        ctx.bindUniform(location, UniformType::Float3, 1, glm::value_ptr(scale));
        break;
    case BuiltinSource::Alpha:
        ctx.bindUniform(location, UniformType::Float1, 1, &alpha);
        break;
    case BuiltinSource::Time:
    {
        float seconds = std::chrono::duration<float>(std::chrono::steady_clock::now() - created).count();
        ctx.bindUniform(location, UniformType::Float1, 1, &seconds);
        break;
    }
    }
}

void Model::bindUserUniform(const std::string& uniform, int location, const std::vector<float>& values)
{
    switch (values.size())
    {
    case 1:
        ctx.bindUniform(location, UniformType::Float1, 1, values.data());
        break;
    case 2:
        ctx.bindUniform(location, UniformType::Float2, 1, values.data());
        break;
    case 3:
        ctx.bindUniform(location, UniformType::Float3, 1, values.data());
        break;
    case 4:
        ctx.bindUniform(location, UniformType::Float4, 1, values.data());
        break;
    default:
        VU_LOG_WARN("Uniform {} for mesh {} has {} values", uniform, getName(), values.size());
        break;
    }
}

void Model::bindUniforms()
{
    if (!shader)
    {
        return;
    }
    for (const auto& [uniform, location] : shader->getUniforms())
    {
        if (const BuiltinUniform* builtin = findBuiltinUniform(uniform))
        {
            bindBuiltin(*builtin, location);
        }
        else if (auto it = user_uniforms.find(uniform); it != user_uniforms.end())
        {
            bindUserUniform(uniform, location, it->second);
        }
        else if (uniformWarningsEnabled())
        {
            VU_LOG_WARN("No uniform {} for mesh {} shader {}", uniform, getName(), shader->getName());
        }
    }
}

std::optional<RenderError> Model::verify() const
{
    if (!shader)
    {
        return RenderError(RenderErrorKind::NoShader, "Model has no shader");
    }
    if (!shader->isBound())
    {
        return RenderError(RenderErrorKind::NoShader, "Shader " + shader->getName() + " is not bound", shader->getName());
    }

    // Sorted so the same model always reports the same problem first
    for (const std::string& uniform : sortedNames(shader->getUniforms()))
    {
        if (findBuiltinUniform(uniform))
        {
            continue;
        }

        auto it = user_uniforms.find(uniform);
        if (it == user_uniforms.end())
        {
            return RenderError(RenderErrorKind::MissingUniform,
                               "No uniform " + uniform + " in shader " + shader->getName(), uniform);
        }
        if (it->second.empty() || it->second.size() > 4)
        {
            return RenderError(RenderErrorKind::MissingUniform,
                               "Uniform " + uniform + " in shader " + shader->getName() + " has " +
                               std::to_string(it->second.size()) + " values", uniform);
        }
    }

    const auto& attributes = shader->getAttributes();
    if (!mesh && !attributes.empty())
    {
        return RenderError(RenderErrorKind::MissingAttribute,
                           "Expecting " + std::to_string(attributes.size()) + " buffers for shader " + shader->getName(),
                           shader->getName());
    }
    for (const std::string& attribute : sortedNames(attributes))
    {
        if (!mesh->hasLocation(attributes.at(attribute)))
        {
            return RenderError(RenderErrorKind::MissingAttribute,
                               "No buffer for attribute " + attribute + " in shader " + shader->getName(), attribute);
        }
    }

    if (mesh && !mesh->isValid())
    {
        return RenderError(RenderErrorKind::InconsistentMesh,
                           "Mesh " + mesh->getName() + " has inconsistent vertex data", mesh->getName());
    }
    return std::nullopt;
}

void Model::releaseShader()
{
    if (shader && shader->release())
    {
        shader->releaseGpu(ctx);
    }
    shader = nullptr;
}

void Model::releaseMesh()
{
    if (mesh && mesh->release())
    {
        mesh->releaseGpu(ctx);
    }
    mesh = nullptr;
}

void Model::dispose()
{
    releaseShader();
    releaseMesh();
    for (Texture* texture : textures)
    {
        releaseTexture(texture);
    }
    textures.clear();
}

}
