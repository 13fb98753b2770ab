#include "ResourceManager.hpp"
#include "GraphicsContext.hpp"
#include "Utils/Log.hpp"

namespace vu
{

namespace
{
    template <typename T>
    T* findOrCreate(std::unordered_map<std::string, std::unique_ptr<T>>& table, const std::string& name, const char* kind)
    {
        auto it = table.find(name);
        if (it != table.end())
        {
            VU_LOG_TRACE("{} '{}' already loaded", kind, name);
            return it->second.get();
        }
        auto inserted = table.emplace(name, std::make_unique<T>(name));
        return inserted.first->second.get();
    }

    template <typename T>
    T* lookup(const std::unordered_map<std::string, std::unique_ptr<T>>& table, const std::string& name, const char* kind)
    {
        auto it = table.find(name);
        if (it != table.end())
        {
            return it->second.get();
        }
        VU_LOG_WARN("{} '{}' not found", kind, name);
        return nullptr;
    }
}

ResourceManager::ResourceManager(IGraphicsContext& ctx)
    : ctx(ctx)
{
}

ResourceManager::~ResourceManager()
{
    clear();
}

Mesh* ResourceManager::createMesh(const std::string& name)
{
    return findOrCreate(meshes, name, "Mesh");
}

Texture* ResourceManager::createTexture(const std::string& name)
{
    return findOrCreate(textures, name, "Texture");
}

Animation* ResourceManager::createAnimation(const std::string& name)
{
    return findOrCreate(animations, name, "Animation");
}

ShaderProgram* ResourceManager::loadShader(const std::string& name, const std::vector<std::string>& vertex_src,
                                           const std::vector<std::string>& fragment_src, std::optional<RenderError>* err)
{
    auto it = shaders.find(name);
    if (it != shaders.end())
    {
        VU_LOG_TRACE("Shader '{}' already loaded", name);
        return it->second.get();
    }

    auto shader = std::make_unique<ShaderProgram>(name);
    shader->setSource(vertex_src, fragment_src);
    std::optional<RenderError> result = shader->bind(ctx);
    if (err)
    {
        *err = result;
    }
    if (result)
    {
        VU_LOG_ERROR("Failed to load shader '{}'", name);
        return nullptr;
    }

    ShaderProgram* loaded = shader.get();
    shaders[name] = std::move(shader);
    VU_LOG_INFO("Shader '{}' loaded and cached", name);
    return loaded;
}

Mesh* ResourceManager::getMesh(const std::string& name) const
{
    return lookup(meshes, name, "Mesh");
}

ShaderProgram* ResourceManager::getShader(const std::string& name) const
{
    return lookup(shaders, name, "Shader");
}

Texture* ResourceManager::getTexture(const std::string& name) const
{
    return lookup(textures, name, "Texture");
}

Animation* ResourceManager::getAnimation(const std::string& name) const
{
    return lookup(animations, name, "Animation");
}

void ResourceManager::clear()
{
    for (auto& [name, mesh] : meshes)
    {
        mesh->releaseGpu(ctx);
    }
    for (auto& [name, shader] : shaders)
    {
        shader->releaseGpu(ctx);
    }
    for (auto& [name, texture] : textures)
    {
        texture->releaseGpu(ctx);
    }
    meshes.clear();
    shaders.clear();
    textures.clear();
    animations.clear();
}

}
