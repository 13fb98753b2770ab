#pragma once

#include "Graphics/Mesh.hpp"
#include "Graphics/ShaderProgram.hpp"
#include "Graphics/Texture.hpp"
#include "Graphics/Animation.hpp"
#include <memory>
#include <string>
#include <unordered_map>

namespace vu
{

// Owns the shared render data by name. Models only hold pointers.
class ResourceManager
{
private:
    IGraphicsContext& ctx;
    std::unordered_map<std::string, std::unique_ptr<Mesh>> meshes;
    std::unordered_map<std::string, std::unique_ptr<ShaderProgram>> shaders;
    std::unordered_map<std::string, std::unique_ptr<Texture>> textures;
    std::unordered_map<std::string, std::unique_ptr<Animation>> animations;

public:
    explicit ResourceManager(IGraphicsContext& ctx);
    ~ResourceManager();

    ResourceManager(const ResourceManager&) = delete;
    ResourceManager& operator=(const ResourceManager&) = delete;

    // Returns the existing entry when the name is already taken
    Mesh* createMesh(const std::string& name);
    Texture* createTexture(const std::string& name);
    Animation* createAnimation(const std::string& name);

    // Create, set the source and bind. Returns nullptr when the program does
    // not compile or link; err receives the reason.
    ShaderProgram* loadShader(const std::string& name, const std::vector<std::string>& vertex_src,
                              const std::vector<std::string>& fragment_src, std::optional<RenderError>* err = nullptr);

    Mesh* getMesh(const std::string& name) const;
    ShaderProgram* getShader(const std::string& name) const;
    Texture* getTexture(const std::string& name) const;
    Animation* getAnimation(const std::string& name) const;

    // Release GPU objects and free everything
    void clear();
};

}
