#include "Renderer.hpp"
#include "GraphicsContext.hpp"
#include "Model.hpp"
#include "Mesh.hpp"
#include "ShaderProgram.hpp"
#include "Texture.hpp"
#include "Utils/Log.hpp"

namespace vu
{

Renderer::Renderer(IGraphicsContext& ctx)
    : ctx(ctx), current_program(INVALID_HANDLE)
{
}

void Renderer::setClearColor(const glm::vec4& color)
{
    ctx.setClearColor(color);
}

void Renderer::clear()
{
    ctx.clear();
}

void Renderer::setViewport(int width, int height)
{
    ctx.setViewport(width, height);
}

void Renderer::enable(RenderFeature feature, bool enabled)
{
    switch (feature)
    {
    case RenderFeature::Blend:
        ctx.setBlend(enabled);
        break;
    case RenderFeature::Cull:
        ctx.setCullFace(enabled);
        break;
    case RenderFeature::Depth:
        ctx.setDepthTest(enabled);
        break;
    }
}

void Renderer::render(Model& model)
{
    Mesh* mesh = model.getMesh();
    ShaderProgram* shader = model.getShader();
    if (!mesh || !shader || !shader->isBound())
    {
        return;
    }
    if (!mesh->isValid())
    {
        VU_LOG_WARN("Render skipped, mesh '{}' is not valid", mesh->getName());
        return;
    }

    ctx.setDepthTest(!model.is2D());
    ctx.setCullFace(model.isCullEnabled());

    // switch programs only if necessary
    if (shader->getProgramID() != current_program)
    {
        ctx.useProgram(shader->getProgramID());
        current_program = shader->getProgramID();
    }

    model.bindUniforms();
    if (mesh->needsRebind() || !mesh->isBound())
    {
        if (auto err = mesh->bind(ctx))
        {
            VU_LOG_ERROR("Render skipped: {}", err->message);
            return;
        }
    }

    ctx.bindVertexArray(mesh->getVAO());
    const int face_count = static_cast<int>(mesh->getFaceCount());
    const auto& textures = model.getTextures();
    switch (model.getDrawMode())
    {
    case DrawMode::Lines:
        ctx.setLineMode(true);
        ctx.drawElements(DrawMode::Lines, face_count, 0);
        ctx.setLineMode(false);
        break;
    case DrawMode::Points:
        ctx.setProgramPointSize(true);
        ctx.drawArrays(DrawMode::Points, 0, static_cast<int>(mesh->getVertexCount()));
        ctx.setProgramPointSize(false);
        break;
    case DrawMode::Triangles:
        if (textures.size() > 1 && textures[0] && textures[0]->getFaceCount() > 0)
        {
            // Several textures over one mesh: same sampler, one draw per triangle range.
            for (Texture* texture : textures)
            {
                ctx.bindTexture(texture->getTextureID());
                ctx.drawElements(DrawMode::Triangles, texture->getFaceCount() * 3, texture->getFirstFace() * 3);
            }
        }
        else if (face_count == 0)
        {
            VU_LOG_WARN("Render mesh '{}' has no faces", mesh->getName());
        }
        else
        {
            ctx.drawElements(DrawMode::Triangles, face_count, 0);
        }
        break;
    }
    ctx.setDepthTest(false);
}

}
