#pragma once

#include "Graphics/RenderTypes.hpp"
#include <glm/glm.hpp>

namespace vu
{

class IGraphicsContext;
class Model;

// Per frame state toggled with Renderer::enable
enum class RenderFeature
{
    Blend,
    Cull,
    Depth
};

// Issues the draw calls for models.
class Renderer
{
private:
    IGraphicsContext& ctx;
    GpuHandle current_program;

public:
    explicit Renderer(IGraphicsContext& ctx);

    void setClearColor(const glm::vec4& color);
    void clear();
    void setViewport(int width, int height);
    void enable(RenderFeature feature, bool enabled);

    // Draw one model with its own depth, cull and draw mode settings.
    // Models without a mesh or shader, or with an invalid mesh, are skipped.
    void render(Model& model);

    // Forget the cached program, e.g. after programs were deleted
    void resetState() { current_program = INVALID_HANDLE; }
};

}
