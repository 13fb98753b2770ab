#include "GraphicsContext.hpp"
#include "OpenGLGraphicsContext.hpp"
#include "HeadlessGraphicsContext.hpp"
#include "Console/ConVar.hpp"

namespace vu
{

// Factory implementation
std::unique_ptr<IGraphicsContext> CreateGraphicsContext(GraphicsContextType type)
{
    InitializeDefaultCVars();

    switch (type)
    {
    case GraphicsContextType::OpenGL:
        return std::make_unique<OpenGLGraphicsContext>();
    case GraphicsContextType::Headless:
        return std::make_unique<HeadlessGraphicsContext>();
    default:
        return nullptr;
    }
}

}
