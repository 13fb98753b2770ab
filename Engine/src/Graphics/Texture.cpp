#include "Texture.hpp"
#include "GraphicsContext.hpp"
#include "Utils/Log.hpp"

namespace vu
{

Texture::Texture(const std::string& name)
    : GpuResource(name), width(0), height(0), texture_id(INVALID_HANDLE), repeat(false), f0(0), fn(0)
{
}

Texture::~Texture()
{
    if (texture_id != INVALID_HANDLE)
    {
        VU_LOG_WARN("Texture '{}' destroyed with GPU data still bound", name);
    }
}

bool Texture::setImage(int w, int h, const std::vector<uint8_t>& rgba)
{
    if (w <= 0 || h <= 0 || rgba.size() != static_cast<size_t>(w) * static_cast<size_t>(h) * 4)
    {
        VU_LOG_WARN("Texture '{}': image {}x{} does not match {} bytes of RGBA data", name, w, h, rgba.size());
        return false;
    }
    width = w;
    height = h;
    pixels = rgba;
    return true;
}

void Texture::freeImage()
{
    pixels.clear();
    pixels.shrink_to_fit();
}

std::optional<RenderError> Texture::bind(IGraphicsContext& ctx)
{
    if (GpuError err = ctx.getError(); err != NO_GPU_ERROR)
    {
        VU_LOG_WARN("Texture '{}' bind found prior error 0x{:X}", name, err);
    }
    if (pixels.empty())
    {
        return RenderError(RenderErrorKind::BindFailed, "Texture " + name + " has no image", name);
    }

    if (texture_id == INVALID_HANDLE)
    {
        texture_id = ctx.createTexture();
    }
    ctx.uploadTexture(texture_id, width, height, pixels);
    ctx.updateTextureMode(texture_id, repeat);

    if (GpuError err = ctx.getError(); err != NO_GPU_ERROR)
    {
        VU_LOG_ERROR("Failed binding texture '{}' 0x{:X}", name, err);
        return RenderError(RenderErrorKind::BindFailed, "Failed binding texture " + name, name);
    }
    return std::nullopt;
}

void Texture::releaseGpu(IGraphicsContext& ctx)
{
    if (texture_id != INVALID_HANDLE)
    {
        ctx.deleteTexture(texture_id);
        texture_id = INVALID_HANDLE;
    }
}

}
