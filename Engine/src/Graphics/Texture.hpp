#pragma once

#include "Graphics/GpuResource.hpp"
#include <cstdint>
#include <vector>

namespace vu
{

// An RGBA8 image sampled by shaders. f0 and fn tag the triangle range the
// texture covers when one mesh uses several textures.
class Texture : public GpuResource
{
private:
    int width;
    int height;
    std::vector<uint8_t> pixels;
    GpuHandle texture_id;
    bool repeat;
    int f0;
    int fn;

public:
    explicit Texture(const std::string& name);
    ~Texture() override;

    // pixels holds width * height * 4 bytes
    bool setImage(int width, int height, const std::vector<uint8_t>& rgba);

    // CPU copy is not needed once uploaded
    void freeImage();
    bool hasImage() const { return !pixels.empty(); }

    int getWidth() const { return width; }
    int getHeight() const { return height; }
    const std::vector<uint8_t>& getPixels() const { return pixels; }

    GpuHandle getTextureID() const { return texture_id; }

    // Wrap mode: repeat, or clamp to edge
    void setRepeat(bool enabled) { repeat = enabled; }
    bool isRepeat() const { return repeat; }

    void setFaceRange(int first, int count) { f0 = first; fn = count; }
    int getFirstFace() const { return f0; }
    int getFaceCount() const { return fn; }

    // GpuResource implementation
    std::optional<RenderError> bind(IGraphicsContext& ctx) override;
    void releaseGpu(IGraphicsContext& ctx) override;
    bool isBound() const override { return texture_id != INVALID_HANDLE; }
};

}
