#pragma once

#include "Graphics/RenderTypes.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace vu
{

class IGraphicsContext;

// Shared GPU backed data (meshes, shaders, textures). Models acquire a
// reference when they adopt the resource; the GPU side is freed by the
// holder that drops the last reference.
class GpuResource
{
protected:
    std::string name;
    uint32_t ref_count;

public:
    explicit GpuResource(const std::string& name);
    virtual ~GpuResource() = default;

    GpuResource(const GpuResource&) = delete;
    GpuResource& operator=(const GpuResource&) = delete;

    const std::string& getName() const { return name; }
    uint32_t getRefCount() const { return ref_count; }

    void acquire();

    // Returns true when the last reference was dropped.
    // Releasing an unreferenced resource throws std::logic_error.
    bool release();

    // Upload to the GPU
    virtual std::optional<RenderError> bind(IGraphicsContext& ctx) = 0;

    // Delete the GPU objects; the CPU data is kept so the resource can be bound again
    virtual void releaseGpu(IGraphicsContext& ctx) = 0;

    virtual bool isBound() const = 0;
};

}
