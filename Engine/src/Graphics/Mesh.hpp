#pragma once

#include "Graphics/GpuResource.hpp"
#include "Graphics/VertexBuffer.hpp"
#include <map>
#include <memory>
#include <vector>

namespace vu
{

// Vertex attribute streams keyed by layout location plus one optional index
// stream. Slot 0 holds the vertex positions and decides the vertex count.
class Mesh : public GpuResource
{
public:
    static const uint32_t MAX_SLOTS = 16;

private:
    std::map<uint32_t, VertexBuffer> buffers;
    std::unique_ptr<IndexBuffer> faces;
    GpuHandle vao;
    bool rebind;

public:
    explicit Mesh(const std::string& name);
    ~Mesh() override;

    // A second call for an initialized slot does nothing.
    Mesh& initData(uint32_t slot, int span, UsageHint usage = UsageHint::Static, bool normalize = false);

    // Ignored for slots that were never initialized.
    Mesh& setData(uint32_t slot, const std::vector<float>& data);
    Mesh& setData(uint32_t slot, const std::vector<uint8_t>& data);

    Mesh& initFaces(UsageHint usage = UsageHint::Static);
    Mesh& setFaces(const std::vector<uint16_t>& indices);

    // Slot 0 is float data with at least one vertex and every other
    // populated slot has the same vertex count.
    bool isValid() const;

    size_t getVertexCount() const;
    size_t getByteSize() const;
    size_t getFaceCount() const;
    bool hasLocation(int slot) const;

    const VertexBuffer* getBuffer(uint32_t slot) const;
    const IndexBuffer* getFaces() const { return faces.get(); }

    bool needsRebind() const { return rebind; }
    GpuHandle getVAO() const { return vao; }

    // GpuResource implementation
    std::optional<RenderError> bind(IGraphicsContext& ctx) override;
    void releaseGpu(IGraphicsContext& ctx) override;
    bool isBound() const override { return vao != INVALID_HANDLE; }

private:
    template <typename T>
    Mesh& setSlotData(uint32_t slot, const std::vector<T>& data);
};

}
