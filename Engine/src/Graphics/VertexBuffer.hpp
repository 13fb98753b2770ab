#pragma once

#include "Graphics/RenderTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

namespace vu
{

// Per-vertex data is either all floats or all bytes.
using VertexData = std::variant<std::vector<float>, std::vector<uint8_t>>;

// CPU side copy of one vertex attribute stream, bound to a shader layout location.
class VertexBuffer
{
private:
    uint32_t slot;
    int span;
    UsageHint usage;
    bool normalize;
    VertexData data;
    bool kind_fixed;
    size_t vertex_count;
    bool needs_upload;
    GpuHandle buffer_id;

public:
    VertexBuffer(uint32_t slot, int span, UsageHint usage = UsageHint::Static, bool normalize = false);

    // Replace the contents, keeping allocated memory. The first call fixes the
    // data kind; a later call with the other kind is rejected.
    bool set(const std::vector<float>& floats);
    bool set(const std::vector<uint8_t>& bytes);

    void setUsage(UsageHint hint);

    uint32_t getSlot() const { return slot; }
    int getSpan() const { return span; }
    UsageHint getUsage() const { return usage; }
    bool isNormalized() const { return normalize; }
    DataKind getDataKind() const;

    const std::vector<float>* getFloats() const { return std::get_if<std::vector<float>>(&data); }
    const std::vector<uint8_t>* getBytes() const { return std::get_if<std::vector<uint8_t>>(&data); }

    size_t getElementCount() const;
    size_t getCapacityBytes() const;
    size_t getByteSize() const;
    size_t getVertexCount() const { return vertex_count; }
    bool isEmpty() const { return getElementCount() == 0; }

    bool needsUpload() const { return needs_upload; }
    void markUploaded() { needs_upload = false; }
    void markDirty() { needs_upload = true; }

    GpuHandle getHandle() const { return buffer_id; }
    void setHandle(GpuHandle handle) { buffer_id = handle; }
};

// Triangle or line indices into slot 0's vertices.
class IndexBuffer
{
private:
    std::vector<uint16_t> indices;
    UsageHint usage;
    bool needs_upload;
    GpuHandle buffer_id;

public:
    explicit IndexBuffer(UsageHint usage = UsageHint::Static);

    void set(const std::vector<uint16_t>& data);
    void setUsage(UsageHint hint);

    const std::vector<uint16_t>& getIndices() const { return indices; }
    UsageHint getUsage() const { return usage; }
    size_t getCount() const { return indices.size(); }
    size_t getByteSize() const { return indices.size() * sizeof(uint16_t); }

    bool needsUpload() const { return needs_upload; }
    void markUploaded() { needs_upload = false; }
    void markDirty() { needs_upload = true; }

    GpuHandle getHandle() const { return buffer_id; }
    void setHandle(GpuHandle handle) { buffer_id = handle; }
};

}
