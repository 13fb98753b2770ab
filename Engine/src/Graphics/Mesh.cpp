#include "Mesh.hpp"
#include "GraphicsContext.hpp"
#include "Utils/Log.hpp"

namespace vu
{

Mesh::Mesh(const std::string& name)
    : GpuResource(name), vao(INVALID_HANDLE), rebind(false)
{
}

Mesh::~Mesh()
{
    if (vao != INVALID_HANDLE)
    {
        VU_LOG_WARN("Mesh '{}' destroyed with GPU data still bound", name);
    }
}

Mesh& Mesh::initData(uint32_t slot, int span, UsageHint usage, bool normalize)
{
    if (slot >= MAX_SLOTS || span <= 0)
    {
        VU_LOG_WARN("Mesh '{}': invalid vertex data slot {} span {}", name, slot, span);
        return *this;
    }
    if (buffers.find(slot) == buffers.end())
    {
        buffers.emplace(slot, VertexBuffer(slot, span, usage, normalize));
    }
    return *this;
}

template <typename T>
Mesh& Mesh::setSlotData(uint32_t slot, const std::vector<T>& data)
{
    auto it = buffers.find(slot);
    if (it == buffers.end())
    {
        return *this;
    }
    if (it->second.set(data))
    {
        rebind = true;
    }
    else
    {
        VU_LOG_WARN("Mesh '{}': slot {} keeps its previous data", name, slot);
    }
    return *this;
}

Mesh& Mesh::setData(uint32_t slot, const std::vector<float>& data)
{
    return setSlotData(slot, data);
}

Mesh& Mesh::setData(uint32_t slot, const std::vector<uint8_t>& data)
{
    return setSlotData(slot, data);
}

Mesh& Mesh::initFaces(UsageHint usage)
{
    if (!faces)
    {
        faces = std::make_unique<IndexBuffer>(usage);
    }
    return *this;
}

Mesh& Mesh::setFaces(const std::vector<uint16_t>& indices)
{
    if (faces)
    {
        faces->set(indices);
        rebind = true;
    }
    return *this;
}

bool Mesh::isValid() const
{
    auto first = buffers.find(0);
    if (first == buffers.end())
    {
        return false;
    }
    const VertexBuffer& positions = first->second;
    if (positions.getDataKind() != DataKind::Float || positions.getVertexCount() == 0)
    {
        return false;
    }
    for (const auto& [slot, buffer] : buffers)
    {
        if (!buffer.isEmpty() && buffer.getVertexCount() != positions.getVertexCount())
        {
            return false;
        }
    }
    return true;
}

size_t Mesh::getVertexCount() const
{
    auto first = buffers.find(0);
    if (first == buffers.end() || first->second.getDataKind() != DataKind::Float)
    {
        return 0;
    }
    return first->second.getVertexCount();
}

size_t Mesh::getByteSize() const
{
    size_t bytes = 0;
    for (const auto& [slot, buffer] : buffers)
    {
        bytes += buffer.getByteSize();
    }
    if (faces)
    {
        bytes += faces->getByteSize();
    }
    return bytes;
}

size_t Mesh::getFaceCount() const
{
    return faces ? faces->getCount() : 0;
}

bool Mesh::hasLocation(int slot) const
{
    return slot >= 0 && buffers.find(static_cast<uint32_t>(slot)) != buffers.end();
}

const VertexBuffer* Mesh::getBuffer(uint32_t slot) const
{
    auto it = buffers.find(slot);
    return it != buffers.end() ? &it->second : nullptr;
}

std::optional<RenderError> Mesh::bind(IGraphicsContext& ctx)
{
    if (GpuError err = ctx.getError(); err != NO_GPU_ERROR)
    {
        VU_LOG_WARN("Mesh '{}' bind found prior error 0x{:X}", name, err);
    }

    // Reuse the existing vertex array
    if (vao == INVALID_HANDLE)
    {
        vao = ctx.createVertexArray();
    }
    ctx.bindVertexArray(vao);

    // Buffers stay dirty until the driver accepts the upload
    std::vector<VertexBuffer*> uploaded;
    for (auto& [slot, buffer] : buffers)
    {
        if (!buffer.needsUpload() || buffer.isEmpty())
        {
            continue;
        }
        if (buffer.getHandle() == INVALID_HANDLE)
        {
            buffer.setHandle(ctx.createBuffer());
        }
        ctx.uploadVertexBuffer(buffer);
        uploaded.push_back(&buffer);
    }
    if (GpuError err = ctx.getError(); err != NO_GPU_ERROR)
    {
        VU_LOG_ERROR("Mesh '{}' failed to bind vertex buffers 0x{:X}", name, err);
        return RenderError(RenderErrorKind::BindFailed, "Failed to bind vertex buffers for mesh " + name, name);
    }
    for (VertexBuffer* buffer : uploaded)
    {
        buffer->markUploaded();
    }

    if (faces && faces->needsUpload() && faces->getCount() > 0)
    {
        if (faces->getHandle() == INVALID_HANDLE)
        {
            faces->setHandle(ctx.createBuffer());
        }
        ctx.uploadIndexBuffer(*faces);
        if (GpuError err = ctx.getError(); err != NO_GPU_ERROR)
        {
            VU_LOG_ERROR("Mesh '{}' failed to bind face buffer 0x{:X}", name, err);
            return RenderError(RenderErrorKind::BindFailed, "Failed to bind face buffer for mesh " + name, name);
        }
        faces->markUploaded();
    }

    rebind = false;
    return std::nullopt;
}

void Mesh::releaseGpu(IGraphicsContext& ctx)
{
    for (auto& [slot, buffer] : buffers)
    {
        if (buffer.getHandle() != INVALID_HANDLE)
        {
            ctx.deleteBuffer(buffer.getHandle());
            buffer.setHandle(INVALID_HANDLE);
        }
        buffer.markDirty();
    }
    if (faces)
    {
        if (faces->getHandle() != INVALID_HANDLE)
        {
            ctx.deleteBuffer(faces->getHandle());
            faces->setHandle(INVALID_HANDLE);
        }
        faces->markDirty();
    }
    if (vao != INVALID_HANDLE)
    {
        ctx.deleteVertexArray(vao);
        vao = INVALID_HANDLE;
    }
    rebind = true;
}

}
