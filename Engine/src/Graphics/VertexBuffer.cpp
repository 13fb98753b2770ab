#include "VertexBuffer.hpp"
#include "Utils/Log.hpp"

namespace vu
{

VertexBuffer::VertexBuffer(uint32_t slot, int span, UsageHint usage, bool normalize)
    : slot(slot), span(span), usage(UsageHint::Static), normalize(normalize),
      kind_fixed(false), vertex_count(0), needs_upload(false), buffer_id(INVALID_HANDLE)
{
    setUsage(usage);
}

bool VertexBuffer::set(const std::vector<float>& floats)
{
    if (kind_fixed && !std::holds_alternative<std::vector<float>>(data))
    {
        VU_LOG_WARN("Vertex buffer {} holds byte data, float data rejected", slot);
        return false;
    }
    if (!kind_fixed)
    {
        data = std::vector<float>();
        kind_fixed = true;
    }

    std::vector<float>& store = std::get<std::vector<float>>(data);
    store.assign(floats.begin(), floats.end());
    vertex_count = span > 0 ? store.size() / span : 0;
    needs_upload = true;
    return true;
}

bool VertexBuffer::set(const std::vector<uint8_t>& bytes)
{
    if (kind_fixed && !std::holds_alternative<std::vector<uint8_t>>(data))
    {
        VU_LOG_WARN("Vertex buffer {} holds float data, byte data rejected", slot);
        return false;
    }
    if (!kind_fixed)
    {
        data = std::vector<uint8_t>();
        kind_fixed = true;
    }

    std::vector<uint8_t>& store = std::get<std::vector<uint8_t>>(data);
    store.assign(bytes.begin(), bytes.end());
    vertex_count = span > 0 ? store.size() / span : 0;
    needs_upload = true;
    return true;
}

void VertexBuffer::setUsage(UsageHint hint)
{
    switch (hint)
    {
    case UsageHint::Static:
    case UsageHint::Dynamic:
        usage = hint;
        break;
    }
}

DataKind VertexBuffer::getDataKind() const
{
    return std::holds_alternative<std::vector<uint8_t>>(data) ? DataKind::Byte : DataKind::Float;
}

size_t VertexBuffer::getElementCount() const
{
    return std::visit([](const auto& store) { return store.size(); }, data);
}

size_t VertexBuffer::getCapacityBytes() const
{
    if (const std::vector<float>* floats = getFloats())
    {
        return floats->capacity() * sizeof(float);
    }
    return getBytes()->capacity();
}

size_t VertexBuffer::getByteSize() const
{
    if (const std::vector<float>* floats = getFloats())
    {
        return floats->size() * sizeof(float);
    }
    return getBytes()->size();
}

IndexBuffer::IndexBuffer(UsageHint usage)
    : usage(UsageHint::Static), needs_upload(false), buffer_id(INVALID_HANDLE)
{
    setUsage(usage);
}

void IndexBuffer::set(const std::vector<uint16_t>& data)
{
    indices.assign(data.begin(), data.end());
    needs_upload = true;
}

void IndexBuffer::setUsage(UsageHint hint)
{
    switch (hint)
    {
    case UsageHint::Static:
    case UsageHint::Dynamic:
        usage = hint;
        break;
    }
}

}
