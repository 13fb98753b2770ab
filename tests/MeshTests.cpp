#include "Graphics/Mesh.hpp"
#include "Graphics/HeadlessGraphicsContext.hpp"
#include "TestShaders.hpp"
#include <gtest/gtest.h>

using namespace vu;

class MeshTests : public ::testing::Test
{
protected:
    HeadlessGraphicsContext ctx;
    Mesh mesh{ "tri" };

    void SetUp() override
    {
        ASSERT_TRUE(ctx.initialize(nullptr));
        mesh.initData(0, 3).setData(0, test::triangleVertices());
        mesh.initFaces().setFaces({ 0, 1, 2 });
    }

    void TearDown() override
    {
        mesh.releaseGpu(ctx);
    }

    const HeadlessGraphicsContext::BufferRecord* record(uint32_t slot) const
    {
        const VertexBuffer* buffer = mesh.getBuffer(slot);
        return buffer ? ctx.getBufferRecord(buffer->getHandle()) : nullptr;
    }
};

// =================================================================================================
// Vertex data
// =================================================================================================

TEST_F(MeshTests, VertexCountComesFromSlotZero)
{
    EXPECT_EQ(mesh.getVertexCount(), 3u);
    EXPECT_EQ(mesh.getFaceCount(), 3u);
    EXPECT_TRUE(mesh.isValid());
    EXPECT_TRUE(mesh.needsRebind());
}

TEST_F(MeshTests, InitDataIsIdempotent)
{
    mesh.initData(0, 2, UsageHint::Dynamic);
    ASSERT_NE(mesh.getBuffer(0), nullptr);
    EXPECT_EQ(mesh.getBuffer(0)->getSpan(), 3);
    EXPECT_EQ(mesh.getBuffer(0)->getUsage(), UsageHint::Static);
    EXPECT_EQ(mesh.getVertexCount(), 3u);
}

TEST_F(MeshTests, InvalidSlotOrSpanIsRejected)
{
    mesh.initData(Mesh::MAX_SLOTS, 3);
    mesh.initData(2, 0);
    EXPECT_EQ(mesh.getBuffer(Mesh::MAX_SLOTS), nullptr);
    EXPECT_EQ(mesh.getBuffer(2), nullptr);
}

TEST_F(MeshTests, DataForUninitializedSlotIsIgnored)
{
    mesh.setData(4, std::vector<float>{ 1.0f, 2.0f });
    EXPECT_EQ(mesh.getBuffer(4), nullptr);
    EXPECT_FALSE(mesh.hasLocation(4));
    EXPECT_TRUE(mesh.isValid());
}

TEST_F(MeshTests, MismatchedVertexCountIsInvalid)
{
    mesh.initData(1, 2).setData(1, std::vector<float>{ 0.0f, 0.0f, 1.0f, 1.0f });
    EXPECT_FALSE(mesh.isValid()) << "Two texcoords for three positions";

    mesh.setData(1, std::vector<float>{ 0.0f, 0.0f, 1.0f, 0.0f, 0.0f, 1.0f });
    EXPECT_TRUE(mesh.isValid());
}

TEST_F(MeshTests, EmptySlotDoesNotBreakValidity)
{
    mesh.initData(2, 3);
    EXPECT_TRUE(mesh.hasLocation(2));
    EXPECT_TRUE(mesh.isValid());
}

TEST_F(MeshTests, MeshWithoutPositionsIsInvalid)
{
    Mesh empty("empty");
    EXPECT_FALSE(empty.isValid());
    EXPECT_EQ(empty.getVertexCount(), 0u);

    empty.initData(0, 3);
    EXPECT_FALSE(empty.isValid()) << "Slot 0 initialized but holds no vertices";
}

TEST_F(MeshTests, ByteColoursCountVertices)
{
    mesh.initData(1, 4, UsageHint::Static, true).setData(1, std::vector<uint8_t>(12, 200));

    const VertexBuffer* colours = mesh.getBuffer(1);
    ASSERT_NE(colours, nullptr);
    EXPECT_EQ(colours->getDataKind(), DataKind::Byte);
    EXPECT_TRUE(colours->isNormalized());
    EXPECT_EQ(colours->getVertexCount(), 3u);
    EXPECT_TRUE(mesh.isValid());
}

TEST_F(MeshTests, BytePositionsAreInvalid)
{
    Mesh bytes("bytes");
    bytes.initData(0, 3).setData(0, std::vector<uint8_t>(9, 1));
    EXPECT_FALSE(bytes.isValid());
}

TEST_F(MeshTests, DataKindCannotChange)
{
    mesh.initData(1, 2).setData(1, std::vector<float>{ 0.0f, 0.0f, 1.0f, 0.0f, 0.0f, 1.0f });
    mesh.setData(1, std::vector<uint8_t>(6, 1));

    const VertexBuffer* uvs = mesh.getBuffer(1);
    ASSERT_NE(uvs, nullptr);
    EXPECT_EQ(uvs->getDataKind(), DataKind::Float);
    EXPECT_EQ(uvs->getElementCount(), 6u);
    ASSERT_NE(uvs->getFloats(), nullptr);
    EXPECT_FLOAT_EQ((*uvs->getFloats())[2], 1.0f);
}

TEST_F(MeshTests, ByteSizeSumsAllStreams)
{
    // 9 floats and 3 indices
    EXPECT_EQ(mesh.getByteSize(), 9u * sizeof(float) + 3u * sizeof(uint16_t));

    mesh.initData(1, 4).setData(1, std::vector<uint8_t>(12, 0));
    EXPECT_EQ(mesh.getByteSize(), 9u * sizeof(float) + 12u + 3u * sizeof(uint16_t));
}

// =================================================================================================
// GPU binding
// =================================================================================================

TEST_F(MeshTests, BindUploadsBuffers)
{
    auto err = mesh.bind(ctx);
    ASSERT_FALSE(err.has_value()) << err->message;

    EXPECT_TRUE(mesh.isBound());
    EXPECT_FALSE(mesh.needsRebind());
    EXPECT_EQ(ctx.liveVertexArrayCount(), 1u);
    EXPECT_EQ(ctx.liveBufferCount(), 2u) << "Position and index buffers";

    const auto* positions = record(0);
    ASSERT_NE(positions, nullptr);
    EXPECT_EQ(positions->slot, 0);
    EXPECT_EQ(positions->span, 3);
    EXPECT_EQ(positions->data_bytes, 9u * sizeof(float));
    EXPECT_EQ(positions->upload_count, 1);

    const auto* faces = ctx.getBufferRecord(mesh.getFaces()->getHandle());
    ASSERT_NE(faces, nullptr);
    EXPECT_EQ(faces->data_bytes, 6u);
}

TEST_F(MeshTests, RebindUploadsOnlyChangedSlots)
{
    mesh.initData(1, 2).setData(1, std::vector<float>{ 0.0f, 0.0f, 1.0f, 0.0f, 0.0f, 1.0f });
    ASSERT_FALSE(mesh.bind(ctx).has_value());
    GpuHandle vao = mesh.getVAO();

    mesh.setData(1, std::vector<float>{ 1.0f, 1.0f, 0.0f, 1.0f, 1.0f, 0.0f });
    EXPECT_TRUE(mesh.needsRebind());
    ASSERT_FALSE(mesh.bind(ctx).has_value());

    EXPECT_EQ(mesh.getVAO(), vao);
    EXPECT_EQ(record(0)->upload_count, 1);
    EXPECT_EQ(record(1)->upload_count, 2);
    EXPECT_EQ(ctx.getBufferRecord(mesh.getFaces()->getHandle())->upload_count, 1);
}

TEST_F(MeshTests, DynamicBuffersAreOrphaned)
{
    Mesh dynamic("dynamic");
    dynamic.initData(0, 3, UsageHint::Dynamic).setData(0, test::triangleVertices());
    ASSERT_FALSE(dynamic.bind(ctx).has_value());

    const auto* buffer = ctx.getBufferRecord(dynamic.getBuffer(0)->getHandle());
    ASSERT_NE(buffer, nullptr);
    EXPECT_TRUE(buffer->orphaned);
    EXPECT_GE(buffer->allocated_bytes, buffer->data_bytes);

    ASSERT_FALSE(mesh.bind(ctx).has_value());
    EXPECT_FALSE(record(0)->orphaned);
    EXPECT_EQ(record(0)->allocated_bytes, record(0)->data_bytes);

    dynamic.releaseGpu(ctx);
}

TEST_F(MeshTests, ByteBufferUploadKeepsNormalizeFlag)
{
    mesh.initData(1, 4, UsageHint::Static, true).setData(1, std::vector<uint8_t>(12, 128));
    ASSERT_FALSE(mesh.bind(ctx).has_value());

    const auto* colours = record(1);
    ASSERT_NE(colours, nullptr);
    EXPECT_EQ(colours->kind, DataKind::Byte);
    EXPECT_TRUE(colours->normalized);
    EXPECT_EQ(colours->data_bytes, 12u);
}

TEST_F(MeshTests, VertexUploadFailureIsReported)
{
    ctx.setFailUploads(true);
    auto err = mesh.bind(ctx);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, RenderErrorKind::BindFailed);
    EXPECT_EQ(err->message, "Failed to bind vertex buffers for mesh tri");
}

TEST_F(MeshTests, FaceUploadFailureIsReported)
{
    ASSERT_FALSE(mesh.bind(ctx).has_value());

    mesh.setFaces({ 2, 1, 0 });
    ctx.setFailUploads(true);
    auto err = mesh.bind(ctx);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, RenderErrorKind::BindFailed);
    EXPECT_EQ(err->message, "Failed to bind face buffer for mesh tri");
}

TEST_F(MeshTests, FailedUploadIsRetriedOnNextBind)
{
    ctx.setFailUploads(true);
    ASSERT_TRUE(mesh.bind(ctx).has_value());
    EXPECT_TRUE(mesh.needsRebind());

    ctx.setFailUploads(false);
    ASSERT_FALSE(mesh.bind(ctx).has_value());
    ASSERT_NE(record(0), nullptr);
    EXPECT_EQ(record(0)->upload_count, 1) << "Vertex data was never sent";
    EXPECT_EQ(record(0)->data_bytes, 36u);
    EXPECT_FALSE(mesh.needsRebind());
}

TEST_F(MeshTests, FailedFaceUploadIsRetriedOnNextBind)
{
    ASSERT_FALSE(mesh.bind(ctx).has_value());

    mesh.setFaces({ 2, 1, 0 });
    ctx.setFailUploads(true);
    ASSERT_TRUE(mesh.bind(ctx).has_value());

    ctx.setFailUploads(false);
    ASSERT_FALSE(mesh.bind(ctx).has_value());
    const auto* faces = ctx.getBufferRecord(mesh.getFaces()->getHandle());
    ASSERT_NE(faces, nullptr);
    EXPECT_EQ(faces->upload_count, 2);
}

TEST_F(MeshTests, PriorErrorDoesNotFailBind)
{
    ctx.injectError(GLError::INVALID_VALUE);
    EXPECT_FALSE(mesh.bind(ctx).has_value());
}

TEST_F(MeshTests, ReleaseGpuAllowsRebind)
{
    ASSERT_FALSE(mesh.bind(ctx).has_value());
    mesh.releaseGpu(ctx);

    EXPECT_FALSE(mesh.isBound());
    EXPECT_TRUE(mesh.needsRebind());
    EXPECT_EQ(ctx.liveVertexArrayCount(), 0u);
    EXPECT_EQ(ctx.liveBufferCount(), 0u);

    ASSERT_FALSE(mesh.bind(ctx).has_value());
    EXPECT_EQ(ctx.liveBufferCount(), 2u);
    EXPECT_EQ(record(0)->upload_count, 1) << "New buffer object after release";
}
