#include "Graphics/Renderer.hpp"
#include "Graphics/Model.hpp"
#include "Graphics/Mesh.hpp"
#include "Graphics/ShaderProgram.hpp"
#include "Graphics/Texture.hpp"
#include "Graphics/HeadlessGraphicsContext.hpp"
#include "TestShaders.hpp"
#include <gtest/gtest.h>

using namespace vu;

class RendererTests : public ::testing::Test
{
protected:
    HeadlessGraphicsContext ctx;
    Renderer renderer{ ctx };
    ShaderProgram basic{ "basic" };
    Mesh tri{ "tri" };

    void SetUp() override
    {
        ASSERT_TRUE(ctx.initialize(nullptr));
        basic.setSource(test::BASIC_VERTEX, test::BASIC_FRAGMENT);
        tri.initData(0, 3).setData(0, test::triangleVertices());
        tri.initFaces().setFaces({ 0, 1, 2 });
    }

    void TearDown() override
    {
        basic.releaseGpu(ctx);
        tri.releaseGpu(ctx);
    }
};

TEST_F(RendererTests, FrameStateReachesContext)
{
    renderer.setClearColor(glm::vec4(0.1f, 0.2f, 0.3f, 1.0f));
    renderer.setViewport(640, 480);
    renderer.enable(RenderFeature::Blend, true);
    renderer.clear();

    EXPECT_EQ(ctx.getClearColor(), glm::vec4(0.1f, 0.2f, 0.3f, 1.0f));
    EXPECT_EQ(ctx.getViewportWidth(), 640);
    EXPECT_EQ(ctx.getViewportHeight(), 480);
    EXPECT_TRUE(ctx.isBlendEnabled());
    EXPECT_EQ(ctx.getClearCount(), 1);

    renderer.enable(RenderFeature::Blend, false);
    EXPECT_FALSE(ctx.isBlendEnabled());
}

TEST_F(RendererTests, TrianglesDrawIndexed)
{
    Model model(ctx, &basic);
    model.setMesh(&tri);

    renderer.render(model);

    const auto& draws = ctx.getDrawCalls();
    ASSERT_EQ(draws.size(), 1u);
    EXPECT_EQ(draws[0].mode, DrawMode::Triangles);
    EXPECT_TRUE(draws[0].indexed);
    EXPECT_EQ(draws[0].count, 3);
    EXPECT_EQ(draws[0].first, 0);
    EXPECT_EQ(draws[0].program, basic.getProgramID());
    EXPECT_EQ(draws[0].vao, tri.getVAO());
    EXPECT_TRUE(draws[0].depth_test);
    EXPECT_TRUE(draws[0].cull_face);
    EXPECT_FALSE(ctx.isDepthTestEnabled()) << "Depth test is switched off after each model";
    model.dispose();
}

TEST_F(RendererTests, FlatModelsSkipDepthAndCull)
{
    Model model(ctx, &basic);
    model.setMesh(&tri);
    model.set2D();
    model.setCullOff();

    renderer.render(model);

    ASSERT_EQ(ctx.getDrawCalls().size(), 1u);
    EXPECT_FALSE(ctx.getDrawCalls()[0].depth_test);
    EXPECT_FALSE(ctx.getDrawCalls()[0].cull_face);
    model.dispose();
}

TEST_F(RendererTests, PointsDrawEveryVertex)
{
    Model model(ctx, &basic);
    model.setMesh(&tri);
    model.setDrawMode(DrawMode::Points);

    renderer.render(model);

    ASSERT_EQ(ctx.getDrawCalls().size(), 1u);
    const auto& draw = ctx.getDrawCalls()[0];
    EXPECT_EQ(draw.mode, DrawMode::Points);
    EXPECT_FALSE(draw.indexed);
    EXPECT_EQ(draw.count, 3);
    EXPECT_TRUE(draw.program_point_size);
    model.dispose();
}

TEST_F(RendererTests, LinesDrawInLineMode)
{
    Model model(ctx, &basic);
    model.setMesh(&tri);
    model.setDrawMode(DrawMode::Lines);

    renderer.render(model);

    ASSERT_EQ(ctx.getDrawCalls().size(), 1u);
    EXPECT_EQ(ctx.getDrawCalls()[0].mode, DrawMode::Lines);
    EXPECT_TRUE(ctx.getDrawCalls()[0].line_mode);
    EXPECT_FALSE(ctx.isLineMode());
    model.dispose();
}

TEST_F(RendererTests, UniformsAreBoundBeforeDraw)
{
    Model model(ctx, &basic);
    model.setMesh(&tri);
    model.setAlpha(0.75f);

    renderer.render(model);

    const auto* alpha = ctx.getUniformValue(basic.getProgramID(), basic.getUniformLocation("alpha"));
    ASSERT_NE(alpha, nullptr);
    EXPECT_FLOAT_EQ(alpha->values[0], 0.75f);
    model.dispose();
}

TEST_F(RendererTests, TextureRangesDrawSeparately)
{
    ShaderProgram textured("textured");
    textured.setSource(test::TEXTURED_VERTEX, test::TEXTURED_FRAGMENT);

    // Two triangles, one per texture
    Mesh pair("pair");
    pair.initData(0, 3).setData(0, std::vector<float>(12, 0.0f));
    pair.initData(1, 2).setData(1, std::vector<float>(8, 0.0f));
    pair.initFaces().setFaces({ 0, 1, 2, 1, 2, 3 });

    Texture left("left");
    left.setImage(1, 1, test::solidImage(1, 1));
    Texture right("right");
    right.setImage(1, 1, test::solidImage(1, 1, 0));

    Model model(ctx, &textured);
    model.setMesh(&pair);
    model.addModelTexture(&left, 0, 1);
    model.addModelTexture(&right, 1, 1);
    model.setUniform("tint", { 1.0f, 1.0f, 1.0f, 1.0f });
    ASSERT_FALSE(model.verify().has_value());

    renderer.render(model);

    const auto& draws = ctx.getDrawCalls();
    ASSERT_EQ(draws.size(), 2u);
    EXPECT_EQ(draws[0].count, 3);
    EXPECT_EQ(draws[0].first, 0);
    EXPECT_EQ(draws[0].texture, left.getTextureID());
    EXPECT_EQ(draws[1].count, 3);
    EXPECT_EQ(draws[1].first, 3);
    EXPECT_EQ(draws[1].texture, right.getTextureID());
    model.dispose();
}

TEST_F(RendererTests, SingleTextureDrawsWholeMesh)
{
    ShaderProgram textured("textured");
    textured.setSource(test::TEXTURED_VERTEX, test::TEXTURED_FRAGMENT);

    tri.initData(1, 2).setData(1, std::vector<float>(6, 0.0f));
    Texture skin("skin");
    skin.setImage(1, 1, test::solidImage(1, 1));

    Model model(ctx, &textured);
    model.setMesh(&tri);
    model.addModelTexture(&skin, 0, 1);
    model.setUniform("tint", { 1.0f });

    renderer.render(model);

    ASSERT_EQ(ctx.getDrawCalls().size(), 1u);
    EXPECT_EQ(ctx.getDrawCalls()[0].count, 3);
    EXPECT_EQ(ctx.getDrawCalls()[0].texture, skin.getTextureID());
    model.dispose();
}

TEST_F(RendererTests, ChangedMeshIsUploadedBeforeDraw)
{
    Model model(ctx, &basic);
    model.setMesh(&tri);
    renderer.render(model);

    tri.setData(0, std::vector<float>{ 0.0f, 0.0f, 0.0f, 2.0f, 0.0f, 0.0f, 0.0f, 2.0f, 0.0f });
    renderer.render(model);

    EXPECT_FALSE(tri.needsRebind());
    EXPECT_EQ(ctx.getBufferRecord(tri.getBuffer(0)->getHandle())->upload_count, 2);
    EXPECT_EQ(ctx.getDrawCalls().size(), 2u);
    model.dispose();
}

TEST_F(RendererTests, ModelsSwitchPrograms)
{
    ShaderProgram plain("plain");
    plain.setSource(test::BASIC_VERTEX, test::PLAIN_FRAGMENT);

    Model first(ctx, &basic);
    first.setMesh(&tri);
    Model second(ctx, &plain);
    second.setMesh(&tri);

    renderer.render(first);
    renderer.render(second);
    renderer.render(first);

    const auto& draws = ctx.getDrawCalls();
    ASSERT_EQ(draws.size(), 3u);
    EXPECT_EQ(draws[0].program, basic.getProgramID());
    EXPECT_EQ(draws[1].program, plain.getProgramID());
    EXPECT_EQ(draws[2].program, basic.getProgramID());

    first.dispose();
    second.dispose();
}

TEST_F(RendererTests, ResetStateAfterProgramDeleted)
{
    Model model(ctx, &basic);
    model.setMesh(&tri);
    renderer.render(model);

    // Rebinding links a new program object
    ASSERT_FALSE(basic.bind(ctx).has_value());
    renderer.resetState();
    renderer.render(model);

    ASSERT_EQ(ctx.getDrawCalls().size(), 2u);
    EXPECT_EQ(ctx.getDrawCalls()[1].program, basic.getProgramID());
    model.dispose();
}

TEST_F(RendererTests, InvalidMeshIsSkipped)
{
    Mesh broken("broken");
    broken.initData(0, 3);

    Model model(ctx, &basic);
    model.setMesh(&broken);
    renderer.render(model);

    EXPECT_TRUE(ctx.getDrawCalls().empty());
    model.dispose();
}

TEST_F(RendererTests, ModelWithoutMeshIsSkipped)
{
    Model model(ctx, &basic);
    renderer.render(model);
    EXPECT_TRUE(ctx.getDrawCalls().empty());
    model.dispose();
}
