#include "Graphics/Animation.hpp"
#include "Graphics/Model.hpp"
#include "Graphics/ShaderProgram.hpp"
#include "Graphics/HeadlessGraphicsContext.hpp"
#include "Console/ConVar.hpp"
#include "TestShaders.hpp"
#include <glm/gtc/matrix_transform.hpp>
#include <gtest/gtest.h>

using namespace vu;

namespace
{
    glm::mat4 translation(float x, float y, float z)
    {
        return glm::translate(glm::mat4(1.0f), glm::vec3(x, y, z));
    }

    // Translation column of a pose matrix
    glm::vec3 poseOffset(const glm::mat3x4& pose)
    {
        return glm::vec3(pose[0][3], pose[1][3], pose[2][3]);
    }
}

class AnimationTests : public ::testing::Test
{
protected:
    Animation slide{ "slide" };
    std::vector<glm::mat3x4> pose;

    void SetUp() override
    {
        // One joint moving from the origin to x = 2 over two frames
        slide.setData({ translation(0.0f, 0.0f, 0.0f), translation(2.0f, 0.0f, 0.0f) }, { -1 },
                      { { "slide", 0, 2, 1.0 } });
    }
};

TEST_F(AnimationTests, PoseMatrixHoldsTransformRows)
{
    glm::mat3x4 p = toPoseMatrix(translation(1.0f, 2.0f, 3.0f));
    EXPECT_EQ(poseOffset(p), glm::vec3(1.0f, 2.0f, 3.0f));
    EXPECT_FLOAT_EQ(p[0][0], 1.0f);
    EXPECT_FLOAT_EQ(p[1][1], 1.0f);

    glm::mat4 back = fromPoseMatrix(p);
    EXPECT_EQ(back, translation(1.0f, 2.0f, 3.0f));
}

TEST_F(AnimationTests, AnimateInterpolatesBetweenFrames)
{
    double frame = slide.animate(0.5, 0.0, 0, pose);
    EXPECT_DOUBLE_EQ(frame, 0.5);
    ASSERT_EQ(pose.size(), 1u);
    EXPECT_FLOAT_EQ(poseOffset(pose[0]).x, 1.0f);
}

TEST_F(AnimationTests, AnimateWrapsWithinMovement)
{
    // Frame 1.5 blends the last frame back into the first
    double frame = slide.animate(1.0, 0.5, 0, pose);
    EXPECT_DOUBLE_EQ(frame, 1.5);
    EXPECT_FLOAT_EQ(poseOffset(pose[0]).x, 1.0f);

    frame = slide.animate(0.5, 0.0, 0, pose);
    frame = slide.animate(0.5, frame, 0, pose);
    EXPECT_DOUBLE_EQ(frame, 1.0);
    EXPECT_FLOAT_EQ(poseOffset(pose[0]).x, 2.0f);
}

TEST_F(AnimationTests, ChildJointsComposeWithParent)
{
    Animation arm("arm");
    arm.setData({ translation(1.0f, 0.0f, 0.0f), translation(0.0f, 2.0f, 0.0f) }, { -1, 0 },
                { { "hold", 0, 1, 1.0 } });
    ASSERT_EQ(arm.getJointCount(), 2u);
    EXPECT_EQ(arm.getFrameCount(), 1u);

    arm.animate(0.25, 0.0, 0, pose);
    ASSERT_EQ(pose.size(), 2u);
    EXPECT_EQ(poseOffset(pose[0]), glm::vec3(1.0f, 0.0f, 0.0f));
    EXPECT_EQ(poseOffset(pose[1]), glm::vec3(1.0f, 2.0f, 0.0f));
}

TEST_F(AnimationTests, MovementWithoutRateUsesDefault)
{
    Animation walk("walk");
    walk.setData({ translation(0.0f, 0.0f, 0.0f) }, { -1 }, { { "idle", 0, 1, 0.0 } });

    ConVarBase* rate = VU_CVAR_PTR(r_anim_rate);
    ASSERT_NE(rate, nullptr);
    EXPECT_DOUBLE_EQ(walk.getMovements()[0].rate, rate->getFloat());

    walk.setRate(0, 12.0);
    EXPECT_DOUBLE_EQ(walk.getMovements()[0].rate, 12.0);
}

TEST_F(AnimationTests, UnknownMovementFallsBack)
{
    EXPECT_EQ(slide.playMovement(0), 0);
    EXPECT_EQ(slide.playMovement(3), 0);
    EXPECT_EQ(slide.playMovement(-1), 0);
    EXPECT_EQ(slide.maxFrames(0), 2);
    EXPECT_EQ(slide.maxFrames(3), 0);
    EXPECT_EQ(slide.getMovementNames(), std::vector<std::string>{ "slide" });
}

TEST_F(AnimationTests, EmptyAnimationDoesNothing)
{
    Animation empty("empty");
    EXPECT_DOUBLE_EQ(empty.animate(1.0, 3.0, 0, pose), 0.0);
    EXPECT_TRUE(pose.empty());
}

TEST_F(AnimationTests, MovementPastLastFrameIsNotSampled)
{
    Animation broken("broken");
    broken.setData({ translation(0.0f, 0.0f, 0.0f) }, { -1 }, { { "far", 3, 2, 1.0 } });
    pose.assign(1, toPoseMatrix(translation(5.0f, 0.0f, 0.0f)));

    broken.animate(0.5, 0.0, 0, pose);
    EXPECT_FLOAT_EQ(poseOffset(pose[0]).x, 5.0f);
}

// =================================================================================================
// Model playback
// =================================================================================================

class ModelAnimationTests : public AnimationTests
{
protected:
    HeadlessGraphicsContext ctx;
    ShaderProgram skinned{ "skinned" };

    void SetUp() override
    {
        AnimationTests::SetUp();
        ASSERT_TRUE(ctx.initialize(nullptr));
        skinned.setSource(test::SKINNED_VERTEX, test::PLAIN_FRAGMENT);
        slide.setData({ translation(0.0f, 0.0f, 0.0f), translation(1.0f, 0.0f, 0.0f),
                        translation(2.0f, 0.0f, 0.0f), translation(3.0f, 0.0f, 0.0f) },
                      { -1 }, { { "walk", 0, 4, 1.0 }, { "wave", 2, 2, 2.0 } });
    }

    void TearDown() override
    {
        skinned.releaseGpu(ctx);
    }
};

TEST_F(ModelAnimationTests, SetAnimationStartsWithRestPose)
{
    Model model(ctx, &skinned);
    model.setAnimation(&slide);

    ASSERT_EQ(model.getPose().size(), 1u);
    EXPECT_EQ(fromPoseMatrix(model.getPose()[0]), glm::mat4(1.0f));
    EXPECT_EQ(model.getMovements(), (std::vector<std::string>{ "walk", "wave" }));
    model.dispose();
}

TEST_F(ModelAnimationTests, LoopCallbackFiresAtMovementEnd)
{
    Model model(ctx, &skinned);
    model.setAnimation(&slide);

    int loops = 0;
    ASSERT_TRUE(model.playMovement(0, [&loops]() { loops++; }));

    model.animate(1.0);
    model.animate(1.0);
    model.animate(1.0);
    EXPECT_DOUBLE_EQ(model.getFrame(), 3.0);
    EXPECT_EQ(loops, 0);
    EXPECT_FLOAT_EQ(poseOffset(model.getPose()[0]).x, 3.0f);

    model.animate(1.0);
    EXPECT_EQ(loops, 1);
    EXPECT_DOUBLE_EQ(model.getFrame(), 0.0);
    model.dispose();
}

TEST_F(ModelAnimationTests, PlayMovementSelectsFrameRange)
{
    Model model(ctx, &skinned);
    model.setAnimation(&slide);

    ASSERT_TRUE(model.playMovement(1));
    model.animate(0.25);
    EXPECT_DOUBLE_EQ(model.getFrame(), 0.5);
    EXPECT_FLOAT_EQ(poseOffset(model.getPose()[0]).x, 2.5f);

    EXPECT_FALSE(model.playMovement(7)) << "Unknown movement plays the first one";
    EXPECT_DOUBLE_EQ(model.getFrame(), 0.0);
    model.dispose();
}

TEST_F(ModelAnimationTests, EmptyMovementNeverLoops)
{
    slide.setData({ translation(0.0f, 0.0f, 0.0f), translation(1.0f, 0.0f, 0.0f) }, { -1 },
                  { { "walk", 0, 2, 1.0 }, { "still", 1, 0, 1.0 } });
    Model model(ctx, &skinned);
    model.setAnimation(&slide);

    int loops = 0;
    ASSERT_TRUE(model.playMovement(1, [&loops]() { loops++; }));
    model.animate(1.0);
    model.animate(1.0);
    model.animate(1.0);
    EXPECT_EQ(loops, 0);
    EXPECT_DOUBLE_EQ(model.getFrame(), 0.0);
    model.dispose();
}

TEST_F(ModelAnimationTests, PoseIsUploadedToArrayUniform)
{
    Model model(ctx, &skinned);
    model.setAnimation(&slide);
    model.animate(1.0);

    ctx.useProgram(skinned.getProgramID());
    model.bindUniforms();

    const auto* bpos = ctx.getUniformValue(skinned.getProgramID(), skinned.getUniformLocation("bpos"));
    ASSERT_NE(bpos, nullptr);
    EXPECT_EQ(bpos->type, UniformType::Mat3x4);
    EXPECT_EQ(bpos->count, 1);
    ASSERT_EQ(bpos->values.size(), 12u);
    EXPECT_FLOAT_EQ(bpos->values[3], 1.0f) << "First row carries the x translation";
    model.dispose();
}
