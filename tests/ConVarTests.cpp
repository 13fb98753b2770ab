#include "Console/ConVar.hpp"
#include "Graphics/ShaderProgram.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <sstream>

using namespace vu;

class ConVarTests : public ::testing::Test
{
protected:
    ConVarBase* anim_rate = nullptr;
    ConVarBase* glsl_override = nullptr;
    ConVarBase* uniform_warnings = nullptr;

    void SetUp() override
    {
        anim_rate = VU_CVAR_PTR(r_anim_rate);
        glsl_override = VU_CVAR_PTR(r_glsl_override);
        uniform_warnings = VU_CVAR_PTR(r_uniform_warnings);
        ASSERT_NE(anim_rate, nullptr);
        ASSERT_NE(glsl_override, nullptr);
        ASSERT_NE(uniform_warnings, nullptr);
    }

    void TearDown() override
    {
        anim_rate->reset();
        glsl_override->reset();
        uniform_warnings->reset();
    }

    static std::string tempPath(const std::string& name)
    {
        return ::testing::TempDir() + name;
    }
};

TEST_F(ConVarTests, RenderCvarsAreRegistered)
{
    EXPECT_FLOAT_EQ(anim_rate->getFloat(), 24.0f);
    EXPECT_TRUE(anim_rate->hasBounds());
    EXPECT_TRUE(glsl_override->getString().empty());
    EXPECT_TRUE(uniform_warnings->getBool());
    EXPECT_NE(VU_CVAR_PTR(developer), nullptr);
    EXPECT_EQ(VU_CVAR_PTR(r_not_a_cvar), nullptr);

    auto render = ConVarRegistry::get().findMatching("r_");
    EXPECT_GE(render.size(), 3u);
}

TEST_F(ConVarTests, BoundedValuesAreClamped)
{
    anim_rate->setFloat(1000.0f);
    EXPECT_FLOAT_EQ(anim_rate->getFloat(), 240.0f);

    anim_rate->setFloat(0.0f);
    EXPECT_FLOAT_EQ(anim_rate->getFloat(), 1.0f);
}

TEST_F(ConVarTests, InvalidTextKeepsValue)
{
    anim_rate->setFloat(30.0f);
    EXPECT_FALSE(anim_rate->setFromString("fast"));
    EXPECT_FLOAT_EQ(anim_rate->getFloat(), 30.0f);

    EXPECT_TRUE(anim_rate->setFromString("60"));
    EXPECT_FLOAT_EQ(anim_rate->getFloat(), 60.0f);
}

TEST_F(ConVarTests, BoolParsing)
{
    uniform_warnings->setFromString("off");
    EXPECT_FALSE(uniform_warnings->getBool());
    uniform_warnings->setFromString("TRUE");
    EXPECT_TRUE(uniform_warnings->getBool());
}

TEST_F(ConVarTests, ChangeCallbackSeesOldAndNew)
{
    ConVarBase local("test_callback", 1, ConVarFlags::NONE, "callback test");
    int old_value = -1;
    int new_value = -1;
    local.addChangeCallback([&](ConVarBase*, const ConVarValue& from, const ConVarValue& to)
    {
        old_value = std::get<int>(from);
        new_value = std::get<int>(to);
    });

    local.setInt(5);
    EXPECT_EQ(old_value, 1);
    EXPECT_EQ(new_value, 5);
}

TEST_F(ConVarTests, LoadConfigAppliesKnownCvars)
{
    const std::string path = tempPath("vu_load_test.cfg");
    {
        std::ofstream file(path);
        file << "// render settings\n";
        file << "r_anim_rate 30\n";
        file << "   r_glsl_override \"OpenGL ES GLSL ES 3.00\"\n";
        file << "r_unknown 12\n";
        file << "\n";
    }

    EXPECT_TRUE(ConVarRegistry::get().loadConfig(path));
    EXPECT_FLOAT_EQ(anim_rate->getFloat(), 30.0f);
    EXPECT_EQ(glsl_override->getString(), GLSL_ES_300);
}

TEST_F(ConVarTests, LoadMissingConfigFails)
{
    EXPECT_FALSE(ConVarRegistry::get().loadConfig(tempPath("vu_does_not_exist.cfg")));
}

TEST_F(ConVarTests, SaveWritesArchivedCvars)
{
    anim_rate->setFloat(48.0f);
    const std::string path = tempPath("vu_save_test.cfg");
    ASSERT_TRUE(ConVarRegistry::get().saveArchiveCvars(path));

    std::ifstream file(path);
    std::stringstream contents;
    contents << file.rdbuf();
    EXPECT_NE(contents.str().find("r_anim_rate 48"), std::string::npos) << contents.str();
    EXPECT_NE(contents.str().find("r_glsl_override \"\""), std::string::npos) << contents.str();

    anim_rate->reset();
    EXPECT_TRUE(ConVarRegistry::get().loadConfig(path));
    EXPECT_FLOAT_EQ(anim_rate->getFloat(), 48.0f);
}
