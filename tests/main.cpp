#include "Utils/Log.hpp"
#include "Console/ConVar.hpp"
#include <gtest/gtest.h>

int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);

    vu::CLog::Init("");
    vu::InitializeDefaultCVars();

    return RUN_ALL_TESTS();
}
