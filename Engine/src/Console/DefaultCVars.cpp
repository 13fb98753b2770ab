// Render ConVar definitions
#include "ConVar.hpp"
#include "Utils/Log.hpp"

VU_CONVAR(r_glsl_override, "", vu::ConVarFlags::ARCHIVE | vu::ConVarFlags::DEVELOPER,
          "Shading language version used for shader preambles instead of the driver's (empty=query driver)");

VU_CONVAR(r_uniform_warnings, true, vu::ConVarFlags::ARCHIVE,
          "Log shader uniforms that have no value when a model is drawn");

VU_CONVAR_BOUNDED(r_anim_rate, 24.0f, 1.0f, 240.0f, vu::ConVarFlags::ARCHIVE,
                  "Default animation frames per second for new movements");

VU_CONVAR(developer, 0, vu::ConVarFlags::ARCHIVE,
          "Developer mode - logs shader introspection results");

namespace vu
{

void InitializeDefaultCVars()
{
    VU_LOG_TRACE("{} render cvars registered", ConVarRegistry::get().getAll().size());
}

}
