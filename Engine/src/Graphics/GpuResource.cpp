#include "GpuResource.hpp"
#include "Utils/Log.hpp"
#include <stdexcept>

namespace vu
{

GpuResource::GpuResource(const std::string& name)
    : name(name), ref_count(0)
{
}

void GpuResource::acquire()
{
    ref_count++;
}

bool GpuResource::release()
{
    if (ref_count == 0)
    {
        VU_LOG_FATAL("Reference count underflow on '{}'", name);
        throw std::logic_error("Reference count underflow on '" + name + "'");
    }
    ref_count--;
    return ref_count == 0;
}

}
