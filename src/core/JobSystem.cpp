#include "core/JobSystem.h"

namespace fractal::core {

JobSystem& JobSystem::Instance()
{
    static JobSystem instance;
    return instance;
}

JobSystem::JobSystem(std::size_t workers)
    : _executor(workers == 0 ? 1 : workers)
{
}

JobSystem::~JobSystem()
{
    _executor.wait_for_all();
}

} // namespace fractal::core
