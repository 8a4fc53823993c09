#include "prism/core/TaskSystem.hpp"
#include "prism/core/logger.hpp"

#include <thread>

namespace prism::core
{
    std::unique_ptr<enki::TaskScheduler> TaskSystem::s_scheduler;

    void TaskSystem::init()
    {
        init(Config{});
    }

    void TaskSystem::init(const Config& config)
    {
        if (s_scheduler)
        {
            return;
        }

        uint32_t threads = config.numThreads;
        if (threads == 0) {
            uint32_t cores = std::thread::hardware_concurrency();
            // Keep one core for the calling thread
            threads = cores > 1 ? cores - 1 : 1;
        }

        s_scheduler = std::make_unique<enki::TaskScheduler>();
        s_scheduler->Initialize(threads);

        Logger::info("TaskSystem initialized: {} worker threads.",
                     s_scheduler->GetNumTaskThreads());
    }

    void TaskSystem::shutdown()
    {
        if (s_scheduler)
        {
            s_scheduler->WaitforAllAndShutdown();
            s_scheduler.reset();
        }
    }

    bool TaskSystem::isInitialized()
    {
        return s_scheduler != nullptr;
    }

    enki::TaskScheduler& TaskSystem::scheduler()
    {
        return *s_scheduler;
    }
}
