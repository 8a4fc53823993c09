#pragma once

#include <TaskScheduler.h>
#include <memory>
#include "prism/core/logger.hpp"

namespace prism::core
{
    template<typename Func>
    class ScopedTask : public enki::ITaskSet {
    public:
        ScopedTask(Func&& func)
            : m_func(std::forward<Func>(func))
            , m_snapshot(Logger::captureScopes()) {}

        // Runs with the creating thread's scopes; the worker's own stack is put back afterwards.
        void ExecuteRange(enki::TaskSetPartition range, uint32_t threadnum) override {
            struct RestoreOnExit {
                ScopeSnapshot previous;
                ~RestoreOnExit() { Logger::restoreScopes(previous); }
            } restore{Logger::captureScopes()};

            Logger::restoreScopes(m_snapshot);
            m_func(range, threadnum);
        }

    private:
        Func m_func;
        ScopeSnapshot m_snapshot;
    };

    class TaskSystem
    {
    public:
        struct Config
        {
            uint32_t numThreads = 0; // 0 = hardware_concurrency() - 1
        };

        static void init();
        static void init(const Config& config);
        static void shutdown();
        static bool isInitialized();
        static enki::TaskScheduler& scheduler();

        // Runs func over [0, setSize) and blocks until every partition finished.
        // Falls back to a single inline call when the scheduler is not running.
        template<typename Func>
        static void parallelFor(uint32_t setSize, Func&& func, uint32_t minRange = 1) {
            if (setSize == 0) {
                return;
            }
            if (!s_scheduler) {
                enki::TaskSetPartition range{0, setSize};
                func(range, 0);
                return;
            }

            ScopedTask<Func> task(std::forward<Func>(func));
            task.m_SetSize = setSize;
            task.m_MinRange = minRange;
            scheduler().AddTaskSetToPipe(&task);
            scheduler().WaitforTask(&task);
        }

    private:
        static std::unique_ptr<enki::TaskScheduler> s_scheduler;
    };
}
