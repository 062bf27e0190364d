#ifndef LATEST_RUNNER_H
#define LATEST_RUNNER_H

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>

namespace app
{
    /**
     * Runs jobs one at a time on a worker thread, keeping only the latest request:
     * submitting replaces the pending job and asks the running one to stop through
     * its stop_token. Superseded jobs that have not started never run.
     */
    class LatestRequestRunner
    {
    public:
        using Job = std::function<void(std::stop_token)>;

        LatestRequestRunner();
        ~LatestRequestRunner();

        LatestRequestRunner(const LatestRequestRunner&) = delete;
        auto operator=(const LatestRequestRunner&) -> LatestRequestRunner& = delete;

        auto submit(Job job) -> void;

        // blocks until no job is pending or running
        auto wait_idle() -> void;

    private:
        auto run(std::stop_token worker_token) -> void;

        std::mutex m_mutex;
        std::condition_variable_any m_condition;
        std::optional<Job> m_pending;
        std::stop_source m_running;
        bool m_busy;

        // declared last so the worker starts after, and stops before, the state above
        std::jthread m_worker;
    };
}

#endif
