#include "../include/latest_runner.hpp"

#include <utility>

namespace app
{
    LatestRequestRunner::LatestRequestRunner()
        : m_pending{std::nullopt},
          m_running{},
          m_busy{false},
          m_worker{[this](std::stop_token worker_token){ run(worker_token); }}
    {}

    LatestRequestRunner::~LatestRequestRunner()
    {
        {
            std::lock_guard lock(m_mutex);
            m_pending.reset();
            m_running.request_stop();
        }
        m_worker.request_stop();
        m_worker.join();
    }

    auto LatestRequestRunner::submit(Job job) -> void
    {
        {
            std::lock_guard lock(m_mutex);
            m_pending = std::move(job);
            m_running.request_stop();
        }
        m_condition.notify_all();
    }

    auto LatestRequestRunner::wait_idle() -> void
    {
        std::unique_lock lock(m_mutex);
        m_condition.wait(lock, [this]{ return !m_pending.has_value() && !m_busy; });
    }

    auto LatestRequestRunner::run(std::stop_token worker_token) -> void
    {
        while (!worker_token.stop_requested())
        {
            Job job;
            std::stop_token job_token;
            {
                std::unique_lock lock(m_mutex);
                if (!m_condition.wait(lock, worker_token, [this]{ return m_pending.has_value(); }))
                {
                    return;
                }
                job = std::move(m_pending.value());
                m_pending.reset();
                m_running = std::stop_source{};
                job_token = m_running.get_token();
                m_busy = true;
            }

            job(job_token);

            {
                std::lock_guard lock(m_mutex);
                m_busy = false;
            }
            m_condition.notify_all();
        }
    }
}
