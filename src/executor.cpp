#include "castlink/executor.hpp"

#include "castlink/log.hpp"

namespace castlink
{

worker_executor::worker_executor(size_t max_queued)
    : m_max_queued {max_queued}
{
    m_worker = std::thread {[this]() { run(); }};
}

worker_executor::~worker_executor()
{
    shutdown();
}

void worker_executor::execute(std::function<void()> task)
{
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        if(m_stopped)
            throw rejected_execution {"Executor already shut down"};
        if(m_tasks.size() >= m_max_queued)
            throw rejected_execution {fmt::format("Executor queue is full ({} tasks)", m_tasks.size())};
        m_tasks.push_back(std::move(task));
    }
    m_cond.notify_one();
}

void worker_executor::shutdown()
{
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        m_stopped = true;
    }
    m_cond.notify_all();

    if(!m_worker.joinable())
        return;
    if(m_worker.get_id() != std::this_thread::get_id())
        m_worker.join();
    else
        m_worker.detach();
}

void worker_executor::run()
{
    while(true)
    {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock {m_mutex};
            m_cond.wait(lock, [this]() { return m_stopped || !m_tasks.empty(); });
            if(m_tasks.empty())
                return;
            task = std::move(m_tasks.front());
            m_tasks.pop_front();
        }

        try {
            task();
        } catch(std::exception& e) {
            log::error("Task failed: {}", e.what());
        }
    }
}

} // namespace castlink
