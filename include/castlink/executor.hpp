#ifndef CASTLINK_EXECUTOR_HPP
#define CASTLINK_EXECUTOR_HPP

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace castlink
{

class rejected_execution : public std::runtime_error
{
public:
    explicit rejected_execution(const std::string& what)
        : std::runtime_error {what}
    {}
};

class executor
{
public:
    virtual ~executor() = default;

    // Schedules the task, throws rejected_execution if it can not be accepted
    virtual void execute(std::function<void()> task) = 0;
};

// Runs tasks in submission order on a single background thread
class worker_executor : public executor
{
public:

    worker_executor(const worker_executor&) = delete;
    worker_executor& operator=(const worker_executor&) = delete;
    worker_executor(worker_executor&&) = delete;
    worker_executor& operator=(worker_executor&&) = delete;

    explicit worker_executor(size_t max_queued = 1024);

    ~worker_executor() override;

    void execute(std::function<void()> task) override;

    // Runs the queued tasks and stops the worker. Later submissions are rejected.
    void shutdown();

private:

    void run();

    const size_t m_max_queued;

    std::mutex m_mutex;

    std::condition_variable m_cond;

    std::deque<std::function<void()>> m_tasks;

    bool m_stopped = false;

    std::thread m_worker;

};

} // namespace castlink

#endif
