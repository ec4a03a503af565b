#pragma once

#include <cstddef>

#include <future>
#include <memory>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

namespace walletmask
{

///
/// @brief      This class describes a pool of threads running the tasks posted to it
///
class WorkerPool
{
public:
    explicit WorkerPool(size_t workers = std::thread::hardware_concurrency())
        : workers_(workers > 0 ? workers : 1)
    {
    }

    ~WorkerPool()
    {
        io_.stop();
        guard_.reset();
        for (auto &worker : workers_)
        {
            if (worker.valid())
                worker.wait();
        }
    }

    WorkerPool(WorkerPool const &)            = delete;
    WorkerPool &operator=(WorkerPool const &) = delete;

    WorkerPool(WorkerPool &&)            = delete;
    WorkerPool &operator=(WorkerPool &&) = delete;

    ///
    /// @brief      Posts a task to the pool
    ///
    /// @param      task  The task
    ///
    /// @tparam     Task  A callable with no arguments
    ///
    template <typename Task>
    void operator()(Task &&task) { boost::asio::post(io_, std::forward<Task>(task)); }

    ///
    /// @brief      Starts the threads, the tasks posted before and after are run by them
    ///
    void run()
    {
        if (!guard_)
        {
            io_.restart();
            guard_ = std::make_unique<guard_t>(io_.get_executor());
            for (auto &worker : workers_)
                worker = std::async(std::launch::async, [this] { io_.run(); });
        }
    }

    ///
    /// @brief      Waits until all the tasks are done
    ///
    /// @throws     The first exception a task has thrown
    ///
    void wait()
    {
        guard_.reset();
        for (auto &worker : workers_)
        {
            if (worker.valid())
                worker.get();
        }
    }

private:
    using guard_t = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    boost::asio::io_context        io_;
    std::vector<std::future<void>> workers_;
    std::unique_ptr<guard_t>       guard_;
};

} // namespace walletmask
