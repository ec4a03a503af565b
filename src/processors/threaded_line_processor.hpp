#pragma once

#include <cstddef>

#include <atomic>
#include <future>
#include <thread>
#include <utility>

#include <boost/lockfree/spsc_queue.hpp>
#include <boost/scope_exit.hpp>

namespace walletmask
{

///
/// @brief      This class describes a threaded line processor
///             It receives items from one thread and handles them in the other with a handler
///
/// @tparam     Handler         A handler type, callable with Item&&
/// @tparam     Item            An item type, default constructible and copyable
/// @tparam     kQueueCapacity  Capacity of the lock-free queue between the threads
///
template <typename Handler, typename Item, size_t kQueueCapacity = 4096>
class ThreadedLineProcessor
{
public:
    explicit ThreadedLineProcessor(Handler handler)
        : handler_(std::move(handler))
    {
    }

    ~ThreadedLineProcessor()
    {
        if (worker_.valid())
        {
            stop_token_ = true;
            worker_.wait();
        }
    }

    ThreadedLineProcessor(ThreadedLineProcessor const &)            = delete;
    ThreadedLineProcessor &operator=(ThreadedLineProcessor const &) = delete;

    ThreadedLineProcessor(ThreadedLineProcessor &&)            = delete;
    ThreadedLineProcessor &operator=(ThreadedLineProcessor &&) = delete;

    ///
    /// @brief      Hands an item over to the receiver, waits while the queue is full
    ///
    /// @return     false if the receiver is gone and the item is dropped
    ///
    bool operator()(Item const &item)
    {
        while (!queue_.push(item))
        {
            if (finished_)
                return false;
            std::this_thread::yield();
        }
        return true;
    }

    ///
    /// @brief      Starts the receiver popping items from the queue
    ///
    void start()
    {
        if (!worker_.valid())
        {
            finished_ = false;
            worker_   = std::async(std::launch::async, [this] {
                BOOST_SCOPE_EXIT_ALL(this) { finished_ = true; };

                Item item;
                while (!stop_token_)
                {
                    if (queue_.pop(item))
                        handler_(std::move(item));
                    else
                        std::this_thread::yield();
                }

                while (queue_.pop(item))
                    handler_(std::move(item));
            });
        }
    }

    ///
    /// @brief      Stops the receiver once it has handled all the items queued
    ///
    /// @throws     The exception the handler has thrown if any
    ///
    void stop()
    {
        if (worker_.valid())
        {
            stop_token_ = true;
            auto worker = std::move(worker_);
            BOOST_SCOPE_EXIT_ALL(this) { stop_token_ = false; };
            worker.get();
        }
    }

private:
    Handler handler_;

    std::atomic_bool                                                             stop_token_{false};
    std::atomic_bool                                                             finished_{false};
    boost::lockfree::spsc_queue<Item, boost::lockfree::capacity<kQueueCapacity>> queue_;
    std::future<void>                                                            worker_;
};

} // namespace walletmask
