// worker_pool.cpp - fixed-size thread pool
// threads are started once and joined once, everything in between is a queue

#include "netrun/worker_pool.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace netrun
{

    worker_pool::worker_pool(std::size_t thread_count)
    {
        if (thread_count == 0)
        {
            thread_count = 1;
        }
        workers_.reserve(thread_count);
        for (std::size_t i = 0; i < thread_count; ++i)
        {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    worker_pool::~worker_pool()
    {
        stop();
        for (auto &t : workers_)
        {
            if (t.joinable())
            {
                t.join();
            }
        }
    }

    auto worker_pool::submit(task t) -> void_result
    {
        if (!t)
        {
            return {};
        }
        {
            std::lock_guard lock{mutex_};
            if (stopping_)
            {
                return std::unexpected{make_error(error_code::internal_fault, "submit on a stopping worker pool")};
            }
            queue_.push(std::move(t));
        }
        cv_.notify_one();
        return {};
    }

    auto worker_pool::stop() noexcept -> void
    {
        {
            std::lock_guard lock{mutex_};
            stopping_ = true;
        }
        cv_.notify_all();
    }

    auto worker_pool::wait() -> void_result
    {
        {
            std::unique_lock lock{mutex_};
            cv_done_.wait(lock, [this] { return queue_.empty() && active_.load(std::memory_order_relaxed) == 0; });
        }

        std::lock_guard lock{error_mutex_};
        if (first_error_.has_value())
        {
            return std::unexpected{*first_error_};
        }
        return {};
    }

    auto worker_pool::set_error(error err) noexcept -> void
    {
        std::lock_guard lock{error_mutex_};
        if (!first_error_.has_value())
        {
            first_error_ = std::move(err);
        }
    }

    auto worker_pool::worker_loop() noexcept -> void
    {
        for (;;)
        {
            task current;

            {
                std::unique_lock lock{mutex_};
                cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });

                if (queue_.empty())
                {
                    if (stopping_)
                    {
                        return;
                    }
                    continue;
                }

                current = std::move(queue_.front());
                queue_.pop();
                active_.fetch_add(1, std::memory_order_relaxed);
            }

            try
            {
                if (auto outcome = current(); !outcome.has_value())
                {
                    spdlog::debug("worker task failed: {}", outcome.error());
                    set_error(std::move(outcome.error()));
                }
            }
            catch (std::exception const &e)
            {
                spdlog::error("worker task threw: {}", e.what());
                set_error(make_error(error_code::internal_fault, "worker task threw: {}", e.what()));
            }
            catch (...)
            {
                spdlog::error("worker task threw an unknown exception");
                set_error(error{error_code::internal_fault, "worker task threw an unknown exception"});
            }

            {
                std::lock_guard lock{mutex_};
                active_.fetch_sub(1, std::memory_order_relaxed);
                if (queue_.empty() && active_.load(std::memory_order_relaxed) == 0)
                {
                    cv_done_.notify_all();
                }
            }
        }
    }

} // namespace netrun
