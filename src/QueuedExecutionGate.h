#pragma once

#include "../oms/tradingsubstrate.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <type_traits>

class GateClosedError : public std::runtime_error {
public:
    GateClosedError()
        : std::runtime_error("trading queue closed") {}
};

class GateCancelledError : public std::runtime_error {
public:
    GateCancelledError()
        : std::runtime_error("operation cancelled") {}
};

struct GateConfig {
    size_t capacity = 256;
    std::chrono::milliseconds min_interval{25};
};

// Serializes every order-mutating call through one worker thread, with a
// minimum spacing between consecutive calls. Callers block until the work
// has run; admitted work still runs if the caller's token fires meanwhile.
class QueuedExecutionGate {
public:
    explicit QueuedExecutionGate(const GateConfig& config)
        : capacity_(config.capacity > 0 ? config.capacity : 256)
        , min_interval_(config.min_interval) {
        worker_ = std::thread(&QueuedExecutionGate::process_jobs, this);
    }

    ~QueuedExecutionGate() { close(); }

    QueuedExecutionGate(const QueuedExecutionGate&) = delete;
    QueuedExecutionGate& operator=(const QueuedExecutionGate&) = delete;

    template<typename Func>
    auto submit(std::stop_token token, Func&& func) -> std::invoke_result_t<Func> {
        using Result = std::invoke_result_t<Func>;

        auto ticket = std::make_shared<Ticket>();
        auto result = std::make_shared<std::optional<std::conditional_t<std::is_void_v<Result>, bool, Result>>>();
        auto error = std::make_shared<std::exception_ptr>();

        Job job;
        job.ticket = ticket;
        job.work = [fn = std::forward<Func>(func), result, error]() mutable {
            try {
                if constexpr(std::is_void_v<Result>) {
                    fn();
                    result->emplace(true);
                } else {
                    result->emplace(fn());
                }
            } catch(...) {
                // handed back to the submitting thread and rethrown there
                *error = std::current_exception();
            }
        };

        {
            std::unique_lock<std::mutex> lock(mutex_);
            space_cv_.wait(lock, token, [this] { return closed_ || queue_.size() < capacity_; });
            if(closed_) {
                throw GateClosedError();
            }
            if(token.stop_requested()) {
                throw GateCancelledError();
            }
            queue_.push_back(std::move(job));
        }
        work_cv_.notify_one();

        {
            std::unique_lock<std::mutex> lock(ticket->mutex);
            ticket->cv.wait(lock, token, [&ticket] { return ticket->done || ticket->dropped; });
            if(ticket->dropped) {
                throw GateClosedError();
            }
            if(!ticket->done) {
                throw GateCancelledError();
            }
        }

        if(*error) {
            std::rethrow_exception(*error);
        }
        if constexpr(!std::is_void_v<Result>) {
            return std::move(**result);
        }
    }

    Order place_order(std::stop_token token, TradingSubstrate& substrate, const OrderRequest& request) {
        return submit(token, [&substrate, request] { return substrate.place_order(request); });
    }

    void cancel_order(std::stop_token token, TradingSubstrate& substrate, const std::string& order_id) {
        submit(token, [&substrate, order_id] { substrate.cancel_order(order_id); });
    }

    std::vector<Order>
    execute_multi_leg(std::stop_token token, TradingSubstrate& substrate, const MultiLegRequest& request) {
        return submit(token, [&substrate, request] { return substrate.execute_multi_leg(request); });
    }

    // Idempotent. Queued work is dropped and its callers see GateClosedError.
    void close() {
        std::deque<Job> dropped;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if(!closed_) {
                closed_ = true;
                dropped.swap(queue_);
            }
        }
        work_cv_.notify_all();
        space_cv_.notify_all();
        for(auto& job : dropped) {
            job.drop();
        }
        if(worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
            worker_.join();
        }
    }

    [[nodiscard]] bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    [[nodiscard]] size_t get_capacity() const { return capacity_; }

private:
    struct Ticket {
        std::mutex mutex;
        std::condition_variable_any cv;
        bool done = false;
        bool dropped = false;
    };

    struct Job {
        std::function<void()> work;
        std::shared_ptr<Ticket> ticket;

        void finish() {
            {
                std::lock_guard<std::mutex> lock(ticket->mutex);
                ticket->done = true;
            }
            ticket->cv.notify_all();
        }

        void drop() {
            {
                std::lock_guard<std::mutex> lock(ticket->mutex);
                ticket->dropped = true;
            }
            ticket->cv.notify_all();
        }
    };

    void process_jobs() {
        while(true) {
            Job job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                work_cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
                if(closed_) {
                    return;
                }
                job = std::move(queue_.front());
                queue_.pop_front();
            }
            space_cv_.notify_one();

            if(last_run_) {
                const auto ready_at = *last_run_ + min_interval_;
                std::unique_lock<std::mutex> lock(mutex_);
                if(work_cv_.wait_until(lock, ready_at, [this] { return closed_; })) {
                    lock.unlock();
                    job.drop();
                    return;
                }
            }

            job.work();
            last_run_ = std::chrono::steady_clock::now();
            job.finish();
        }
    }

    const size_t capacity_;
    const std::chrono::milliseconds min_interval_;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable_any space_cv_;
    std::deque<Job> queue_;
    bool closed_ = false;
    std::optional<std::chrono::steady_clock::time_point> last_run_;
    std::thread worker_;
};
