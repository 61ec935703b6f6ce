#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <list>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <utility>

// Sleeps for the given duration unless the token is stopped first.
// Returns false when woken by a stop request.
template<typename Rep, typename Period>
inline bool interruptible_sleep(std::stop_token token, std::chrono::duration<Rep, Period> duration) {
    if(duration <= std::chrono::duration<Rep, Period>::zero()) {
        return !token.stop_requested();
    }
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait_for(lock, token, duration, [] { return false; });
    return !token.stop_requested();
}

// Owns cooperative background tasks. Each task receives a stop token; the
// group requests stop on all running tasks at once and joins them on
// destruction. Finished tasks are reaped when new ones are spawned.
class TaskGroup {
public:
    TaskGroup() = default;
    ~TaskGroup() { join_all(); }

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    template<typename Func>
    void spawn(Func&& func) {
        std::lock_guard<std::mutex> lock(mutex_);
        reap_finished_locked();
        auto done = std::make_shared<std::atomic<bool>>(false);
        tasks_.push_back(Task{std::jthread([fn = std::forward<Func>(func), done](std::stop_token token) mutable {
                                  fn(token);
                                  done->store(true);
                              }),
                              done});
    }

    void request_stop_all() {
        std::lock_guard<std::mutex> lock(mutex_);
        for(auto& task : tasks_) {
            task.thread.request_stop();
        }
    }

    // Must not be called from one of the group's own tasks.
    void join_all() {
        std::list<Task> tasks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tasks.swap(tasks_);
        }
        for(auto& task : tasks) {
            task.thread.request_stop();
            if(task.thread.joinable()) {
                task.thread.join();
            }
        }
    }

    [[nodiscard]] size_t running_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for(const auto& task : tasks_) {
            if(!task.done->load()) {
                count++;
            }
        }
        return count;
    }

private:
    struct Task {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void reap_finished_locked() {
        for(auto it = tasks_.begin(); it != tasks_.end();) {
            if(it->done->load()) {
                if(it->thread.joinable()) {
                    it->thread.join();
                }
                it = tasks_.erase(it);
            } else {
                ++it;
            }
        }
    }

    mutable std::mutex mutex_;
    std::list<Task> tasks_;
};
