#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

class CallbackInterface {
public:
    virtual ~CallbackInterface() = default;
    virtual void invoke() = 0;
};

template<typename Func>
class Callback : public CallbackInterface {
public:
    explicit Callback(Func&& func)
        : m_func(std::forward<Func>(func)) {}

    void invoke() override { m_func(); }

private:
    std::decay_t<Func> m_func;
};

// Periodic callback runner. stop() wakes the timer thread immediately instead
// of waiting out the current period.
class Timer {
public:
    Timer()
        : running(false) {}

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

    template<typename Func>
    void addCallback(Func&& callback) {
        std::lock_guard<std::mutex> lock(callbackMutex);
        callbacks.push_back(std::make_unique<Callback<Func>>(std::forward<Func>(callback)));
    }

    void clearCallbacks() {
        std::lock_guard<std::mutex> lock(callbackMutex);
        callbacks.clear();
    }

    void start(std::chrono::milliseconds period) {
        if(running) {
            stop();
        }
        running = true;

        timerThread = std::thread([this, period]() {
            while(running) {
                {
                    std::unique_lock<std::mutex> lock(wakeMutex);
                    wakeCv.wait_for(lock, period, [this] { return !running; });
                }
                if(running) {
                    triggerCallbacks();
                }
            }
        });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(wakeMutex);
            running = false;
        }
        wakeCv.notify_all();
        if(timerThread.joinable()) {
            timerThread.join();
        }
    }

    [[nodiscard]] bool isRunning() const { return running; }

    ~Timer() { stop(); }

private:
    void triggerCallbacks() {
        std::lock_guard<std::mutex> lock(callbackMutex);
        for(auto& callback : callbacks) {
            if(callback) {
                callback->invoke();
            }
        }
    }

    std::atomic<bool> running;
    std::thread timerThread;
    std::mutex wakeMutex;
    std::condition_variable wakeCv;
    std::mutex callbackMutex;
    std::vector<std::unique_ptr<CallbackInterface>> callbacks;
};
