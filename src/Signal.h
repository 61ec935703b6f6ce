#pragma once

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <signal.h>
#include <stdexcept>
#include <sys/epoll.h>
#include <thread>
#include <unistd.h>

// SIGINT/SIGTERM handling through a self-pipe watched by epoll. run() waits
// for the session to become ready, starts it and then blocks until a signal.
class Signal {
public:
    Signal() = default;
    ~Signal() {
        instance = nullptr;
        if(epoll_fd != -1) {
            close(epoll_fd);
        }
        if(signal_pipe[0] != -1) {
            close(signal_pipe[0]);
        }
        if(signal_pipe[1] != -1) {
            close(signal_pipe[1]);
        }
    }

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;
    Signal(Signal&&) = delete;
    Signal& operator=(Signal&&) = delete;

    void stop() {
        running = false;
        if(signal_pipe[1] != -1) {
            char buf = 1;
            // Only async-signal-safe calls here; a full pipe already wakes epoll.
            [[maybe_unused]] auto written = write(signal_pipe[1], &buf, 1);
        }
    }

    void start() { running = true; }

    bool isRunning() const { return running; }

    bool setupSignalHandlers() {
        instance = this;
        struct sigaction sa {};
        sa.sa_handler = &Signal::staticSignalHandler;
        sa.sa_flags = SA_RESTART;
        sigemptyset(&sa.sa_mask);

        sigaction(SIGINT, &sa, nullptr);
        sigaction(SIGTERM, &sa, nullptr);
        epoll_fd = epoll_create1(0);
        if(epoll_fd == -1) {
            perror("epoll_create");
            return false;
        }

        if(pipe(signal_pipe) == -1) {
            perror("pipe");
            close(epoll_fd);
            epoll_fd = -1;
            return false;
        }

        struct epoll_event ev {};
        ev.events = EPOLLIN;
        ev.data.fd = signal_pipe[0];
        if(epoll_ctl(epoll_fd, EPOLL_CTL_ADD, signal_pipe[0], &ev) == -1) {
            perror("epoll_ctl");
            close(epoll_fd);
            close(signal_pipe[0]);
            close(signal_pipe[1]);
            epoll_fd = -1;
            signal_pipe[0] = signal_pipe[1] = -1;
            return false;
        }
        return true;
    }

    // Session must provide is_trading_ready(), initialize_trading() and start_trading().
    template<typename Session>
    void run(Session& session, const std::chrono::seconds& ready_timeout = std::chrono::seconds(30)) {
        const auto start_time = std::chrono::steady_clock::now();

        while(isRunning() && !session.is_trading_ready()) {
            if(wait_for_signal(1000)) {
                return;
            }
            const auto elapsed = std::chrono::steady_clock::now() - start_time;
            if(elapsed >= ready_timeout) {
                throw std::runtime_error("Timeout: session did not become ready within the specified time");
            }
        }
        if(!isRunning()) {
            return;
        }

        session.initialize_trading();
        session.start_trading();

        while(isRunning()) {
            if(wait_for_signal(1000)) {
                break;
            }
        }
    }

private:
    // True when the signal pipe fired or epoll failed.
    bool wait_for_signal(int timeout_ms) {
        struct epoll_event events[1];
        int nfds = epoll_wait(epoll_fd, events, 1, timeout_ms);
        if(nfds == -1) {
            if(errno == EINTR) {
                return !isRunning();
            }
            perror("epoll_wait");
            return true;
        }
        if(nfds > 0) {
            char buf;
            [[maybe_unused]] auto bytes = read(events[0].data.fd, &buf, 1);
            return true;
        }
        return false;
    }

    static void staticSignalHandler(int signum) {
        if(instance) {
            instance->last_signal = signum;
            instance->stop();
        }
    }

    int epoll_fd = -1;
    int signal_pipe[2] = {-1, -1};
    static inline Signal* instance = nullptr;
    std::atomic<bool> running{true};

public:
    std::atomic<int> last_signal{0};
};
