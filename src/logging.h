#pragma once

#include "../utils/logger.hpp"
#include "format.h"
#include <cstdint>
#include <string>
#include <type_traits>

enum class ActionStatus : std::uint8_t {
    Pass,
    Fail,
    Attempted,
};

inline std::string action_status_to_string(ActionStatus status) {
    switch(status) {
    case ActionStatus::Pass: return "pass";
    case ActionStatus::Fail: return "fail";
    case ActionStatus::Attempted: return "attempted";
    default: return "unknown";
    }
}

namespace detail {

template<typename... Args>
inline void append_fields(std::string& message, Args&&... args) {
    (
        [&message](const auto& arg) {
            if constexpr(std::is_convertible_v<decltype(arg), std::string>) {
                message += " " + std::string(arg);
            } else if constexpr(std::is_arithmetic_v<std::remove_reference_t<decltype(arg)>>) {
                message += " " + std::to_string(arg);
            } else {
                message += " " + std::string("(non-string type)");
            }
        }(std::forward<Args>(args)),
        ...);
}

template<LogLevel Level>
inline void emit(const std::string& message) {
    if constexpr(Level == LogLevel::DEBUG) {
        LOG_OMS_DEBUG(message);
    } else if constexpr(Level == LogLevel::INFO) {
        LoggerSingleton::get().oms().info(message);
    } else if constexpr(Level == LogLevel::WARNING) {
        LoggerSingleton::get().oms().warning(message);
    } else if constexpr(Level == LogLevel::ERROR) {
        LoggerSingleton::get().oms().error(message);
    }
}

} // namespace detail

template<LogLevel Level = LogLevel::INFO, ActionStatus Status, typename... Args>
inline void log_action(const std::string& action, Args&&... args) {
#ifndef DEBUG_MODE
    if constexpr(Level == LogLevel::DEBUG) {
        return;
    }
#endif
    std::string message = f("action", action) + " " + f("status", action_status_to_string(Status));
    detail::append_fields(message, std::forward<Args>(args)...);
    detail::emit<Level>(message);
}

template<LogLevel Level = LogLevel::INFO, typename... Args>
inline void log_action_pass(const std::string& action, Args&&... args) {
    log_action<Level, ActionStatus::Pass>(action, std::forward<Args>(args)...);
}

template<LogLevel Level = LogLevel::INFO, typename... Args>
inline void log_action_fail(const std::string& action, const std::string& reason, Args&&... args) {
    log_action<Level, ActionStatus::Fail>(action, f("reason", reason), std::forward<Args>(args)...);
}

template<LogLevel Level = LogLevel::INFO, typename... Args>
inline void log_action_attempt(const std::string& action, Args&&... args) {
    log_action<Level, ActionStatus::Attempted>(action, std::forward<Args>(args)...);
}

// Macro versions keep debug arguments unevaluated in release builds
#ifdef DEBUG_MODE
#define LOG_ACTION_PASS_DEBUG(action, ...) log_action_pass<LogLevel::DEBUG>(action __VA_OPT__(, ) __VA_ARGS__)
#define LOG_ACTION_FAIL_DEBUG(action, reason, ...) \
    log_action_fail<LogLevel::DEBUG>(action, reason __VA_OPT__(, ) __VA_ARGS__)
#define LOG_ACTION_ATTEMPT_DEBUG(action, ...) log_action_attempt<LogLevel::DEBUG>(action __VA_OPT__(, ) __VA_ARGS__)
#else
#define LOG_ACTION_PASS_DEBUG(...)
#define LOG_ACTION_FAIL_DEBUG(...)
#define LOG_ACTION_ATTEMPT_DEBUG(...)
#endif

template<LogLevel Level = LogLevel::INFO, typename... Args>
inline void log_event(const std::string& event, Args&&... args) {
#ifndef DEBUG_MODE
    if constexpr(Level == LogLevel::DEBUG) {
        return;
    }
#endif
    std::string message = f("event", event);
    detail::append_fields(message, std::forward<Args>(args)...);
    detail::emit<Level>(message);
}

#ifdef DEBUG_MODE
#define LOG_EVENT_DEBUG(event, ...) log_event<LogLevel::DEBUG>(event __VA_OPT__(, ) __VA_ARGS__)
#else
#define LOG_EVENT_DEBUG(...)
#endif
