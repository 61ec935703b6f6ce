#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>

// Per-market cooldowns. A cooldown can be extended but never shortened, and
// an expired entry is dropped the first time it is queried.
class CooldownLedger {
public:
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;
    using Duration = Clock::duration;

    struct Status {
        Duration remaining;
        std::string reason;
    };

    void extend(const std::string& market, TimePoint now, Duration duration, const std::string& reason) {
        if(market.empty()) {
            return;
        }
        const TimePoint until = now + duration;
        auto it = cooldowns_.find(market);
        if(it == cooldowns_.end()) {
            cooldowns_.emplace(market, Entry{until, reason});
            return;
        }
        if(until > it->second.until) {
            it->second.until = until;
        }
        it->second.reason = reason;
    }

    [[nodiscard]] std::optional<Status> query(const std::string& market, TimePoint now) {
        auto it = cooldowns_.find(market);
        if(it == cooldowns_.end()) {
            return std::nullopt;
        }
        if(now >= it->second.until) {
            cooldowns_.erase(it);
            return std::nullopt;
        }
        return Status{it->second.until - now, it->second.reason};
    }

    [[nodiscard]] std::optional<TimePoint> get_until(const std::string& market) const {
        auto it = cooldowns_.find(market);
        if(it == cooldowns_.end()) {
            return std::nullopt;
        }
        return it->second.until;
    }

    void clear() { cooldowns_.clear(); }

private:
    struct Entry {
        TimePoint until;
        std::string reason;
    };

    std::unordered_map<std::string, Entry> cooldowns_;
};
