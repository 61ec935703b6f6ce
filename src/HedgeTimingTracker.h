#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <unordered_map>

// Per-market EWMA of the delay between an entry fill and its hedge fill.
class HedgeTimingTracker {
public:
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    static constexpr double ALPHA = 0.2;

    // First fill wins; repeated updates for the same entry are ignored.
    void record_entry_filled(const std::string& entry_id, const std::string& market, TimePoint filled_at) {
        if(entry_id.empty() || market.empty()) {
            return;
        }
        pending_.try_emplace(entry_id, Pending{market, filled_at});
    }

    // Consumes the pending entry record; returns false when there is none, so
    // a second call for the same entry never folds a sample twice.
    bool record_hedge_filled(const std::string& entry_id, TimePoint filled_at) {
        auto it = pending_.find(entry_id);
        if(it == pending_.end()) {
            return false;
        }
        const Pending pending = it->second;
        pending_.erase(it);

        const double seconds = std::chrono::duration<double>(filled_at - pending.entry_filled_at).count();
        if(seconds <= 0.0) {
            return false;
        }

        auto& stats = stats_[pending.market];
        if(stats.samples == 0) {
            stats.ewma_seconds = seconds;
        } else {
            stats.ewma_seconds = ALPHA * seconds + (1.0 - ALPHA) * stats.ewma_seconds;
        }
        stats.samples++;
        return true;
    }

    [[nodiscard]] double get_ewma_seconds(const std::string& market) const {
        auto it = stats_.find(market);
        return it == stats_.end() ? 0.0 : it->second.ewma_seconds;
    }

    [[nodiscard]] size_t get_sample_count(const std::string& market) const {
        auto it = stats_.find(market);
        return it == stats_.end() ? 0 : it->second.samples;
    }

    [[nodiscard]] size_t get_pending_count() const { return pending_.size(); }

    void clear_pending() { pending_.clear(); }

    void reset() {
        pending_.clear();
        stats_.clear();
    }

private:
    struct Pending {
        std::string market;
        TimePoint entry_filled_at;
    };

    struct Stats {
        double ewma_seconds = 0.0;
        size_t samples = 0;
    };

    std::unordered_map<std::string, Pending> pending_;
    std::unordered_map<std::string, Stats> stats_;
};
