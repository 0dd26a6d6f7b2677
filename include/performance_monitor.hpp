#pragma once

#include <algorithm>
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <numeric>
#include <string>
#include <vector>

namespace pricemesh {

// Per-instance latency recorder for gossip rounds and inbound messages.
// Keeps the most recent max_samples durations per operation.
class PerformanceMonitor {
public:
    struct LatencyStats {
        double min = 0;
        double max = 0;
        double avg = 0;
        double p95 = 0;
        size_t sample_count = 0;
    };

    explicit PerformanceMonitor(size_t max_samples = 1024) : max_samples_(max_samples) {}

    void record(const std::string& operation_name, double duration_ms) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& samples = latencies_[operation_name];
        samples.push_back(duration_ms);
        if (samples.size() > max_samples_) {
            samples.pop_front();
        }
    }

    // Get statistics for an operation
    LatencyStats getStats(const std::string& operation_name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        LatencyStats stats;

        auto it = latencies_.find(operation_name);
        if (it == latencies_.end() || it->second.empty()) {
            return stats;
        }

        const auto& samples = it->second;
        stats.sample_count = samples.size();

        stats.min = *std::min_element(samples.begin(), samples.end());
        stats.max = *std::max_element(samples.begin(), samples.end());
        stats.avg = std::accumulate(samples.begin(), samples.end(), 0.0) / samples.size();

        std::vector<double> sorted_samples(samples.begin(), samples.end());
        std::sort(sorted_samples.begin(), sorted_samples.end());
        size_t p95_index = std::min(sorted_samples.size() - 1,
                                    static_cast<size_t>(sorted_samples.size() * 0.95));
        stats.p95 = sorted_samples[p95_index];

        return stats;
    }

    std::vector<std::string> operations() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> names;
        for (const auto& entry : latencies_) {
            names.push_back(entry.first);
        }
        return names;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        latencies_.clear();
    }

private:
    const size_t max_samples_;
    mutable std::mutex mutex_;
    std::map<std::string, std::deque<double>> latencies_;
};

} // namespace pricemesh
