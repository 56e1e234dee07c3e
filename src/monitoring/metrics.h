#pragma once
#include <cstdint>
#include <string>
#include <map>
#include <mutex>

class Metrics {
public:
    static Metrics& instance();

    void inc(const std::string& name, int64_t value = 1);
    void set(const std::string& name, int64_t value);
    int64_t get(const std::string& name) const;

    std::string renderPrometheus() const;

private:
    Metrics() = default;
    mutable std::mutex mutex_;
    // ordered so the exposition output is stable
    std::map<std::string, int64_t> counters_;
};
