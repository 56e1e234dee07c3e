#pragma once
#include <atomic>
#include <chrono>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "intel/intel_source.h"

struct IntelSourceStatus {
    std::string name;
    bool enabled = false;
};

// Fans a lookup out to every enabled source and merges whatever answers
// before the deadline. Late sources are abandoned, not cancelled: their
// threads keep running until the transport timeout ends them. Finished
// threads are reaped on the next lookup; the destructor joins the rest.
//
// Sources must be added before the first lookup.
class IntelAggregator : public ThreatIntelSource {
public:
    explicit IntelAggregator(std::chrono::milliseconds budget);
    ~IntelAggregator() override;

    IntelAggregator(const IntelAggregator&) = delete;
    IntelAggregator& operator=(const IntelAggregator&) = delete;

    void addSource(std::shared_ptr<ThreatIntelSource> source);

    ThreatIntelSignal lookup(const std::string& url) override;

    std::string name() const override {
        return "IntelAggregator";
    }

    bool enabled() const override;

    std::vector<IntelSourceStatus> status() const;

    std::chrono::milliseconds budget() const { return budget_; }

    // Lookup threads not yet reaped, finished or not
    size_t workerCount() const;

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void reapFinished();

    std::chrono::milliseconds budget_;
    std::vector<std::shared_ptr<ThreatIntelSource>> sources_;

    mutable std::mutex workersMutex_;
    std::list<Worker> workers_;
};
