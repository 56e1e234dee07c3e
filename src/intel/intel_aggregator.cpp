#include "intel/intel_aggregator.h"
#include "core/logger.h"
#include "monitoring/metrics.h"

#include <future>
#include <system_error>
#include <thread>

IntelAggregator::IntelAggregator(std::chrono::milliseconds budget)
    : budget_(budget) {}

IntelAggregator::~IntelAggregator() {
    std::list<Worker> pending;
    {
        std::lock_guard lock(workersMutex_);
        pending.swap(workers_);
    }
    for (auto& w : pending) {
        if (w.thread.joinable())
            w.thread.join();
    }
}

void IntelAggregator::reapFinished() {
    std::lock_guard lock(workersMutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable())
                it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t IntelAggregator::workerCount() const {
    std::lock_guard lock(workersMutex_);
    return workers_.size();
}

void IntelAggregator::addSource(std::shared_ptr<ThreatIntelSource> source) {
    if (!source)
        return;

    Logger::instance().log(LogLevel::Info,
        "Threat intel source " + source->name() +
        (source->enabled() ? ": enabled" : ": disabled (no credentials)"));
    sources_.push_back(std::move(source));
}

bool IntelAggregator::enabled() const {
    for (const auto& s : sources_) {
        if (s->enabled())
            return true;
    }
    return false;
}

std::vector<IntelSourceStatus> IntelAggregator::status() const {
    std::vector<IntelSourceStatus> out;
    out.reserve(sources_.size());
    for (const auto& s : sources_)
        out.push_back({s->name(), s->enabled()});
    return out;
}

ThreatIntelSignal IntelAggregator::lookup(const std::string& url) {
    struct Pending {
        std::string name;
        std::future<ThreatIntelSignal> result;
    };

    reapFinished();

    std::vector<Pending> pending;
    for (const auto& source : sources_) {
        if (!source->enabled())
            continue;

        auto slot = std::make_shared<std::promise<ThreatIntelSignal>>();
        Pending p{source->name(), slot->get_future()};

        auto done = std::make_shared<std::atomic<bool>>(false);
        try {
            std::thread t([source, slot, done, url]() {
                ThreatIntelSignal s;
                try {
                    s = source->lookup(url);
                } catch (const std::exception& e) {
                    Logger::instance().log(LogLevel::Warn,
                        "Threat intel source " + source->name() +
                        " threw: " + e.what());
                    Metrics::instance().inc("intel_lookup_failures_total");
                }
                // Flag first: once the result is visible the thread is reapable
                done->store(true);
                slot->set_value(s);
            });
            std::lock_guard lock(workersMutex_);
            workers_.push_back(Worker{std::move(t), done});
        } catch (const std::system_error& e) {
            Logger::instance().log(LogLevel::Error,
                "Threat intel: cannot start lookup thread: " + std::string(e.what()));
            continue;
        }

        pending.push_back(std::move(p));
    }

    ThreatIntelSignal merged;
    auto deadline = std::chrono::steady_clock::now() + budget_;

    for (auto& p : pending) {
        if (p.result.wait_until(deadline) != std::future_status::ready) {
            Logger::instance().log(LogLevel::Warn,
                "Threat intel source " + p.name + " missed the " +
                std::to_string(budget_.count()) + "ms budget, treated as unknown");
            Metrics::instance().inc("intel_lookup_timeouts_total");
            continue;
        }
        merged = mergeSignals(merged, p.result.get());
    }

    return merged;
}
