#include "proxykeeper/service/TaskScheduler.hpp"
#include "proxykeeper/util/Logging.hpp"

#include <boost/asio/post.hpp>

#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace proxykeeper::service {

TaskScheduler::TaskScheduler(boost::asio::io_context& io,
                             boost::asio::thread_pool& worker,
                             StalenessReconciler& reconciler,
                             repository::ProxyRecordStore& store,
                             const util::Clock& clock,
                             Config config)
    : io_(io)
    , worker_(worker)
    , reconciler_(reconciler)
    , store_(store)
    , clock_(clock)
    , config_(std::move(config)) {
    if (config_.maxConcurrentCycles == 0) {
        config_.maxConcurrentCycles = 1;
    }
}

TaskScheduler::~TaskScheduler() {
    stop();
}

void TaskScheduler::start() {
    if (running_.exchange(true)) {
        return;
    }
    timer_ = std::make_unique<boost::asio::steady_timer>(io_);
    util::log(util::LogLevel::info,
              "Reconciliation scheduled every " + std::to_string(config_.interval.count()) + "s, stale after " +
                  std::to_string(config_.staleAfter.count()) + "s");
    scheduleNext();
}

void TaskScheduler::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (timer_) {
        timer_->cancel();
    }
}

std::size_t TaskScheduler::runReconciliationTick() {
    std::vector<model::Source> sources;
    try {
        sources = store_.listSources();
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, std::string("Listing sources for reconciliation failed: ") + ex.what());
        return 0;
    }

    std::size_t dispatched = 0;
    std::size_t queued = 0;
    {
        std::scoped_lock lock(inFlightMutex_);
        for (const auto& source : sources) {
            if (inFlight_.count(source.id) > 0 || queuedIds_.count(source.id) > 0) {
                util::log(util::LogLevel::debug,
                          "Source " + std::to_string(source.id) + " still reconciling, skipped");
                continue;
            }
            if (inFlight_.size() < config_.maxConcurrentCycles) {
                inFlight_.insert(source.id);
                dispatchLocked(source.id);
                ++dispatched;
            } else {
                queuedIds_.insert(source.id);
                queue_.push_back(source.id);
                ++queued;
            }
        }
    }
    if (queued > 0) {
        util::log(util::LogLevel::debug,
                  "Reconciliation tick saturated, " + std::to_string(queued) + " sources queued");
    }
    return dispatched;
}

bool TaskScheduler::isCycleRunning(int sourceId) const {
    std::scoped_lock lock(inFlightMutex_);
    return inFlight_.count(sourceId) > 0;
}

std::size_t TaskScheduler::inFlightCount() const {
    std::scoped_lock lock(inFlightMutex_);
    return inFlight_.size();
}

std::size_t TaskScheduler::queuedCount() const {
    std::scoped_lock lock(inFlightMutex_);
    return queue_.size();
}

void TaskScheduler::dispatchLocked(int sourceId) {
    boost::asio::post(worker_, [this, sourceId]() { runCycle(sourceId); });
}

void TaskScheduler::scheduleNext() {
    timer_->expires_after(config_.interval);
    timer_->async_wait([this](const boost::system::error_code& ec) {
        if (ec || !running_.load()) {
            return;
        }
        runReconciliationTick();
        scheduleNext();
    });
}

void TaskScheduler::runCycle(int sourceId) {
    try {
        reconciler_.reconcileSource(sourceId, clock_.now(), config_.staleAfter);
        ++completed_;
    } catch (const std::exception& ex) {
        ++failed_;
        util::log(util::LogLevel::error,
                  "Reconciliation cycle for source " + std::to_string(sourceId) + " failed: " + ex.what());
    }
    std::scoped_lock lock(inFlightMutex_);
    inFlight_.erase(sourceId);
    // The freed slot goes to the oldest queued source.
    if (!queue_.empty() && inFlight_.size() < config_.maxConcurrentCycles) {
        int next = queue_.front();
        queue_.pop_front();
        queuedIds_.erase(next);
        inFlight_.insert(next);
        dispatchLocked(next);
    }
}

} // namespace proxykeeper::service
