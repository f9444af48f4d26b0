#include "core/queue/PrintDispatchQueue.hpp"
#include "logger/Logger.hpp"
#include <stdexcept>
#include <vector>

namespace core {

    PrintDispatchQueue::PrintDispatchQueue(std::shared_ptr<DeliveryChannel> channel)
            : channel_(std::move(channel)) {
        if (!channel_) {
            throw std::invalid_argument("DeliveryChannel cannot be null");
        }
        Logger::logInfo("[PrintDispatchQueue] Created");
    }

    PrintDispatchQueue::~PrintDispatchQueue() {
        stop();
    }

    void PrintDispatchQueue::start() {
        if (running_) {
            Logger::logWarning("[PrintDispatchQueue] Already running");
            return;
        }
        stopping_ = false;
        running_ = true;
        Logger::logInfo("[PrintDispatchQueue] Started");
    }

    void PrintDispatchQueue::stop() {
        if (!running_) return;

        Logger::logInfo("[PrintDispatchQueue] Stopping...");

        std::map<std::string, std::unique_ptr<Lane>> lanes;
        {
            std::lock_guard<std::mutex> lock(lanesMutex_);
            stopping_ = true;
            lanes.swap(lanes_);
        }

        for (auto &[key, lane]: lanes) {
            {
                std::lock_guard<std::mutex> laneLock(lane->mutex);
            }
            lane->condition.notify_all();
        }

        for (auto &[key, lane]: lanes) {
            if (lane->worker.joinable()) {
                lane->worker.join();
            }
        }

        running_ = false;
        Logger::logInfo("[PrintDispatchQueue] Stopped (" + std::to_string(lanes.size()) + " lane(s))");
    }

    std::future<types::DeliveryResult> PrintDispatchQueue::enqueue(std::shared_ptr<const EncodedJob> job) {
        if (!job) {
            throw std::invalid_argument("EncodedJob cannot be null");
        }

        PendingJob pending;
        pending.job = std::move(job);
        pending.sequenceId = nextSequenceId_++;
        auto future = pending.promise.get_future();

        std::lock_guard<std::mutex> lock(lanesMutex_);
        if (!isRunning()) {
            Logger::logWarning("[PrintDispatchQueue] Rejecting " + pending.job->label + ": queue not running");
            pending.promise.set_value(types::DeliveryResult::cancelled("dispatch queue not running"));
            return future;
        }

        Lane &lane = laneFor(pending.job->endpoint.key());
        size_t depth;
        {
            std::lock_guard<std::mutex> laneLock(lane.mutex);
            Logger::logInfo("[PrintDispatchQueue] Queued #" + std::to_string(pending.sequenceId) + " " +
                            pending.job->label + " for " + lane.key);
            lane.pending.push_back(std::move(pending));
            depth = lane.pending.size();
        }
        lane.condition.notify_one();

        {
            std::lock_guard<std::mutex> statsLock(statsMutex_);
            stats_.totalEnqueued++;
        }
        if (depth > 1) {
            Logger::logInfo("[PrintDispatchQueue] " + lane.key + " has " + std::to_string(depth) + " job(s) waiting");
        }
        return future;
    }

    PrintDispatchQueue::Statistics PrintDispatchQueue::getStatistics() const {
        Statistics snapshot;
        {
            std::lock_guard<std::mutex> statsLock(statsMutex_);
            snapshot = stats_;
        }

        std::lock_guard<std::mutex> lock(lanesMutex_);
        snapshot.lanes = lanes_.size();
        snapshot.pendingJobs = 0;
        for (const auto &[key, lane]: lanes_) {
            std::lock_guard<std::mutex> laneLock(lane->mutex);
            snapshot.pendingJobs += lane->pending.size();
        }
        return snapshot;
    }

    // Caller holds lanesMutex_.
    PrintDispatchQueue::Lane &PrintDispatchQueue::laneFor(const std::string &key) {
        auto it = lanes_.find(key);
        if (it != lanes_.end()) {
            return *it->second;
        }

        auto lane = std::make_unique<Lane>();
        lane->key = key;
        Lane &ref = *lane;
        ref.worker = std::thread([this, &ref]() {
            try {
                laneLoop(ref);
            } catch (const std::exception &e) {
                Logger::logError("[PrintDispatchQueue] Lane " + ref.key + " crashed: " + std::string(e.what()));
            }
        });
        lanes_.emplace(key, std::move(lane));
        Logger::logInfo("[PrintDispatchQueue] Opened lane for " + key);
        return ref;
    }

    void PrintDispatchQueue::laneLoop(Lane &lane) {
        while (true) {
            PendingJob next;
            {
                std::unique_lock<std::mutex> lock(lane.mutex);
                lane.condition.wait(lock, [&]() { return stopping_.load() || !lane.pending.empty(); });
                if (stopping_) break;

                next = std::move(lane.pending.front());
                lane.pending.pop_front();
            }

            types::DeliveryResult result = types::DeliveryResult::writeFailed("not attempted");
            try {
                result = channel_->deliver(next.job->endpoint, next.job->payload);
            } catch (const std::exception &e) {
                Logger::logError("[PrintDispatchQueue] Delivery of " + next.job->label + " threw: " + e.what());
                result = types::DeliveryResult::writeFailed(e.what());
            }

            updateStats(result.isSuccess());
            next.promise.set_value(result);
        }

        std::deque<PendingJob> leftovers;
        {
            std::lock_guard<std::mutex> lock(lane.mutex);
            leftovers.swap(lane.pending);
        }
        for (auto &pending: leftovers) {
            Logger::logWarning("[PrintDispatchQueue] Cancelling " + pending.job->label + " on shutdown");
            pending.promise.set_value(types::DeliveryResult::cancelled("dispatch queue stopped"));
        }
    }

    void PrintDispatchQueue::updateStats(bool delivered) {
        std::lock_guard<std::mutex> lock(statsMutex_);
        if (delivered) {
            stats_.totalDelivered++;
        } else {
            stats_.totalFailed++;
        }
    }

} // namespace core
