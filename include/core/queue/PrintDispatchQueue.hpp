//
// Created by Andrea on 15/10/2025.
//

#pragma once

#include "core/network/DeliveryChannel.hpp"
#include "core/queue/EncodedJob.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace core {

    /**
     * @brief Serializes deliveries per printer endpoint.
     *
     * Jobs for the same host:port run one at a time in arrival order on that
     * endpoint's lane; different endpoints have their own lanes and run in
     * parallel. Lanes are created on first use and kept until stop().
     */
    class PrintDispatchQueue {
    public:
        explicit PrintDispatchQueue(std::shared_ptr<DeliveryChannel> channel);

        ~PrintDispatchQueue();

        bool isRunning() const {
            return running_.load() && !stopping_.load();
        }

        void start();

        /**
         * @brief Waits for in-flight deliveries, fails every queued job with Cancelled.
         */
        void stop();

        /**
         * @brief Queues the job on its endpoint lane.
         * @return Future resolved with the delivery outcome
         */
        std::future<types::DeliveryResult> enqueue(std::shared_ptr<const EncodedJob> job);

        struct Statistics {
            size_t totalEnqueued = 0;
            size_t totalDelivered = 0;
            size_t totalFailed = 0;
            size_t pendingJobs = 0;
            size_t lanes = 0;
        };

        Statistics getStatistics() const;

    private:
        struct PendingJob {
            std::shared_ptr<const EncodedJob> job;
            std::promise<types::DeliveryResult> promise;
            uint64_t sequenceId = 0;
        };

        struct Lane {
            std::string key;
            std::deque<PendingJob> pending;
            std::mutex mutex;
            std::condition_variable condition;
            std::thread worker;
        };

        std::shared_ptr<DeliveryChannel> channel_;
        std::map<std::string, std::unique_ptr<Lane>> lanes_;
        mutable std::mutex lanesMutex_;
        std::atomic<bool> running_{false};
        std::atomic<bool> stopping_{false};
        std::atomic<uint64_t> nextSequenceId_{1};

        mutable Statistics stats_;
        mutable std::mutex statsMutex_;

        Lane &laneFor(const std::string &key);

        void laneLoop(Lane &lane);

        void updateStats(bool delivered);
    };
} // namespace core
