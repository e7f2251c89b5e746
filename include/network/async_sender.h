#pragma once

#include "network/transport_client.h"
#include "protocol/fix_builder.h"
#include "protocol/order_request.h"
#include "session/fix_session.h"
#include "utils/message_queue.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <mutex>
#include <string>
#include <thread>

namespace fix_order_entry::network
{
    struct Endpoint
    {
        std::string host = constants::DEFAULT_HOST;
        int port = constants::DEFAULT_PORT;
    };

    // What happened to one submitted order
    struct SubmissionResult
    {
        uint64_t job_id = 0;
        std::string message; // raw bytes that were sent
        std::string clOrdID;
        int msgSeqNum = 0;
        TransportOutcome outcome;

        bool delivered() const { return isDelivered(outcome); }
    };

    enum class OrderEventType
    {
        SENT,
        RECEIVED,
        INFO,
        ERROR
    };

    struct OrderEvent
    {
        OrderEventType type = OrderEventType::INFO;
        uint64_t job_id = 0;
        std::string text;
        std::chrono::system_clock::time_point timestamp;
    };

    const char *eventTypeName(OrderEventType type);

    struct SendJob
    {
        uint64_t id = 0;
        protocol::OrderRequest order;
        std::promise<SubmissionResult> promise;
    };

    struct SenderStats
    {
        size_t total_jobs_submitted;
        size_t total_jobs_rejected; // queue full or stopped
        size_t total_orders_delivered;
        size_t total_orders_failed;
        size_t current_queue_depth;
        size_t pending_events;
    };

    // Runs submissions on one worker thread. Each job is built against the
    // shared session, sent through the transport client, and reported both
    // through its future and the event queue.
    class AsyncSender
    {
    public:
        AsyncSender(session::FixSession &session,
                    const protocol::FixBuilder::BuilderConfig &builder_config,
                    const Endpoint &endpoint,
                    const TransportOptions &options,
                    size_t job_queue_size = constants::JOB_QUEUE_SIZE,
                    size_t event_queue_size = constants::EVENT_QUEUE_SIZE);

        ~AsyncSender();

        AsyncSender(const AsyncSender &) = delete;
        AsyncSender &operator=(const AsyncSender &) = delete;

        // Lifecycle management
        void start();
        void stop(); // executes jobs already queued, then joins
        bool isRunning() const;

        // Throws std::runtime_error if the sender is not running or the queue is full
        std::future<SubmissionResult> submit(const protocol::OrderRequest &order);

        // Event stream for presentation
        bool pollEvent(OrderEvent &event);
        bool waitEvent(OrderEvent &event, std::chrono::milliseconds timeout);

        SenderStats getStats() const;
        const Endpoint &getEndpoint() const { return endpoint_; }

    private:
        session::FixSession &session_;
        protocol::FixBuilder builder_;
        TransportClient transport_;
        const Endpoint endpoint_;

        utils::MessageQueue<SendJob> job_queue_;
        utils::MessageQueue<OrderEvent> event_queue_;

        // Threading
        std::thread sender_thread_;
        std::atomic<bool> running_;
        std::mutex lifecycle_mutex_;
        std::atomic<uint64_t> next_job_id_{1};

        // Performance tracking
        std::atomic<size_t> total_submitted_{0};
        std::atomic<size_t> total_rejected_{0};
        std::atomic<size_t> total_delivered_{0};
        std::atomic<size_t> total_failed_{0};

        void senderLoop();
        void processJob(SendJob &job);
        void publish(OrderEventType type, uint64_t job_id, const std::string &text);
    };

} // namespace fix_order_entry::network
