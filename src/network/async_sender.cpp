#include "network/async_sender.h"
#include "protocol/fix_message.h"
#include "utils/logger.h"

#include <exception>
#include <stdexcept>

namespace fix_order_entry::network
{
    using protocol::FixMessage;
    using protocol::FixMessageUtils::toReadable;

    const char *eventTypeName(OrderEventType type)
    {
        switch (type)
        {
        case OrderEventType::SENT:
            return "SENT";
        case OrderEventType::RECEIVED:
            return "RECEIVED";
        case OrderEventType::INFO:
            return "INFO";
        case OrderEventType::ERROR:
            return "ERROR";
        default:
            return "UNKNOWN";
        }
    }

    AsyncSender::AsyncSender(session::FixSession &session,
                             const protocol::FixBuilder::BuilderConfig &builder_config,
                             const Endpoint &endpoint,
                             const TransportOptions &options,
                             size_t job_queue_size,
                             size_t event_queue_size)
        : session_(session),
          builder_(builder_config),
          transport_(options),
          endpoint_(endpoint),
          job_queue_(job_queue_size, "send_jobs"),
          event_queue_(event_queue_size, "order_events"),
          running_(false)
    {
        if (endpoint_.host.empty())
        {
            throw std::invalid_argument("Endpoint host cannot be empty");
        }
        if (endpoint_.port <= 0 || endpoint_.port > 65535)
        {
            throw std::invalid_argument("Endpoint port out of range: " + std::to_string(endpoint_.port));
        }
    }

    AsyncSender::~AsyncSender()
    {
        stop();
    }

    void AsyncSender::start()
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (running_.load())
        {
            return; // Already running
        }
        if (job_queue_.isShutdown())
        {
            throw std::logic_error("AsyncSender cannot be restarted after stop()");
        }

        running_.store(true);
        sender_thread_ = std::thread(&AsyncSender::senderLoop, this);
        LOG_INFO("AsyncSender started for " + endpoint_.host + ":" + std::to_string(endpoint_.port));
    }

    void AsyncSender::stop()
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (!running_.load())
        {
            return;
        }

        // Refuse new jobs; the worker keeps popping until the queue is empty
        job_queue_.shutdown();
        if (sender_thread_.joinable())
        {
            sender_thread_.join();
        }
        running_.store(false);
        LOG_INFO("AsyncSender stopped");
    }

    bool AsyncSender::isRunning() const
    {
        return running_.load();
    }

    std::future<SubmissionResult> AsyncSender::submit(const protocol::OrderRequest &order)
    {
        if (!running_.load())
        {
            total_rejected_++;
            throw std::runtime_error("AsyncSender is not running");
        }

        SendJob job;
        job.id = next_job_id_.fetch_add(1);
        job.order = order;
        std::future<SubmissionResult> future = job.promise.get_future();
        uint64_t id = job.id;

        if (!job_queue_.push(std::move(job)))
        {
            total_rejected_++;
            throw std::runtime_error("Send queue rejected job " + std::to_string(id) +
                                     (job_queue_.isShutdown() ? " (stopped)" : " (full)"));
        }

        total_submitted_++;
        LOG_DEBUG("Queued job " + std::to_string(id) + " for " + order.symbol);
        return future;
    }

    bool AsyncSender::pollEvent(OrderEvent &event)
    {
        return event_queue_.tryPop(event);
    }

    bool AsyncSender::waitEvent(OrderEvent &event, std::chrono::milliseconds timeout)
    {
        return event_queue_.pop(event, timeout);
    }

    SenderStats AsyncSender::getStats() const
    {
        SenderStats stats;
        stats.total_jobs_submitted = total_submitted_.load();
        stats.total_jobs_rejected = total_rejected_.load();
        stats.total_orders_delivered = total_delivered_.load();
        stats.total_orders_failed = total_failed_.load();
        stats.current_queue_depth = job_queue_.size();
        stats.pending_events = event_queue_.size();
        return stats;
    }

    void AsyncSender::senderLoop()
    {
        SendJob job;

        // pop() only fails once the queue is shut down and drained
        while (job_queue_.pop(job))
        {
            processJob(job);
        }

        LOG_DEBUG("Exiting sender loop");
    }

    void AsyncSender::processJob(SendJob &job)
    {
        std::string message;
        try
        {
            message = builder_.buildNewOrderSingle(session_, job.order);
        }
        catch (const std::exception &e)
        {
            total_failed_++;
            publish(OrderEventType::ERROR, job.id, std::string("Order not sent: ") + e.what());
            job.promise.set_exception(std::current_exception());
            return;
        }

        FixMessage parsed(message);
        SubmissionResult result;
        result.job_id = job.id;
        result.message = message;
        result.clOrdID = parsed.getClOrdID();
        result.msgSeqNum = parsed.getMsgSeqNum();

        publish(OrderEventType::SENT, job.id, "Sent: " + toReadable(message));

        result.outcome = transport_.send(endpoint_.host, endpoint_.port, message);

        if (std::holds_alternative<Received>(result.outcome))
        {
            publish(OrderEventType::RECEIVED, job.id,
                    "Received: " + toReadable(std::get<Received>(result.outcome).bytes));
        }
        else if (isDelivered(result.outcome))
        {
            publish(OrderEventType::INFO, job.id, describe(result.outcome));
        }
        else
        {
            publish(OrderEventType::ERROR, job.id, describe(result.outcome));
        }

        if (result.delivered())
        {
            total_delivered_++;
        }
        else
        {
            total_failed_++;
        }
        job.promise.set_value(std::move(result));
    }

    void AsyncSender::publish(OrderEventType type, uint64_t job_id, const std::string &text)
    {
        OrderEvent event;
        event.type = type;
        event.job_id = job_id;
        event.text = text;
        event.timestamp = std::chrono::system_clock::now();

        if (!event_queue_.push(std::move(event)))
        {
            LOG_WARN("Event queue full, dropped " + std::string(eventTypeName(type)) +
                     " event for job " + std::to_string(job_id));
        }
    }

} // namespace fix_order_entry::network
