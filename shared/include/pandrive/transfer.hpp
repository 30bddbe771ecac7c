/**
 * PanDrive - Transfer state, progress events and user control.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pandrive
{

    // Whole seconds since the epoch of a file timestamp.
    std::int64_t to_unix_time(std::filesystem::file_time_type time);

    struct RetryPolicy
    {
        std::uint32_t max_retries{3};
        std::chrono::milliseconds delay{1000};
    };

    enum class TransferState : std::uint8_t
    {
        Queued,
        Running,
        Paused,
        Completed,
        Failed,
        Skipped
    };

    std::string_view to_string(TransferState state) noexcept;

    bool is_terminal(TransferState state) noexcept;

    struct TransferEvent
    {
        std::string task_id;
        std::string path;
        std::uint64_t bytes_done{};
        std::uint64_t bytes_total{};
        TransferState state{TransferState::Running};
        std::optional<std::string> error{};
    };

    // Unbounded multi-producer queue; pop() blocks until an event arrives or
    // the channel is closed and drained.
    class EventChannel
    {
    public:
        void push(TransferEvent event);
        void close();

        std::optional<TransferEvent> pop();
        std::optional<TransferEvent> try_pop();
        std::vector<TransferEvent> drain();

        bool closed() const;

    private:
        mutable std::mutex mutex_;
        std::condition_variable ready_;
        std::deque<TransferEvent> events_;
        bool closed_{false};
    };

    class TransferControl
    {
    public:
        void pause();
        void resume();
        // Also wakes a paused transfer so it can stop.
        void cancel();

        bool paused() const noexcept { return paused_.load(); }
        bool cancelled() const noexcept { return cancelled_.load(); }
        bool stop_requested() const noexcept { return paused() || cancelled(); }

        // Blocks while paused. Returns false once cancelled.
        bool wait_if_paused();

    private:
        std::atomic<bool> paused_{false};
        std::atomic<bool> cancelled_{false};
        std::mutex mutex_;
        std::condition_variable changed_;
    };

    // Bytes moved by all transfers of an engine.
    class RateCounter
    {
    public:
        void add(std::uint64_t bytes) noexcept { total_.fetch_add(bytes, std::memory_order_relaxed); }
        std::uint64_t total() const noexcept { return total_.load(std::memory_order_relaxed); }

    private:
        std::atomic<std::uint64_t> total_{0};
    };

    struct TransferResult
    {
        std::string task_id;
        std::string path;
        TransferState state{TransferState::Queued};
        std::uint64_t bytes_done{};
        std::uint64_t bytes_total{};
        bool rapid_upload{};
        std::exception_ptr error{};
    };

    struct BatchResult
    {
        std::vector<TransferResult> files;

        std::size_t count(TransferState state) const;
        bool all_succeeded() const;
    };

    // Progress of one task. add() is called by the worker doing the I/O;
    // every call publishes an event with the accumulated byte count.
    class ProgressReporter
    {
    public:
        ProgressReporter(std::string task_id, std::string path, std::uint64_t total, EventChannel *events,
                         RateCounter *rate);

        void start(std::uint64_t already_done);
        void add(std::uint64_t bytes);
        // Resets the count without publishing, e.g. after bytes past a resume
        // point were discarded.
        void rewind(std::uint64_t done);
        void finish(TransferState state, std::optional<std::string> error = std::nullopt);

        std::uint64_t done() const noexcept { return done_.load(); }
        std::uint64_t total() const noexcept { return total_; }
        const std::string &task_id() const noexcept { return task_id_; }
        const std::string &path() const noexcept { return path_; }

        TransferResult result(TransferState state, std::exception_ptr error = nullptr) const;

    private:
        void publish(TransferState state, std::optional<std::string> error);

        std::string task_id_;
        std::string path_;
        std::uint64_t total_;
        EventChannel *events_;
        RateCounter *rate_;
        std::atomic<std::uint64_t> done_{0};
        std::mutex publish_mutex_;
    };

} // namespace pandrive
