#include "pandrive/transfer.hpp"

#include <algorithm>
#include <array>

namespace pandrive
{

    namespace
    {

        struct StateMapping
        {
            TransferState state;
            std::string_view label;
        };

        constexpr std::array<StateMapping, 6> kStateMappings{{
            {TransferState::Queued, "queued"},
            {TransferState::Running, "running"},
            {TransferState::Paused, "paused"},
            {TransferState::Completed, "completed"},
            {TransferState::Failed, "failed"},
            {TransferState::Skipped, "skipped"},
        }};

    } // namespace

    std::int64_t to_unix_time(std::filesystem::file_time_type time)
    {
        const auto system = std::filesystem::file_time_type::clock::to_sys(time);
        return std::chrono::duration_cast<std::chrono::seconds>(system.time_since_epoch()).count();
    }

    std::string_view to_string(TransferState state) noexcept
    {
        for (const auto &mapping : kStateMappings)
        {
            if (mapping.state == state)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    bool is_terminal(TransferState state) noexcept
    {
        return state == TransferState::Paused || state == TransferState::Completed ||
               state == TransferState::Failed || state == TransferState::Skipped;
    }

    void EventChannel::push(TransferEvent event)
    {
        {
            std::lock_guard lock(mutex_);
            if (closed_)
            {
                return;
            }
            events_.push_back(std::move(event));
        }
        ready_.notify_one();
    }

    void EventChannel::close()
    {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

    std::optional<TransferEvent> EventChannel::pop()
    {
        std::unique_lock lock(mutex_);
        ready_.wait(lock, [this]
                    { return closed_ || !events_.empty(); });
        if (events_.empty())
        {
            return std::nullopt;
        }
        auto event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

    std::optional<TransferEvent> EventChannel::try_pop()
    {
        std::lock_guard lock(mutex_);
        if (events_.empty())
        {
            return std::nullopt;
        }
        auto event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

    std::vector<TransferEvent> EventChannel::drain()
    {
        std::lock_guard lock(mutex_);
        std::vector<TransferEvent> result(std::make_move_iterator(events_.begin()),
                                          std::make_move_iterator(events_.end()));
        events_.clear();
        return result;
    }

    bool EventChannel::closed() const
    {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    void TransferControl::pause()
    {
        paused_.store(true);
        changed_.notify_all();
    }

    void TransferControl::resume()
    {
        {
            std::lock_guard lock(mutex_);
            paused_.store(false);
        }
        changed_.notify_all();
    }

    void TransferControl::cancel()
    {
        {
            std::lock_guard lock(mutex_);
            cancelled_.store(true);
        }
        changed_.notify_all();
    }

    bool TransferControl::wait_if_paused()
    {
        std::unique_lock lock(mutex_);
        changed_.wait(lock, [this]
                      { return !paused_.load() || cancelled_.load(); });
        return !cancelled_.load();
    }

    std::size_t BatchResult::count(TransferState state) const
    {
        return static_cast<std::size_t>(std::count_if(files.begin(), files.end(), [state](const TransferResult &file)
                                                      { return file.state == state; }));
    }

    bool BatchResult::all_succeeded() const
    {
        return std::all_of(files.begin(), files.end(), [](const TransferResult &file)
                           { return file.state == TransferState::Completed || file.state == TransferState::Skipped; });
    }

    ProgressReporter::ProgressReporter(std::string task_id, std::string path, std::uint64_t total,
                                       EventChannel *events, RateCounter *rate)
        : task_id_(std::move(task_id)),
          path_(std::move(path)),
          total_(total),
          events_(events),
          rate_(rate)
    {
    }

    void ProgressReporter::start(std::uint64_t already_done)
    {
        std::lock_guard lock(publish_mutex_);
        done_.store(already_done);
        publish(TransferState::Running, std::nullopt);
    }

    void ProgressReporter::add(std::uint64_t bytes)
    {
        if (bytes == 0)
        {
            return;
        }
        if (rate_)
        {
            rate_->add(bytes);
        }
        std::lock_guard lock(publish_mutex_);
        done_.fetch_add(bytes);
        publish(TransferState::Running, std::nullopt);
    }

    void ProgressReporter::rewind(std::uint64_t done)
    {
        std::lock_guard lock(publish_mutex_);
        done_.store(done);
    }

    void ProgressReporter::finish(TransferState state, std::optional<std::string> error)
    {
        std::lock_guard lock(publish_mutex_);
        publish(state, std::move(error));
    }

    TransferResult ProgressReporter::result(TransferState state, std::exception_ptr error) const
    {
        TransferResult result;
        result.task_id = task_id_;
        result.path = path_;
        result.state = state;
        result.bytes_done = done_.load();
        result.bytes_total = total_;
        result.error = std::move(error);
        return result;
    }

    void ProgressReporter::publish(TransferState state, std::optional<std::string> error)
    {
        if (!events_)
        {
            return;
        }
        events_->push(TransferEvent{
            .task_id = task_id_,
            .path = path_,
            .bytes_done = done_.load(),
            .bytes_total = total_,
            .state = state,
            .error = std::move(error),
        });
    }

} // namespace pandrive
