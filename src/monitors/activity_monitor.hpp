#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <utility>

#include "helpers/thread_safe_queue.hpp"

enum class Activity
{
    Generated,
    Validated,
    Classified,
    BinExtracted,
    BinLookup,
    Cleared,
    Rejected
};

struct ActivityData
{
    std::string requester;
    Activity activity;
    std::string detail;
};

struct ActivityLog
{
    std::atomic_bool should_close{false};
    ThreadSafeQueue<ActivityData> queue;
};

namespace activity_monitor
{
    /**
     * Starts the thread that writes queued activity to
     * `<log_dir>/activity.log`. To stop it, set `should_close`, interrupt the
     * queue and join the returned thread.
     */
    std::pair<std::shared_ptr<ActivityLog>, std::thread> initialize(const std::string& log_dir);
}
