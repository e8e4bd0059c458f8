#include "activity_monitor.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/daily_file_sink.h>

static void monitor_activity(std::shared_ptr<ActivityLog> data, std::shared_ptr<spdlog::logger> logger)
{
    try
    {
        while (!data->should_close)
        {
            auto elem = data->queue.wait_and_pop();

            switch (elem.activity)
            {
                case Activity::Generated:
                    logger->info("{} generated cards: {}", elem.requester, elem.detail);
                    break;
                case Activity::Validated:
                    logger->info("{} validated a batch: {}", elem.requester, elem.detail);
                    break;
                case Activity::Classified:
                    logger->debug("{} classified {}", elem.requester, elem.detail);
                    break;
                case Activity::BinExtracted:
                    logger->debug("{} extracted BIN {}", elem.requester, elem.detail);
                    break;
                case Activity::BinLookup:
                    logger->info("{} looked up {}", elem.requester, elem.detail);
                    break;
                case Activity::Cleared:
                    logger->info("{} cleared the results", elem.requester);
                    break;
                case Activity::Rejected:
                    logger->warn("{} sent a bad request: {}", elem.requester, elem.detail);
                    break;
            }

            logger->flush();
        }
    }
    catch (interrupted_exception&)
    {
        logger->debug("Activity monitor interrupted, shutting down");
    }
}

std::pair<std::shared_ptr<ActivityLog>, std::thread> activity_monitor::initialize(const std::string& log_dir)
{
    auto logger = spdlog::daily_logger_st("activity_logger", log_dir + "/activity.log");
    logger->set_level(spdlog::level::trace);

    auto data = std::make_shared<ActivityLog>();
    std::thread monitor_thread{ monitor_activity, data, logger };
    return {std::move(data), std::move(monitor_thread)};
}
