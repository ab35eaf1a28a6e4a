#include "rwdagt/common/logging.hpp"
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace rwdagt
{

std::shared_ptr<spdlog::logger> logger()
{
    static std::once_flag s_once;
    static std::shared_ptr<spdlog::logger> s_logger;
    std::call_once(s_once, []() {
        s_logger = spdlog::get(kLoggerName);
        if (!s_logger)
        {
            s_logger = spdlog::stderr_color_mt(kLoggerName);
            s_logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] [t%t] %v");
        }
    });
    return s_logger;
}

void set_log_level(spdlog::level::level_enum level)
{
    logger()->set_level(level);
}

} // namespace rwdagt
