#include "logging/Log.h"

#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace alimante::logsys {

namespace {

constexpr const char* kLoggerName = "alimante";
constexpr std::size_t kMaxFileSize = 1 << 20; // 1MB
constexpr std::size_t kMaxFiles    = 4;

std::shared_ptr<spdlog::logger> g_logger;

} // namespace

spdlog::level::level_enum ParseLevel(std::string_view name)
{
    if (name == "trace")    return spdlog::level::trace;
    if (name == "debug")    return spdlog::level::debug;
    if (name == "info")     return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error")    return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off")      return spdlog::level::off;
    return spdlog::level::info;
}

void Init(const LogConfig& cfg)
{
    std::vector<spdlog::sink_ptr> sinks;
    if (cfg.console)
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::error_code ec;
    fs::create_directories(cfg.directory, ec);
    std::string fileError;
    if (!ec) {
        try {
            const auto file = (cfg.directory / "alimante.log").string();
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, kMaxFileSize, kMaxFiles));
        } catch (const spdlog::spdlog_ex& ex) {
            fileError = ex.what();
        }
    } else {
        fileError = ec.message();
    }

    spdlog::drop(kLoggerName);

    if (cfg.async) {
        // Small pool, drop oldest on overflow. Shutdown() releases it.
        if (!spdlog::thread_pool())
            spdlog::init_thread_pool(8192, 1);

        g_logger = std::make_shared<spdlog::async_logger>(
            kLoggerName, sinks.begin(), sinks.end(),
            spdlog::thread_pool(),
            spdlog::async_overflow_policy::overrun_oldest);
    } else {
        g_logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    }

    spdlog::set_default_logger(g_logger);
    spdlog::set_level(ParseLevel(cfg.level));
    spdlog::flush_on(spdlog::level::warn);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    if (!fileError.empty())
        spdlog::warn("Logging: file sink unavailable in {} ({}), stdout only", cfg.directory.string(), fileError);
    spdlog::info("Logging started (level {}, async={})", cfg.level, cfg.async);
}

void Shutdown()
{
    if (g_logger)
        g_logger->flush();
    g_logger.reset();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger> Get() { return g_logger ? g_logger : spdlog::default_logger(); }

} // namespace alimante::logsys
