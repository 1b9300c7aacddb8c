#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace alimante::logsys {

struct LogConfig {
    std::filesystem::path directory = "logs";
    std::string           level     = "info";
    bool                  async     = false;
    bool                  console   = true;
};

// Builds the "alimante" logger (rotating alimante.log, 1MB * 4, plus colored
// stdout) and makes it the default. Falls back to stdout only when the log
// directory cannot be created. Safe to call more than once.
void Init(const LogConfig& cfg);
void Shutdown();

std::shared_ptr<spdlog::logger> Get();

// Unknown names map to info.
spdlog::level::level_enum ParseLevel(std::string_view name);

} // namespace alimante::logsys
