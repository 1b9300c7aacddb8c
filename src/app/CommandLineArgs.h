#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace alimante::app {

// Parsed command-line arguments for the alimante daemon.
//
// Notes:
//   - Option names are case-insensitive; values (paths) are kept verbatim.
//   - "--opt=value", "--opt:value" and "--opt value" are all accepted.
struct CommandLineArgs
{
    bool showHelp = false; // --help / -h / -?
    bool verbose  = false; // --verbose / -v (debug log level)

    std::optional<std::string> configDir; // --config-dir <dir>
    std::optional<std::string> logDir;    // --log-dir <dir>

    std::optional<double> loopIntervalSeconds;     // --loop-interval <s>
    std::optional<double> watchdogIntervalSeconds; // --watchdog-interval <s>

    // Unknown options and options with bad values, in command-line order.
    std::vector<std::string> unknown;
};

// argv[0] is the program name and is skipped.
[[nodiscard]] CommandLineArgs ParseCommandLineArgsFromArgv(std::span<const std::string_view> argv);
[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, char** argv);

[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace alimante::app
