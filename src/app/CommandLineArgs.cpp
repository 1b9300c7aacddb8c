#include "app/CommandLineArgs.h"

#include <cctype>
#include <charconv>
#include <cmath>
#include <sstream>

namespace alimante::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

// Matches "--opt=value" / "--opt:value" against the lowered argument and
// returns the offset of the value, so it can be taken from the raw text.
[[nodiscard]] std::optional<std::size_t> ValueOffset(std::string_view lowered, std::string_view prefix)
{
    if (lowered.size() <= prefix.size() || lowered.substr(0, prefix.size()) != prefix)
        return std::nullopt;

    const char sep = lowered[prefix.size()];
    if (sep != '=' && sep != ':')
        return std::nullopt;

    return prefix.size() + 1;
}

[[nodiscard]] std::optional<double> ParseSeconds(std::string_view s)
{
    if (s.empty())
        return std::nullopt;

    double v = 0.0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size())
        return std::nullopt;
    if (!std::isfinite(v) || v <= 0.0 || v > 86'400.0)
        return std::nullopt; // absurd
    return v;
}

} // namespace

CommandLineArgs ParseCommandLineArgsFromArgv(std::span<const std::string_view> argv)
{
    CommandLineArgs out;

    const auto addUnknown = [&](std::string_view raw) {
        out.unknown.emplace_back(raw);
    };

    for (std::size_t i = 1; i < argv.size(); ++i)
    {
        const std::string_view raw = argv[i];
        if (raw.empty())
            continue;

        const std::string lowered = ToLower(raw);
        const std::string_view arg(lowered);

        if (arg == "--help" || arg == "-h" || arg == "-?") {
            out.showHelp = true;
            continue;
        }
        if (arg == "--verbose" || arg == "-v") {
            out.verbose = true;
            continue;
        }

        // Options with values. Names are matched on the lowered text, values
        // are taken from the raw text.
        const auto takeNextString = [&](std::optional<std::string>& dst) {
            if (i + 1 >= argv.size()) {
                addUnknown(raw);
                return;
            }
            dst = std::string(argv[i + 1]);
            ++i;
        };
        const auto takeNextSeconds = [&](std::optional<double>& dst) {
            if (i + 1 >= argv.size()) {
                addUnknown(raw);
                return;
            }
            const auto parsed = ParseSeconds(argv[i + 1]);
            if (!parsed) {
                addUnknown(raw);
                return;
            }
            dst = *parsed;
            ++i;
        };
        const auto inlineString = [&](std::string_view name, std::optional<std::string>& dst) -> bool {
            const auto off = ValueOffset(arg, name);
            if (!off)
                return false;
            const std::string_view value = raw.substr(*off);
            if (value.empty())
                addUnknown(raw);
            else
                dst = std::string(value);
            return true;
        };
        const auto inlineSeconds = [&](std::string_view name, std::optional<double>& dst) -> bool {
            const auto off = ValueOffset(arg, name);
            if (!off)
                return false;
            const auto parsed = ParseSeconds(raw.substr(*off));
            if (!parsed)
                addUnknown(raw);
            else
                dst = *parsed;
            return true;
        };

        if (arg == "--config-dir" || arg == "-c") { takeNextString(out.configDir); continue; }
        if (inlineString("--config-dir", out.configDir)) continue;

        if (arg == "--log-dir") { takeNextString(out.logDir); continue; }
        if (inlineString("--log-dir", out.logDir)) continue;

        if (arg == "--loop-interval") { takeNextSeconds(out.loopIntervalSeconds); continue; }
        if (inlineSeconds("--loop-interval", out.loopIntervalSeconds)) continue;

        if (arg == "--watchdog-interval") { takeNextSeconds(out.watchdogIntervalSeconds); continue; }
        if (inlineSeconds("--watchdog-interval", out.watchdogIntervalSeconds)) continue;

        // Anything else is unknown.
        addUnknown(raw);
    }

    return out;
}

CommandLineArgs ParseCommandLineArgs(int argc, char** argv)
{
    std::vector<std::string_view> v;
    v.reserve(argc > 0 ? static_cast<std::size_t>(argc) : 0u);
    for (int i = 0; i < argc; ++i)
        v.emplace_back(argv[i] ? argv[i] : "");
    return ParseCommandLineArgsFromArgv(v);
}

std::string BuildCommandLineHelpText()
{
    std::ostringstream oss;
    oss << "alimante - terrarium controller\n\n";
    oss << "Usage: alimante [options]\n\n";
    oss << "Options\n";
    oss << "  --config-dir <dir>, -c        Configuration directory (default: config)\n";
    oss << "  --log-dir <dir>               Log directory (overrides runtime.logging.directory)\n";
    oss << "  --loop-interval <seconds>     Control cycle interval (overrides runtime.loop_interval_s)\n";
    oss << "  --watchdog-interval <seconds> Watchdog poll interval (overrides runtime.watchdog.check_interval_s)\n";
    oss << "  --verbose, -v                 Debug logging\n";
    oss << "  --help, -h                    Show this help\n\n";
    oss << "Values may also be given as --opt=value or --opt:value.\n\n";
    oss << "Examples\n";
    oss << "  alimante --config-dir /etc/alimante\n";
    oss << "  alimante --loop-interval=0.5 --verbose\n";
    return oss.str();
}

} // namespace alimante::app
