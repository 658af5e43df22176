#pragma once

#include <mutex>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>

namespace hwenergy {
namespace logging {

enum class Level {
    LVL_DEBUG,
    LVL_INFO,
    LVL_WARN,
    LVL_ERROR,
    LVL_NONE
};

class Logger {
public:
    static void init(Level threshold);
    static void log(Level level, const char *file, int line, const std::string &message);
    static void set_level(Level level);
    static Level level();

    // Redirect output (nullptr restores std::cerr). The stream must outlive its use.
    static void set_output(std::ostream *out);

private:
    static Level threshold_;
    static std::ostream *out_;
    static std::mutex mutex_;
};

// Parses "debug", "info", "warn", "error" (case-insensitive)
std::optional<Level> string_to_level(const std::string &level_str);
std::string level_to_string(Level level);

}  // namespace logging
}  // namespace hwenergy

#define LOG_INTERNAL(lvl, msg)                                                \
    do {                                                                      \
        if ((lvl) >= hwenergy::logging::Logger::level()) {                    \
            std::stringstream ss;                                             \
            ss << msg;                                                        \
            hwenergy::logging::Logger::log(lvl, __FILE__, __LINE__, ss.str()); \
        }                                                                     \
    } while (0)

#define LOG_DEBUG(msg) LOG_INTERNAL(hwenergy::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LOG_INTERNAL(hwenergy::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LOG_INTERNAL(hwenergy::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(hwenergy::logging::Level::LVL_ERROR, msg)
