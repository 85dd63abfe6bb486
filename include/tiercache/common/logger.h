#ifndef TIERCACHE_COMMON_LOGGER_H_
#define TIERCACHE_COMMON_LOGGER_H_

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace tiercache {
namespace common {

class Logger {
public:
    static void Init();
    static void SetLevel(spdlog::level::level_enum level);
};

} // namespace common
} // namespace tiercache

// Macros for convenient logging
#define TIERCACHE_TRACE(...) spdlog::trace(__VA_ARGS__)
#define TIERCACHE_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define TIERCACHE_INFO(...)  spdlog::info(__VA_ARGS__)
#define TIERCACHE_WARN(...)  spdlog::warn(__VA_ARGS__)
#define TIERCACHE_ERROR(...) spdlog::error(__VA_ARGS__)
#define TIERCACHE_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // TIERCACHE_COMMON_LOGGER_H_
