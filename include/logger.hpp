#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>
#include <expected>
#include <format>
#include <cstdint>

/**
 * Process-wide leveled logger. Lines go to stderr and, when configured,
 * to a file that is rotated to "<file>.1" once it reaches max_size_mb.
 */
class Logger
{
public:
    enum class Level : uint8_t { Debug, Info, Warn, Error };

    [[nodiscard]] static std::expected<void, std::string> init(std::string_view level,
                                                                std::string_view file,
                                                                size_t max_size_mb,
                                                                bool enable_console);
    static void shutdown();
    static void set_level(std::string_view level);

    [[nodiscard]] static bool enabled(Level l)
    {
        return l >= instance().lvl.load(std::memory_order_relaxed);
    }

    template<typename... Args>
    static void log(Level l, std::format_string<Args...> fmt, Args&&... args)
    {
        if (enabled(l))
        {
            write(l, std::format(fmt, std::forward<Args>(args)...));
        }
    }

private:
    struct State
    {
        std::atomic<Level> lvl{Level::Info};
        std::mutex mtx;
        bool console = true;
        std::ofstream file;
        std::string filename;
        size_t max_size = 0;
        size_t written = 0;
    };

    static State& instance();
    static void write(Level l, const std::string& msg);
};

#define LOG_DEBUG(...) Logger::log(Logger::Level::Debug, __VA_ARGS__)
#define LOG_INFO(...)  Logger::log(Logger::Level::Info, __VA_ARGS__)
#define LOG_WARN(...)  Logger::log(Logger::Level::Warn, __VA_ARGS__)
#define LOG_ERROR(...) Logger::log(Logger::Level::Error, __VA_ARGS__)
