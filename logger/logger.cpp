#include "logger.hpp"

#include <array>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace
{

constexpr std::array<std::string_view, 4> level_names{"DEBUG", "INFO", "WARN", "ERROR"};

// Unknown names fall back to Info
Logger::Level parse_level(std::string_view name)
{
    std::string upper;
    std::ranges::transform(name, std::back_inserter(upper),
                           [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
    if (upper == "WARNING")
    {
        return Logger::Level::Warn;
    }
    auto it = std::ranges::find(level_names, upper);
    if (it == level_names.end())
    {
        return Logger::Level::Info;
    }
    return static_cast<Logger::Level>(std::distance(level_names.begin(), it));
}

std::string now_str()
{
    using namespace std::chrono;
    auto now = system_clock::now();
    auto secs = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm;
    localtime_r(&secs, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::format("{}.{:03d}", buf, ms);
}

} // namespace

Logger::State& Logger::instance()
{
    static State s;
    return s;
}

std::expected<void, std::string> Logger::init(std::string_view level,
                                               std::string_view file,
                                               size_t max_size_mb,
                                               bool enable_console)
{
    State& s = instance();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.lvl = parse_level(level);
    s.console = enable_console;
    s.max_size = max_size_mb * 1024 * 1024;
    s.filename = std::string(file);
    s.written = 0;
    s.file.close();
    if (s.filename.empty())
    {
        return {};
    }

    s.file.open(s.filename, std::ios::app);
    if (!s.file.is_open())
    {
        return std::unexpected("Failed to open log file: " + s.filename);
    }
    std::error_code ec;
    auto sz = std::filesystem::file_size(s.filename, ec);
    if (!ec)
    {
        s.written = static_cast<size_t>(sz);
    }
    return {};
}

void Logger::set_level(std::string_view level)
{
    instance().lvl = parse_level(level);
}

void Logger::shutdown()
{
    State& s = instance();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.file.close();
}

void Logger::write(Level l, const std::string& msg)
{
    auto line = std::format("[{}] [{}] {}\n", now_str(), level_names[static_cast<size_t>(l)], msg);

    State& s = instance();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.console)
    {
        // stdout carries the tool's own output
        std::cerr << line;
    }
    if (!s.file.is_open())
    {
        return;
    }

    // keep a single backup, <file>.1
    if (s.max_size > 0 && s.written + line.size() > s.max_size)
    {
        s.file.close();
        std::error_code ec;
        std::filesystem::rename(s.filename, s.filename + ".1", ec);
        if (ec)
        {
            std::cerr << "Log rotation failed: " << ec.message() << "\n";
        }
        s.file.open(s.filename, std::ios::trunc);
        s.written = 0;
    }
    s.file << line;
    s.file.flush();
    s.written += line.size();
}
