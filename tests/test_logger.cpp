#include <catch2/catch_test_macros.hpp>

#include "logger.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <atomic>

namespace fs = std::filesystem;

namespace
{

std::string slurp(const fs::path& p)
{
    std::ifstream f(p);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

} // namespace

TEST_CASE("Logger writes enabled levels to its file")
{
    const fs::path log_file = "/tmp/test_mptree_logger.log";
    fs::remove(log_file);

    REQUIRE(Logger::init("info", log_file.string(), 1, false).has_value());
    LOG_DEBUG("hidden {}", 1);
    LOG_INFO("decoded {} byte(s)", 3);
    LOG_ERROR("bad marker 0x{:02X}", 0xC1);

    Logger::set_level("error");
    LOG_WARN("suppressed");
    Logger::shutdown();

    auto text = slurp(log_file);
    CHECK(text.find("[INFO] decoded 3 byte(s)") != std::string::npos);
    CHECK(text.find("[ERROR] bad marker 0xC1") != std::string::npos);
    CHECK(text.find("hidden") == std::string::npos);
    CHECK(text.find("suppressed") == std::string::npos);

    fs::remove(log_file);
}

TEST_CASE("Logger rotates the file once it reaches the size limit")
{
    const fs::path log_file = "/tmp/test_mptree_rotate.log";
    const fs::path backup = "/tmp/test_mptree_rotate.log.1";
    fs::remove(log_file);
    fs::remove(backup);

    {
        std::ofstream f(log_file);
        f << std::string(1024 * 1024 - 4, 'x');
    }

    REQUIRE(Logger::init("debug", log_file.string(), 1, false).has_value());
    LOG_INFO("after rotation");
    Logger::shutdown();

    REQUIRE(fs::exists(backup));
    CHECK(fs::file_size(backup) == 1024 * 1024 - 4);
    CHECK(slurp(log_file).find("after rotation") != std::string::npos);

    fs::remove(log_file);
    fs::remove(backup);
}

TEST_CASE("Logger::init fails for an unwritable file")
{
    auto r = Logger::init("info", "/nonexistent/dir/mptree.log", 1, false);

    REQUIRE(!r.has_value());
    CHECK(r.error().find("Failed to open log file") != std::string::npos);

    Logger::shutdown();
}

TEST_CASE("Logger::set_level gates enabled levels")
{
    REQUIRE(Logger::init("warn", "", 1, false).has_value());
    CHECK(!Logger::enabled(Logger::Level::Info));
    CHECK(Logger::enabled(Logger::Level::Warn));

    Logger::set_level("DEBUG");
    CHECK(Logger::enabled(Logger::Level::Debug));

    Logger::set_level("error");
    CHECK(!Logger::enabled(Logger::Level::Warn));
    CHECK(Logger::enabled(Logger::Level::Error));

    Logger::set_level("nonsense");
    CHECK(Logger::enabled(Logger::Level::Info));
    CHECK(!Logger::enabled(Logger::Level::Debug));

    Logger::shutdown();
}

TEST_CASE("Logger::set_level may run while other threads log")
{
    const fs::path log_file = "/tmp/test_mptree_threads.log";
    fs::remove(log_file);
    REQUIRE(Logger::init("info", log_file.string(), 1, false).has_value());

    std::atomic<bool> done{false};
    std::jthread toggler([&done]
    {
        for (int i = 0; !done; ++i)
        {
            Logger::set_level(i % 2 == 0 ? "debug" : "info");
        }
    });

    for (int i = 0; i < 200; ++i)
    {
        LOG_INFO("line {}", i);
    }
    done = true;
    toggler.join();
    Logger::shutdown();

    // info is enabled in both levels the toggler switches between
    auto text = slurp(log_file);
    CHECK(text.find("line 0\n") != std::string::npos);
    CHECK(text.find("line 199\n") != std::string::npos);

    fs::remove(log_file);
}
