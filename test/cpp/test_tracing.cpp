#include "catch.hpp"
#include "tracing.hpp"
#include <atomic>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

#include "duckdb/common/exception.hpp"

using namespace odata_client;

namespace {

// Restores console-only, disabled tracing when a test case ends
struct TracerReset {
    ~TracerReset() {
        auto& tracer = ODataTracer::Instance();
        tracer.SetEnabled(false);
        tracer.SetOutputMode("console");
        tracer.SetLevel(TraceLevel::INFO);
    }
};

std::string CaptureCout(const std::function<void()>& fn) {
    std::stringstream buffer;
    std::streambuf* old_cout = std::cout.rdbuf(buffer.rdbuf());
    fn();
    std::cout.rdbuf(old_cout);
    return buffer.str();
}

} // namespace

TEST_CASE("ODataTracer Singleton Pattern", "[tracing]") {
    auto& instance1 = ODataTracer::Instance();
    auto& instance2 = ODataTracer::Instance();
    REQUIRE(&instance1 == &instance2);
}

TEST_CASE("Trace level names", "[tracing]") {
    SECTION("Parsing is case insensitive") {
        REQUIRE(StringToTraceLevel("none") == TraceLevel::NONE);
        REQUIRE(StringToTraceLevel("Error") == TraceLevel::ERROR);
        REQUIRE(StringToTraceLevel("WARN") == TraceLevel::WARN);
        REQUIRE(StringToTraceLevel("info") == TraceLevel::INFO);
        REQUIRE(StringToTraceLevel("debug") == TraceLevel::DEBUG_LEVEL);
        REQUIRE(StringToTraceLevel("trace") == TraceLevel::TRACE);
    }

    SECTION("Unknown names are rejected") {
        REQUIRE_THROWS_AS(StringToTraceLevel("verbose"), duckdb::InvalidInputException);
    }

    SECTION("Levels print their names") {
        REQUIRE(TraceLevelToString(TraceLevel::DEBUG_LEVEL) == "DEBUG");
        REQUIRE(TraceLevelToString(TraceLevel::WARN) == "WARN");
    }
}

TEST_CASE("ODataTracer Level Filtering", "[tracing]") {
    TracerReset reset;
    auto& tracer = ODataTracer::Instance();

    tracer.SetOutputMode("console");
    tracer.SetEnabled(true);
    tracer.SetLevel(TraceLevel::INFO);

    SECTION("Messages at or below current level are logged") {
        auto output = CaptureCout([&]() {
            tracer.Error("TEST", "Error message");
            tracer.Warn("TEST", "Warning message");
            tracer.Info("TEST", "Info message");
        });

        REQUIRE(output.find("[ERROR] [TEST] Error message") != std::string::npos);
        REQUIRE(output.find("[WARN] [TEST] Warning message") != std::string::npos);
        REQUIRE(output.find("[INFO] [TEST] Info message") != std::string::npos);
    }

    SECTION("Messages above current level are not logged") {
        auto output = CaptureCout([&]() {
            tracer.Debug("TEST", "Debug message");
            tracer.Trace("TEST", "Trace message");
        });

        REQUIRE(output.find("Debug message") == std::string::npos);
        REQUIRE(output.find("Trace message") == std::string::npos);
    }

    SECTION("Nothing is logged while disabled") {
        tracer.SetEnabled(false);
        auto output = CaptureCout([&]() {
            ODATA_CLIENT_TRACE_ERROR("TEST", "Disabled error");
        });
        REQUIRE(output.empty());
    }
}

TEST_CASE("ODataTracer Data Messages", "[tracing]") {
    TracerReset reset;
    auto& tracer = ODataTracer::Instance();
    tracer.SetEnabled(true);
    tracer.SetLevel(TraceLevel::DEBUG_LEVEL);

    std::string test_data = "{\"key\": \"value\", \"number\": 42}";
    auto output = CaptureCout([&]() {
        ODATA_CLIENT_TRACE_DEBUG_DATA("TEST", "JSON data received", test_data);
    });

    REQUIRE(output.find("JSON data received") != std::string::npos);
    REQUIRE(output.find("Data: " + test_data) != std::string::npos);
}

TEST_CASE("ODataTracer File Output", "[tracing]") {
    TracerReset reset;
    auto& tracer = ODataTracer::Instance();

    std::string test_dir = "./test_trace_output";
    std::filesystem::remove_all(test_dir);

    tracer.SetTraceDirectory(test_dir);
    REQUIRE(std::filesystem::exists(test_dir));

    tracer.SetOutputMode("file");
    tracer.SetEnabled(true);
    tracer.SetLevel(TraceLevel::DEBUG_LEVEL);

    std::string test_message = "Test trace message";
    auto console = CaptureCout([&]() {
        tracer.Info("TEST", test_message);
    });
    REQUIRE(console.find(test_message) == std::string::npos);

    tracer.SetEnabled(false);

    std::filesystem::path trace_file_path = std::filesystem::path(test_dir) / ODataTracer::TRACE_FILE_NAME;
    REQUIRE(std::filesystem::exists(trace_file_path));

    std::ifstream file(trace_file_path);
    REQUIRE(file.is_open());
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    file.close();

    REQUIRE(content.find(test_message) != std::string::npos);
    REQUIRE(content.find("[INFO]") != std::string::npos);

    tracer.SetTraceDirectory(".");
    std::filesystem::remove_all(test_dir);
}

TEST_CASE("ODataTracer File Rotation", "[tracing]") {
    TracerReset reset;
    auto& tracer = ODataTracer::Instance();

    std::string test_dir = "./test_trace_rotation";
    std::filesystem::remove_all(test_dir);

    tracer.SetTraceDirectory(test_dir);
    tracer.SetMaxFileSize(256);
    tracer.SetRotation(true);
    tracer.SetOutputMode("file");
    tracer.SetEnabled(true);
    tracer.SetLevel(TraceLevel::INFO);

    for (int i = 0; i < 20; ++i) {
        tracer.Info("TEST", "Rotation message number " + std::to_string(i));
    }
    tracer.SetEnabled(false);

    auto trace_file_path = std::filesystem::path(test_dir) / ODataTracer::TRACE_FILE_NAME;
    auto rotated_path = trace_file_path;
    rotated_path += ".1";
    REQUIRE(std::filesystem::exists(rotated_path));
    REQUIRE(std::filesystem::file_size(trace_file_path) < 1024);

    tracer.SetMaxFileSize(TraceSettings::DEFAULT_MAX_FILE_SIZE);
    tracer.SetTraceDirectory(".");
    std::filesystem::remove_all(test_dir);
}

TEST_CASE("ODataTracer Thread Safety", "[tracing]") {
    TracerReset reset;
    auto& tracer = ODataTracer::Instance();
    tracer.SetEnabled(true);
    tracer.SetLevel(TraceLevel::DEBUG_LEVEL);

    const int num_threads = 10;
    const int messages_per_thread = 100;
    std::atomic<int> total_messages(0);

    auto output = CaptureCout([&]() {
        std::vector<std::thread> threads;
        for (int i = 0; i < num_threads; ++i) {
            threads.emplace_back([&tracer, i, &total_messages]() {
                for (int j = 0; j < messages_per_thread; ++j) {
                    tracer.Debug("THREAD_" + std::to_string(i), "Message " + std::to_string(j));
                    total_messages++;
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
    });

    REQUIRE(total_messages == num_threads * messages_per_thread);
    REQUIRE(output.find("[THREAD_9] Message 99") != std::string::npos);
}

TEST_CASE("Trace settings from environment", "[tracing]") {
    setenv("ODATA_CLIENT_TRACE_ENABLED", "true", 1);
    setenv("ODATA_CLIENT_TRACE_LEVEL", "debug", 1);
    setenv("ODATA_CLIENT_TRACE_OUTPUT", "both", 1);

    auto settings = TraceSettings::FromEnvironment();
    REQUIRE(settings.enabled);
    REQUIRE(settings.level == TraceLevel::DEBUG_LEVEL);
    REQUIRE(settings.output_mode == "both");

    setenv("ODATA_CLIENT_TRACE_OUTPUT", "syslog", 1);
    REQUIRE_THROWS_AS(TraceSettings::FromEnvironment(), duckdb::InvalidInputException);

    unsetenv("ODATA_CLIENT_TRACE_ENABLED");
    unsetenv("ODATA_CLIENT_TRACE_LEVEL");
    unsetenv("ODATA_CLIENT_TRACE_OUTPUT");

    auto defaults = TraceSettings::FromEnvironment();
    REQUIRE_FALSE(defaults.enabled);
    REQUIRE(defaults.level == TraceLevel::INFO);
    REQUIRE(defaults.output_mode == "console");
}
