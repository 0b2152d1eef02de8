#pragma once

#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <chrono>
#include <sstream>
#include <iostream>
#include <atomic>

namespace odata_client {

enum class TraceLevel {
    NONE = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    DEBUG_LEVEL = 4,
    TRACE = 5
};

TraceLevel StringToTraceLevel(const std::string &level_str);
std::string TraceLevelToString(TraceLevel level);

// ----------------------------------------------------------------------

struct TraceSettings {
    static constexpr bool DEFAULT_ENABLED = false;
    static constexpr TraceLevel DEFAULT_LEVEL = TraceLevel::INFO;
    static constexpr int64_t DEFAULT_MAX_FILE_SIZE = 10485760; // 10MB

    TraceSettings();

    // Reads ODATA_CLIENT_TRACE_ENABLED, ODATA_CLIENT_TRACE_LEVEL,
    // ODATA_CLIENT_TRACE_OUTPUT and ODATA_CLIENT_TRACE_DIRECTORY.
    static TraceSettings FromEnvironment();

    bool enabled;
    TraceLevel level;
    std::string output_mode;
    std::string directory;
    int64_t max_file_size;
    bool rotation;
};

// ----------------------------------------------------------------------

class ODataTracer {
public:
    static constexpr const char *TRACE_FILE_NAME = "odata_client_trace.log";

    static ODataTracer& Instance();

    void Configure(const TraceSettings &settings);

    void SetEnabled(bool enabled);
    void SetLevel(TraceLevel level);
    void SetTraceDirectory(const std::string& directory);
    void SetOutputMode(const std::string& output_mode);
    void SetMaxFileSize(int64_t max_size);
    void SetRotation(bool rotation);

    bool IsEnabled() const { return enabled; }
    TraceLevel GetLevel() const { return level; }
    std::string GetOutputMode() const { return output_mode; }
    std::string GetTraceDirectory() const { return trace_directory; }
    int64_t GetMaxFileSize() const { return max_file_size; }
    bool GetRotation() const { return rotation_enabled; }

    bool ShouldTrace(TraceLevel msg_level) const { return enabled.load() && msg_level != TraceLevel::NONE && msg_level <= level.load(); }

    void Trace(TraceLevel msg_level, const std::string& component, const std::string& message);
    void Trace(TraceLevel msg_level, const std::string& component, const std::string& message, const std::string& data);

    void Error(const std::string& component, const std::string& message);
    void Error(const std::string& component, const std::string& message, const std::string& data);
    void Warn(const std::string& component, const std::string& message);
    void Warn(const std::string& component, const std::string& message, const std::string& data);
    void Info(const std::string& component, const std::string& message);
    void Info(const std::string& component, const std::string& message, const std::string& data);
    void Debug(const std::string& component, const std::string& message);
    void Debug(const std::string& component, const std::string& message, const std::string& data);
    void Trace(const std::string& component, const std::string& message);
    void Trace(const std::string& component, const std::string& message, const std::string& data);

private:
    ODataTracer() = default;
    ~ODataTracer() = default;
    ODataTracer(const ODataTracer&) = delete;
    ODataTracer& operator=(const ODataTracer&) = delete;

    // Callers hold trace_mutex
    void Emit(TraceLevel msg_level, const std::string& component, const std::string& message, const std::string& data);
    void OpenTraceFile();
    void CloseTraceFile();
    void RotateIfNeeded();

    std::string GetTimestamp();

    std::atomic<bool> enabled{false};
    std::atomic<TraceLevel> level{TraceLevel::INFO};
    std::string trace_directory = ".";
    std::string output_mode = "console";
    int64_t max_file_size = TraceSettings::DEFAULT_MAX_FILE_SIZE;
    bool rotation_enabled = true;
    std::unique_ptr<std::ofstream> trace_file;
    std::recursive_mutex trace_mutex;
};

#define ODATA_CLIENT_TRACE_ERROR(component, message) \
    ::odata_client::ODataTracer::Instance().Error(component, message)

#define ODATA_CLIENT_TRACE_ERROR_DATA(component, message, data) \
    ::odata_client::ODataTracer::Instance().Error(component, message, data)

#define ODATA_CLIENT_TRACE_WARN(component, message) \
    ::odata_client::ODataTracer::Instance().Warn(component, message)

#define ODATA_CLIENT_TRACE_WARN_DATA(component, message, data) \
    ::odata_client::ODataTracer::Instance().Warn(component, message, data)

#define ODATA_CLIENT_TRACE_INFO(component, message) \
    ::odata_client::ODataTracer::Instance().Info(component, message)

#define ODATA_CLIENT_TRACE_INFO_DATA(component, message, data) \
    ::odata_client::ODataTracer::Instance().Info(component, message, data)

#define ODATA_CLIENT_TRACE_DEBUG(component, message) \
    ::odata_client::ODataTracer::Instance().Debug(component, message)

#define ODATA_CLIENT_TRACE_DEBUG_DATA(component, message, data) \
    ::odata_client::ODataTracer::Instance().Debug(component, message, data)

#define ODATA_CLIENT_TRACE_TRACE(component, message) \
    ::odata_client::ODataTracer::Instance().Trace(component, message)

#define ODATA_CLIENT_TRACE_TRACE_DATA(component, message, data) \
    ::odata_client::ODataTracer::Instance().Trace(component, message, data)

} // namespace odata_client
