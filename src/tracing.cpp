#include "tracing.hpp"
#include <cstdlib>
#include <filesystem>
#include <iomanip>

#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"

namespace odata_client {

TraceLevel StringToTraceLevel(const std::string &level_str)
{
    auto level_str_upper = duckdb::StringUtil::Upper(level_str);

    if (level_str_upper == "NONE") {
        return TraceLevel::NONE;
    } else if (level_str_upper == "ERROR") {
        return TraceLevel::ERROR;
    } else if (level_str_upper == "WARN") {
        return TraceLevel::WARN;
    } else if (level_str_upper == "INFO") {
        return TraceLevel::INFO;
    } else if (level_str_upper == "DEBUG") {
        return TraceLevel::DEBUG_LEVEL;
    } else if (level_str_upper == "TRACE") {
        return TraceLevel::TRACE;
    }

    throw duckdb::InvalidInputException("Invalid trace level: " + level_str +
                                        ". Valid levels are: NONE, ERROR, WARN, INFO, DEBUG, TRACE");
}

std::string TraceLevelToString(TraceLevel level) {
    switch (level) {
        case TraceLevel::NONE: return "NONE";
        case TraceLevel::ERROR: return "ERROR";
        case TraceLevel::WARN: return "WARN";
        case TraceLevel::INFO: return "INFO";
        case TraceLevel::DEBUG_LEVEL: return "DEBUG";
        case TraceLevel::TRACE: return "TRACE";
        default: return "UNKNOWN";
    }
}

// ----------------------------------------------------------------------

TraceSettings::TraceSettings()
    : enabled(DEFAULT_ENABLED),
      level(DEFAULT_LEVEL),
      output_mode("console"),
      directory("."),
      max_file_size(DEFAULT_MAX_FILE_SIZE),
      rotation(true)
{
}

TraceSettings TraceSettings::FromEnvironment()
{
    TraceSettings settings;

    if (const char *enabled = std::getenv("ODATA_CLIENT_TRACE_ENABLED")) {
        auto value = duckdb::StringUtil::Lower(enabled);
        settings.enabled = (value == "1" || value == "true" || value == "on");
    }
    if (const char *level = std::getenv("ODATA_CLIENT_TRACE_LEVEL")) {
        settings.level = StringToTraceLevel(level);
    }
    if (const char *output = std::getenv("ODATA_CLIENT_TRACE_OUTPUT")) {
        auto output_lower = duckdb::StringUtil::Lower(output);
        if (output_lower != "console" && output_lower != "file" && output_lower != "both") {
            throw duckdb::InvalidInputException("Invalid trace output: " + std::string(output) +
                                                ". Valid outputs are: console, file, both");
        }
        settings.output_mode = output_lower;
    }
    if (const char *directory = std::getenv("ODATA_CLIENT_TRACE_DIRECTORY")) {
        settings.directory = directory;
    }

    return settings;
}

// ----------------------------------------------------------------------

ODataTracer& ODataTracer::Instance() {
    static ODataTracer instance;
    return instance;
}

void ODataTracer::Configure(const TraceSettings &settings) {
    std::lock_guard<std::recursive_mutex> lock(trace_mutex);
    SetTraceDirectory(settings.directory);
    SetOutputMode(settings.output_mode);
    SetMaxFileSize(settings.max_file_size);
    SetRotation(settings.rotation);
    SetLevel(settings.level);
    SetEnabled(settings.enabled);
}

void ODataTracer::SetEnabled(bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(trace_mutex);
    this->enabled = enabled;

    if (enabled && output_mode != "console") {
        OpenTraceFile();
    } else if (!enabled) {
        CloseTraceFile();
    }
}

void ODataTracer::SetLevel(TraceLevel level) {
    std::lock_guard<std::recursive_mutex> lock(trace_mutex);
    this->level = level;
    Emit(TraceLevel::INFO, "TRACER", "Trace level set to: " + TraceLevelToString(level), "");
}

void ODataTracer::SetTraceDirectory(const std::string& directory) {
    std::lock_guard<std::recursive_mutex> lock(trace_mutex);
    trace_directory = directory;

    std::filesystem::path dir_path(directory);
    if (!std::filesystem::exists(dir_path)) {
        std::filesystem::create_directories(dir_path);
    }

    if (trace_file) {
        CloseTraceFile();
        OpenTraceFile();
    }
    Emit(TraceLevel::INFO, "TRACER", "Trace directory set to: " + directory, "");
}

void ODataTracer::SetOutputMode(const std::string& output_mode) {
    std::lock_guard<std::recursive_mutex> lock(trace_mutex);
    this->output_mode = output_mode;

    if (enabled && output_mode != "console") {
        OpenTraceFile();
    } else if (output_mode == "console") {
        CloseTraceFile();
    }
    Emit(TraceLevel::INFO, "TRACER", "Trace output mode set to: " + output_mode, "");
}

void ODataTracer::SetMaxFileSize(int64_t max_size) {
    std::lock_guard<std::recursive_mutex> lock(trace_mutex);
    max_file_size = max_size;
}

void ODataTracer::SetRotation(bool rotation) {
    std::lock_guard<std::recursive_mutex> lock(trace_mutex);
    rotation_enabled = rotation;
}

void ODataTracer::Trace(TraceLevel msg_level, const std::string& component, const std::string& message) {
    if (!ShouldTrace(msg_level)) {
        return;
    }
    std::lock_guard<std::recursive_mutex> lock(trace_mutex);
    Emit(msg_level, component, message, "");
}

void ODataTracer::Trace(TraceLevel msg_level, const std::string& component, const std::string& message, const std::string& data) {
    if (!ShouldTrace(msg_level)) {
        return;
    }
    std::lock_guard<std::recursive_mutex> lock(trace_mutex);
    Emit(msg_level, component, message, data);
}

void ODataTracer::Error(const std::string& component, const std::string& message) {
    Trace(TraceLevel::ERROR, component, message);
}

void ODataTracer::Error(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::ERROR, component, message, data);
}

void ODataTracer::Warn(const std::string& component, const std::string& message) {
    Trace(TraceLevel::WARN, component, message);
}

void ODataTracer::Warn(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::WARN, component, message, data);
}

void ODataTracer::Info(const std::string& component, const std::string& message) {
    Trace(TraceLevel::INFO, component, message);
}

void ODataTracer::Info(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::INFO, component, message, data);
}

void ODataTracer::Debug(const std::string& component, const std::string& message) {
    Trace(TraceLevel::DEBUG_LEVEL, component, message);
}

void ODataTracer::Debug(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::DEBUG_LEVEL, component, message, data);
}

void ODataTracer::Trace(const std::string& component, const std::string& message) {
    Trace(TraceLevel::TRACE, component, message);
}

void ODataTracer::Trace(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::TRACE, component, message, data);
}

void ODataTracer::Emit(TraceLevel msg_level, const std::string& component, const std::string& message, const std::string& data) {
    if (!ShouldTrace(msg_level)) {
        return;
    }

    std::string log_message;
    log_message.reserve(100 + component.length() + message.length() + data.length());

    log_message += GetTimestamp();
    log_message += " [";
    log_message += TraceLevelToString(msg_level);
    log_message += "] [";
    log_message += component;
    log_message += "] ";
    log_message += message;

    if (!data.empty()) {
        log_message += "\nData: ";
        log_message += data;
    }

    if (output_mode == "console" || output_mode == "both") {
        std::cout << log_message << std::endl;
    }
    if (trace_file && trace_file->is_open()) {
        RotateIfNeeded();
        *trace_file << log_message << std::endl;
        trace_file->flush();
    }
}

void ODataTracer::OpenTraceFile() {
    if (trace_file) {
        return;
    }

    std::filesystem::path trace_path = trace_directory;
    trace_path /= TRACE_FILE_NAME;

    trace_file = std::make_unique<std::ofstream>(trace_path, std::ios::app);
    if (!trace_file->is_open()) {
        std::cerr << "Failed to open trace file: " << trace_path.string() << std::endl;
        trace_file.reset();
    }
}

void ODataTracer::CloseTraceFile() {
    if (trace_file) {
        if (trace_file->is_open()) {
            trace_file->close();
        }
        trace_file.reset();
    }
}

void ODataTracer::RotateIfNeeded() {
    if (!rotation_enabled || max_file_size <= 0) {
        return;
    }

    auto position = static_cast<int64_t>(trace_file->tellp());
    if (position < max_file_size) {
        return;
    }

    std::filesystem::path trace_path = trace_directory;
    trace_path /= TRACE_FILE_NAME;
    auto rotated_path = trace_path;
    rotated_path += ".1";

    trace_file->close();
    std::error_code ec;
    std::filesystem::rename(trace_path, rotated_path, ec);
    if (ec) {
        std::cerr << "Failed to rotate trace file: " << ec.message() << std::endl;
    }
    trace_file->open(trace_path, std::ios::app);
}

std::string ODataTracer::GetTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream ss;
    ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << "."
       << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

} // namespace odata_client
