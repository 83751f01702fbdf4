// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷
// ---------------------------------------------------------------------------
static std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

LogLevel parse_log_level(std::string_view text) noexcept {
    std::string lowered;
    try {
        lowered.reserve(text.size());
        for (const char c : text) {
            lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    } catch (const std::exception&) {
        return LogLevel::kInfo;
    }

    if (lowered == "debug" || lowered == "trace") {
        return LogLevel::kDebug;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error" || lowered == "critical") {
        return LogLevel::kError;
    }
    return LogLevel::kInfo;
}

std::string StructuredLogger::escape_json_string(std::string_view str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (const char c : str) {
        const auto ch = static_cast<unsigned char>(c);
        switch (ch) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b";  break;
            case '\f': result += "\\f";  break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (ch < 0x20) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result += c;
                }
                break;
        }
    }

    return result;
}

int StructuredLogger::to_spdlog_level(LogLevel level) const {
    switch (level) {
        case LogLevel::kDebug: return static_cast<int>(spdlog::level::debug);
        case LogLevel::kInfo:  return static_cast<int>(spdlog::level::info);
        case LogLevel::kWarn:  return static_cast<int>(spdlog::level::warn);
        case LogLevel::kError: return static_cast<int>(spdlog::level::err);
        default:               return static_cast<int>(spdlog::level::info);
    }
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());

        if (!log_path_.empty()) {
            if (log_path_.has_parent_path()) {
                std::filesystem::create_directories(log_path_.parent_path());
            }
            // Rotating file sink (10MB, 3개 파일 유지)
            const std::size_t max_file_size = 10 * 1024 * 1024;
            const std::size_t max_files     = 3;
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_path_.string(), max_file_size, max_files));
        }

        logger_ = std::make_shared<spdlog::logger>("path_hole", sinks.begin(), sinks.end());
        logger_->set_level(static_cast<spdlog::level::level_enum>(to_spdlog_level(min_level)));
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger_->flush_on(spdlog::level::trace);

        // 엔진/resolver 의 spdlog::warn 등도 같은 sink 로 기록되도록 기본 로거 교체
        spdlog::set_default_logger(logger_);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
    }
}

// ---------------------------------------------------------------------------
// log_install: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_install(const InstallLog& entry) {
    if (!logger_) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"install","routine":")" << escape_json_string(entry.routine)
         << R"(","outcome":")" << escape_json_string(entry.outcome)
         << R"(","instruction_count":)" << entry.instruction_count
         << R"(,"frame_slots":)" << entry.frame_slots
         << R"(,"error":")" << escape_json_string(entry.error)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    if (entry.error.empty()) {
        if (static_cast<int>(min_level_) <= static_cast<int>(LogLevel::kInfo)) {
            logger_->info(json.str());
        }
    } else {
        logger_->error(json.str());
    }
}

// ---------------------------------------------------------------------------
// log_denial: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_denial(const DenialLog& entry) {
    if (!logger_ || static_cast<int>(min_level_) > static_cast<int>(LogLevel::kDebug)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"definition_denied","name":")" << escape_json_string(entry.name)
         << R"(","resolver":")" << escape_json_string(entry.resolver)
         << R"(","matched_rule":")" << escape_json_string(entry.matched_rule)
         << R"(","reason":")" << escape_json_string(entry.reason)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    logger_->debug(json.str());
}

void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}
