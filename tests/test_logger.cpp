// ---------------------------------------------------------------------------
// test_logger.cpp
//
// StructuredLogger 단위 테스트
// ---------------------------------------------------------------------------

#include "logger/log_types.hpp"
#include "logger/structured_logger.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Helper: JSON 라인 필드 추출 (문자열/정수 값만)
// ---------------------------------------------------------------------------
class JsonLineParser {
public:
    explicit JsonLineParser(const std::string& json_str)
        : parsed_(json_str) {}

    bool has_field(const std::string& field) const {
        return parsed_.find("\"" + field + "\"") != std::string::npos;
    }

    std::string get_field(const std::string& field) const {
        std::string search_key = "\"" + field + "\":";
        size_t      pos         = parsed_.find(search_key);
        if (pos == std::string::npos) {
            return "";
        }

        pos += search_key.length();

        // Skip whitespace
        while (pos < parsed_.size() && std::isspace(parsed_[pos])) {
            ++pos;
        }

        if (pos >= parsed_.size()) {
            return "";
        }

        // Extract value (string or number)
        std::ostringstream oss;

        if (parsed_[pos] == '"') {
            // String value
            ++pos;
            while (pos < parsed_.size() && parsed_[pos] != '"') {
                if (parsed_[pos] == '\\' && pos + 1 < parsed_.size()) {
                    ++pos;
                }
                oss << parsed_[pos];
                ++pos;
            }
        } else {
            // Number
            while (pos < parsed_.size() && (std::isdigit(parsed_[pos]) || parsed_[pos] == '-')) {
                oss << parsed_[pos];
                ++pos;
            }
        }

        return oss.str();
    }

private:
    std::string parsed_;
};

// ---------------------------------------------------------------------------
// Fixture: Temporary log file
// ---------------------------------------------------------------------------
class StructuredLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name =
            std::string(info->test_suite_name()) + "_" + info->name();
        log_dir_  = fs::temp_directory_path() / "path_hole_test_logs" / unique_name;
        log_file_ = log_dir_ / "test.log";
        fs::create_directories(log_dir_);
    }

    void TearDown() override {
        fs::remove_all(log_dir_);
    }

    std::vector<std::string> read_log_lines() const {
        std::vector<std::string> lines;
        std::ifstream            file(log_file_);
        if (!file.is_open()) {
            return lines;
        }

        std::string line;
        while (std::getline(file, line)) {
            // Skip timestamps and keep only JSON part
            size_t json_start = line.find('{');
            if (json_start != std::string::npos) {
                lines.push_back(line.substr(json_start));
            }
        }
        return lines;
    }

    fs::path log_dir_;
    fs::path log_file_;
};

// ---------------------------------------------------------------------------
// Test: InstallLog JSON 직렬화 (성공)
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, InstallLogJsonFormat) {
    StructuredLogger logger(LogLevel::kInfo, log_file_);

    InstallLog entry;
    entry.routine           = "Resolver::resolve";
    entry.outcome           = "installed";
    entry.instruction_count = 4;
    entry.frame_slots       = 2;
    entry.timestamp         = std::chrono::system_clock::now();

    logger.log_install(entry);

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto lines = read_log_lines();
    ASSERT_GT(lines.size(), 0) << "No log lines found";

    JsonLineParser parser(lines[0]);
    EXPECT_TRUE(parser.has_field("event"));
    EXPECT_TRUE(parser.has_field("routine"));
    EXPECT_TRUE(parser.has_field("timestamp"));

    EXPECT_EQ(parser.get_field("event"), "install");
    EXPECT_EQ(parser.get_field("routine"), "Resolver::resolve");
    EXPECT_EQ(parser.get_field("outcome"), "installed");
    EXPECT_EQ(parser.get_field("instruction_count"), "4");
    EXPECT_EQ(parser.get_field("frame_slots"), "2");
    EXPECT_EQ(parser.get_field("error"), "");
}

// ---------------------------------------------------------------------------
// Test: InstallLog 실패는 error 레벨 (kError 로거에서도 기록)
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, FailedInstallLoggedAtErrorLevel) {
    StructuredLogger logger(LogLevel::kError, log_file_);

    InstallLog ok;
    ok.routine   = "Resolver::resolve";
    ok.outcome   = "installed";
    ok.timestamp = std::chrono::system_clock::now();
    logger.log_install(ok);

    InstallLog failed;
    failed.routine   = "Resolver::resolve";
    failed.outcome   = "failed";
    failed.error     = "routine redefinition is not supported by this runtime";
    failed.timestamp = std::chrono::system_clock::now();
    logger.log_install(failed);

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1);
    JsonLineParser parser(lines[0]);
    EXPECT_EQ(parser.get_field("outcome"), "failed");
    EXPECT_EQ(parser.get_field("error"), "routine redefinition is not supported by this runtime");
}

// ---------------------------------------------------------------------------
// Test: DenialLog 필드
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, DenialLogFields) {
    StructuredLogger logger(LogLevel::kDebug, log_file_);

    DenialLog entry;
    entry.name         = "pkg.Foo1";
    entry.resolver     = "Plugins";
    entry.matched_rule = "pattern";
    entry.reason       = "'pkg.Foo1' matches filter entry 'pkg.Foo1'";
    entry.timestamp    = std::chrono::system_clock::now();

    logger.log_denial(entry);

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto lines = read_log_lines();
    ASSERT_GT(lines.size(), 0);

    JsonLineParser parser(lines[0]);
    EXPECT_EQ(parser.get_field("event"), "definition_denied");
    EXPECT_EQ(parser.get_field("name"), "pkg.Foo1");
    EXPECT_EQ(parser.get_field("resolver"), "Plugins");
    EXPECT_EQ(parser.get_field("matched_rule"), "pattern");
    EXPECT_EQ(parser.get_field("reason"), "'pkg.Foo1' matches filter entry 'pkg.Foo1'");
}

// ---------------------------------------------------------------------------
// Test: 로그 레벨 필터링 (차단 이벤트는 debug 전용)
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, LogLevelFiltering) {
    StructuredLogger logger(LogLevel::kInfo, log_file_);

    auto now = std::chrono::system_clock::now();

    // debug 레벨 이벤트 (필터되어야 함)
    DenialLog denial;
    denial.name      = "pkg.Foo1";
    denial.timestamp = now;
    logger.log_denial(denial);

    // info 레벨 이벤트 (기록되어야 함)
    InstallLog install;
    install.routine   = "Resolver::resolve";
    install.outcome   = "installed";
    install.timestamp = now;
    logger.log_install(install);

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto lines = read_log_lines();
    EXPECT_EQ(lines.size(), 1);
    EXPECT_TRUE(lines[0].find("\"install\"") != std::string::npos);
}

// ---------------------------------------------------------------------------
// Test: 멀티스레드 동시 로깅 (크래시 없음)
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, MultithreadedLoggingNoCrash) {
    StructuredLogger logger(LogLevel::kDebug, log_file_);

    const int                num_threads     = 4;
    const int                logs_per_thread = 10;
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&logger, t]() {
            auto now = std::chrono::system_clock::now();
            for (int i = 0; i < logs_per_thread; ++i) {
                DenialLog entry;
                entry.name         = "pkg.Name" + std::to_string(i);
                entry.resolver     = "resolver_" + std::to_string(t);
                entry.matched_rule = "pattern";
                entry.timestamp    = now;
                logger.log_denial(entry);
            }
        });
    }

    for (auto& th : threads) {
        th.join();
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    auto lines = read_log_lines();
    EXPECT_EQ(lines.size(), static_cast<std::size_t>(num_threads * logs_per_thread));
}

// ---------------------------------------------------------------------------
// Test: JSON 이스케이프 처리
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, JsonEscaping) {
    EXPECT_EQ(StructuredLogger::escape_json_string("a\"b\\c"), "a\\\"b\\\\c");
    EXPECT_EQ(StructuredLogger::escape_json_string("line\nbreak\t"), "line\\nbreak\\t");

    StructuredLogger logger(LogLevel::kDebug, log_file_);

    DenialLog entry;
    entry.name      = "pkg.Quote\"d";
    entry.reason    = "multi\nline";
    entry.timestamp = std::chrono::system_clock::now();
    logger.log_denial(entry);

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1);
    JsonLineParser parser(lines[0]);
    EXPECT_EQ(parser.get_field("name"), "pkg.Quote\"d");
}

// ---------------------------------------------------------------------------
// Test: 기본 로거 교체 (엔진 진단 로그가 같은 파일로 기록)
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, BecomesDefaultLogger) {
    StructuredLogger logger(LogLevel::kInfo, log_file_);

    spdlog::warn("path_hole: malformed filter entry = '{}'", "not valid!!");

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    std::ifstream file(log_file_);
    ASSERT_TRUE(file.is_open());
    const std::string content((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("malformed filter entry = 'not valid!!'"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Test: 디버그/정보/경고/에러 로깅
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, DiagnosticLogging) {
    StructuredLogger logger(LogLevel::kDebug, log_file_);

    logger.debug("Debug message");
    logger.info("Info message");
    logger.warn("Warning message");
    logger.error("Error message");

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    // 진단 로그는 일반 텍스트이므로, 파일이 생성되고 크기가 0이 아닌지 확인
    std::ifstream file(log_file_);
    EXPECT_TRUE(file.is_open()) << "Log file was not created";

    file.seekg(0, std::ios::end);
    std::streamsize file_size = file.tellg();
    EXPECT_GT(file_size, 0) << "Log file is empty";
}

// ---------------------------------------------------------------------------
// Test: 로그 레벨 문자열 파싱
// ---------------------------------------------------------------------------
TEST(LogLevelTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::kDebug);
    EXPECT_EQ(parse_log_level("trace"), LogLevel::kDebug);
    EXPECT_EQ(parse_log_level("info"), LogLevel::kInfo);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::kWarn);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::kWarn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::kError);
    EXPECT_EQ(parse_log_level("critical"), LogLevel::kError);
    EXPECT_EQ(parse_log_level("bogus"), LogLevel::kInfo);
    EXPECT_EQ(parse_log_level(""), LogLevel::kInfo);
}
