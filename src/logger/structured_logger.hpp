#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 로거 인터페이스.
//
// [설계 원칙]
// - 생성자 주입 방식. 가드/splicer 는 shared_ptr 로 전달받는다.
// - 생성 시 spdlog 기본 로거로 등록되어, spdlog::warn 등 엔진 진단 로그도
//   같은 sink (stdout + 선택적 rotating file) 로 기록된다.
//
// [JSON 스키마 일관성]
// 모든 구조체 필드를 snake_case JSON 키로 직렬화한다.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}

class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로. 비어 있으면 stdout sink 만 사용.
    //   실패 시 std::runtime_error.
    explicit StructuredLogger(LogLevel min_level,
                              const std::filesystem::path& log_path = {});

    ~StructuredLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    StructuredLogger(StructuredLogger&&)            = default;
    StructuredLogger& operator=(StructuredLogger&&) = default;

    // log_install: splice 결과 (성공 info / 실패 error)
    void log_install(const InstallLog& entry);

    // log_denial
    //   차단 이벤트. 해석 경로에서 호출되므로 debug 레벨로 기록한다.
    void log_denial(const DenialLog& entry);

    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

    // escape_json_string: JSON 문자열 값 이스케이프 (따옴표 제외)
    [[nodiscard]] static std::string escape_json_string(std::string_view str);

private:
    [[nodiscard]] int to_spdlog_level(LogLevel level) const;

    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};
