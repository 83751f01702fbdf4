#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - FilterDecision, InstallState 를 직접 include 하지 않는다.
//   이벤트는 문자열 필드로 기록한다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// parse_log_level: "debug"|"info"|"warn"|"error" (대소문자 무관), 그 외 kInfo
[[nodiscard]] LogLevel parse_log_level(std::string_view text) noexcept;

// ---------------------------------------------------------------------------
// InstallLog
//   공유 routine splice 결과.
//   outcome: "installed" | "failed" | "rejected"
// ---------------------------------------------------------------------------
struct InstallLog {
    std::string                                routine{};            // 대상 routine 이름
    std::string                                outcome{};
    std::uint32_t                              instruction_count{0}; // splice 후 instruction 수
    std::uint32_t                              frame_slots{0};       // 재계산된 frame slot 수
    std::string                                error{};              // 실패 사유 (성공 시 빈값)
    std::chrono::system_clock::time_point      timestamp{};
};

// ---------------------------------------------------------------------------
// DenialLog
//   가드가 해석을 차단한 이벤트.
// ---------------------------------------------------------------------------
struct DenialLog {
    std::string                                name{};           // 요청 이름
    std::string                                resolver{};       // 호출 resolver identity
    std::string                                matched_rule{};
    std::string                                reason{};
    std::chrono::system_clock::time_point      timestamp{};
};
