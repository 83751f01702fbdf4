#pragma once

// ---------------------------------------------------------------------------
// filter_engine.hpp
//
// 완전 한정 이름과 호출 resolver identity 를 받아 허용/차단을 판정하는 엔진.
//
// [판정 순서] (변경 금지)
// 1. 호출 resolver 가 면제 목록(path_hole.unfiltered.cls)에 있으면 → kAllow
// 2. 이름이 BuiltinAllow 접두사로 시작하면 → kAllow
// 3. 필터(path_hole.filter) 가 비어 있으면 → kAllow
// 4. 유효한 패턴 중 하나라도 이름 전체와 일치하면 → kDeny
// 5. 일치 없음 → kAllow
//
// [상태 없음]
// 엔진은 컴파일된 패턴을 캐시하지 않는다. 매 호출마다 provider 에서 설정을
// 다시 읽고 파싱한다. 설정 변경은 다음 호출부터 즉시 반영되며 캐시 무효화
// 문제가 존재하지 않는다.
//
// [잘못된 토큰]
// 문법에 맞지 않는 토큰은 해당 토큰만 버리고 warn 로그를 남긴다.
// 호출마다 다시 기록된다 (중복 억제 없음).
//
// [순환 의존성]
// filter_engine.hpp → config/config_provider.hpp (단방향)
// ---------------------------------------------------------------------------

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "config/config_provider.hpp"

// ---------------------------------------------------------------------------
// FilterDecision
// ---------------------------------------------------------------------------
enum class FilterDecision : std::uint8_t {
    kAllow = 0,  // 원래 해석 로직으로 진행
    kDeny  = 1,  // "not found" 신호로 해석 실패
};

// ---------------------------------------------------------------------------
// FilterResult
//   matched_rule: 판정 근거 식별자
//     "exempt-resolver" | "builtin-allow" | "no-filter" | "pattern" |
//     "no-match" | "engine-error"
//   reason: 로깅용 설명. "pattern" 이면 일치한 패턴 원문을 포함한다.
// ---------------------------------------------------------------------------
struct FilterResult {
    FilterDecision decision{FilterDecision::kAllow};
    std::string    matched_rule{};
    std::string    reason{};
};

// default_builtin_allow_prefixes
//   {"std.", "__gnu_cxx.", "__cxxabiv1.", "path_hole."}
//   런타임 자체(표준 라이브러리, 구현 네임스페이스, 가드 자신)의 이름은
//   어떤 필터로도 차단할 수 없다.
[[nodiscard]] const std::vector<std::string>& default_builtin_allow_prefixes();

// ---------------------------------------------------------------------------
// FilterEngine
//
//   [스레드 안전성]
//   - 가변 멤버가 없다. evaluate/decide 는 임의 스레드에서 동시 호출 안전.
//   - provider 는 동시 읽기에 안전해야 한다 (PropertyConfigProvider 는 안전).
// ---------------------------------------------------------------------------
class FilterEngine {
public:
    // config 가 nullptr 이면 모든 판정이 kAllow ("no-filter") 이다.
    explicit FilterEngine(std::shared_ptr<const GuardConfigProvider> config,
                          std::vector<std::string> builtin_allow = default_builtin_allow_prefixes());

    ~FilterEngine() = default;

    FilterEngine(const FilterEngine&)            = delete;
    FilterEngine& operator=(const FilterEngine&) = delete;
    FilterEngine(FilterEngine&&)                 = default;
    FilterEngine& operator=(FilterEngine&&)      = default;

    // decide: evaluate() 의 판정만 반환한다.
    [[nodiscard]] FilterDecision decide(std::string_view name,
                                        std::string_view caller_identity) const noexcept;

    // evaluate
    //   어떤 경우에도 예외를 던지지 않는다. 내부 오류 시 error 로그 후
    //   kAllow ("engine-error") 를 반환한다.
    [[nodiscard]] FilterResult evaluate(std::string_view name,
                                        std::string_view caller_identity) const noexcept;

    [[nodiscard]] const std::vector<std::string>& builtin_allow() const noexcept {
        return builtin_allow_;
    }

private:
    [[nodiscard]] FilterResult evaluate_unchecked(std::string_view name,
                                                  std::string_view caller_identity) const;

    std::shared_ptr<const GuardConfigProvider> config_;
    std::vector<std::string>                   builtin_allow_;
};
