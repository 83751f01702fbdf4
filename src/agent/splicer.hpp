#pragma once

// ---------------------------------------------------------------------------
// splicer.hpp
//
// 가드 본문을 공유 해석 routine 의 맨 앞에 한 번만 삽입한다.
//
// [알고리즘]
// 1. capability 확인 (is_redefinition_supported)
// 2. 가드 routine 의 instruction 복사 → 끝의 label(선택) 제거 → 끝의 return 제거
// 3. 대상 routine 의 현재 instruction 앞에 삽입
// 4. rebuild_routine 으로 구조 검증 + frame 메타데이터 재계산
// 5. Instrumentation::redefine 으로 원자적 교체
// 3~4 는 복사본에서만 수행되므로, 실패 시 live routine 은 변하지 않는다.
//
// [상태 머신]
//   kUninstalled → kInstalling → { kInstalled | kFailed }
//   kInstalled / kFailed 는 종결 상태. 재호출은 kAlreadyInstalled 로 거부한다
//   (이중 설치 없음).
// ---------------------------------------------------------------------------

#include <atomic>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <vector>

#include "runtime/instrumentation.hpp"

class StructuredLogger;

enum class InstallState : std::uint8_t {
    kUninstalled = 0,
    kInstalling  = 1,
    kInstalled   = 2,
    kFailed      = 3,
};

enum class InstallErrorCode : std::uint8_t {
    kCapabilityUnavailable  = 0,  // 호스트가 routine 교체를 지원하지 않음
    kSpliceIntegrityFailure = 1,  // fragment 추출 또는 rebuild 검증 실패
    kRedefinitionFailed     = 2,  // redefine() 실패
    kAlreadyInstalled       = 3,  // 재호출 거부
};

struct InstallError {
    InstallErrorCode code{InstallErrorCode::kSpliceIntegrityFailure};
    std::string      message{};
};

[[nodiscard]] const char* install_state_name(InstallState state) noexcept;

// ---------------------------------------------------------------------------
// strip_to_prefix_fragment
//   완전한 routine 의 instruction 을 prefix fragment 로 만든다.
//   끝의 label 하나(있다면)와 그 앞의 return 을 제거한다.
//   return 으로 끝나지 않거나, 제거 후에도 return 이 남아 있으면 실패.
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<std::vector<Instruction>, std::string>
strip_to_prefix_fragment(std::vector<Instruction> instructions);

class InterceptionSplicer {
public:
    InterceptionSplicer(std::shared_ptr<const Routine>    guard,
                        RoutineId                         target = RoutineId::kResolveDefinition,
                        std::shared_ptr<StructuredLogger> logger = nullptr);

    ~InterceptionSplicer() = default;

    InterceptionSplicer(const InterceptionSplicer&)            = delete;
    InterceptionSplicer& operator=(const InterceptionSplicer&) = delete;
    InterceptionSplicer(InterceptionSplicer&&)                 = delete;
    InterceptionSplicer& operator=(InterceptionSplicer&&)      = delete;

    // install
    //   성공 시 이후 모든 resolve 호출이 가드를 거친다.
    //   실패는 모두 치명적이며 호출자(부트스트랩)는 기동을 중단해야 한다.
    [[nodiscard]] std::expected<void, InstallError> install(Instrumentation& instrumentation);

    [[nodiscard]] InstallState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

private:
    [[nodiscard]] std::expected<void, InstallError> splice(Instrumentation& instrumentation);
    void report(const std::expected<void, InstallError>& outcome, std::uint32_t instruction_count,
                std::uint32_t frame_slots) const;

    std::shared_ptr<const Routine>    guard_;
    RoutineId                         target_;
    std::shared_ptr<StructuredLogger> logger_;
    std::atomic<InstallState>         state_{InstallState::kUninstalled};
    std::uint32_t                     spliced_count_{0};
    std::uint32_t                     spliced_slots_{0};
};
