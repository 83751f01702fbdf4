#pragma once

// ---------------------------------------------------------------------------
// routine.hpp
//
// 공유 해석 routine 의 실행 가능한 본문 표현.
//
// Routine 은 Instruction 의 순서 있는 목록이다. 실행은 첫 instruction 부터
// 순서대로 진행하며 kReturn 에서 frame 의 결과를 반환한다.
//
// [Instruction 종류]
//   kOperation : 본문(callable) 실행. kNext 면 다음으로, kExit 면 즉시 종료.
//   kLabel     : 실행 효과 없는 표식 (splice 시 제거 대상이 될 수 있음)
//   kReturn    : 종결자. frame.result 를 반환한다.
//
// [구조 규칙] (rebuild_routine 이 검증)
//   1. instruction 목록이 비어 있지 않다.
//   2. kReturn 은 정확히 하나이며 마지막 instruction 이다.
//   3. 모든 kOperation 은 본문을 가진다.
//   4. label 이름은 routine 내에서 유일하다.
//   frame 메타데이터(max_frame_slots)는 rebuild 시 다시 계산된다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"

class Resolver;

// ---------------------------------------------------------------------------
// ResolutionFrame
//   routine 한 번 실행 동안의 호출 상태.
//   resolver : 해석을 요청한 resolver (caller identity 의 출처)
//   name     : 요청된 완전 한정 이름
//   result   : kExit 또는 kReturn 시점에 반드시 설정되어 있어야 한다
// ---------------------------------------------------------------------------
struct ResolutionFrame {
    const Resolver&                                         resolver;
    std::string_view                                        name;
    std::optional<std::expected<Definition, ResolveError>>  result{};
};

enum class InstructionKind : std::uint8_t {
    kOperation = 0,
    kLabel     = 1,
    kReturn    = 2,
};

enum class StepOutcome : std::uint8_t {
    kNext = 0,  // 다음 instruction 으로 진행
    kExit = 1,  // frame.result 로 즉시 종료
};

using InstructionBody = std::function<StepOutcome(ResolutionFrame&)>;

struct Instruction {
    InstructionKind kind{InstructionKind::kOperation};
    std::string     mnemonic{};          // 진단/로그용 이름 (label 은 label 이름)
    InstructionBody body{};              // kOperation 만 사용
    std::uint32_t   frame_slots{0};      // 이 instruction 이 요구하는 frame slot 수

    [[nodiscard]] static Instruction operation(std::string mnemonic,
                                               InstructionBody body,
                                               std::uint32_t frame_slots = 1);
    [[nodiscard]] static Instruction label(std::string name);
    [[nodiscard]] static Instruction ret();
};

// ---------------------------------------------------------------------------
// Routine
//   불변 객체. 교체는 RoutineTable 의 slot 단위로 이루어진다.
// ---------------------------------------------------------------------------
class Routine {
public:
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::vector<Instruction>& instructions() const noexcept { return instructions_; }
    [[nodiscard]] std::uint32_t max_frame_slots() const noexcept { return max_frame_slots_; }

    // execute
    //   instruction 을 순서대로 실행한다.
    //   종료 시점에 frame.result 가 비어 있으면 kInternalError 를 반환한다.
    [[nodiscard]] std::expected<Definition, ResolveError> execute(ResolutionFrame& frame) const;

private:
    friend std::expected<Routine, std::string>
    rebuild_routine(std::string name, std::vector<Instruction> instructions);

    Routine(std::string name, std::vector<Instruction> instructions, std::uint32_t max_frame_slots);

    std::string              name_;
    std::vector<Instruction> instructions_;
    std::uint32_t            max_frame_slots_{0};
};

// ---------------------------------------------------------------------------
// rebuild_routine
//   구조 규칙을 검증하고 frame 메타데이터를 계산해 Routine 을 만든다.
//   Routine 을 만드는 유일한 경로이므로 모든 Routine 은 구조적으로 유효하다.
//   위반 시 std::unexpected(사유).
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<Routine, std::string>
rebuild_routine(std::string name, std::vector<Instruction> instructions);
