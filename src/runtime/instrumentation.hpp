#pragma once

// ---------------------------------------------------------------------------
// instrumentation.hpp
//
// 이미 로드된 공유 routine 의 본문을 제자리에서 교체하는 capability.
// 호스트 환경이 부트스트랩 시 path_hole 에 전달한다.
//
// [계약]
// - is_redefinition_supported() 가 false 면 redefine() 은 항상 실패한다.
// - redefine() 은 전부 반영되거나 전혀 반영되지 않는다 (부분 교체 없음).
// ---------------------------------------------------------------------------

#include <expected>
#include <memory>
#include <string>

#include "runtime/routine_table.hpp"

class Instrumentation {
public:
    virtual ~Instrumentation() = default;

    [[nodiscard]] virtual bool is_redefinition_supported() const noexcept = 0;

    // routine: 현재 slot 의 본문 (splice 의 원본)
    [[nodiscard]] virtual std::shared_ptr<const Routine> routine(RoutineId id) const = 0;

    [[nodiscard]] virtual std::expected<void, std::string>
    redefine(RoutineId id, std::shared_ptr<const Routine> routine) = 0;
};

// ---------------------------------------------------------------------------
// TableInstrumentation
//   RoutineTable 에 대한 capability 구현.
//   redefinition_supported = false 로 생성하면 교체를 지원하지 않는
//   호스트를 표현한다.
// ---------------------------------------------------------------------------
class TableInstrumentation final : public Instrumentation {
public:
    explicit TableInstrumentation(RoutineTable& table, bool redefinition_supported = true);

    [[nodiscard]] bool is_redefinition_supported() const noexcept override;
    [[nodiscard]] std::shared_ptr<const Routine> routine(RoutineId id) const override;
    [[nodiscard]] std::expected<void, std::string>
    redefine(RoutineId id, std::shared_ptr<const Routine> routine) override;

private:
    RoutineTable& table_;
    bool          redefinition_supported_;
};
