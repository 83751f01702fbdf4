#pragma once

// ---------------------------------------------------------------------------
// routine_table.hpp
//
// 모든 resolver 가 공유하는 routine slot 테이블.
//
// Resolver::resolve() 는 호출마다 slot 의 현재 routine 을 load 하여 실행한다.
// routine 이 resolver 인스턴스가 아닌 slot 에 있으므로, slot 을 교체하면
// 이미 생성된 resolver 와 이후 생성될 resolver 모두가 새 본문을 관측한다.
//
// [교체 원자성]
// slot 은 std::atomic<std::shared_ptr<const Routine>> 이다.
// - 실행 중인 호출은 load() 로 얻은 shared_ptr 로 이전 본문을 끝까지 실행한다.
// - replace() 는 store() 한 번으로 교체한다. 중간 상태는 관측되지 않는다.
// ---------------------------------------------------------------------------

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

#include "runtime/routine.hpp"

enum class RoutineId : std::uint8_t {
    kResolveDefinition = 0,  // 공유 해석 진입점
};

inline constexpr std::size_t kRoutineCount = 1;

[[nodiscard]] std::string_view routine_name(RoutineId id) noexcept;

class RoutineTable {
public:
    // 생성 시 각 slot 에 기본 본문을 설치한다.
    RoutineTable();
    ~RoutineTable() = default;

    RoutineTable(const RoutineTable&)            = delete;
    RoutineTable& operator=(const RoutineTable&) = delete;
    RoutineTable(RoutineTable&&)                 = delete;
    RoutineTable& operator=(RoutineTable&&)      = delete;

    // process: 프로세스 전역 테이블 (기본 resolver 들이 사용)
    [[nodiscard]] static RoutineTable& process();

    [[nodiscard]] std::shared_ptr<const Routine> current(RoutineId id) const;

    // replace: 원자적 교체. routine 이 nullptr 이면 무시한다.
    void replace(RoutineId id, std::shared_ptr<const Routine> routine);

    // generation: 해당 slot 이 교체된 횟수 (진단용)
    [[nodiscard]] std::uint64_t generation(RoutineId id) const noexcept;

private:
    std::array<std::atomic<std::shared_ptr<const Routine>>, kRoutineCount> slots_;
    std::array<std::atomic<std::uint64_t>, kRoutineCount>                  generations_{};
};
