#pragma once

// ---------------------------------------------------------------------------
// resolver.hpp
//
// 완전 한정 이름을 정의로 해석하는 resolver 의 추상 기반 클래스.
//
// [공유 진입점]
// resolve() 는 비가상 함수이며 본문이 없다. 호출마다 RoutineTable 의
// kResolveDefinition slot 에서 현재 routine 을 load 하여 실행한다.
// 기본 routine 본문은 resolve_default() 를 호출한다:
//   1. parent 가 있으면 parent->resolve(name) 에 먼저 위임
//   2. parent 가 kNotFound 를 반환하면 find_definition(name)
//   3. parent 가 다른 오류를 반환하면 그대로 전파
// parent 위임은 다시 공유 진입점을 거치므로 체인의 resolver 마다 가드가
// 실행된다.
//
// [identity]
// identity 는 면제 목록(path_hole.unfiltered.cls)과 정확히 비교되는 문자열.
// ---------------------------------------------------------------------------

#include <expected>
#include <memory>
#include <string>
#include <string_view>

#include "common/types.hpp"
#include "runtime/routine_table.hpp"

class Resolver {
public:
    Resolver(std::string               identity,
             std::shared_ptr<Resolver> parent = nullptr,
             RoutineTable&             table  = RoutineTable::process());

    virtual ~Resolver() = default;

    Resolver(const Resolver&)            = delete;
    Resolver& operator=(const Resolver&) = delete;
    Resolver(Resolver&&)                 = delete;
    Resolver& operator=(Resolver&&)      = delete;

    [[nodiscard]] const std::string& identity() const noexcept { return identity_; }
    [[nodiscard]] const std::shared_ptr<Resolver>& parent() const noexcept { return parent_; }

    // resolve: 공유 진입점. 모든 해석 요청은 여기를 거친다.
    [[nodiscard]] std::expected<Definition, ResolveError> resolve(std::string_view name) const;

    // resolve_default
    //   공유 routine 의 원래 본문이 호출하는 해석 로직 (위임 + 로컬 조회).
    //   가드를 우회하므로 애플리케이션 코드는 resolve() 를 사용할 것.
    [[nodiscard]] std::expected<Definition, ResolveError> resolve_default(std::string_view name) const;

protected:
    // find_definition: 이 resolver 자신의 저장소에서만 조회한다.
    [[nodiscard]] virtual std::expected<Definition, ResolveError>
    find_definition(std::string_view name) const = 0;

private:
    std::string               identity_;
    std::shared_ptr<Resolver> parent_;
    RoutineTable&             table_;
};

// ---------------------------------------------------------------------------
// make_default_resolution_routine
//   ["resolve-default" operation, return]
//   RoutineTable 이 slot 초기값으로 사용한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::shared_ptr<const Routine> make_default_resolution_routine();
