#pragma once

// ---------------------------------------------------------------------------
// guard_fragment.hpp
//
// 공유 해석 routine 앞에 붙일 가드 본문.
//
// make_guard_routine() 은 완전한 Routine 을 만든다:
//   [0] "path_hole.guard" operation
//         FilterEngine::evaluate(frame.name, frame.resolver.identity())
//         kDeny  → frame.result = "not found" (이름의 '.' → '/'), kExit
//         kAllow → kNext (원래 본문으로 fall through)
//   [1] label "path_hole.guard.end"
//   [2] return
// splicer 는 [1], [2] 를 제거한 나머지를 대상 routine 앞에 삽입한다.
//
// [상태 없음]
// 가드는 engine 과 logger 의 shared_ptr 만 캡처한다. engine 은 매 호출마다
// 설정을 다시 읽으므로 가드 자체에는 캐시가 없다.
// ---------------------------------------------------------------------------

#include <memory>

#include "runtime/routine.hpp"

class FilterEngine;
class StructuredLogger;

inline constexpr const char* kGuardMnemonic  = "path_hole.guard";
inline constexpr const char* kGuardEndLabel  = "path_hole.guard.end";

// logger 가 nullptr 이면 차단 이벤트는 spdlog::debug 로만 기록된다.
[[nodiscard]] std::shared_ptr<const Routine>
make_guard_routine(std::shared_ptr<const FilterEngine> engine,
                   std::shared_ptr<StructuredLogger>   logger = nullptr);
