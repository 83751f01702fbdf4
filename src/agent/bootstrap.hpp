#pragma once

// ---------------------------------------------------------------------------
// bootstrap.hpp
//
// path_hole 에이전트 진입점. 호스트가 애플리케이션 코드 실행 전에 한 번 호출한다.
//
// premain 은 다음을 수행한다:
//   1. capability 검사 (nullptr, is_redefinition_supported)
//   2. PropertyStore::process() 기반 FilterEngine 생성
//      (path_hole.builtin_allow 가 있으면 BuiltinAllow 를 그 값으로 교체)
//   3. 가드 routine 생성 후 프로세스 전역 splicer 로 설치
// 어떤 단계든 실패하면 BootstrapError 를 던진다. 호출자는 기동을 중단해야
// 한다. 가드 없이 계속 실행하면 필터가 적용되지 않는데도 적용된 것처럼 보인다.
//
// [한 번만]
// 프로세스 전역 splicer 는 하나뿐이다. 설치 성공/실패 이후 재호출은
// kAlreadyInstalled 로 거부되어 BootstrapError 가 된다.
// capability 검사 실패도 종결 상태다: process_install_state() 는 kFailed 를
// 반환하고 이후 premain 은 모두 BootstrapError 를 던진다.
// ---------------------------------------------------------------------------

#include <memory>
#include <stdexcept>
#include <string>

#include "agent/splicer.hpp"

class Instrumentation;
class StructuredLogger;

class BootstrapError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// premain
//   logger: 설치/차단 이벤트를 기록할 구조화 로거 (선택)
void premain(Instrumentation* instrumentation, std::shared_ptr<StructuredLogger> logger = nullptr);

// process_install_state: 프로세스 전역 splicer 의 현재 상태
[[nodiscard]] InstallState process_install_state() noexcept;
