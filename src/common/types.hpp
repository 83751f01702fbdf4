#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

// ---------------------------------------------------------------------------
// Definition
//   이름 해석(resolution) 이 성공했을 때 반환되는 정의 정보.
//   resolver 레이어가 생성하고 호출자에게 값으로 전달한다.
// ---------------------------------------------------------------------------
struct Definition {
    std::string name{};              // 요청된 완전 한정 이름 (예: "pkg.Foo1")
    std::string origin{};            // 정의를 제공한 위치 (resolver identity 또는 .so 경로)
    const void* address{nullptr};    // 정의 엔트리 주소 (레지스트리 정의는 nullptr 가능)
};

// ---------------------------------------------------------------------------
// ResolveErrorCode
//   이름 해석 단계에서 발생 가능한 오류 분류.
// ---------------------------------------------------------------------------
enum class ResolveErrorCode : std::uint8_t {
    kNotFound      = 0,  // 정의 없음 (path_hole 차단도 동일한 신호를 사용)
    kLoadFailed    = 1,  // 정의 파일은 있으나 로드/심볼 조회 실패
    kInternalError = 2,  // routine 실행 오류 (예: 결과 미설정)
};

// ---------------------------------------------------------------------------
// ResolveError
//   해석 실패 시 반환되는 오류 정보.
//   std::expected<Definition, ResolveError> 패턴과 함께 사용한다.
//
//   detail: kNotFound 인 경우 요청 이름의 내부 경로 표기 ("pkg/Foo1").
// ---------------------------------------------------------------------------
struct ResolveError {
    ResolveErrorCode code{ResolveErrorCode::kInternalError};
    std::string      detail{};   // 식별 정보 (내부 경로, 파일 경로 등)
    std::string      message{};  // 사람이 읽을 수 있는 오류 설명
};

// ---------------------------------------------------------------------------
// to_internal_path
//   "pkg.sub.Foo" → "pkg/sub/Foo"
//   런타임 내부 경로 구분자('/') 표기로 변환한다.
// ---------------------------------------------------------------------------
[[nodiscard]] inline std::string to_internal_path(std::string_view name) {
    std::string path{name};
    for (char& c : path) {
        if (c == '.') {
            c = '/';
        }
    }
    return path;
}

// ---------------------------------------------------------------------------
// make_not_found
//   정의가 존재하지 않을 때와 동일한 "not found" 오류를 만든다.
// ---------------------------------------------------------------------------
[[nodiscard]] inline ResolveError make_not_found(std::string_view name) {
    std::string path = to_internal_path(name);
    std::string message = "definition not found: " + path;
    return ResolveError{ResolveErrorCode::kNotFound, std::move(path), std::move(message)};
}
