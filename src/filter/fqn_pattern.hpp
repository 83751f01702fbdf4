#pragma once

// ---------------------------------------------------------------------------
// fqn_pattern.hpp
//
// 필터 토큰 문법 검증과 anchored literal + wildcard 매처 컴파일.
//
// [토큰 문법]
//   token   := (segment '.')* segment
//   segment := 첫 글자 [letter _ $ *], 이후 [letter digit _ $ *]*
//   letter  := ASCII 영문자 또는 0x80 이상 바이트 (UTF-8 식별자 허용)
//
// [매칭 규칙]
//   - '.' 와 '$' 는 리터럴 문자 그대로 비교한다. '$' 는 끝 앵커가 아니다.
//   - '*' 는 임의의 문자 1개 이상과 매칭한다 (0개는 불일치).
//   - 이름 전체가 매칭되어야 한다 (양 끝 anchored).
//
// 범용 regex 엔진은 사용하지 않는다. '*' 의 1개 이상 의미와 '$' 리터럴
// 처리를 정확히 재현하기 위해 리터럴 조각 + 와일드카드만 해석한다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// trim_ascii / split_spec_list
//   쉼표 구분 설정 문자열을 토큰 목록으로 분리한다.
//   각 토큰은 앞뒤 공백을 제거하고, 빈 토큰은 버린다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string_view trim_ascii(std::string_view text) noexcept;
[[nodiscard]] std::vector<std::string_view> split_spec_list(std::string_view spec);

// is_valid_fqn_pattern: 위 문법을 만족하면 true
[[nodiscard]] bool is_valid_fqn_pattern(std::string_view token) noexcept;

// ---------------------------------------------------------------------------
// CompiledPattern
//   토큰을 '*' 기준 리터럴 조각으로 분해해 보관한다.
//   "a.*Z" → {"a.", "Z"}, "*Foo$" → {"", "Foo$"}
// ---------------------------------------------------------------------------
class CompiledPattern {
public:
    // compile
    //   문법 위반 시 std::unexpected(사유 문자열) 반환.
    [[nodiscard]] static std::expected<CompiledPattern, std::string>
    compile(std::string_view token);

    // matches: name 전체가 패턴과 일치하면 true
    [[nodiscard]] bool matches(std::string_view name) const noexcept;

    [[nodiscard]] const std::string& source() const noexcept { return source_; }
    [[nodiscard]] std::size_t wildcard_count() const noexcept { return pieces_.size() - 1; }

private:
    CompiledPattern(std::string source, std::vector<std::string> pieces);

    std::string              source_;
    std::vector<std::string> pieces_;  // 항상 wildcard_count() + 1 개
};
