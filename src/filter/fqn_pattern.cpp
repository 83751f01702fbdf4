// ---------------------------------------------------------------------------
// fqn_pattern.cpp
//
// [매칭 알고리즘]
// 패턴 L0 * L1 * ... * Ln 에 대해:
//   1. name 은 L0 로 시작하고 Ln 으로 끝나야 한다.
//   2. 중간 조각 L1..Ln-1 은 순서대로, 직전 위치보다 최소 1글자 뒤에서
//      가장 왼쪽 위치를 찾는다 ('*' 가 1글자 이상 소비).
//   3. 마지막 '*' 도 최소 1글자를 소비할 공간이 남아야 한다.
// 가장 왼쪽 배치가 이후 조각에 가장 넓은 공간을 남기므로 backtracking 이
// 필요 없다. 연속된 "**" 는 빈 조각을 만들며 2글자 이상을 요구한다.
// ---------------------------------------------------------------------------

#include "filter/fqn_pattern.hpp"

#include <utility>

#include <fmt/format.h>

namespace {

[[nodiscard]] bool is_letter(unsigned char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c >= 0x80;
}

[[nodiscard]] bool is_digit(unsigned char c) noexcept {
    return c >= '0' && c <= '9';
}

[[nodiscard]] bool is_segment_start(unsigned char c) noexcept {
    return is_letter(c) || c == '_' || c == '$' || c == '*';
}

[[nodiscard]] bool is_segment_part(unsigned char c) noexcept {
    return is_segment_start(c) || is_digit(c);
}

[[nodiscard]] bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

}  // namespace

std::string_view trim_ascii(std::string_view text) noexcept {
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

std::vector<std::string_view> split_spec_list(std::string_view spec) {
    std::vector<std::string_view> tokens;
    std::size_t start = 0;
    while (start <= spec.size()) {
        const auto comma = spec.find(',', start);
        const auto end   = (comma == std::string_view::npos) ? spec.size() : comma;
        const auto token = trim_ascii(spec.substr(start, end - start));
        if (!token.empty()) {
            tokens.push_back(token);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return tokens;
}

bool is_valid_fqn_pattern(std::string_view token) noexcept {
    if (token.empty()) {
        return false;
    }

    bool at_segment_start = true;
    for (const char ch : token) {
        const auto c = static_cast<unsigned char>(ch);
        if (c == '.') {
            // 빈 segment ("a..b", ".a", "a.") 금지
            if (at_segment_start) {
                return false;
            }
            at_segment_start = true;
            continue;
        }
        if (at_segment_start) {
            if (!is_segment_start(c)) {
                return false;
            }
            at_segment_start = false;
        } else if (!is_segment_part(c)) {
            return false;
        }
    }
    return !at_segment_start;
}

CompiledPattern::CompiledPattern(std::string source, std::vector<std::string> pieces)
    : source_(std::move(source))
    , pieces_(std::move(pieces)) {}

std::expected<CompiledPattern, std::string> CompiledPattern::compile(std::string_view token) {
    if (!is_valid_fqn_pattern(token)) {
        return std::unexpected(fmt::format("'{}' is not a fully qualified name pattern", token));
    }

    std::vector<std::string> pieces;
    std::size_t start = 0;
    for (;;) {
        const auto star = token.find('*', start);
        if (star == std::string_view::npos) {
            pieces.emplace_back(token.substr(start));
            break;
        }
        pieces.emplace_back(token.substr(start, star - start));
        start = star + 1;
    }

    return CompiledPattern{std::string{token}, std::move(pieces)};
}

bool CompiledPattern::matches(std::string_view name) const noexcept {
    const std::string_view head = pieces_.front();

    // wildcard 없음: 완전 일치
    if (pieces_.size() == 1) {
        return name == head;
    }

    const std::string_view tail = pieces_.back();
    if (name.size() < head.size() + tail.size() + wildcard_count()) {
        return false;
    }
    if (!name.starts_with(head) || !name.ends_with(tail)) {
        return false;
    }

    // tail 은 name 끝에 고정되므로 중간 조각은 tail 시작 전에서만 찾는다
    const std::size_t tail_start = name.size() - tail.size();
    std::size_t pos = head.size();

    for (std::size_t i = 1; i + 1 < pieces_.size(); ++i) {
        const std::string_view piece = pieces_[i];
        const std::size_t search_from = pos + 1;  // 직전 '*' 가 최소 1글자 소비
        if (search_from > tail_start) {
            return false;
        }
        const auto found = name.substr(0, tail_start).find(piece, search_from);
        if (found == std::string_view::npos) {
            return false;
        }
        pos = found + piece.size();
    }

    // 마지막 '*' 가 최소 1글자 소비
    return pos + 1 <= tail_start;
}
