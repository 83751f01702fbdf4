// ---------------------------------------------------------------------------
// filter_engine.cpp
//
// [재파싱 비용]
// 매 호출마다 filter 속성 값을 분리/검증/컴파일한다. 토큰 수 P, 이름 길이 N
// 에 대해 O(P * N). 패턴 캐시는 두지 않는다: 가드는 공유 routine 안에서
// 실행되므로 캐시를 보관할 인스턴스 필드가 없다.
//
// [면제 목록]
// exemption 속성 값은 쉼표로 분리 후 trim, 빈 항목은 버린다. 비교는 정확한
// 문자열 일치 (대소문자 구분).
// ---------------------------------------------------------------------------

#include "filter/filter_engine.hpp"

#include "filter/fqn_pattern.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

const std::vector<std::string>& default_builtin_allow_prefixes() {
    static const std::vector<std::string> prefixes{
        "std.",
        "__gnu_cxx.",
        "__cxxabiv1.",
        "path_hole.",
    };
    return prefixes;
}

FilterEngine::FilterEngine(std::shared_ptr<const GuardConfigProvider> config,
                           std::vector<std::string>                   builtin_allow)
    : config_(std::move(config))
    , builtin_allow_(std::move(builtin_allow)) {
    if (!config_) {
        spdlog::warn("filter_engine: constructed without config provider, every name is allowed");
    }
    // 빈 접두사는 모든 이름과 일치하므로 제거
    std::erase_if(builtin_allow_, [](const std::string& prefix) { return prefix.empty(); });
}

FilterDecision FilterEngine::decide(std::string_view name,
                                    std::string_view caller_identity) const noexcept {
    return evaluate(name, caller_identity).decision;
}

FilterResult FilterEngine::evaluate(std::string_view name,
                                    std::string_view caller_identity) const noexcept {
    try {
        return evaluate_unchecked(name, caller_identity);
    } catch (const std::exception& e) {
        // 해석 호출을 중단시키지 않는다. 가드가 없는 것처럼 원래 로직으로 진행.
        try {
            spdlog::error("filter_engine: evaluation failed for '{}': {}", name, e.what());
        } catch (const std::exception&) {
            // 로깅 실패는 판정에 영향 없음
        }
        return FilterResult{FilterDecision::kAllow, "engine-error", {}};
    } catch (...) {
        // noexcept 경계: provider 가 std::exception 이 아닌 값을 던진 경우
        try {
            spdlog::error("filter_engine: evaluation failed for '{}': non-standard exception", name);
        } catch (const std::exception&) {
            // 로깅 실패는 판정에 영향 없음
        }
        return FilterResult{FilterDecision::kAllow, "engine-error", {}};
    }
}

FilterResult FilterEngine::evaluate_unchecked(std::string_view name,
                                              std::string_view caller_identity) const {
    if (!config_) {
        return FilterResult{FilterDecision::kAllow, "no-filter", "no config provider"};
    }

    // Step 1: 면제 resolver
    const std::string exemptions = config_->exemption_spec();
    for (const auto entry : split_spec_list(exemptions)) {
        if (entry == caller_identity) {
            return FilterResult{
                FilterDecision::kAllow,
                "exempt-resolver",
                fmt::format("resolver '{}' is exempt", caller_identity)
            };
        }
    }

    // Step 2: 런타임 소유 네임스페이스
    const auto builtin = std::find_if(
        builtin_allow_.begin(), builtin_allow_.end(),
        [name](const std::string& prefix) { return name.starts_with(prefix); }
    );
    if (builtin != builtin_allow_.end()) {
        return FilterResult{
            FilterDecision::kAllow,
            "builtin-allow",
            fmt::format("'{}' is under protected prefix '{}'", name, *builtin)
        };
    }

    // Step 3: 필터 패턴
    const std::string filter = config_->filter_spec();
    if (trim_ascii(filter).empty()) {
        return FilterResult{FilterDecision::kAllow, "no-filter", {}};
    }

    // 모든 토큰을 먼저 컴파일한다. 잘못된 토큰은 매칭 결과와 무관하게
    // 호출마다 빠짐없이 경고된다.
    const auto tokens = split_spec_list(filter);
    std::vector<CompiledPattern> patterns;
    patterns.reserve(tokens.size());
    for (const auto token : tokens) {
        auto pattern = CompiledPattern::compile(token);
        if (!pattern.has_value()) {
            spdlog::warn("path_hole: malformed filter entry = '{}'", token);
            continue;
        }
        patterns.push_back(std::move(*pattern));
    }

    for (const auto& pattern : patterns) {
        if (pattern.matches(name)) {
            return FilterResult{
                FilterDecision::kDeny,
                "pattern",
                fmt::format("'{}' matches filter entry '{}'", name, pattern.source())
            };
        }
    }

    // Step 4: 일치 없음
    return FilterResult{FilterDecision::kAllow, "no-match", {}};
}
