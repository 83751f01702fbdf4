#pragma once

// ---------------------------------------------------------------------------
// config_loader.hpp
//
// YAML 설정 파일을 로드해 PropertyStore 에 반영하는 로더.
//
// [파일 형식]
//   path_hole:
//     filter: ["pkg.Foo1", "pkg.*Test"]   # sequence 또는 쉼표 구분 scalar
//     unfiltered: ["TrustedResolver"]
//     builtin_allow: ["std.", "path_hole."]
//   logging:
//     level: info
//     path: /tmp/path_hole.log
//
// [설계 원칙]
// - All-or-nothing: 파일 없음, YAML 문법 오류, 최상위가 map 이 아님 →
//   std::unexpected. 부분적으로 파싱된 설정을 반환하지 않는다.
// - 잘못된 filter 토큰은 로드 실패가 아니다. 로드 시점에 경고만 출력하고
//   FilterEngine 이 호출마다 해당 토큰을 건너뛴다.
// - YAML 파일 전체를 로그에 출력하지 않는다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

class PropertyStore;

// ---------------------------------------------------------------------------
// GuardFileConfig
//   파일에 존재한 필드만 값을 가진다. 없는 필드는 std::nullopt.
//   filter/unfiltered 는 PropertyStore 에 그대로 넣을 수 있도록
//   쉼표로 합친 문자열로 보관한다.
// ---------------------------------------------------------------------------
struct GuardFileConfig {
    std::optional<std::string>              filter_spec{};
    std::optional<std::string>              exemption_spec{};
    std::optional<std::vector<std::string>> builtin_allow{};
    std::optional<std::string>              log_level{};
    std::optional<std::string>              log_path{};
};

class ConfigLoader {
public:
    // load
    //   성공: GuardFileConfig
    //   실패: std::unexpected(error_message)
    [[nodiscard]] static std::expected<GuardFileConfig, std::string>
    load(const std::filesystem::path& config_path);

    // apply
    //   값이 있는 필드만 store 에 기록한다. 반환값: 기록한 키 개수.
    static std::size_t apply(const GuardFileConfig& config, PropertyStore& store);
};
