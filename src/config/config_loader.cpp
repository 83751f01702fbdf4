// ---------------------------------------------------------------------------
// config_loader.cpp
//
// [알려진 한계]
// - filter/unfiltered 의 scalar 형태는 쉼표 구분 문자열로 그대로 보관한다.
//   sequence 형태는 각 원소를 ',' 로 합친다. 원소 안에 ',' 가 있으면
//   합친 뒤 여러 토큰으로 쪼개진다.
// - builtin_allow 가 빈 sequence 이면 "BuiltinAllow 없음" 으로 반영된다.
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include "config/property_store.hpp"
#include "filter/fqn_pattern.hpp"

#include <string>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

// ---------------------------------------------------------------------------
// 내부 헬퍼: scalar 또는 string sequence 를 쉼표 구분 문자열로 읽는다.
// 노드가 없거나 null 이면 std::nullopt.
// map 이면 YAML::Exception 과 같은 취급을 하도록 호출자에 오류를 돌려준다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<std::optional<std::string>, std::string>
read_spec_list(const YAML::Node& node, const char* key) {
    if (!node || node.IsNull()) {
        return std::optional<std::string>{};
    }
    if (node.IsScalar()) {
        return std::optional<std::string>{node.as<std::string>()};
    }
    if (node.IsSequence()) {
        std::vector<std::string> items;
        items.reserve(node.size());
        for (const auto& item : node) {
            if (!item.IsScalar()) {
                return std::unexpected(fmt::format(
                    "'path_hole.{}' must contain only scalar entries", key));
            }
            items.push_back(item.as<std::string>());
        }
        return std::optional<std::string>{fmt::format("{}", fmt::join(items, ","))};
    }
    return std::unexpected(fmt::format(
        "'path_hole.{}' must be a scalar or a sequence", key));
}

[[nodiscard]] std::optional<std::string> read_string(const YAML::Node& node) {
    if (!node || !node.IsScalar()) {
        return std::nullopt;
    }
    return node.as<std::string>();
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 로드 시점 토큰 검증. 잘못된 토큰은 호출마다 건너뛰어지므로
// 해당 이름은 차단되지 않는다. 운영자에게 미리 알린다.
// ---------------------------------------------------------------------------
void warn_malformed_tokens(const std::string& filter_spec) {
    for (const auto token : split_spec_list(filter_spec)) {
        if (!is_valid_fqn_pattern(token)) {
            spdlog::warn("config_loader: filter entry '{}' is malformed and will be ignored",
                         token);
        }
    }
}

}  // namespace

// ---------------------------------------------------------------------------
// ConfigLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<GuardFileConfig, std::string>
ConfigLoader::load(const std::filesystem::path& config_path) {
    // 1. 경로 정규화
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "config_loader: cannot resolve config path '{}': {}",
            config_path.string(), ec.message()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("config_loader: loading configuration from '{}'", canonical_path.string());

    // 2. YAML 파일 로드
    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format(
            "config_loader: cannot open file '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "config_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(),
            e.mark.line + 1,
            e.mark.column + 1,
            e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: YAML error in '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    if (!root || !root.IsMap()) {
        const std::string err = fmt::format(
            "config_loader: '{}' is not a valid YAML map (top-level)",
            canonical_path.string()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    // 3. 섹션 파싱
    GuardFileConfig cfg{};

    try {
        const YAML::Node guard = root["path_hole"];
        if (guard && !guard.IsNull()) {
            if (!guard.IsMap()) {
                const std::string err = "config_loader: 'path_hole' section is not a map";
                spdlog::error("{}", err);
                return std::unexpected(err);
            }

            auto filter = read_spec_list(guard["filter"], "filter");
            if (!filter.has_value()) {
                const std::string err = fmt::format("config_loader: {}", filter.error());
                spdlog::error("{}", err);
                return std::unexpected(err);
            }
            cfg.filter_spec = std::move(*filter);

            auto unfiltered = read_spec_list(guard["unfiltered"], "unfiltered");
            if (!unfiltered.has_value()) {
                const std::string err = fmt::format("config_loader: {}", unfiltered.error());
                spdlog::error("{}", err);
                return std::unexpected(err);
            }
            cfg.exemption_spec = std::move(*unfiltered);

            const YAML::Node builtin = guard["builtin_allow"];
            if (builtin && !builtin.IsNull()) {
                if (!builtin.IsSequence()) {
                    const std::string err =
                        "config_loader: 'path_hole.builtin_allow' must be a sequence";
                    spdlog::error("{}", err);
                    return std::unexpected(err);
                }
                std::vector<std::string> prefixes;
                prefixes.reserve(builtin.size());
                for (const auto& item : builtin) {
                    if (!item.IsScalar()) {
                        const std::string err =
                            "config_loader: 'path_hole.builtin_allow' must contain only scalar entries";
                        spdlog::error("{}", err);
                        return std::unexpected(err);
                    }
                    prefixes.push_back(item.as<std::string>());
                }
                cfg.builtin_allow = std::move(prefixes);
            }
        }
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: error parsing 'path_hole' section: {}", e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    try {
        const YAML::Node logging = root["logging"];
        if (logging && logging.IsMap()) {
            cfg.log_level = read_string(logging["level"]);
            cfg.log_path  = read_string(logging["path"]);
        }
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: error parsing 'logging' section: {}", e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    if (cfg.filter_spec.has_value()) {
        warn_malformed_tokens(*cfg.filter_spec);
    }

    spdlog::info("config_loader: configuration loaded (filter entries: {})",
                 cfg.filter_spec ? split_spec_list(*cfg.filter_spec).size() : 0);
    return cfg;
}

std::size_t ConfigLoader::apply(const GuardFileConfig& config, PropertyStore& store) {
    std::size_t applied = 0;
    if (config.filter_spec) {
        store.set(kFilterProperty, *config.filter_spec);
        ++applied;
    }
    if (config.exemption_spec) {
        store.set(kUnfilteredProperty, *config.exemption_spec);
        ++applied;
    }
    if (config.builtin_allow) {
        store.set(kBuiltinAllowProperty, fmt::format("{}", fmt::join(*config.builtin_allow, ",")));
        ++applied;
    }
    if (config.log_level) {
        store.set(kLogLevelProperty, *config.log_level);
        ++applied;
    }
    if (config.log_path) {
        store.set(kLogPathProperty, *config.log_path);
        ++applied;
    }
    return applied;
}
