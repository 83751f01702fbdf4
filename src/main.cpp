#include "agent/bootstrap.hpp"
#include "config/config_loader.hpp"
#include "config/config_watcher.hpp"
#include "config/property_store.hpp"
#include "filter/fqn_pattern.hpp"
#include "logger/structured_logger.hpp"
#include "runtime/instrumentation.hpp"
#include "runtime/shared_object_resolver.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

// ---------------------------------------------------------------------------
// path_hole_probe
//
// 환경변수/YAML 로 가드를 설정하고, 주어진 이름들을 SharedObjectResolver 로
// 해석해 결과를 출력한다.
//
// 종료 코드:
//   0 : 모든 이름 해석 성공
//   1 : 하나 이상 해석 실패 (차단 포함)
//   2 : 기동 실패 (설정 파일 오류, 로거 생성 실패, BootstrapError)
// ---------------------------------------------------------------------------

namespace {

constexpr int kExitUnresolved   = 1;
constexpr int kExitStartupError = 2;

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없으면 기본값 반환)
// ---------------------------------------------------------------------------
std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

std::uint32_t env_u32(const char* name, std::uint32_t default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr || val[0] == '\0') {
        return default_val;
    }
    const std::string_view text{val};
    std::uint32_t parsed{0};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        spdlog::warn("env {}: invalid value '{}', using default {}", name, text, default_val);
        return default_val;
    }
    return parsed;
}

// 결과 한 줄 출력. 성공하면 true.
bool probe(const Resolver& resolver, std::string_view name) {
    const auto result = resolver.resolve(name);
    if (result.has_value()) {
        fmt::print("{}: found ({})\n", name, result->origin);
        return true;
    }
    if (result.error().code == ResolveErrorCode::kNotFound) {
        fmt::print("{}: not found ({})\n", name, result.error().detail);
    } else {
        fmt::print("{}: load failed ({})\n", name, result.error().message);
    }
    return false;
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {

    // ── 설정 로드 (환경변수 → YAML 파일 순, 파일 값이 우선) ──────────────
    auto& properties = PropertyStore::process();
    properties.load_environment();

    const std::string config_path  = env_str("PATH_HOLE_CONFIG", "");
    const std::string plugin_path  = env_str("PATH_HOLE_PLUGIN_PATH", "plugins");
    const std::uint32_t watch_ms   = env_u32("PATH_HOLE_WATCH_INTERVAL_MS", 1000);

    if (!config_path.empty()) {
        auto loaded = ConfigLoader::load(config_path);
        if (!loaded.has_value()) {
            fmt::print(stderr, "path_hole_probe: {}\n", loaded.error());
            return kExitStartupError;
        }
        ConfigLoader::apply(*loaded, properties);
    }

    // ── 로깅 초기화 ─────────────────────────────────────────────────────
    std::shared_ptr<StructuredLogger> logger;
    try {
        logger = std::make_shared<StructuredLogger>(
            parse_log_level(properties.get_or(kLogLevelProperty, "info")),
            properties.get_or(kLogPathProperty, ""));
    } catch (const std::runtime_error& e) {
        fmt::print(stderr, "path_hole_probe: cannot initialise logging: {}\n", e.what());
        return kExitStartupError;
    }

    spdlog::info("Starting path_hole probe");
    spdlog::info("Plugin path: {}", plugin_path);
    spdlog::info("Config file: {}", config_path.empty() ? "(none)" : config_path);

    // ── 가드 설치 ───────────────────────────────────────────────────────
    TableInstrumentation instrumentation{RoutineTable::process()};
    try {
        premain(&instrumentation, logger);
    } catch (const BootstrapError& e) {
        spdlog::critical("{}", e.what());
        return kExitStartupError;
    }

    const SharedObjectResolver resolver{SharedObjectResolver::parse_search_path(plugin_path)};

    // ── 인자 모드 ───────────────────────────────────────────────────────
    if (argc > 1) {
        bool all_found = true;
        for (int i = 1; i < argc; ++i) {
            all_found = probe(resolver, argv[i]) && all_found;
        }
        return all_found ? EXIT_SUCCESS : kExitUnresolved;
    }

    // ── stdin 모드 (설정 파일이 있으면 백그라운드 감시) ──────────────────
    boost::asio::io_context ioc;
    std::unique_ptr<ConfigWatcher> watcher;
    std::optional<std::thread> watch_thread;
    if (!config_path.empty()) {
        watcher = std::make_unique<ConfigWatcher>(
            config_path, properties, ioc, std::chrono::milliseconds{watch_ms});
        boost::asio::co_spawn(ioc, watcher->run(), boost::asio::detached);
        watch_thread.emplace([&ioc] { ioc.run(); });
    }

    bool all_found = true;
    std::string line;
    while (std::getline(std::cin, line)) {
        const auto name = trim_ascii(line);
        if (name.empty()) {
            continue;
        }
        all_found = probe(resolver, name) && all_found;
    }

    // ── 종료 처리 ───────────────────────────────────────────────────────
    if (watcher) {
        watcher->stop();
    }
    if (watch_thread) {
        watch_thread->join();
    }
    spdlog::info("path_hole probe stopped");

    return all_found ? EXIT_SUCCESS : kExitUnresolved;
}
