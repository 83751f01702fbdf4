#include "agent/bootstrap.hpp"

#include "agent/guard_fragment.hpp"
#include "config/config_provider.hpp"
#include "config/property_store.hpp"
#include "filter/filter_engine.hpp"
#include "filter/fqn_pattern.hpp"
#include "logger/structured_logger.hpp"
#include "runtime/instrumentation.hpp"

#include <exception>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

// 프로세스 전역 splicer. premain 이 처음 성공적으로 capability 검사를
// 통과했을 때 생성되며 이후 교체되지 않는다.
// g_failed: splicer 생성 전에 premain 이 실패한 경우. splicer 의 kFailed 와
// 같은 종결 상태로 취급한다.
std::mutex                           g_splicer_mutex;
std::unique_ptr<InterceptionSplicer> g_splicer;
bool                                 g_failed{false};

[[noreturn]] void fail_bootstrap(std::string message) {
    g_failed = true;
    spdlog::critical("bootstrap: {}", message);
    throw BootstrapError(std::move(message));
}

[[nodiscard]] std::vector<std::string> builtin_allow_from_properties() {
    const auto configured = PropertyStore::process().get(kBuiltinAllowProperty);
    if (!configured.has_value()) {
        return default_builtin_allow_prefixes();
    }

    std::vector<std::string> prefixes;
    for (const auto entry : split_spec_list(*configured)) {
        prefixes.emplace_back(entry);
    }
    spdlog::info("bootstrap: builtin allow prefixes overridden ({} entries)", prefixes.size());
    return prefixes;
}

}  // namespace

void premain(Instrumentation* instrumentation, std::shared_ptr<StructuredLogger> logger) {
    const std::lock_guard lock(g_splicer_mutex);

    if (g_failed) {
        throw BootstrapError(
            "path_hole: an earlier bootstrap attempt failed; the resolution guard "
            "cannot be installed in this process");
    }
    if (instrumentation == nullptr) {
        fail_bootstrap(
            "path_hole: no instrumentation handle was provided by the host; "
            "the resolution guard cannot be installed");
    }
    if (!instrumentation->is_redefinition_supported()) {
        fail_bootstrap(
            "path_hole: routine redefinition is not supported by this runtime. "
            "Remove the path_hole agent.");
    }

    if (!g_splicer) {
        try {
            auto provider = std::make_shared<const PropertyConfigProvider>(PropertyStore::process());
            auto engine   = std::make_shared<const FilterEngine>(std::move(provider),
                                                                 builtin_allow_from_properties());
            g_splicer = std::make_unique<InterceptionSplicer>(
                make_guard_routine(std::move(engine), logger),
                RoutineId::kResolveDefinition,
                logger);
        } catch (const std::exception& e) {
            fail_bootstrap(fmt::format("path_hole: cannot build the resolution guard: {}", e.what()));
        }
    }

    // 실패 시 splicer 가 kFailed (종결) 또는 kInstalled (재호출 거부) 상태를 유지한다
    auto installed = g_splicer->install(*instrumentation);
    if (!installed.has_value()) {
        throw BootstrapError(fmt::format("path_hole: {}", installed.error().message));
    }

    spdlog::info("bootstrap: path_hole guard active (filter='{}', unfiltered='{}')",
                 PropertyStore::process().get_or(kFilterProperty, ""),
                 PropertyStore::process().get_or(kUnfilteredProperty, ""));
}

InstallState process_install_state() noexcept {
    const std::lock_guard lock(g_splicer_mutex);
    if (g_failed) {
        return InstallState::kFailed;
    }
    return g_splicer ? g_splicer->state() : InstallState::kUninstalled;
}
