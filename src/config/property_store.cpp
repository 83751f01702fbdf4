// ---------------------------------------------------------------------------
// property_store.cpp
// ---------------------------------------------------------------------------

#include "config/property_store.hpp"

#include <array>
#include <cstdlib>
#include <mutex>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

struct EnvBinding {
    const char*      env_name;
    std::string_view key;
};

constexpr std::array<EnvBinding, 5> kEnvBindings{{
    {"PATH_HOLE_FILTER",         kFilterProperty},
    {"PATH_HOLE_UNFILTERED_CLS", kUnfilteredProperty},
    {"PATH_HOLE_BUILTIN_ALLOW",  kBuiltinAllowProperty},
    {"PATH_HOLE_LOG_LEVEL",      kLogLevelProperty},
    {"PATH_HOLE_LOG_PATH",       kLogPathProperty},
}};

}  // namespace

PropertyStore& PropertyStore::process() {
    static PropertyStore store;
    return store;
}

std::optional<std::string> PropertyStore::get(std::string_view key) const {
    const std::shared_lock lock(mutex_);
    const auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string PropertyStore::get_or(std::string_view key, std::string_view fallback) const {
    auto value = get(key);
    if (!value.has_value()) {
        return std::string{fallback};
    }
    return std::move(*value);
}

void PropertyStore::set(std::string_view key, std::string_view value) {
    const std::unique_lock lock(mutex_);
    values_.insert_or_assign(std::string{key}, std::string{value});
}

void PropertyStore::clear(std::string_view key) {
    const std::unique_lock lock(mutex_);
    const auto it = values_.find(key);
    if (it != values_.end()) {
        values_.erase(it);
    }
}

// ---------------------------------------------------------------------------
// load_environment
//   getenv 는 setenv 와 동시 호출 시 안전하지 않다. 부트스트랩 단계
//   (단일 스레드) 에서만 호출할 것.
// ---------------------------------------------------------------------------
std::size_t PropertyStore::load_environment() {
    std::size_t applied = 0;
    for (const auto& binding : kEnvBindings) {
        const char* val = std::getenv(binding.env_name);  // NOLINT(concurrency-mt-unsafe)
        if (val == nullptr || val[0] == '\0') {
            continue;
        }
        set(binding.key, val);
        spdlog::debug("property_store: {} -> {}", binding.env_name, binding.key);
        ++applied;
    }
    return applied;
}
