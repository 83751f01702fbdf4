// ---------------------------------------------------------------------------
// shared_object_resolver.cpp
//
// [dlerror]
// glibc 의 dlerror 상태는 스레드 로컬이다. 각 dlopen/dlsym 직전에 dlerror()
// 로 이전 상태를 비운 뒤 결과를 확인한다.
// ---------------------------------------------------------------------------

#include "runtime/shared_object_resolver.hpp"

#include <dlfcn.h>

#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

// 경로 변환이 안전한 이름인지 확인: 빈 segment 와 '/' 금지
[[nodiscard]] bool is_path_safe_name(std::string_view name) noexcept {
    if (name.empty() || name.front() == '.' || name.back() == '.') {
        return false;
    }
    if (name.find("..") != std::string_view::npos) {
        return false;
    }
    return name.find('/') == std::string_view::npos && name.find('\0') == std::string_view::npos;
}

[[nodiscard]] std::string take_dlerror(std::string_view fallback) {
    const char* err = dlerror();
    return err != nullptr ? std::string{err} : std::string{fallback};
}

}  // namespace

SharedObjectResolver::SharedObjectResolver(std::vector<std::filesystem::path> search_path,
                                           std::string                        identity,
                                           std::shared_ptr<Resolver>          parent,
                                           RoutineTable&                      table)
    : Resolver(std::move(identity), std::move(parent), table)
    , search_path_(std::move(search_path)) {}

SharedObjectResolver::~SharedObjectResolver() {
    const std::lock_guard lock(handles_mutex_);
    for (const auto& [file, handle] : handles_) {
        if (dlclose(handle) != 0) {
            spdlog::warn("shared_object_resolver: dlclose('{}') failed: {}",
                         file, take_dlerror("unknown error"));
        }
    }
    handles_.clear();
}

std::vector<std::filesystem::path> SharedObjectResolver::parse_search_path(std::string_view text) {
    std::vector<std::filesystem::path> dirs;
    std::size_t start = 0;
    while (start <= text.size()) {
        const auto colon = text.find(':', start);
        const auto end   = (colon == std::string_view::npos) ? text.size() : colon;
        if (end > start) {
            dirs.emplace_back(text.substr(start, end - start));
        }
        if (colon == std::string_view::npos) {
            break;
        }
        start = colon + 1;
    }
    return dirs;
}

std::expected<Definition, ResolveError>
SharedObjectResolver::find_definition(std::string_view name) const {
    if (!is_path_safe_name(name)) {
        return std::unexpected(make_not_found(name));
    }

    const std::filesystem::path relative = to_internal_path(name) + ".so";

    for (const auto& dir : search_path_) {
        const auto candidate = dir / relative;
        std::error_code ec;
        if (!std::filesystem::is_regular_file(candidate, ec)) {
            continue;
        }

        auto handle = open_cached(candidate);
        if (!handle.has_value()) {
            return std::unexpected(std::move(handle.error()));
        }

        dlerror();
        void* entry = dlsym(*handle, kDefinitionEntrySymbol);
        if (entry == nullptr) {
            return std::unexpected(ResolveError{
                ResolveErrorCode::kLoadFailed,
                candidate.string(),
                fmt::format("entry symbol '{}' missing: {}",
                            kDefinitionEntrySymbol, take_dlerror("symbol resolved to null"))
            });
        }

        return Definition{std::string{name}, candidate.string(), entry};
    }

    return std::unexpected(make_not_found(name));
}

std::expected<void*, ResolveError>
SharedObjectResolver::open_cached(const std::filesystem::path& file) const {
    const std::lock_guard lock(handles_mutex_);

    const auto key = file.string();
    if (const auto it = handles_.find(key); it != handles_.end()) {
        return it->second;
    }

    dlerror();
    void* handle = dlopen(key.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (handle == nullptr) {
        const auto err = take_dlerror("dlopen failed");
        spdlog::warn("shared_object_resolver: cannot load '{}': {}", key, err);
        return std::unexpected(ResolveError{ResolveErrorCode::kLoadFailed, key, err});
    }

    spdlog::debug("shared_object_resolver: loaded '{}'", key);
    handles_.emplace(key, handle);
    return handle;
}
