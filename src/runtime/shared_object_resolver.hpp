#pragma once

// ---------------------------------------------------------------------------
// shared_object_resolver.hpp
//
// 검색 경로(search path) 기반 resolver.
//   "pkg.Foo1" → <dir>/pkg/Foo1.so  (검색 경로 순서대로 첫 번째 존재 파일)
// 파일을 dlopen 한 뒤 엔트리 심볼(kDefinitionEntrySymbol)을 조회한다.
//
// [오류 분류]
// - 어떤 디렉터리에도 파일 없음         → kNotFound (detail: "pkg/Foo1")
// - 파일은 있으나 dlopen/dlsym 실패     → kLoadFailed (detail: 파일 경로)
// - 이름이 경로로 변환될 수 없는 형태   → kNotFound
//   (빈 이름, 빈 segment, '/' 포함. 검색 경로 밖 탐색 방지)
//
// [수명]
// dlopen 핸들은 캐시되며 resolver 소멸 시 dlclose 된다. 반환된
// Definition::address 는 resolver 가 살아 있는 동안만 유효하다.
// ---------------------------------------------------------------------------

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "runtime/resolver.hpp"

inline constexpr const char* kDefinitionEntrySymbol = "path_hole_definition";

class SharedObjectResolver final : public Resolver {
public:
    SharedObjectResolver(std::vector<std::filesystem::path> search_path,
                         std::string                        identity = "SharedObjectResolver",
                         std::shared_ptr<Resolver>          parent   = nullptr,
                         RoutineTable&                      table    = RoutineTable::process());

    ~SharedObjectResolver() override;

    [[nodiscard]] const std::vector<std::filesystem::path>& search_path() const noexcept {
        return search_path_;
    }

    // parse_search_path: "a:b::c" → {"a", "b", "c"} (빈 항목 제거)
    [[nodiscard]] static std::vector<std::filesystem::path> parse_search_path(std::string_view text);

protected:
    [[nodiscard]] std::expected<Definition, ResolveError>
    find_definition(std::string_view name) const override;

private:
    [[nodiscard]] std::expected<void*, ResolveError> open_cached(const std::filesystem::path& file) const;

    std::vector<std::filesystem::path>              search_path_;
    mutable std::mutex                              handles_mutex_;
    mutable std::unordered_map<std::string, void*>  handles_;
};
