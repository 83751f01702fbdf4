#pragma once

// ---------------------------------------------------------------------------
// registry_resolver.hpp
//
// 메모리 내 이름 → 정의 테이블 기반 resolver.
// define/undefine 은 해석과 동시에 호출해도 안전하다 (shared_mutex).
// ---------------------------------------------------------------------------

#include <functional>
#include <map>
#include <shared_mutex>
#include <string>
#include <string_view>

#include "runtime/resolver.hpp"

class RegistryResolver final : public Resolver {
public:
    explicit RegistryResolver(std::string               identity = "RegistryResolver",
                              std::shared_ptr<Resolver> parent   = nullptr,
                              RoutineTable&             table    = RoutineTable::process());

    // define: 같은 이름이 이미 있으면 교체한다
    void define(std::string_view name, const void* address = nullptr);
    bool undefine(std::string_view name);
    [[nodiscard]] bool contains(std::string_view name) const;

protected:
    [[nodiscard]] std::expected<Definition, ResolveError>
    find_definition(std::string_view name) const override;

private:
    mutable std::shared_mutex                           mutex_;
    std::map<std::string, const void*, std::less<>>     definitions_;
};
