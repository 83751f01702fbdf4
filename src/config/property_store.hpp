#pragma once

// ---------------------------------------------------------------------------
// property_store.hpp
//
// 프로세스 전역 key/value 설정 저장소.
// path_hole.filter / path_hole.unfiltered.cls 등 가드 설정이 여기에 있다.
//
// [동시성]
// - get/set/clear 는 std::shared_mutex 로 보호되어 동시 호출 안전.
// - 가드는 매 호출마다 값을 복사해서 읽는다. 외부 writer 와 경쟁해도
//   crash 는 없으며, 읽는 시점의 값(이전 값 또는 새 값)을 관측한다.
//   여러 키에 걸친 트랜잭션 보장은 제공하지 않는다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// 설정 키 상수
// ---------------------------------------------------------------------------
inline constexpr std::string_view kFilterProperty       = "path_hole.filter";
inline constexpr std::string_view kUnfilteredProperty   = "path_hole.unfiltered.cls";
inline constexpr std::string_view kBuiltinAllowProperty = "path_hole.builtin_allow";
inline constexpr std::string_view kLogLevelProperty     = "path_hole.log_level";
inline constexpr std::string_view kLogPathProperty      = "path_hole.log_path";

class PropertyStore {
public:
    PropertyStore()  = default;
    ~PropertyStore() = default;

    // 복사/이동 금지 (mutex 보유)
    PropertyStore(const PropertyStore&)            = delete;
    PropertyStore& operator=(const PropertyStore&) = delete;
    PropertyStore(PropertyStore&&)                 = delete;
    PropertyStore& operator=(PropertyStore&&)      = delete;

    // process
    //   프로세스 전역 인스턴스. 가드 코드가 참조하는 안정적인 전역 접근점.
    [[nodiscard]] static PropertyStore& process();

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;
    [[nodiscard]] std::string get_or(std::string_view key, std::string_view fallback) const;

    void set(std::string_view key, std::string_view value);
    void clear(std::string_view key);

    // load_environment
    //   PATH_HOLE_* 환경변수를 대응하는 path_hole.* 키로 복사한다.
    //   빈 환경변수는 무시한다. 반환값: 적용된 키 개수.
    std::size_t load_environment();

private:
    mutable std::shared_mutex                     mutex_;
    std::map<std::string, std::string, std::less<>> values_;
};
