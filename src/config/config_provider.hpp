#pragma once

// ---------------------------------------------------------------------------
// config_provider.hpp
//
// 필터 엔진이 매 호출마다 읽는 두 개의 설정 슬롯에 대한 접근 인터페이스.
//
// [설계 원칙]
// - 엔진은 저장 방식을 가정하지 않는다. 읽기는 저렴해야 하며 외부 writer 와
//   경쟁할 수 있다.
// - 반환값은 복사본. 호출 도중 값이 바뀌어도 이번 호출에는 영향이 없다.
// ---------------------------------------------------------------------------

#include <string>

class PropertyStore;

class GuardConfigProvider {
public:
    virtual ~GuardConfigProvider() = default;

    // filter_spec: 쉼표로 구분된 패턴 토큰 목록. 비어 있으면 필터링 없음.
    [[nodiscard]] virtual std::string filter_spec() const = 0;

    // exemption_spec: 쉼표로 구분된 resolver identity 목록. 비어 있으면 면제 없음.
    [[nodiscard]] virtual std::string exemption_spec() const = 0;
};

// ---------------------------------------------------------------------------
// PropertyConfigProvider
//   PropertyStore 의 path_hole.filter / path_hole.unfiltered.cls 를 읽는다.
//   store 는 provider 보다 오래 살아야 한다 (보통 PropertyStore::process()).
// ---------------------------------------------------------------------------
class PropertyConfigProvider final : public GuardConfigProvider {
public:
    explicit PropertyConfigProvider(const PropertyStore& store);

    [[nodiscard]] std::string filter_spec() const override;
    [[nodiscard]] std::string exemption_spec() const override;

private:
    const PropertyStore& store_;
};
