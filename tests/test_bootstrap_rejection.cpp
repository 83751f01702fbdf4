// ---------------------------------------------------------------------------
// test_bootstrap_rejection.cpp
//
// premain 통합 테스트 (capability 거부 경로).
//
// capability 검사 실패는 프로세스 안에서 종결 상태다. 이후 올바른 핸들로
// 다시 호출해도 가드는 설치되지 않는다. 전역 상태를 쓰므로 별도 실행 파일.
// ---------------------------------------------------------------------------

#include "agent/bootstrap.hpp"
#include "config/property_store.hpp"
#include "runtime/instrumentation.hpp"
#include "runtime/registry_resolver.hpp"
#include "runtime/routine_table.hpp"

#include <gtest/gtest.h>

#include <string>

TEST(BootstrapRejectionTest, UnsupportedRuntimeFailsForGood) {
    EXPECT_EQ(process_install_state(), InstallState::kUninstalled);
    const auto original = RoutineTable::process().current(RoutineId::kResolveDefinition);

    // 1. redefine 미지원 runtime
    TableInstrumentation unsupported{RoutineTable::process(), false};
    try {
        premain(&unsupported);
        FAIL() << "premain should reject a runtime without redefinition support";
    } catch (const BootstrapError& ex) {
        EXPECT_NE(std::string(ex.what()).find("Remove the path_hole agent"), std::string::npos);
    }
    EXPECT_EQ(process_install_state(), InstallState::kFailed);

    // 2. Failed 는 종결: 지원하는 핸들로도 설치되지 않는다
    PropertyStore::process().set(kFilterProperty, "pkg.Foo1");
    TableInstrumentation instrumentation{RoutineTable::process()};
    EXPECT_THROW(premain(&instrumentation), BootstrapError);
    EXPECT_THROW(premain(nullptr), BootstrapError);
    EXPECT_EQ(process_install_state(), InstallState::kFailed);

    // 3. live routine 은 그대로, 필터는 적용되지 않는다
    EXPECT_EQ(RoutineTable::process().current(RoutineId::kResolveDefinition), original);
    RegistryResolver resolver{"AppResolver", nullptr, RoutineTable::process()};
    resolver.define("pkg.Foo1");
    EXPECT_TRUE(resolver.resolve("pkg.Foo1").has_value());
}

TEST(BootstrapRejectionTest, MissingHandleIsReported) {
    // 핸들 없음도 종결 실패
    try {
        premain(nullptr);
        FAIL() << "premain should reject a null handle";
    } catch (const BootstrapError& ex) {
        EXPECT_NE(std::string(ex.what()).find("path_hole: "), std::string::npos);
    }
    EXPECT_EQ(process_install_state(), InstallState::kFailed);
}
