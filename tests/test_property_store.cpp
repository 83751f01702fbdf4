// ---------------------------------------------------------------------------
// test_property_store.cpp
//
// PropertyStore / PropertyConfigProvider 단위 테스트.
// ---------------------------------------------------------------------------

#include "config/config_provider.hpp"
#include "config/property_store.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

TEST(PropertyStoreTest, MissingKeyIsNullopt) {
    PropertyStore store;
    EXPECT_FALSE(store.get(kFilterProperty).has_value());
    EXPECT_EQ(store.get_or(kFilterProperty, "fallback"), "fallback");
}

TEST(PropertyStoreTest, SetOverwritesAndClearRemoves) {
    PropertyStore store;
    store.set(kFilterProperty, "pkg.Foo1");
    EXPECT_EQ(store.get(kFilterProperty), "pkg.Foo1");

    store.set(kFilterProperty, "pkg.Bar1");
    EXPECT_EQ(store.get_or(kFilterProperty, ""), "pkg.Bar1");

    store.clear(kFilterProperty);
    EXPECT_FALSE(store.get(kFilterProperty).has_value());

    // 없는 키 clear 는 무시
    store.clear("path_hole.unknown");
}

TEST(PropertyStoreTest, EmptyValueIsStillPresent) {
    PropertyStore store;
    store.set(kUnfilteredProperty, "");
    ASSERT_TRUE(store.get(kUnfilteredProperty).has_value());
    EXPECT_TRUE(store.get(kUnfilteredProperty)->empty());
}

TEST(PropertyStoreTest, LoadEnvironmentMapsKnownVariables) {
    ASSERT_EQ(setenv("PATH_HOLE_FILTER", "pkg.Foo1,pkg.Bar1", 1), 0);
    ASSERT_EQ(setenv("PATH_HOLE_UNFILTERED_CLS", "TrustedResolver", 1), 0);
    ASSERT_EQ(setenv("PATH_HOLE_LOG_LEVEL", "", 1), 0);  // 빈 값은 무시
    ASSERT_EQ(unsetenv("PATH_HOLE_BUILTIN_ALLOW"), 0);
    ASSERT_EQ(unsetenv("PATH_HOLE_LOG_PATH"), 0);

    PropertyStore store;
    EXPECT_EQ(store.load_environment(), 2u);
    EXPECT_EQ(store.get(kFilterProperty), "pkg.Foo1,pkg.Bar1");
    EXPECT_EQ(store.get(kUnfilteredProperty), "TrustedResolver");
    EXPECT_FALSE(store.get(kLogLevelProperty).has_value());
    EXPECT_FALSE(store.get(kBuiltinAllowProperty).has_value());

    unsetenv("PATH_HOLE_FILTER");
    unsetenv("PATH_HOLE_UNFILTERED_CLS");
    unsetenv("PATH_HOLE_LOG_LEVEL");
}

TEST(PropertyStoreTest, ProcessInstanceIsStable) {
    EXPECT_EQ(&PropertyStore::process(), &PropertyStore::process());
}

TEST(PropertyStoreTest, ConcurrentReadersAndWriter) {
    PropertyStore store;
    store.set(kFilterProperty, "a.B");

    std::thread writer([&store] {
        for (int i = 0; i < 1000; ++i) {
            store.set(kFilterProperty, (i % 2 == 0) ? "a.B,c.D" : "a.B");
        }
    });

    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&store] {
            for (int i = 0; i < 1000; ++i) {
                const auto value = store.get_or(kFilterProperty, "");
                EXPECT_TRUE(value == "a.B" || value == "a.B,c.D") << value;
            }
        });
    }

    writer.join();
    for (auto& th : readers) {
        th.join();
    }
}

TEST(PropertyConfigProviderTest, ReflectsStoreOnEveryRead) {
    PropertyStore store;
    const PropertyConfigProvider provider{store};
    EXPECT_EQ(provider.filter_spec(), "");
    EXPECT_EQ(provider.exemption_spec(), "");

    store.set(kFilterProperty, "pkg.Foo1");
    store.set(kUnfilteredProperty, "TrustedResolver");
    EXPECT_EQ(provider.filter_spec(), "pkg.Foo1");
    EXPECT_EQ(provider.exemption_spec(), "TrustedResolver");
}
