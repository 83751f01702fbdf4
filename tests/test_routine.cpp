// ---------------------------------------------------------------------------
// test_routine.cpp
//
// Routine / rebuild_routine / RoutineTable / TableInstrumentation 단위 테스트.
// ---------------------------------------------------------------------------

#include "runtime/instrumentation.hpp"
#include "runtime/registry_resolver.hpp"
#include "runtime/routine.hpp"
#include "runtime/routine_table.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace {

Instruction set_found(std::string origin) {
    return Instruction::operation(
        "set-found",
        [origin = std::move(origin)](ResolutionFrame& frame) {
            frame.result = Definition{std::string{frame.name}, origin, nullptr};
            return StepOutcome::kNext;
        });
}

Instruction noop(std::uint32_t slots = 1) {
    return Instruction::operation(
        "noop", [](ResolutionFrame&) { return StepOutcome::kNext; }, slots);
}

}  // namespace

// ---------------------------------------------------------------------------
// rebuild_routine 구조 검증
// ---------------------------------------------------------------------------
TEST(RebuildRoutineTest, AcceptsWellFormedBody) {
    std::vector<Instruction> body;
    body.push_back(noop(3));
    body.push_back(Instruction::label("mid"));
    body.push_back(set_found("test"));
    body.push_back(Instruction::ret());

    auto routine = rebuild_routine("r", std::move(body));
    ASSERT_TRUE(routine.has_value()) << routine.error();
    EXPECT_EQ(routine->name(), "r");
    EXPECT_EQ(routine->instructions().size(), 4u);
    EXPECT_EQ(routine->max_frame_slots(), 3u);
}

TEST(RebuildRoutineTest, RejectsEmptyBody) {
    EXPECT_FALSE(rebuild_routine("r", {}).has_value());
}

TEST(RebuildRoutineTest, RejectsMissingTrailingReturn) {
    std::vector<Instruction> body;
    body.push_back(noop());
    auto routine = rebuild_routine("r", std::move(body));
    ASSERT_FALSE(routine.has_value());
    EXPECT_NE(routine.error().find("not a return"), std::string::npos);
}

TEST(RebuildRoutineTest, RejectsEarlyReturn) {
    std::vector<Instruction> body;
    body.push_back(Instruction::ret());
    body.push_back(noop());
    body.push_back(Instruction::ret());
    auto routine = rebuild_routine("r", std::move(body));
    ASSERT_FALSE(routine.has_value());
    EXPECT_NE(routine.error().find("index 0"), std::string::npos);
}

TEST(RebuildRoutineTest, RejectsDuplicateLabels) {
    std::vector<Instruction> body;
    body.push_back(Instruction::label("x"));
    body.push_back(Instruction::label("x"));
    body.push_back(Instruction::ret());
    EXPECT_FALSE(rebuild_routine("r", std::move(body)).has_value());
}

TEST(RebuildRoutineTest, RejectsOperationWithoutBody) {
    std::vector<Instruction> body;
    body.push_back(Instruction::operation("empty", InstructionBody{}));
    body.push_back(Instruction::ret());
    EXPECT_FALSE(rebuild_routine("r", std::move(body)).has_value());
}

// ---------------------------------------------------------------------------
// execute
// ---------------------------------------------------------------------------
TEST(RoutineExecuteTest, RunsUntilReturn) {
    RoutineTable     table;
    RegistryResolver resolver{"R", nullptr, table};

    std::vector<Instruction> body;
    body.push_back(noop());
    body.push_back(set_found("first"));
    body.push_back(Instruction::ret());
    auto routine = rebuild_routine("r", std::move(body));
    ASSERT_TRUE(routine.has_value());

    ResolutionFrame frame{resolver, "pkg.Foo1"};
    const auto result = routine->execute(frame);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->name, "pkg.Foo1");
    EXPECT_EQ(result->origin, "first");
}

TEST(RoutineExecuteTest, ExitStopsEarly) {
    RoutineTable     table;
    RegistryResolver resolver{"R", nullptr, table};

    std::vector<Instruction> body;
    body.push_back(Instruction::operation("deny", [](ResolutionFrame& frame) {
        frame.result = std::unexpected(make_not_found(frame.name));
        return StepOutcome::kExit;
    }));
    body.push_back(set_found("never"));
    body.push_back(Instruction::ret());
    auto routine = rebuild_routine("r", std::move(body));
    ASSERT_TRUE(routine.has_value());

    ResolutionFrame frame{resolver, "pkg.Foo1"};
    const auto result = routine->execute(frame);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ResolveErrorCode::kNotFound);
    EXPECT_EQ(result.error().detail, "pkg/Foo1");
}

TEST(RoutineExecuteTest, MissingResultIsInternalError) {
    RoutineTable     table;
    RegistryResolver resolver{"R", nullptr, table};

    std::vector<Instruction> body;
    body.push_back(noop());
    body.push_back(Instruction::ret());
    auto routine = rebuild_routine("r", std::move(body));
    ASSERT_TRUE(routine.has_value());

    ResolutionFrame frame{resolver, "pkg.Foo1"};
    const auto result = routine->execute(frame);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ResolveErrorCode::kInternalError);
}

// ---------------------------------------------------------------------------
// RoutineTable / TableInstrumentation
// ---------------------------------------------------------------------------
TEST(RoutineTableTest, StartsWithDefaultResolutionRoutine) {
    RoutineTable table;
    const auto routine = table.current(RoutineId::kResolveDefinition);
    ASSERT_NE(routine, nullptr);
    EXPECT_EQ(routine->name(), "Resolver::resolve");
    ASSERT_EQ(routine->instructions().size(), 2u);
    EXPECT_EQ(routine->instructions().front().mnemonic, "resolve-default");
    EXPECT_EQ(routine->instructions().back().kind, InstructionKind::kReturn);
    EXPECT_EQ(table.generation(RoutineId::kResolveDefinition), 0u);
}

TEST(RoutineTableTest, ReplaceSwapsAndCountsGenerations) {
    RoutineTable table;
    std::vector<Instruction> body;
    body.push_back(set_found("replaced"));
    body.push_back(Instruction::ret());
    auto routine = rebuild_routine("Resolver::resolve", std::move(body));
    ASSERT_TRUE(routine.has_value());

    table.replace(RoutineId::kResolveDefinition, std::make_shared<const Routine>(std::move(*routine)));
    EXPECT_EQ(table.generation(RoutineId::kResolveDefinition), 1u);

    RegistryResolver resolver{"R", nullptr, table};
    const auto found = resolver.resolve("anything");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->origin, "replaced");

    // nullptr 교체는 무시
    table.replace(RoutineId::kResolveDefinition, nullptr);
    EXPECT_EQ(table.generation(RoutineId::kResolveDefinition), 1u);
    EXPECT_NE(table.current(RoutineId::kResolveDefinition), nullptr);
}

TEST(TableInstrumentationTest, RedefineRespectsCapability) {
    RoutineTable table;
    const auto original = table.current(RoutineId::kResolveDefinition);

    TableInstrumentation unsupported{table, false};
    EXPECT_FALSE(unsupported.is_redefinition_supported());
    EXPECT_FALSE(unsupported.redefine(RoutineId::kResolveDefinition, original).has_value());

    TableInstrumentation supported{table};
    EXPECT_TRUE(supported.is_redefinition_supported());
    EXPECT_FALSE(supported.redefine(RoutineId::kResolveDefinition, nullptr).has_value());
    EXPECT_TRUE(supported.redefine(RoutineId::kResolveDefinition, original).has_value());
    EXPECT_EQ(supported.routine(RoutineId::kResolveDefinition), original);
    EXPECT_EQ(table.generation(RoutineId::kResolveDefinition), 1u);
}
