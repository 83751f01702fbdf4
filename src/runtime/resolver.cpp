#include "runtime/resolver.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

Resolver::Resolver(std::string identity, std::shared_ptr<Resolver> parent, RoutineTable& table)
    : identity_(std::move(identity))
    , parent_(std::move(parent))
    , table_(table) {}

std::expected<Definition, ResolveError> Resolver::resolve(std::string_view name) const {
    const auto routine = table_.current(RoutineId::kResolveDefinition);
    ResolutionFrame frame{*this, name};
    return routine->execute(frame);
}

std::expected<Definition, ResolveError> Resolver::resolve_default(std::string_view name) const {
    if (parent_) {
        auto delegated = parent_->resolve(name);
        if (delegated.has_value() || delegated.error().code != ResolveErrorCode::kNotFound) {
            return delegated;
        }
    }
    return find_definition(name);
}

std::shared_ptr<const Routine> make_default_resolution_routine() {
    std::vector<Instruction> body;
    body.push_back(Instruction::operation(
        "resolve-default",
        [](ResolutionFrame& frame) {
            frame.result = frame.resolver.resolve_default(frame.name);
            return StepOutcome::kNext;
        },
        2));
    body.push_back(Instruction::ret());

    auto routine = rebuild_routine(std::string{routine_name(RoutineId::kResolveDefinition)},
                                   std::move(body));
    if (!routine.has_value()) {
        // 고정된 본문이므로 실패는 프로그래밍 오류
        throw std::logic_error(fmt::format("default resolution routine is invalid: {}", routine.error()));
    }
    return std::make_shared<const Routine>(std::move(*routine));
}
