#include "agent/guard_fragment.hpp"

#include "filter/filter_engine.hpp"
#include "logger/structured_logger.hpp"
#include "runtime/resolver.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

std::shared_ptr<const Routine>
make_guard_routine(std::shared_ptr<const FilterEngine> engine,
                   std::shared_ptr<StructuredLogger>   logger) {
    if (!engine) {
        throw std::invalid_argument("make_guard_routine: engine must not be null");
    }

    std::vector<Instruction> body;
    body.push_back(Instruction::operation(
        kGuardMnemonic,
        [engine = std::move(engine), logger = std::move(logger)](ResolutionFrame& frame) {
            const auto& caller = frame.resolver.identity();
            auto result = engine->evaluate(frame.name, caller);
            if (result.decision == FilterDecision::kAllow) {
                return StepOutcome::kNext;
            }

            spdlog::debug("path_hole: denied '{}' for resolver '{}' ({})",
                          frame.name, caller, result.reason);
            if (logger) {
                logger->log_denial(DenialLog{
                    std::string{frame.name},
                    caller,
                    std::move(result.matched_rule),
                    std::move(result.reason),
                    std::chrono::system_clock::now()
                });
            }

            frame.result = std::unexpected(make_not_found(frame.name));
            return StepOutcome::kExit;
        },
        1));
    body.push_back(Instruction::label(kGuardEndLabel));
    body.push_back(Instruction::ret());

    auto routine = rebuild_routine(kGuardMnemonic, std::move(body));
    if (!routine.has_value()) {
        throw std::logic_error(fmt::format("guard routine is invalid: {}", routine.error()));
    }
    return std::make_shared<const Routine>(std::move(*routine));
}
