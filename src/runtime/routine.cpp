// ---------------------------------------------------------------------------
// routine.cpp
// ---------------------------------------------------------------------------

#include "runtime/routine.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

#include <fmt/format.h>

Instruction Instruction::operation(std::string mnemonic, InstructionBody body, std::uint32_t frame_slots) {
    return Instruction{InstructionKind::kOperation, std::move(mnemonic), std::move(body), frame_slots};
}

Instruction Instruction::label(std::string name) {
    return Instruction{InstructionKind::kLabel, std::move(name), {}, 0};
}

Instruction Instruction::ret() {
    return Instruction{InstructionKind::kReturn, "return", {}, 0};
}

Routine::Routine(std::string name, std::vector<Instruction> instructions, std::uint32_t max_frame_slots)
    : name_(std::move(name))
    , instructions_(std::move(instructions))
    , max_frame_slots_(max_frame_slots) {}

std::expected<Definition, ResolveError> Routine::execute(ResolutionFrame& frame) const {
    for (const auto& insn : instructions_) {
        switch (insn.kind) {
            case InstructionKind::kLabel:
                continue;
            case InstructionKind::kOperation:
                if (insn.body(frame) == StepOutcome::kExit) {
                    break;
                }
                continue;
            case InstructionKind::kReturn:
                break;
        }
        // kExit 또는 kReturn
        if (!frame.result.has_value()) {
            return std::unexpected(ResolveError{
                ResolveErrorCode::kInternalError,
                std::string{frame.name},
                fmt::format("routine '{}' finished at '{}' without a result", name_, insn.mnemonic)
            });
        }
        return std::move(*frame.result);
    }

    // rebuild_routine 이 마지막 kReturn 을 보장하므로 도달하지 않는다
    return std::unexpected(ResolveError{
        ResolveErrorCode::kInternalError,
        std::string{frame.name},
        fmt::format("routine '{}' has no terminating return", name_)
    });
}

std::expected<Routine, std::string>
rebuild_routine(std::string name, std::vector<Instruction> instructions) {
    if (instructions.empty()) {
        return std::unexpected(fmt::format("routine '{}': empty instruction list", name));
    }
    if (instructions.back().kind != InstructionKind::kReturn) {
        return std::unexpected(fmt::format(
            "routine '{}': last instruction '{}' is not a return",
            name, instructions.back().mnemonic));
    }

    std::unordered_set<std::string> labels;
    std::uint32_t max_slots = 0;

    for (std::size_t i = 0; i < instructions.size(); ++i) {
        const auto& insn = instructions[i];
        switch (insn.kind) {
            case InstructionKind::kReturn:
                if (i + 1 != instructions.size()) {
                    return std::unexpected(fmt::format(
                        "routine '{}': return at index {} would cut off {} trailing instruction(s)",
                        name, i, instructions.size() - i - 1));
                }
                break;
            case InstructionKind::kLabel:
                if (!labels.insert(insn.mnemonic).second) {
                    return std::unexpected(fmt::format(
                        "routine '{}': duplicate label '{}'", name, insn.mnemonic));
                }
                break;
            case InstructionKind::kOperation:
                if (!insn.body) {
                    return std::unexpected(fmt::format(
                        "routine '{}': operation '{}' at index {} has no body",
                        name, insn.mnemonic, i));
                }
                break;
        }
        max_slots = std::max(max_slots, insn.frame_slots);
    }

    return Routine{std::move(name), std::move(instructions), max_slots};
}
