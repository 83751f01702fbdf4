// ---------------------------------------------------------------------------
// splicer.cpp
//
// [원자성]
// splice 는 대상 routine 의 instruction 복사본 위에서만 작업한다.
// live slot 은 마지막 redefine() 한 번으로만 바뀌므로 "fragment 는 붙었지만
// 교체는 안 된" 중간 상태는 관측될 수 없다.
// ---------------------------------------------------------------------------

#include "agent/splicer.hpp"

#include "logger/structured_logger.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

const char* install_state_name(InstallState state) noexcept {
    switch (state) {
        case InstallState::kUninstalled: return "uninstalled";
        case InstallState::kInstalling:  return "installing";
        case InstallState::kInstalled:   return "installed";
        case InstallState::kFailed:      return "failed";
        default:                         return "unknown";
    }
}

std::expected<std::vector<Instruction>, std::string>
strip_to_prefix_fragment(std::vector<Instruction> instructions) {
    // 끝의 label 제거 (선택)
    if (!instructions.empty() && instructions.back().kind == InstructionKind::kLabel) {
        instructions.pop_back();
    }
    // return 제거 (인자 없는 종결자이므로 이것만 제거하면 된다)
    if (instructions.empty() || instructions.back().kind != InstructionKind::kReturn) {
        return std::unexpected(std::string{"guard routine does not end with a return"});
    }
    instructions.pop_back();

    for (std::size_t i = 0; i < instructions.size(); ++i) {
        if (instructions[i].kind == InstructionKind::kReturn) {
            return std::unexpected(fmt::format(
                "guard fragment has an early return at index {}", i));
        }
    }
    return instructions;
}

InterceptionSplicer::InterceptionSplicer(std::shared_ptr<const Routine>    guard,
                                         RoutineId                         target,
                                         std::shared_ptr<StructuredLogger> logger)
    : guard_(std::move(guard))
    , target_(target)
    , logger_(std::move(logger)) {}

std::expected<void, InstallError> InterceptionSplicer::install(Instrumentation& instrumentation) {
    InstallState expected_state = InstallState::kUninstalled;
    if (!state_.compare_exchange_strong(expected_state, InstallState::kInstalling,
                                        std::memory_order_acq_rel)) {
        InstallError rejected{
            InstallErrorCode::kAlreadyInstalled,
            fmt::format("path_hole guard install rejected: splicer is already {}",
                        install_state_name(expected_state))
        };
        spdlog::error("splicer: {}", rejected.message);
        if (logger_) {
            logger_->log_install(InstallLog{
                std::string{routine_name(target_)}, "rejected", 0, 0,
                rejected.message, std::chrono::system_clock::now()});
        }
        return std::unexpected(std::move(rejected));
    }

    // splice 중 예외도 kFailed 로 끝나야 한다 (kInstalling 에 머무르지 않음)
    std::expected<void, InstallError> outcome;
    try {
        outcome = splice(instrumentation);
    } catch (const std::exception& e) {
        outcome = std::unexpected(InstallError{
            InstallErrorCode::kRedefinitionFailed,
            fmt::format("splicing '{}' threw: {}", routine_name(target_), e.what())});
    } catch (...) {
        state_.store(InstallState::kFailed, std::memory_order_release);
        report(std::unexpected(InstallError{
                   InstallErrorCode::kRedefinitionFailed,
                   "splicing threw a non-standard exception"}),
               0, 0);
        throw;
    }
    state_.store(outcome.has_value() ? InstallState::kInstalled : InstallState::kFailed,
                 std::memory_order_release);
    report(outcome, spliced_count_, spliced_slots_);
    return outcome;
}

std::expected<void, InstallError> InterceptionSplicer::splice(Instrumentation& instrumentation) {
    const auto target_name = routine_name(target_);

    if (!instrumentation.is_redefinition_supported()) {
        return std::unexpected(InstallError{
            InstallErrorCode::kCapabilityUnavailable,
            fmt::format("routine redefinition is not supported by this runtime; "
                        "cannot guard '{}'. Remove the path_hole agent.", target_name)
        });
    }

    if (!guard_) {
        return std::unexpected(InstallError{
            InstallErrorCode::kSpliceIntegrityFailure, "no guard routine to splice"});
    }

    auto fragment = strip_to_prefix_fragment(guard_->instructions());
    if (!fragment.has_value()) {
        return std::unexpected(InstallError{
            InstallErrorCode::kSpliceIntegrityFailure, std::move(fragment.error())});
    }

    const auto original = instrumentation.routine(target_);
    if (!original) {
        return std::unexpected(InstallError{
            InstallErrorCode::kSpliceIntegrityFailure,
            fmt::format("routine '{}' is not loaded", target_name)});
    }

    // 다른 splicer 가 이미 가드를 넣은 routine 은 다시 건드리지 않는다
    const auto& guard_mnemonic = guard_->instructions().front().mnemonic;
    for (const auto& insn : original->instructions()) {
        if (insn.kind == InstructionKind::kOperation && insn.mnemonic == guard_mnemonic) {
            return std::unexpected(InstallError{
                InstallErrorCode::kAlreadyInstalled,
                fmt::format("routine '{}' already carries guard '{}'", target_name, insn.mnemonic)});
        }
    }

    // fragment 를 원래 본문의 첫 instruction 앞에 삽입
    std::vector<Instruction> spliced = std::move(*fragment);
    spliced.reserve(spliced.size() + original->instructions().size());
    spliced.insert(spliced.end(), original->instructions().begin(), original->instructions().end());

    auto rebuilt = rebuild_routine(original->name(), std::move(spliced));
    if (!rebuilt.has_value()) {
        return std::unexpected(InstallError{
            InstallErrorCode::kSpliceIntegrityFailure,
            fmt::format("rebuilding '{}' failed: {}", target_name, rebuilt.error())});
    }

    spliced_count_ = static_cast<std::uint32_t>(rebuilt->instructions().size());
    spliced_slots_ = rebuilt->max_frame_slots();

    auto redefined = instrumentation.redefine(
        target_, std::make_shared<const Routine>(std::move(*rebuilt)));
    if (!redefined.has_value()) {
        return std::unexpected(InstallError{
            InstallErrorCode::kRedefinitionFailed,
            fmt::format("redefining '{}' failed: {}", target_name, redefined.error())});
    }

    return {};
}

void InterceptionSplicer::report(const std::expected<void, InstallError>& outcome,
                                 std::uint32_t instruction_count,
                                 std::uint32_t frame_slots) const {
    const auto target_name = routine_name(target_);
    if (outcome.has_value()) {
        spdlog::info("splicer: guard installed into '{}' ({} instructions, {} frame slots)",
                     target_name, instruction_count, frame_slots);
    } else {
        spdlog::error("splicer: guard installation into '{}' failed: {}",
                      target_name, outcome.error().message);
    }

    if (logger_) {
        logger_->log_install(InstallLog{
            std::string{target_name},
            outcome.has_value() ? "installed" : "failed",
            instruction_count,
            frame_slots,
            outcome.has_value() ? std::string{} : outcome.error().message,
            std::chrono::system_clock::now()
        });
    }
}
