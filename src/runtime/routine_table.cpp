#include "runtime/routine_table.hpp"

#include "runtime/resolver.hpp"

#include <utility>

#include <spdlog/spdlog.h>

std::string_view routine_name(RoutineId id) noexcept {
    switch (id) {
        case RoutineId::kResolveDefinition: return "Resolver::resolve";
        default:                            return "unknown";
    }
}

RoutineTable::RoutineTable() {
    slots_[static_cast<std::size_t>(RoutineId::kResolveDefinition)].store(
        make_default_resolution_routine());
}

RoutineTable& RoutineTable::process() {
    static RoutineTable table;
    return table;
}

std::shared_ptr<const Routine> RoutineTable::current(RoutineId id) const {
    return slots_[static_cast<std::size_t>(id)].load(std::memory_order_acquire);
}

void RoutineTable::replace(RoutineId id, std::shared_ptr<const Routine> routine) {
    if (!routine) {
        spdlog::warn("routine_table: ignoring null replacement for '{}'", routine_name(id));
        return;
    }
    const auto index = static_cast<std::size_t>(id);
    slots_[index].store(std::move(routine), std::memory_order_release);
    generations_[index].fetch_add(1, std::memory_order_acq_rel);
}

std::uint64_t RoutineTable::generation(RoutineId id) const noexcept {
    return generations_[static_cast<std::size_t>(id)].load(std::memory_order_acquire);
}
