#include "runtime/instrumentation.hpp"

#include <utility>

#include <fmt/format.h>

TableInstrumentation::TableInstrumentation(RoutineTable& table, bool redefinition_supported)
    : table_(table)
    , redefinition_supported_(redefinition_supported) {}

bool TableInstrumentation::is_redefinition_supported() const noexcept {
    return redefinition_supported_;
}

std::shared_ptr<const Routine> TableInstrumentation::routine(RoutineId id) const {
    return table_.current(id);
}

std::expected<void, std::string>
TableInstrumentation::redefine(RoutineId id, std::shared_ptr<const Routine> routine) {
    if (!redefinition_supported_) {
        return std::unexpected(fmt::format(
            "redefinition of '{}' is not supported by this runtime", routine_name(id)));
    }
    if (!routine) {
        return std::unexpected(fmt::format(
            "redefinition of '{}' rejected: null routine", routine_name(id)));
    }
    table_.replace(id, std::move(routine));
    return {};
}
