#include "runtime/registry_resolver.hpp"

#include <mutex>
#include <utility>

RegistryResolver::RegistryResolver(std::string identity, std::shared_ptr<Resolver> parent, RoutineTable& table)
    : Resolver(std::move(identity), std::move(parent), table) {}

void RegistryResolver::define(std::string_view name, const void* address) {
    const std::unique_lock lock(mutex_);
    definitions_.insert_or_assign(std::string{name}, address);
}

bool RegistryResolver::undefine(std::string_view name) {
    const std::unique_lock lock(mutex_);
    const auto it = definitions_.find(name);
    if (it == definitions_.end()) {
        return false;
    }
    definitions_.erase(it);
    return true;
}

bool RegistryResolver::contains(std::string_view name) const {
    const std::shared_lock lock(mutex_);
    return definitions_.find(name) != definitions_.end();
}

std::expected<Definition, ResolveError> RegistryResolver::find_definition(std::string_view name) const {
    const std::shared_lock lock(mutex_);
    const auto it = definitions_.find(name);
    if (it == definitions_.end()) {
        return std::unexpected(make_not_found(name));
    }
    return Definition{it->first, identity(), it->second};
}
