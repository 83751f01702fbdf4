#include "config/config_provider.hpp"

#include "config/property_store.hpp"

PropertyConfigProvider::PropertyConfigProvider(const PropertyStore& store)
    : store_(store) {}

std::string PropertyConfigProvider::filter_spec() const {
    return store_.get_or(kFilterProperty, "");
}

std::string PropertyConfigProvider::exemption_spec() const {
    return store_.get_or(kUnfilteredProperty, "");
}
