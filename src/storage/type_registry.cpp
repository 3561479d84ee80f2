#include "storage/type_registry.hpp"

#include <array>
#include <algorithm>
#include <mutex>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace shardb {

namespace {

// ShardOffset, Shard, Collection, Element.
constexpr std::array<std::string_view, 4> kReservedNames{"so", "sh", "cl", "el"};

} // anonymous namespace

TypeRegistry::TypeRegistry() = default;

bool TypeRegistry::is_reserved(std::string_view name) {
    return std::find(kReservedNames.begin(), kReservedNames.end(), name) !=
           kReservedNames.end();
}

void TypeRegistry::add(std::type_index type, std::string name, Factory factory) {
    if (name.empty()) {
        throw std::invalid_argument("type name must not be empty");
    }
    if (is_reserved(name)) {
        throw std::invalid_argument("type name '" + name + "' is reserved");
    }

    std::unique_lock lock(mutex_);
    if (auto it = names_.find(type); it != names_.end()) {
        if (it->second == name) {
            return;  // already registered
        }
        throw std::invalid_argument(
            "type already registered as '" + it->second + "', not '" + name + "'");
    }
    if (factories_.contains(name)) {
        throw std::invalid_argument(
            "type name '" + name + "' is registered for a different type");
    }

    spdlog::debug("TypeRegistry: registered '{}'", name);
    names_.emplace(type, name);
    factories_.emplace(std::move(name), std::move(factory));
}

std::optional<std::string> TypeRegistry::name_of(const CustomStructure& value) const {
    std::shared_lock lock(mutex_);
    auto it = names_.find(std::type_index(typeid(value)));
    if (it == names_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::unique_ptr<CustomStructure> TypeRegistry::make(std::string_view name) const {
    std::shared_lock lock(mutex_);
    auto it = factories_.find(std::string(name));
    if (it == factories_.end()) {
        return nullptr;
    }
    return it->second();
}

bool TypeRegistry::contains(std::string_view name) const {
    std::shared_lock lock(mutex_);
    return factories_.contains(std::string(name));
}

std::size_t TypeRegistry::size() const {
    std::shared_lock lock(mutex_);
    return factories_.size();
}

} // namespace shardb
