#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <typeindex>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <vector>

namespace shardb {

// ── CustomStructure ──────────────────────────────────────────────────────────
//
// A user-defined value that can be stored inside an element.  It is persisted
// as its flat field index and rebuilt from it, so only types registered with
// a TypeRegistry can be read back.

struct DataIndexField {
    std::string name;
    std::string value;

    bool operator==(const DataIndexField&) const = default;
};

class CustomStructure {
public:
    virtual ~CustomStructure() = default;

    // Flat list of the fields that make up this value.
    [[nodiscard]] virtual std::vector<DataIndexField> data_index() const = 0;

    // Rebuild this value from a previously produced field index.
    virtual void restore(const std::vector<DataIndexField>& fields) = 0;
};

// ── TypeRegistry ─────────────────────────────────────────────────────────────
//
// Maps structure types to the names they are persisted under.  Owned by a
// Database and passed by reference to wherever elements are encoded, so two
// databases in one process never share registrations.
//
// The names of the built-in persisted records ("so", "sh", "cl", "el") are
// reserved.  Registering a reserved name, or a name already bound to another
// type, throws std::invalid_argument.  Registering the same type under the
// same name again is a no-op.
//
// Thread-safe: lookups take a shared lock, registration an exclusive one.

class TypeRegistry {
public:
    using Factory = std::function<std::unique_ptr<CustomStructure>()>;

    TypeRegistry();

    template <typename T>
    void register_type_name(std::string name) {
        static_assert(std::is_base_of_v<CustomStructure, T>,
                      "registered types must derive from CustomStructure");
        add(std::type_index(typeid(T)), std::move(name),
            [] { return std::make_unique<T>(); });
    }

    // Registers T under its implementation-defined type name.
    template <typename T>
    void register_type() {
        register_type_name<T>(typeid(T).name());
    }

    // Name `value`'s dynamic type is registered under, if any.
    [[nodiscard]] std::optional<std::string> name_of(const CustomStructure& value) const;

    // Default-constructed instance of the type registered as `name`,
    // or nullptr if unknown.
    [[nodiscard]] std::unique_ptr<CustomStructure> make(std::string_view name) const;

    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] static bool is_reserved(std::string_view name);

    // Number of user registrations.
    [[nodiscard]] std::size_t size() const;

private:
    void add(std::type_index type, std::string name, Factory factory);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Factory> factories_;
    std::unordered_map<std::type_index, std::string> names_;
};

} // namespace shardb
