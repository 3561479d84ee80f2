#include "common/errors.hpp"

#include <string>

namespace shardb {

namespace {

class ShardbCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "shardb"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::not_found:               return "not found";
            case Errc::version_incompatible:    return "incompatible database version";
            case Errc::corrupted_collection:    return "corrupted collection";
            case Errc::corrupted_header:        return "corrupted database header";
            case Errc::corrupted_element:       return "corrupted element record";
            case Errc::already_exists:          return "already exists";
            case Errc::empty_registry:          return "database has no collections";
            case Errc::missing_collections_dir: return "collections folder does not exist";
            case Errc::unknown_type:            return "structure type is not registered";
        }
        return "unknown shardb error";
    }
};

} // anonymous namespace

const std::error_category& shardb_category() noexcept {
    static const ShardbCategory category;
    return category;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), shardb_category()};
}

} // namespace shardb
