#include "storage/collection.hpp"

#include "common/errors.hpp"
#include "persistence/package.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace shardb {

// ── CollectionDescriptor ─────────────────────────────────────────────────────

Json::Value CollectionDescriptor::to_json() const {
    Json::Value json(Json::objectValue);
    json["name"]        = name;
    json["path"]        = path;
    json["objects"]     = Json::Value(static_cast<Json::UInt64>(objects));
    json["shard_count"] = Json::Value(static_cast<Json::UInt>(shard_count));
    return json;
}

std::error_code CollectionDescriptor::from_json(const Json::Value& json,
                                                CollectionDescriptor& out) {
    if (!json.isObject() ||
        !json["name"].isString() ||
        !json["path"].isString() ||
        !json["objects"].isUInt64() ||
        !json["shard_count"].isUInt()) {
        return make_error_code(Errc::corrupted_collection);
    }
    out.name        = json["name"].asString();
    out.path        = json["path"].asString();
    out.objects     = json["objects"].asUInt64();
    out.shard_count = json["shard_count"].asUInt();
    return {};
}

// ── Collection ───────────────────────────────────────────────────────────────

Collection::Collection(std::string name,
                       std::string path,
                       std::unique_ptr<ConcurrentMap> map,
                       std::unique_ptr<CollectionCache> cache)
    : name_{std::move(name)}
    , path_{std::move(path)}
    , map_{std::move(map)}
    , cache_{std::move(cache)}
{
    if (!map_ || !cache_) {
        throw std::invalid_argument("Collection '" + name_ + "' needs a map and a cache");
    }
}

Collection::Collection(const CollectionDescriptor& descriptor,
                       std::unique_ptr<ConcurrentMap> map,
                       std::unique_ptr<CollectionCache> cache)
    : Collection(descriptor.name, descriptor.path, std::move(map), std::move(cache))
{}

std::string Collection::descriptor_filename(const std::string& name) {
    return name + ".json.gzip";
}

std::error_code Collection::load_descriptor(const std::filesystem::path& file,
                                            CollectionDescriptor& out) {
    Json::Value json;
    if (auto ec = persistence::load_json(file, json, /*compressed=*/true)) {
        spdlog::error("Collection: descriptor {} unreadable: {}",
                      file.string(), ec.message());
        return make_error_code(Errc::corrupted_collection);
    }
    return CollectionDescriptor::from_json(json, out);
}

CollectionDescriptor Collection::descriptor() const {
    return CollectionDescriptor{name_, path_, size(), static_cast<uint32_t>(kShardCount)};
}

std::error_code Collection::save_descriptor() const {
    return persistence::save_json(storage_path() / descriptor_filename(name_),
                                  descriptor().to_json(), /*compressed=*/true);
}

// ── Elements ─────────────────────────────────────────────────────────────────

std::error_code Collection::set(std::string_view key, std::string_view value) {
    pb::Element element;
    element.set_key(std::string(key));
    element.set_value(std::string(value));

    // Invalidate after the write: erase() advances the cache generation, so
    // a reader that fetched the previous value cannot fill it back in.
    auto ec = map_->put(element);
    cache_->erase(key);
    return ec;
}

std::error_code Collection::add(std::string_view value, uint64_t& id) {
    const uint64_t next = map_->next_id();

    pb::Element element;
    element.set_key(std::to_string(next));
    element.set_id(next);
    element.set_value(std::string(value));

    // The generated key may collide with one written through set().
    auto ec = map_->put(element);
    cache_->erase(element.key());
    if (ec) {
        return ec;
    }
    id = next;
    return {};
}

std::error_code Collection::get(std::string_view key, std::string& value) const {
    const uint64_t generation = cache_->generation();
    if (auto cached = cache_->get(key)) {
        value = std::move(*cached);
        return {};
    }

    pb::Element element;
    if (auto ec = map_->get(key, element)) {
        return ec;
    }
    value = element.value();
    cache_->fill(std::string(key), value, generation);
    return {};
}

std::error_code Collection::put_structure(std::string_view key,
                                          const CustomStructure& value,
                                          const TypeRegistry& registry) {
    auto type_name = registry.name_of(value);
    if (!type_name) {
        return make_error_code(Errc::unknown_type);
    }

    pb::Element element;
    element.set_key(std::string(key));
    element.set_type_name(*type_name);
    for (const auto& field : value.data_index()) {
        auto* f = element.add_fields();
        f->set_name(field.name);
        f->set_value(field.value);
    }

    auto ec = map_->put(element);
    cache_->erase(key);
    return ec;
}

std::error_code Collection::get_structure(std::string_view key,
                                          const TypeRegistry& registry,
                                          std::unique_ptr<CustomStructure>& out) const {
    pb::Element element;
    if (auto ec = map_->get(key, element)) {
        return ec;
    }

    auto value = registry.make(element.type_name());
    if (!value) {
        spdlog::warn("Collection {}: '{}' holds unregistered type '{}'",
                     name_, key, element.type_name());
        return make_error_code(Errc::unknown_type);
    }

    std::vector<DataIndexField> fields;
    fields.reserve(static_cast<std::size_t>(element.fields_size()));
    for (const auto& f : element.fields()) {
        fields.push_back(DataIndexField{f.name(), f.value()});
    }
    value->restore(fields);
    out = std::move(value);
    return {};
}

bool Collection::del(std::string_view key) {
    const bool existed = map_->erase(key);
    cache_->erase(key);
    return existed;
}

bool Collection::contains(std::string_view key) const {
    return map_->contains(key);
}

std::vector<std::string> Collection::keys() const {
    return map_->keys();
}

std::size_t Collection::size() const {
    return map_->size();
}

// ── Persistence ──────────────────────────────────────────────────────────────

std::error_code Collection::sync() {
    if (auto ec = map_->sync()) {
        spdlog::error("Collection {}: map sync failed: {}", name_, ec.message());
        return ec;
    }
    if (auto ec = save_descriptor()) {
        spdlog::error("Collection {}: descriptor save failed: {}", name_, ec.message());
        return ec;
    }
    spdlog::debug("Collection {}: synced {} elements", name_, size());
    return {};
}

std::error_code Collection::optimize(uint64_t& reclaimed) {
    reclaimed = 0;
    if (auto ec = map_->optimize(reclaimed)) {
        spdlog::error("Collection {}: optimize failed: {}", name_, ec.message());
        return ec;
    }
    spdlog::info("Collection {}: optimize reclaimed {} bytes", name_, reclaimed);
    return {};
}

} // namespace shardb
