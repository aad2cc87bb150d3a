#include "tether/serializer.hpp"
#include "tether/reflection.hpp"
#include "tether/record.hpp"
#include "tether/collection_proxy.hpp"
#include <algorithm>

namespace tether {

namespace {

bool listed(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

bool emits(const serialize_options& options, const std::string& name) {
    if (!options.only.empty() && !listed(options.only, name)) return false;
    return !listed(options.except, name);
}

} // namespace

nlohmann::json serializer::serialize(record& r, const serialize_options& options) {
    nlohmann::json out = nlohmann::json::object();

    if (emits(options, "id")) {
        out["id"] = detail::to_json_value(r.get("id"));
    }
    for (const auto& col : r.type().columns()) {
        if (emits(options, col.name)) {
            out[col.name] = detail::to_json_value(r.get(col.name));
        }
    }

    for (const auto& [name, reader] : r.type().readers()) {
        if (!emits(options, name)) continue;
        if (!options.include_associations && r.type().reflect_on_association(name)) continue;
        out[name] = reader(r);
    }
    return out;
}

nlohmann::json serializer::serialize(const std::vector<record_ptr>& records, const serialize_options& options) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& r : records) {
        out.push_back(serialize(*r, options));
    }
    return out;
}

// ============================================================================
// serializer_registry
// ============================================================================

serializer_registry& serializer_registry::instance() {
    static serializer_registry registry;
    return registry;
}

void serializer_registry::register_record_serializer(const std::string& name, record_serializer_t fn) {
    records_[name] = std::move(fn);
}

void serializer_registry::register_collection_serializer(const std::string& name, collection_serializer_t fn) {
    collections_[name] = std::move(fn);
}

const record_serializer_t& serializer_registry::record_serializer(const std::string& name) const {
    auto it = records_.find(name);
    if (it == records_.end()) {
        throw configuration_error("no serializer registered as '" + name + "'");
    }
    return it->second;
}

const collection_serializer_t& serializer_registry::collection_serializer(const std::string& name) const {
    auto it = collections_.find(name);
    if (it == collections_.end()) {
        throw configuration_error("no collection serializer registered as '" + name + "'");
    }
    return it->second;
}

// ============================================================================
// Default relationship reader
// ============================================================================

reader_t make_association_reader(std::shared_ptr<const reflection> refl) {
    return [refl](record& owner) -> nlohmann::json {
        if (const auto* fixed = refl->virtual_value()) {
            return *fixed;
        }

        serialize_options nested;
        nested.only = refl->only();
        nested.except = refl->except();
        nested.include_associations = false;

        auto& registry = serializer_registry::instance();

        if (refl->is_collection()) {
            auto members = owner.many(refl->name());
            if (refl->embeds_ids()) {
                nlohmann::json ids = nlohmann::json::array();
                for (const auto& id : members.ids()) {
                    ids.push_back(detail::to_json_value(id));
                }
                return ids;
            }
            if (auto name = refl->serializer()) {
                return registry.collection_serializer(*name)(members.load_target());
            }
            nlohmann::json out = nlohmann::json::array();
            if (auto each = refl->each_serializer()) {
                const auto& fn = registry.record_serializer(*each);
                for (const auto& m : members) out.push_back(fn(*m));
                return out;
            }
            for (const auto& m : members) out.push_back(serializer::serialize(*m, nested));
            return out;
        }

        if (refl->embeds_ids()) {
            return detail::to_json_value(owner.get(refl->foreign_key()));
        }
        auto target = owner.one(refl->name());
        if (!target) return nullptr;
        if (auto name = refl->serializer()) {
            return registry.record_serializer(*name)(*target);
        }
        return serializer::serialize(*target, nested);
    };
}

} // namespace tether
