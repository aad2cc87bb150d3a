#include "tether/builder.hpp"
#include "tether/accessor.hpp"
#include "tether/collection_proxy.hpp"
#include "tether/serializer.hpp"
#include "tether/log.hpp"
#include <algorithm>
#include <cctype>

namespace tether {

namespace {

class collection_accessor final : public relationship_accessor {
public:
    explicit collection_accessor(std::shared_ptr<const reflection> refl) : reflection_(std::move(refl)) {}

    const std::shared_ptr<const reflection>& metadata() const override { return reflection_; }

    collection_proxy read_many(record& owner, bool force_reload) const override {
        return has_many_association(owner.shared_from_this(), reflection_).reader(force_reload);
    }

    void write_many(record& owner, const std::vector<record_ptr>& records) const override {
        has_many_association(owner.shared_from_this(), reflection_).writer(records);
    }

    record_ptr read_one(record&, bool) const override {
        throw configuration_error("'" + reflection_->name() + "' is a collection; use many()");
    }

    void write_one(record&, record_ptr) const override {
        throw configuration_error("'" + reflection_->name() + "' is a collection; use assign_many()");
    }

private:
    std::shared_ptr<const reflection> reflection_;
};

class singular_accessor final : public relationship_accessor {
public:
    explicit singular_accessor(std::shared_ptr<const reflection> refl) : reflection_(std::move(refl)) {}

    const std::shared_ptr<const reflection>& metadata() const override { return reflection_; }

    collection_proxy read_many(record&, bool) const override {
        throw configuration_error("'" + reflection_->name() + "' is a single relationship; use one()");
    }

    void write_many(record&, const std::vector<record_ptr>&) const override {
        throw configuration_error("'" + reflection_->name() + "' is a single relationship; use assign_one()");
    }

    record_ptr read_one(record& owner, bool force_reload) const override {
        return belongs_to_association(owner.shared_from_this(), reflection_).reader(force_reload);
    }

    void write_one(record& owner, record_ptr target) const override {
        belongs_to_association(owner.shared_from_this(), reflection_).writer(std::move(target));
    }

private:
    std::shared_ptr<const reflection> reflection_;
};

void require_string(const std::string& relationship, const nlohmann::json& options, const char* key) {
    auto it = options.find(key);
    if (it != options.end() && !it->is_string()) {
        throw configuration_error(std::string(key) + " on " + relationship + " must be a string");
    }
}

} // namespace

void builder::validate_name(const std::string& name) {
    bool valid = !name.empty() &&
                 (std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '_') &&
                 std::all_of(name.begin(), name.end(), [](char c) {
                     return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
                 });
    if (!valid) {
        throw configuration_error("relationship name '" + name + "' is not a plain identifier");
    }
}

void builder::validate_options(association_kind kind, const std::string& name, const nlohmann::json& options) {
    if (options.is_null()) return;
    if (!options.is_object()) {
        throw configuration_error("options for " + name + " must be an object");
    }

    const auto& allowed = reflection::valid_options(kind);
    for (const auto& [key, value] : options.items()) {
        if (std::find(allowed.begin(), allowed.end(), key) == allowed.end()) {
            throw configuration_error("Unknown key: " + key + " on " + name);
        }
    }

    for (const char* key : {"className", "foreignKey", "primaryKey", "inverseOf", "serializer", "eachSerializer"}) {
        require_string(name, options, key);
    }

    if (auto it = options.find("embed"); it != options.end()) {
        if (!it->is_string() || (*it != "ids" && *it != "objects")) {
            throw configuration_error("embed on " + name + " must be \"ids\" or \"objects\"");
        }
    }

    for (const char* key : {"only", "except"}) {
        auto it = options.find(key);
        if (it == options.end() || it->is_string()) continue;
        bool strings = it->is_array() &&
                       std::all_of(it->begin(), it->end(), [](const nlohmann::json& v) { return v.is_string(); });
        if (!strings) {
            throw configuration_error(std::string(key) + " on " + name + " must be a string or a list of strings");
        }
    }

    if (auto it = options.find("dependent"); it != options.end()) {
        if (!it->is_string() || !parse_dependent_policy(it->get<std::string>())) {
            throw configuration_error("dependent on " + name + " must be one of destroy, delete_all, "
                                      "nullify, restrict_with_exception, restrict_with_error");
        }
    }
}

std::shared_ptr<const reflection> builder::build(association_kind kind,
                                                 const std::shared_ptr<entity_type>& owner,
                                                 const std::string& name,
                                                 const nlohmann::json& options) {
    validate_name(name);
    validate_options(kind, name, options);

    std::string class_name = detail::classify(name);
    if (options.is_object() && options.contains("className")) {
        class_name = options["className"].get<std::string>();
    }
    // An inverse on an already registered type is checked now; otherwise on first use
    if (options.is_object() && options.contains("inverseOf")) {
        auto inverse_name = options["inverseOf"].get<std::string>();
        auto related = type_registry::instance().find(class_name);
        if (related && !related->reflect_on_association(inverse_name)) {
            throw configuration_error("inverseOf '" + inverse_name + "' on " + name +
                                      " does not name a relationship of " + class_name);
        }
    }

    // The related type may be defined after this declaration
    auto refl = std::make_shared<const reflection>(kind, name, options, owner.get(),
                                                   [class_name] { return type_registry::instance().get(class_name); });

    owner->add_reflection(refl);

    if (kind == association_kind::to_many) {
        owner->set_accessor(name, std::make_shared<collection_accessor>(refl));
    } else {
        owner->set_accessor(name, std::make_shared<singular_accessor>(refl));
    }

    if (!owner->has_reader(name)) {
        owner->define_reader(name, make_association_reader(refl));
    } else {
        LOG_DEBUG("builder", "%s already defines %s, keeping its reader", owner->name().c_str(), name.c_str());
    }

    LOG_DEBUG("builder", "%s %s %s -> %s (foreign key %s)",
              owner->name().c_str(), kind == association_kind::to_many ? "has_many" : "belongs_to",
              name.c_str(), refl->class_name().c_str(), refl->foreign_key().c_str());
    return refl;
}

std::shared_ptr<const reflection> builder::has_many(const std::shared_ptr<entity_type>& owner,
                                                    const std::string& name,
                                                    const nlohmann::json& options) {
    return build(association_kind::to_many, owner, name, options);
}

std::shared_ptr<const reflection> builder::belongs_to(const std::shared_ptr<entity_type>& owner,
                                                      const std::string& name,
                                                      const nlohmann::json& options) {
    return build(association_kind::to_one, owner, name, options);
}

} // namespace tether
