#include "tether/reflection.hpp"
#include "tether/entity_type.hpp"
#include <cctype>

namespace tether {

const char* to_string(dependent_policy policy) {
    switch (policy) {
        case dependent_policy::none: return "none";
        case dependent_policy::destroy: return "destroy";
        case dependent_policy::delete_all: return "delete_all";
        case dependent_policy::nullify: return "nullify";
        case dependent_policy::restrict_with_exception: return "restrict_with_exception";
        case dependent_policy::restrict_with_error: return "restrict_with_error";
    }
    return "none";
}

std::optional<dependent_policy> parse_dependent_policy(const std::string& name) {
    if (name == "destroy") return dependent_policy::destroy;
    if (name == "delete_all") return dependent_policy::delete_all;
    if (name == "nullify") return dependent_policy::nullify;
    if (name == "restrict_with_exception") return dependent_policy::restrict_with_exception;
    if (name == "restrict_with_error") return dependent_policy::restrict_with_error;
    return std::nullopt;
}

namespace detail {

std::string classify(const std::string& name) {
    std::string singular = name;
    auto ends_with = [&](const std::string& suffix) {
        return singular.size() > suffix.size() &&
               singular.compare(singular.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    if (ends_with("ies")) {
        singular = singular.substr(0, singular.size() - 3) + "y";
    } else if (ends_with("sses") || ends_with("xes") || ends_with("ches") || ends_with("shes")) {
        singular = singular.substr(0, singular.size() - 2);
    } else if (ends_with("s") && !ends_with("ss")) {
        singular = singular.substr(0, singular.size() - 1);
    }

    std::string result;
    bool upper_next = true;
    for (char c : singular) {
        if (c == '_') {
            upper_next = true;
            continue;
        }
        result += upper_next ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c;
        upper_next = false;
    }
    return result;
}

std::string underscore(const std::string& name) {
    std::string result;
    for (size_t i = 0; i < name.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(name[i]);
        if (std::isupper(c)) {
            if (i > 0 && name[i - 1] != '_') result += '_';
            result += static_cast<char>(std::tolower(c));
        } else {
            result += static_cast<char>(c);
        }
    }
    return result;
}

} // namespace detail

reflection::reflection(association_kind kind,
                       std::string name,
                       nlohmann::json options,
                       const entity_type* owner_type,
                       type_resolver_t related_type_resolver)
    : kind_(kind)
    , name_(std::move(name))
    , options_(options.is_null() ? nlohmann::json::object() : std::move(options))
    , owner_type_(owner_type)
    , related_type_resolver_(std::move(related_type_resolver)) {
    class_name_ = string_option("className").value_or(detail::classify(name_));
    primary_key_ = string_option("primaryKey").value_or("id");

    if (auto fk = string_option("foreignKey")) {
        foreign_key_ = *fk;
    } else if (kind_ == association_kind::to_many) {
        foreign_key_ = detail::underscore(owner_type_->name()) + "_id";
    } else {
        foreign_key_ = name_ + "_id";
    }

    if (auto dep = string_option("dependent")) {
        // Values were checked by the builder; an unknown one is a programming error
        auto parsed = parse_dependent_policy(*dep);
        if (!parsed) {
            throw configuration_error("unknown dependent policy '" + *dep + "' on " + name_);
        }
        dependent_ = *parsed;
    }
}

std::shared_ptr<entity_type> reflection::related_type() const {
    return related_type_resolver_();
}

std::optional<std::string> reflection::string_option(const char* key) const {
    auto it = options_.find(key);
    if (it == options_.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::shared_ptr<const reflection> reflection::inverse_of() const {
    auto related = type_registry::instance().find(class_name_);
    if (!related) return nullptr;

    if (auto explicit_name = string_option("inverseOf")) {
        auto inverse = related->reflect_on_association(*explicit_name);
        if (!inverse) {
            throw configuration_error("inverseOf '" + *explicit_name + "' on " + name_ +
                                      " does not name a relationship of " + class_name_);
        }
        return inverse;
    }

    // Only collections detect their inverse automatically: the belongs-to on the
    // related type that uses the same foreign key and points back at the owner.
    if (kind_ != association_kind::to_many) return nullptr;

    for (const auto& candidate : related->reflections()) {
        if (candidate->kind() != association_kind::to_one) continue;
        if (candidate->foreign_key() != foreign_key_) continue;
        for (const entity_type* t = owner_type_; t != nullptr; t = t->parent().get()) {
            if (t->name() == candidate->class_name()) return candidate;
        }
    }
    return nullptr;
}

bool reflection::embeds_ids() const {
    return string_option("embed").value_or("objects") == "ids";
}

const nlohmann::json* reflection::virtual_value() const {
    auto it = options_.find("virtualValue");
    return it == options_.end() ? nullptr : &*it;
}

namespace {

std::vector<std::string> string_list(const nlohmann::json& options, const char* key) {
    std::vector<std::string> result;
    auto it = options.find(key);
    if (it == options.end()) return result;
    if (it->is_string()) {
        result.push_back(it->get<std::string>());
    } else if (it->is_array()) {
        for (const auto& v : *it) result.push_back(v.get<std::string>());
    }
    return result;
}

} // namespace

std::vector<std::string> reflection::only() const {
    return string_list(options_, "only");
}

std::vector<std::string> reflection::except() const {
    return string_list(options_, "except");
}

std::optional<std::string> reflection::serializer() const {
    return string_option("serializer");
}

std::optional<std::string> reflection::each_serializer() const {
    return string_option("eachSerializer");
}

const std::vector<std::string>& reflection::valid_options(association_kind kind) {
    static const std::vector<std::string> to_one = {
        "virtualValue", "embed", "except", "only", "serializer",
        "className", "foreignKey", "primaryKey", "inverseOf"
    };
    static const std::vector<std::string> to_many = {
        "virtualValue", "embed", "except", "only", "serializer",
        "className", "foreignKey", "primaryKey", "inverseOf",
        "eachSerializer", "dependent"
    };
    return kind == association_kind::to_many ? to_many : to_one;
}

} // namespace tether
