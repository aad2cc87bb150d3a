#include "tether/entity_type.hpp"
#include "tether/reflection.hpp"
#include "tether/log.hpp"
#include <algorithm>

namespace tether {

std::shared_ptr<entity_type> entity_type::define(const std::string& name,
                                                 std::vector<column_def> columns,
                                                 std::shared_ptr<entity_type> parent) {
    auto type = std::make_shared<entity_type>(name, std::move(columns), std::move(parent));
    type_registry::instance().register_type(type);
    return type;
}

entity_type::entity_type(std::string name, std::vector<column_def> columns, std::shared_ptr<entity_type> parent)
    : name_(std::move(name))
    , parent_(std::move(parent)) {
    if (parent_) {
        // Composition, not sharing: later declarations on the parent do not reach us
        table_name_ = parent_->table_name_;
        columns_ = parent_->columns_;
        validators_ = parent_->validators_;
        reflections_ = parent_->reflections_;
        accessors_ = parent_->accessors_;
        readers_ = parent_->readers_;
    } else {
        table_name_ = name_;
    }

    for (auto& col : columns) {
        if (col.name == "id" || col.name == "_type") {
            throw configuration_error("column name '" + col.name + "' is reserved");
        }
        if (has_column(col.name)) {
            throw configuration_error("column '" + col.name + "' is already defined on " + name_);
        }
        columns_.push_back(std::move(col));
    }
}

bool entity_type::has_column(const std::string& name) const {
    return std::any_of(columns_.begin(), columns_.end(),
                       [&](const column_def& c) { return c.name == name; });
}

bool entity_type::is_a(const entity_type& other) const {
    for (const entity_type* t = this; t != nullptr; t = t->parent_.get()) {
        if (t == &other) return true;
    }
    return false;
}

std::shared_ptr<const reflection> entity_type::reflect_on_association(const std::string& name) const {
    for (const auto& refl : reflections_) {
        if (refl->name() == name) return refl;
    }
    return nullptr;
}

void entity_type::add_reflection(std::shared_ptr<const reflection> refl) {
    if (reflect_on_association(refl->name())) {
        throw configuration_error("relationship '" + refl->name() + "' is already declared on " + name_);
    }
    reflections_.push_back(std::move(refl));
}

void entity_type::set_accessor(const std::string& name, std::shared_ptr<const relationship_accessor> accessor) {
    accessors_[name] = std::move(accessor);
}

const relationship_accessor& entity_type::accessor(const std::string& name) const {
    auto it = accessors_.find(name);
    if (it == accessors_.end()) {
        throw configuration_error("no relationship named '" + name + "' on " + name_);
    }
    return *it->second;
}

void entity_type::define_reader(const std::string& name, reader_t reader) {
    for (auto& [existing, fn] : readers_) {
        if (existing == name) {
            fn = std::move(reader);
            return;
        }
    }
    readers_.emplace_back(name, std::move(reader));
}

bool entity_type::has_reader(const std::string& name) const {
    return std::any_of(readers_.begin(), readers_.end(),
                       [&](const auto& entry) { return entry.first == name; });
}

// ============================================================================
// type_registry
// ============================================================================

type_registry& type_registry::instance() {
    static type_registry registry;
    return registry;
}

void type_registry::register_type(std::shared_ptr<entity_type> type) {
    if (types_.count(type->name())) {
        throw configuration_error("entity type '" + type->name() + "' is already defined");
    }
    LOG_DEBUG("registry", "Registered type %s (table %s)", type->name().c_str(), type->table_name().c_str());
    types_[type->name()] = std::move(type);
}

std::shared_ptr<entity_type> type_registry::find(const std::string& name) const {
    auto it = types_.find(name);
    return it == types_.end() ? nullptr : it->second;
}

std::shared_ptr<entity_type> type_registry::get(const std::string& name) const {
    auto type = find(name);
    if (!type) {
        throw configuration_error("unknown entity type '" + name + "'");
    }
    return type;
}

std::vector<std::string> type_registry::descendant_names(const entity_type& type) const {
    std::vector<std::string> names;
    for (const auto& [name, candidate] : types_) {
        if (candidate->is_a(type)) names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace tether
