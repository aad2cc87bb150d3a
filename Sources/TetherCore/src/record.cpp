#include "tether/record.hpp"
#include "tether/accessor.hpp"
#include "tether/collection_proxy.hpp"
#include "tether/tether.hpp"

namespace tether {

record::record(std::shared_ptr<entity_type> type, tether_db* store)
    : type_(std::move(type))
    , store_(store) {
    for (const auto& col : type_->columns()) {
        attributes_[col.name] = nullptr;
    }
}

record_ptr record::make(std::shared_ptr<entity_type> type, tether_db* store, const attributes_t& attributes) {
    record_ptr r(new record(std::move(type), store));
    for (const auto& [name, value] : attributes) {
        r->set(name, value);
    }
    return r;
}

tether_db& record::store() const {
    if (!store_) {
        throw tether_error(type_->name() + " record is not bound to a store");
    }
    return *store_;
}

column_value_t record::get(const std::string& name) const {
    if (name == "id") {
        return id_ ? column_value_t{*id_} : column_value_t{nullptr};
    }
    auto it = attributes_.find(name);
    if (it == attributes_.end()) {
        throw tether_error("unknown attribute '" + name + "' on " + type_->name());
    }
    return it->second;
}

void record::set(const std::string& name, column_value_t value) {
    auto it = attributes_.find(name);
    if (it == attributes_.end()) {
        throw tether_error("unknown attribute '" + name + "' on " + type_->name());
    }
    if (it->second == value) return;
    it->second = std::move(value);
    changed_.insert(name);
}

void record::refresh_from(const attributes_t& fetched) {
    for (const auto& [name, value] : fetched) {
        if (changed_.count(name)) continue;
        auto it = attributes_.find(name);
        if (it != attributes_.end()) it->second = value;
    }
}

bool record::valid() {
    errors_.clear();
    for (const auto& validator : type_->validators()) {
        validator(*this, errors_);
    }
    return errors_.empty();
}

bool record::save() {
    return store().save(*this);
}

void record::save_or_throw() {
    store().save_or_throw(*this);
}

bool record::destroy() {
    return store().destroy(*this);
}

association_runtime record::association(const std::string& name) {
    auto refl = type_->reflect_on_association(name);
    if (!refl) {
        throw configuration_error("no relationship named '" + name + "' on " + type_->name());
    }
    if (refl->is_collection()) {
        return has_many_association(shared_from_this(), refl);
    }
    return belongs_to_association(shared_from_this(), refl);
}

collection_proxy record::many(const std::string& name, bool force_reload) {
    return type_->accessor(name).read_many(*this, force_reload);
}

record_ptr record::one(const std::string& name, bool force_reload) {
    return type_->accessor(name).read_one(*this, force_reload);
}

void record::assign_many(const std::string& name, const std::vector<record_ptr>& records) {
    type_->accessor(name).write_many(*this, records);
}

void record::assign_one(const std::string& name, record_ptr target) {
    type_->accessor(name).write_one(*this, std::move(target));
}

association_state* record::find_association_cache(const std::string& name) {
    auto it = association_cache_.find(name);
    return it == association_cache_.end() ? nullptr : &it->second;
}

bool record::same_entity(const record& other) const {
    if (this == &other) return true;
    if (new_record_ || other.new_record_ || !id_ || !other.id_) return false;
    return *id_ == *other.id_ && type_->table_name() == other.type_->table_name();
}

} // namespace tether
