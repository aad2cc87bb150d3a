#include "tether/collection_association.hpp"
#include "tether/collection_proxy.hpp"
#include "tether/tether.hpp"
#include "tether/log.hpp"
#include <algorithm>
#include <unordered_map>

namespace tether {

namespace {

bool contains_entity(const std::vector<record_ptr>& list, const record& candidate) {
    return std::any_of(list.begin(), list.end(),
                       [&](const record_ptr& r) { return r->same_entity(candidate); });
}

/// Members of `a` that are not in `b`.
std::vector<record_ptr> difference(const std::vector<record_ptr>& a, const std::vector<record_ptr>& b) {
    std::vector<record_ptr> result;
    for (const auto& r : a) {
        if (!contains_entity(b, *r)) result.push_back(r);
    }
    return result;
}

bool same_members_in_order(const std::vector<record_ptr>& a, const std::vector<record_ptr>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (!a[i]->same_entity(*b[i])) return false;
    }
    return true;
}

} // namespace

// ============================================================================
// Loading
// ============================================================================

bool collection_association::stale_target() const {
    // A new owner gaining its identity on save is not a key change
    const auto& st = state();
    if (st.snapshot && detail::is_null(*st.snapshot)) return false;
    return association::stale_target();
}

bool collection_association::find_target_p() const {
    return !loaded() && (!owner_->is_new_record() || foreign_key_present());
}

std::vector<record_ptr> collection_association::find_target() const {
    auto records = scope().to_list();
    for (const auto& r : records) {
        set_inverse_instance(r);
    }
    return records;
}

std::vector<record_ptr> collection_association::merge_target_lists(
        const std::vector<record_ptr>& persisted,
        const std::vector<record_ptr>& memory) const {
    if (memory.empty()) return persisted;

    std::vector<record_ptr> remaining = memory;
    std::vector<record_ptr> merged;
    merged.reserve(persisted.size() + memory.size());

    for (const auto& fetched : persisted) {
        auto held = std::find_if(remaining.begin(), remaining.end(),
                                 [&](const record_ptr& r) { return r->same_entity(*fetched); });
        if (held == remaining.end()) {
            merged.push_back(fetched);
            continue;
        }
        // Keep the instance the caller already holds, with its unsaved edits
        (*held)->refresh_from(fetched->attributes());
        merged.push_back(*held);
        remaining.erase(held);
    }

    for (const auto& r : remaining) {
        if (r->is_new_record()) merged.push_back(r);
    }
    return merged;
}

const std::vector<record_ptr>& collection_association::load_target() {
    if (find_target_p()) {
        auto fetched = find_target();
        target() = merge_target_lists(fetched, target());
    }
    loaded_now();
    return target();
}

void collection_association::reset() {
    association::reset();
    target().clear();
}

void collection_association::reload() {
    reset();
    load_target();
}

// ============================================================================
// Queries
// ============================================================================

size_t collection_association::count_unsaved() const {
    const auto& t = target();
    return static_cast<size_t>(std::count_if(t.begin(), t.end(),
                                             [](const record_ptr& r) { return r->is_new_record(); }));
}

size_t collection_association::size() {
    if (!find_target_p() || loaded()) {
        return target().size();
    }
    if (!target().empty()) {
        return count_unsaved() + scope().count();
    }
    return scope().count();
}

bool collection_association::empty() {
    if (loaded()) {
        return size() == 0;
    }
    return target().empty() && !scope().exists();
}

bool collection_association::any(const predicate_t& predicate) {
    const auto& records = load_target();
    return std::any_of(records.begin(), records.end(), predicate);
}

bool collection_association::many(const predicate_t& predicate) {
    const auto& records = load_target();
    return std::count_if(records.begin(), records.end(), predicate) > 1;
}

bool collection_association::include(const record_ptr& candidate) {
    if (!candidate || !type_matches(*candidate)) return false;

    const auto& t = target();
    if (candidate->is_new_record()) {
        return std::find(t.begin(), t.end(), candidate) != t.end();
    }
    if (loaded()) {
        return contains_entity(t, *candidate);
    }
    return scope().exists(*candidate->id());
}

std::vector<column_value_t> collection_association::ids_reader() {
    if (!loaded() && target().empty()) {
        return scope().pluck("id");
    }
    std::vector<column_value_t> ids;
    for (const auto& r : load_target()) {
        ids.push_back(r->get("id"));
    }
    return ids;
}

void collection_association::ids_writer(const std::vector<column_value_t>& ids) {
    std::vector<primary_key_t> keys;
    for (const auto& value : ids) {
        if (detail::is_blank(value)) continue;
        auto key = detail::to_identity(value);
        if (!key) {
            LOG_DEBUG("association", "Dropping %s from %s ids", detail::describe(value).c_str(),
                      reflection_->name().c_str());
            continue;
        }
        if (std::find(keys.begin(), keys.end(), *key) == keys.end()) {
            keys.push_back(*key);
        }
    }

    auto found = store().find(klass(), keys);
    std::unordered_map<primary_key_t, record_ptr> by_id;
    for (const auto& r : found) {
        by_id[*r->id()] = r;
    }

    std::vector<record_ptr> ordered;
    ordered.reserve(keys.size());
    for (auto key : keys) {
        ordered.push_back(by_id.at(key));
    }
    replace(ordered);
}

std::vector<attributes_t> collection_association::select(const std::vector<std::string>& fields) const {
    return scope().select(fields);
}

std::vector<record_ptr> collection_association::select(const predicate_t& predicate) {
    std::vector<record_ptr> result;
    const auto& records = load_target();
    std::copy_if(records.begin(), records.end(), std::back_inserter(result), predicate);
    return result;
}

// ============================================================================
// Building and inserting
// ============================================================================

record_ptr collection_association::build_record(const attributes_t& attributes) const {
    attributes_t merged = association_scope().scope_for_create();
    for (const auto& [name, value] : attributes) {
        merged[name] = value;
    }
    return store().build(klass(), merged);
}

void collection_association::add_to_target(const record_ptr& member) {
    set_inverse_instance(member);
    auto& t = target();
    auto existing = std::find_if(t.begin(), t.end(),
                                 [&](const record_ptr& r) { return r->same_entity(*member); });
    if (existing != t.end()) {
        *existing = member;
    } else {
        t.push_back(member);
    }
}

record_ptr collection_association::build(const attributes_t& attributes) {
    auto member = build_record(attributes);
    add_to_target(member);
    return member;
}

std::vector<record_ptr> collection_association::build(const std::vector<attributes_t>& attributes) {
    std::vector<record_ptr> members;
    members.reserve(attributes.size());
    for (const auto& attrs : attributes) {
        members.push_back(build(attrs));
    }
    return members;
}

record_ptr collection_association::create_record(const attributes_t& attributes, bool raise) {
    if (!owner_->is_persisted()) {
        throw record_not_saved_error("You cannot call create unless the parent is saved");
    }

    record_ptr member;
    store().run_in_transaction([&] {
        member = build_record(attributes);
        set_inverse_instance(member);
        bool saved = insert_record(*member, raise);
        add_to_target(member);
        return saved;
    });
    return member;
}

record_ptr collection_association::create(const attributes_t& attributes) {
    return create_record(attributes, false);
}

std::vector<record_ptr> collection_association::create(const std::vector<attributes_t>& attributes) {
    std::vector<record_ptr> members;
    for (const auto& attrs : attributes) {
        members.push_back(create_record(attrs, false));
    }
    return members;
}

record_ptr collection_association::create_or_throw(const attributes_t& attributes) {
    return create_record(attributes, true);
}

std::vector<record_ptr> collection_association::create_or_throw(const std::vector<attributes_t>& attributes) {
    std::vector<record_ptr> members;
    for (const auto& attrs : attributes) {
        members.push_back(create_record(attrs, true));
    }
    return members;
}

bool collection_association::concat_records(const std::vector<record_ptr>& records, bool persist) {
    bool result = true;
    for (const auto& r : records) {
        if (persist) {
            set_inverse_instance(r);
            result = result && insert_record(*r, false);
        }
        add_to_target(r);
    }
    return result;
}

bool collection_association::concat(const std::vector<record_ptr>& records) {
    for (const auto& r : records) {
        if (!r) throw type_mismatch_error(reflection_->class_name() + " expected, got null");
        raise_on_type_mismatch(*r);
    }

    if (owner_->is_new_record()) {
        load_target();
        return concat_records(records, false);
    }
    return store().run_in_transaction([&] { return concat_records(records, true); });
}

// ============================================================================
// Replacing and removing
// ============================================================================

void collection_association::replace_common_records_in_memory(const std::vector<record_ptr>& records) {
    for (const auto& r : records) {
        auto& t = target();
        auto held = std::find_if(t.begin(), t.end(),
                                 [&](const record_ptr& h) { return h->same_entity(*r); });
        if (held != t.end()) *held = r;
    }
}

void collection_association::replace_records(const std::vector<record_ptr>& records,
                                             const std::vector<record_ptr>& original) {
    delete_records(difference(target(), records));

    if (!concat(difference(records, target()))) {
        target() = original;
        throw record_not_saved_error("Failed to replace " + reflection_->name() +
                                     " because one or more of the new records could not be saved.");
    }
}

void collection_association::replace(const std::vector<record_ptr>& records) {
    for (const auto& r : records) {
        if (!r) throw type_mismatch_error(reflection_->class_name() + " expected, got null");
        raise_on_type_mismatch(*r);
    }

    std::vector<record_ptr> original = load_target();

    if (owner_->is_new_record()) {
        replace_records(records, original);
    } else {
        replace_common_records_in_memory(records);
        if (!same_members_in_order(records, original)) {
            store().run_in_transaction([&] {
                replace_records(records, original);
                return true;
            });
        }
    }

    // Membership is now exactly `records`; keep the caller's order
    auto& t = target();
    std::vector<record_ptr> ordered;
    ordered.reserve(records.size());
    for (const auto& r : records) {
        auto held = std::find_if(t.begin(), t.end(),
                                 [&](const record_ptr& h) { return h->same_entity(*r); });
        ordered.push_back(held != t.end() ? *held : r);
    }
    t = std::move(ordered);
}

void collection_association::delete_or_destroy(const std::vector<record_ptr>& records,
                                               dependent_policy method) {
    if (records.empty()) return;
    for (const auto& r : records) {
        if (!r) throw type_mismatch_error(reflection_->class_name() + " expected, got null");
        raise_on_type_mismatch(*r);
    }

    std::vector<record_ptr> existing;
    std::copy_if(records.begin(), records.end(), std::back_inserter(existing),
                 [](const record_ptr& r) { return !r->is_new_record(); });

    auto remove_from_target = [&] {
        auto& t = target();
        t.erase(std::remove_if(t.begin(), t.end(),
                               [&](const record_ptr& h) { return contains_entity(records, *h); }),
                t.end());
    };

    if (existing.empty()) {
        remove_from_target();
        return;
    }
    store().run_in_transaction([&] {
        remove_persisted(existing, method);
        remove_from_target();
        return true;
    });
}

void collection_association::delete_records(const std::vector<record_ptr>& records) {
    auto method = reflection_->dependent();
    if (method != dependent_policy::destroy && method != dependent_policy::delete_all) {
        method = dependent_policy::nullify;
    }
    delete_or_destroy(records, method);
}

void collection_association::destroy_records(const std::vector<record_ptr>& records) {
    delete_or_destroy(records, dependent_policy::destroy);
}

size_t collection_association::delete_all() {
    auto method = reflection_->dependent();
    if (method == dependent_policy::destroy) {
        method = dependent_policy::delete_all;
    }
    size_t count = delete_or_nullify_all(method);
    reset();
    loaded_now();
    return count;
}

void collection_association::destroy_all() {
    std::vector<record_ptr> members = load_target();
    destroy_records(members);
    reset();
    loaded_now();
}

// ============================================================================
// has_many_association
// ============================================================================

collection_proxy has_many_association::reader(bool force_reload) {
    refresh_state();
    if (force_reload || state().state == load_state::stale) {
        reload();
    }
    return collection_proxy(*this);
}

column_value_t has_many_association::stale_state() const {
    return owner_->get(reflection_->primary_key());
}

relation_scope has_many_association::association_scope() const {
    return relation_scope(store(), klass())
        .where(reflection_->foreign_key(), owner_->get(reflection_->primary_key()));
}

void has_many_association::set_owner_attributes(record& member) const {
    member.set(reflection_->foreign_key(), owner_->get(reflection_->primary_key()));
}

bool has_many_association::insert_record(record& member, bool raise) {
    set_owner_attributes(member);
    set_inverse_instance(member.shared_from_this());
    if (raise) {
        store().save_or_throw(member);
        return true;
    }
    return store().save(member);
}

void has_many_association::remove_persisted(const std::vector<record_ptr>& records,
                                            dependent_policy method) {
    if (method == dependent_policy::destroy) {
        for (const auto& r : records) {
            if (!store().destroy(*r)) {
                throw record_not_destroyed_error("Failed to destroy " + r->type().name() +
                                                 " while removing it from " + reflection_->name());
            }
        }
        return;
    }

    std::vector<column_value_t> ids;
    for (const auto& r : records) ids.push_back(r->get("id"));
    auto members = scope().where_in("id", ids);

    if (method == dependent_policy::delete_all) {
        members.delete_all();
        return;
    }

    members.update_all({{reflection_->foreign_key(), nullptr}});
    for (const auto& r : records) {
        r->refresh_from({{reflection_->foreign_key(), nullptr}});
    }
}

size_t has_many_association::delete_or_nullify_all(dependent_policy method) {
    if (method == dependent_policy::delete_all) {
        return scope().delete_all();
    }
    return scope().update_all({{reflection_->foreign_key(), nullptr}});
}

bool has_many_association::handle_dependency() {
    const auto& name = reflection_->name();
    switch (reflection_->dependent()) {
        case dependent_policy::none:
            return true;

        case dependent_policy::restrict_with_exception:
            if (!empty()) {
                LOG_DEBUG("cascade", "%s has dependent %s, refusing", owner_->type().name().c_str(), name.c_str());
                throw delete_restriction_error(name);
            }
            return true;

        case dependent_policy::restrict_with_error:
            if (!empty()) {
                owner_->errors().add("base", "Cannot delete record because dependent " + name + " exist");
                return false;
            }
            return true;

        case dependent_policy::destroy: {
            std::vector<record_ptr> members = load_target();
            for (const auto& m : members) {
                m->set_destroyed_by_association(reflection_);
            }
            LOG_DEBUG("cascade", "Destroying %zu %s", members.size(), name.c_str());
            destroy_all();
            return true;
        }

        default:
            LOG_DEBUG("cascade", "%s %s", to_string(reflection_->dependent()), name.c_str());
            delete_all();
            return true;
    }
}

} // namespace tether
