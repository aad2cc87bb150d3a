#include "tether/association.hpp"
#include "tether/tether.hpp"
#include "tether/log.hpp"

namespace tether {

load_state next_state(load_state state, load_event event) {
    switch (event) {
        case load_event::loaded:
            return load_state::loaded;
        case load_event::key_changed:
            return state == load_state::loaded ? load_state::stale : state;
        case load_event::reset:
            return load_state::not_loaded;
    }
    return state;
}

// ============================================================================
// association
// ============================================================================

association::association(record_ptr owner, std::shared_ptr<const reflection> refl)
    : owner_(std::move(owner))
    , reflection_(std::move(refl)) {
}

std::shared_ptr<entity_type> association::klass() const {
    return reflection_->related_type();
}

bool association::null_scope() const {
    return owner_->is_new_record() && !foreign_key_present();
}

relation_scope association::scope(bool nullify) const {
    auto s = association_scope();
    if (nullify && null_scope()) {
        return s.none();
    }
    return s;
}

bool association::stale_target() const {
    const auto& st = state();
    return st.state == load_state::loaded && st.snapshot && *st.snapshot != stale_state();
}

void association::refresh_state() const {
    if (!stale_target()) return;
    auto& st = state();
    st.state = next_state(st.state, load_event::key_changed);
    LOG_DEBUG("association", "%s.%s is stale, reloading",
              owner_->type().name().c_str(), reflection_->name().c_str());
}

void association::loaded_now() const {
    auto& st = state();
    st.state = next_state(st.state, load_event::loaded);
    st.snapshot = stale_state();
}

void association::reset() {
    auto& st = state();
    st.state = next_state(st.state, load_event::reset);
    st.snapshot.reset();
}

void association::set_inverse_instance(const record_ptr& member) const {
    auto inverse = reflection_->inverse_of();
    if (!inverse || !member) return;

    auto& st = member->association_cache(inverse->name());
    st.inverse_owner = owner_;
    st.target_one.reset();
    st.state = next_state(st.state, load_event::loaded);
    st.snapshot = member->get(inverse->foreign_key());
}

bool association::type_matches(const record& candidate) const {
    auto related = klass();
    return candidate.type().is_a(*related);
}

void association::raise_on_type_mismatch(const record& candidate) const {
    if (!type_matches(candidate)) {
        throw type_mismatch_error(reflection_->class_name() + " expected, got " + candidate.type().name());
    }
}

// ============================================================================
// belongs_to_association
// ============================================================================

column_value_t belongs_to_association::stale_state() const {
    return owner_->get(reflection_->foreign_key());
}

bool belongs_to_association::foreign_key_present() const {
    return !detail::is_null(owner_->get(reflection_->foreign_key()));
}

relation_scope belongs_to_association::association_scope() const {
    return relation_scope(store(), klass())
        .where(reflection_->primary_key(), owner_->get(reflection_->foreign_key()));
}

void belongs_to_association::reset() {
    association::reset();
    auto& st = state();
    st.target_one.reset();
    st.inverse_owner.reset();
}

record_ptr belongs_to_association::reload() {
    reset();
    return reader();
}

record_ptr belongs_to_association::reader(bool force_reload) {
    refresh_state();
    auto& st = state();
    if (force_reload || st.state == load_state::stale) {
        reset();
    }

    if (st.target_one) return st.target_one;
    if (auto inverse = st.inverse_owner.lock()) return inverse;
    if (st.state == load_state::loaded) return nullptr;

    if (!foreign_key_present()) {
        loaded_now();
        return nullptr;
    }

    auto found = scope().to_list();
    st.target_one = found.empty() ? nullptr : found.front();
    loaded_now();
    return st.target_one;
}

void belongs_to_association::writer(record_ptr target) {
    if (target) raise_on_type_mismatch(*target);

    auto& st = state();
    st.inverse_owner.reset();
    st.target_one = target;

    // An unsaved target has no key yet; saving the owner saves it first
    column_value_t key = target ? target->get(reflection_->primary_key()) : column_value_t{nullptr};
    owner_->set(reflection_->foreign_key(), key);
    loaded_now();
}

} // namespace tether
