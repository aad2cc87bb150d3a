#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "record.hpp"
#include "reflection.hpp"
#include "scope.hpp"
#include <memory>

namespace tether {

// ============================================================================
// association - runtime for one (owner, reflection) pair
//
// Cheap to construct and rebuilt on every access. Anything that must survive
// between accesses is kept in the owner's association_state for this name.
// ============================================================================

class association {
public:
    association(record_ptr owner, std::shared_ptr<const reflection> refl);
    virtual ~association() = default;

    const record_ptr& owner() const { return owner_; }
    const reflection& metadata() const { return *reflection_; }
    const std::shared_ptr<const reflection>& metadata_ptr() const { return reflection_; }

    /// Related type, resolved through the type registry.
    std::shared_ptr<entity_type> klass() const;

    /// Records related to the owner. When nullify is set and the owner has no
    /// identity yet (and no foreign key), returns none() instead of a query
    /// that could match another owner's rows.
    relation_scope scope(bool nullify = true) const;
    bool null_scope() const;

    bool loaded() const { return state().state == load_state::loaded; }
    /// Loaded, but the owner's linking key no longer matches the snapshot.
    virtual bool stale_target() const;

    association_state& state() const { return owner_->association_cache(reflection_->name()); }

    virtual void reset();

    /// Point the member's inverse relationship back at the owner without a query.
    void set_inverse_instance(const record_ptr& member) const;

protected:
    /// The owner's linking attribute the cached target was resolved with.
    virtual column_value_t stale_state() const = 0;
    virtual bool foreign_key_present() const = 0;
    virtual relation_scope association_scope() const = 0;

    /// Moves a stale target to the stale state so the caller reloads it.
    void refresh_state() const;
    void loaded_now() const;

    bool type_matches(const record& candidate) const;
    void raise_on_type_mismatch(const record& candidate) const;

    tether_db& store() const { return owner_->store(); }

    record_ptr owner_;
    std::shared_ptr<const reflection> reflection_;
};

// ============================================================================
// belongs_to_association - the owner holds the foreign key
// ============================================================================

class belongs_to_association : public association {
public:
    using association::association;

    /// Null when the foreign key is unset or matches no row.
    record_ptr reader(bool force_reload = false);
    void writer(record_ptr target);

    void reset() override;
    record_ptr reload();

protected:
    column_value_t stale_state() const override;
    bool foreign_key_present() const override;
    relation_scope association_scope() const override;
};

} // namespace tether

#endif // __cplusplus
