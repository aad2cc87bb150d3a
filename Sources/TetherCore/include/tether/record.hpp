#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "errors.hpp"
#include "entity_type.hpp"
#include <set>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace tether {

class tether_db;
class reflection;
class collection_proxy;
class belongs_to_association;
class has_many_association;

/// Closed set of relationship kinds, produced by record::association().
using association_runtime = std::variant<belongs_to_association, has_many_association>;

// ============================================================================
// Load state of one relationship on one owner
// ============================================================================

enum class load_state {
    not_loaded,  // target may be empty or hold only locally built records
    loaded,      // target is the full known membership
    stale        // the linking key changed since the last load
};

enum class load_event {
    loaded,
    key_changed,
    reset
};

/// not_loaded --loaded--> loaded --key_changed--> stale --loaded--> loaded.
/// reset returns to not_loaded from any state.
load_state next_state(load_state state, load_event event);

/// Per-owner state of one relationship. Lives on the owner because the
/// association runtime is rebuilt on every access.
struct association_state {
    load_state state = load_state::not_loaded;
    std::vector<record_ptr> target;            // to-many members
    record_ptr target_one;                     // to-one target
    std::optional<column_value_t> snapshot;    // linking key at last load
    std::weak_ptr<record> inverse_owner;       // set by the collection side
};

// ============================================================================
// record - one instance of an entity_type
// ============================================================================

class record : public std::enable_shared_from_this<record> {
public:
    /// Create an unsaved record. Unknown attribute names throw tether_error.
    static record_ptr make(std::shared_ptr<entity_type> type,
                           tether_db* store,
                           const attributes_t& attributes = {});

    record(const record&) = delete;
    record& operator=(const record&) = delete;

    const entity_type& type() const { return *type_; }
    const std::shared_ptr<entity_type>& type_ptr() const { return type_; }

    bool has_store() const { return store_ != nullptr; }
    tether_db& store() const;

    // Persistence state
    std::optional<primary_key_t> id() const { return id_; }
    bool is_new_record() const { return new_record_; }
    bool is_persisted() const { return !new_record_ && !destroyed_; }
    bool is_destroyed() const { return destroyed_; }

    // Attributes. "id" reads the identity key (null while unsaved).
    column_value_t get(const std::string& name) const;
    void set(const std::string& name, column_value_t value);
    const attributes_t& attributes() const { return attributes_; }

    bool has_changes() const { return !changed_.empty(); }
    bool attribute_changed(const std::string& name) const { return changed_.count(name) > 0; }
    const std::set<std::string>& changed() const { return changed_; }

    /// Take fetched values for every attribute that has no unsaved change.
    void refresh_from(const attributes_t& fetched);

    // Validation
    error_list& errors() { return errors_; }
    const error_list& errors() const { return errors_; }
    bool valid();

    // Persistence, delegated to the store
    bool save();
    void save_or_throw();
    bool destroy();

    // Relationships
    association_runtime association(const std::string& name);
    collection_proxy many(const std::string& name, bool force_reload = false);
    record_ptr one(const std::string& name, bool force_reload = false);
    void assign_many(const std::string& name, const std::vector<record_ptr>& records);
    void assign_one(const std::string& name, record_ptr target);

    association_state& association_cache(const std::string& name) { return association_cache_[name]; }
    association_state* find_association_cache(const std::string& name);

    /// Set by a destroy cascade on the members it destroys.
    const reflection* destroyed_by_association() const { return destroyed_by_association_.get(); }
    void set_destroyed_by_association(std::shared_ptr<const reflection> refl) {
        destroyed_by_association_ = std::move(refl);
    }

    /// Same object, or both persisted rows of the same table with the same id.
    bool same_entity(const record& other) const;

private:
    friend class tether_db;

    record(std::shared_ptr<entity_type> type, tether_db* store);

    void changes_applied() { changed_.clear(); }

    std::shared_ptr<entity_type> type_;
    tether_db* store_;
    std::optional<primary_key_t> id_;
    bool new_record_ = true;
    bool destroyed_ = false;

    attributes_t attributes_;
    std::set<std::string> changed_;
    error_list errors_;

    std::unordered_map<std::string, association_state> association_cache_;
    std::shared_ptr<const reflection> destroyed_by_association_;
};

} // namespace tether

#endif // __cplusplus
