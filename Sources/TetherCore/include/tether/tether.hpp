#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "db.hpp"
#include "entity_type.hpp"
#include "record.hpp"
#include "scope.hpp"
#include <concepts>
#include <functional>
#include <set>
#include <unordered_set>

namespace tether {

// ============================================================================
// configuration
// ============================================================================

struct configuration {
    std::string path = ":memory:";
    std::optional<log_level> level;  // leaves the global level alone when unset

    configuration() = default;
    explicit configuration(std::string path) : path(std::move(path)) {}

    /// {"path": "...", "logLevel": "debug"}. Unknown keys are ignored.
    static configuration from_json(const nlohmann::json& j);
};

// ============================================================================
// tether_db - persistence for records
//
// Saves and destroys records, hydrates rows into their concrete types, and
// runs transactions. A transaction opened inside another becomes a savepoint.
// ============================================================================

class tether_db {
public:
    explicit tether_db(const configuration& config = {});

    tether_db(const tether_db&) = delete;
    tether_db& operator=(const tether_db&) = delete;

    database& db() { return db_; }
    const configuration& config() const { return config_; }

    /// A new, unsaved record bound to this store.
    record_ptr build(const std::shared_ptr<entity_type>& type, const attributes_t& attributes = {});

    /// Validates, then writes the record with its unsaved relationships.
    bool save(record& r);
    /// Throws record_invalid_error when save() fails.
    void save_or_throw(record& r);

    /// Runs dependent cascades, then deletes the row. False when a
    /// restrict_with_error cascade refused.
    bool destroy(record& r);

    /// Throws record_not_found_error when any id has no row. Order is not guaranteed.
    std::vector<record_ptr> find(const std::shared_ptr<entity_type>& type, const std::vector<primary_key_t>& ids);
    record_ptr find(const std::shared_ptr<entity_type>& type, primary_key_t id);

    relation_scope all(const std::shared_ptr<entity_type>& type);

    /// Commits when the block returns true, rolls back when it returns false
    /// or throws. Records saved or destroyed in a rolled back scope get their
    /// new/id/destroyed state back.
    template <typename F>
        requires std::invocable<F&> && std::convertible_to<std::invoke_result_t<F&>, bool>
    bool run_in_transaction(F&& block) {
        transaction tx(db_);
        tx_frames_.emplace_back();
        bool ok = false;
        try {
            ok = static_cast<bool>(std::invoke(block));
        } catch (...) {
            tx.rollback();
            rollback_frame();
            throw;
        }
        if (ok) {
            try {
                tx.commit();
            } catch (const db_error&) {
                rollback_frame();
                throw;
            }
            commit_frame();
        } else {
            tx.rollback();
            rollback_frame();
        }
        return ok;
    }

    bool in_transaction() const { return !tx_frames_.empty(); }

    /// Build a persisted record from a row, using the row's _type when it is
    /// a registered subtype of `base`.
    record_ptr hydrate(const std::shared_ptr<entity_type>& base, const database::row_t& row);

    void ensure_table(const entity_type& type);

private:
    struct persistence_snapshot {
        record_ptr rec;
        bool new_record;
        std::optional<primary_key_t> id;
        bool destroyed;
        std::set<std::string> changed;
    };

    void remember(record& r);
    void commit_frame();
    void rollback_frame();

    bool save_graph(record& r);
    bool save_belongs_to_targets(record& r);
    void write_row(record& r);
    bool autosave_collections(record& r);

    configuration config_;
    database db_;
    std::unordered_set<std::string> ensured_types_;
    std::vector<std::vector<persistence_snapshot>> tx_frames_;
};

} // namespace tether

#endif // __cplusplus
