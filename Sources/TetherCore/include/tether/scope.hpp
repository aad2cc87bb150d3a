#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace tether {

class tether_db;
class entity_type;

// ============================================================================
// relation_scope - a deferred query over one entity type's rows
//
// Conditions are conjunctive equalities (or IN lists). Nothing runs until a
// terminal call: to_list, pluck, exists, count, select, delete_all, update_all.
// A none() scope answers every terminal call without touching SQLite.
// ============================================================================

class relation_scope {
public:
    relation_scope(tether_db& store, std::shared_ptr<entity_type> type);

    /// column = value, or column IS NULL for a null value.
    relation_scope where(const std::string& column, column_value_t value) const;
    /// column IN (values). An empty list yields none().
    relation_scope where_in(const std::string& column, const std::vector<column_value_t>& values) const;

    relation_scope none() const;
    bool is_none() const { return none_; }

    const entity_type& type() const { return *type_; }
    const std::shared_ptr<entity_type>& type_ptr() const { return type_; }

    /// Records in primary key order, hydrated into their concrete type.
    std::vector<record_ptr> to_list() const;
    std::vector<column_value_t> pluck(const std::string& column) const;
    bool exists() const;
    bool exists(primary_key_t id) const;
    size_t count() const;

    /// The single-valued equality conditions, as attributes for new records.
    attributes_t scope_for_create() const;

    /// Projection of the named columns only.
    std::vector<attributes_t> select(const std::vector<std::string>& fields) const;

    size_t delete_all() const;
    size_t update_all(const attributes_t& attributes) const;

private:
    struct condition {
        std::string column;
        std::vector<column_value_t> values;  // one value: equality, several: IN
    };

    void check_column(const std::string& column) const;
    std::string where_clause(std::vector<column_value_t>& params) const;

    tether_db* store_;
    std::shared_ptr<entity_type> type_;
    std::vector<condition> conditions_;
    bool none_ = false;
};

} // namespace tether

#endif // __cplusplus
