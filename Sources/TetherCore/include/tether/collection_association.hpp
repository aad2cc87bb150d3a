#pragma once

#ifdef __cplusplus

#include "association.hpp"
#include <functional>
#include <vector>

namespace tether {

class collection_proxy;

// ============================================================================
// collection_association - lazy to-many target list
//
// The target may hold persisted and unsaved members at once. Loading merges
// fetched rows into it: a fetched row that is already held keeps the held
// instance, and unsaved members are kept after the fetched ones.
// ============================================================================

class collection_association : public association {
public:
    using association::association;
    using predicate_t = std::function<bool(const record_ptr&)>;

    std::vector<record_ptr>& target() const { return state().target; }

    /// Fetches when warranted, merges, and marks the state loaded.
    const std::vector<record_ptr>& load_target();
    void reset() override;
    void reload();

    bool stale_target() const override;

    // Identity keys
    std::vector<column_value_t> ids_reader();
    /// Blank entries and entries that are not identity keys are dropped.
    /// Duplicates keep their first position. Throws record_not_found_error.
    void ids_writer(const std::vector<column_value_t>& ids);

    std::vector<attributes_t> select(const std::vector<std::string>& fields) const;
    std::vector<record_ptr> select(const predicate_t& predicate);

    record_ptr build(const attributes_t& attributes = {});
    std::vector<record_ptr> build(const std::vector<attributes_t>& attributes);

    record_ptr create(const attributes_t& attributes = {});
    std::vector<record_ptr> create(const std::vector<attributes_t>& attributes);
    record_ptr create_or_throw(const attributes_t& attributes = {});
    std::vector<record_ptr> create_or_throw(const std::vector<attributes_t>& attributes);

    /// False when any insert failed; the inserts of this call are then rolled back.
    bool concat(const std::vector<record_ptr>& records);
    void replace(const std::vector<record_ptr>& records);

    size_t size();
    bool empty();
    bool any() { return !empty(); }
    bool any(const predicate_t& predicate);
    bool many() { return size() > 1; }
    bool many(const predicate_t& predicate);
    bool include(const record_ptr& candidate);

    // Removal follows the dependent option: destroy, delete_all, otherwise nullify
    void delete_records(const std::vector<record_ptr>& records);
    void destroy_records(const std::vector<record_ptr>& records);
    size_t delete_all();
    void destroy_all();

    /// Sets the owner key on the member and saves it.
    virtual bool insert_record(record& member, bool raise) = 0;

protected:
    bool find_target_p() const;
    std::vector<record_ptr> find_target() const;
    std::vector<record_ptr> merge_target_lists(const std::vector<record_ptr>& persisted,
                                               const std::vector<record_ptr>& memory) const;

    record_ptr build_record(const attributes_t& attributes) const;
    void add_to_target(const record_ptr& member);
    record_ptr create_record(const attributes_t& attributes, bool raise);

    bool concat_records(const std::vector<record_ptr>& records, bool persist);
    void replace_records(const std::vector<record_ptr>& records,
                         const std::vector<record_ptr>& original);
    void replace_common_records_in_memory(const std::vector<record_ptr>& records);

    void delete_or_destroy(const std::vector<record_ptr>& records, dependent_policy method);
    virtual void remove_persisted(const std::vector<record_ptr>& records, dependent_policy method) = 0;
    virtual size_t delete_or_nullify_all(dependent_policy method) = 0;

    size_t count_unsaved() const;
};

// ============================================================================
// has_many_association - members hold the foreign key to the owner
// ============================================================================

class has_many_association : public collection_association {
public:
    using collection_association::collection_association;

    collection_proxy reader(bool force_reload = false);
    void writer(const std::vector<record_ptr>& records) { replace(records); }

    bool insert_record(record& member, bool raise) override;

    /// Runs the dependent option before the owner is destroyed.
    /// Returns false when restrict_with_error refused.
    bool handle_dependency();

protected:
    column_value_t stale_state() const override;
    bool foreign_key_present() const override { return false; }
    relation_scope association_scope() const override;

    void remove_persisted(const std::vector<record_ptr>& records, dependent_policy method) override;
    size_t delete_or_nullify_all(dependent_policy method) override;

private:
    void set_owner_attributes(record& member) const;
};

} // namespace tether

#endif // __cplusplus
