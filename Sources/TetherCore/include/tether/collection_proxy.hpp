#pragma once

#ifdef __cplusplus

#include "collection_association.hpp"

namespace tether {

// ============================================================================
// collection_proxy - what record::many() hands to callers
//
// Forwards to the has_many runtime. Iteration and indexing load the target.
// ============================================================================

class collection_proxy {
public:
    using iterator = std::vector<record_ptr>::const_iterator;

    explicit collection_proxy(has_many_association association)
        : association_(std::move(association)) {}

    has_many_association& association() { return association_; }
    const reflection& metadata() const { return association_.metadata(); }
    bool loaded() const { return association_.loaded(); }

    const std::vector<record_ptr>& load_target() { return association_.load_target(); }
    /// The members held in memory, without loading.
    const std::vector<record_ptr>& target() const { return association_.target(); }

    iterator begin() { return load_target().begin(); }
    iterator end() { return load_target().end(); }

    const record_ptr& operator[](size_t index) { return load_target()[index]; }
    const record_ptr& at(size_t index) { return load_target().at(index); }

    size_t size() { return association_.size(); }
    bool empty() { return association_.empty(); }
    bool any() { return association_.any(); }
    bool any(const collection_association::predicate_t& pred) { return association_.any(pred); }
    bool many() { return association_.many(); }
    bool many(const collection_association::predicate_t& pred) { return association_.many(pred); }
    bool include(const record_ptr& candidate) { return association_.include(candidate); }

    std::vector<column_value_t> ids() { return association_.ids_reader(); }
    void set_ids(const std::vector<column_value_t>& ids) { association_.ids_writer(ids); }

    std::vector<attributes_t> select(const std::vector<std::string>& fields) const {
        return association_.select(fields);
    }
    std::vector<record_ptr> select(const collection_association::predicate_t& pred) {
        return association_.select(pred);
    }

    record_ptr build(const attributes_t& attributes = {}) { return association_.build(attributes); }
    std::vector<record_ptr> build(const std::vector<attributes_t>& attributes) {
        return association_.build(attributes);
    }
    record_ptr create(const attributes_t& attributes = {}) { return association_.create(attributes); }
    std::vector<record_ptr> create(const std::vector<attributes_t>& attributes) {
        return association_.create(attributes);
    }
    record_ptr create_or_throw(const attributes_t& attributes = {}) {
        return association_.create_or_throw(attributes);
    }
    std::vector<record_ptr> create_or_throw(const std::vector<attributes_t>& attributes) {
        return association_.create_or_throw(attributes);
    }

    /// Accepts records and vectors of records in any mix, flattened in order.
    template <typename... Args>
    bool concat(Args&&... args) {
        std::vector<record_ptr> flat;
        (flatten_into(flat, std::forward<Args>(args)), ...);
        return association_.concat(flat);
    }

    void replace(const std::vector<record_ptr>& records) { association_.replace(records); }
    collection_proxy& operator=(const std::vector<record_ptr>& records) {
        association_.writer(records);
        return *this;
    }

    void delete_records(const std::vector<record_ptr>& records) { association_.delete_records(records); }
    void destroy_records(const std::vector<record_ptr>& records) { association_.destroy_records(records); }
    size_t delete_all() { return association_.delete_all(); }
    void destroy_all() { association_.destroy_all(); }

    collection_proxy& reload() {
        association_.reload();
        return *this;
    }
    collection_proxy& reset() {
        association_.reset();
        return *this;
    }

private:
    static void flatten_into(std::vector<record_ptr>& out, const record_ptr& r) {
        out.push_back(r);
    }
    static void flatten_into(std::vector<record_ptr>& out, const std::vector<record_ptr>& records) {
        out.insert(out.end(), records.begin(), records.end());
    }
    static void flatten_into(std::vector<record_ptr>& out, const std::vector<std::vector<record_ptr>>& nested) {
        for (const auto& inner : nested) flatten_into(out, inner);
    }

    has_many_association association_;
};

} // namespace tether

#endif // __cplusplus
