#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "errors.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <functional>
#include <memory>

namespace tether {

class reflection;
class relationship_accessor;
class record;

// ============================================================================
// error_list - validation messages attached to a record
// ============================================================================

struct validation_error {
    std::string attribute;  // "base" for record-level errors
    std::string message;
};

class error_list {
public:
    void add(const std::string& attribute, const std::string& message) {
        errors_.push_back({attribute, message});
    }

    bool empty() const { return errors_.empty(); }
    size_t size() const { return errors_.size(); }
    void clear() { errors_.clear(); }

    std::vector<std::string> on(const std::string& attribute) const {
        std::vector<std::string> result;
        for (const auto& e : errors_) {
            if (e.attribute == attribute) result.push_back(e.message);
        }
        return result;
    }

    /// "name can't be blank" style messages; base errors are left unprefixed.
    std::vector<std::string> full_messages() const {
        std::vector<std::string> result;
        result.reserve(errors_.size());
        for (const auto& e : errors_) {
            result.push_back(e.attribute == "base" ? e.message : e.attribute + " " + e.message);
        }
        return result;
    }

    auto begin() const { return errors_.begin(); }
    auto end() const { return errors_.end(); }

private:
    std::vector<validation_error> errors_;
};

using validator_t = std::function<void(const record&, error_list&)>;

/// Serialization reader: produces the JSON value emitted under a name.
using reader_t = std::function<nlohmann::json(record&)>;

// ============================================================================
// entity_type - runtime description of one kind of record
//
// Holds columns, validators, the relationship registry (name -> reflection)
// and the capability table (name -> relationship_accessor). A subtype copies
// its parent's entries when it is defined and shares the parent's table.
// ============================================================================

class entity_type {
public:
    /// Define and register a type. Throws configuration_error on a duplicate name.
    static std::shared_ptr<entity_type> define(const std::string& name,
                                               std::vector<column_def> columns,
                                               std::shared_ptr<entity_type> parent = nullptr);

    entity_type(std::string name, std::vector<column_def> columns, std::shared_ptr<entity_type> parent);

    entity_type(const entity_type&) = delete;
    entity_type& operator=(const entity_type&) = delete;

    const std::string& name() const { return name_; }
    const std::string& table_name() const { return table_name_; }
    const std::vector<column_def>& columns() const { return columns_; }
    bool has_column(const std::string& name) const;
    const std::shared_ptr<entity_type>& parent() const { return parent_; }

    /// True if this type is `other` or derives from it.
    bool is_a(const entity_type& other) const;

    table_schema schema() const { return {table_name_, columns_}; }

    // Validation
    void validates(validator_t validator) { validators_.push_back(std::move(validator)); }
    const std::vector<validator_t>& validators() const { return validators_; }

    // Relationship registry
    const std::vector<std::shared_ptr<const reflection>>& reflections() const { return reflections_; }
    std::shared_ptr<const reflection> reflect_on_association(const std::string& name) const;
    void add_reflection(std::shared_ptr<const reflection> refl);

    // Capability table
    void set_accessor(const std::string& name, std::shared_ptr<const relationship_accessor> accessor);
    /// Throws configuration_error when no relationship of that name was declared.
    const relationship_accessor& accessor(const std::string& name) const;

    // Serialization readers (association readers and computed attributes)
    void define_reader(const std::string& name, reader_t reader);
    bool has_reader(const std::string& name) const;
    const std::vector<std::pair<std::string, reader_t>>& readers() const { return readers_; }

private:
    std::string name_;
    std::string table_name_;
    std::vector<column_def> columns_;
    std::shared_ptr<entity_type> parent_;
    std::vector<validator_t> validators_;

    std::vector<std::shared_ptr<const reflection>> reflections_;
    std::unordered_map<std::string, std::shared_ptr<const relationship_accessor>> accessors_;
    std::vector<std::pair<std::string, reader_t>> readers_;
};

// Global type registry
class type_registry {
public:
    static type_registry& instance();

    void register_type(std::shared_ptr<entity_type> type);
    std::shared_ptr<entity_type> find(const std::string& name) const;
    /// Throws configuration_error for an unknown name.
    std::shared_ptr<entity_type> get(const std::string& name) const;

    /// Names of `type` and every registered type deriving from it.
    std::vector<std::string> descendant_names(const entity_type& type) const;

private:
    type_registry() = default;
    std::unordered_map<std::string, std::shared_ptr<entity_type>> types_;
};

} // namespace tether

#endif // __cplusplus
