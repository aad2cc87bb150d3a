#include "tether/scope.hpp"
#include "tether/entity_type.hpp"
#include "tether/tether.hpp"
#include "tether/log.hpp"
#include <sstream>

namespace tether {

relation_scope::relation_scope(tether_db& store, std::shared_ptr<entity_type> type)
    : store_(&store)
    , type_(std::move(type)) {
}

void relation_scope::check_column(const std::string& column) const {
    if (column == "id" || column == "_type" || type_->has_column(column)) return;
    throw tether_error("unknown column '" + column + "' on " + type_->name());
}

relation_scope relation_scope::where(const std::string& column, column_value_t value) const {
    check_column(column);
    relation_scope result = *this;
    result.conditions_.push_back({column, {std::move(value)}});
    return result;
}

relation_scope relation_scope::where_in(const std::string& column,
                                        const std::vector<column_value_t>& values) const {
    check_column(column);
    if (values.empty()) return none();
    relation_scope result = *this;
    result.conditions_.push_back({column, values});
    return result;
}

relation_scope relation_scope::none() const {
    relation_scope result = *this;
    result.none_ = true;
    return result;
}

std::string relation_scope::where_clause(std::vector<column_value_t>& params) const {
    std::vector<std::string> clauses;

    // Subtypes share their root's table; restrict to this type and below
    if (type_->parent()) {
        auto names = type_registry::instance().descendant_names(*type_);
        std::string in = "_type IN (";
        for (size_t i = 0; i < names.size(); ++i) {
            if (i > 0) in += ", ";
            in += "?";
            params.emplace_back(names[i]);
        }
        clauses.push_back(in + ")");
    }

    for (const auto& cond : conditions_) {
        if (cond.values.size() == 1) {
            if (detail::is_null(cond.values.front())) {
                clauses.push_back(cond.column + " IS NULL");
            } else {
                clauses.push_back(cond.column + " = ?");
                params.push_back(cond.values.front());
            }
            continue;
        }
        std::string in = cond.column + " IN (";
        for (size_t i = 0; i < cond.values.size(); ++i) {
            if (i > 0) in += ", ";
            in += "?";
            params.push_back(cond.values[i]);
        }
        clauses.push_back(in + ")");
    }

    if (clauses.empty()) return "";
    std::string sql = " WHERE ";
    for (size_t i = 0; i < clauses.size(); ++i) {
        if (i > 0) sql += " AND ";
        sql += clauses[i];
    }
    return sql;
}

std::vector<record_ptr> relation_scope::to_list() const {
    if (none_) return {};
    store_->ensure_table(*type_);

    std::vector<column_value_t> params;
    std::string sql = "SELECT * FROM " + type_->table_name() + where_clause(params) + " ORDER BY id";
    auto rows = store_->db().query(sql, params);

    std::vector<record_ptr> records;
    records.reserve(rows.size());
    for (const auto& row : rows) {
        records.push_back(store_->hydrate(type_, row));
    }
    LOG_DEBUG("store", "Loaded %zu %s rows", records.size(), type_->name().c_str());
    return records;
}

std::vector<column_value_t> relation_scope::pluck(const std::string& column) const {
    check_column(column);
    if (none_) return {};
    store_->ensure_table(*type_);

    std::vector<column_value_t> params;
    std::string sql = "SELECT " + column + " FROM " + type_->table_name() + where_clause(params) + " ORDER BY id";
    auto rows = store_->db().query(sql, params);

    std::vector<column_value_t> values;
    values.reserve(rows.size());
    for (auto& row : rows) {
        auto it = row.find(column);
        values.push_back(it == row.end() ? column_value_t{nullptr} : std::move(it->second));
    }
    return values;
}

bool relation_scope::exists() const {
    if (none_) return false;
    store_->ensure_table(*type_);

    std::vector<column_value_t> params;
    std::string sql = "SELECT 1 AS one FROM " + type_->table_name() + where_clause(params) + " LIMIT 1";
    return !store_->db().query(sql, params).empty();
}

bool relation_scope::exists(primary_key_t id) const {
    return where("id", id).exists();
}

size_t relation_scope::count() const {
    if (none_) return 0;
    store_->ensure_table(*type_);

    std::vector<column_value_t> params;
    std::string sql = "SELECT COUNT(*) AS n FROM " + type_->table_name() + where_clause(params);
    auto rows = store_->db().query(sql, params);
    if (rows.empty()) return 0;
    auto n = detail::to_identity(rows.front()["n"]);
    return n ? static_cast<size_t>(*n) : 0;
}

attributes_t relation_scope::scope_for_create() const {
    attributes_t attributes;
    for (const auto& cond : conditions_) {
        if (cond.values.size() == 1 && cond.column != "id" && cond.column != "_type") {
            attributes[cond.column] = cond.values.front();
        }
    }
    return attributes;
}

std::vector<attributes_t> relation_scope::select(const std::vector<std::string>& fields) const {
    for (const auto& f : fields) check_column(f);
    if (none_ || fields.empty()) return {};
    store_->ensure_table(*type_);

    std::ostringstream sql;
    sql << "SELECT ";
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) sql << ", ";
        sql << fields[i];
    }
    std::vector<column_value_t> params;
    sql << " FROM " << type_->table_name() << where_clause(params) << " ORDER BY id";

    std::vector<attributes_t> result;
    for (auto& row : store_->db().query(sql.str(), params)) {
        attributes_t attrs;
        for (const auto& f : fields) {
            auto it = row.find(f);
            attrs[f] = it == row.end() ? column_value_t{nullptr} : it->second;
        }
        result.push_back(std::move(attrs));
    }
    return result;
}

size_t relation_scope::delete_all() const {
    if (none_) return 0;
    store_->ensure_table(*type_);

    std::vector<column_value_t> params;
    std::string sql = "DELETE FROM " + type_->table_name() + where_clause(params);
    size_t changed = store_->db().execute(sql, params);
    LOG_DEBUG("store", "Deleted %zu %s rows", changed, type_->name().c_str());
    return changed;
}

size_t relation_scope::update_all(const attributes_t& attributes) const {
    if (none_ || attributes.empty()) return 0;
    store_->ensure_table(*type_);

    std::vector<column_value_t> params;
    std::string sql = "UPDATE " + type_->table_name() + " SET ";
    bool first = true;
    for (const auto& [column, value] : attributes) {
        check_column(column);
        if (column == "id" || column == "_type") {
            throw tether_error("cannot update_all the '" + column + "' column");
        }
        if (!first) sql += ", ";
        sql += column + " = ?";
        params.push_back(value);
        first = false;
    }
    sql += where_clause(params);
    size_t changed = store_->db().execute(sql, params);
    LOG_DEBUG("store", "Updated %zu %s rows", changed, type_->name().c_str());
    return changed;
}

} // namespace tether
