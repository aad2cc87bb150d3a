#include "tether/tether.hpp"
#include "tether/reflection.hpp"
#include "tether/collection_association.hpp"
#include <algorithm>

namespace tether {

// Global log level definition
std::atomic<log_level> g_log_level{log_level::off};

configuration configuration::from_json(const nlohmann::json& j) {
    configuration config;
    if (!j.is_object()) {
        throw tether_error("configuration must be a JSON object");
    }
    if (auto it = j.find("path"); it != j.end()) {
        config.path = it->get<std::string>();
    }
    if (auto it = j.find("logLevel"); it != j.end()) {
        auto level = parse_log_level(it->get<std::string>());
        if (!level) {
            throw tether_error("unknown log level '" + it->get<std::string>() + "'");
        }
        config.level = *level;
    }
    return config;
}

tether_db::tether_db(const configuration& config)
    : config_(config)
    , db_(config.path) {
    if (config_.level) {
        set_log_level(*config_.level);
    }
    LOG_INFO("store", "Opened %s (log level %s)", config_.path.c_str(), to_string(get_log_level()));
}

void tether_db::ensure_table(const entity_type& type) {
    if (ensured_types_.count(type.name())) return;
    db_.ensure_table(type.schema());
    ensured_types_.insert(type.name());
}

record_ptr tether_db::build(const std::shared_ptr<entity_type>& type, const attributes_t& attributes) {
    return record::make(type, this, attributes);
}

record_ptr tether_db::hydrate(const std::shared_ptr<entity_type>& base, const database::row_t& row) {
    auto type = base;
    if (auto it = row.find("_type"); it != row.end()) {
        if (auto* name = std::get_if<std::string>(&it->second); name && *name != base->name()) {
            auto concrete = type_registry::instance().find(*name);
            if (concrete && concrete->is_a(*base)) {
                type = concrete;
            } else {
                LOG_WARN("store", "Row of unknown type %s hydrated as %s", name->c_str(), base->name().c_str());
            }
        }
    }

    auto r = record::make(type, this);
    for (const auto& [column, value] : row) {
        if (column == "id") {
            r->id_ = detail::to_identity(value);
        } else if (type->has_column(column)) {
            r->attributes_[column] = value;
        }
    }
    r->new_record_ = false;
    return r;
}

// ============================================================================
// Transaction frames
// ============================================================================

void tether_db::remember(record& r) {
    if (tx_frames_.empty()) return;
    auto& frame = tx_frames_.back();
    bool seen = std::any_of(frame.begin(), frame.end(),
                            [&](const persistence_snapshot& s) { return s.rec.get() == &r; });
    if (seen) return;
    frame.push_back({r.shared_from_this(), r.new_record_, r.id_, r.destroyed_, r.changed_});
}

void tether_db::commit_frame() {
    auto frame = std::move(tx_frames_.back());
    tx_frames_.pop_back();
    if (tx_frames_.empty()) return;

    // A savepoint was released; the enclosing transaction may still roll these back
    auto& parent = tx_frames_.back();
    for (auto& snapshot : frame) {
        bool seen = std::any_of(parent.begin(), parent.end(),
                                [&](const persistence_snapshot& s) { return s.rec == snapshot.rec; });
        if (!seen) parent.push_back(std::move(snapshot));
    }
}

void tether_db::rollback_frame() {
    auto frame = std::move(tx_frames_.back());
    tx_frames_.pop_back();
    for (auto it = frame.rbegin(); it != frame.rend(); ++it) {
        auto& r = *it->rec;
        r.new_record_ = it->new_record;
        r.id_ = it->id;
        r.destroyed_ = it->destroyed;
        r.changed_ = it->changed;
    }
    // Tables created inside the rolled back scope are gone again
    ensured_types_.clear();
    LOG_DEBUG("store", "Rolled back, restored %zu records", frame.size());
}

// ============================================================================
// Saving
// ============================================================================

bool tether_db::save(record& r) {
    if (r.is_destroyed()) {
        throw record_not_saved_error("cannot save a destroyed " + r.type().name());
    }
    if (!r.valid()) {
        LOG_DEBUG("store", "%s failed validation with %zu errors", r.type().name().c_str(), r.errors().size());
        return false;
    }
    return run_in_transaction([&] { return save_graph(r); });
}

void tether_db::save_or_throw(record& r) {
    if (!save(r)) {
        throw record_invalid_error(r.type().name(), r.errors().full_messages());
    }
}

bool tether_db::save_graph(record& r) {
    if (!save_belongs_to_targets(r)) return false;
    write_row(r);
    return autosave_collections(r);
}

bool tether_db::save_belongs_to_targets(record& r) {
    for (const auto& refl : r.type().reflections()) {
        if (refl->is_collection()) continue;
        auto* st = r.find_association_cache(refl->name());
        if (!st || !st->target_one) continue;

        auto target = st->target_one;
        if (target->is_new_record() || target->has_changes()) {
            if (!save(*target)) {
                r.errors().add(refl->name(), "is invalid");
                return false;
            }
        }
        column_value_t key = target->get(refl->primary_key());
        if (r.get(refl->foreign_key()) != key) {
            r.set(refl->foreign_key(), key);
        }
        st->snapshot = key;
    }
    return true;
}

void tether_db::write_row(record& r) {
    const auto& type = r.type();
    ensure_table(type);
    remember(r);

    if (r.is_new_record()) {
        std::vector<std::pair<std::string, column_value_t>> values;
        values.emplace_back("_type", type.name());
        for (const auto& col : type.columns()) {
            values.emplace_back(col.name, r.get(col.name));
        }
        r.id_ = db_.insert(type.table_name(), values);
        r.new_record_ = false;
        LOG_DEBUG("store", "Inserted %s id=%lld", type.name().c_str(), static_cast<long long>(*r.id_));
    } else if (r.has_changes()) {
        std::vector<std::pair<std::string, column_value_t>> values;
        for (const auto& name : r.changed()) {
            values.emplace_back(name, r.get(name));
        }
        db_.update(type.table_name(), *r.id_, values);
        LOG_DEBUG("store", "Updated %s id=%lld (%zu columns)", type.name().c_str(),
                  static_cast<long long>(*r.id_), values.size());
    }
    r.changes_applied();
}

bool tether_db::autosave_collections(record& r) {
    auto self = r.shared_from_this();
    for (const auto& refl : r.type().reflections()) {
        if (!refl->is_collection()) continue;
        auto* st = r.find_association_cache(refl->name());
        if (!st || st->target.empty()) continue;

        has_many_association assoc(self, refl);
        column_value_t key = r.get(refl->primary_key());
        std::vector<record_ptr> members = st->target;
        for (const auto& m : members) {
            if (m->is_destroyed()) continue;
            if (!m->is_new_record() && !m->has_changes() && m->get(refl->foreign_key()) == key) continue;
            if (!assoc.insert_record(*m, false)) {
                r.errors().add(refl->name(), "is invalid");
                return false;
            }
        }
    }
    return true;
}

// ============================================================================
// Destroying
// ============================================================================

bool tether_db::destroy(record& r) {
    if (r.is_destroyed()) return true;
    if (r.is_new_record()) {
        r.destroyed_ = true;
        return true;
    }

    auto self = r.shared_from_this();
    return run_in_transaction([&] {
        for (const auto& refl : r.type().reflections()) {
            if (!refl->is_collection() || refl->dependent() == dependent_policy::none) continue;
            if (!has_many_association(self, refl).handle_dependency()) {
                LOG_DEBUG("cascade", "%s id=%lld kept by %s", r.type().name().c_str(),
                          static_cast<long long>(*r.id_), refl->name().c_str());
                return false;
            }
        }
        remember(r);
        db_.remove(r.type().table_name(), *r.id_);
        r.destroyed_ = true;
        LOG_DEBUG("store", "Destroyed %s id=%lld", r.type().name().c_str(), static_cast<long long>(*r.id_));
        return true;
    });
}

// ============================================================================
// Finding
// ============================================================================

relation_scope tether_db::all(const std::shared_ptr<entity_type>& type) {
    return relation_scope(*this, type);
}

std::vector<record_ptr> tether_db::find(const std::shared_ptr<entity_type>& type,
                                        const std::vector<primary_key_t>& ids) {
    if (ids.empty()) return {};

    std::vector<column_value_t> keys(ids.begin(), ids.end());
    auto records = all(type).where_in("id", keys).to_list();

    std::vector<primary_key_t> missing;
    for (auto id : ids) {
        bool found = std::any_of(records.begin(), records.end(),
                                 [&](const record_ptr& r) { return r->id() == id; });
        if (!found && std::find(missing.begin(), missing.end(), id) == missing.end()) {
            missing.push_back(id);
        }
    }
    if (!missing.empty()) {
        std::string list;
        for (size_t i = 0; i < missing.size(); ++i) {
            if (i > 0) list += ", ";
            list += std::to_string(missing[i]);
        }
        throw record_not_found_error("Couldn't find all " + type->name() + " with ids (" + list + ")");
    }
    return records;
}

record_ptr tether_db::find(const std::shared_ptr<entity_type>& type, primary_key_t id) {
    return find(type, std::vector<primary_key_t>{id}).front();
}

} // namespace tether
