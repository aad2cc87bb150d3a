#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "entity_type.hpp"
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace tether {

class reflection;

struct serialize_options {
    std::vector<std::string> only;     // empty means every column
    std::vector<std::string> except;
    bool include_associations = true;  // off for nested records
};

class serializer {
public:
    /// `id`, the columns, then every reader of the type in declaration order.
    static nlohmann::json serialize(record& r, const serialize_options& options = {});
    static nlohmann::json serialize(const std::vector<record_ptr>& records, const serialize_options& options = {});
};

using record_serializer_t = std::function<nlohmann::json(record&)>;
using collection_serializer_t = std::function<nlohmann::json(const std::vector<record_ptr>&)>;

// Named serializer functions referenced by the serializer / eachSerializer options
class serializer_registry {
public:
    static serializer_registry& instance();

    void register_record_serializer(const std::string& name, record_serializer_t fn);
    void register_collection_serializer(const std::string& name, collection_serializer_t fn);

    /// Throw configuration_error for an unknown name.
    const record_serializer_t& record_serializer(const std::string& name) const;
    const collection_serializer_t& collection_serializer(const std::string& name) const;

private:
    serializer_registry() = default;
    std::unordered_map<std::string, record_serializer_t> records_;
    std::unordered_map<std::string, collection_serializer_t> collections_;
};

/// The reader the builder installs for a relationship.
reader_t make_association_reader(std::shared_ptr<const reflection> refl);

} // namespace tether

#endif // __cplusplus
