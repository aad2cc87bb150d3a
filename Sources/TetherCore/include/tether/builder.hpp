#pragma once

#ifdef __cplusplus

#include "entity_type.hpp"
#include "reflection.hpp"
#include <memory>
#include <string>

namespace tether {

// ============================================================================
// builder - relationship declarations
//
// Checks the name and every option before anything is registered, so a bad
// declaration fails with configuration_error when the type is defined.
// ============================================================================

class builder {
public:
    static std::shared_ptr<const reflection> has_many(const std::shared_ptr<entity_type>& owner,
                                                      const std::string& name,
                                                      const nlohmann::json& options = nullptr);

    static std::shared_ptr<const reflection> belongs_to(const std::shared_ptr<entity_type>& owner,
                                                        const std::string& name,
                                                        const nlohmann::json& options = nullptr);

    /// Same runtime as belongs_to: the owner holds the foreign key.
    static std::shared_ptr<const reflection> has_one(const std::shared_ptr<entity_type>& owner,
                                                     const std::string& name,
                                                     const nlohmann::json& options = nullptr) {
        return belongs_to(owner, name, options);
    }

private:
    static std::shared_ptr<const reflection> build(association_kind kind,
                                                   const std::shared_ptr<entity_type>& owner,
                                                   const std::string& name,
                                                   const nlohmann::json& options);

    static void validate_name(const std::string& name);
    static void validate_options(association_kind kind, const std::string& name, const nlohmann::json& options);
};

} // namespace tether

#endif // __cplusplus
