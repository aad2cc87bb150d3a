#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "errors.hpp"
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <memory>

namespace tether {

class entity_type;

enum class association_kind {
    to_one,   // belongs_to / has_one
    to_many   // has_many
};

/// What happens to a collection's members when its owner is destroyed,
/// and how members removed from the collection are detached.
enum class dependent_policy {
    none,
    destroy,
    delete_all,
    nullify,
    restrict_with_exception,
    restrict_with_error
};

const char* to_string(dependent_policy policy);
std::optional<dependent_policy> parse_dependent_policy(const std::string& name);

// ============================================================================
// reflection - immutable metadata for one declared relationship
// ============================================================================

class reflection {
public:
    using type_resolver_t = std::function<std::shared_ptr<entity_type>()>;

    reflection(association_kind kind,
               std::string name,
               nlohmann::json options,
               const entity_type* owner_type,
               type_resolver_t related_type_resolver);

    association_kind kind() const { return kind_; }
    bool is_collection() const { return kind_ == association_kind::to_many; }
    const std::string& name() const { return name_; }
    const nlohmann::json& options() const { return options_; }
    const entity_type& owner_type() const { return *owner_type_; }

    /// Resolves the related type through the type registry on every call,
    /// so the related type may be defined after the declaration.
    std::shared_ptr<entity_type> related_type() const;

    // Linkage
    const std::string& class_name() const { return class_name_; }
    const std::string& foreign_key() const { return foreign_key_; }
    const std::string& primary_key() const { return primary_key_; }
    dependent_policy dependent() const { return dependent_; }

    /// The reflection on the related type that points back at the owner,
    /// from the inverseOf option or by matching foreign keys. May be null.
    std::shared_ptr<const reflection> inverse_of() const;

    // Serialization options
    bool embeds_ids() const;
    const nlohmann::json* virtual_value() const;
    std::vector<std::string> only() const;
    std::vector<std::string> except() const;
    std::optional<std::string> serializer() const;
    std::optional<std::string> each_serializer() const;

    /// Option allow-list for a kind.
    static const std::vector<std::string>& valid_options(association_kind kind);

private:
    association_kind kind_;
    std::string name_;
    nlohmann::json options_;
    const entity_type* owner_type_;
    type_resolver_t related_type_resolver_;

    std::string class_name_;
    std::string foreign_key_;
    std::string primary_key_;
    dependent_policy dependent_ = dependent_policy::none;

    std::optional<std::string> string_option(const char* key) const;
};

namespace detail {
    /// "comments" -> "Comment", "blog_posts" -> "BlogPost"
    std::string classify(const std::string& name);
    /// "BlogPost" -> "blog_post"
    std::string underscore(const std::string& name);
}

} // namespace tether

#endif // __cplusplus
