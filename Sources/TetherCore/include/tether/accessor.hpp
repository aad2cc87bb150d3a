#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <memory>
#include <vector>

namespace tether {

class reflection;
class collection_proxy;

/// Reader/writer surface for one declared relationship, installed on the
/// owner type's capability table by the builder.
class relationship_accessor {
public:
    virtual ~relationship_accessor() = default;

    virtual const std::shared_ptr<const reflection>& metadata() const = 0;

    virtual collection_proxy read_many(record& owner, bool force_reload) const = 0;
    virtual void write_many(record& owner, const std::vector<record_ptr>& records) const = 0;

    virtual record_ptr read_one(record& owner, bool force_reload) const = 0;
    virtual void write_one(record& owner, record_ptr target) const = 0;
};

} // namespace tether

#endif // __cplusplus
