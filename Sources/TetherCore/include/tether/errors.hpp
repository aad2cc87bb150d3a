#pragma once

#ifdef __cplusplus

#include <stdexcept>
#include <string>
#include <vector>

namespace tether {

class tether_error : public std::runtime_error {
public:
    explicit tether_error(const std::string& msg) : std::runtime_error(msg) {}
};

/// Invalid relationship declaration: bad name, unknown option key or bad option value.
class configuration_error : public tether_error {
public:
    explicit configuration_error(const std::string& msg) : tether_error(msg) {}
};

/// A record of the wrong entity type was handed to a relationship mutation.
class type_mismatch_error : public tether_error {
public:
    explicit type_mismatch_error(const std::string& msg) : tether_error(msg) {}
};

class record_not_saved_error : public tether_error {
public:
    explicit record_not_saved_error(const std::string& msg) : tether_error(msg) {}
};

/// Strict save/create failed validation. Carries the record's messages.
class record_invalid_error : public record_not_saved_error {
public:
    record_invalid_error(const std::string& type_name, std::vector<std::string> messages)
        : record_not_saved_error(build_message(type_name, messages))
        , messages_(std::move(messages)) {}

    const std::vector<std::string>& messages() const { return messages_; }

private:
    static std::string build_message(const std::string& type_name,
                                      const std::vector<std::string>& messages) {
        std::string msg = "Validation failed for " + type_name + ": ";
        for (size_t i = 0; i < messages.size(); ++i) {
            if (i > 0) msg += ", ";
            msg += messages[i];
        }
        return msg;
    }

    std::vector<std::string> messages_;
};

class record_not_found_error : public tether_error {
public:
    explicit record_not_found_error(const std::string& msg) : tether_error(msg) {}
};

class record_not_destroyed_error : public tether_error {
public:
    explicit record_not_destroyed_error(const std::string& msg) : tether_error(msg) {}
};

/// Raised by the restrict_with_exception cascade. The owner is left in place.
class delete_restriction_error : public tether_error {
public:
    explicit delete_restriction_error(const std::string& association_name)
        : tether_error("Cannot delete record because of dependent " + association_name)
        , association_name_(association_name) {}

    const std::string& association_name() const { return association_name_; }

private:
    std::string association_name_;
};

} // namespace tether

#endif // __cplusplus
