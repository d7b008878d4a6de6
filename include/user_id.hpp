#pragma once

#include <string>
#include <optional>
#include <utility>

namespace wkd {

// A user id or user attribute packet bound to a certificate.
struct UserId {
    std::string value;          // raw packet text; empty for attributes
    bool is_attribute = false;  // user attribute (photo etc.) rather than a user id

    /**
     * Returns the address the user id declares, exactly as written.
     * Accepts "Name <local@domain>" and bare "local@domain" forms.
     */
    std::optional<std::string> email() const;

    // email() lowercased.
    std::optional<std::string> email_normalized() const;
};

// Splits an address on its last '@'. Both halves must be non-empty.
std::optional<std::pair<std::string, std::string>> split_email(const std::string& address);

}
