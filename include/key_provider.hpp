#pragma once

#include <optional>
#include <string>

#include "certificate.hpp"

namespace wkd {

// Source of certificates for WKD lookups. The file-backed provider is the
// only implementation today; a database or remote directory can be added
// behind the same interface.
class KeyProvider {
public:
    virtual ~KeyProvider() = default;

    /**
     * Finds the certificate published for one address.
     * @param encoded_local WKD token of the local part (see encode_local_part).
     * @param domain Lowercase domain of the address.
     * @return the sanitized certificate, or std::nullopt if nothing is published.
     */
    virtual std::optional<Certificate> discover(const std::string& encoded_local,
                                                const std::string& domain) = 0;
};

}
