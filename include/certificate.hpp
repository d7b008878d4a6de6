#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <functional>
#include <filesystem>

#include "user_id.hpp"

namespace wkd {

// Uppercase hex fingerprint of a primary key.
using Fingerprint = std::string;

// OpenPGP key flags (RFC 4880, section 5.2.3.21).
namespace key_flags {
constexpr uint8_t certify = 0x01;
constexpr uint8_t sign = 0x02;
constexpr uint8_t encrypt_communications = 0x04;
constexpr uint8_t encrypt_storage = 0x08;
}

struct Subkey {
    Fingerprint fingerprint;
    // Key flags of the newest valid binding signature; empty without one.
    std::optional<uint8_t> latest_self_signature_flags;

    bool can_sign() const {
        return latest_self_signature_flags && (*latest_self_signature_flags & key_flags::sign);
    }
    bool can_encrypt_transport() const {
        return latest_self_signature_flags &&
               (*latest_self_signature_flags & key_flags::encrypt_communications);
    }
};

/**
 * Immutable OpenPGP certificate (transferable public key).
 *
 * Decoding, encoding and packet surgery are delegated to librnp. Every
 * transforming method returns a new value and leaves the receiver untouched.
 */
class Certificate {
public:
    /**
     * Decodes the first certificate found in binary or ASCII-armored input.
     * @throws ParseError on malformed or empty input.
     */
    static Certificate parse(const std::vector<uint8_t>& bytes);
    static Certificate parse(const std::string& bytes);

    // Reads and decodes a file. @throws ParseError if it cannot be read or decoded.
    static Certificate from_file(const std::filesystem::path& path);

    const Fingerprint& fingerprint() const { return fingerprint_; }
    const std::vector<UserId>& user_ids() const { return user_ids_; }
    const std::vector<Subkey>& subkeys() const { return subkeys_; }

    // True while secret key material is still attached.
    bool is_tsk() const { return !secret_packets_.empty(); }

    // True if the primary key carries a revocation signature from its owner.
    bool is_revoked() const { return revoked_; }

    // Public serialization (binary).
    const std::vector<uint8_t>& to_bytes() const { return packets_; }
    std::string to_armored() const;

    /**
     * Evaluates the certificate under the current validity policy.
     * @return user ids (not attributes) carrying a valid, unrevoked
     *         self-certification now. Empty for a revoked or expired primary key.
     * @throws PolicyError if the primary key has no valid self-signature or
     *         the evaluation itself fails.
     */
    std::vector<UserId> valid_user_ids() const;

    Certificate strip_secret_key_material() const;

    // Combines two copies of the same certificate. @throws KeyError on fingerprint mismatch.
    Certificate merge(const Certificate& other) const;

    // Keeps the user ids accepted by `keep`; user attributes are not affected.
    Certificate retain_user_ids(const std::function<bool(const UserId&)>& keep) const;
    Certificate retain_user_attributes(const std::function<bool(const UserId&)>& keep) const;
    Certificate retain_subkeys(const std::function<bool(const Subkey&)>& keep) const;

    bool operator==(const Certificate& other) const {
        return packets_ == other.packets_ && secret_packets_ == other.secret_packets_;
    }
    bool operator!=(const Certificate& other) const { return !(*this == other); }

private:
    Certificate() = default;
    friend class CertificateBuilder;

    Fingerprint fingerprint_;
    std::vector<UserId> user_ids_;
    std::vector<Subkey> subkeys_;
    std::vector<uint8_t> packets_;
    std::vector<uint8_t> secret_packets_;
    bool revoked_ = false;
};

}
