#include "certificate.hpp"
#include "key_errors.hpp"
#include "rnp_handles.hpp"
#include "input_validator.hpp"
#include <boost/json.hpp>
#include <fstream>
#include <iterator>

namespace json = boost::json;

namespace wkd {

namespace {

const char kIdentifierFingerprint[] = "fingerprint";
constexpr int64_t kSubkeyBindingSignature = 0x18;
constexpr int64_t kKeyFlagsSubpacket = 27;

struct BindingSignature {
    uint32_t created = 0;
    std::optional<uint8_t> flags;
};

std::optional<int64_t> json_int(const json::object& obj, const char* field) {
    auto* v = obj.if_contains(field);
    if (!v || !v->is_number()) return std::nullopt;
    return v->to_number<int64_t>();
}

// Only valid subkey binding signatures count as self-signatures of a subkey.
std::optional<BindingSignature> read_binding_signature(rnp_signature_handle_t sig) {
    if (rnp_signature_is_valid(sig, 0) != RNP_SUCCESS) {
        return std::nullopt;
    }

    char* raw_json = nullptr;
    if (rnp_signature_packet_to_json(sig, 0, &raw_json) != RNP_SUCCESS) {
        return std::nullopt;
    }
    rnp::BufferPtr dump(raw_json);

    try {
        auto doc = InputValidator::safe_parse_json(dump.get());
        const json::object* packet = nullptr;
        if (doc.is_array() && !doc.as_array().empty()) {
            packet = doc.as_array()[0].if_object();
        } else {
            packet = doc.if_object();
        }
        if (!packet || json_int(*packet, "type") != kSubkeyBindingSignature) {
            return std::nullopt;
        }

        BindingSignature binding;
        if (rnp_signature_get_creation(sig, &binding.created) != RNP_SUCCESS) {
            return std::nullopt;
        }

        auto* subpackets = packet->if_contains("subpackets");
        if (subpackets && subpackets->is_array()) {
            for (const auto& sp : subpackets->as_array()) {
                auto* obj = sp.if_object();
                if (!obj || json_int(*obj, "type") != kKeyFlagsSubpacket) continue;
                if (auto flags = json_int(*obj, "flags")) {
                    binding.flags = static_cast<uint8_t>(*flags);
                }
            }
        }
        return binding;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void import_packets(rnp_ffi_t ffi, const std::vector<uint8_t>& bytes, uint32_t flags) {
    if (bytes.empty()) {
        throw ParseError("Empty certificate data");
    }
    rnp_input_t raw_input = nullptr;
    rnp::check<ParseError>(rnp_input_from_memory(&raw_input, bytes.data(), bytes.size(), false),
                           "Cannot open certificate data");
    rnp::InputPtr input(raw_input);

    char* raw_results = nullptr;
    rnp::check<ParseError>(rnp_import_keys(ffi, input.get(), flags | RNP_LOAD_SAVE_SINGLE, &raw_results),
                           "Malformed certificate");
    rnp::BufferPtr results(raw_results);
}

rnp::KeyPtr locate_key(rnp_ffi_t ffi, const Fingerprint& fp) {
    rnp_key_handle_t raw_key = nullptr;
    if (rnp_locate_key(ffi, kIdentifierFingerprint, fp.c_str(), &raw_key) != RNP_SUCCESS || !raw_key) {
        throw KeyError("Key " + fp + " not present in context");
    }
    return rnp::KeyPtr(raw_key);
}

rnp::KeyPtr locate_primary(rnp_ffi_t ffi) {
    rnp_identifier_iterator_t raw_it = nullptr;
    rnp::check<ParseError>(rnp_identifier_iterator_create(ffi, &raw_it, kIdentifierFingerprint),
                           "Cannot enumerate keys");
    rnp::IteratorPtr it(raw_it);

    const char* identifier = nullptr;
    while (rnp_identifier_iterator_next(it.get(), &identifier) == RNP_SUCCESS && identifier) {
        rnp_key_handle_t raw_key = nullptr;
        if (rnp_locate_key(ffi, kIdentifierFingerprint, identifier, &raw_key) != RNP_SUCCESS || !raw_key) {
            continue;
        }
        rnp::KeyPtr key(raw_key);
        bool primary = false;
        if (rnp_key_is_primary(key.get(), &primary) == RNP_SUCCESS && primary) {
            return key;
        }
    }
    throw ParseError("Input does not contain a primary key");
}

std::string key_fingerprint(rnp_key_handle_t key) {
    char* raw_fp = nullptr;
    rnp::check(rnp_key_get_fprint(key, &raw_fp), "Cannot read fingerprint");
    rnp::BufferPtr fp(raw_fp);
    return std::string(fp.get());
}

std::vector<uint8_t> export_key(rnp_key_handle_t key, uint32_t flags) {
    rnp_output_t raw_output = nullptr;
    rnp::check(rnp_output_to_memory(&raw_output, 0), "Cannot create output buffer");
    rnp::OutputPtr output(raw_output);

    rnp::check(rnp_key_export(key, output.get(), flags | RNP_KEY_EXPORT_SUBKEYS), "Certificate export failed");

    uint8_t* buf = nullptr;
    size_t len = 0;
    rnp::check(rnp_output_memory_get_buf(output.get(), &buf, &len, false), "Cannot read exported certificate");
    return std::vector<uint8_t>(buf, buf + len);
}

rnp::UidPtr uid_at(rnp_key_handle_t key, size_t idx) {
    rnp_uid_handle_t raw_uid = nullptr;
    rnp::check(rnp_key_get_uid_handle_at(key, idx, &raw_uid), "Cannot access user id");
    return rnp::UidPtr(raw_uid);
}

rnp::KeyPtr subkey_at(rnp_key_handle_t key, size_t idx) {
    rnp_key_handle_t raw_sub = nullptr;
    rnp::check(rnp_key_get_subkey_at(key, idx, &raw_sub), "Cannot access subkey");
    return rnp::KeyPtr(raw_sub);
}

UserId read_user_id(rnp_uid_handle_t uid) {
    uint32_t type = 0;
    rnp::check(rnp_uid_get_type(uid, &type), "Cannot read user id type");

    UserId user_id;
    user_id.is_attribute = (type != RNP_USER_ID);
    if (!user_id.is_attribute) {
        void* data = nullptr;
        size_t size = 0;
        rnp::check(rnp_uid_get_data(uid, &data, &size), "Cannot read user id");
        rnp::BufferPtr holder(static_cast<char*>(data));
        user_id.value.assign(holder.get(), size);
    }
    return user_id;
}

Subkey read_subkey(rnp_key_handle_t sub) {
    Subkey subkey;
    subkey.fingerprint = key_fingerprint(sub);

    size_t count = 0;
    rnp::check(rnp_key_get_signature_count(sub, &count), "Cannot count subkey signatures");

    std::optional<BindingSignature> newest;
    for (size_t i = 0; i < count; ++i) {
        rnp_signature_handle_t raw_sig = nullptr;
        if (rnp_key_get_signature_at(sub, i, &raw_sig) != RNP_SUCCESS) continue;
        rnp::SignaturePtr sig(raw_sig);

        auto binding = read_binding_signature(sig.get());
        if (binding && (!newest || binding->created >= newest->created)) {
            newest = binding;
        }
    }
    if (newest) {
        subkey.latest_self_signature_flags = newest->flags;
    }
    return subkey;
}

}

// Builds Certificate values from a live librnp key handle.
class CertificateBuilder {
public:
    static Certificate snapshot(rnp_key_handle_t key) {
        Certificate cert;
        cert.fingerprint_ = key_fingerprint(key);

        size_t uid_count = 0;
        rnp::check(rnp_key_get_uid_count(key, &uid_count), "Cannot count user ids");
        for (size_t i = 0; i < uid_count; ++i) {
            cert.user_ids_.push_back(read_user_id(uid_at(key, i).get()));
        }

        size_t subkey_count = 0;
        rnp::check(rnp_key_get_subkey_count(key, &subkey_count), "Cannot count subkeys");
        for (size_t i = 0; i < subkey_count; ++i) {
            cert.subkeys_.push_back(read_subkey(subkey_at(key, i).get()));
        }

        cert.packets_ = export_key(key, RNP_KEY_EXPORT_PUBLIC);

        rnp::check(rnp_key_is_revoked(key, &cert.revoked_), "Cannot read revocation status");

        bool secret = false;
        if (rnp_key_have_secret(key, &secret) == RNP_SUCCESS && secret) {
            cert.secret_packets_ = export_key(key, RNP_KEY_EXPORT_SECRET);
        }
        return cert;
    }

    // Loads the public packets of `source` into a scratch context, applies `edit`
    // to its primary key and snapshots the outcome.
    template <typename Edit>
    static Certificate rewrite(const Certificate& source, Edit&& edit) {
        auto ffi = rnp::make_ffi();
        import_packets(ffi.get(), source.packets_, RNP_LOAD_SAVE_PUBLIC_KEYS);
        auto key = locate_primary(ffi.get());
        edit(ffi.get(), key.get());
        return snapshot(key.get());
    }

    static Certificate strip(const Certificate& source) {
        Certificate cert = source;
        cert.secret_packets_.clear();
        cert.secret_packets_.shrink_to_fit();
        return cert;
    }

    static const std::vector<uint8_t>& packets(const Certificate& cert) { return cert.packets_; }
};

Certificate Certificate::parse(const std::vector<uint8_t>& bytes) {
    auto ffi = rnp::make_ffi();
    import_packets(ffi.get(), bytes, RNP_LOAD_SAVE_PUBLIC_KEYS | RNP_LOAD_SAVE_SECRET_KEYS);
    auto key = locate_primary(ffi.get());
    try {
        return CertificateBuilder::snapshot(key.get());
    } catch (const ParseError&) {
        throw;
    } catch (const KeyError& e) {
        throw ParseError(e.what());
    }
}

Certificate Certificate::parse(const std::string& bytes) {
    return parse(std::vector<uint8_t>(bytes.begin(), bytes.end()));
}

Certificate Certificate::from_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw ParseError("Not a regular file: " + path.string());
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ParseError("Cannot open " + path.string());
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    try {
        return parse(bytes);
    } catch (const ParseError& e) {
        throw ParseError(path.string() + ": " + e.what());
    }
}

std::string Certificate::to_armored() const {
    auto ffi = rnp::make_ffi();
    import_packets(ffi.get(), packets_, RNP_LOAD_SAVE_PUBLIC_KEYS);
    auto key = locate_primary(ffi.get());
    auto armored = export_key(key.get(), RNP_KEY_EXPORT_PUBLIC | RNP_KEY_EXPORT_ARMORED);
    return std::string(armored.begin(), armored.end());
}

std::vector<UserId> Certificate::valid_user_ids() const {
    std::vector<UserId> valid_ids;
    try {
        auto ffi = rnp::make_ffi();
        import_packets(ffi.get(), packets_, RNP_LOAD_SAVE_PUBLIC_KEYS);
        auto key = locate_primary(ffi.get());

        // Revoked or expired certificates evaluate to no valid identity.
        bool revoked = false;
        bool expired = false;
        rnp::check<PolicyError>(rnp_key_is_revoked(key.get(), &revoked), "Cannot read revocation status");
        rnp::check<PolicyError>(rnp_key_is_expired(key.get(), &expired), "Cannot read expiration status");
        if (revoked || expired) {
            return valid_ids;
        }

        bool key_valid = false;
        rnp::check<PolicyError>(rnp_key_is_valid(key.get(), &key_valid), "Cannot evaluate primary key");
        if (!key_valid) {
            throw PolicyError("Primary key " + fingerprint_ + " has no valid self-signature");
        }

        size_t count = 0;
        rnp::check<PolicyError>(rnp_key_get_uid_count(key.get(), &count), "Cannot count user ids");
        for (size_t i = 0; i < count; ++i) {
            auto uid = uid_at(key.get(), i);
            bool uid_valid = false;
            bool uid_revoked = false;
            if (rnp_uid_is_valid(uid.get(), &uid_valid) != RNP_SUCCESS || !uid_valid) continue;
            if (rnp_uid_is_revoked(uid.get(), &uid_revoked) != RNP_SUCCESS || uid_revoked) continue;

            auto user_id = read_user_id(uid.get());
            if (!user_id.is_attribute) {
                valid_ids.push_back(std::move(user_id));
            }
        }
    } catch (const PolicyError&) {
        throw;
    } catch (const KeyError& e) {
        throw PolicyError(std::string("Policy evaluation failed: ") + e.what());
    }
    return valid_ids;
}

Certificate Certificate::strip_secret_key_material() const {
    return CertificateBuilder::strip(*this);
}

Certificate Certificate::merge(const Certificate& other) const {
    if (other.fingerprint_ != fingerprint_) {
        throw KeyError("Cannot merge " + other.fingerprint_ + " into " + fingerprint_);
    }

    auto ffi = rnp::make_ffi();
    import_packets(ffi.get(), packets_, RNP_LOAD_SAVE_PUBLIC_KEYS);
    import_packets(ffi.get(), CertificateBuilder::packets(other), RNP_LOAD_SAVE_PUBLIC_KEYS);
    auto key = locate_key(ffi.get(), fingerprint_);
    return CertificateBuilder::snapshot(key.get());
}

Certificate Certificate::retain_user_ids(const std::function<bool(const UserId&)>& keep) const {
    return CertificateBuilder::rewrite(*this, [&keep](rnp_ffi_t, rnp_key_handle_t key) {
        size_t count = 0;
        rnp::check(rnp_key_get_uid_count(key, &count), "Cannot count user ids");
        // Walk backwards so removals do not shift the indices still to visit.
        for (size_t i = count; i > 0; --i) {
            auto uid = uid_at(key, i - 1);
            auto user_id = read_user_id(uid.get());
            if (!user_id.is_attribute && !keep(user_id)) {
                rnp::check(rnp_uid_remove(key, uid.get()), "Cannot remove user id");
            }
        }
    });
}

Certificate Certificate::retain_user_attributes(const std::function<bool(const UserId&)>& keep) const {
    return CertificateBuilder::rewrite(*this, [&keep](rnp_ffi_t, rnp_key_handle_t key) {
        size_t count = 0;
        rnp::check(rnp_key_get_uid_count(key, &count), "Cannot count user ids");
        for (size_t i = count; i > 0; --i) {
            auto uid = uid_at(key, i - 1);
            auto user_id = read_user_id(uid.get());
            if (user_id.is_attribute && !keep(user_id)) {
                rnp::check(rnp_uid_remove(key, uid.get()), "Cannot remove user attribute");
            }
        }
    });
}

Certificate Certificate::retain_subkeys(const std::function<bool(const Subkey&)>& keep) const {
    return CertificateBuilder::rewrite(*this, [&keep](rnp_ffi_t, rnp_key_handle_t key) {
        size_t count = 0;
        rnp::check(rnp_key_get_subkey_count(key, &count), "Cannot count subkeys");
        for (size_t i = count; i > 0; --i) {
            auto sub = subkey_at(key, i - 1);
            if (!keep(read_subkey(sub.get()))) {
                rnp::check(rnp_key_remove(sub.get(), RNP_KEY_REMOVE_PUBLIC), "Cannot remove subkey");
            }
        }
    });
}

}
