#include "certificate_sanitizer.hpp"
#include <algorithm>
#include <optional>

namespace wkd {

namespace {

// Picks the user id to publish: the first one declaring `target_email` that is
// valid now, else the first one declaring it at all.
std::optional<std::string> choose_user_id(const Certificate& cert, const std::string& target_email) {
    // Compared against the address as declared, not the normalized one.
    auto declares_target = [&target_email](const UserId& uid) {
        auto email = uid.email();
        return email && *email == target_email;
    };

    auto valid = cert.valid_user_ids();
    auto preferred = std::find_if(valid.begin(), valid.end(), declares_target);
    if (preferred != valid.end()) {
        return preferred->value;
    }

    for (const auto& uid : cert.user_ids()) {
        if (declares_target(uid)) return uid.value;
    }
    return std::nullopt;
}

}

Certificate sanitize(const Certificate& cert, const std::string& target_email) {
    auto chosen = choose_user_id(cert, target_email);

    bool kept = false;
    auto reduced = cert.retain_user_ids([&chosen, &kept](const UserId& uid) {
        if (kept || !chosen || uid.value != *chosen) return false;
        kept = true;
        return true;
    });

    reduced = reduced.retain_user_attributes([](const UserId&) { return false; });

    return reduced.retain_subkeys([](const Subkey& subkey) {
        return subkey.can_encrypt_transport() || subkey.can_sign();
    });
}

}
