#include "certificate_store.hpp"
#include "key_errors.hpp"
#include "local_part_encoder.hpp"
#include "security_logger.hpp"
#include "metrics.hpp"
#include <algorithm>
#include <system_error>

namespace wkd {

CertificateStore::PreparedImport CertificateStore::prepare(const Certificate& cert) {
    PreparedImport prepared{cert.strip_secret_key_material(), {}};

    for (const auto& uid : prepared.certificate.valid_user_ids()) {
        auto email = uid.email_normalized();
        if (!email) continue;

        auto parts = split_email(*email);
        if (!parts) continue;

        EmailIdentity identity{encode_local_part(parts->first), parts->first, parts->second};
        if (std::find(prepared.claims.begin(), prepared.claims.end(), identity) == prepared.claims.end()) {
            prepared.claims.push_back(std::move(identity));
        }
    }
    return prepared;
}

std::unique_lock<std::shared_mutex> CertificateStore::write_lock() {
    try {
        return std::unique_lock<std::shared_mutex>(mutex_);
    } catch (const std::system_error& e) {
        throw LockError(std::string("Cannot acquire store write lock: ") + e.what());
    }
}

std::shared_lock<std::shared_mutex> CertificateStore::read_lock() const {
    try {
        return std::shared_lock<std::shared_mutex>(mutex_);
    } catch (const std::system_error& e) {
        throw LockError(std::string("Cannot acquire store read lock: ") + e.what());
    }
}

std::string CertificateStore::path_key(const std::filesystem::path& path) {
    return path.lexically_normal().string();
}

// Merges or inserts the certificate and points its identities at it.
// Returns descriptions of identities taken over from other certificates.
std::vector<std::string> CertificateStore::commit_locked(PreparedImport&& prepared) {
    const Fingerprint fp = prepared.certificate.fingerprint();

    auto it = certificates_.find(fp);
    if (it != certificates_.end()) {
        // Computed before any assignment so a failed merge leaves the entry untouched.
        Certificate merged = it->second.certificate.merge(prepared.certificate);
        it->second.certificate = std::move(merged);
        for (auto& claim : prepared.claims) {
            auto& claims = it->second.claims;
            if (std::find(claims.begin(), claims.end(), claim) == claims.end()) {
                claims.push_back(claim);
            }
        }
        it->second.generation = next_generation_++;
    } else {
        certificates_.emplace(fp, Entry{std::move(prepared.certificate), prepared.claims, next_generation_++});
    }

    std::vector<std::string> conflicts;
    for (const auto& claim : prepared.claims) {
        IdentityKey key{claim.encoded_local, claim.domain};
        auto owner = identities_.find(key);
        if (owner != identities_.end() && owner->second.fingerprint != fp) {
            conflicts.push_back(claim.local_part + "@" + claim.domain + " moved from " +
                                owner->second.fingerprint + " to " + fp);
        }
        identities_[key] = IdentityOwner{claim.local_part, fp};
    }

    publish_gauges_locked();
    return conflicts;
}

// Drops the certificate and hands its identities to the newest remaining
// claimant. Each handover is appended to `takeovers`.
Certificate CertificateStore::erase_locked(const Fingerprint& fp, std::vector<std::string>& takeovers) {
    auto it = certificates_.find(fp);
    if (it == certificates_.end()) {
        throw NotFoundError("No certificate with fingerprint " + fp);
    }
    Certificate removed = std::move(it->second.certificate);
    certificates_.erase(it);

    std::vector<IdentityKey> orphaned;
    for (auto id = identities_.begin(); id != identities_.end();) {
        if (id->second.fingerprint == fp) {
            orphaned.push_back(id->first);
            id = identities_.erase(id);
        } else {
            ++id;
        }
    }

    for (auto file = files_.begin(); file != files_.end();) {
        if (file->second == fp) {
            file = files_.erase(file);
        } else {
            ++file;
        }
    }

    for (const auto& key : orphaned) {
        const Entry* heir = nullptr;
        const EmailIdentity* heir_claim = nullptr;
        for (const auto& [candidate_fp, entry] : certificates_) {
            for (const auto& claim : entry.claims) {
                if (claim.encoded_local == key.encoded_local && claim.domain == key.domain &&
                    (!heir || entry.generation > heir->generation)) {
                    heir = &entry;
                    heir_claim = &claim;
                }
            }
        }
        if (heir) {
            takeovers.push_back(heir_claim->local_part + "@" + key.domain + " passed from " + fp + " to " +
                                heir->certificate.fingerprint());
            identities_[key] = IdentityOwner{heir_claim->local_part, heir->certificate.fingerprint()};
        }
    }

    publish_gauges_locked();
    return removed;
}

void CertificateStore::log_conflicts(const std::vector<std::string>& conflicts) {
    for (const auto& conflict : conflicts) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::IDENTITY_CONFLICT,
                            "internal", conflict);
    }
}

bool CertificateStore::referenced_by_file_locked(const Fingerprint& fp) const {
    return std::any_of(files_.begin(), files_.end(),
                       [&fp](const auto& file) { return file.second == fp; });
}

void CertificateStore::publish_gauges_locked() const {
    auto& metrics = MetricsRegistry::instance();
    metrics.set_gauge(metric::certificates, static_cast<double>(certificates_.size()));
    metrics.set_gauge(metric::identities, static_cast<double>(identities_.size()));
}

Fingerprint CertificateStore::import(const Certificate& cert) {
    auto prepared = prepare(cert);
    const Fingerprint fp = prepared.certificate.fingerprint();

    std::vector<std::string> conflicts;
    {
        auto lock = write_lock();
        conflicts = commit_locked(std::move(prepared));
    }

    log_conflicts(conflicts);
    return fp;
}

Fingerprint CertificateStore::load(const std::filesystem::path& path) {
    auto prepared = prepare(Certificate::from_file(path));
    const Fingerprint fp = prepared.certificate.fingerprint();
    const std::string key = path_key(path);

    std::vector<std::string> conflicts;
    {
        auto lock = write_lock();
        conflicts = commit_locked(std::move(prepared));

        std::optional<Fingerprint> replaced;
        auto previous = files_.find(key);
        if (previous != files_.end() && previous->second != fp) {
            replaced = previous->second;
        }
        files_[key] = fp;

        if (replaced && !referenced_by_file_locked(*replaced) && certificates_.count(*replaced)) {
            erase_locked(*replaced, conflicts);
        }
    }

    log_conflicts(conflicts);
    return fp;
}

Certificate CertificateStore::unload(const std::filesystem::path& path) {
    std::vector<std::string> takeovers;
    std::optional<Certificate> removed;
    {
        auto lock = write_lock();

        auto file = files_.find(path_key(path));
        if (file == files_.end()) {
            throw NotFoundError("No certificate loaded from " + path.string());
        }
        Fingerprint fp = file->second;
        files_.erase(file);

        if (referenced_by_file_locked(fp)) {
            auto it = certificates_.find(fp);
            if (it == certificates_.end()) {
                throw NotFoundError("No certificate with fingerprint " + fp);
            }
            return it->second.certificate;
        }
        removed = erase_locked(fp, takeovers);
    }

    log_conflicts(takeovers);
    return std::move(*removed);
}

Certificate CertificateStore::remove(const Fingerprint& fp) {
    std::vector<std::string> takeovers;
    std::optional<Certificate> removed;
    {
        auto lock = write_lock();
        removed = erase_locked(fp, takeovers);
    }

    log_conflicts(takeovers);
    return std::move(*removed);
}

std::optional<Certificate> CertificateStore::get(const Fingerprint& fp) const {
    auto lock = read_lock();
    auto it = certificates_.find(fp);
    if (it == certificates_.end()) {
        return std::nullopt;
    }
    return it->second.certificate;
}

std::optional<IdentityMatch> CertificateStore::find_by_identity(const std::string& encoded_local,
                                                                const std::string& domain) const {
    auto lock = read_lock();
    auto owner = identities_.find(IdentityKey{encoded_local, domain});
    if (owner == identities_.end()) {
        return std::nullopt;
    }
    auto it = certificates_.find(owner->second.fingerprint);
    if (it == certificates_.end()) {
        return std::nullopt;
    }
    return IdentityMatch{owner->second.local_part, domain, it->second.certificate};
}

std::vector<EmailIdentity> CertificateStore::identities_of(const Fingerprint& fp) const {
    auto lock = read_lock();
    std::vector<EmailIdentity> result;
    for (const auto& [key, owner] : identities_) {
        if (owner.fingerprint == fp) {
            result.push_back(EmailIdentity{key.encoded_local, owner.local_part, key.domain});
        }
    }
    return result;
}

std::optional<Fingerprint> CertificateStore::fingerprint_for(const std::filesystem::path& path) const {
    auto lock = read_lock();
    auto it = files_.find(path_key(path));
    if (it == files_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::filesystem::path> CertificateStore::loaded_files() const {
    auto lock = read_lock();
    std::vector<std::filesystem::path> result;
    result.reserve(files_.size());
    for (const auto& [path, fp] : files_) {
        result.emplace_back(path);
    }
    return result;
}

size_t CertificateStore::certificate_count() const {
    auto lock = read_lock();
    return certificates_.size();
}

size_t CertificateStore::identity_count() const {
    auto lock = read_lock();
    return identities_.size();
}

size_t CertificateStore::file_count() const {
    auto lock = read_lock();
    return files_.size();
}

}
