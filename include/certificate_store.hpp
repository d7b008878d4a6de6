#pragma once

#include <string>
#include <vector>
#include <map>
#include <unordered_map>
#include <optional>
#include <mutex>
#include <shared_mutex>
#include <filesystem>
#include <cstdint>

#include "certificate.hpp"

namespace wkd {

// One address a certificate was indexed under.
struct EmailIdentity {
    std::string encoded_local;  // WKD token of local_part
    std::string local_part;
    std::string domain;

    bool operator==(const EmailIdentity& other) const {
        return encoded_local == other.encoded_local && local_part == other.local_part &&
               domain == other.domain;
    }
};

struct IdentityMatch {
    std::string local_part;
    std::string domain;
    Certificate certificate;
};

/**
 * Concurrent index of imported certificates.
 *
 * Certificates are keyed by fingerprint, addressable through the email
 * identities of their valid user ids, and remember which files contributed
 * them so a file deletion can be reversed.
 *
 * Readers share one reader-writer lock; writers hold it exclusively and only
 * for the in-memory update. Reading files, parsing and policy evaluation
 * happen before the lock is taken.
 *
 * When two certificates claim the same identity the most recent import wins.
 * If the winner is later removed, the identity passes to the most recently
 * imported remaining certificate that still claims it.
 */
class CertificateStore {
public:
    CertificateStore() = default;
    ~CertificateStore() = default;

    CertificateStore(const CertificateStore&) = delete;
    CertificateStore& operator=(const CertificateStore&) = delete;

    /**
     * Strips secrets, indexes the valid identities and merges with any
     * certificate already stored under the same fingerprint.
     * @return fingerprint of the imported certificate.
     * @throws PolicyError if the certificate cannot be evaluated.
     */
    Fingerprint import(const Certificate& cert);

    /**
     * Parses `path`, imports it and records the file as a source of the
     * certificate. A file that previously contributed another certificate
     * releases it.
     * @throws ParseError, PolicyError
     */
    Fingerprint load(const std::filesystem::path& path);

    /**
     * Forgets the file. The certificate is deleted once no other file refers
     * to it.
     * @return the certificate the file contributed.
     * @throws NotFoundError if the path was never loaded.
     */
    Certificate unload(const std::filesystem::path& path);

    /**
     * Deletes a certificate, its identities and its file records.
     * @throws NotFoundError if nothing is stored under `fp`.
     */
    Certificate remove(const Fingerprint& fp);

    std::optional<Certificate> get(const Fingerprint& fp) const;

    // Exact match on (encoded local part, domain).
    std::optional<IdentityMatch> find_by_identity(const std::string& encoded_local,
                                                  const std::string& domain) const;

    std::vector<EmailIdentity> identities_of(const Fingerprint& fp) const;
    std::optional<Fingerprint> fingerprint_for(const std::filesystem::path& path) const;
    std::vector<std::filesystem::path> loaded_files() const;

    size_t certificate_count() const;
    size_t identity_count() const;
    size_t file_count() const;

private:
    struct IdentityKey {
        std::string encoded_local;
        std::string domain;

        bool operator<(const IdentityKey& other) const {
            return encoded_local != other.encoded_local ? encoded_local < other.encoded_local
                                                        : domain < other.domain;
        }
    };

    struct IdentityOwner {
        std::string local_part;
        Fingerprint fingerprint;
    };

    struct Entry {
        Certificate certificate;
        std::vector<EmailIdentity> claims;
        uint64_t generation;
    };

    // Secret-free certificate plus the identities it claims, computed without the lock.
    struct PreparedImport {
        Certificate certificate;
        std::vector<EmailIdentity> claims;
    };

    static PreparedImport prepare(const Certificate& cert);

    // The *_locked helpers expect the caller to hold the write lock.
    std::vector<std::string> commit_locked(PreparedImport&& prepared);
    Certificate erase_locked(const Fingerprint& fp, std::vector<std::string>& takeovers);
    bool referenced_by_file_locked(const Fingerprint& fp) const;
    void publish_gauges_locked() const;

    static void log_conflicts(const std::vector<std::string>& conflicts);

    std::unique_lock<std::shared_mutex> write_lock();
    std::shared_lock<std::shared_mutex> read_lock() const;

    static std::string path_key(const std::filesystem::path& path);

    std::unordered_map<Fingerprint, Entry> certificates_;
    std::map<IdentityKey, IdentityOwner> identities_;
    std::unordered_map<std::string, Fingerprint> files_;
    uint64_t next_generation_ = 0;

    mutable std::shared_mutex mutex_;
};

}
