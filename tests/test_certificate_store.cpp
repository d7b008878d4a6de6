#include <gtest/gtest.h>
#include "certificate_store.hpp"
#include "key_errors.hpp"
#include "local_part_encoder.hpp"
#include "test_keys.hpp"

using namespace wkd;
using namespace wkd::testing;

class CertificateStoreTest : public ::testing::Test {
protected:
    CertificateStore store;
    TempDir dir;
};

TEST_F(CertificateStoreTest, ImportIndexesIdentities) {
    auto key = generate_key({"Alice <Alice@Example.com>", "alice@other.example", "No Address"});
    auto fp = store.import(Certificate::parse(key.public_bytes));

    EXPECT_EQ(fp, key.fingerprint);
    EXPECT_EQ(store.certificate_count(), 1u);
    EXPECT_EQ(store.identity_count(), 2u);

    auto match = store.find_by_identity(encode_local_part("alice"), "example.com");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->local_part, "alice");
    EXPECT_EQ(match->domain, "example.com");
    EXPECT_EQ(match->certificate.fingerprint(), fp);

    EXPECT_TRUE(store.find_by_identity(encode_local_part("alice"), "other.example").has_value());
    EXPECT_FALSE(store.find_by_identity(encode_local_part("alice"), "example.org").has_value());
    EXPECT_FALSE(store.find_by_identity(encode_local_part("bob"), "example.com").has_value());
}

TEST_F(CertificateStoreTest, ImportStripsSecrets) {
    auto key = generate_key({"alice@example.com"});
    auto fp = store.import(Certificate::parse(key.secret_bytes));

    auto stored = store.get(fp);
    ASSERT_TRUE(stored.has_value());
    EXPECT_FALSE(stored->is_tsk());
}

TEST_F(CertificateStoreTest, ImportIdempotent) {
    auto cert = Certificate::parse(generate_key({"alice@example.com"}).public_bytes);

    auto fp = store.import(cert);
    auto first = store.get(fp);
    auto first_identities = store.identities_of(fp);

    store.import(cert);
    EXPECT_EQ(store.certificate_count(), 1u);
    EXPECT_EQ(store.identity_count(), 1u);
    EXPECT_EQ(store.get(fp)->to_bytes(), first->to_bytes());
    EXPECT_EQ(store.identities_of(fp), first_identities);
}

TEST_F(CertificateStoreTest, ImportMergesSameFingerprint) {
    auto full = Certificate::parse(generate_key({"alice@example.com", "alice@other.example"}).public_bytes);
    auto no_subkeys = full.retain_subkeys([](const Subkey&) { return false; });
    auto one_uid = full.retain_user_ids([](const UserId& uid) { return uid.value == "alice@other.example"; });

    store.import(no_subkeys);
    auto fp = store.import(one_uid);

    EXPECT_EQ(store.certificate_count(), 1u);
    auto stored = store.get(fp);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->subkeys().size(), 1u);
    EXPECT_EQ(stored->user_ids().size(), 2u);
    EXPECT_EQ(store.identities_of(fp).size(), 2u);
}

TEST_F(CertificateStoreTest, LoadUnloadInverse) {
    auto key = generate_key({"alice@example.com"});
    write_file(dir / "alice.pgp", key.public_bytes);

    auto fp = store.load(dir / "alice.pgp");
    EXPECT_EQ(store.fingerprint_for(dir / "alice.pgp"), fp);
    EXPECT_EQ(store.file_count(), 1u);

    auto removed = store.unload(dir / "alice.pgp");
    EXPECT_EQ(removed.fingerprint(), fp);
    EXPECT_EQ(store.certificate_count(), 0u);
    EXPECT_EQ(store.identity_count(), 0u);
    EXPECT_EQ(store.file_count(), 0u);
    EXPECT_FALSE(store.get(fp).has_value());
    EXPECT_FALSE(store.find_by_identity(encode_local_part("alice"), "example.com").has_value());
}

TEST_F(CertificateStoreTest, UnloadKeepsCertificateReferencedElsewhere) {
    auto key = generate_key({"alice@example.com"});
    write_file(dir / "a.pgp", key.public_bytes);
    write_file(dir / "b.pgp", key.public_bytes);

    auto fp = store.load(dir / "a.pgp");
    store.load(dir / "b.pgp");
    EXPECT_EQ(store.certificate_count(), 1u);

    store.unload(dir / "a.pgp");
    EXPECT_TRUE(store.get(fp).has_value());
    EXPECT_TRUE(store.find_by_identity(encode_local_part("alice"), "example.com").has_value());

    store.unload(dir / "b.pgp");
    EXPECT_FALSE(store.get(fp).has_value());
}

TEST_F(CertificateStoreTest, ReloadWithDifferentCertificateReleasesOld) {
    auto alice = generate_key({"alice@example.com"});
    auto bob = generate_key({"bob@example.com"});

    write_file(dir / "key.pgp", alice.public_bytes);
    auto old_fp = store.load(dir / "key.pgp");

    write_file(dir / "key.pgp", bob.public_bytes);
    auto new_fp = store.load(dir / "key.pgp");

    EXPECT_NE(old_fp, new_fp);
    EXPECT_FALSE(store.get(old_fp).has_value());
    EXPECT_FALSE(store.find_by_identity(encode_local_part("alice"), "example.com").has_value());
    EXPECT_TRUE(store.find_by_identity(encode_local_part("bob"), "example.com").has_value());
    EXPECT_EQ(store.file_count(), 1u);
}

TEST_F(CertificateStoreTest, LoadFailuresLeaveStoreUntouched) {
    write_file(dir / "junk.pgp", std::string("not a key"));
    EXPECT_THROW(store.load(dir / "junk.pgp"), ParseError);
    EXPECT_THROW(store.load(dir / "missing.pgp"), ParseError);
    EXPECT_EQ(store.certificate_count(), 0u);
    EXPECT_EQ(store.file_count(), 0u);
}

TEST_F(CertificateStoreTest, UnknownTargets) {
    EXPECT_THROW(store.unload(dir / "never-loaded.pgp"), NotFoundError);
    EXPECT_THROW(store.remove("0000000000000000000000000000000000000000"), NotFoundError);
}

TEST_F(CertificateStoreTest, RemovePurgesIdentitiesAndFiles) {
    auto key = generate_key({"alice@example.com", "alice@other.example"});
    write_file(dir / "alice.pgp", key.public_bytes);
    auto fp = store.load(dir / "alice.pgp");

    auto removed = store.remove(fp);
    EXPECT_EQ(removed.fingerprint(), fp);
    EXPECT_EQ(store.identity_count(), 0u);
    EXPECT_EQ(store.file_count(), 0u);
    EXPECT_THROW(store.unload(dir / "alice.pgp"), NotFoundError);
}

TEST_F(CertificateStoreTest, IdentityConflictLastWriteWins) {
    auto first = generate_key({"alice@example.com"});
    auto second = generate_key({"Alice Again <alice@example.com>"});
    const auto token = encode_local_part("alice");

    store.import(Certificate::parse(first.public_bytes));
    store.import(Certificate::parse(second.public_bytes));

    EXPECT_EQ(store.certificate_count(), 2u);
    EXPECT_EQ(store.identity_count(), 1u);
    EXPECT_EQ(store.find_by_identity(token, "example.com")->certificate.fingerprint(), second.fingerprint);

    // Removing the winner hands the address back to the remaining claimant.
    store.remove(second.fingerprint);
    auto match = store.find_by_identity(token, "example.com");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->certificate.fingerprint(), first.fingerprint);

    store.remove(first.fingerprint);
    EXPECT_FALSE(store.find_by_identity(token, "example.com").has_value());
}

TEST_F(CertificateStoreTest, RemovingLoserKeepsWinner) {
    auto first = generate_key({"alice@example.com"});
    auto second = generate_key({"alice@example.com"});
    const auto token = encode_local_part("alice");

    store.import(Certificate::parse(first.public_bytes));
    store.import(Certificate::parse(second.public_bytes));
    store.remove(first.fingerprint);

    EXPECT_EQ(store.find_by_identity(token, "example.com")->certificate.fingerprint(), second.fingerprint);
}

TEST_F(CertificateStoreTest, HandoverIsLogged) {
    auto first = generate_key({"alice@example.com"});
    auto second = generate_key({"alice@example.com"});

    store.import(Certificate::parse(first.public_bytes));
    store.import(Certificate::parse(second.public_bytes));

    CoutCapture capture;
    store.remove(second.fingerprint);

    std::string out = capture.str();
    EXPECT_NE(out.find("IDENTITY_CONFLICT"), std::string::npos);
    EXPECT_NE(out.find("alice@example.com passed from " + second.fingerprint + " to " + first.fingerprint),
              std::string::npos);
}

TEST_F(CertificateStoreTest, UnloadHandoverIsLogged) {
    auto first = generate_key({"alice@example.com"});
    auto second = generate_key({"alice@example.com"});
    write_file(dir / "first.pgp", first.public_bytes);
    write_file(dir / "second.pgp", second.public_bytes);

    store.load(dir / "first.pgp");
    store.load(dir / "second.pgp");

    CoutCapture capture;
    store.unload(dir / "second.pgp");

    EXPECT_NE(capture.str().find("passed from " + second.fingerprint + " to " + first.fingerprint),
              std::string::npos);
    EXPECT_EQ(store.find_by_identity(encode_local_part("alice"), "example.com")->certificate.fingerprint(),
              first.fingerprint);
}

TEST_F(CertificateStoreTest, RemovalWithoutHeirLogsNothing) {
    auto key = generate_key({"alice@example.com"});
    store.import(Certificate::parse(key.public_bytes));

    CoutCapture capture;
    store.remove(key.fingerprint);
    EXPECT_EQ(capture.str().find("IDENTITY_CONFLICT"), std::string::npos);
}

TEST_F(CertificateStoreTest, ImportRevokedCertificate) {
    auto key = generate_key({"alice@example.com"});
    auto fp = store.import(Certificate::parse(revoke_key(key)));

    EXPECT_EQ(fp, key.fingerprint);
    EXPECT_EQ(store.certificate_count(), 1u);
    EXPECT_EQ(store.identity_count(), 0u);
    ASSERT_TRUE(store.get(fp).has_value());
    EXPECT_TRUE(store.get(fp)->is_revoked());
}

TEST_F(CertificateStoreTest, ReloadPublishesRevocation) {
    auto key = generate_key({"alice@example.com"});
    const auto token = encode_local_part("alice");
    write_file(dir / "alice.pgp", key.public_bytes);
    store.load(dir / "alice.pgp");
    ASSERT_FALSE(store.find_by_identity(token, "example.com")->certificate.is_revoked());

    write_file(dir / "alice.pgp", revoke_key(key));
    EXPECT_EQ(store.load(dir / "alice.pgp"), key.fingerprint);

    EXPECT_EQ(store.file_count(), 1u);
    EXPECT_EQ(store.certificate_count(), 1u);
    EXPECT_TRUE(store.get(key.fingerprint)->is_revoked());

    // The address keeps resolving, now to the revoked copy.
    auto match = store.find_by_identity(token, "example.com");
    ASSERT_TRUE(match.has_value());
    EXPECT_TRUE(match->certificate.is_revoked());
}
