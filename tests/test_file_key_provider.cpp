#include <gtest/gtest.h>
#include "file_key_provider.hpp"
#include "local_part_encoder.hpp"
#include "metrics.hpp"
#include "test_keys.hpp"
#include <boost/asio/io_context.hpp>

using namespace wkd;
using namespace wkd::testing;

class FileKeyProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        MetricsRegistry::instance().reset();
    }

    // Runs the io_context until `done` holds or the deadline passes.
    template <typename Pred>
    bool run_until(Pred done, std::chrono::milliseconds deadline = std::chrono::seconds(5)) {
        auto until = std::chrono::steady_clock::now() + deadline;
        while (!done()) {
            if (std::chrono::steady_clock::now() > until) return false;
            ioc.restart();
            ioc.run_for(std::chrono::milliseconds(20));
        }
        return true;
    }

    net::io_context ioc;
    TempDir dir;
};

TEST_F(FileKeyProviderTest, DiscoversScannedCertificate) {
    auto alice = generate_key({"Alice <alice@example.com>", "Alice <alice@elsewhere.example>"},
                              {"encrypt", "authenticate"});
    write_file(dir / "alice.pgp", alice.public_bytes);

    FileKeyProvider provider(ioc.get_executor(), dir.path());
    provider.start();

    auto cert = provider.discover(encode_local_part("alice"), "example.com");
    ASSERT_TRUE(cert.has_value());
    EXPECT_EQ(cert->fingerprint(), alice.fingerprint);
    ASSERT_EQ(cert->user_ids().size(), 1u);
    EXPECT_EQ(*cert->user_ids()[0].email(), "alice@example.com");
    ASSERT_EQ(cert->subkeys().size(), 1u);
    EXPECT_TRUE(cert->subkeys()[0].can_encrypt_transport());
    EXPECT_FALSE(cert->is_tsk());

    EXPECT_FALSE(provider.discover(encode_local_part("bob"), "example.com").has_value());
    EXPECT_FALSE(provider.discover(encode_local_part("alice"), "example.org").has_value());

    EXPECT_EQ(MetricsRegistry::instance().get_counter(metric::lookup_hits), 1.0);
    EXPECT_EQ(MetricsRegistry::instance().get_counter(metric::lookup_misses), 2.0);
}

TEST_F(FileKeyProviderTest, SecretKeyFilesArePublishedWithoutSecrets) {
    auto alice = generate_key({"alice@example.com"});
    write_file(dir / "alice.sec", alice.secret_bytes);

    FileKeyProvider provider(ioc.get_executor(), dir.path());
    provider.start();

    auto cert = provider.discover(encode_local_part("alice"), "example.com");
    ASSERT_TRUE(cert.has_value());
    EXPECT_FALSE(cert->is_tsk());
}

TEST_F(FileKeyProviderTest, FollowsDirectoryChanges) {
    FileKeyProvider provider(ioc.get_executor(), dir.path(), std::chrono::milliseconds(100));
    provider.start();
    ASSERT_TRUE(run_until([&] { return provider.watcher().subscribed(); }));

    const auto bob_token = encode_local_part("bob");
    EXPECT_FALSE(provider.discover(bob_token, "example.com").has_value());

    write_file(dir / "bob.pgp", generate_key({"bob@example.com"}).public_bytes);
    EXPECT_TRUE(run_until([&] { return provider.store().certificate_count() == 1; }));
    EXPECT_TRUE(provider.discover(bob_token, "example.com").has_value());

    std::filesystem::rename(dir / "bob.pgp", dir.path().parent_path() / ("moved_" + dir.path().filename().string()));
    EXPECT_TRUE(run_until([&] { return provider.store().certificate_count() == 0; }));
    EXPECT_FALSE(provider.discover(bob_token, "example.com").has_value());
    std::filesystem::remove(dir.path().parent_path() / ("moved_" + dir.path().filename().string()));
}
