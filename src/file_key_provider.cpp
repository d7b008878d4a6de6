#include "file_key_provider.hpp"
#include "certificate_sanitizer.hpp"
#include "key_errors.hpp"
#include "security_logger.hpp"
#include "metrics.hpp"
#include <boost/asio/strand.hpp>

namespace wkd {

FileKeyProvider::FileKeyProvider(net::any_io_executor executor,
                                 std::filesystem::path directory,
                                 std::chrono::milliseconds retry_interval)
    : store_(std::make_shared<CertificateStore>())
{
    net::any_io_executor strand = net::make_strand(executor);
    watcher_ = std::make_shared<DirectoryWatcher>(strand, std::move(directory), store_,
                                                  std::make_unique<InotifySource>(strand), retry_interval);
}

FileKeyProvider::FileKeyProvider(net::any_io_executor strand,
                                 std::filesystem::path directory,
                                 std::unique_ptr<NotificationSource> source,
                                 std::chrono::milliseconds retry_interval)
    : store_(std::make_shared<CertificateStore>())
    , watcher_(std::make_shared<DirectoryWatcher>(strand, std::move(directory), store_, std::move(source),
                                                  retry_interval))
{}

FileKeyProvider::~FileKeyProvider() {
    watcher_->stop();
}

void FileKeyProvider::start() {
    watcher_->start();
}

std::optional<Certificate> FileKeyProvider::discover(const std::string& encoded_local,
                                                     const std::string& domain) {
    auto& metrics = MetricsRegistry::instance();

    std::optional<IdentityMatch> match;
    try {
        match = store_->find_by_identity(encoded_local, domain);
    } catch (const LockError& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::LOOKUP, "internal",
                            std::string("Lookup degraded to not found: ") + e.what());
    }

    if (!match) {
        metrics.increment_counter(metric::lookup_misses);
        return std::nullopt;
    }

    try {
        Certificate published = sanitize(match->certificate, match->local_part + "@" + match->domain);
        metrics.increment_counter(metric::lookup_hits);
        return published;
    } catch (const KeyError& e) {
        metrics.increment_counter(metric::lookup_misses);
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::LOOKUP, "internal",
                            "Cannot sanitize " + match->certificate.fingerprint() + ": " + e.what());
        return std::nullopt;
    }
}

}
