#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <chrono>
#include <filesystem>
#include <memory>

#include "key_provider.hpp"
#include "certificate_store.hpp"
#include "directory_watcher.hpp"

namespace wkd {

// Serves certificates found in one directory, kept current by a DirectoryWatcher.
class FileKeyProvider : public KeyProvider {
public:
    // Watches `directory` with inotify on a new strand of `executor`.
    FileKeyProvider(net::any_io_executor executor,
                    std::filesystem::path directory,
                    std::chrono::milliseconds retry_interval = std::chrono::seconds(5));

    // Uses the given notification source; `strand` must be the executor it completes on.
    FileKeyProvider(net::any_io_executor strand,
                    std::filesystem::path directory,
                    std::unique_ptr<NotificationSource> source,
                    std::chrono::milliseconds retry_interval = std::chrono::seconds(5));

    ~FileKeyProvider() override;

    FileKeyProvider(const FileKeyProvider&) = delete;
    FileKeyProvider& operator=(const FileKeyProvider&) = delete;

    // Scans the directory and begins watching it.
    void start();

    std::optional<Certificate> discover(const std::string& encoded_local,
                                        const std::string& domain) override;

    const CertificateStore& store() const { return *store_; }
    DirectoryWatcher& watcher() { return *watcher_; }

private:
    std::shared_ptr<CertificateStore> store_;
    std::shared_ptr<DirectoryWatcher> watcher_;
};

}
