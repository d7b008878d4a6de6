#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>

#include "certificate_store.hpp"
#include "notification_source.hpp"

namespace wkd {

/**
 * Keeps a CertificateStore in sync with one directory.
 *
 * All work after start() runs as handlers on the executor passed in, which
 * must be a strand: at most one event is being applied at any time. The
 * watcher keeps itself alive through its pending handlers, so it must be
 * created with std::make_shared.
 */
class DirectoryWatcher : public std::enable_shared_from_this<DirectoryWatcher> {
public:
    DirectoryWatcher(net::any_io_executor strand,
                     std::filesystem::path directory,
                     std::shared_ptr<CertificateStore> store,
                     std::unique_ptr<NotificationSource> source,
                     std::chrono::milliseconds retry_interval = std::chrono::seconds(5));

    /**
     * Loads every regular file in the directory and unloads tracked files
     * that have disappeared. Per-file failures are logged and skipped; a
     * missing or unreadable directory is logged and leaves the store as is.
     */
    void scan();

    // Runs the initial scan on the calling thread, then subscribes on the strand.
    void start();

    // Cancels the backoff timer and closes the source. Pending handlers become no-ops.
    void stop();

    const std::filesystem::path& directory() const { return directory_; }

    size_t subscribe_attempts() const { return subscribe_attempts_; }
    size_t events_handled() const { return events_handled_; }
    bool subscribed() const { return subscribed_; }

private:
    void subscribe();
    void schedule_retry();
    void read_events();
    void on_events(const boost::system::error_code& ec, std::vector<FileEvent> events);
    void dispatch(const FileEvent& event);

    void load_file(const std::filesystem::path& path);
    void unload_file(const std::filesystem::path& path);

    net::any_io_executor strand_;
    std::filesystem::path directory_;
    std::shared_ptr<CertificateStore> store_;
    std::unique_ptr<NotificationSource> source_;
    std::chrono::milliseconds retry_interval_;
    net::steady_timer retry_timer_;

    std::atomic<bool> running_{false};
    std::atomic<bool> subscribed_{false};
    std::atomic<size_t> subscribe_attempts_{0};
    std::atomic<size_t> events_handled_{0};
    bool needs_rescan_ = false;
};

}
