#include "directory_watcher.hpp"
#include "key_errors.hpp"
#include "security_logger.hpp"
#include "metrics.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <set>

namespace wkd {

namespace fs = std::filesystem;

namespace {
fs::path normalize_directory(const fs::path& directory) {
    fs::path normal = directory.lexically_normal();
    // "keys/" and "keys" must name the same directory.
    if (!normal.has_filename() && normal.has_parent_path() && normal != normal.root_path()) {
        normal = normal.parent_path();
    }
    return normal;
}
}

DirectoryWatcher::DirectoryWatcher(net::any_io_executor strand,
                                   fs::path directory,
                                   std::shared_ptr<CertificateStore> store,
                                   std::unique_ptr<NotificationSource> source,
                                   std::chrono::milliseconds retry_interval)
    : strand_(strand)
    , directory_(normalize_directory(directory))
    , store_(std::move(store))
    , source_(std::move(source))
    , retry_interval_(retry_interval)
    , retry_timer_(strand)
{}

void DirectoryWatcher::scan() {
    std::error_code ec;
    fs::directory_iterator it(directory_, ec);
    if (ec) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::WATCH_FAILURE,
                            "internal", "Cannot read key directory " + directory_.string() + ": " + ec.message());
        return;
    }

    std::set<fs::path> present;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code status_ec;
        if (!it->is_regular_file(status_ec)) continue;

        fs::path path = directory_ / it->path().filename();
        present.insert(path);
        load_file(path);
    }
    if (ec) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::WATCH_FAILURE,
                            "internal", "Key directory listing interrupted: " + ec.message());
        return;
    }

    for (const auto& path : store_->loaded_files()) {
        if (path.parent_path() == directory_ && !present.count(path)) {
            unload_file(path);
        }
    }
}

void DirectoryWatcher::start() {
    running_ = true;
    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE, "internal",
                        "Watching key directory " + directory_.string());
    scan();
    net::post(strand_, [self = shared_from_this()] { self->subscribe(); });
}

void DirectoryWatcher::stop() {
    running_ = false;
    net::dispatch(strand_, [self = shared_from_this()] {
        self->retry_timer_.cancel();
        self->source_->close();
        self->subscribed_ = false;
    });
}

void DirectoryWatcher::subscribe() {
    if (!running_) return;
    ++subscribe_attempts_;

    try {
        source_->open();
        source_->add_watch(directory_);
    } catch (const WatchSubsystemError& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::WATCH_FAILURE, "internal",
                            std::string(e.what()) + "; retrying in " +
                                std::to_string(retry_interval_.count()) + " ms");
        MetricsRegistry::instance().increment_counter(metric::watch_failures);
        source_->close();
        needs_rescan_ = true;
        schedule_retry();
        return;
    }

    subscribed_ = true;
    // Changes made while unsubscribed were never reported.
    if (needs_rescan_) {
        needs_rescan_ = false;
        scan();
    }
    read_events();
}

void DirectoryWatcher::schedule_retry() {
    retry_timer_.expires_after(retry_interval_);
    retry_timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        if (ec || !self->running_) return;
        self->subscribe();
    });
}

void DirectoryWatcher::read_events() {
    source_->async_next([self = shared_from_this()](const boost::system::error_code& ec,
                                                    std::vector<FileEvent> events) {
        // The source may complete on its own executor; hop back onto the strand.
        net::dispatch(self->strand_, [self, ec, events = std::move(events)]() mutable {
            self->on_events(ec, std::move(events));
        });
    });
}

void DirectoryWatcher::on_events(const boost::system::error_code& ec, std::vector<FileEvent> events) {
    if (!running_) return;

    if (ec) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::WATCH_FAILURE, "internal",
                            "Notification channel failed: " + ec.message());
        MetricsRegistry::instance().increment_counter(metric::watch_failures);
        subscribed_ = false;
        source_->close();
        needs_rescan_ = true;
        schedule_retry();
        return;
    }

    for (const auto& event : events) {
        if (event.kind == FileEvent::Kind::WatchLost) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::WATCH_FAILURE,
                                "internal", "Watch on " + directory_.string() + " was lost");
            subscribed_ = false;
            source_->close();
            needs_rescan_ = true;
            subscribe();
            return;
        }
        dispatch(event);
        ++events_handled_;
    }

    read_events();
}

void DirectoryWatcher::dispatch(const FileEvent& event) {
    switch (event.kind) {
        case FileEvent::Kind::Written:
        case FileEvent::Kind::MovedIn:
            load_file(directory_ / event.name);
            break;
        case FileEvent::Kind::Deleted:
        case FileEvent::Kind::MovedOut:
            unload_file(directory_ / event.name);
            break;
        case FileEvent::Kind::Overflow:
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::WATCH_FAILURE,
                                "internal", "Notification queue overflowed, rescanning");
            scan();
            break;
        case FileEvent::Kind::WatchLost:
            break;
    }
}

void DirectoryWatcher::load_file(const fs::path& path) {
    try {
        Fingerprint fp = store_->load(path);
        MetricsRegistry::instance().increment_counter(metric::keys_loaded);
        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::KEY_LOADED, "internal",
                            path.filename().string() + " -> " + fp);
    } catch (const std::exception& e) {
        MetricsRegistry::instance().increment_counter(metric::keys_load_failed);
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::KEY_REJECTED, "internal",
                            path.filename().string() + ": " + e.what());
    }
}

void DirectoryWatcher::unload_file(const fs::path& path) {
    try {
        Certificate removed = store_->unload(path);
        MetricsRegistry::instance().increment_counter(metric::keys_unloaded);
        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::KEY_UNLOADED, "internal",
                            path.filename().string() + " -> " + removed.fingerprint());
    } catch (const NotFoundError&) {
        // Files that were rejected on load were never tracked.
        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::KEY_UNLOADED, "internal",
                            path.filename().string() + ": not tracked, ignored");
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::KEY_UNLOADED, "internal",
                            path.filename().string() + ": " + e.what());
    }
}

}
