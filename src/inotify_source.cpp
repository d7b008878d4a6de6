#include "notification_source.hpp"
#include "key_errors.hpp"
#include <boost/asio/error.hpp>
#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace wkd {

namespace {
constexpr uint32_t kWatchMask = IN_CLOSE_WRITE | IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO |
                                IN_DELETE_SELF | IN_MOVE_SELF | IN_ONLYDIR;
}

InotifySource::InotifySource(net::any_io_executor executor)
    : descriptor_(executor)
{}

InotifySource::~InotifySource() {
    close();
}

void InotifySource::open() {
    if (descriptor_.is_open()) return;

    int fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0) {
        throw WatchSubsystemError(std::string("inotify_init1 failed: ") + std::strerror(errno));
    }

    boost::system::error_code ec;
    descriptor_.assign(fd, ec);
    if (ec) {
        ::close(fd);
        throw WatchSubsystemError("Cannot register inotify descriptor: " + ec.message());
    }
}

void InotifySource::add_watch(const std::filesystem::path& directory) {
    if (!descriptor_.is_open()) {
        throw WatchSubsystemError("inotify descriptor is not open");
    }
    int wd = inotify_add_watch(descriptor_.native_handle(), directory.c_str(), kWatchMask);
    if (wd < 0) {
        throw WatchSubsystemError("Cannot watch " + directory.string() + ": " + std::strerror(errno));
    }
}

void InotifySource::async_next(Handler handler) {
    descriptor_.async_read_some(
        net::buffer(buffer_),
        [this, handler = std::move(handler)](const boost::system::error_code& ec, std::size_t bytes) {
            if (ec) {
                handler(ec, {});
                return;
            }
            if (bytes == 0) {
                handler(net::error::eof, {});
                return;
            }
            handler(ec, decode(buffer_.data(), bytes));
        });
}

void InotifySource::close() {
    if (!descriptor_.is_open()) return;
    // Closing the descriptor also drops its watches and cancels pending reads.
    boost::system::error_code ec;
    descriptor_.close(ec);
}

std::vector<FileEvent> InotifySource::decode(const char* data, size_t size) {
    std::vector<FileEvent> events;
    size_t offset = 0;

    while (offset + sizeof(inotify_event) <= size) {
        inotify_event header;
        std::memcpy(&header, data + offset, sizeof(header));

        size_t record_size = sizeof(inotify_event) + header.len;
        if (offset + record_size > size) break;

        // The name is NUL-padded to an alignment boundary.
        std::string name;
        if (header.len > 0) {
            const char* name_start = data + offset + sizeof(inotify_event);
            name.assign(name_start, strnlen(name_start, header.len));
        }
        offset += record_size;

        if (header.mask & IN_Q_OVERFLOW) {
            events.push_back({FileEvent::Kind::Overflow, ""});
        } else if (header.mask & (IN_IGNORED | IN_DELETE_SELF | IN_MOVE_SELF | IN_UNMOUNT)) {
            events.push_back({FileEvent::Kind::WatchLost, ""});
        } else if (header.mask & IN_ISDIR) {
            continue;
        } else if (header.mask & IN_CLOSE_WRITE) {
            events.push_back({FileEvent::Kind::Written, std::move(name)});
        } else if (header.mask & IN_MOVED_TO) {
            events.push_back({FileEvent::Kind::MovedIn, std::move(name)});
        } else if (header.mask & IN_DELETE) {
            events.push_back({FileEvent::Kind::Deleted, std::move(name)});
        } else if (header.mask & IN_MOVED_FROM) {
            events.push_back({FileEvent::Kind::MovedOut, std::move(name)});
        }
    }
    return events;
}

}
