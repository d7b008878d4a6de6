#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/system/error_code.hpp>
#include <array>
#include <functional>
#include <filesystem>
#include <string>
#include <vector>
#include <sys/inotify.h>

namespace net = boost::asio;

namespace wkd {

struct FileEvent {
    enum class Kind {
        Written,    // a file was closed after writing
        MovedIn,    // a file was renamed into the directory
        Deleted,
        MovedOut,   // a file was renamed out of the directory
        Overflow,   // the kernel dropped events
        WatchLost   // the directory itself went away or the watch was removed
    };

    Kind kind;
    std::string name;  // file name relative to the watched directory
};

// OS change-notification channel for one directory.
class NotificationSource {
public:
    using Handler = std::function<void(const boost::system::error_code&, std::vector<FileEvent>)>;

    virtual ~NotificationSource() = default;

    // Creates the underlying primitive. @throws WatchSubsystemError
    virtual void open() = 0;

    // Subscribes to create/write, delete and rename events. @throws WatchSubsystemError
    virtual void add_watch(const std::filesystem::path& directory) = 0;

    // Delivers the next batch of events, or an error once the channel is closed or broken.
    virtual void async_next(Handler handler) = 0;

    // Releases the primitive and aborts a pending async_next. Safe to call twice.
    virtual void close() = 0;
};

// inotify(7) channel read asynchronously through Boost.Asio.
class InotifySource : public NotificationSource {
public:
    explicit InotifySource(net::any_io_executor executor);
    ~InotifySource() override;

    void open() override;
    void add_watch(const std::filesystem::path& directory) override;
    void async_next(Handler handler) override;
    void close() override;

    // Decodes a buffer of raw inotify records.
    static std::vector<FileEvent> decode(const char* data, size_t size);

private:
    net::posix::stream_descriptor descriptor_;
    alignas(struct inotify_event) std::array<char, 4096> buffer_;
};

}
