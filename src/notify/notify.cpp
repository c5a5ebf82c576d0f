#include "notify/notify.hpp"
#include <errno.h>
#include <glog/logging.h>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>
#include <chrono>
#include <cstring>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace grader::notify {
using namespace std;

void ensure_notify_file(const filesystem::path &path) {
    auto parent = filesystem::absolute(path).parent_path();
    error_code ec;
    filesystem::create_directories(parent, ec);
    if (ec) throw internal_error("unable to create directory " + parent.string() + " for the notification file: " + ec.message());
    if (!filesystem::exists(path)) ping(path);
}

void ping(const filesystem::path &path) {
    auto now = chrono::duration_cast<chrono::nanoseconds>(chrono::system_clock::now().time_since_epoch());
    write_file_content(path, to_string(now.count()));
    VLOG(1) << "Pinged runners through " << path;
}

listener::listener(const filesystem::path &path, int timeout_ms)
    : fd(-1), timeout_ms(timeout_ms), path(path) {
    fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0)
        throw internal_error(string("unable to initialize inotify: ") + strerror(errno));
    if (inotify_add_watch(fd, path.c_str(), IN_MODIFY | IN_CLOSE_WRITE) < 0) {
        int err = errno;
        close(fd);
        throw internal_error("unable to watch " + path.string() + ": " + strerror(err));
    }
}

listener::~listener() {
    if (fd >= 0) close(fd);
}

bool listener::listen() {
    return listen(timeout_ms);
}

bool listener::listen(int timeout) {
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int ret = poll(&pfd, 1, timeout);
    if (ret < 0) {
        if (errno == EINTR) return false;
        throw internal_error(string("error while watching notification file: ") + strerror(errno));
    }
    if (ret == 0) return false;

    // 读空所有事件，一次写入可能产生多个事件
    alignas(struct inotify_event) char buf[4096];
    errno = 0;
    while (read(fd, buf, sizeof(buf)) > 0)
        ;
    if (errno != 0 && errno != EAGAIN && errno != EWOULDBLOCK)
        throw internal_error(string("error while reading inotify events: ") + strerror(errno));
    return true;
}

}  // namespace grader::notify
