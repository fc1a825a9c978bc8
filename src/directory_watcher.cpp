#include "directory_watcher.hpp"

#include <algorithm>
#include <cerrno>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include "logger.hpp"

namespace fs = std::filesystem;

namespace {

constexpr std::uint32_t kWatchMask = IN_MODIFY | IN_ATTRIB | IN_CREATE | IN_DELETE |
                                     IN_DELETE_SELF | IN_MOVE_SELF | IN_MOVED_FROM |
                                     IN_MOVED_TO;

bool is_permission_error(const std::error_code& ec) {
    return ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted;
}

bool is_vanished_error(const std::error_code& ec) {
    return ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
}

fs::path resolve_root(const fs::path& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    if (ec)
        throw std::system_error(ec, "resolving path " + path.string());
    abs = abs.lexically_normal();
    if (!abs.has_filename() && abs != abs.root_path())
        abs = abs.parent_path();
    return abs;
}

} // namespace

const char* to_string(Operation op) {
    switch (op) {
    case Operation::Create:
        return "create";
    case Operation::Write:
        return "write";
    case Operation::Remove:
        return "remove";
    case Operation::Rename:
        return "rename";
    case Operation::Chmod:
        return "chmod";
    case Operation::Unknown:
        return "unknown";
    }
    return "unknown";
}

Operation operation_from_mask(std::uint32_t mask) {
    if (mask & (IN_CREATE | IN_MOVED_TO))
        return Operation::Create;
    if (mask & IN_MODIFY)
        return Operation::Write;
    if (mask & (IN_DELETE | IN_DELETE_SELF))
        return Operation::Remove;
    if (mask & (IN_MOVED_FROM | IN_MOVE_SELF))
        return Operation::Rename;
    if (mask & IN_ATTRIB)
        return Operation::Chmod;
    return Operation::Unknown;
}

const std::set<std::string>& excluded_dir_names() {
    // Build output, VCS metadata, dependency caches and editor state.
    static const std::set<std::string> names{
        ".git",          "node_modules", ".cache", ".npm",   ".cargo", ".rustup",
        "__pycache__",   ".pytest_cache", ".venv", "venv",   ".tox",   "dist",
        "build",         "target",        ".next",  ".nuxt", "vendor", ".gradle",
        ".m2",           ".idea",         ".vscode"};
    return names;
}

bool is_excluded_dir(const std::string& name) { return excluded_dir_names().count(name) > 0; }

DirectoryWatcher::DirectoryWatcher(const fs::path& path, bool recursive,
                                   std::chrono::milliseconds debounce)
    : root_(resolve_root(path)), recursive_(recursive), debouncer_(debounce) {
    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0)
        throw std::system_error(errno, std::generic_category(), "creating watcher");
    if (::pipe2(wake_fd_, O_NONBLOCK | O_CLOEXEC) != 0) {
        std::error_code ec(errno, std::generic_category());
        release_fds();
        throw std::system_error(ec, "creating wake pipe");
    }
    if (auto ec = add_watch(root_.string())) {
        release_fds();
        throw std::system_error(ec, "adding path to watcher: " + root_.string());
    }
    log_info("Watching " + root_.string(), {{"recursive", recursive_ ? "true" : "false"}});

    try {
        reader_ = std::thread([this]() { read_loop(); });
        if (recursive_)
            spawn_walk(root_, "recursive watch setup");
    } catch (...) {
        close();
        throw;
    }
}

DirectoryWatcher::~DirectoryWatcher() { close(); }

void DirectoryWatcher::close() {
    {
        std::unique_lock<std::shared_mutex> lk(send_mtx_);
        if (closed_)
            return;
        closed_ = true;
    }
    stopping_.store(true);
    debouncer_.stop();
    events_.close();
    errors_.close();

    if (wake_fd_[1] >= 0) {
        const char byte = 'x';
        while (::write(wake_fd_[1], &byte, 1) < 0 && errno == EINTR) {
        }
    }
    if (reader_.joinable()) {
        if (reader_.get_id() == std::this_thread::get_id())
            reader_.detach();
        else
            reader_.join();
    }
    std::vector<std::future<void>> walkers;
    {
        std::lock_guard<std::mutex> lk(walkers_mtx_);
        walkers.swap(walkers_);
    }
    for (auto& w : walkers)
        w.wait();
    release_fds();
    log_info("Stopped watching " + root_.string());
}

bool DirectoryWatcher::closed() const {
    std::shared_lock<std::shared_mutex> lk(send_mtx_);
    return closed_;
}

std::vector<std::string> DirectoryWatcher::watched_directories() const {
    std::lock_guard<std::mutex> lk(dirs_mtx_);
    return std::vector<std::string>(watched_.begin(), watched_.end());
}

bool DirectoryWatcher::is_watched(const std::string& dir) const {
    std::lock_guard<std::mutex> lk(dirs_mtx_);
    return watched_.count(dir) > 0;
}

void DirectoryWatcher::release_fds() {
    if (inotify_fd_ >= 0) {
        ::close(inotify_fd_);
        inotify_fd_ = -1;
    }
    for (int& fd : wake_fd_) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
}

std::error_code DirectoryWatcher::add_watch(const std::string& dir) {
    int wd = inotify_add_watch(inotify_fd_, dir.c_str(), kWatchMask);
    if (wd < 0)
        return std::error_code(errno, std::generic_category());
    std::lock_guard<std::mutex> lk(dirs_mtx_);
    wd_to_path_[wd] = dir;
    path_to_wd_[dir] = wd;
    watched_.insert(dir);
    return {};
}

bool DirectoryWatcher::subscribed(const std::string& dir) const {
    std::lock_guard<std::mutex> lk(dirs_mtx_);
    return path_to_wd_.count(dir) > 0;
}

// The kernel dropped the watch (directory deleted or unmounted). The path
// stays in watched_; a directory recreated under the same name is
// subscribed again.
void DirectoryWatcher::forget_watch(int wd) {
    std::lock_guard<std::mutex> lk(dirs_mtx_);
    auto it = wd_to_path_.find(wd);
    if (it == wd_to_path_.end())
        return;
    auto rev = path_to_wd_.find(it->second);
    if (rev != path_to_wd_.end() && rev->second == wd)
        path_to_wd_.erase(rev);
    wd_to_path_.erase(it);
}

std::error_code DirectoryWatcher::add_recursive(const fs::path& dir, bool is_root,
                                                fs::path& failed) {
    if (stopping_.load())
        return {};
    const std::string key = dir.string();
    if (!is_root) {
        if (is_excluded_dir(dir.filename().string()) || subscribed(key))
            return {};
    }
    if (!subscribed(key)) {
        if (auto ec = add_watch(key)) {
            if (is_permission_error(ec) || is_vanished_error(ec))
                return {};
            failed = dir;
            return ec;
        }
        log_debug("Subscribed " + key);
    }

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        if (is_permission_error(ec) || is_vanished_error(ec))
            return {};
        failed = dir;
        return ec;
    }
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec)
            break;
        if (stopping_.load())
            return {};
        std::error_code st_ec;
        // Symlinked directories are not followed.
        if (!it->is_directory(st_ec) || it->is_symlink(st_ec))
            continue;
        if (auto sub = add_recursive(it->path(), false, failed))
            return sub;
    }
    if (ec && !is_permission_error(ec) && !is_vanished_error(ec)) {
        failed = dir;
        return ec;
    }
    return {};
}

void DirectoryWatcher::spawn_walk(const fs::path& dir, const std::string& context) {
    std::lock_guard<std::mutex> lk(walkers_mtx_);
    if (stopping_.load())
        return;
    walkers_.erase(std::remove_if(walkers_.begin(), walkers_.end(),
                                  [](const std::future<void>& f) {
                                      return f.wait_for(std::chrono::seconds(0)) ==
                                             std::future_status::ready;
                                  }),
                   walkers_.end());
    bool is_root = dir == root_;
    walkers_.push_back(std::async(std::launch::async, [this, dir, context, is_root]() {
        fs::path failed = dir;
        if (auto ec = add_recursive(dir, is_root, failed)) {
            log_warning(context + " failed",
                        {{"path", failed.string()}, {"error", ec.message()}});
            send_error(WatchError{failed.string(), ec, context + ": " + ec.message()});
        }
    }));
}

void DirectoryWatcher::read_loop() {
    alignas(inotify_event) char buf[64 * 1024];
    while (!stopping_.load()) {
        pollfd fds[2] = {{inotify_fd_, POLLIN, 0}, {wake_fd_[0], POLLIN, 0}};
        int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            std::error_code ec(errno, std::generic_category());
            send_error(WatchError{root_.string(), ec, "polling watcher: " + ec.message()});
            return;
        }
        if (fds[1].revents != 0)
            return;
        if (fds[0].revents & (POLLERR | POLLHUP | POLLNVAL))
            return;
        if (!(fds[0].revents & POLLIN))
            continue;

        ssize_t len = ::read(inotify_fd_, buf, sizeof(buf));
        if (len < 0) {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            std::error_code ec(errno, std::generic_category());
            send_error(WatchError{root_.string(), ec, "reading watcher: " + ec.message()});
            return;
        }
        for (char* ptr = buf; ptr < buf + len;) {
            const auto* ev = reinterpret_cast<const inotify_event*>(ptr);
            std::string name = ev->len > 0 ? std::string(ev->name) : std::string();
            handle_raw(ev->wd, ev->mask, name);
            ptr += sizeof(inotify_event) + ev->len;
        }
    }
}

void DirectoryWatcher::handle_raw(int wd, std::uint32_t mask, const std::string& name) {
    if (mask & IN_Q_OVERFLOW) {
        log_warning("inotify queue overflow; events were lost");
        send_error(WatchError{root_.string(), std::make_error_code(std::errc::no_buffer_space),
                              "event queue overflow"});
        return;
    }
    if (mask & IN_IGNORED) {
        forget_watch(wd);
        return;
    }

    std::string dir;
    {
        std::lock_guard<std::mutex> lk(dirs_mtx_);
        auto it = wd_to_path_.find(wd);
        if (it == wd_to_path_.end())
            return;
        dir = it->second;
    }
    const std::string path = name.empty() ? dir : (fs::path(dir) / name).string();
    const Operation op = operation_from_mask(mask);

    if (recursive_ && op == Operation::Create && (mask & IN_ISDIR) && !is_excluded_dir(name))
        spawn_walk(path, "adding new directory to watcher");

    Event ev{path, op, std::chrono::system_clock::now()};
    debouncer_.add(path, [this, ev]() { send_event(ev); });
}

void DirectoryWatcher::send_event(const Event& ev) {
    std::shared_lock<std::shared_mutex> lk(send_mtx_);
    if (closed_)
        return;
    if (!events_.try_send(ev))
        log_warning("Dropped event; channel full", {{"path", ev.path}, {"op", to_string(ev.op)}});
}

void DirectoryWatcher::send_error(WatchError err) {
    std::shared_lock<std::shared_mutex> lk(send_mtx_);
    if (closed_)
        return;
    if (!errors_.try_send(std::move(err)))
        log_warning("Dropped watcher error; channel full");
}
