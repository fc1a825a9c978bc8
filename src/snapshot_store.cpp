#include "snapshot_store.hpp"

#include <array>
#include <cerrno>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

#include "logger.hpp"

bool read_file_bytes(const std::string& path, std::string& out, std::error_code& ec) {
    ec.clear();
    out.clear();
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT || errno == ENOTDIR)
            ec = std::make_error_code(std::errc::no_such_file_or_directory);
        else
            ec = std::error_code(errno, std::generic_category());
        return false;
    }
    std::array<char, 65536> buf{};
    while (true) {
        ssize_t n = ::read(fd, buf.data(), buf.size());
        if (n > 0) {
            out.append(buf.data(), static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0)
            break;
        if (errno == EINTR)
            continue;
        ec = std::error_code(errno, std::generic_category());
        ::close(fd);
        out.clear();
        return false;
    }
    ::close(fd);
    return true;
}

SnapshotUpdate SnapshotStore::update(const std::string& path) {
    Snapshot fresh;
    fresh.path = path;
    std::error_code ec;
    if (read_file_bytes(path, fresh.content, ec)) {
        fresh.exists = true;
    } else if (ec == std::errc::no_such_file_or_directory) {
        fresh.exists = false;
    } else {
        log_debug("Snapshot read failed", {{"path", path}, {"error", ec.message()}});
        throw std::system_error(ec, "reading " + path);
    }

    SnapshotUpdate result;
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = snapshots_.find(path);
    if (it != snapshots_.end()) {
        result.old_snapshot = std::move(it->second);
    } else {
        result.old_snapshot.path = path;
        result.old_snapshot.exists = false;
    }
    result.new_snapshot = fresh;
    snapshots_[path] = std::move(fresh);
    return result;
}

std::optional<Snapshot> SnapshotStore::get(const std::string& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = snapshots_.find(path);
    if (it == snapshots_.end())
        return std::nullopt;
    return it->second;
}

void SnapshotStore::remove(const std::string& path) {
    std::lock_guard<std::mutex> lk(mtx_);
    snapshots_.erase(path);
}

void SnapshotStore::clear() {
    std::lock_guard<std::mutex> lk(mtx_);
    snapshots_.clear();
}

std::size_t SnapshotStore::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return snapshots_.size();
}
