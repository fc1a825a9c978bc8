#ifndef SNAPSHOT_STORE_HPP
#define SNAPSHOT_STORE_HPP
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <system_error>
#include <string>

/**
 * @brief Content of a file (or its absence) captured at one point in time.
 *
 * A snapshot with `exists == false` never carries content.
 */
struct Snapshot {
    std::string path;
    std::string content; ///< Raw bytes, not necessarily text.
    bool exists = false;
};

/**
 * @brief Old and new snapshot returned by SnapshotStore::update().
 */
struct SnapshotUpdate {
    Snapshot old_snapshot;
    Snapshot new_snapshot;
};

/**
 * @brief Keeps the last-read content of every tracked path.
 *
 * All access goes through one mutex. File reads happen outside of it, the
 * lock only covers the map lookup and the replacement of the entry.
 */
class SnapshotStore {
  public:
    SnapshotStore() = default;
    SnapshotStore(const SnapshotStore&) = delete;
    SnapshotStore& operator=(const SnapshotStore&) = delete;

    /**
     * @brief Re-read @p path and replace its stored snapshot.
     *
     * A path seen for the first time yields an `old_snapshot` with
     * `exists == false`. A missing file is a normal transition and yields a
     * `new_snapshot` with `exists == false`.
     *
     * @throws std::system_error for any other read failure (permission
     *         denied, I/O error, path is a directory). The stored entry is
     *         left untouched in that case.
     */
    SnapshotUpdate update(const std::string& path);

    /// Stored snapshot for @p path, if any.
    std::optional<Snapshot> get(const std::string& path) const;

    /// Forget @p path.
    void remove(const std::string& path);

    /// Forget every path.
    void clear();

    std::size_t size() const;

  private:
    mutable std::mutex mtx_;
    std::map<std::string, Snapshot> snapshots_;
};

/**
 * @brief Read a whole file into @p out.
 *
 * @return `false` with @p ec set on failure. `ENOENT` and `ENOTDIR` are
 *         reported as `std::errc::no_such_file_or_directory`.
 */
bool read_file_bytes(const std::string& path, std::string& out, std::error_code& ec);

#endif // SNAPSHOT_STORE_HPP
