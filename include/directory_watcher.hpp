#ifndef DIRECTORY_WATCHER_HPP
#define DIRECTORY_WATCHER_HPP
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <future>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <vector>

#include "bounded_channel.hpp"
#include "debouncer.hpp"

/// Normalized kind of filesystem change.
enum class Operation { Create, Write, Remove, Rename, Chmod, Unknown };

/// Lowercase name of @p op, e.g. "write".
const char* to_string(Operation op);

/**
 * @brief Debounced, normalized filesystem change.
 */
struct Event {
    std::string path;
    Operation op = Operation::Unknown;
    std::chrono::system_clock::time_point timestamp;
};

/**
 * @brief Non-fatal watcher failure reported on the error channel.
 */
struct WatchError {
    std::string path;
    std::error_code code;
    std::string message;
};

/**
 * @brief Map an inotify event mask to an Operation.
 *
 * When several bits are set the first of create, write, remove, rename,
 * chmod wins.
 */
Operation operation_from_mask(std::uint32_t mask);

/// Directory basenames never subscribed during recursive watching.
const std::set<std::string>& excluded_dir_names();

/// `true` if @p name is one of excluded_dir_names() (exact, case-sensitive).
bool is_excluded_dir(const std::string& name);

/**
 * @brief inotify based watcher that emits debounced change events.
 *
 * The root is subscribed synchronously by the constructor. In recursive mode
 * the rest of the tree is subscribed by a background walk, and directories
 * created later are subscribed by further walks as their creation events
 * arrive. Events are coalesced per path for the debounce delay and then
 * offered to a bounded channel; when a channel is full the value is dropped.
 *
 * Linux only.
 */
class DirectoryWatcher {
  public:
    static constexpr std::size_t kEventCapacity = 100;
    static constexpr std::size_t kErrorCapacity = 10;

    /**
     * @brief Start watching @p path.
     *
     * @throws std::system_error if the path cannot be resolved, inotify cannot
     *         be initialized or the root cannot be subscribed.
     */
    DirectoryWatcher(const std::filesystem::path& path, bool recursive,
                     std::chrono::milliseconds debounce = Debouncer::kDefaultDelay);
    ~DirectoryWatcher();

    DirectoryWatcher(const DirectoryWatcher&) = delete;
    DirectoryWatcher& operator=(const DirectoryWatcher&) = delete;

    BoundedChannel<Event>& events() { return events_; }
    BoundedChannel<WatchError>& errors() { return errors_; }

    /**
     * @brief Stop watching and release all resources.
     *
     * Stops the debouncer, closes both channels, joins the reader thread and
     * any subtree walks, then closes the inotify descriptor. Later calls do
     * nothing.
     */
    void close();

    bool closed() const;
    bool recursive() const { return recursive_; }
    const std::filesystem::path& root() const { return root_; }

    /// Every directory subscribed since construction, sorted. Only grows.
    std::vector<std::string> watched_directories() const;
    bool is_watched(const std::string& dir) const;

  private:
    void read_loop();
    void handle_raw(int wd, std::uint32_t mask, const std::string& name);
    void spawn_walk(const std::filesystem::path& dir, const std::string& context);
    // On failure @p failed names the directory that could not be walked.
    std::error_code add_recursive(const std::filesystem::path& dir, bool is_root,
                                  std::filesystem::path& failed);
    std::error_code add_watch(const std::string& dir);
    bool subscribed(const std::string& dir) const;
    void forget_watch(int wd);
    void send_event(const Event& ev);
    void send_error(WatchError err);
    void release_fds();

    std::filesystem::path root_;
    const bool recursive_;
    int inotify_fd_ = -1;
    int wake_fd_[2]{-1, -1};

    BoundedChannel<Event> events_{kEventCapacity};
    BoundedChannel<WatchError> errors_{kErrorCapacity};
    Debouncer debouncer_;

    mutable std::shared_mutex send_mtx_;
    bool closed_ = false;
    std::atomic<bool> stopping_{false};

    mutable std::mutex dirs_mtx_;
    std::unordered_map<int, std::string> wd_to_path_;
    std::unordered_map<std::string, int> path_to_wd_;
    std::set<std::string> watched_;

    std::mutex walkers_mtx_;
    std::vector<std::future<void>> walkers_;

    std::thread reader_;
};

#endif // DIRECTORY_WATCHER_HPP
