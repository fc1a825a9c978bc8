#ifndef CHANGE_PROCESSOR_HPP
#define CHANGE_PROCESSOR_HPP
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "diff_engine.hpp"
#include "directory_watcher.hpp"
#include "snapshot_store.hpp"

enum class ChangeStatus {
    Diffed,    ///< Snapshot updated and the content changed.
    Unchanged, ///< Snapshot updated, nothing to show.
    Ignored,   ///< Directory event.
    TooLarge,  ///< File exceeds the size cutoff and was not read.
    Failed     ///< Stat or read failed.
};

const char* to_string(ChangeStatus status);

/**
 * @brief What happened to one event.
 *
 * `result` is set for Diffed and Unchanged. `message` describes TooLarge
 * and Failed outcomes.
 */
struct ChangeOutcome {
    ChangeStatus status = ChangeStatus::Ignored;
    std::optional<diff::DiffResult> result;
    std::string message;
};

/**
 * @brief Turns watcher events into diffs.
 *
 * Owns the snapshot store and applies the file-size cutoff before any file
 * is read.
 */
class ChangeProcessor {
  public:
    static constexpr std::uintmax_t kDefaultMaxFileSize = 1024 * 1024;

    using OutcomeCallback = std::function<void(const Event&, const ChangeOutcome&)>;
    using ErrorCallback = std::function<void(const WatchError&)>;

    explicit ChangeProcessor(std::uintmax_t max_file_size = kDefaultMaxFileSize);

    /**
     * @brief Update the snapshot for @p ev and diff it against the previous one.
     *
     * Never throws for filesystem problems; they become Failed outcomes.
     */
    ChangeOutcome handle(const Event& ev);

    /**
     * @brief Consume @p watcher until both of its channels are closed and drained.
     *
     * @p on_outcome is called for every handled event, @p on_error for every
     * watcher error. Either may be empty.
     */
    void run(DirectoryWatcher& watcher, const OutcomeCallback& on_outcome,
             const ErrorCallback& on_error,
             std::chrono::milliseconds poll = std::chrono::milliseconds(100));

    SnapshotStore& store() { return store_; }
    std::uintmax_t max_file_size() const { return max_file_size_; }

  private:
    ChangeOutcome diff_path(const std::string& path);

    SnapshotStore store_;
    diff::DiffEngine engine_;
    std::uintmax_t max_file_size_;
};

#endif // CHANGE_PROCESSOR_HPP
