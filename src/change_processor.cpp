#include "change_processor.hpp"

#include <filesystem>
#include <system_error>

#include "logger.hpp"

namespace fs = std::filesystem;

const char* to_string(ChangeStatus status) {
    switch (status) {
    case ChangeStatus::Diffed:
        return "diffed";
    case ChangeStatus::Unchanged:
        return "unchanged";
    case ChangeStatus::Ignored:
        return "ignored";
    case ChangeStatus::TooLarge:
        return "too-large";
    case ChangeStatus::Failed:
        return "failed";
    }
    return "failed";
}

ChangeProcessor::ChangeProcessor(std::uintmax_t max_file_size) : max_file_size_(max_file_size) {}

ChangeOutcome ChangeProcessor::diff_path(const std::string& path) {
    ChangeOutcome outcome;
    try {
        auto snaps = store_.update(path);
        outcome.result = engine_.compute(snaps.old_snapshot, snaps.new_snapshot);
        // Nothing to compare a recreated file against; an absent entry is
        // the same as an absent snapshot.
        if (!snaps.new_snapshot.exists)
            store_.remove(path);
        outcome.status =
            outcome.result->has_diff ? ChangeStatus::Diffed : ChangeStatus::Unchanged;
    } catch (const std::system_error& e) {
        outcome.status = ChangeStatus::Failed;
        outcome.message = e.what();
        log_warning("Snapshot update failed", {{"path", path}, {"error", e.what()}});
    }
    return outcome;
}

ChangeOutcome ChangeProcessor::handle(const Event& ev) {
    log_debug("Handling event", {{"path", ev.path}, {"op", to_string(ev.op)}});

    // A removed file cannot be stat'ed; go straight to the deletion diff.
    if (ev.op == Operation::Remove)
        return diff_path(ev.path);

    std::error_code ec;
    auto st = fs::status(ev.path, ec);
    if (ec || !fs::exists(st)) {
        if (!ec || ec == std::errc::no_such_file_or_directory ||
            ec == std::errc::not_a_directory)
            return diff_path(ev.path);
        ChangeOutcome outcome;
        outcome.status = ChangeStatus::Failed;
        outcome.message = ev.path + ": " + ec.message();
        return outcome;
    }
    if (fs::is_directory(st))
        return ChangeOutcome{};

    auto size = fs::file_size(ev.path, ec);
    if (!ec && size > max_file_size_) {
        ChangeOutcome outcome;
        outcome.status = ChangeStatus::TooLarge;
        outcome.message = "file too large for diff (" + std::to_string(size) + " bytes, max " +
                          std::to_string(max_file_size_) + " bytes)";
        log_info("Skipping large file", {{"path", ev.path}, {"size", std::to_string(size)}});
        return outcome;
    }
    return diff_path(ev.path);
}

void ChangeProcessor::run(DirectoryWatcher& watcher, const OutcomeCallback& on_outcome,
                          const ErrorCallback& on_error, std::chrono::milliseconds poll) {
    auto& events = watcher.events();
    auto& errors = watcher.errors();
    while (true) {
        if (auto ev = events.receive_for(poll)) {
            ChangeOutcome outcome = handle(*ev);
            if (on_outcome)
                on_outcome(*ev, outcome);
        }
        while (auto err = errors.try_receive()) {
            log_warning("Watcher error", {{"path", err->path}, {"error", err->message}});
            if (on_error)
                on_error(*err);
        }
        if (events.closed() && events.size() == 0 && errors.closed() && errors.size() == 0)
            break;
    }
}
