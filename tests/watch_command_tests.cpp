#include "test_common.hpp"
#include "help_text.hpp"
#include "watch_command.hpp"

#include <future>
#include <sstream>

using diffwatch::test_support::TempDir;
using diffwatch::test_support::write_file;

TEST_CASE("run_watch fails for a missing path") {
    TempDir dir("cmd_missing");
    Options opts;
    opts.path = dir.path / "absent";
    std::ostringstream out;
    std::atomic<bool> running{true};
    REQUIRE(run_watch(opts, out, running) == 1);
    REQUIRE(out.str().empty());

    write_file(dir.path / "plain.txt", "x");
    opts.path = dir.path / "plain.txt";
    REQUIRE(run_watch(opts, out, running) == 1);
}

TEST_CASE("run_watch prints diffs until stopped") {
    TempDir dir("cmd_run");
    fs::create_directories(dir.path / "sub");
    Options opts;
    opts.path = dir.path;
    opts.recursive = true;
    opts.no_colors = true;
    std::ostringstream out;
    std::atomic<bool> running{true};
    auto result = std::async(std::launch::async, [&] { return run_watch(opts, out, running); });

    // Give the watcher time to subscribe before touching files.
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    fs::path file = dir.path / "sub" / "hello.txt";
    write_file(file, "hello\nworld\n");
    std::this_thread::sleep_for(std::chrono::milliseconds(700));
    running.store(false);
    REQUIRE(result.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    REQUIRE(result.get() == 0);

    const std::string text = out.str();
    REQUIRE(text.find("Watching " + dir.path.string() + " (recursive)") != std::string::npos);
    REQUIRE(text.find(file.string() + " (new file)") != std::string::npos);
    REQUIRE(text.find("+ hello") != std::string::npos);
    REQUIRE(text.find("+ world") != std::string::npos);
}

TEST_CASE("print_help lists every option group") {
    std::ostringstream out;
    print_help("diffwatch", out);
    const std::string text = out.str();
    REQUIRE(text.find("Usage: diffwatch") != std::string::npos);
    REQUIRE(text.find("--recursive") != std::string::npos);
    REQUIRE(text.find("--config-yaml") != std::string::npos);
    REQUIRE(text.find("Logging:") != std::string::npos);
}
