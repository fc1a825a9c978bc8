#include "test_common.hpp"

using diffwatch::test_support::TempDir;
using diffwatch::test_support::write_file;

TEST_CASE("parse_options defaults") {
    const char* argv[] = {"prog"};
    Options opts = parse_options(1, const_cast<char**>(argv));
    REQUIRE(opts.path == fs::path("."));
    REQUIRE_FALSE(opts.recursive);
    REQUIRE(opts.max_file_size == 1024 * 1024);
    REQUIRE(opts.max_lines == 0);
    REQUIRE_FALSE(opts.no_colors);
    REQUIRE(opts.logging.log_level == LogLevel::INFO);
    REQUIRE(opts.logging.log_file.empty());
}

TEST_CASE("parse_options path and recursive flags") {
    const char* argv[] = {"prog", "-r", "--path", "src"};
    Options opts = parse_options(4, const_cast<char**>(argv));
    REQUIRE(opts.recursive);
    REQUIRE(opts.path == fs::path("src"));

    const char* argv2[] = {"prog", "--recursive", "lib"};
    Options opts2 = parse_options(3, const_cast<char**>(argv2));
    REQUIRE(opts2.recursive);
    REQUIRE(opts2.path == fs::path("lib"));
}

TEST_CASE("parse_options logging and limits") {
    const char* argv[] = {"prog",           "--log-file",      "dw.log", "--log-level",
                          "debug",          "--json-log",      "--max-log-size", "1MB",
                          "--max-file-size", "64k",            "--max-lines", "20",
                          "--no-colors"};
    Options opts = parse_options(13, const_cast<char**>(argv));
    REQUIRE(opts.logging.log_file == "dw.log");
    REQUIRE(opts.logging.log_level == LogLevel::DEBUG);
    REQUIRE(opts.logging.json_log);
    REQUIRE(opts.logging.max_log_size == 1024 * 1024);
    REQUIRE(opts.max_file_size == 64 * 1024);
    REQUIRE(opts.max_lines == 20);
    REQUIRE(opts.no_colors);
}

TEST_CASE("parse_options help and version") {
    const char* argv[] = {"prog", "-h", "-v"};
    Options opts = parse_options(3, const_cast<char**>(argv));
    REQUIRE(opts.show_help);
    REQUIRE(opts.print_version);
}

TEST_CASE("parse_options rejects bad input") {
    const char* unknown[] = {"prog", "--bogus"};
    REQUIRE_THROWS_AS(parse_options(2, const_cast<char**>(unknown)), std::runtime_error);
    const char* level[] = {"prog", "--log-level", "LOUD"};
    REQUIRE_THROWS_AS(parse_options(3, const_cast<char**>(level)), std::runtime_error);
    const char* size[] = {"prog", "--max-file-size", "huge"};
    REQUIRE_THROWS_AS(parse_options(3, const_cast<char**>(size)), std::runtime_error);
    const char* missing[] = {"prog", "--path"};
    REQUIRE_THROWS_AS(parse_options(2, const_cast<char**>(missing)), std::runtime_error);
    const char* two[] = {"prog", "a", "b"};
    REQUIRE_THROWS_AS(parse_options(3, const_cast<char**>(two)), std::runtime_error);
}

TEST_CASE("parse_options uses config values as defaults") {
    TempDir dir("options_cfg");
    fs::path cfg = dir.path / "diffwatch.yaml";
    write_file(cfg, "path: from-config\nrecursive: true\nlogging:\n  log-level: WARNING\n"
                    "max-lines: 7\n");
    std::string cfg_str = cfg.string();
    const char* argv[] = {"prog", "-y", cfg_str.c_str(), "--max-lines", "3"};
    Options opts = parse_options(5, const_cast<char**>(argv));
    REQUIRE(opts.path == fs::path("from-config"));
    REQUIRE(opts.recursive);
    REQUIRE(opts.logging.log_level == LogLevel::WARNING);
    REQUIRE(opts.max_lines == 3);
    REQUIRE(opts.config_file == cfg);

    const char* argv2[] = {"prog", "-y", cfg_str.c_str(), "other"};
    Options opts2 = parse_options(4, const_cast<char**>(argv2));
    REQUIRE(opts2.path == fs::path("other"));
}

TEST_CASE("parse_options rejects unknown config keys") {
    TempDir dir("options_cfg_bad");
    fs::path cfg = dir.path / "bad.json";
    write_file(cfg, "{\"path\": \".\", \"colour\": true}");
    std::string cfg_str = cfg.string();
    const char* argv[] = {"prog", "--config-json", cfg_str.c_str()};
    try {
        parse_options(3, const_cast<char**>(argv));
        FAIL("expected an exception");
    } catch (const std::runtime_error& e) {
        REQUIRE(std::string(e.what()) == "Unknown option in config: colour");
    }
}
