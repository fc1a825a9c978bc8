#include "test_common.hpp"

TEST_CASE("YAML config loading") {
    fs::path cfg = fs::temp_directory_path() / "diffwatch_cfg.yaml";
    {
        std::ofstream ofs(cfg);
        ofs << "path: src\n";
        ofs << "recursive: true\n";
        ofs << "max-file-size: 2MB\n";
    }
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(opts["--path"] == "src");
    REQUIRE(opts["--recursive"] == "true");
    REQUIRE(opts["--max-file-size"] == "2MB");
    FS_REMOVE(cfg);
}

TEST_CASE("YAML config sections are flattened") {
    fs::path cfg = fs::temp_directory_path() / "diffwatch_cfg_sections.yaml";
    {
        std::ofstream ofs(cfg);
        ofs << "watch:\n  path: src\n  recursive: yes\nlogging:\n  log-level: DEBUG\n"
               "  log-file:\n";
    }
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(opts["--path"] == "src");
    REQUIRE(opts["--recursive"] == "yes");
    REQUIRE(opts["--log-level"] == "DEBUG");
    REQUIRE(opts.count("--log-file") == 1);
    REQUIRE(opts["--log-file"].empty());
    FS_REMOVE(cfg);
}

TEST_CASE("YAML config rejects sequences and non-map roots") {
    fs::path cfg = fs::temp_directory_path() / "diffwatch_cfg_bad.yaml";
    std::map<std::string, std::string> opts;
    std::string err;
    {
        std::ofstream ofs(cfg);
        ofs << "path:\n  - a\n  - b\n";
    }
    REQUIRE_FALSE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(err.find("path") != std::string::npos);
    {
        std::ofstream ofs(cfg);
        ofs << "- just\n- a list\n";
    }
    REQUIRE_FALSE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(err == "Root YAML node is not a map");
    FS_REMOVE(cfg);
}

TEST_CASE("JSON config loading") {
    fs::path cfg = fs::temp_directory_path() / "diffwatch_cfg.json";
    {
        std::ofstream ofs(cfg);
        ofs << "{\n  \"path\": \"src\",\n  \"max-lines\": 40,\n"
               "  \"logging\": {\"json-log\": true, \"log-level\": \"ERROR\"}\n}";
    }
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_json_config(cfg.string(), opts, err));
    REQUIRE(opts["--path"] == "src");
    REQUIRE(opts["--max-lines"] == "40");
    REQUIRE(opts["--json-log"] == "true");
    REQUIRE(opts["--log-level"] == "ERROR");
    FS_REMOVE(cfg);
}

TEST_CASE("JSON config errors") {
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE_FALSE(load_json_config("/nonexistent/diffwatch.json", opts, err));
    REQUIRE(err == "Failed to open file");

    fs::path cfg = fs::temp_directory_path() / "diffwatch_cfg_bad.json";
    {
        std::ofstream ofs(cfg);
        ofs << "{ not json";
    }
    REQUIRE_FALSE(load_json_config(cfg.string(), opts, err));
    REQUIRE_FALSE(err.empty());
    {
        std::ofstream ofs(cfg);
        ofs << "[1, 2]";
    }
    REQUIRE_FALSE(load_json_config(cfg.string(), opts, err));
    REQUIRE(err == "Root JSON value is not an object");
    FS_REMOVE(cfg);
}
