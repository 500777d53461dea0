#include "config_utils.hpp"
#include "test_common.hpp"

using memsync::test_support::TempDir;
using memsync::test_support::write_file;

TEST_CASE("YAML config loading") {
    TempDir tmp("memsync_cfg_yaml");
    fs::path cfg = tmp.path / "cfg.yaml";
    write_file(cfg, "remote-url: https://example.com/memories.git\n"
                    "retry-attempts: 5\n"
                    "retry-delay: 0.5\n"
                    "enable-sync: true\n");
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(opts["--remote-url"] == "https://example.com/memories.git");
    REQUIRE(opts["--retry-attempts"] == "5");
    REQUIRE(opts["--retry-delay"] == "0.5");
    REQUIRE(opts["--enable-sync"] == "true");
}

TEST_CASE("YAML config categories") {
    TempDir tmp("memsync_cfg_yaml_cat");
    fs::path cfg = tmp.path / "cfg.yaml";
    write_file(cfg, "Sync:\n  repo-dir: /data/memsync\n  max-pending: 8\n"
                    "Logging:\n  log-level: DEBUG\n  json-log: false\n");
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(opts["--repo-dir"] == "/data/memsync");
    REQUIRE(opts["--max-pending"] == "8");
    REQUIRE(opts["--log-level"] == "DEBUG");
    REQUIRE(opts["--json-log"] == "false");
    REQUIRE(opts.count("--Sync") == 0);
}

TEST_CASE("YAML null clears a value and sequences are skipped") {
    TempDir tmp("memsync_cfg_yaml_null");
    fs::path cfg = tmp.path / "cfg.yaml";
    write_file(cfg, "remote-url: ~\nextra:\n  - a\n  - b\n");
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(opts.count("--remote-url") == 1);
    REQUIRE(opts["--remote-url"].empty());
    REQUIRE(opts.count("--extra") == 0);
}

TEST_CASE("YAML config errors") {
    TempDir tmp("memsync_cfg_yaml_err");
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE_FALSE(load_yaml_config((tmp.path / "missing.yaml").string(), opts, err));
    REQUIRE(err == "Failed to open file");

    fs::path list = tmp.path / "list.yaml";
    write_file(list, "- one\n- two\n");
    REQUIRE_FALSE(load_yaml_config(list.string(), opts, err));
    REQUIRE(err.find("not a map") != std::string::npos);

    fs::path broken = tmp.path / "broken.yaml";
    write_file(broken, "key: [unterminated\n");
    err.clear();
    REQUIRE_FALSE(load_yaml_config(broken.string(), opts, err));
    REQUIRE_FALSE(err.empty());
}

TEST_CASE("JSON config loading") {
    TempDir tmp("memsync_cfg_json");
    fs::path cfg = tmp.path / "cfg.json";
    write_file(cfg, "{\n  \"remote-url\": \"git@example.com:me/memories.git\",\n"
                    "  \"retry-attempts\": 4,\n  \"retry-delay\": 2.5,\n"
                    "  \"enable-sync\": false\n}");
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_json_config(cfg.string(), opts, err));
    REQUIRE(opts["--remote-url"] == "git@example.com:me/memories.git");
    REQUIRE(opts["--retry-attempts"] == "4");
    REQUIRE(opts["--retry-delay"] == "2.5");
    REQUIRE(opts["--enable-sync"] == "false");
}

TEST_CASE("JSON config categories") {
    TempDir tmp("memsync_cfg_json_cat");
    fs::path cfg = tmp.path / "cfg.json";
    write_file(cfg, "{\n  \"Sync\": {\n    \"files-subdir\": \"notes\"\n  },\n"
                    "  \"Logging\": {\n    \"log-level\": \"warning\",\n"
                    "    \"syslog\": true\n  }\n}");
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_json_config(cfg.string(), opts, err));
    REQUIRE(opts["--files-subdir"] == "notes");
    REQUIRE(opts["--log-level"] == "warning");
    REQUIRE(opts["--syslog"] == "true");
}

TEST_CASE("JSON config errors") {
    TempDir tmp("memsync_cfg_json_err");
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE_FALSE(load_json_config((tmp.path / "missing.json").string(), opts, err));
    REQUIRE(err == "Failed to open file");

    fs::path arr = tmp.path / "arr.json";
    write_file(arr, "[1, 2]");
    REQUIRE_FALSE(load_json_config(arr.string(), opts, err));
    REQUIRE(err.find("not an object") != std::string::npos);

    fs::path broken = tmp.path / "broken.json";
    write_file(broken, "{ \"remote-url\": ");
    err.clear();
    REQUIRE_FALSE(load_json_config(broken.string(), opts, err));
    REQUIRE_FALSE(err.empty());
}
