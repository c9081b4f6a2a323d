#include "config.hpp"
#include "errors.hpp"
#include "test_support.hpp"

#include <cassert>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace {

std::filesystem::path WriteJson(const std::string& test_name, const std::string& content) {
    auto dir = MakeTempDir("config_" + test_name);
    auto path = dir / "config.json";
    std::ofstream out(path);
    out << content;
    return path;
}

template <typename Fn>
bool ThrowsConfigError(Fn fn) {
    try {
        fn();
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

void TestFullFile() {
    auto path = WriteJson("full", R"({
  "target_image_count": 25,
  "request_timeout_ms": 5000,
  "user_agent": "test-agent/2.0",
  "input_path": "pages.txt",
  "originals_root": "raw",
  "output_root": "rotated",
  "log_dir": "",
  "log_level": "debug",
  "max_concurrency": 3,
  "manifest_path": "run/manifest.json",
  "blocklist": ["thumb", "pixel"]
})");
    Config c = ConfigLoader::load_file(path.string());
    assert(c.target_image_count == 25);
    assert(c.request_timeout_ms == 5000);
    assert(c.user_agent == "test-agent/2.0");
    assert(c.input_path == "pages.txt");
    assert(c.originals_root == "raw");
    assert(c.output_root == "rotated");
    assert(c.log_dir.empty());
    assert(c.log_level == "debug");
    assert(c.max_concurrency == 3);
    assert(c.manifest_path == "run/manifest.json");
    assert(c.blocklist.has_value());
    assert((*c.blocklist == std::vector<std::string>{"thumb", "pixel"}));
    ConfigLoader::validate(c);
}

void TestMissingKeysKeepDefaults() {
    auto path = WriteJson("partial", R"({"target_image_count": 4})");
    Config c = ConfigLoader::load_file(path.string());
    Config defaults;
    assert(c.target_image_count == 4);
    assert(c.request_timeout_ms == defaults.request_timeout_ms);
    assert(c.user_agent == defaults.user_agent);
    assert(!c.blocklist.has_value());
}

void TestWrongTypeRejected() {
    auto path = WriteJson("wrong_type", R"({"target_image_count": "many"})");
    assert(ThrowsConfigError([&] { ConfigLoader::load_file(path.string()); }));
}

void TestMalformedJsonRejected() {
    auto path = WriteJson("malformed", R"({"target_image_count": )");
    assert(ThrowsConfigError([&] { ConfigLoader::load_file(path.string()); }));
    assert(ThrowsConfigError([] { ConfigLoader::load_file("/nonexistent/imgharvest/config.json"); }));
}

void TestValidation() {
    Config c;
    ConfigLoader::validate(c);

    c.target_image_count = 0;
    assert(ThrowsConfigError([&] { ConfigLoader::validate(c); }));
    c = Config{};
    c.max_concurrency = 0;
    assert(ThrowsConfigError([&] { ConfigLoader::validate(c); }));
    c = Config{};
    c.output_root = c.originals_root;
    assert(ThrowsConfigError([&] { ConfigLoader::validate(c); }));
}

void TestUnknownLogLevelRejected() {
    Config c;
    for (const char* level : {"trace", "debug", "info", "warn", "error", "critical", "off"}) {
        c.log_level = level;
        ConfigLoader::validate(c);
    }
    c.log_level = "verbose";
    assert(ThrowsConfigError([&] { ConfigLoader::validate(c); }));
    c.log_level = "";
    assert(ThrowsConfigError([&] { ConfigLoader::validate(c); }));

    setenv("IMGHARVEST_LOG_LEVEL", "loud", 1);
    auto path = WriteJson("bad_level", R"({"target_image_count": 2})");
    std::string program = "imgharvest";
    std::string config_arg = path.string();
    char* argv[] = {program.data(), config_arg.data()};
    assert(ThrowsConfigError([&] { ConfigLoader::from_args(2, argv); }));
    unsetenv("IMGHARVEST_LOG_LEVEL");
}

void TestArgsOverrideFile() {
    auto path = WriteJson("args", R"({"target_image_count": 4, "input_path": "a.txt"})");
    std::string config_arg = path.string();
    std::string program = "imgharvest";
    std::string count = "12";
    std::string input = "b.txt";
    char* argv[] = {program.data(), config_arg.data(), count.data(), input.data()};
    Config c = ConfigLoader::from_args(4, argv);
    assert(c.target_image_count == 12);
    assert(c.input_path == "b.txt");

    std::string bad = "12x";
    char* bad_argv[] = {program.data(), config_arg.data(), bad.data()};
    assert(ThrowsConfigError([&] { ConfigLoader::from_args(3, bad_argv); }));
}

void TestEnvOverridesLogging() {
    setenv("IMGHARVEST_LOG_LEVEL", "warn", 1);
    Config c;
    ConfigLoader::apply_env(c);
    assert(c.log_level == "warn");
    unsetenv("IMGHARVEST_LOG_LEVEL");
}

} // namespace

int main() {
    TestFullFile();
    TestMissingKeysKeepDefaults();
    TestWrongTypeRejected();
    TestMalformedJsonRejected();
    TestValidation();
    TestUnknownLogLevelRejected();
    TestArgsOverrideFile();
    TestEnvOverridesLogging();
    std::cout << "config_loader_test passed" << std::endl;
    return 0;
}
