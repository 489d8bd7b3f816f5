/**
 * @file test_options.cpp
 * @brief Config file loading, ${VAR} substitution and provider-driven parsing.
 */

#undef NDEBUG
#include "options/Options.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using shared_opts::ConfigError;
using shared_opts::Options;
using nlohmann::json;

namespace {

std::filesystem::path write_temp(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream ofs(path);
    ofs << content;
    return path;
}

/// argv-style view over a list of strings.
struct Argv {
    std::vector<std::string> storage;
    std::vector<char*> pointers;

    explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
        for (auto& s : storage) pointers.push_back(s.data());
        pointers.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(storage.size()); }
    char** argv() { return pointers.data(); }
};

template <typename Fn>
bool throws_config_error(Fn&& fn) {
    try {
        fn();
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

} // namespace

void test_env_substitution() {
    std::cout << "\n=== Testing ${VAR} Substitution ===\n";
    setenv("ECHO_AGENT_TEST_NAME", "FromEnv", 1);
    unsetenv("ECHO_AGENT_TEST_UNSET");

    json cfg = {
        {"agent", {{"name", "${ECHO_AGENT_TEST_NAME}"}, {"url", "${ECHO_AGENT_TEST_UNSET}"}}},
        {"list", {"${ECHO_AGENT_TEST_NAME}", 3, "plain"}},
        {"embedded", "prefix ${ECHO_AGENT_TEST_NAME}"},
        {"number", 8000}
    };
    shared_opts::substitute_env_placeholders(cfg);

    assert(cfg["agent"]["name"] == "FromEnv");
    assert(cfg["agent"]["url"] == "${ECHO_AGENT_TEST_UNSET}");
    assert(cfg["list"][0] == "FromEnv");
    assert(cfg["list"][1] == 3);
    assert(cfg["list"][2] == "plain");
    assert(cfg["embedded"] == "prefix ${ECHO_AGENT_TEST_NAME}");
    assert(cfg["number"] == 8000);
    std::cout << "  Substitution test passed!\n";
}

void test_load_config_file_errors() {
    std::cout << "\n=== Testing Config File Errors ===\n";
    auto missing = std::filesystem::temp_directory_path() / "echo_agent_does_not_exist.json";
    std::filesystem::remove(missing);
    assert(throws_config_error([&] { (void)shared_opts::load_config_file(missing); }));

    auto malformed = write_temp("echo_agent_malformed.json", "{\"server\": {\"port\": }");
    assert(throws_config_error([&] { (void)shared_opts::load_config_file(malformed); }));

    auto not_object = write_temp("echo_agent_array.json", "[1, 2, 3]");
    assert(throws_config_error([&] { (void)shared_opts::load_config_file(not_object); }));

    setenv("ECHO_AGENT_TEST_HOST", "127.0.0.1", 1);
    auto good = write_temp("echo_agent_good.json", R"({"server": {"host": "${ECHO_AGENT_TEST_HOST}", "port": 9001}})");
    auto cfg = shared_opts::load_config_file(good);
    assert(cfg["server"]["host"] == "127.0.0.1");
    assert(cfg["server"]["port"] == 9001);
    std::cout << "  Config file errors test passed!\n";
}

void test_config_value_readers() {
    std::cout << "\n=== Testing Config Value Readers ===\n";
    json section = {
        {"port", 9000},
        {"port_text", "9001"},
        {"port_garbage", "90x"},
        {"port_range", 70000},
        {"port_placeholder", "${ECHO_AGENT_TEST_UNSET_PORT}"},
        {"url", "http://agent:9000"},
        {"url_placeholder", "${ECHO_AGENT_TEST_UNSET_URL}"},
        {"flag", true}
    };

    int value = 8000;
    assert(shared_opts::read_config_int(section, "port", 1, 65535, value) && value == 9000);
    assert(shared_opts::read_config_int(section, "port_text", 1, 65535, value) && value == 9001);
    value = 8000;
    assert(!shared_opts::read_config_int(section, "port_garbage", 1, 65535, value) && value == 8000);
    assert(!shared_opts::read_config_int(section, "port_range", 1, 65535, value) && value == 8000);
    assert(!shared_opts::read_config_int(section, "port_placeholder", 1, 65535, value) && value == 8000);
    assert(!shared_opts::read_config_int(section, "flag", 1, 65535, value) && value == 8000);
    assert(!shared_opts::read_config_int(section, "absent", 1, 65535, value) && value == 8000);

    std::string url = "http://localhost:8000";
    assert(!shared_opts::read_config_string(section, "url_placeholder", url));
    assert(url == "http://localhost:8000");
    assert(!shared_opts::read_config_string(section, "flag", url));
    assert(shared_opts::read_config_string(section, "url", url) && url == "http://agent:9000");

    assert(shared_opts::is_unresolved_placeholder("${X}"));
    assert(!shared_opts::is_unresolved_placeholder("prefix ${X}"));
    std::cout << "  Config value readers test passed!\n";
}

void test_providers_and_cli_override() {
    std::cout << "\n=== Testing Providers ===\n";
    Options::reset_providers();

    static int port = 0;
    static std::string host;
    Options::add_provider([](CLI::App& app, const json& j) {
        port = 8000;
        host = "0.0.0.0";
        if (j.contains("server")) {
            port = j["server"].value("port", port);
            host = j["server"].value("host", host);
        }
        app.add_option("--port", port);
        app.add_option("--host", host);
    });

    auto cfg = write_temp("echo_agent_providers.json", R"({"server": {"host": "10.0.0.1", "port": 9100}})");
    std::string err;

    Argv defaults({"prog"});
    assert(Options::load_and_parse(defaults.argc(), defaults.argv(), err) == Options::ParseResult::Ok);
    assert(port == 8000 && host == "0.0.0.0");
    assert(!Options::get_config_file().has_value());

    Argv from_file({"prog", "-c", cfg.string()});
    assert(Options::load_and_parse(from_file.argc(), from_file.argv(), err) == Options::ParseResult::Ok);
    assert(port == 9100 && host == "10.0.0.1");
    assert(Options::get_config_file().has_value());
    assert(Options::get_config_dir() == std::filesystem::absolute(cfg).parent_path());

    // CLI flags win over the config file
    Argv overridden({"prog", "--port", "9200", "--config", cfg.string()});
    assert(Options::load_and_parse(overridden.argc(), overridden.argv(), err) == Options::ParseResult::Ok);
    assert(port == 9200 && host == "10.0.0.1");
    std::cout << "  Providers test passed!\n";
}

void test_parse_results() {
    std::cout << "\n=== Testing Parse Results ===\n";
    Options::reset_providers();
    Options::set_program_info("options-test", "0.0.1");
    std::string err;

    Argv unknown({"prog", "--no-such-flag"});
    assert(Options::load_and_parse(unknown.argc(), unknown.argv(), err) == Options::ParseResult::Error);
    assert(!err.empty());

    err.clear();
    Argv missing({"prog", "-c", "/nonexistent/echo-agent.json"});
    assert(Options::load_and_parse(missing.argc(), missing.argv(), err) == Options::ParseResult::Error);
    assert(err.find("cannot open config file") != std::string::npos);

    err.clear();
    auto malformed = write_temp("echo_agent_malformed2.json", "{ nope");
    Argv bad({"prog", "-c", malformed.string()});
    assert(Options::load_and_parse(bad.argc(), bad.argv(), err) == Options::ParseResult::Error);
    assert(err.find("malformed config file") != std::string::npos);

    Argv help({"prog", "--help"});
    assert(Options::load_and_parse(help.argc(), help.argv(), err) == Options::ParseResult::Help);

    Argv version({"prog", "--version"});
    assert(Options::load_and_parse(version.argc(), version.argv(), err) == Options::ParseResult::Version);
    std::cout << "  Parse results test passed!\n";
}

int main() {
    test_env_substitution();
    test_load_config_file_errors();
    test_config_value_readers();
    test_providers_and_cli_override();
    test_parse_results();

    std::cout << "\n=== All options tests passed! ===\n";
    return 0;
}
