#pragma once

#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

namespace shared_opts {

/// Malformed or unreadable configuration. Fatal at startup.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Replace every string value of the exact form "${NAME}" with the value of
 * environment variable NAME. Objects and arrays are walked recursively.
 * Unset variables leave the placeholder untouched.
 */
void substitute_env_placeholders(nlohmann::json& node);

/**
 * Read a JSON config file and apply substitute_env_placeholders().
 * Throws ConfigError if the file cannot be opened or is not valid JSON.
 */
nlohmann::json load_config_file(const std::filesystem::path& path);

/// True for a string still of the form "${NAME}" (its variable was unset at load time).
bool is_unresolved_placeholder(const std::string& value);

/**
 * Read section[key] as a string into @p out. Missing keys, non-strings and
 * unresolved placeholders leave @p out unchanged.
 * @return true if @p out was updated.
 */
bool read_config_string(const nlohmann::json& section, const char* key, std::string& out);

/**
 * Read section[key] as an integer in [min_value, max_value] into @p out.
 * A numeric string (what a "${VAR}" placeholder resolves to) is accepted.
 * Anything else leaves @p out unchanged and prints a warning to stderr.
 * @return true if @p out was updated.
 */
bool read_config_int(const nlohmann::json& section, const char* key,
                     int min_value, int max_value, int& out);

class Options {
public:
    using Provider = std::function<void(CLI::App&, const nlohmann::json&)>;

    enum class ParseResult { Ok, Help, Version, Error };

    // Name and version shown by --help / --version. Call before load_and_parse().
    static void set_program_info(std::string name, std::string version);

    static void add_provider(Provider p);
    // Drop all registered providers (primarily for testing).
    static void reset_providers();
    static ParseResult load_and_parse(int argc, char** argv, std::string& err);
    // Directory of the loaded config file (if any). Useful for resolving relative paths in providers.
    static std::optional<std::filesystem::path> get_config_dir();
    // Full path to loaded config file (if any)
    static std::optional<std::filesystem::path> get_config_file();

private:
    static std::mutex& providers_mutex();
};

} // namespace shared_opts
