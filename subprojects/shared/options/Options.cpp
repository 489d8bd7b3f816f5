#include "Options.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <utility>
#include <iostream>
#include <stdexcept>

namespace shared_opts {

struct ProviderHolder { std::function<void(CLI::App&, const nlohmann::json&)> cb; };

static std::vector<ProviderHolder>& providers() {
    static std::vector<ProviderHolder> p;
    return p;
}

struct ProgramInfo {
    std::string name{"echo-agent"};
    std::string version{"1.0.0"};
};

static ProgramInfo& program_info() {
    static ProgramInfo info;
    return info;
}

// Store the loaded config file path (if any) so that option providers can resolve relative paths.
static std::optional<std::filesystem::path>& loaded_config_file_storage() {
    static std::optional<std::filesystem::path> p; return p;
}

void substitute_env_placeholders(nlohmann::json& node) {
    if (node.is_object() || node.is_array()) {
        for (auto& child : node) {
            substitute_env_placeholders(child);
        }
        return;
    }
    if (!node.is_string()) return;

    const auto& value = node.get_ref<const std::string&>();
    if (!is_unresolved_placeholder(value)) return;

    const std::string var_name = value.substr(2, value.size() - 3);
    if (const char* env = std::getenv(var_name.c_str())) {
        node = std::string(env);
    }
}

nlohmann::json load_config_file(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw ConfigError("cannot open config file: " + path.string());
    }
    nlohmann::json cfg;
    try {
        ifs >> cfg;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("malformed config file " + path.string() + ": " + e.what());
    }
    if (!cfg.is_object()) {
        throw ConfigError("config file " + path.string() + " must contain a JSON object");
    }
    substitute_env_placeholders(cfg);
    return cfg;
}

bool is_unresolved_placeholder(const std::string& value) {
    return value.size() >= 3 && value.rfind("${", 0) == 0 && value.back() == '}';
}

bool read_config_string(const nlohmann::json& section, const char* key, std::string& out) {
    if (!section.is_object()) return false;
    auto it = section.find(key);
    if (it == section.end() || !it->is_string()) return false;
    const auto& value = it->get_ref<const std::string&>();
    if (is_unresolved_placeholder(value)) {
        std::cerr << "Warning: config key '" << key << "' refers to unset " << value
                  << ", keeping default '" << out << "'" << std::endl;
        return false;
    }
    out = value;
    return true;
}

bool read_config_int(const nlohmann::json& section, const char* key,
                     int min_value, int max_value, int& out) {
    if (!section.is_object()) return false;
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) return false;

    std::optional<long long> parsed;
    if (it->is_number_integer()) {
        parsed = it->get<long long>();
    } else if (it->is_string()) {
        const auto& text = it->get_ref<const std::string&>();
        try {
            size_t consumed = 0;
            long long v = std::stoll(text, &consumed);
            if (consumed == text.size()) parsed = v;
        } catch (const std::logic_error&) {
            // invalid_argument or out_of_range from stoll; reported below
            parsed.reset();
        }
    }

    if (!parsed || *parsed < min_value || *parsed > max_value) {
        std::cerr << "Warning: config key '" << key << "' must be an integer in ["
                  << min_value << ", " << max_value << "], got " << it->dump()
                  << ", using " << out << std::endl;
        return false;
    }
    out = static_cast<int>(*parsed);
    return true;
}

std::mutex& Options::providers_mutex() {
    static std::mutex m;
    return m;
}

void Options::set_program_info(std::string name, std::string version) {
    std::lock_guard<std::mutex> lk(providers_mutex());
    program_info().name = std::move(name);
    program_info().version = std::move(version);
}

void Options::add_provider(Provider p) {
    std::lock_guard<std::mutex> lk(providers_mutex());
    providers().push_back(ProviderHolder{std::move(p)});
}

void Options::reset_providers() {
    std::lock_guard<std::mutex> lk(providers_mutex());
    providers().clear();
}

Options::ParseResult Options::load_and_parse(int argc, char** argv, std::string& err) {
    ProgramInfo info;
    {
        std::lock_guard<std::mutex> lk(providers_mutex());
        info = program_info();
    }
    CLI::App app{info.name};
    app.set_version_flag("-V,--version", info.name + " " + info.version);

    std::string config_file;
    app.add_option("-c,--config", config_file, "JSON config file to load")->group("General");

    // Probe for -c/--config first so providers can take their defaults from
    // the file before the strict parse below.
    CLI::App config_probe{"config_probe"};
    config_probe.add_option("-c,--config", config_file);
    config_probe.allow_extras(true);
    config_probe.set_help_flag();
    try {
        config_probe.parse(argc, argv);
    } catch (const CLI::ParseError&) {
        // The strict parse reports the real problem.
    }

    nlohmann::json cfg_json = nlohmann::json::object();
    if (!config_file.empty()) {
        try {
            cfg_json = load_config_file(config_file);
        } catch (const ConfigError& e) {
            err = e.what();
            return ParseResult::Error;
        }
        std::error_code ec;
        auto abs = std::filesystem::absolute(config_file, ec);
        loaded_config_file_storage() = ec ? std::filesystem::path(config_file) : abs;
    } else {
        loaded_config_file_storage().reset();
    }

    {
        std::lock_guard<std::mutex> lk(providers_mutex());
        for (auto &ph : providers()) {
            if (ph.cb) ph.cb(app, cfg_json);
        }
    }

    try {
        app.parse(argc, argv);
        return ParseResult::Ok;
    } catch (const CLI::CallForHelp &) {
        std::cout << app.help() << std::endl;
        return ParseResult::Help;
    } catch (const CLI::CallForAllHelp &) {
        std::cout << app.help() << std::endl;
        return ParseResult::Help;
    } catch (const CLI::CallForVersion &v) {
        std::cout << v.what() << std::endl;
        return ParseResult::Version;
    } catch (const std::exception &e) {
        err = e.what();
        return ParseResult::Error;
    }
}

std::optional<std::filesystem::path> Options::get_config_dir() {
    auto &s = loaded_config_file_storage();
    if (s && s->has_parent_path()) return s->parent_path();
    return std::nullopt;
}

std::optional<std::filesystem::path> Options::get_config_file() {
    return loaded_config_file_storage();
}

} // namespace shared_opts
