#include "Options.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <utility>
#include <iostream>
#include <system_error>

namespace shared_opts {

static std::vector<Options::Provider>& providers() {
    static std::vector<Options::Provider> p;
    return p;
}

static std::optional<std::filesystem::path>& loaded_config_file_storage() {
    static std::optional<std::filesystem::path> p;
    return p;
}

std::mutex& Options::providers_mutex() {
    static std::mutex m;
    return m;
}

void Options::add_provider(Provider p) {
    std::lock_guard<std::mutex> lk(providers_mutex());
    providers().push_back(std::move(p));
}

// Read the JSON config named on the command line. A missing or malformed
// file is an option error rather than a silently empty config.
static bool load_config(const std::string& config_file, nlohmann::json& out, std::string& err) {
    std::ifstream ifs(config_file);
    if (!ifs) {
        err = "cannot open config file: " + config_file;
        return false;
    }
    try {
        ifs >> out;
    } catch (const nlohmann::json::parse_error& e) {
        err = "malformed config file " + config_file + ": " + e.what();
        return false;
    }
    std::error_code ec;
    auto abs = std::filesystem::absolute(config_file, ec);
    if (!ec) loaded_config_file_storage() = abs;
    return true;
}

Options::ParseResult Options::load_and_parse(int argc, char** argv, std::string& err) {
    CLI::App app{"linewire line-protocol client"};
    app.set_version_flag("-V,--version", std::string{"linewire 0.1"});

    std::string config_file;
    app.add_option("-c,--config", config_file, "JSON config file to load")->group("General");

    // Pre-parse only -c/--config so the JSON file can seed provider defaults
    // before the strict parse. Errors here are reported by the strict parse.
    CLI::App config_probe{"config_probe"};
    config_probe.add_option("-c,--config", config_file);
    config_probe.allow_extras(true);
    config_probe.set_help_flag();
    try {
        config_probe.parse(argc, argv);
    } catch (const CLI::ParseError&) {
        config_file.clear();
    }

    nlohmann::json cfg_json = nlohmann::json::object();
    loaded_config_file_storage().reset();
    if (!config_file.empty() && !load_config(config_file, cfg_json, err)) {
        return ParseResult::Error;
    }

    {
        std::lock_guard<std::mutex> lk(providers_mutex());
        for (auto& provider : providers()) {
            if (provider) provider(app, cfg_json);
        }
    }

    try {
        app.parse(argc, argv);
        return ParseResult::Ok;
    } catch (const CLI::CallForHelp&) {
        std::cout << app.help() << std::endl;
        return ParseResult::Help;
    } catch (const CLI::CallForAllHelp&) {
        std::cout << app.help() << std::endl;
        return ParseResult::Help;
    } catch (const CLI::CallForVersion& v) {
        std::cout << v.what() << std::endl;
        return ParseResult::Version;
    } catch (const std::exception& e) {
        err = e.what();
        return ParseResult::Error;
    }
}

std::optional<std::filesystem::path> Options::get_config_file() {
    return loaded_config_file_storage();
}

}
