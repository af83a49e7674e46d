#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

namespace shared_opts {

// Process-wide option registry. Modules register providers that add their
// CLI options to the app; each provider receives the parsed JSON config (or
// an empty object) so config values can become option defaults.
class Options {
public:
    using Provider = std::function<void(CLI::App&, const nlohmann::json&)>;

    enum class ParseResult { Ok, Help, Version, Error };

    static void add_provider(Provider p);
    static ParseResult load_and_parse(int argc, char** argv, std::string& err);
    // Full path to loaded config file (if any)
    static std::optional<std::filesystem::path> get_config_file();

private:
    static std::mutex& providers_mutex();
};

}
