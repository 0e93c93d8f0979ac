#include "Options.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <utility>
#include <iostream>

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

void Options::clear_providers() {
    std::lock_guard<std::mutex> lk(providers_mutex());
    providers().clear();
}

namespace {

// Discover -c/--config before providers run so they can seed defaults from the file.
std::string probe_config_path(int argc, char** argv) {
    std::string config_file;
    CLI::App probe{"config_probe"};
    probe.add_option("-c,--config", config_file);
    probe.allow_extras(true);
    probe.set_help_flag();
    try {
        probe.parse(argc, argv);
    } catch (const CLI::ParseError&) {
        // The strict parse below reports the real problem.
    }
    return config_file;
}

} // namespace

Options::ParseResult Options::load_and_parse(int argc, char** argv, std::string& err) {
    CLI::App app{"hostbus: worker supervisor and local message bus"};
    app.set_version_flag("-V,--version", std::string{"hostbus 0.1"});

    std::string config_file;
    app.add_option("-c,--config", config_file, "JSON config file to load")->group("General");

    const std::string probed = probe_config_path(argc, argv);

    nlohmann::json cfg_json = nlohmann::json::object();
    loaded_config_file_storage().reset();
    if (!probed.empty()) {
        std::ifstream ifs(probed);
        if (!ifs) {
            err = "cannot open config file '" + probed + "'";
            return ParseResult::Error;
        }
        try {
            ifs >> cfg_json;
        } catch (const nlohmann::json::parse_error& e) {
            err = "malformed config file '" + probed + "': " + e.what();
            return ParseResult::Error;
        }
        if (!cfg_json.is_object()) {
            err = "config file '" + probed + "' must contain a JSON object";
            return ParseResult::Error;
        }
        std::error_code fs_ec;
        auto abs = std::filesystem::absolute(probed, fs_ec);
        if (!fs_ec) loaded_config_file_storage() = abs;
    }

    {
        std::lock_guard<std::mutex> lk(providers_mutex());
        for (auto& p : providers()) {
            if (p) p(app, cfg_json);
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
    } catch (const CLI::ParseError& e) {
        err = e.what();
        return ParseResult::Error;
    }
}

std::optional<std::filesystem::path> Options::get_config_dir() {
    auto& s = loaded_config_file_storage();
    if (s && s->has_parent_path()) return s->parent_path();
    return std::nullopt;
}

std::optional<std::filesystem::path> Options::get_config_file() {
    return loaded_config_file_storage();
}

}
