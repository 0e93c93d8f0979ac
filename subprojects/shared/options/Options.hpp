/**
 * \file Options.hpp
 * \brief Process-wide option registry merging a JSON config file with CLI11 flags.
 * \details Each module contributes a provider. A provider reads its defaults from the
 * JSON document (if one was loaded via `-c/--config`) and then declares CLI flags that
 * may override them. `load_and_parse` runs every provider against a single `CLI::App`.
 */
#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include <optional>
#include <type_traits>
#include <filesystem>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

namespace shared_opts {
class Options {
public:
    using Provider = std::function<void(CLI::App&, const nlohmann::json&)>;

    enum class ParseResult { Ok, Help, Version, Error };

    static void add_provider(Provider p);
    /** \brief Load the optional config file, run providers, then parse argv strictly.
     *  \param err Receives a readable message when the result is `Error`.
     */
    static ParseResult load_and_parse(int argc, char** argv, std::string& err);
    /// Directory of the loaded config file (if any); providers resolve relative paths against it.
    static std::optional<std::filesystem::path> get_config_dir();
    static std::optional<std::filesystem::path> get_config_file();
    /// Drop every registered provider. Used by tests that build their own option sets.
    static void clear_providers();

private:
    static std::mutex& providers_mutex();
};

/** \brief Read `section.key` from a config document when it holds a value of type `T`. */
template <typename T>
std::optional<T> json_value(const nlohmann::json& doc, const char* section, const char* key) {
    if (!doc.is_object() || !doc.contains(section)) return std::nullopt;
    const auto& s = doc[section];
    if (!s.is_object() || !s.contains(key)) return std::nullopt;
    const auto& v = s[key];
    if constexpr (std::is_same_v<T, bool>) {
        if (!v.is_boolean()) return std::nullopt;
    } else if constexpr (std::is_integral_v<T>) {
        if (!v.is_number_integer()) return std::nullopt;
    } else if constexpr (std::is_floating_point_v<T>) {
        if (!v.is_number()) return std::nullopt;
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (!v.is_string()) return std::nullopt;
    }
    return v.template get<T>();
}
}
