/**
 * yaml_config.hpp - Simple YAML configuration loader for xsys
 *
 * Parses a subset of YAML (key: value pairs with sections) without external dependencies.
 * Command-line arguments override config file settings.
 */

#pragma once

#include <string>
#include <fstream>
#include <sstream>
#include <vector>
#include <filesystem>
#include <iostream>
#include <algorithm>
#include <stdexcept>
#include <cstdlib>

namespace xsys {

/**
 * Application configuration loaded from xsys.yml
 */
struct AppConfig {
    // Output
    std::string output_type = "html";
    std::string title = "Expert System";
    std::string output_name = "output";

    // Parser
    bool strict = false;

    // Settings
    bool verbose = false;
    bool debug = false;

    // Paths
    std::string log_dir;  // Empty = ~/.xsys

    // Path the configuration was read from, empty if defaults only
    std::string source_path;

    /**
     * Get possible config file paths (in order of priority)
     */
    static std::vector<std::string> get_config_paths() {
        std::vector<std::string> paths;

        // 1. Current directory
        paths.push_back("./xsys.yml");
        paths.push_back("./xsys.yaml");

        // 2. User home directory
        std::string home;
#ifdef _WIN32
        const char* userprofile = std::getenv("USERPROFILE");
        home = userprofile ? userprofile : "";
#else
        const char* home_env = std::getenv("HOME");
        home = home_env ? home_env : "";
#endif
        if (!home.empty()) {
            paths.push_back(home + "/.xsys/config.yml");
            paths.push_back(home + "/.xsys/config.yaml");
        }

        return paths;
    }

    /**
     * Load configuration from YAML file.
     * Returns true if a config file was found and loaded.
     */
    bool load(const std::string& explicit_path = "") {
        std::string config_path;

        if (!explicit_path.empty()) {
            if (std::filesystem::exists(explicit_path)) {
                config_path = explicit_path;
            } else {
                std::cerr << "[!] Config file not found: " << explicit_path << "\n";
                return false;
            }
        } else {
            for (const auto& path : get_config_paths()) {
                if (std::filesystem::exists(path)) {
                    config_path = path;
                    break;
                }
            }
        }

        if (config_path.empty()) {
            return false;  // No config file found (this is OK)
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cerr << "[!] Failed to open config file: " << config_path << "\n";
            return false;
        }

        source_path = config_path;
        load_from_stream(file);
        return true;
    }

    /**
     * Parse configuration text. Invalid values are reported and skipped.
     * Returns the number of values rejected.
     */
    int load_from_stream(std::istream& in) {
        std::string line;
        std::string current_section;
        int line_number = 0;
        int errors = 0;

        while (std::getline(in, line)) {
            line_number++;

            // Trim leading whitespace and count indent
            size_t indent = 0;
            while (indent < line.length() && (line[indent] == ' ' || line[indent] == '\t')) {
                indent++;
            }
            std::string trimmed = line.substr(indent);

            // Skip empty lines, comments and document markers
            if (trimmed.empty() || trimmed[0] == '#' || trimmed.substr(0, 3) == "---") {
                continue;
            }

            // Remove trailing comments (not inside quotes)
            size_t comment_pos = find_comment(trimmed);
            if (comment_pos != std::string::npos) {
                trimmed = trimmed.substr(0, comment_pos);
            }

            while (!trimmed.empty() && (trimmed.back() == ' ' || trimmed.back() == '\t' || trimmed.back() == '\r')) {
                trimmed.pop_back();
            }

            if (trimmed.empty()) continue;

            // Parse key: value
            size_t colon_pos = trimmed.find(':');
            if (colon_pos == std::string::npos) continue;

            std::string key = trimmed.substr(0, colon_pos);
            std::string value = (colon_pos + 1 < trimmed.length()) ? trimmed.substr(colon_pos + 1) : "";

            while (!key.empty() && (key.back() == ' ' || key.back() == '\t')) key.pop_back();
            while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) value.erase(0, 1);

            // Section header (no value at top level)
            if (value.empty() && indent == 0) {
                current_section = key;
                continue;
            }

            // Remove quotes from string values
            if (value.length() >= 2 &&
                ((value.front() == '"' && value.back() == '"') ||
                 (value.front() == '\'' && value.back() == '\''))) {
                value = value.substr(1, value.length() - 2);
            }

            try {
                parse_value(current_section, key, value);
            } catch (const std::exception& e) {
                std::cerr << "[!] Config parse error at line " << line_number << ": " << e.what() << "\n";
                errors++;
            }
        }

        return errors;
    }

private:
    void parse_value(const std::string& section, const std::string& key, const std::string& value) {
        if (section == "output") {
            if (key == "type") {
                if (value != "html" && value != "json") {
                    throw std::invalid_argument("output.type must be html or json, got '" + value + "'");
                }
                output_type = value;
            }
            else if (key == "title") title = value;
            else if (key == "name") output_name = value;
        }
        else if (section == "parser") {
            if (key == "strict") strict = parse_bool(value);
        }
        else if (section == "settings") {
            if (key == "verbose") verbose = parse_bool(value);
            else if (key == "debug") debug = parse_bool(value);
        }
        else if (section == "paths") {
            if (key == "log_dir") log_dir = value;
        }
    }

    static size_t find_comment(const std::string& s) {
        char quote = 0;
        for (size_t i = 0; i < s.size(); i++) {
            char c = s[i];
            if (quote) {
                if (c == quote) quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '#' && (i == 0 || s[i - 1] == ' ' || s[i - 1] == '\t')) {
                return i;
            }
        }
        return std::string::npos;
    }

    static bool parse_bool(const std::string& value) {
        std::string lower = value;
        std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
        if (lower == "true" || lower == "yes" || lower == "1" || lower == "on") return true;
        if (lower == "false" || lower == "no" || lower == "0" || lower == "off") return false;
        throw std::invalid_argument("expected a boolean, got '" + value + "'");
    }
};

/**
 * Apply config file settings to Arguments struct.
 * Only applies settings where the command line didn't set a value.
 */
template<typename Arguments>
void apply_config_to_args(Arguments& args, const AppConfig& config) {
    if (!args.type_set) args.type = config.output_type;
    if (!args.title_set) args.title = config.title;
    if (!args.output_set) args.output = config.output_name;

    // Boolean flags can only be switched on from the command line
    if (config.strict) args.strict = true;
    if (config.verbose) args.verbose = true;
    if (config.debug) args.debug = true;

    if (args.log_dir.empty()) args.log_dir = config.log_dir;
}

}  // namespace xsys
