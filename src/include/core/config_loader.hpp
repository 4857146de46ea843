#pragma once
#include "core/errors.hpp"
#include <string>
#include <unordered_map>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cctype>
#include <cstddef>

namespace dp_ledger {

/**
 * @brief Configuration section holding key-value pairs
 */
struct ConfigSection {
    std::string name;
    std::unordered_map<std::string, std::string> values;

    std::string get(const std::string& key, const std::string& default_val = "") const {
        auto it = values.find(key);
        return (it != values.end()) ? it->second : default_val;
    }

    /**
     * @brief Numeric lookup; a present but unparseable value is an error
     *
     * Accepts "inf" / "infinity" as produced by printf-style writers.
     */
    double get_double(const std::string& key, double default_val = 0.0) const {
        auto it = values.find(key);
        if (it == values.end()) {
            return default_val;
        }
        std::size_t consumed = 0;
        double parsed = 0.0;
        try {
            parsed = std::stod(it->second, &consumed);
        } catch (const std::logic_error&) {
            consumed = 0;
        }
        if (consumed == 0 || consumed != it->second.size()) {
            throw ConfigurationError("[" + name + "] " + key + ": not a number: '" + it->second + "'");
        }
        return parsed;
    }

    bool has(const std::string& key) const {
        return values.find(key) != values.end();
    }
};

/**
 * @brief Simple key-value configuration file parser
 *
 * File format (INI-style with sections):
 * ```
 * [accountant]
 * epsilon = 5.0
 * delta = 1e-6
 * slack = 1e-7
 *
 * [logging]
 * level = info
 * ```
 */
class ConfigLoader {
public:
    std::unordered_map<std::string, ConfigSection> sections;

    bool load(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            return false;
        }
        parse(file);
        return true;
    }

    void load_string(const std::string& text) {
        std::istringstream in(text);
        parse(in);
    }

    bool save(const std::string& filename) const {
        std::ofstream file(filename);
        if (!file.is_open()) {
            return false;
        }

        for (const auto& section_pair : sections) {
            file << "[" << section_pair.first << "]" << std::endl;
            for (const auto& value_pair : section_pair.second.values) {
                file << value_pair.first << " = " << value_pair.second << std::endl;
            }
            file << std::endl;
        }

        return true;
    }

    ConfigSection get_section(const std::string& name) const {
        auto it = sections.find(name);
        if (it != sections.end()) {
            return it->second;
        }
        ConfigSection empty;
        empty.name = name;
        return empty;
    }

    bool has_section(const std::string& name) const {
        return sections.find(name) != sections.end();
    }

private:
    void parse(std::istream& in) {
        sections.clear();
        std::string current_section = "default";

        std::string line;
        while (std::getline(in, line)) {
            line = trim(line);

            // Skip empty lines and comments
            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            if (line[0] == '[' && line.back() == ']') {
                current_section = trim(line.substr(1, line.length() - 2));
                continue;
            }

            size_t pos = line.find('=');
            if (pos != std::string::npos) {
                std::string key = trim(line.substr(0, pos));
                std::string value = trim(line.substr(pos + 1));

                if (value.size() >= 2 &&
                    ((value.front() == '"' && value.back() == '"') ||
                     (value.front() == '\'' && value.back() == '\''))) {
                    value = value.substr(1, value.length() - 2);
                }

                ConfigSection& section = sections[current_section];
                section.name = current_section;
                section.values[key] = value;
            }
        }
    }

    static std::string trim(const std::string& str) {
        size_t start = 0;
        while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
            ++start;
        }
        if (start == str.length()) {
            return "";
        }

        size_t end = str.length() - 1;
        while (end > start && std::isspace(static_cast<unsigned char>(str[end]))) {
            --end;
        }

        return str.substr(start, end - start + 1);
    }
};

} // namespace dp_ledger
