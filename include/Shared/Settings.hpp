// =============================================================================
// BLOCKFORGE - SETTINGS LOADER
// Simple TOML-like config parser
// Supports [section], [[group.name]], key = value, inline arrays, # comments
// =============================================================================
#pragma once

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace blockforge {

class Settings {
public:
    // =============================================================================
    // LOADING
    // =============================================================================

    // Load settings from file
    bool load(const std::string& filepath) {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            m_errors.push_back(filepath + ": failed to open");
            return false;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return parse(buffer.str(), filepath);
    }

    // Parse in-memory text; returns false if any line was malformed.
    // Well-formed lines are kept even when others fail.
    bool parse(std::string_view text, const std::string& source = "<memory>") {
        const std::size_t errors_before = m_errors.size();
        std::string current_section;
        std::size_t line_number = 0;
        std::istringstream stream{std::string(text)};
        std::string line;

        while (std::getline(stream, line)) {
            ++line_number;

            // Skip empty lines and comments
            strip_comment(line);
            trim(line);
            if (line.empty()) continue;

            const std::string where = source + ":" + std::to_string(line_number);

            // Table header [[group.name]] or [section]
            if (line[0] == '[') {
                const bool array_table = line.size() > 1 && line[1] == '[';
                const std::string_view closing = array_table ? "]]" : "]";
                const std::size_t open_len = array_table ? 2 : 1;
                const std::size_t end = line.find(closing, open_len);
                if (end == std::string::npos || end + closing.size() != line.size()) {
                    m_errors.push_back(where + ": malformed table header '" + line + "'");
                } else {
                    current_section = line.substr(open_len, end - open_len);
                    trim(current_section);
                    m_tables.push_back(current_section);
                }
                continue;
            }

            // Key = value
            const std::size_t eq_pos = line.find('=');
            if (eq_pos == std::string::npos) {
                m_errors.push_back(where + ": expected 'key = value'");
                continue;
            }

            std::string key = line.substr(0, eq_pos);
            std::string value = line.substr(eq_pos + 1);
            trim(key);
            trim(value);

            if (key.empty()) {
                m_errors.push_back(where + ": empty key");
            } else if (value.empty()) {
                m_errors.push_back(where + ": missing value for '" + key + "'");
            } else if (value.front() == '"' && (value.size() < 2 || value.back() != '"')) {
                m_errors.push_back(where + ": unterminated string for '" + key + "'");
            } else if (value.front() == '[' && value.back() != ']') {
                m_errors.push_back(where + ": unterminated array for '" + key + "'");
            } else {
                // Remove quotes from strings
                if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                    value = value.substr(1, value.size() - 2);
                }

                // Store with section prefix
                std::string full_key = current_section.empty() ? key : current_section + "." + key;
                if (m_values.find(full_key) != m_values.end()) {
                    // First definition wins
                    m_errors.push_back(where + ": duplicate key '" + full_key + "'");
                } else {
                    m_keys[current_section].push_back(key);
                    m_values.emplace(std::move(full_key), std::move(value));
                }
            }
        }

        return m_errors.size() == errors_before;
    }

    // =============================================================================
    // SCALAR ACCESS
    // =============================================================================

    // Get string value
    [[nodiscard]] std::string get_string(const std::string& key, const std::string& default_val = "") const {
        auto it = m_values.find(key);
        if (it != m_values.end()) {
            return it->second;
        }
        return default_val;
    }

    [[nodiscard]] std::optional<float> try_float(const std::string& key) const {
        auto it = m_values.find(key);
        if (it == m_values.end()) return std::nullopt;
        return parse_float(it->second);
    }

    [[nodiscard]] std::optional<long> try_int(const std::string& key) const {
        auto it = m_values.find(key);
        if (it == m_values.end()) return std::nullopt;
        return parse_int(it->second);
    }

    // Get float value
    [[nodiscard]] float get_float(const std::string& key, float default_val = 0.0f) const {
        return try_float(key).value_or(default_val);
    }

    // Get int value
    [[nodiscard]] int get_int(const std::string& key, int default_val = 0) const {
        const auto v = try_int(key);
        return v ? static_cast<int>(*v) : default_val;
    }

    // true/false, yes/no, 1/0; anything else is nullopt
    [[nodiscard]] std::optional<bool> try_bool(const std::string& key) const {
        auto it = m_values.find(key);
        if (it == m_values.end()) return std::nullopt;
        return parse_bool(it->second);
    }

    // Get bool value
    [[nodiscard]] bool get_bool(const std::string& key, bool default_val = false) const {
        return try_bool(key).value_or(default_val);
    }

    // =============================================================================
    // CHECKED READS
    // Absent keys leave `out` alone and succeed; present but malformed values
    // leave `out` alone and fail
    // =============================================================================

    [[nodiscard]] bool read(const std::string& key, int& out) const {
        if (!has(key)) return true;
        const auto v = try_int(key);
        if (!v || *v < std::numeric_limits<int>::min() || *v > std::numeric_limits<int>::max()) return false;
        out = static_cast<int>(*v);
        return true;
    }

    [[nodiscard]] bool read(const std::string& key, float& out) const {
        if (!has(key)) return true;
        const auto v = try_float(key);
        if (!v) return false;
        out = *v;
        return true;
    }

    [[nodiscard]] bool read(const std::string& key, bool& out) const {
        if (!has(key)) return true;
        const auto v = try_bool(key);
        if (!v) return false;
        out = *v;
        return true;
    }

    // Check if key exists
    [[nodiscard]] bool has(const std::string& key) const {
        return m_values.find(key) != m_values.end();
    }

    // =============================================================================
    // ARRAY ACCESS
    // =============================================================================

    [[nodiscard]] std::vector<std::string> get_string_list(const std::string& key) const {
        std::vector<std::string> items;
        auto it = m_values.find(key);
        if (it == m_values.end()) return items;

        std::string raw = it->second;
        if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
            // Bare scalar reads as a one-element list
            items.push_back(raw);
            return items;
        }

        raw = raw.substr(1, raw.size() - 2);
        std::string item;
        bool in_quotes = false;
        for (char c : raw) {
            if (c == '"') {
                in_quotes = !in_quotes;
            } else if (c == ',' && !in_quotes) {
                trim(item);
                if (!item.empty()) items.push_back(unquote(item));
                item.clear();
                continue;
            }
            item.push_back(c);
        }
        trim(item);
        if (!item.empty()) items.push_back(unquote(item));
        return items;
    }

    // Nullopt if any element is not a number
    [[nodiscard]] std::optional<std::vector<float>> get_float_list(const std::string& key) const {
        std::vector<float> values;
        for (const std::string& item : get_string_list(key)) {
            const auto v = parse_float(item);
            if (!v) return std::nullopt;
            values.push_back(*v);
        }
        return values;
    }

    // Nullopt if any element is not an integer
    [[nodiscard]] std::optional<std::vector<long>> get_int_list(const std::string& key) const {
        std::vector<long> values;
        for (const std::string& item : get_string_list(key)) {
            const auto v = parse_int(item);
            if (!v) return std::nullopt;
            values.push_back(*v);
        }
        return values;
    }

    // =============================================================================
    // TABLE QUERIES
    // =============================================================================

    // Names following "prefix." for every table header, in file order
    // e.g. prefix "blocks" yields "Wall" for [[blocks.Wall]]
    [[nodiscard]] std::vector<std::string> tables_with_prefix(const std::string& prefix) const {
        std::vector<std::string> names;
        const std::string lead = prefix + ".";
        for (const std::string& table : m_tables) {
            if (table.size() > lead.size() && table.compare(0, lead.size(), lead) == 0) {
                names.push_back(table.substr(lead.size()));
            }
        }
        return names;
    }

    [[nodiscard]] bool has_table(const std::string& name) const {
        for (const std::string& table : m_tables) {
            if (table == name) return true;
        }
        return false;
    }

    // Keys declared directly in a table, in file order
    [[nodiscard]] std::vector<std::string> keys_in(const std::string& section) const {
        auto it = m_keys.find(section);
        if (it == m_keys.end()) return {};
        return it->second;
    }

    [[nodiscard]] const std::vector<std::string>& errors() const noexcept { return m_errors; }
    [[nodiscard]] std::size_t size() const noexcept { return m_values.size(); }

private:
    static void trim(std::string& s) {
        const std::size_t start = s.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) {
            s.clear();
            return;
        }
        const std::size_t end = s.find_last_not_of(" \t\r\n");
        s = s.substr(start, end - start + 1);
    }

    // Drop everything after a '#' that is not inside quotes
    static void strip_comment(std::string& line) {
        bool in_quotes = false;
        for (std::size_t i = 0; i < line.size(); ++i) {
            if (line[i] == '"') in_quotes = !in_quotes;
            if (line[i] == '#' && !in_quotes) {
                line.erase(i);
                return;
            }
        }
    }

    static std::string unquote(const std::string& s) {
        if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
            return s.substr(1, s.size() - 2);
        }
        return s;
    }

    static std::optional<float> parse_float(const std::string& text) {
        if (text.empty()) return std::nullopt;
        char* end = nullptr;
        const float val = std::strtof(text.c_str(), &end);
        if (end == text.c_str() || *end != '\0') return std::nullopt;
        return val;
    }

    static std::optional<bool> parse_bool(const std::string& text) {
        if (text == "true" || text == "yes" || text == "1") return true;
        if (text == "false" || text == "no" || text == "0") return false;
        return std::nullopt;
    }

    static std::optional<long> parse_int(const std::string& text) {
        if (text.empty()) return std::nullopt;
        char* end = nullptr;
        const long val = std::strtol(text.c_str(), &end, 10);
        if (end == text.c_str() || *end != '\0') return std::nullopt;
        return val;
    }

    std::unordered_map<std::string, std::string> m_values;
    std::unordered_map<std::string, std::vector<std::string>> m_keys;
    std::vector<std::string> m_tables;
    std::vector<std::string> m_errors;
};

} // namespace blockforge
