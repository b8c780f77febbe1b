// =============================================================================
// BLOCKFORGE - SOCKET COMPATIBILITY TABLE
// Symmetric "may face" relation over socket labels
// Loads from config/sockets.toml
// =============================================================================
#pragma once

#include "Logger.hpp"
#include "Settings.hpp"
#include "Types.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace blockforge {

class SocketCompatibilityTable {
public:
    // =============================================================================
    // MUTATION
    // =============================================================================

    // Returns false if the label already existed
    bool add_label(const SocketLabel& label) {
        return m_table.try_emplace(label).second;
    }

    // Updates both sides together. No-op (returns false) if either label is unknown.
    bool set_compatible(const SocketLabel& a, const SocketLabel& b, bool compatible) {
        auto ia = m_table.find(a);
        auto ib = m_table.find(b);
        if (ia == m_table.end() || ib == m_table.end()) {
            return false;
        }
        if (compatible) {
            ia->second.insert(b);
            ib->second.insert(a);
        } else {
            ia->second.erase(b);
            ib->second.erase(a);
        }
        return true;
    }

    // Deletes the label and purges it from every other set
    bool remove_label(const SocketLabel& label) {
        if (m_table.erase(label) == 0) return false;
        for (auto& [_, compatible] : m_table) {
            compatible.erase(label);
        }
        return true;
    }

    void clear() { m_table.clear(); }

    // =============================================================================
    // QUERY
    // =============================================================================

    // False if a is absent; empty labels get no special treatment here
    [[nodiscard]] bool are_compatible(const SocketLabel& a, const SocketLabel& b) const {
        auto it = m_table.find(a);
        if (it == m_table.end()) return false;
        return it->second.count(b) != 0;
    }

    [[nodiscard]] bool has_label(const SocketLabel& label) const {
        return m_table.find(label) != m_table.end();
    }

    [[nodiscard]] std::vector<SocketLabel> labels() const {
        std::vector<SocketLabel> out;
        out.reserve(m_table.size());
        for (const auto& [label, _] : m_table) {
            out.push_back(label);
        }
        return out;
    }

    [[nodiscard]] std::vector<SocketLabel> compatible_with(const SocketLabel& label) const {
        auto it = m_table.find(label);
        if (it == m_table.end()) return {};
        return {it->second.begin(), it->second.end()};
    }

    [[nodiscard]] bool is_symmetric() const {
        for (const auto& [a, compatible] : m_table) {
            for (const auto& b : compatible) {
                if (!are_compatible(b, a)) return false;
            }
        }
        return true;
    }

    [[nodiscard]] std::size_t size() const noexcept { return m_table.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_table.empty(); }

    // =============================================================================
    // LOADING
    // [sockets]
    // wall = ["wall", "window"]
    // =============================================================================
    bool load(const Settings& settings) {
        const std::vector<std::string> keys = settings.keys_in("sockets");
        if (keys.empty()) {
            BLOCKFORGE_ERROR("Sockets", "No [sockets] table found");
            return false;
        }

        // Declare every label first, including ones only named on the right
        for (const std::string& label : keys) {
            add_label(label);
            for (const std::string& other : settings.get_string_list("sockets." + label)) {
                add_label(other);
            }
        }

        for (const std::string& label : keys) {
            for (const std::string& other : settings.get_string_list("sockets." + label)) {
                set_compatible(label, other, true);
            }
        }

        BLOCKFORGE_LOG("Sockets", "Loaded ", m_table.size(), " socket labels");
        return true;
    }

private:
    std::map<SocketLabel, std::set<SocketLabel>> m_table;
};

} // namespace blockforge
