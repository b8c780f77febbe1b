// =============================================================================
// BLOCKFORGE - BLOCK REGISTRY
// Data-driven block catalog - single source of truth for socket layouts
// Loads block definitions from config/blocks.toml
// =============================================================================
#pragma once

#include "Logger.hpp"
#include "Orientation.hpp"
#include "Settings.hpp"
#include "SocketTable.hpp"
#include "Types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace blockforge {

// =============================================================================
// BLOCK DEFINITION (immutable once registered)
// =============================================================================
struct BlockDefinition {
    std::string name;                       // Unique lookup key
    std::string mesh;                       // Opaque visual reference, passed through
    SocketSet sockets;                      // As authored
    Direction down_face = Direction::Down;  // Authored face that rests on the ground

    // Sockets with the physical bottom mapped onto Down; see orient()
    SocketSet oriented;

    // Fills oriented from sockets and down_face; false for an unsupported down face
    [[nodiscard]] bool orient() {
        const auto remapped = remap_for_down_face(sockets, down_face);
        if (!remapped) return false;
        oriented = *remapped;
        return true;
    }

    [[nodiscard]] static std::optional<BlockDefinition> make(std::string name, SocketSet sockets,
                                                             Direction down_face = Direction::Down,
                                                             std::string mesh = {}) {
        BlockDefinition block;
        block.name = std::move(name);
        block.mesh = std::move(mesh);
        block.sockets = std::move(sockets);
        block.down_face = down_face;
        if (!block.orient()) return std::nullopt;
        return block;
    }

    [[nodiscard]] const SocketLabel& socket(Direction d) const noexcept {
        return oriented.get(d);
    }
};

// =============================================================================
// BLOCK REGISTRY
// =============================================================================
class BlockRegistry {
public:
    // =============================================================================
    // REGISTRATION
    // =============================================================================

    // Rejects empty or duplicate names and down faces without a remap table
    bool add(BlockDefinition block) {
        if (block.name.empty()) {
            BLOCKFORGE_ERROR("BlockRegistry", "Block with empty name");
            return false;
        }
        if (m_index.find(block.name) != m_index.end()) {
            BLOCKFORGE_ERROR("BlockRegistry", "Duplicate block name: ", block.name);
            return false;
        }
        if (!block.orient()) {
            BLOCKFORGE_ERROR("BlockRegistry", "Block '", block.name, "' uses unsupported down face: ",
                             direction::name(block.down_face));
            return false;
        }

        m_index.emplace(block.name, m_blocks.size());
        m_blocks.push_back(std::move(block));
        return true;
    }

    // Load block definitions from parsed settings
    // [[blocks.Wall]]
    // up = "wall_top"
    // down = "floor"
    // ...
    bool load(const Settings& settings) {
        bool ok = true;
        std::size_t blocks_loaded = 0;

        for (const std::string& name : settings.tables_with_prefix("blocks")) {
            const std::string prefix = "blocks." + name + ".";

            BlockDefinition block;
            block.name = name;
            block.mesh = settings.get_string(prefix + "mesh");
            for (Direction d : ALL_DIRECTIONS) {
                block.sockets.set(d, settings.get_string(prefix + std::string(direction::name(d))));
            }

            const std::string down = settings.get_string(prefix + "down_face", "down");
            const auto down_face = direction::from_name(down);
            if (!down_face) {
                BLOCKFORGE_ERROR("BlockRegistry", "Block '", name, "' has unknown down_face: ", down);
                ok = false;
                continue;
            }
            block.down_face = *down_face;

            if (add(std::move(block))) {
                blocks_loaded++;
            } else {
                ok = false;
            }
        }

        BLOCKFORGE_LOG("BlockRegistry", "Loaded ", blocks_loaded, " block types");
        return ok;
    }

    void clear() {
        m_blocks.clear();
        m_index.clear();
    }

    // =============================================================================
    // LOOKUP
    // =============================================================================

    // nullptr when absent; pointers stay valid until the next add()
    [[nodiscard]] const BlockDefinition* find(std::string_view name) const {
        auto it = m_index.find(std::string(name));
        if (it == m_index.end()) return nullptr;
        return &m_blocks[it->second];
    }

    [[nodiscard]] bool contains(std::string_view name) const {
        return find(name) != nullptr;
    }

    // Registration order
    [[nodiscard]] const std::vector<BlockDefinition>& all() const noexcept {
        return m_blocks;
    }

    [[nodiscard]] std::size_t size() const noexcept { return m_blocks.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_blocks.empty(); }

    // =============================================================================
    // CATALOG QUERIES
    // =============================================================================

    [[nodiscard]] std::vector<const BlockDefinition*> with_socket(Direction d, const SocketLabel& label) const {
        std::vector<const BlockDefinition*> out;
        for (const auto& block : m_blocks) {
            if (block.socket(d) == label) out.push_back(&block);
        }
        return out;
    }

    [[nodiscard]] std::vector<const BlockDefinition*> with_any_socket(Direction d) const {
        std::vector<const BlockDefinition*> out;
        for (const auto& block : m_blocks) {
            if (!block.socket(d).empty()) out.push_back(&block);
        }
        return out;
    }

    // Blocks whose socket in direction d may face the given label
    [[nodiscard]] std::vector<const BlockDefinition*> compatible_with(
        Direction d, const SocketLabel& label, const SocketCompatibilityTable& table) const {
        std::vector<const BlockDefinition*> out;
        for (const auto& block : m_blocks) {
            const SocketLabel& own = block.socket(d);
            if (!own.empty() && table.are_compatible(own, label)) out.push_back(&block);
        }
        return out;
    }

    // Labels used by blocks but missing from the table can never connect
    [[nodiscard]] std::vector<std::string> unknown_labels(const SocketCompatibilityTable& table) const {
        std::vector<std::string> out;
        for (const auto& block : m_blocks) {
            for (Direction d : ALL_DIRECTIONS) {
                const SocketLabel& label = block.socket(d);
                if (!label.empty() && !table.has_label(label)) {
                    out.push_back(block.name + "." + std::string(direction::name(d)) + " = " + label);
                }
            }
        }
        return out;
    }

private:
    std::vector<BlockDefinition> m_blocks;
    std::unordered_map<std::string, std::size_t> m_index;
};

} // namespace blockforge
