// =============================================================================
// BLOCKFORGE - BUILD KIT
// Everything loaded from a config directory, shared read-only by all runs
// =============================================================================
#pragma once

#include "Server/BuildGrid.hpp"
#include "Server/BuildingStyle.hpp"
#include "Server/PlacementRules.hpp"
#include "Shared/BlockRegistry.hpp"
#include "Shared/Settings.hpp"
#include "Shared/SocketTable.hpp"

#include <string>
#include <vector>

namespace blockforge::client {

struct BuildKit {
    Settings settings;                      // All config files merged
    SocketCompatibilityTable sockets;
    BlockRegistry blocks;
    server::BuildingStyle style;
    server::GridConfig grid;

    // Reads sockets/blocks/style/rules/settings .toml from dir.
    // style, rules and settings files are optional.
    bool load(const std::string& dir);

    // Same, from in-memory text (missing pieces left empty)
    bool load_text(const std::string& sockets_text,
                   const std::string& blocks_text,
                   const std::string& style_text = "",
                   const std::string& rules_text = "",
                   const std::string& settings_text = "");

    // Fresh rule set for one run; rules carry per-run state
    bool make_rules(server::RuleSet& out) const;

private:
    bool build();
};

} // namespace blockforge::client
