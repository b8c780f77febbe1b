// =============================================================================
// BLOCKFORGE - BUILD KIT IMPLEMENTATION
// =============================================================================

#include "Client/BuildKit.hpp"
#include "Server/RuleFactory.hpp"
#include "Shared/Logger.hpp"

#include <fstream>

namespace blockforge::client {

namespace {

bool file_exists(const std::string& path) {
    std::ifstream file(path);
    return file.is_open();
}

} // namespace

bool BuildKit::load(const std::string& dir) {
    const std::string base = dir.empty() || dir.back() == '/' ? dir : dir + "/";

    bool ok = true;
    for (const char* name : {"sockets.toml", "blocks.toml"}) {
        if (!settings.load(base + name)) {
            ok = false;
        }
    }
    for (const char* name : {"style.toml", "rules.toml", "settings.toml"}) {
        const std::string path = base + name;
        if (!file_exists(path)) {
            BLOCKFORGE_LOG("Config", "Optional file not found: ", path);
            continue;
        }
        if (!settings.load(path)) {
            ok = false;
        }
    }

    for (const std::string& error : settings.errors()) {
        BLOCKFORGE_ERROR("Config", error);
    }
    return build() && ok;
}

bool BuildKit::load_text(const std::string& sockets_text,
                         const std::string& blocks_text,
                         const std::string& style_text,
                         const std::string& rules_text,
                         const std::string& settings_text) {
    bool ok = settings.parse(sockets_text, "sockets");
    ok = settings.parse(blocks_text, "blocks") && ok;
    ok = settings.parse(style_text, "style") && ok;
    ok = settings.parse(rules_text, "rules") && ok;
    ok = settings.parse(settings_text, "settings") && ok;

    for (const std::string& error : settings.errors()) {
        BLOCKFORGE_ERROR("Config", error);
    }
    return build() && ok;
}

bool BuildKit::build() {
    bool ok = sockets.load(settings);
    ok = blocks.load(settings) && ok;
    ok = grid.load(settings) && ok;

    // Start from neutral weights so every block is listed, then apply the file
    style.initialize_with(blocks);
    ok = style.load(settings) && ok;

    for (const std::string& label : blocks.unknown_labels(sockets)) {
        BLOCKFORGE_WARN("Config", "Socket label not in table, it will never connect: ", label);
    }

    // Parse rules once so config errors surface before any run
    server::RuleSet trial;
    ok = make_rules(trial) && ok;
    return ok;
}

bool BuildKit::make_rules(server::RuleSet& out) const {
    const server::RuleFactory factory;
    out.clear();
    return factory.load(settings, out);
}

} // namespace blockforge::client
