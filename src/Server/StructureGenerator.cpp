// =============================================================================
// BLOCKFORGE - STRUCTURE GENERATOR SHARED SETUP CHECKS
// =============================================================================

#include "Server/StructureGenerator.hpp"

namespace blockforge::server {

std::vector<std::string> setup_problems(const BuildGrid& grid, const GenerationContext& ctx) {
    std::vector<std::string> problems = grid.config().validate();

    if (ctx.blocks.empty()) {
        problems.push_back("block catalog is empty");
    }
    if (ctx.sockets.empty()) {
        problems.push_back("socket compatibility table is empty");
    } else if (!ctx.sockets.is_symmetric()) {
        problems.push_back("socket compatibility table is not symmetric");
    }

    for (std::string& p : ctx.rules.validate(ctx.blocks)) {
        problems.push_back(std::move(p));
    }
    for (std::string& p : ctx.style.validate(ctx.blocks)) {
        problems.push_back(std::move(p));
    }
    return problems;
}

} // namespace blockforge::server
