// =============================================================================
// BLOCKFORGE - GENERATOR REGISTRY
// Runtime-selectable structure generators, configured from settings
// =============================================================================
#pragma once

#include "Server/BlueprintGenerator.hpp"
#include "Server/FrontierGenerator.hpp"
#include "Server/StructureGenerator.hpp"
#include "Shared/Logger.hpp"
#include "Shared/Settings.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace blockforge::server {

// =============================================================================
// GENERATOR FACTORY FUNCTION TYPE
// nullptr when the settings are malformed
// =============================================================================
using GeneratorFactory = std::function<std::unique_ptr<StructureGenerator>(const Settings& settings, std::uint64_t seed)>;

// =============================================================================
// GENERATOR REGISTRY
// Allows runtime registration and creation of structure generators
// =============================================================================
class GeneratorRegistry {
public:
    GeneratorRegistry() {
        // Register built-in generators
        register_defaults();
    }

    // =============================================================================
    // REGISTRATION
    // =============================================================================

    // Register a generator factory
    void register_generator(const std::string& name, GeneratorFactory factory) {
        m_factories[name] = std::move(factory);
        BLOCKFORGE_TRACE("GeneratorRegistry", "Registered generator: ", name);
    }

    // =============================================================================
    // CREATION
    // =============================================================================

    // Create generator by name; the seed overrides the one in settings
    [[nodiscard]] std::unique_ptr<StructureGenerator> create(
        std::string_view name,
        const Settings& settings,
        std::uint64_t seed
    ) const {
        auto it = m_factories.find(std::string(name));
        if (it != m_factories.end()) {
            return it->second(settings, seed);
        }

        BLOCKFORGE_ERROR("GeneratorRegistry", "Unknown generator: ", name);
        return nullptr;
    }

    // =============================================================================
    // QUERY
    // =============================================================================

    // Check if generator exists
    [[nodiscard]] bool has_generator(const std::string& name) const {
        return m_factories.find(name) != m_factories.end();
    }

    // Get list of registered generator names
    [[nodiscard]] std::vector<std::string> list_generators() const {
        std::vector<std::string> names;
        names.reserve(m_factories.size());
        for (const auto& [name, _] : m_factories) {
            names.push_back(name);
        }
        return names;
    }

    // Get count of registered generators
    [[nodiscard]] std::size_t count() const noexcept {
        return m_factories.size();
    }

private:
    void register_defaults() {
        // Frontier expansion - default
        register_generator("frontier",
            [](const Settings& settings, std::uint64_t seed) -> std::unique_ptr<StructureGenerator> {
                FrontierConfig config;
                if (!config.load(settings)) return nullptr;
                config.seed = seed;
                return std::make_unique<FrontierGenerator>(config);
            });

        // Fixed box building
        register_generator("blueprint",
            [](const Settings& settings, std::uint64_t seed) -> std::unique_ptr<StructureGenerator> {
                BlueprintConfig config;
                if (!config.load(settings)) return nullptr;
                config.seed = seed;
                return std::make_unique<BlueprintGenerator>(config);
            });
    }

    std::unordered_map<std::string, GeneratorFactory> m_factories;
};

} // namespace blockforge::server
