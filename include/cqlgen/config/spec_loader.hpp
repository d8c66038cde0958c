// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Specification Loader                                               ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "cqlgen/config/spec_handler.hpp"
#include "cqlgen/keyspace/specification.hpp"
#include "cqlgen/types.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace cqlgen::config {

/// Loads specifications from JSON documents.
///
/// A document is one action object or an array of them. Every object names
/// its action under "action" (CREATE_TABLE, DROP_INDEX, ...); the action is
/// looked up in a registry of handlers.
class SpecLoader {
public:
    using Specifications = std::vector<keyspace::Specification>;

    /// Registers the built-in actions
    SpecLoader();

    SpecLoader(const SpecLoader&) = delete;
    SpecLoader& operator=(const SpecLoader&) = delete;
    SpecLoader(SpecLoader&&) = default;
    SpecLoader& operator=(SpecLoader&&) = default;

    [[nodiscard]] Result<Specifications> load(const nlohmann::ordered_json& document) const;
    [[nodiscard]] Result<Specifications> load_string(std::string_view text) const;
    [[nodiscard]] Result<Specifications> load_file(const std::filesystem::path& path) const;

    /// Adds or replaces the handler for `action` (matched case-insensitively)
    void register_handler(std::string action, std::unique_ptr<ISpecHandler> handler);

    [[nodiscard]] bool has_action(std::string_view action) const;
    [[nodiscard]] std::vector<std::string> actions() const;

private:
    void init_registry();

    [[nodiscard]] Result<Specifications> load_action(const nlohmann::ordered_json& args, std::size_t index) const;

    std::map<std::string, std::unique_ptr<ISpecHandler>, std::less<>> registry_;
};

} // namespace cqlgen::config
