#include "cqlgen/config/spec_loader.hpp"
#include "config/spec_handlers.hpp"
#include "utils/logger.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <fmt/core.h>

#include <fstream>
#include <sstream>

namespace cqlgen::config {

using json = nlohmann::ordered_json;

SpecLoader::SpecLoader() {
    init_registry();
}

void SpecLoader::init_registry() {
    using keyspace::KeyspaceAction;

    registry_["CREATE_KEYSPACE"] = std::make_unique<KeyspaceActionHandler>(KeyspaceAction::Create);
    registry_["CREATE_DROP_KEYSPACE"] = std::make_unique<KeyspaceActionHandler>(KeyspaceAction::CreateDrop);
    registry_["ALTER_KEYSPACE"] = std::make_unique<AlterKeyspaceHandler>();
    registry_["DROP_KEYSPACE"] = std::make_unique<DropKeyspaceHandler>();

    registry_["CREATE_TABLE"] = std::make_unique<CreateTableHandler>();
    registry_["ALTER_TABLE"] = std::make_unique<AlterTableHandler>();
    registry_["DROP_TABLE"] = std::make_unique<DropTableHandler>();

    registry_["CREATE_INDEX"] = std::make_unique<CreateIndexHandler>();
    registry_["DROP_INDEX"] = std::make_unique<DropIndexHandler>();

    registry_["CREATE_TYPE"] = std::make_unique<CreateUserTypeHandler>();
    registry_["ALTER_TYPE"] = std::make_unique<AlterUserTypeHandler>();
    registry_["DROP_TYPE"] = std::make_unique<DropUserTypeHandler>();

    Logger::debug("spec loader registered {} actions", registry_.size());
}

void SpecLoader::register_handler(std::string action, std::unique_ptr<ISpecHandler> handler) {
    if (!handler) {
        throw SpecificationError(ErrorCode::InvalidArgument,
            fmt::format("handler for action '{}' must not be null", action));
    }
    registry_[boost::to_upper_copy(action)] = std::move(handler);
}

bool SpecLoader::has_action(std::string_view action) const {
    return registry_.find(boost::to_upper_copy(std::string(action))) != registry_.end();
}

std::vector<std::string> SpecLoader::actions() const {
    std::vector<std::string> names;
    names.reserve(registry_.size());
    for (const auto& [name, handler] : registry_) {
        names.push_back(name);
    }
    return names;
}

// ==============================================================================
// Loading
// ==============================================================================

Result<SpecLoader::Specifications> SpecLoader::load(const json& document) const {
    if (document.is_object()) {
        return load_action(document, 0);
    }
    if (!document.is_array()) {
        return Err<Specifications>(ErrorCode::ConfigInvalid,
            "document must be an action object or an array of action objects");
    }

    Specifications specs;
    for (std::size_t i = 0; i < document.size(); ++i) {
        auto loaded = load_action(document[i], i);
        if (!loaded) {
            return Err<Specifications>(loaded.error());
        }
        for (auto& spec : loaded.value()) {
            specs.push_back(std::move(spec));
        }
    }

    Logger::info("loaded {} specifications from {} actions", specs.size(), document.size());
    return Ok(std::move(specs));
}

Result<SpecLoader::Specifications> SpecLoader::load_string(std::string_view text) const {
    json document;
    try {
        document = json::parse(text.begin(), text.end());
    } catch (const json::parse_error& e) {
        return Err<Specifications>(ErrorCode::ConfigParseError, e.what());
    }
    return load(document);
}

Result<SpecLoader::Specifications> SpecLoader::load_file(const std::filesystem::path& path) const {
    std::ifstream file(path);
    if (!file) {
        return Err<Specifications>(ErrorCode::FileNotFound,
            fmt::format("cannot open specification file '{}'", path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    Logger::debug("loading specifications from {}", path.string());
    auto loaded = load_string(buffer.str());
    if (!loaded) {
        return Err<Specifications>(loaded.error().code(),
            fmt::format("{}: {}", path.string(), loaded.error().message()));
    }
    return loaded;
}

Result<SpecLoader::Specifications> SpecLoader::load_action(const json& args, std::size_t index) const {
    if (!args.is_object()) {
        return Err<Specifications>(ErrorCode::ConfigInvalid,
            fmt::format("action #{} must be an object", index));
    }
    if (!args.contains("action") || !args.at("action").is_string()) {
        return Err<Specifications>(ErrorCode::ConfigInvalid,
            fmt::format("action #{} has no \"action\" name", index));
    }

    const std::string name = boost::to_upper_copy(args.at("action").get<std::string>());
    auto it = registry_.find(name);
    if (it == registry_.end()) {
        return Err<Specifications>(ErrorCode::ConfigInvalid,
            fmt::format("action #{}: unknown action '{}'", index, name));
    }

    try {
        auto specs = it->second->load(args);
        Logger::debug("action #{} {} produced {} specifications", index, name, specs.size());
        return Ok(std::move(specs));
    } catch (const SpecificationError& e) {
        return Err<Specifications>(e.code(), fmt::format("action #{} {}: {}", index, name, e.what()));
    } catch (const json::exception& e) {
        return Err<Specifications>(ErrorCode::ConfigInvalid,
            fmt::format("action #{} {}: {}", index, name, e.what()));
    }
}

} // namespace cqlgen::config
