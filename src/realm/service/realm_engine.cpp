// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Reaches - A spatial tag query engine for map annotation
 * Copyright (C) 2024 Max Qian
 */

#include "realm_engine.hpp"

#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "realm/core/logging.hpp"

namespace reaches::realm::service {

// ============================================================================
// Implementation
// ============================================================================

class RealmEngine::Impl {
public:
    Impl(const EngineConfig& engineConfig, model::Clock clock)
        : config(engineConfig),
          regionStore(
              store::StoreOptions{engineConfig, std::move(clock), {}}),
          registry(engineConfig.maxSuggestions) {}

    EngineConfig config;
    store::RegionStore regionStore;
    tag::TagRegistry registry;
    io::DocumentCodec codec;
};

RealmEngine::RealmEngine(const EngineConfig& config, model::Clock clock)
    : pImpl_(std::make_unique<Impl>(config, std::move(clock))) {
    SPDLOG_INFO("RealmEngine constructed for scope '{}'", config.scope);
}

RealmEngine::~RealmEngine() { SPDLOG_DEBUG("RealmEngine destructor"); }

RealmEngine::RealmEngine(RealmEngine&& other) noexcept
    : pImpl_(std::move(other.pImpl_)) {}

RealmEngine& RealmEngine::operator=(RealmEngine&& other) noexcept {
    pImpl_ = std::move(other.pImpl_);
    return *this;
}

auto RealmEngine::fromConfigText(std::string_view configText)
    -> std::expected<RealmEngine, std::string> {
    auto config = parseEngineConfig(configText);
    if (!config) {
        return std::unexpected(config.error());
    }

    try {
        RealmEngine engine(*config);
        configureLogging(config->logging);
        return engine;
    } catch (const std::invalid_argument& ex) {
        spdlog::error("RealmEngine construction failed: {}", ex.what());
        return std::unexpected(std::string(ex.what()));
    }
}

// ============================================================================
// Tags
// ============================================================================

auto RealmEngine::validateTag(std::string_view tag) const -> bool {
    return pImpl_->registry.isValid(tag);
}

auto RealmEngine::checkTag(std::string_view tag) const
    -> std::expected<void, tag::TagError> {
    return pImpl_->registry.validate(tag);
}

auto RealmEngine::suggestTags(std::string_view partial,
                              std::span<const std::string> existingTags) const
    -> std::vector<tag::TagSuggestion> {
    return pImpl_->registry.suggest(partial, existingTags);
}

auto RealmEngine::detectConflicts(std::span<const std::string> tags) const
    -> std::vector<std::string> {
    return pImpl_->registry.detectConflicts(tags);
}

auto RealmEngine::biomePreset(std::string_view biome) const
    -> std::vector<std::string> {
    return pImpl_->registry.biomePreset(biome);
}

// ============================================================================
// Regions
// ============================================================================

auto RealmEngine::createRegion(std::string name, geometry::Geometry geometry,
                               std::vector<std::string> tags,
                               std::optional<std::string> author)
    -> std::expected<model::Region, RealmError> {
    model::CreateRequest request{std::move(name), std::move(geometry),
                                 std::move(tags), std::move(author)};
    auto created = pImpl_->regionStore.create(request);
    if (!created) {
        SPDLOG_DEBUG("createRegion failed: {}", created.error().toString());
    }
    return created;
}

auto RealmEngine::updateRegion(const std::string& id,
                               const model::RegionPatch& patch)
    -> std::expected<model::Region, RealmError> {
    auto updated = pImpl_->regionStore.update(id, patch);
    if (!updated) {
        SPDLOG_DEBUG("updateRegion failed: {}", updated.error().toString());
    }
    return updated;
}

auto RealmEngine::deleteRegion(const std::string& id) -> bool {
    return pImpl_->regionStore.remove(id);
}

auto RealmEngine::getRegion(const std::string& id) const
    -> std::optional<model::Region> {
    return pImpl_->regionStore.get(id);
}

auto RealmEngine::regions() const -> std::vector<model::Region> {
    return pImpl_->regionStore.all();
}

// ============================================================================
// Queries
// ============================================================================

auto RealmEngine::queryPoint(double x, double y) const
    -> std::vector<model::Region> {
    return pImpl_->regionStore.queryPoint(x, y);
}

auto RealmEngine::queryBounds(const geometry::BoundingBox& box) const
    -> std::vector<model::Region> {
    return pImpl_->regionStore.queryBounds(box);
}

auto RealmEngine::queryTags(std::span<const std::string> tags) const
    -> std::vector<model::Region> {
    return pImpl_->regionStore.queryTags(tags);
}

auto RealmEngine::findRegions(const model::RegionQuery& query) const
    -> std::vector<model::Region> {
    return pImpl_->regionStore.find(query);
}

auto RealmEngine::regionAt(double x, double y) const
    -> std::optional<model::Region> {
    return pImpl_->regionStore.regionAt(x, y);
}

auto RealmEngine::statistics() const -> store::StoreStatistics {
    return pImpl_->regionStore.statistics();
}

// ============================================================================
// Import / Export
// ============================================================================

auto RealmEngine::exportStore(const io::ExportOptions& options) const
    -> io::ExportDocument {
    return pImpl_->codec.exportStore(pImpl_->regionStore, options);
}

auto RealmEngine::exportText(int indent) const -> std::string {
    return io::DocumentCodec::serialize(exportStore(), indent);
}

auto RealmEngine::importStore(const nlohmann::json& document,
                              io::ImportPolicy policy)
    -> std::expected<io::ImportResult, RealmError> {
    return pImpl_->codec.importStore(pImpl_->regionStore, document, policy);
}

auto RealmEngine::importStore(const io::ExportDocument& document,
                              io::ImportPolicy policy)
    -> std::expected<io::ImportResult, RealmError> {
    return pImpl_->codec.importStore(pImpl_->regionStore, document, policy);
}

auto RealmEngine::importText(std::string_view text, io::ImportPolicy policy)
    -> std::expected<io::ImportResult, RealmError> {
    auto parsed = io::DocumentCodec::parse(text);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    return importStore(*parsed, policy);
}

auto RealmEngine::exportScene(const io::ExportOptions& options) const
    -> nlohmann::json {
    return pImpl_->codec.exportScene(pImpl_->regionStore, options);
}

auto RealmEngine::importScene(const nlohmann::json& bundle)
    -> std::expected<io::ImportResult, RealmError> {
    return pImpl_->codec.importScene(pImpl_->regionStore, bundle);
}

// ============================================================================
// Components
// ============================================================================

auto RealmEngine::regionStore() -> store::RegionStore& {
    return pImpl_->regionStore;
}

auto RealmEngine::regionStore() const -> const store::RegionStore& {
    return pImpl_->regionStore;
}

auto RealmEngine::registry() const -> const tag::TagRegistry& {
    return pImpl_->registry;
}

auto RealmEngine::config() const -> const EngineConfig& {
    return pImpl_->config;
}

}  // namespace reaches::realm::service
