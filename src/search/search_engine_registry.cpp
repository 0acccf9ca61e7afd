#include <schemadex/common/string_utils.h>
#include <schemadex/search/accelerated_search_engine.h>
#include <schemadex/search/search_engine_registry.h>
#include <schemadex/search/search_index.h>

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace schemadex::search {

std::optional<AccelerationPreference> parseAccelerationPreference(std::string_view value) {
    const auto v = common::toLower(value);
    if (v == "auto" || v.empty())
        return AccelerationPreference::Auto;
    if (v == "on" || v == "true" || v == "1" || v == "yes")
        return AccelerationPreference::On;
    if (v == "off" || v == "false" || v == "0" || v == "no")
        return AccelerationPreference::Off;
    return std::nullopt;
}

std::string_view toString(AccelerationPreference pref) {
    switch (pref) {
        case AccelerationPreference::Auto:
            return "auto";
        case AccelerationPreference::On:
            return "on";
        case AccelerationPreference::Off:
            return "off";
    }
    return "auto";
}

SearchEngineRegistry SearchEngineRegistry::withBuiltins() {
    SearchEngineRegistry registry;
    registry.registerEngine(std::string(kReferenceEngine), [](std::shared_ptr<StringInterner> i) {
        return std::make_unique<ReferenceSearchEngine>(std::move(i));
    });
    registry.registerEngine(
        std::string(kAcceleratedEngine),
        [](std::shared_ptr<StringInterner> i) {
            return std::make_unique<AcceleratedSearchEngine>(std::move(i));
        },
        &AcceleratedSearchEngine::probe);
    return registry;
}

void SearchEngineRegistry::registerEngine(std::string name, SearchEngineFactory factory,
                                          CapabilityProbe probe) {
    if (!factory) {
        throw std::invalid_argument("search engine factory must not be empty");
    }
    if (entries_.contains(name)) {
        spdlog::warn("[SearchEngineRegistry] overwriting engine '{}'", name);
    }
    entries_[std::move(name)] = Entry{std::move(factory), std::move(probe)};
}

bool SearchEngineRegistry::contains(std::string_view name) const {
    return entries_.find(name) != entries_.end();
}

bool SearchEngineRegistry::isUsable(std::string_view name) const {
    auto it = entries_.find(name);
    if (it == entries_.end())
        return false;
    if (!it->second.probe)
        return true;
    try {
        return it->second.probe();
    } catch (const std::exception& e) {
        spdlog::info("[SearchEngineRegistry] probe for '{}' threw: {}", name, e.what());
        return false;
    }
}

std::unique_ptr<ISearchEngine>
SearchEngineRegistry::create(std::string_view name, std::shared_ptr<StringInterner> interner) const {
    auto it = entries_.find(name);
    if (it == entries_.end())
        return nullptr;
    return it->second.factory(std::move(interner));
}

std::vector<std::string> SearchEngineRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& [name, _] : entries_)
        out.push_back(name);
    return out;
}

EngineSelection selectSearchEngine(const SearchEngineRegistry& registry,
                                   AccelerationPreference preference,
                                   std::shared_ptr<StringInterner> interner) {
    const bool acceleratedUsable = registry.isUsable(kAcceleratedEngine);

    EngineSelection selection;
    if (preference != AccelerationPreference::Off && acceleratedUsable) {
        selection.engine = registry.create(kAcceleratedEngine, interner);
    }

    if (!selection.engine) {
        if (preference == AccelerationPreference::On) {
            spdlog::info("[SearchEngineRegistry] accelerated engine unavailable, using reference");
        }
        selection.engine = registry.create(kReferenceEngine, interner);
    }

    // A registry without a reference entry still gets a working engine
    if (!selection.engine) {
        selection.engine = std::make_unique<ReferenceSearchEngine>(std::move(interner));
    }

    selection.status = accelerationStatus(registry, *selection.engine);
    spdlog::info("[SearchEngineRegistry] using '{}' search engine (acceleration={})",
                 selection.status.active, toString(preference));
    return selection;
}

AccelerationStatus accelerationStatus(const SearchEngineRegistry& registry,
                                      const ISearchEngine& active) {
    AccelerationStatus status;
    status.active = std::string(active.name());
    status.acceleratedAvailable = registry.isUsable(kAcceleratedEngine);
    status.acceleratedActive = active.name() == kAcceleratedEngine;
    status.performanceLevel = status.acceleratedActive ? "accelerated" : "standard";
    return status;
}

} // namespace schemadex::search
