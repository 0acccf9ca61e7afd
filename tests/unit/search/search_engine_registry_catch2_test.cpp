// Catch2 tests for engine registration, capability probing and selection

#include <catch2/catch_test_macros.hpp>

#include <schemadex/search/accelerated_search_engine.h>
#include <schemadex/search/search_engine_registry.h>
#include <schemadex/search/search_index.h>

#include <stdexcept>

using namespace schemadex::search;

namespace {

SearchEngineRegistry registryWithProbe(CapabilityProbe probe) {
    SearchEngineRegistry registry;
    registry.registerEngine(std::string(kReferenceEngine), [](std::shared_ptr<StringInterner> i) {
        return std::make_unique<ReferenceSearchEngine>(std::move(i));
    });
    registry.registerEngine(
        std::string(kAcceleratedEngine),
        [](std::shared_ptr<StringInterner> i) {
            return std::make_unique<AcceleratedSearchEngine>(std::move(i));
        },
        std::move(probe));
    return registry;
}

} // namespace

TEST_CASE("AccelerationPreference parsing", "[search][registry][catch2]") {
    CHECK(parseAccelerationPreference("auto") == AccelerationPreference::Auto);
    CHECK(parseAccelerationPreference("") == AccelerationPreference::Auto);
    CHECK(parseAccelerationPreference("ON") == AccelerationPreference::On);
    CHECK(parseAccelerationPreference("true") == AccelerationPreference::On);
    CHECK(parseAccelerationPreference("Off") == AccelerationPreference::Off);
    CHECK(parseAccelerationPreference("0") == AccelerationPreference::Off);
    CHECK_FALSE(parseAccelerationPreference("fast").has_value());

    CHECK(toString(AccelerationPreference::Auto) == "auto");
    CHECK(toString(AccelerationPreference::On) == "on");
    CHECK(toString(AccelerationPreference::Off) == "off");
}

TEST_CASE("Built-in registry", "[search][registry][catch2]") {
    auto registry = SearchEngineRegistry::withBuiltins();

    CHECK(registry.names() == std::vector<std::string>{"accelerated", "reference"});
    CHECK(registry.contains(kReferenceEngine));
    CHECK(registry.isUsable(kReferenceEngine));
    CHECK(AcceleratedSearchEngine::probe());
    CHECK(registry.isUsable(kAcceleratedEngine));
    CHECK(registry.create("missing", nullptr) == nullptr);
    CHECK_FALSE(registry.isUsable("missing"));
}

TEST_CASE("Engine selection", "[search][registry][catch2]") {
    SECTION("Auto prefers the accelerated engine") {
        auto selection = selectSearchEngine(SearchEngineRegistry::withBuiltins(),
                                            AccelerationPreference::Auto);
        REQUIRE(selection.engine);
        CHECK(selection.engine->name() == kAcceleratedEngine);
        CHECK(selection.status.active == "accelerated");
        CHECK(selection.status.acceleratedAvailable);
        CHECK(selection.status.acceleratedActive);
        CHECK(selection.status.performanceLevel == "accelerated");
    }

    SECTION("Off always uses the reference engine") {
        auto selection = selectSearchEngine(SearchEngineRegistry::withBuiltins(),
                                            AccelerationPreference::Off);
        CHECK(selection.engine->name() == kReferenceEngine);
        CHECK(selection.status.acceleratedAvailable);
        CHECK_FALSE(selection.status.acceleratedActive);
        CHECK(selection.status.performanceLevel == "standard");
    }

    SECTION("Failing probe falls back") {
        auto registry = registryWithProbe([] { return false; });
        auto selection = selectSearchEngine(registry, AccelerationPreference::On);
        CHECK(selection.engine->name() == kReferenceEngine);
        CHECK_FALSE(selection.status.acceleratedAvailable);
    }

    SECTION("Throwing probe falls back") {
        auto registry = registryWithProbe([]() -> bool { throw std::runtime_error("no cpu"); });
        CHECK_FALSE(registry.isUsable(kAcceleratedEngine));
        auto selection = selectSearchEngine(registry, AccelerationPreference::Auto);
        CHECK(selection.engine->name() == kReferenceEngine);
    }

    SECTION("Empty registry still yields an engine") {
        SearchEngineRegistry empty;
        auto selection = selectSearchEngine(empty, AccelerationPreference::Auto);
        REQUIRE(selection.engine);
        CHECK(selection.engine->name() == kReferenceEngine);
        CHECK_FALSE(selection.status.acceleratedAvailable);
    }

    SECTION("Injected interner reaches the engine") {
        auto interner = std::make_shared<StringInterner>();
        auto selection = selectSearchEngine(SearchEngineRegistry::withBuiltins(),
                                            AccelerationPreference::Auto, interner);
        CHECK(selection.engine->interner() == interner);
    }
}

TEST_CASE("Registry rejects empty factories", "[search][registry][catch2]") {
    SearchEngineRegistry registry;
    CHECK_THROWS_AS(registry.registerEngine("broken", nullptr), std::invalid_argument);
    CHECK_FALSE(registry.contains("broken"));
}
