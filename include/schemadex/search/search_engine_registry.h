#pragma once

#include <schemadex/search/search_engine.h>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace schemadex::search {

inline constexpr std::string_view kReferenceEngine = "reference";
inline constexpr std::string_view kAcceleratedEngine = "accelerated";

enum class AccelerationPreference { Auto, On, Off };

/// Parses "auto", "on"/"true"/"1", "off"/"false"/"0" (case-insensitive)
std::optional<AccelerationPreference> parseAccelerationPreference(std::string_view value);
std::string_view toString(AccelerationPreference pref);

struct AccelerationStatus {
    std::string active;             ///< name of the engine in use
    bool acceleratedAvailable = false;
    bool acceleratedActive = false;
    std::string performanceLevel;   ///< "accelerated" or "standard"
};

using SearchEngineFactory =
    std::function<std::unique_ptr<ISearchEngine>(std::shared_ptr<StringInterner>)>;
using CapabilityProbe = std::function<bool()>;

/**
 * @brief Named search engine factories with capability probes
 *
 * The reference engine is expected to always be registered; selection falls
 * back to it whenever the accelerated engine is missing or its probe fails.
 */
class SearchEngineRegistry {
public:
    SearchEngineRegistry() = default;

    /// Registry holding the reference and accelerated engines
    static SearchEngineRegistry withBuiltins();

    void registerEngine(std::string name, SearchEngineFactory factory,
                        CapabilityProbe probe = nullptr);

    bool contains(std::string_view name) const;

    /// Registered and, when a probe exists, the probe passes
    bool isUsable(std::string_view name) const;

    std::unique_ptr<ISearchEngine> create(std::string_view name,
                                          std::shared_ptr<StringInterner> interner) const;

    std::vector<std::string> names() const;

private:
    struct Entry {
        SearchEngineFactory factory;
        CapabilityProbe probe;
    };
    std::map<std::string, Entry, std::less<>> entries_;
};

struct EngineSelection {
    std::unique_ptr<ISearchEngine> engine;
    AccelerationStatus status;
};

/**
 * @brief Pick the engine for this process; never fails
 *
 * Auto and On use the accelerated engine when it is usable, Off always uses
 * the reference engine. Falling back is logged, not reported as an error.
 */
EngineSelection selectSearchEngine(const SearchEngineRegistry& registry,
                                   AccelerationPreference preference,
                                   std::shared_ptr<StringInterner> interner = nullptr);

AccelerationStatus accelerationStatus(const SearchEngineRegistry& registry,
                                      const ISearchEngine& active);

} // namespace schemadex::search
