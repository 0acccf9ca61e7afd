#pragma once

#include <cstddef>
#include <string_view>

namespace schemadex::search {

/**
 * @brief Levenshtein distance between two strings.
 *
 * Uses a single DP row sized to the shorter input. Byte-wise comparison;
 * callers lower-case beforehand when case should not matter.
 */
size_t editDistance(std::string_view a, std::string_view b);

/**
 * @brief Levenshtein distance with an early exit.
 *
 * Returns the exact distance when it is <= maxDist, otherwise some value
 * greater than maxDist (currently maxDist + 1).
 */
size_t editDistanceBounded(std::string_view a, std::string_view b, size_t maxDist);

/**
 * @brief Distance metric interface
 */
class IDistanceMetric {
public:
    virtual ~IDistanceMetric() = default;
    virtual size_t distance(std::string_view s1, std::string_view s2) const = 0;
};

/**
 * @brief Levenshtein distance metric
 */
class LevenshteinDistance : public IDistanceMetric {
public:
    size_t distance(std::string_view s1, std::string_view s2) const override {
        return editDistance(s1, s2);
    }
};

/**
 * @brief Levenshtein metric that stops counting past a threshold
 */
class BoundedLevenshteinDistance : public IDistanceMetric {
public:
    explicit BoundedLevenshteinDistance(size_t maxDistance) : maxDistance_(maxDistance) {}

    size_t distance(std::string_view s1, std::string_view s2) const override {
        return editDistanceBounded(s1, s2, maxDistance_);
    }

    size_t maxDistance() const { return maxDistance_; }

private:
    size_t maxDistance_;
};

} // namespace schemadex::search
