#pragma once

#include <schemadex/catalog/descriptors.h>
#include <schemadex/search/string_interner.h>

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace schemadex::search {

template <typename T> struct ScoredHit {
    T item;
    double score = 0.0;
};

using TableHit = ScoredHit<catalog::TableDescriptor>;
using ColumnHit = ScoredHit<catalog::ColumnDescriptor>;

/**
 * @brief A table that owns at least one matching column (column search mode)
 */
struct TableColumnMatch {
    std::string schema;
    std::string table;
    size_t matchCount = 0;
    double bestScore = 0.0;
};

struct SearchIndexStats {
    size_t tableCount = 0;
    size_t columnCount = 0;
    size_t indexNodes = 0;    ///< trie nodes or flat index entries
    size_t internedStrings = 0;
};

/**
 * @brief Search engine over table and column descriptors
 *
 * Two implementations exist: the trie-based reference engine and the
 * accelerated flat-index engine. Both return identical results for
 * identical input.
 *
 * Scoring (highest tier wins, ties keep insertion order):
 *  - tables:  exact name 2.0, name substring 1.0, remarks substring 0.8,
 *             name word prefix 0.6
 *  - columns: exact name 2.0, name substring 1.0, type substring 0.7,
 *             remarks substring 0.5
 * An empty query returns everything in insertion order with score 0.
 *
 * buildIndex() is not safe to run concurrently with searches on the same
 * instance. Build a fresh engine and publish it via SearchEngineHandle.
 */
class ISearchEngine {
public:
    explicit ISearchEngine(std::shared_ptr<StringInterner> interner);
    virtual ~ISearchEngine() = default;

    ISearchEngine(const ISearchEngine&) = delete;
    ISearchEngine& operator=(const ISearchEngine&) = delete;

    /// Replace the indexed content. Empty lists are fine.
    virtual void buildIndex(const std::vector<catalog::TableDescriptor>& tables,
                            const std::vector<catalog::ColumnDescriptor>& columns) = 0;

    virtual std::vector<TableHit> searchTablesScored(std::string_view query) const = 0;
    virtual std::vector<ColumnHit> searchColumnsScored(std::string_view query) const = 0;

    virtual SearchIndexStats stats() const = 0;

    /// Implementation identifier ("reference", "accelerated")
    virtual std::string_view name() const = 0;

    /// Lower-case and map '_' to ' '
    virtual std::string normalize(std::string_view text) const;

    /// Whitespace split, empty pieces dropped
    virtual std::vector<std::string> splitWords(std::string_view text) const;

    std::string_view intern(std::string_view s) { return interner_->intern(s); }

    std::vector<catalog::TableDescriptor> searchTables(std::string_view query) const;
    std::vector<catalog::ColumnDescriptor> searchColumns(std::string_view query) const;

    /// Group column hits by owning table, best score first
    std::vector<TableColumnMatch> tablesWithMatchingColumns(std::string_view query) const;

    const std::shared_ptr<StringInterner>& interner() const { return interner_; }

protected:
    std::shared_ptr<StringInterner> interner_;
};

/**
 * @brief Publishes a fully built engine to readers
 *
 * Readers take a snapshot and keep using it even if a rebuild publishes a
 * new engine in the meantime.
 */
class SearchEngineHandle {
public:
    SearchEngineHandle() = default;
    explicit SearchEngineHandle(std::shared_ptr<const ISearchEngine> engine)
        : engine_(std::move(engine)) {}

    std::shared_ptr<const ISearchEngine> snapshot() const {
        std::lock_guard lock(mutex_);
        return engine_;
    }

    void publish(std::shared_ptr<const ISearchEngine> engine) {
        std::lock_guard lock(mutex_);
        engine_ = std::move(engine);
    }

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const ISearchEngine> engine_;
};

} // namespace schemadex::search
