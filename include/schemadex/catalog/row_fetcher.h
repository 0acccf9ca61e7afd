#pragma once

#include <schemadex/core/types.h>

#include <nlohmann/json.hpp>
#include <functional>
#include <string>
#include <vector>

namespace schemadex::catalog {

/// Column name to value in result-set order; values are strings, numbers or null
using Row = nlohmann::ordered_json;
using RowSet = std::vector<Row>;

/**
 * @brief Runs a SQL statement against the catalog and returns its rows
 *
 * Implementations may block. Failures come back as an Error, never as an
 * exception.
 */
class IRowFetcher {
public:
    virtual ~IRowFetcher() = default;

    virtual Result<RowSet> fetch(const std::string& sql) = 0;
};

/// Adapts a plain callable, mostly for tests and embedding
class CallbackRowFetcher final : public IRowFetcher {
public:
    using Callback = std::function<Result<RowSet>(const std::string&)>;

    explicit CallbackRowFetcher(Callback callback) : callback_(std::move(callback)) {}

    Result<RowSet> fetch(const std::string& sql) override {
        if (!callback_) {
            return Error{ErrorCode::NotSupported, "no row fetch callback configured"};
        }
        return callback_(sql);
    }

private:
    Callback callback_;
};

} // namespace schemadex::catalog
