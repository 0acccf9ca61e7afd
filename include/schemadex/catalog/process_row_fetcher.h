#pragma once

#include <schemadex/catalog/row_fetcher.h>

#include <string>
#include <string_view>

namespace schemadex::catalog {

struct ProcessRowFetcherConfig {
    /// Passed to the shell unquoted, so it may carry its own arguments
    std::string command = "query_runner";
    std::string databaseType = "db2";
};

/**
 * @brief Row fetcher that shells out to an external query runner
 *
 * The statement is written to a temporary .sql file and the runner is
 * invoked as `<command> -t <databaseType> <file>`. A non-zero exit status is
 * an ExternalCommandFailed error carrying the runner's stderr.
 */
class ProcessRowFetcher final : public IRowFetcher {
public:
    explicit ProcessRowFetcher(ProcessRowFetcherConfig config = {});

    Result<RowSet> fetch(const std::string& sql) override;

private:
    ProcessRowFetcherConfig config_;
};

/**
 * @brief Parse query runner stdout
 *
 * JSON first: an array yields its elements, an object yields one row, any
 * other JSON value yields no rows. Otherwise the text is read as delimited
 * data with a header line, tab-separated if the header contains a tab and
 * comma-separated otherwise. Header names are trimmed; values stay strings.
 */
RowSet parseRunnerOutput(std::string_view output);

} // namespace schemadex::catalog
