#include <schemadex/catalog/process_row_fetcher.h>
#include <schemadex/config/config_helpers.h>

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sys/wait.h>
#include <unistd.h>

namespace schemadex::catalog {

namespace {

// Removes the wrapped file when it goes out of scope
struct TempFile {
    std::filesystem::path path;

    ~TempFile() {
        if (!path.empty()) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }
    }
};

Result<std::filesystem::path> makeTempFile(const char* pattern, int suffixLength) {
    std::string templ = (std::filesystem::temp_directory_path() / pattern).string();
    int fd = ::mkstemps(templ.data(), suffixLength);
    if (fd < 0) {
        return Error{ErrorCode::WriteError,
                     fmt::format("cannot create temporary file: {}", std::strerror(errno))};
    }
    ::close(fd);
    return std::filesystem::path(templ);
}

std::string shellQuote(std::string_view s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'')
            out += "'\\''";
        else
            out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

std::string readAll(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

std::vector<std::string> splitDelimited(std::string_view line, char delim) {
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                current.push_back('"');
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                current.push_back(c);
            }
        } else if (c == '"' && current.empty()) {
            quoted = true;
        } else if (c == delim) {
            fields.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    fields.push_back(std::move(current));
    return fields;
}

std::vector<std::string_view> splitLines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos)
            end = text.size();
        auto line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

RowSet parseDelimited(std::string_view text) {
    RowSet rows;

    std::string trimmed(text);
    config::trim(trimmed);
    if (trimmed.empty())
        return rows;

    auto lines = splitLines(trimmed);
    const char delim = lines.front().find('\t') != std::string_view::npos ? '\t' : ',';

    auto header = splitDelimited(lines.front(), delim);
    for (auto& h : header)
        config::trim(h);

    for (size_t i = 1; i < lines.size(); ++i) {
        if (lines[i].empty())
            continue;
        auto fields = splitDelimited(lines[i], delim);
        Row row = Row::object();
        for (size_t c = 0; c < header.size(); ++c) {
            if (c < fields.size())
                row[header[c]] = fields[c];
            else
                row[header[c]] = nullptr;
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

} // namespace

RowSet parseRunnerOutput(std::string_view output) {
    auto parsed = Row::parse(output.begin(), output.end(), nullptr, false);
    if (!parsed.is_discarded()) {
        if (parsed.is_array())
            return RowSet(parsed.begin(), parsed.end());
        if (parsed.is_object())
            return RowSet{std::move(parsed)};
        return {};
    }
    return parseDelimited(output);
}

ProcessRowFetcher::ProcessRowFetcher(ProcessRowFetcherConfig config)
    : config_(std::move(config)) {}

Result<RowSet> ProcessRowFetcher::fetch(const std::string& sql) {
    auto sqlPath = makeTempFile("schemadex-XXXXXX.sql", 4);
    if (!sqlPath)
        return sqlPath.error();
    TempFile sqlFile{sqlPath.value()};

    auto errPath = makeTempFile("schemadex-XXXXXX.err", 4);
    if (!errPath)
        return errPath.error();
    TempFile errFile{errPath.value()};

    {
        std::ofstream ofs(sqlFile.path, std::ios::trunc);
        ofs << sql;
        if (!ofs) {
            return Error{ErrorCode::WriteError,
                         fmt::format("cannot write {}", sqlFile.path.string())};
        }
    }

    const std::string cmd =
        fmt::format("{} -t {} {} 2>{}", config_.command,
                    shellQuote(config_.databaseType), shellQuote(sqlFile.path.string()),
                    shellQuote(errFile.path.string()));
    spdlog::debug("[ProcessRowFetcher] running {}", cmd);

    FILE* pipe = ::popen(cmd.c_str(), "r");
    if (!pipe) {
        return Error{ErrorCode::ExternalCommandFailed,
                     fmt::format("cannot start {}: {}", config_.command, std::strerror(errno))};
    }

    std::string output;
    char buffer[4096];
    size_t n = 0;
    while ((n = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        output.append(buffer, n);
    }
    const int status = ::pclose(pipe);

    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        std::string stderrText = readAll(errFile.path);
        config::trim(stderrText);
        const int code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
        return Error{ErrorCode::ExternalCommandFailed,
                     fmt::format("{} failed (exit {}): {}", config_.command, code, stderrText)};
    }

    auto rows = parseRunnerOutput(output);
    spdlog::debug("[ProcessRowFetcher] {} rows", rows.size());
    return rows;
}

} // namespace schemadex::catalog
