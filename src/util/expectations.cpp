#include <lockscan/expectations.hpp>
#include <cctype>
#include <sstream>

namespace lockscan {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && is_space(s[b])) ++b;
    while (e > b && is_space(s[e - 1])) --e;
    return s.substr(b, e - b);
}

static std::string strip_quotes(std::string s) {
    while (s.size() >= 2) {
        char first = s.front();
        char last = s.back();
        if ((first == '"' || first == '\'' || first == '`') && first == last) {
            s = trim(s.substr(1, s.size() - 2));
        } else {
            break;
        }
    }
    return s;
}

static std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> cells;
    size_t start = 0;
    while (true) {
        size_t tab = line.find('\t', start);
        if (tab == std::string::npos) {
            cells.push_back(trim(line.substr(start)));
            break;
        }
        cells.push_back(trim(line.substr(start, tab - start)));
        start = tab + 1;
    }
    return cells;
}

static std::vector<std::string> split_whitespace(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream in(line);
    std::string tok;
    while (in >> tok) tokens.push_back(tok);
    return tokens;
}

static std::string join(const std::vector<std::string>& parts,
                        size_t begin, size_t end) {
    std::string out;
    for (size_t i = begin; i < end && i < parts.size(); ++i) {
        if (!out.empty()) out += ' ';
        out += parts[i];
    }
    return out;
}

// Version tokens of a space-separated row, rejoined as a comma list.
// Words that cannot start a version ("(yanked)") are annotations.
static std::string join_versions(const std::vector<std::string>& tokens,
                                 size_t begin, size_t end) {
    std::string out;
    for (size_t i = begin; i < end && i < tokens.size(); ++i) {
        const std::string& tok = tokens[i];
        size_t first = tok.find_first_not_of("\"'`");
        if (first == std::string::npos ||
            !std::isalnum(static_cast<unsigned char>(tok[first]))) {
            continue;
        }
        if (!out.empty()) out += ',';
        out += tok;
    }
    return out;
}

// 2025-09-08, 2025/9/8
static bool looks_like_date(const std::string& tok) {
    int digits = 0;
    int separators = 0;
    for (char c : tok) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            ++digits;
        } else if (c == '-' || c == '/') {
            ++separators;
        } else {
            return false;
        }
    }
    return separators == 2 && digits >= 4;
}

// Header cells, whether the header is tab- or space-separated
static bool has_token(const std::string& header, const std::string& token) {
    for (const auto& tok : split_whitespace(header)) {
        if (tok == token) return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Version lists
// ---------------------------------------------------------------------------

static std::string clean_version_token(const std::string& raw) {
    std::string tok = strip_quotes(trim(raw));

    // Drop annotations written after the version: "1.0.0 (yanked)"
    for (size_t i = 0; i < tok.size(); ++i) {
        if (is_space(tok[i])) {
            tok.erase(i);
            break;
        }
    }
    // Drop trailing marker glyphs: "1.0.1*", "2.0.0⚠"
    while (!tok.empty() &&
           !std::isalnum(static_cast<unsigned char>(tok.back()))) {
        tok.pop_back();
    }
    return tok;
}

std::vector<VersionSpec> parse_version_list(const std::string& cell) {
    std::vector<VersionSpec> specs;
    size_t start = 0;
    while (start <= cell.size()) {
        size_t comma = cell.find(',', start);
        size_t end = comma == std::string::npos ? cell.size() : comma;
        std::string tok = clean_version_token(cell.substr(start, end - start));
        if (!tok.empty()) specs.push_back(std::move(tok));
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return specs;
}

// ---------------------------------------------------------------------------
// Rows
// ---------------------------------------------------------------------------

namespace {

struct RowCells {
    std::string name;
    std::string versions;
    std::optional<std::string> date;
    std::optional<std::string> status;
};

// Row | Package Name | Version(s)
// The version column must be present; an empty cell means any version.
Result<RowCells> standard_row(const std::string& line) {
    RowCells row;
    if (line.find('\t') != std::string::npos) {
        auto cells = split_tabs(line);
        if (cells.size() < 2) {
            return ScanError{ScanError::Format, "missing package name column"};
        }
        if (cells.size() < 3) {
            return ScanError{ScanError::Format, "missing version column"};
        }
        row.name = cells[1];
        row.versions = cells[2];
    } else {
        auto tokens = split_whitespace(line);
        if (tokens.size() < 2) {
            return ScanError{ScanError::Format, "missing package name column"};
        }
        if (tokens.size() < 3) {
            return ScanError{ScanError::Format, "missing version column"};
        }
        row.name = tokens[1];
        row.versions = join_versions(tokens, 2, tokens.size());
    }
    return Result<RowCells>::ok(std::move(row));
}

// Package Name | Compromised Version(s) | Detection Date | Status
Result<RowCells> security_row(const std::string& line) {
    RowCells row;
    if (line.find('\t') != std::string::npos) {
        auto cells = split_tabs(line);
        if (cells.size() < 2) {
            return ScanError{ScanError::Format, "missing version column"};
        }
        row.name = cells[0];
        row.versions = cells[1];
        row.date = cells.size() > 2 ? cells[2] : std::string();
        row.status = cells.size() > 3 ? cells[3] : std::string();
    } else {
        auto tokens = split_whitespace(line);
        if (tokens.size() < 2) {
            return ScanError{ScanError::Format, "missing version column"};
        }
        row.name = tokens[0];
        size_t date_at = tokens.size();
        for (size_t i = tokens.size(); i-- > 1;) {
            if (looks_like_date(tokens[i])) {
                date_at = i;
                break;
            }
        }
        row.versions = join_versions(tokens, 1, date_at);
        row.date = date_at < tokens.size() ? tokens[date_at] : std::string();
        row.status = join(tokens, date_at + 1, tokens.size());
    }
    return Result<RowCells>::ok(std::move(row));
}

} // namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

const char* format_name(BatchFormat f) {
    switch (f) {
    case BatchFormat::StandardList:   return "standard list";
    case BatchFormat::SecurityReport: return "security report";
    }
    return "unknown";
}

ExpectedPackage ExpectedPackage::single(std::string name,
                                        std::optional<std::string> version) {
    ExpectedPackage pkg;
    pkg.name = std::move(name);
    if (version.has_value() && !version->empty()) {
        pkg.versions.push_back(std::move(*version));
    }
    return pkg;
}

Result<BatchFormat> detect_format(const std::string& header) {
    if (has_token(header, "Row") &&
        header.find("Package Name") != std::string::npos) {
        return Result<BatchFormat>::ok(BatchFormat::StandardList);
    }
    if (header.find("Compromised Version(s)") != std::string::npos) {
        return Result<BatchFormat>::ok(BatchFormat::SecurityReport);
    }
    return ScanError{ScanError::Format,
        "unrecognized batch file header: " + trim(header),
        "expected 'Row<TAB>Package Name<TAB>Version(s)' or "
        "'Package Name<TAB>Compromised Version(s)<TAB>Detection Date<TAB>Status'",
        "", 1};
}

Result<ExpectationList> parse_expectations(const std::string& text) {
    std::istringstream in(text);
    std::string line;
    int lineno = 0;

    ExpectationList list;
    bool have_header = false;

    while (std::getline(in, line)) {
        ++lineno;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (lineno == 1 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            line.erase(0, 3);
        }

        if (trim(line).empty()) continue;

        if (!have_header) {
            auto fmt = detect_format(line);
            if (fmt.is_err()) {
                auto err = std::move(fmt).error();
                err.line = lineno;
                return err;
            }
            list.format = fmt.value();
            have_header = true;
            continue;
        }

        if (trim(line)[0] == '#') continue;

        auto cells = list.format == BatchFormat::StandardList
            ? standard_row(line)
            : security_row(line);
        if (cells.is_err()) {
            list.skipped.push_back(SkippedRow{lineno, cells.error().message, line});
            continue;
        }

        ExpectedPackage pkg;
        pkg.name = strip_quotes(cells.value().name);
        if (pkg.name.empty()) {
            list.skipped.push_back(SkippedRow{lineno, "empty package name", line});
            continue;
        }
        pkg.versions = parse_version_list(cells.value().versions);
        pkg.detection_date = std::move(cells.value().date);
        pkg.original_status = std::move(cells.value().status);
        list.packages.push_back(std::move(pkg));
    }

    if (!have_header) {
        return ScanError{ScanError::Format, "batch file is empty",
            "the first non-empty line must be a column header"};
    }

    return Result<ExpectationList>::ok(std::move(list));
}

} // namespace lockscan
