/********************************************************************
 * transcriber.cpp  –  transcriber facade and rule table files.
 ********************************************************************
Copyright (C) <2025> <Khumnath Cg/nath.khum@gmail.com>

This program is free software: you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

This program is distributed in in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with this program. If not, see <https://www.gnu.org/licenses/>
 *******************************************************************/
#include "libphonema/transcriber.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>

#include "libphonema/phonema_core.h"

namespace fs = std::filesystem;

// =============================================================================//
// CompletionStatus
// =============================================================================//

std::string completionStatusName(CompletionStatus status) {
    switch (status) {
    case CompletionStatus::NotStarted: return "not-started";
    case CompletionStatus::Incomplete: return "incomplete";
    case CompletionStatus::InProgress: return "in-progress";
    case CompletionStatus::Complete: return "complete";
    }
    return "unknown";
}

CompletionStatus completionStatusFromName(const std::string &name) {
    if (name == "not-started") return CompletionStatus::NotStarted;
    if (name == "incomplete") return CompletionStatus::Incomplete;
    if (name == "in-progress") return CompletionStatus::InProgress;
    if (name == "complete") return CompletionStatus::Complete;
    throw RuleTableError("Unknown completion status: " + name);
}

// =============================================================================//
// Rule table file reader
// =============================================================================//
//
// A small TOML subset: one [transcriber] table and any number of [[rule]]
// tables, each line "key = value" where value is a string, a one-line array
// of strings, or an integer.

namespace {

struct TableValue {
    enum Kind { String, Array, Integer } kind = String;
    std::string str;
    std::vector<std::string> items;
    long integer = 0;
};

struct RuleDraft {
    int line = 0;
    std::optional<std::string> before;
    std::optional<std::string> match;
    std::vector<std::string> output;
    std::optional<int> consume;
};

class TableReader {
public:
    explicit TableReader(std::string sourceName) : source_(std::move(sourceName)) {}

    Transcriber read(const std::string &content, FallbackPolicy fallback);

private:
    [[noreturn]] void fail(const std::string &what) const {
        throw RuleTableError(source_ + ":" + std::to_string(line_) + ": " + what);
    }

    static std::string trim(const std::string &s) {
        size_t b = s.find_first_not_of(" \t\r");
        if (b == std::string::npos) return "";
        size_t e = s.find_last_not_of(" \t\r");
        return s.substr(b, e - b + 1);
    }

    std::string stripComment(const std::string &line) const;
    std::string parseString(const std::string &text, size_t &pos) const;
    TableValue parseValue(const std::string &text) const;
    void appendCodePoint(std::string &out, const std::string &hex) const;

    std::vector<std::string> expectStrings(const TableValue &v, const std::string &key) const {
        if (v.kind == TableValue::String) return {v.str};
        if (v.kind == TableValue::Array) return v.items;
        fail("'" + key + "' must be a string or an array of strings");
    }
    std::string expectString(const TableValue &v, const std::string &key) const {
        if (v.kind != TableValue::String) fail("'" + key + "' must be a string");
        return v.str;
    }

    std::string source_;
    int line_ = 0;
};

std::string TableReader::stripComment(const std::string &line) const {
    char quote = '\0';
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote) {
            if (quote == '"' && c == '\\') {
                ++i;
            } else if (c == quote) {
                quote = '\0';
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

void TableReader::appendCodePoint(std::string &out, const std::string &hex) const {
    UChar32 cp = 0;
    try {
        size_t used = 0;
        cp = static_cast<UChar32>(std::stoul(hex, &used, 16));
        if (used != hex.size()) fail("Invalid unicode escape \\u" + hex);
    } catch (const std::logic_error &) {
        fail("Invalid unicode escape \\u" + hex);
    }
    if (cp < 0 || cp > 0x10FFFF) fail("Unicode escape out of range: " + hex);
    icu::UnicodeString(cp).toUTF8String(out);
}

// Parses a quoted string starting at text[pos]; leaves pos after the closing quote.
std::string TableReader::parseString(const std::string &text, size_t &pos) const {
    const char quote = text[pos++];
    std::string result;
    while (pos < text.size()) {
        char c = text[pos++];
        if (c == quote) {
            return result;
        }
        // Literal strings are raw, which keeps regular expressions readable.
        if (c != '\\' || quote == '\'') {
            result += c;
            continue;
        }
        if (pos >= text.size()) break;
        char next = text[pos++];
        switch (next) {
        case '\\': result += '\\'; break;
        case '"': result += '"'; break;
        case 'n': result += '\n'; break;
        case 't': result += '\t'; break;
        case 'u':
        case 'U': {
            size_t width = next == 'u' ? 4 : 8;
            if (pos + width > text.size()) fail("Truncated unicode escape");
            appendCodePoint(result, text.substr(pos, width));
            pos += width;
            break;
        }
        default:
            fail(std::string("Unknown escape sequence \\") + next);
        }
    }
    fail("Unterminated string");
}

TableValue TableReader::parseValue(const std::string &text) const {
    TableValue value;
    if (text.empty()) fail("Missing value");

    if (text[0] == '"' || text[0] == '\'') {
        size_t pos = 0;
        value.kind = TableValue::String;
        value.str = parseString(text, pos);
        if (!trim(text.substr(pos)).empty()) fail("Unexpected text after string");
        return value;
    }

    if (text[0] == '[') {
        value.kind = TableValue::Array;
        size_t pos = 1;
        bool expectItem = true;
        while (true) {
            pos = text.find_first_not_of(" \t", pos);
            if (pos == std::string::npos) fail("Unterminated array (arrays must fit on one line)");
            char c = text[pos];
            if (c == ']') {
                ++pos;
                break;
            }
            if (c == ',' && !expectItem) {
                expectItem = true;
                ++pos;
                continue;
            }
            if ((c == '"' || c == '\'') && expectItem) {
                value.items.push_back(parseString(text, pos));
                expectItem = false;
                continue;
            }
            fail("Malformed array");
        }
        if (!trim(text.substr(pos)).empty()) fail("Unexpected text after array");
        return value;
    }

    try {
        size_t used = 0;
        value.integer = std::stol(text, &used, 10);
        if (used != text.size()) fail("Malformed value: " + text);
    } catch (const std::logic_error &) {
        fail("Malformed value: " + text);
    }
    value.kind = TableValue::Integer;
    return value;
}

Transcriber TableReader::read(const std::string &content, FallbackPolicy fallback) {
    std::istringstream iss(content);
    std::string raw, section;
    std::optional<std::string> name;
    CompletionStatus status = CompletionStatus::NotStarted;
    std::vector<std::string> variants;
    std::vector<RuleDraft> drafts;

    while (std::getline(iss, raw)) {
        ++line_;
        std::string line = trim(stripComment(raw));
        if (line.empty()) continue;

        if (line == "[[rule]]") {
            section = "rule";
            drafts.push_back(RuleDraft{});
            drafts.back().line = line_;
            continue;
        }
        if (line[0] == '[') {
            if (line != "[transcriber]") fail("Unknown section " + line);
            section = "transcriber";
            continue;
        }

        size_t eqPos = line.find('=');
        if (eqPos == std::string::npos) fail("Expected key = value");
        std::string key = trim(line.substr(0, eqPos));
        TableValue value = parseValue(trim(line.substr(eqPos + 1)));

        if (section == "transcriber") {
            if (key == "name") {
                name = expectString(value, key);
            } else if (key == "status") {
                try {
                    status = completionStatusFromName(expectString(value, key));
                } catch (const RuleTableError &e) {
                    fail(e.what());
                }
            } else if (key == "variants") {
                variants = expectStrings(value, key);
            } else {
                fail("Unknown transcriber key '" + key + "'");
            }
        } else if (section == "rule") {
            RuleDraft &draft = drafts.back();
            if (key == "match") {
                draft.match = expectString(value, key);
            } else if (key == "before") {
                draft.before = expectString(value, key);
            } else if (key == "output") {
                draft.output = expectStrings(value, key);
            } else if (key == "consume") {
                if (value.kind != TableValue::Integer) fail("'consume' must be an integer");
                if (value.integer < std::numeric_limits<int>::min() ||
                    value.integer > std::numeric_limits<int>::max()) {
                    fail("'consume' is out of range: " + std::to_string(value.integer));
                }
                draft.consume = static_cast<int>(value.integer);
            } else {
                fail("Unknown rule key '" + key + "'");
            }
        } else {
            fail("Key '" + key + "' outside of a section");
        }
    }

    if (!name) {
        throw RuleTableError(source_ + ": missing [transcriber] name");
    }
    if (variants.empty()) {
        throw RuleTableError(source_ + ": [transcriber] must declare at least one variant");
    }

    std::vector<Rule> rules;
    rules.reserve(drafts.size());
    for (const auto &draft : drafts) {
        line_ = draft.line;
        if (!draft.match) fail("Rule has no 'match'");
        if (draft.output.empty()) fail("Rule has no 'output'");
        try {
            rules.emplace_back(*draft.match, draft.output, draft.consume, draft.before);
        } catch (const RuleTableError &e) {
            fail(e.what());
        }
    }
    return Transcriber(*name, status, RuleTable(std::move(rules)), std::move(variants), std::move(fallback));
}

} // namespace

// =============================================================================//
// Transcriber Implementation
// =============================================================================//

Transcriber::Transcriber(std::string name, CompletionStatus status, RuleTable rules,
                         std::vector<std::string> variantLabels, FallbackPolicy fallback)
    : name_(std::move(name)), status_(status), rules_(std::move(rules)),
      variantLabels_(std::move(variantLabels)), fallback_(std::move(fallback)) {
    if (variantLabels_.empty()) {
        throw RuleTableError("Transcriber '" + name_ + "' declares no output variants");
    }
    if (!fallback_) {
        fallback_ = reportAndCopy(std::cerr);
    }
}

Transcriber Transcriber::fromFile(const std::string &path, FallbackPolicy fallback) {
    fs::path fullPath(path);
    if (!fs::exists(fullPath)) {
        throw std::runtime_error("Could not locate critical data file: " + fullPath.string());
    }
    std::ifstream file(fullPath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open critical data file: " + fullPath.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromString(buffer.str(), fullPath.filename().string(), std::move(fallback));
}

Transcriber Transcriber::fromString(const std::string &content, const std::string &sourceName,
                                    FallbackPolicy fallback) {
    return TableReader(sourceName).read(content, std::move(fallback));
}

TranscriptionResult Transcriber::transcribe(const std::string &nativeText) const {
    return applyRules(normalizeInput(icu::UnicodeString::fromUTF8(nativeText)), rules_, variantLabels_,
                      fallback_);
}

std::string Transcriber::transcribeToIpa(const std::string &nativeText) const {
    return transcribe(nativeText).variants.front().text;
}

Transcriber Transcriber::withFallback(FallbackPolicy fallback) const {
    return Transcriber(name_, status_, rules_, variantLabels_, std::move(fallback));
}
