/********************************************************************
 * lexicon.cpp  –  pronunciation exception lexicon (SQLite).
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
#include "libphonema/lexicon.h"

#ifdef HAVE_SQLITE3

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <sqlite3.h>

#include "libphonema/phonema_core.h"

namespace fs = std::filesystem;

// =============================================================================//
// PronunciationLexicon Implementation (PImpl Idiom)
// =============================================================================//
class PronunciationLexicon::Impl {
public:
    sqlite3* db_ = nullptr;

    explicit Impl(const std::string& dbPath) {
        std::string finalDbPath;
        if (dbPath == ":memory:") {
            finalDbPath = dbPath;
        } else {
            fs::path path;
            if (!dbPath.empty()) {
                path = dbPath;
            } else {
                const char* xdg_data_home = getenv("XDG_DATA_HOME");
                fs::path dataHome;
                if (xdg_data_home && xdg_data_home[0] != '\0') {
                    dataHome = xdg_data_home;
                } else {
                    const char* home = getenv("HOME");
                    if (!home) {
                        throw std::runtime_error("Cannot find HOME or XDG_DATA_HOME directory.");
                    }
                    dataHome = fs::path(home) / ".local" / "share";
                }
                path = dataHome / "libphonema" / "lexicon.db";
            }
            if (path.has_parent_path()) {
                fs::create_directories(path.parent_path());
            }
            finalDbPath = path.string();
        }

        if (sqlite3_open(finalDbPath.c_str(), &db_) != SQLITE_OK) {
            std::string errMsg = db_ ? sqlite3_errmsg(db_) : "SQLite failed to open database";
            if (db_) {
                sqlite3_close(db_);
            }
            db_ = nullptr;
            throw std::runtime_error("Can't open database: " + errMsg);
        }
        initializeDatabase();
    }

    ~Impl() {
        if (db_) {
            sqlite3_close(db_);
        }
    }

    void exec(const char* sql, const std::string& context) {
        char* errMsg = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &errMsg) != SQLITE_OK) {
            std::string err = context + ": " + (errMsg ? errMsg : "unknown error");
            sqlite3_free(errMsg);
            throw std::runtime_error(err);
        }
    }

    sqlite3_stmt* prepare(const char* sql) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("SQL error: ") + sqlite3_errmsg(db_));
        }
        return stmt;
    }

    void initializeDatabase() {
        const char* sql =
            "CREATE TABLE IF NOT EXISTS entries ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "language TEXT NOT NULL,"
            "word TEXT NOT NULL,"
            "variant TEXT NOT NULL DEFAULT '',"
            "ipa TEXT NOT NULL,"
            "UNIQUE(language, word, variant));"
            "CREATE INDEX IF NOT EXISTS idx_lang_word ON entries(language, word);"
            "CREATE TABLE IF NOT EXISTS meta ("
            "key TEXT PRIMARY KEY, value TEXT);"
            "INSERT OR IGNORE INTO meta (key, value) VALUES ('format_version', '1.0');"
            "INSERT OR IGNORE INTO meta (key, value) VALUES ('Db', 'phonema-lexicon');"
            "INSERT OR IGNORE INTO meta (key, value) VALUES ('created_at', strftime('%Y-%m-%d', 'now'));";
        exec(sql, "SQL error during initialization");
    }
};

//  Public PronunciationLexicon methods forwarding to Impl

PronunciationLexicon::PronunciationLexicon(const std::string& dbPath) : pImpl(std::make_unique<Impl>(dbPath)) {}
PronunciationLexicon::~PronunciationLexicon() = default;

void PronunciationLexicon::addEntry(const std::string& language, const std::string& word,
                                    const std::string& ipa, const std::string& variant) {
    const char* sql = "INSERT INTO entries (language, word, variant, ipa) VALUES (?, ?, ?, ?) "
                      "ON CONFLICT(language, word, variant) DO UPDATE SET ipa = excluded.ipa;";
    std::string normalized = normalizeInput(word);
    sqlite3_stmt* stmt = pImpl->prepare(sql);
    sqlite3_bind_text(stmt, 1, language.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, normalized.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, variant.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, ipa.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to add lexicon entry: " + std::string(sqlite3_errmsg(pImpl->db_)));
    }
}

void PronunciationLexicon::removeWord(const std::string& language, const std::string& word) {
    std::string normalized = normalizeInput(word);
    sqlite3_stmt* stmt = pImpl->prepare("DELETE FROM entries WHERE language = ? AND word = ?;");
    sqlite3_bind_text(stmt, 1, language.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, normalized.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to remove lexicon entry: " + std::string(sqlite3_errmsg(pImpl->db_)));
    }
}

std::map<std::string, std::string> PronunciationLexicon::lookup(const std::string& language,
                                                                const std::string& word) {
    std::map<std::string, std::string> results;
    std::string normalized = normalizeInput(word);
    sqlite3_stmt* stmt = pImpl->prepare("SELECT variant, ipa FROM entries WHERE language = ? AND word = ?;");
    sqlite3_bind_text(stmt, 1, language.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, normalized.c_str(), -1, SQLITE_TRANSIENT);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        results.emplace(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)),
                        reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1)));
    }
    sqlite3_finalize(stmt);
    return results;
}

long PronunciationLexicon::importFromFile(const std::string& filePath, const std::string& language) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + filePath);
    }

    long imported = 0;
    std::string line;
    beginTransaction();
    try {
        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty() || line[0] == '#') continue;

            std::vector<std::string> fields;
            std::istringstream fieldStream(line);
            std::string field;
            while (std::getline(fieldStream, field, '\t')) {
                fields.push_back(field);
            }
            if (fields.size() < 2 || fields[0].empty() || fields[1].empty()) continue;
            addEntry(language, fields[0], fields[1], fields.size() > 2 ? fields[2] : "");
            imported++;
        }
        commitTransaction();
    } catch (...) {
        rollbackTransaction();
        throw; // Re-throw the exception after rolling back
    }
    return imported;
}

std::map<std::string, std::string> PronunciationLexicon::getDatabaseInfo() {
    std::map<std::string, std::string> info;
    sqlite3_stmt* stmt = pImpl->prepare("SELECT COUNT(*) FROM entries;");
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        info["entry_count"] = std::to_string(sqlite3_column_int(stmt, 0));
    }
    sqlite3_finalize(stmt);

    // Get the full path and replace home directory with ~
    const char* filename = sqlite3_db_filename(pImpl->db_, "main");
    std::string fullPath = filename && filename[0] ? filename : ":memory:";
    const char* homeEnv = getenv("HOME");
    if (homeEnv && homeEnv[0] && fullPath.rfind(homeEnv, 0) == 0) {
        info["db_path"] = "~" + fullPath.substr(strlen(homeEnv));
    } else {
        info["db_path"] = fullPath;
    }

    stmt = pImpl->prepare("SELECT key, value FROM meta;");
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        std::string key = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        std::string val = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        info[key] = val;
    }
    sqlite3_finalize(stmt);
    return info;
}

void PronunciationLexicon::reset() {
    pImpl->exec("DELETE FROM entries;", "Failed to reset lexicon");
}

void PronunciationLexicon::beginTransaction() {
    pImpl->exec("BEGIN TRANSACTION;", "SQL error");
}

void PronunciationLexicon::commitTransaction() {
    pImpl->exec("COMMIT;", "SQL error");
}

void PronunciationLexicon::rollbackTransaction() {
    // No throw here, as rollback is often called in a catch block.
    sqlite3_exec(pImpl->db_, "ROLLBACK;", nullptr, nullptr, nullptr);
}

// =============================================================================//
// Lexicon-first transcription
// =============================================================================//

TranscriptionResult transcribeWithLexicon(const Transcriber& transcriber,
                                          const std::string& language,
                                          PronunciationLexicon& lexicon,
                                          const std::string& nativeText) {
    std::map<std::string, std::string> entries = lexicon.lookup(language, nativeText);
    if (entries.empty()) {
        return transcriber.transcribe(nativeText);
    }

    TranscriptionResult ruleResult;
    bool ruleResultReady = false;
    TranscriptionResult result;
    const auto shared = entries.find("");
    for (const auto& label : transcriber.variantLabels()) {
        auto it = entries.find(label);
        if (it == entries.end()) {
            it = shared;
        }
        if (it != entries.end()) {
            // No rule cycles ran for this variant
            result.variants.push_back({label, "/" + it->second + "/", 0});
            continue;
        }
        // No entry for this variant: use the rules for it.
        if (!ruleResultReady) {
            ruleResult = transcriber.transcribe(nativeText);
            ruleResultReady = true;
            result.gaps = ruleResult.gaps;
            result.steps = ruleResult.steps;
        }
        for (const auto& variant : ruleResult.variants) {
            if (variant.label == label) {
                result.variants.push_back(variant);
            }
        }
    }
    return result;
}

#endif // HAVE_SQLITE3
