/********************************************************************
 * lexicon.h  –  pronunciation exception lexicon
 ********************************************************************
Copyright (C) <2025> <Khumnath Cg/nath.khum@gmail.com>

This program is free software: you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with this program. If not, see <https://www.gnu.org/licenses/>
 *******************************************************************/
#pragma once
#include <map>
#include <memory>
#include <string>

#include "libphonema/transcriber.h"

#ifdef HAVE_SQLITE3

// =============================================================================//
// PronunciationLexicon Class
// =============================================================================//
/**
 * @brief Stores whole-word pronunciations that override the rule tables.
 *
 * Entries live in a SQLite database keyed by language code, word and variant
 * label. An empty variant label means the entry applies to every variant.
 * Words are stored normalized (see normalizeInput).
 */
class PronunciationLexicon {
public:
    /**
     * @brief Opens (and if needed creates) the lexicon database.
     * @param dbPath Optional path to the database file, or ":memory:". If
     * empty, a default path under XDG_DATA_HOME is used.
     * @throws std::runtime_error if the database cannot be opened.
     */
    explicit PronunciationLexicon(const std::string &dbPath = "");
    ~PronunciationLexicon();

    /**
     * @brief Adds or replaces an entry.
     * @param language Language code, e.g. "en".
     * @param word Native spelling; normalized before storing.
     * @param ipa Phonemic form without the surrounding slashes.
     * @param variant Variant label, or "" for all variants.
     */
    void addEntry(const std::string &language, const std::string &word,
                  const std::string &ipa, const std::string &variant = "");

    /** @brief Removes every entry for a word, all variants. */
    void removeWord(const std::string &language, const std::string &word);

    /**
     * @brief Finds the entries for a word.
     * @return Variant label to IPA. Empty if the word is unknown.
     */
    std::map<std::string, std::string> lookup(const std::string &language, const std::string &word);

    /**
     * @brief Imports a tab-separated file of "word<TAB>ipa[<TAB>variant]" lines.
     * Lines starting with '#' and blank lines are skipped.
     * @return The number of entries imported.
     * @throws std::runtime_error if the file cannot be opened.
     */
    long importFromFile(const std::string &filePath, const std::string &language);

    /** @brief Entry count, database path and meta table contents. */
    std::map<std::string, std::string> getDatabaseInfo();

    /** @brief Deletes ALL entries. */
    void reset();

    void beginTransaction();
    void commitTransaction();
    void rollbackTransaction();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

/**
 * @brief Transcribes with lexicon entries taking priority over the rules.
 *
 * If the lexicon holds the whole normalized input for the transcriber's
 * language, each variant takes its own entry or the shared one. Variants
 * with no applicable entry come from the rule engine.
 *
 * Lexicon-filled variants report zero segments, and the result's steps and
 * gaps describe only the rule-filled variants (none if every variant came
 * from the lexicon). Equal segment counts across variants therefore hold
 * only for results the rules produced alone.
 */
TranscriptionResult transcribeWithLexicon(const Transcriber &transcriber,
                                          const std::string &language,
                                          PronunciationLexicon &lexicon,
                                          const std::string &nativeText);

#endif
