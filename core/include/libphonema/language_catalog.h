/********************************************************************
 * language_catalog.h  –  supported languages and their transcribers
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
#include <string>
#include <vector>

#include "libphonema/transcriber.h"

enum class Language {
    Spanish,
    English,
    Arabic,     // classical
    Hindi,
    Bengali,
    Portuguese,
    Russian,
    Japanese,
    Punjabi,
    Javanese,
    Turkish,
    Korean,
    French,
    German,
    Telugu,
    Marathi,
    Urdu,
    Vietnamese,
    Tamil,
    Italian,
    Persian,
    InternationalPhoneticAlphabet
};

/** @brief The language's ISO 639-1 code ("ipa" for the IPA itself). */
std::string languageCode(Language language);

/**
 * @brief Looks a language up by code.
 * @throws UnsupportedLanguageError for an unknown code.
 */
Language languageFromCode(const std::string &code);

/** @brief Every language in the catalog, in declaration order. */
const std::vector<Language> &allLanguages();

// =============================================================================//
// LanguageCatalog Class
// =============================================================================//
/**
 * @brief Loads and holds the transcriber of every language with a rule table.
 *
 * All registered tables are loaded in the constructor; afterwards the catalog
 * is read-only.
 */
class LanguageCatalog {
public:
    /**
     * @brief Constructs the catalog and loads the rule table files.
     * @param dataDir Optional directory holding the *.toml tables. If empty,
     * default system paths are searched.
     * @throws std::runtime_error if a registered table file is missing.
     * @throws RuleTableError if a table file is malformed.
     */
    explicit LanguageCatalog(const std::string &dataDir = "");

    /**
     * @brief Gets the transcriber for a language.
     * @throws UnsupportedLanguageError if the language has no rule table.
     */
    const Transcriber &get(Language language) const;

    bool isSupported(Language language) const;

    /** @brief Languages with a loaded table, in declaration order. */
    std::vector<Language> supportedLanguages() const;

    /** @brief The directory the tables were loaded from. */
    const std::string &dataDir() const { return dataDir_; }

    /** @brief File name of a language's table, or "" if none is registered. */
    static std::string tableFileName(Language language);

private:
    std::string dataDir_;
    std::map<Language, Transcriber> transcribers_;
};
