/********************************************************************
 * language_catalog.cpp  –  language catalog implementation.
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
#include "libphonema/language_catalog.h"

#include <filesystem>

#include "libphonema/phonema_core.h"

namespace fs = std::filesystem;

namespace {

struct LanguageInfo {
    Language language;
    const char *code;
    const char *tableFile;  // nullptr: no rule table yet
};

const LanguageInfo kLanguages[] = {
    {Language::Spanish, "es", "spanish.toml"},
    {Language::English, "en", "english.toml"},
    {Language::Arabic, "ar", nullptr},
    {Language::Hindi, "hi", nullptr},
    {Language::Bengali, "bn", nullptr},
    {Language::Portuguese, "pt", nullptr},
    {Language::Russian, "ru", nullptr},
    {Language::Japanese, "ja", nullptr},
    {Language::Punjabi, "pa", nullptr},
    {Language::Javanese, "jw", nullptr},
    {Language::Turkish, "tr", nullptr},
    {Language::Korean, "ko", nullptr},
    {Language::French, "fr", nullptr},
    {Language::German, "de", nullptr},
    {Language::Telugu, "te", nullptr},
    {Language::Marathi, "mr", "marathi.toml"},
    {Language::Urdu, "ur", nullptr},
    {Language::Vietnamese, "vi", nullptr},
    {Language::Tamil, "ta", nullptr},
    {Language::Italian, "it", nullptr},
    {Language::Persian, "fa", nullptr},
    {Language::InternationalPhoneticAlphabet, "ipa", nullptr},
};

const LanguageInfo &infoFor(Language language) {
    for (const auto &info : kLanguages) {
        if (info.language == language) return info;
    }
    throw UnsupportedLanguageError("Language not in catalog");
}

} // namespace

// =============================================================================//
// Standalone Function Implementations
// =============================================================================//

std::string languageCode(Language language) {
    return infoFor(language).code;
}

Language languageFromCode(const std::string &code) {
    for (const auto &info : kLanguages) {
        if (code == info.code) return info.language;
    }
    throw UnsupportedLanguageError("Unknown language code: " + code);
}

const std::vector<Language> &allLanguages() {
    static const std::vector<Language> languages = [] {
        std::vector<Language> out;
        for (const auto &info : kLanguages) out.push_back(info.language);
        return out;
    }();
    return languages;
}

// =============================================================================//
// LanguageCatalog Implementation
// =============================================================================//

LanguageCatalog::LanguageCatalog(const std::string &dataDir) {
    if (!dataDir.empty()) {
        dataDir_ = dataDir;
    } else if (fs::exists("/usr/share/libphonema/")) {
        dataDir_ = "/usr/share/libphonema/";
    } else {
        dataDir_ = "/usr/local/share/libphonema/";
    }

    for (const auto &info : kLanguages) {
        if (!info.tableFile) continue;
        fs::path tablePath = fs::path(dataDir_) / info.tableFile;
        transcribers_.emplace(info.language, Transcriber::fromFile(tablePath.string()));
    }
}

std::string LanguageCatalog::tableFileName(Language language) {
    const char *file = infoFor(language).tableFile;
    return file ? file : "";
}

bool LanguageCatalog::isSupported(Language language) const {
    return transcribers_.count(language) > 0;
}

const Transcriber &LanguageCatalog::get(Language language) const {
    auto it = transcribers_.find(language);
    if (it == transcribers_.end()) {
        throw UnsupportedLanguageError("No rule table registered for language '" +
                                       languageCode(language) + "'");
    }
    return it->second;
}

std::vector<Language> LanguageCatalog::supportedLanguages() const {
    std::vector<Language> out;
    for (Language language : allLanguages()) {
        if (isSupported(language)) out.push_back(language);
    }
    return out;
}
