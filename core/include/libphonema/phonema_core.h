/********************************************************************
 * phonema_core.h  –  phonema core header
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
#include <stdexcept>
#include <string>

#include <unicode/uversion.h>

// Forward declare ICU's UnicodeString to avoid including the full ICU header
namespace U_ICU_NAMESPACE {
class UnicodeString;
}

// =============================================================================//
// Standalone Functions
// =============================================================================//

/**
 * @brief Gets the version string of the libphonema library.
 * @return A string in "MAJOR.MINOR.PATCH" format.
 */
std::string getPhonemaVersion();

/**
 * @brief Normalizes native text before it reaches a rule table.
 *
 * Applies NFC composition and then lower-cases with the root locale, so rule
 * tables only ever need to be written for composed, lower-case input.
 * @param u The text to normalize.
 * @return The normalized text.
 */
U_ICU_NAMESPACE::UnicodeString normalizeInput(const U_ICU_NAMESPACE::UnicodeString &u);

/**
 * @brief Convenience overload for normalizeInput that accepts UTF-8.
 * @param s The UTF-8 encoded std::string to normalize.
 * @return The normalized text, UTF-8 encoded.
 */
std::string normalizeInput(const std::string &s);
inline std::string normalizeInput(const char *s) { return normalizeInput(std::string(s)); }

/** @brief Converts an ICU string to UTF-8. */
std::string toUtf8(const U_ICU_NAMESPACE::UnicodeString &u);

// =============================================================================//
// Errors
// =============================================================================//

/**
 * @brief A rule table was applied in a way its own declarations forbid.
 *
 * Raised when a selected rule would consume fewer than one or more than the
 * remaining code points, or when it carries a number of per-variant outputs
 * different from the transcriber's variant count.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * @brief A rule table could not be built: bad pattern or malformed table file.
 */
class RuleTableError : public std::runtime_error {
public:
    explicit RuleTableError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * @brief The requested language has no registered rule table, or the
 * language code is unknown.
 */
class UnsupportedLanguageError : public std::runtime_error {
public:
    explicit UnsupportedLanguageError(const std::string &what) : std::runtime_error(what) {}
};
