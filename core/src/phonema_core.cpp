/********************************************************************
 * phonema_core.cpp  –  phonema core implementation.
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
#include "libphonema/phonema_core.h"

#include <unicode/locid.h>
#include <unicode/normalizer2.h>
#include <unicode/unistr.h>
#include <unicode/utypes.h>

// =============================================================================//
// Standalone Function Implementations
// =============================================================================//

std::string getPhonemaVersion() {
    // This macro is defined by the CMake build script
    return PHONEMA_VERSION;
}

std::string toUtf8(const icu::UnicodeString &u) {
    std::string out;
    u.toUTF8String(out);
    return out;
}

icu::UnicodeString normalizeInput(const icu::UnicodeString &u) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2 *nfc = icu::Normalizer2::getNFCInstance(status);
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("ICU NFC normalizer unavailable: ") + u_errorName(status));
    }
    icu::UnicodeString composed = nfc->normalize(u, status);
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("NFC normalization failed: ") + u_errorName(status));
    }
    // Root locale, so the result doesn't depend on the process locale
    // (e.g. Turkish dotted/dotless i).
    composed.toLower(icu::Locale::getRoot());
    return composed;
}

std::string normalizeInput(const std::string &s) {
    return toUtf8(normalizeInput(icu::UnicodeString::fromUTF8(s)));
}
