/********************************************************************
 * rule.cpp  –  rule compilation and matching.
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
#include "libphonema/rule.h"

#include <sstream>

#include <unicode/parseerr.h>
#include <unicode/utypes.h>

#include "libphonema/phonema_core.h"

namespace {

std::shared_ptr<const icu::RegexPattern> compilePattern(const std::string &source,
                                                        const std::string &what) {
    UErrorCode status = U_ZERO_ERROR;
    UParseError parseError;
    std::shared_ptr<const icu::RegexPattern> pattern(
        icu::RegexPattern::compile(icu::UnicodeString::fromUTF8(source), 0, parseError, status));
    if (U_FAILURE(status) || !pattern) {
        std::ostringstream msg;
        msg << "Invalid " << what << " pattern '" << source << "': " << u_errorName(status);
        if (parseError.offset >= 0) {
            msg << " at offset " << parseError.offset;
        }
        throw RuleTableError(msg.str());
    }
    return pattern;
}

std::unique_ptr<icu::RegexMatcher> makeMatcher(const icu::RegexPattern &pattern,
                                               const icu::UnicodeString &input) {
    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::RegexMatcher> matcher(pattern.matcher(input, status));
    if (U_FAILURE(status) || !matcher) {
        throw std::runtime_error(std::string("Could not create regex matcher: ") + u_errorName(status));
    }
    return matcher;
}

} // namespace

// =============================================================================//
// Rule Implementation
// =============================================================================//

Rule::Rule(const std::string &match, std::vector<std::string> output,
           std::optional<int> consume, std::optional<std::string> before)
    : match_(match), before_(std::move(before)), output_(std::move(output)), consume_(consume) {
    if (output_.empty()) {
        throw RuleTableError("Rule '" + match_ + "' has no output");
    }
    matchPattern_ = compilePattern(match_, "match");
    if (before_) {
        // The context has to end exactly where the cursor is. The region is
        // opaque, so nothing follows its limit and the lookahead succeeds
        // only there.
        contextPattern_ = compilePattern("(?:" + *before_ + ")(?![\\s\\S])", "left-context");
    }
}

std::string Rule::describe() const {
    std::ostringstream out;
    if (before_) {
        out << "before='" << *before_ << "' ";
    }
    out << "match='" << match_ << "' output=";
    for (size_t i = 0; i < output_.size(); ++i) {
        out << (i ? "|" : "") << '"' << output_[i] << '"';
    }
    if (consume_) {
        out << " consume=" << *consume_;
    }
    return out.str();
}

Rule::Matcher::Matcher(const Rule &rule, const icu::UnicodeString &input)
    : input_(input),
      match_(makeMatcher(*rule.matchPattern_, input)),
      context_(rule.contextPattern_ ? makeMatcher(*rule.contextPattern_, input) : nullptr),
      inputLength_(input.length()) {
    if (context_) {
        // '^' in a context means the start of the input, not of the window.
        context_->useAnchoringBounds(false);
    }
}

namespace {

[[noreturn]] void matchFailed(const char *what, int32_t cursor, UErrorCode status) {
    throw ConfigurationError(std::string("Regex ") + what + " failed at index " +
                             std::to_string(cursor) + ": " + u_errorName(status));
}

} // namespace

int32_t Rule::Matcher::matchAt(int32_t cursor) {
    UErrorCode status = U_ZERO_ERROR;

    // Main pattern: anchored at the cursor, sees only the remaining input.
    match_->region(cursor, inputLength_, status);
    bool found = U_SUCCESS(status) && match_->lookingAt(status);
    if (U_FAILURE(status)) {
        matchFailed("match", cursor, status);
    }
    if (!found) {
        return -1;
    }
    int32_t end = match_->end(status);
    if (U_FAILURE(status)) {
        matchFailed("match", cursor, status);
    }

    if (context_) {
        // Left context: sees a bounded window of the consumed input and must
        // end at the cursor.
        int32_t windowStart = cursor > kLeftContextWindow ? cursor - kLeftContextWindow : 0;
        windowStart = input_.getChar32Start(windowStart);
        context_->region(windowStart, cursor, status);
        found = U_SUCCESS(status) && context_->find(status);
        if (U_FAILURE(status)) {
            matchFailed("left context", cursor, status);
        }
        if (!found) {
            return -1;
        }
    }
    return end;
}
