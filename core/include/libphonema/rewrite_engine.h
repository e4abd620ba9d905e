/********************************************************************
 * rewrite_engine.h  –  ordered-rule rewrite engine
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
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

#include <unicode/unistr.h>

#include "libphonema/rule.h"

/// A grapheme no rule covered, copied through by the fallback.
struct Gap {
    std::string grapheme;   ///< UTF-8
    int32_t position = 0;   ///< code-point offset into the normalized input
};

/// One engine cycle: either a rule application or a fallback step.
struct Step {
    int32_t position = 0;   ///< code-point offset where the cycle started
    int32_t consumed = 0;   ///< code points advanced past
    int ruleIndex = -1;     ///< index into the rule table, -1 for the fallback
};

/// One labelled output of a transcription.
struct Variant {
    std::string label;
    std::string text;
    size_t segments = 0;    ///< appends received, one per cycle
};

/**
 * @brief Everything one call produces. Created fresh per call.
 */
struct TranscriptionResult {
    std::vector<Variant> variants;
    std::vector<Gap> gaps;
    std::vector<Step> steps;

    /**
     * @brief Looks up a variant's text by label.
     * @throws std::out_of_range if no variant has that label.
     */
    const std::string &text(const std::string &label) const;
};

/**
 * @brief Decides what to emit for an uncovered grapheme. The engine always
 * advances exactly one code point after calling it.
 */
using FallbackPolicy = std::function<std::string(const Gap &gap)>;

/** @brief Emits the uncovered grapheme unchanged. */
FallbackPolicy copyThrough();

/**
 * @brief Writes a warning line to @p out, then emits the grapheme unchanged.
 * @p out must outlive the returned policy.
 */
FallbackPolicy reportAndCopy(std::ostream &out);

/**
 * @brief Runs a rule table over already-normalized input.
 *
 * Each cycle scans @p rules from the top and applies the first rule that
 * fires; if none does, @p fallback handles one code point. Every variant
 * accumulator starts and ends with '/'.
 *
 * @param input Normalized text (see normalizeInput).
 * @param rules The ordered rule table.
 * @param variantLabels One label per output, at least one.
 * @param fallback Policy for uncovered graphemes.
 * @return The labelled outputs, with gaps and the step trace.
 * @throws ConfigurationError if a selected rule's consumed length is out of
 * range or its alternatives do not match the variant count.
 */
TranscriptionResult applyRules(const icu::UnicodeString &input,
                               const RuleTable &rules,
                               const std::vector<std::string> &variantLabels,
                               const FallbackPolicy &fallback);

/**
 * @brief Convenience overload: normalizes UTF-8 input, then applies the rules.
 */
TranscriptionResult applyRules(const std::string &nativeText,
                               const RuleTable &rules,
                               const std::vector<std::string> &variantLabels,
                               const FallbackPolicy &fallback);
inline TranscriptionResult applyRules(const char *nativeText,
                                      const RuleTable &rules,
                                      const std::vector<std::string> &variantLabels,
                                      const FallbackPolicy &fallback) {
    return applyRules(std::string(nativeText), rules, variantLabels, fallback);
}
