/********************************************************************
 * rewrite_engine.cpp  –  ordered-rule rewrite engine.
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
#include "libphonema/rewrite_engine.h"

#include <memory>
#include <ostream>
#include <sstream>

#include "libphonema/phonema_core.h"

const std::string &TranscriptionResult::text(const std::string &label) const {
    for (const auto &variant : variants) {
        if (variant.label == label) {
            return variant.text;
        }
    }
    throw std::out_of_range("No variant labelled '" + label + "'");
}

// ----------------- Fallback policies -----------------

FallbackPolicy copyThrough() {
    return [](const Gap &gap) { return gap.grapheme; };
}

FallbackPolicy reportAndCopy(std::ostream &out) {
    return [&out](const Gap &gap) {
        out << "Warning: no rule covers '" << gap.grapheme << "' at position "
            << gap.position << "; copied unchanged." << std::endl;
        return gap.grapheme;
    };
}

// ----------------- Variant expansion -----------------

namespace {

struct Accumulator {
    std::string label;
    std::string text;
    size_t segments = 0;
};

void appendOutput(std::vector<Accumulator> &accumulators, const Rule &rule,
                  size_t ruleIndex, int32_t position) {
    const auto &output = rule.output();
    if (!rule.hasAlternatives()) {
        for (auto &acc : accumulators) {
            acc.text += output.front();
            acc.segments++;
        }
        return;
    }
    if (output.size() != accumulators.size()) {
        std::ostringstream msg;
        msg << "Rule " << ruleIndex << " (" << rule.describe() << ") has " << output.size()
            << " alternatives but the transcriber declares " << accumulators.size()
            << " variants (at position " << position << ")";
        throw ConfigurationError(msg.str());
    }
    for (size_t i = 0; i < accumulators.size(); ++i) {
        accumulators[i].text += output[i];
        accumulators[i].segments++;
    }
}

} // namespace

// =============================================================================//
// Engine
// =============================================================================//

TranscriptionResult applyRules(const icu::UnicodeString &input,
                               const RuleTable &rules,
                               const std::vector<std::string> &variantLabels,
                               const FallbackPolicy &fallback) {
    if (variantLabels.empty()) {
        throw ConfigurationError("At least one output variant must be declared");
    }

    std::vector<Accumulator> accumulators;
    accumulators.reserve(variantLabels.size());
    for (const auto &label : variantLabels) {
        accumulators.push_back({label, "/", 0});
    }

    // Matchers are created on first use and reused for the rest of the call.
    std::vector<std::unique_ptr<Rule::Matcher>> matchers(rules.size());

    TranscriptionResult result;
    const int32_t totalCodePoints = input.countChar32();
    int32_t cursor = 0;     // UTF-16 index
    int32_t position = 0;   // code points consumed so far

    while (cursor < input.length()) {
        const int32_t remaining = totalCodePoints - position;
        bool applied = false;

        for (size_t i = 0; i < rules.size(); ++i) {
            if (!matchers[i]) {
                matchers[i] = std::make_unique<Rule::Matcher>(rules[i], input);
            }
            int32_t matchEnd = matchers[i]->matchAt(cursor);
            if (matchEnd < 0) {
                continue;
            }

            const Rule &rule = rules[i];
            int32_t consumed = rule.declaredConsume()
                ? *rule.declaredConsume()
                : input.countChar32(cursor, matchEnd - cursor);
            if (consumed < 1 || consumed > remaining) {
                std::ostringstream msg;
                msg << "Rule " << i << " (" << rule.describe() << ") would consume " << consumed
                    << " code point(s) at position " << position << " with " << remaining
                    << " remaining";
                throw ConfigurationError(msg.str());
            }

            appendOutput(accumulators, rule, i, position);
            result.steps.push_back({position, consumed, static_cast<int>(i)});
            cursor = input.moveIndex32(cursor, consumed);
            position += consumed;
            applied = true;
            break;
        }
        if (applied) {
            continue;
        }

        // No rule matched: hand exactly one code point to the fallback.
        int32_t next = input.moveIndex32(cursor, 1);
        Gap gap{toUtf8(input.tempSubStringBetween(cursor, next)), position};
        std::string copied = fallback ? fallback(gap) : gap.grapheme;
        for (auto &acc : accumulators) {
            acc.text += copied;
            acc.segments++;
        }
        result.gaps.push_back(std::move(gap));
        result.steps.push_back({position, 1, -1});
        cursor = next;
        position += 1;
    }

    for (auto &acc : accumulators) {
        acc.text += '/';
        result.variants.push_back({std::move(acc.label), std::move(acc.text), acc.segments});
    }
    return result;
}

TranscriptionResult applyRules(const std::string &nativeText,
                               const RuleTable &rules,
                               const std::vector<std::string> &variantLabels,
                               const FallbackPolicy &fallback) {
    return applyRules(normalizeInput(icu::UnicodeString::fromUTF8(nativeText)), rules, variantLabels,
                      fallback);
}
