/********************************************************************
 * rule.h  –  rewrite rules and rule tables
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
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <unicode/regex.h>
#include <unicode/unistr.h>

// =============================================================================//
// Rule Class
// =============================================================================//
/**
 * @brief One ordered rewrite rule.
 *
 * A rule fires when its match pattern matches at the very start of the
 * remaining input and, if it has one, its left context matches a suffix of
 * the input already consumed. When it fires it contributes its output and
 * advances the cursor by its consumed length.
 *
 * Patterns are ICU regular expressions, compiled once in the constructor.
 * Rules are immutable and cheap to copy; the compiled patterns are shared.
 */
class Rule {
public:
    /**
     * @brief Builds a rule.
     * @param match Pattern anchored at the cursor.
     * @param output One string shared by every variant, or one string per
     * declared variant, in variant order.
     * @param consume Code points to advance past. When unset, the length of
     * the text @p match matched.
     * @param before Optional left-context pattern, tested against the input
     * consumed so far. It must match a suffix of it; '^' means "at the start".
     * Only the last Matcher::kLeftContextWindow code units are visible to it.
     * @throws RuleTableError if either pattern fails to compile.
     */
    Rule(const std::string &match, std::vector<std::string> output,
         std::optional<int> consume = std::nullopt,
         std::optional<std::string> before = std::nullopt);

    const std::string &pattern() const { return match_; }
    const std::optional<std::string> &leftContext() const { return before_; }
    const std::vector<std::string> &output() const { return output_; }
    const std::optional<int> &declaredConsume() const { return consume_; }

    /** @brief True when the output lists one alternative per variant. */
    bool hasAlternatives() const { return output_.size() > 1; }

    /** @brief Human-readable form used in error messages. */
    std::string describe() const;

    /**
     * @brief Per-call matching state for one rule over one input string.
     *
     * ICU matchers are not thread-safe, so each transcription call owns its
     * own. The input must outlive the matcher.
     */
    class Matcher {
    public:
        Matcher(const Rule &rule, const icu::UnicodeString &input);

        /**
         * @brief Tests the rule at a cursor position (UTF-16 index).
         * @return The UTF-16 index where the main pattern's match ends, or -1
         * if the rule does not fire here.
         * @throws ConfigurationError if ICU fails while matching (e.g. its
         * backtracking stack overflows).
         */
        int32_t matchAt(int32_t cursor);

        /** Code units of consumed input visible to a left context. */
        static constexpr int32_t kLeftContextWindow = 64;

    private:
        const icu::UnicodeString &input_;
        std::unique_ptr<icu::RegexMatcher> match_;
        std::unique_ptr<icu::RegexMatcher> context_;
        int32_t inputLength_;
    };

private:
    std::string match_;
    std::optional<std::string> before_;
    std::vector<std::string> output_;
    std::optional<int> consume_;
    std::shared_ptr<const icu::RegexPattern> matchPattern_;
    std::shared_ptr<const icu::RegexPattern> contextPattern_;
};

// =============================================================================//
// RuleTable Class
// =============================================================================//
/**
 * @brief An immutable, ordered list of rules. Order is the only priority:
 * the first rule that fires wins.
 */
class RuleTable {
public:
    RuleTable() = default;
    explicit RuleTable(std::vector<Rule> rules) : rules_(std::move(rules)) {}
    RuleTable(std::initializer_list<Rule> rules) : rules_(rules) {}

    size_t size() const { return rules_.size(); }
    bool empty() const { return rules_.empty(); }
    const Rule &operator[](size_t i) const { return rules_[i]; }
    std::vector<Rule>::const_iterator begin() const { return rules_.begin(); }
    std::vector<Rule>::const_iterator end() const { return rules_.end(); }

private:
    std::vector<Rule> rules_;
};
