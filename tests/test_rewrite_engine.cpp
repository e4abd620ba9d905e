// =============================================================================
// Rewrite Engine Tests
// =============================================================================

#include <gtest/gtest.h>
#include "libphonema/phonema_core.h"
#include "libphonema/rewrite_engine.h"

#include <algorithm>
#include <chrono>
#include <sstream>

class RewriteEngineTest : public ::testing::Test {
protected:
    const std::vector<std::string> single{"Standard"};
    const std::vector<std::string> two{"Peninsular", "American"};

    TranscriptionResult run(const std::string &text, const RuleTable &rules,
                            const std::vector<std::string> &labels) {
        return applyRules(text, rules, labels, copyThrough());
    }
};

TEST_F(RewriteEngineTest, AppliesRulesAndBrackets) {
    RuleTable rules{Rule("ph", {"f"}), Rule("o", {"o"}), Rule("n", {"n"})};
    auto result = run("phon", rules, single);

    ASSERT_EQ(result.variants.size(), 1u);
    EXPECT_EQ(result.variants[0].label, "Standard");
    EXPECT_EQ(result.variants[0].text, "/fon/");
    EXPECT_TRUE(result.gaps.empty());
}

TEST_F(RewriteEngineTest, EmptyInputGivesEmptyBrackets) {
    RuleTable rules{Rule("a", {"a"})};
    auto result = run("", rules, two);

    ASSERT_EQ(result.variants.size(), 2u);
    EXPECT_EQ(result.variants[0].text, "//");
    EXPECT_EQ(result.variants[1].text, "//");
    EXPECT_TRUE(result.steps.empty());
}

// Uncovered graphemes are copied into every variant and reported, never thrown
TEST_F(RewriteEngineTest, FallbackCopiesUncoveredGrapheme) {
    RuleTable rules{Rule("c", {"θ", "s"}), Rule("a", {"a"})};
    TranscriptionResult result;
    ASSERT_NO_THROW(result = run("ca1a", rules, two));

    EXPECT_EQ(result.text("Peninsular"), "/θa1a/");
    EXPECT_EQ(result.text("American"), "/sa1a/");
    ASSERT_EQ(result.gaps.size(), 1u);
    EXPECT_EQ(result.gaps[0].grapheme, "1");
    EXPECT_EQ(result.gaps[0].position, 2);
}

TEST_F(RewriteEngineTest, FallbackAdvancesOneCodePoint) {
    RuleTable rules;
    auto result = run("ñé", rules, single);

    EXPECT_EQ(result.variants[0].text, "/ñé/");
    ASSERT_EQ(result.gaps.size(), 2u);
    EXPECT_EQ(result.gaps[0].grapheme, "ñ");
    EXPECT_EQ(result.gaps[1].grapheme, "é");
    EXPECT_EQ(result.gaps[1].position, 1);
    for (const auto &step : result.steps) {
        EXPECT_EQ(step.ruleIndex, -1);
        EXPECT_EQ(step.consumed, 1);
    }
}

TEST_F(RewriteEngineTest, ReportAndCopyWritesDiagnostic) {
    std::ostringstream log;
    RuleTable rules{Rule("a", {"a"})};
    auto result = applyRules("a7", rules, single, reportAndCopy(log));

    EXPECT_EQ(result.variants[0].text, "/a7/");
    EXPECT_NE(log.str().find("'7'"), std::string::npos);
    EXPECT_NE(log.str().find("position 1"), std::string::npos);
}

TEST_F(RewriteEngineTest, CustomFallbackPolicy) {
    RuleTable rules{Rule("a", {"a"})};
    auto result = applyRules("a?a", rules, single, [](const Gap &) { return std::string("*"); });

    EXPECT_EQ(result.variants[0].text, "/a*a/");
    EXPECT_EQ(result.gaps.size(), 1u);
}

TEST_F(RewriteEngineTest, VariantDivergence) {
    RuleTable rules{Rule("ll", {"ʎ", "ʝ"}), Rule("a", {"a"}), Rule("v", {"β"}), Rule("e", {"e"})};
    auto result = run("llave", rules, two);

    ASSERT_EQ(result.variants.size(), 2u);
    EXPECT_EQ(result.variants[0].label, "Peninsular");
    EXPECT_EQ(result.variants[0].text, "/ʎaβe/");
    EXPECT_EQ(result.variants[1].label, "American");
    EXPECT_EQ(result.variants[1].text, "/ʝaβe/");

    // Identical apart from the diverging segment
    const std::string &p = result.variants[0].text;
    const std::string &a = result.variants[1].text;
    EXPECT_EQ(p.substr(p.size() - 5), a.substr(a.size() - 5));  // "aβe/"
    EXPECT_EQ(p.front(), a.front());
}

TEST_F(RewriteEngineTest, EveryVariantReceivesOneSegmentPerCycle) {
    RuleTable rules{Rule("z", {"θ", "s"}), Rule("a", {"a"}), Rule("p", {"p"})};
    auto result = run("zapa9", rules, two);

    ASSERT_EQ(result.variants.size(), 2u);
    EXPECT_EQ(result.variants[0].segments, result.steps.size());
    EXPECT_EQ(result.variants[1].segments, result.steps.size());
    EXPECT_EQ(result.steps.size(), 5u);
}

TEST_F(RewriteEngineTest, ConsumedLengthsCoverWholeInput) {
    RuleTable rules{Rule("ch", {"tʃ"}), Rule("n(?=d)", {"n"}), Rule("nd", {"nd"}), Rule("ñ", {"ɲ"})};
    const std::string text = "chañando x";
    auto result = run(text, rules, single);

    int32_t total = 0;
    int32_t expectedPosition = 0;
    for (const auto &step : result.steps) {
        EXPECT_EQ(step.position, expectedPosition);
        total += step.consumed;
        expectedPosition += step.consumed;
    }
    EXPECT_EQ(total, icu::UnicodeString::fromUTF8(text).countChar32());
}

// Left contexts look at a bounded window, so doubling the input roughly
// doubles the work instead of quadrupling it
TEST_F(RewriteEngineTest, ContextRulesScaleLinearly) {
    RuleTable rules{Rule("d", {"d"}, std::nullopt, "(^|\\s|n|l)"), Rule("d", {"ð"}),
                    Rule("v", {"b"}, std::nullopt, "(^|\\s)"), Rule("v", {"β"}),
                    Rule("c", {"k"}), Rule("[aeo]", {"a"}), Rule("\\s", {" "})};

    auto timeFor = [&](int repeats) {
        std::string text;
        for (int i = 0; i < repeats; ++i) text += "vaca dedo ";
        auto best = std::chrono::steady_clock::duration::max();
        for (int attempt = 0; attempt < 3; ++attempt) {
            auto start = std::chrono::steady_clock::now();
            auto result = run(text, rules, single);
            auto elapsed = std::chrono::steady_clock::now() - start;
            EXPECT_TRUE(result.gaps.empty());
            best = std::min(best, elapsed);
        }
        return std::chrono::duration<double>(best).count();
    };

    double small = timeFor(400);
    double large = timeFor(3200);
    // Eight times the input: ~8x when linear, ~64x when quadratic
    EXPECT_LT(large, std::max(small, 1e-3) * 24) << "small=" << small << "s large=" << large << "s";
}

TEST_F(RewriteEngineTest, IsDeterministic) {
    RuleTable rules{Rule("c(?=[ie])", {"θ", "s"}), Rule("c", {"k"}), Rule("i", {"i"}), Rule("o", {"o"})};
    auto first = run("cocido", rules, two);
    for (int i = 0; i < 10; ++i) {
        auto again = run("cocido", rules, two);
        EXPECT_EQ(again.variants[0].text, first.variants[0].text);
        EXPECT_EQ(again.variants[1].text, first.variants[1].text);
        EXPECT_EQ(again.gaps.size(), first.gaps.size());
    }
}

// The first rule that matches wins; nothing prefers the longer match
TEST_F(RewriteEngineTest, DigraphOrderedFirstAlwaysWins) {
    RuleTable rules{Rule("ch", {"tʃ"}), Rule("c", {"k"}), Rule("a", {"a"}), Rule("h", {"h"})};
    for (const std::string text : {"ch", "chach", "hachac", "cchh"}) {
        auto result = run(text, rules, single);
        for (const auto &step : result.steps) {
            if (step.ruleIndex == 1) {
                // "c" only fires where "ch" could not
                EXPECT_NE(text.substr(step.position, 2), "ch") << text;
            }
        }
    }
    EXPECT_EQ(run("chach", rules, single).variants[0].text, "/tʃatʃ/");
}

TEST_F(RewriteEngineTest, SwappingRulesChangesWhichFires) {
    RuleTable digraphFirst{Rule("ch", {"tʃ"}), Rule("c", {"k"})};
    RuleTable singleFirst{Rule("c", {"k"}), Rule("ch", {"tʃ"})};

    EXPECT_EQ(run("ch", digraphFirst, single).variants[0].text, "/tʃ/");
    EXPECT_EQ(run("ch", singleFirst, single).variants[0].text, "/kh/");
}

TEST_F(RewriteEngineTest, ConsumeShorterThanMatchLeavesRest) {
    RuleTable rules{Rule("ab", {"x"}, 1), Rule("b", {"y"})};
    auto result = run("ab", rules, single);

    EXPECT_EQ(result.variants[0].text, "/xy/");
    ASSERT_EQ(result.steps.size(), 2u);
    EXPECT_EQ(result.steps[0].consumed, 1);
    EXPECT_EQ(result.steps[1].ruleIndex, 1);
}

// Scanning restarts at the first rule, so earlier rules can use fresh context
TEST_F(RewriteEngineTest, ScanRestartsFromFirstRule) {
    RuleTable rules{Rule("b", {"B"}, std::nullopt, "a"), Rule("a", {"A"}), Rule("b", {"b"})};

    EXPECT_EQ(run("ab", rules, single).variants[0].text, "/AB/");
    EXPECT_EQ(run("bb", rules, single).variants[0].text, "/bb/");
    EXPECT_EQ(run("bab", rules, single).variants[0].text, "/bAB/");
}

TEST_F(RewriteEngineTest, ConsumeBeyondRemainingInputIsADefect) {
    RuleTable rules{Rule("ab", {"x"}, 5)};
    EXPECT_THROW(run("ab", rules, single), ConfigurationError);
}

TEST_F(RewriteEngineTest, NonPositiveConsumeIsADefect) {
    EXPECT_THROW(run("a", RuleTable{Rule("a", {"x"}, 0)}, single), ConfigurationError);
    EXPECT_THROW(run("a", RuleTable{Rule("a", {"x"}, -2)}, single), ConfigurationError);
    // An empty match with no declared length would consume nothing
    EXPECT_THROW(run("a", RuleTable{Rule("", {""})}, single), ConfigurationError);
}

TEST_F(RewriteEngineTest, DefectMessageNamesTheRule) {
    RuleTable rules{Rule("a", {"a"}), Rule("bc", {"x"}, 4)};
    try {
        run("abc", rules, single);
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError &e) {
        std::string what = e.what();
        EXPECT_NE(what.find("Rule 1"), std::string::npos);
        EXPECT_NE(what.find("match='bc'"), std::string::npos);
        EXPECT_NE(what.find("position 1"), std::string::npos);
    }
}

TEST_F(RewriteEngineTest, AlternativeCountMismatchIsADefect) {
    RuleTable rules{Rule("a", {"a"}), Rule("z", {"θ", "s", "z"})};

    EXPECT_THROW(run("z", rules, two), ConfigurationError);
    EXPECT_THROW(run("z", rules, single), ConfigurationError);
    // Only checked when the rule is applied
    EXPECT_NO_THROW(run("aaa", rules, two));
}

TEST_F(RewriteEngineTest, NoVariantsIsADefect) {
    RuleTable rules{Rule("a", {"a"})};
    EXPECT_THROW(run("a", rules, {}), ConfigurationError);
}

TEST_F(RewriteEngineTest, InputIsNormalized) {
    RuleTable rules{Rule("ñ", {"ɲ"}), Rule("a", {"a"})};

    EXPECT_EQ(run("ÑA", rules, single).variants[0].text, "/ɲa/");
    // n + combining tilde composes to ñ before matching
    EXPECT_EQ(run("n\xCC\x83" "a", rules, single).variants[0].text, "/ɲa/");
}

TEST_F(RewriteEngineTest, UnknownLabelLookupThrows) {
    RuleTable rules{Rule("a", {"a"})};
    auto result = run("a", rules, single);
    EXPECT_EQ(result.text("Standard"), "/a/");
    EXPECT_THROW(result.text("Other"), std::out_of_range);
}
