#include "pch.h"

#include "HealthAQ/vocabulary_matcher.h"

#include <stdexcept>

namespace {

haq::VocabularyMatcher create_country_matcher() {
    auto vocabulary = std::vector<std::string>{"Thailand", "Vietnam", "New Zealand", "India"};
    auto synonyms = std::map<std::string, std::string>{
        {"viet nam", "Vietnam"}, {"siam", "Thailand"}, {"atlantis", "Atlantis"}};
    return haq::VocabularyMatcher{vocabulary, synonyms};
}

} // anonymous namespace

TEST(TestHealthAQ_VocabularyMatcher, CreateSortsVocabulary) {
    auto matcher = create_country_matcher();

    ASSERT_EQ(4u, matcher.vocabulary().size());
    ASSERT_EQ("India", matcher.vocabulary().front());
    ASSERT_EQ("Vietnam", matcher.vocabulary().back());
    ASSERT_DOUBLE_EQ(haq::VocabularyMatcher::DefaultThreshold, matcher.threshold());
}

TEST(TestHealthAQ_VocabularyMatcher, CreateWithInvalidThresholdThrows) {
    using namespace haq;
    auto vocabulary = std::vector<std::string>{"Stroke"};

    ASSERT_THROW(VocabularyMatcher(vocabulary, {}, false, 0.0), std::invalid_argument);
    ASSERT_THROW(VocabularyMatcher(vocabulary, {}, false, 1.5), std::invalid_argument);
    ASSERT_NO_THROW(VocabularyMatcher(vocabulary, {}, false, 1.0));
}

TEST(TestHealthAQ_VocabularyMatcher, FindAllInTextOrder) {
    auto matcher = create_country_matcher();
    auto matches = matcher.find_all("Compare India and Thailand in 2030");

    ASSERT_EQ(2u, matches.size());
    ASSERT_EQ("India", matches[0].name);
    ASSERT_EQ(8u, matches[0].position);
    ASSERT_EQ("Thailand", matches[1].name);
    ASSERT_DOUBLE_EQ(1.0, matches[1].similarity);
}

TEST(TestHealthAQ_VocabularyMatcher, FindAllDistinctNames) {
    auto matcher = create_country_matcher();
    auto matches = matcher.find_all("thailand vs siam vs THAILAND");

    ASSERT_EQ(1u, matches.size());
    ASSERT_EQ("Thailand", matches[0].name);
    ASSERT_EQ(0u, matches[0].position);
}

TEST(TestHealthAQ_VocabularyMatcher, MatchSynonymsLongestFirst) {
    auto matcher = create_country_matcher();
    auto matches = matcher.find_all("pm2.5 in viet nam");

    ASSERT_EQ(1u, matches.size());
    ASSERT_EQ("Vietnam", matches[0].name);
    ASSERT_EQ(8u, matches[0].length);
}

TEST(TestHealthAQ_VocabularyMatcher, SynonymWithUnknownTargetIsSkipped) {
    auto matcher = create_country_matcher();

    ASSERT_FALSE(matcher.match("air quality in atlantis").has_value());
}

TEST(TestHealthAQ_VocabularyMatcher, MatchUniqueNamePart) {
    auto matcher = create_country_matcher();

    ASSERT_EQ("New Zealand", matcher.match("how clean is the air in zealand").value());
}

TEST(TestHealthAQ_VocabularyMatcher, WordBoundariesAreRequired) {
    auto matcher = create_country_matcher();

    ASSERT_FALSE(matcher.match("indiana air quality").has_value());
}

TEST(TestHealthAQ_VocabularyMatcher, ApproximateMatchAboveThreshold) {
    auto matcher = create_country_matcher();
    auto match = matcher.best_match("pm2.5 in thailnd");

    ASSERT_TRUE(match.has_value());
    ASSERT_EQ("Thailand", match->name);
    ASSERT_EQ(9u, match->position);
    ASSERT_NEAR(0.875, match->similarity, 1e-9);
    ASSERT_EQ("Thailand", matcher.match("pm2.5 in thailnd").value());
}

TEST(TestHealthAQ_VocabularyMatcher, ApproximateMatchBelowThreshold) {
    auto matcher = create_country_matcher();

    ASSERT_FALSE(matcher.best_match("pm2.5 in thalnd").has_value());
    ASSERT_TRUE(matcher.find_all("nothing to see here").empty());
}

TEST(TestHealthAQ_VocabularyMatcher, MaskMatchedSpans) {
    auto matcher = create_country_matcher();

    ASSERT_EQ("Air in" + std::string(12, ' ') + "2030", matcher.mask("Air in Thailand   2030"));
    ASSERT_EQ("no names", matcher.mask("no names"));
}

TEST(TestHealthAQ_VocabularyMatcher, NormalisedSimilarity) {
    using namespace haq;

    ASSERT_DOUBLE_EQ(1.0, VocabularyMatcher::similarity("", ""));
    ASSERT_DOUBLE_EQ(1.0, VocabularyMatcher::similarity("stroke", "stroke"));
    ASSERT_DOUBLE_EQ(0.0, VocabularyMatcher::similarity("abc", "xyz"));
    ASSERT_DOUBLE_EQ(0.75, VocabularyMatcher::similarity("copd", "copx"));
}
