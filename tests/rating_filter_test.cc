#include "xmprate/rating_filter.h"

#include <gtest/gtest.h>

#include <string_view>

namespace xmprate {
namespace {

    static LabelResult label_of(std::string_view value)
    {
        LabelResult label;
        label.found = true;
        label.value.assign(value.data(), value.size());
        return label;
    }

}  // namespace

TEST(RatingFilter, DefaultSelectsFiveAndAbove)
{
    const RatingFilter filter;
    EXPECT_FALSE(rating_passes(0, filter));
    EXPECT_FALSE(rating_passes(4, filter));
    EXPECT_TRUE(rating_passes(5, filter));
}

TEST(RatingFilter, Comparisons)
{
    RatingFilter filter;
    filter.threshold = 3;

    filter.comparison = RatingComparison::LessEqual;
    EXPECT_TRUE(rating_passes(0, filter));
    EXPECT_TRUE(rating_passes(3, filter));
    EXPECT_FALSE(rating_passes(4, filter));

    filter.comparison = RatingComparison::Equal;
    EXPECT_FALSE(rating_passes(2, filter));
    EXPECT_TRUE(rating_passes(3, filter));
    EXPECT_FALSE(rating_passes(4, filter));
}

TEST(RatingFilter, InverseSelectsFailingFiles)
{
    RatingFilter filter;
    filter.threshold = 3;
    filter.inverse   = true;
    EXPECT_TRUE(rating_passes(2, filter));
    EXPECT_FALSE(rating_passes(3, filter));
}

TEST(RatingFilter, ThresholdIgnoresInverse)
{
    RatingFilter filter;
    filter.inverse = true;
    EXPECT_TRUE(threshold_passes(5, filter));
    EXPECT_FALSE(rating_passes(5, filter));
}

TEST(RatingFilter, LabelMustMatch)
{
    RatingFilter filter;
    filter.threshold   = 3;
    filter.match_label = true;
    filter.label       = "Red";

    EXPECT_TRUE(rating_passes(4, label_of("Red"), filter));
    EXPECT_FALSE(rating_passes(4, label_of("Green"), filter));
    EXPECT_FALSE(rating_passes(4, label_of("red"), filter));
    // Label matches but the rating does not.
    EXPECT_FALSE(rating_passes(2, label_of("Red"), filter));
}

TEST(RatingFilter, MissingLabelFailsLabelFilter)
{
    RatingFilter filter;
    filter.threshold   = 0;
    filter.match_label = true;
    filter.label       = "Red";

    EXPECT_FALSE(rating_passes(5, LabelResult {}, filter));
    EXPECT_FALSE(rating_passes(5, filter));

    // An empty label is still a label.
    filter.label = "";
    EXPECT_TRUE(rating_passes(5, label_of(""), filter));
    EXPECT_FALSE(rating_passes(5, LabelResult {}, filter));
}

TEST(RatingFilter, LabelIgnoredUnlessRequested)
{
    RatingFilter filter;
    filter.label = "Red";
    EXPECT_TRUE(rating_passes(5, label_of("Green"), filter));
    EXPECT_TRUE(rating_passes(5, LabelResult {}, filter));
}

TEST(RatingFilter, InverseAppliesToLabelAndThreshold)
{
    RatingFilter filter;
    filter.threshold   = 3;
    filter.match_label = true;
    filter.label       = "Red";
    filter.inverse     = true;

    EXPECT_FALSE(rating_passes(4, label_of("Red"), filter));
    EXPECT_TRUE(rating_passes(4, label_of("Green"), filter));
    EXPECT_TRUE(rating_passes(2, label_of("Red"), filter));
    EXPECT_TRUE(rating_passes(4, LabelResult {}, filter));
}

TEST(RatingFilter, ComparisonNames)
{
    for (RatingComparison c :
         { RatingComparison::MoreEqual, RatingComparison::LessEqual,
           RatingComparison::Equal }) {
        RatingComparison parsed = RatingComparison::MoreEqual;
        ASSERT_TRUE(parse_rating_comparison(rating_comparison_name(c), &parsed));
        EXPECT_EQ(parsed, c);
    }

    RatingComparison out = RatingComparison::Equal;
    EXPECT_FALSE(parse_rating_comparison("greater", &out));
    EXPECT_FALSE(parse_rating_comparison("", &out));
    EXPECT_EQ(out, RatingComparison::Equal);
}

}  // namespace xmprate
