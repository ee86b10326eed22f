#include "gtest/gtest.h"
#include <relgraph/graph/model/node_palette.h>

#include <cmath>
#include <limits>
#include <set>
#include <string>

using namespace relgraph::graph;

TEST(NodePaletteTest, EveryLegendKindHasDistinctStyle) {
    const auto& styles = NodeKindStyles();
    ASSERT_EQ(styles.size(), 8u);

    std::set<std::string> kinds;
    std::set<ImU32> colors;
    for (const auto& style : styles) {
        kinds.insert(style.kind);
        colors.insert(style.color);
        EXPECT_FALSE(std::string(style.glyph).empty());
        EXPECT_FALSE(std::string(style.description).empty());
    }
    EXPECT_EQ(kinds.size(), styles.size());
    EXPECT_EQ(colors.size(), styles.size());
    EXPECT_EQ(kinds.count(kSourceNodeKind), 1u);
    EXPECT_EQ(kinds.count(kDefaultNodeKind), 1u);
}

TEST(NodePaletteTest, KnownKindsResolveToTheirStyle) {
    EXPECT_EQ(ColorForKind("person"), IM_COL32(0xEC, 0x48, 0x99, 0xFF));
    EXPECT_EQ(ColorForKind("place"), IM_COL32(0x10, 0xB9, 0x81, 0xFF));
    EXPECT_EQ(GlyphForKind("source"), std::string(kDefaultSourceGlyph));
    EXPECT_STREQ(StyleForKind("work").kind, "work");
}

TEST(NodePaletteTest, UnknownKindFallsBackToDefault) {
    const NodeKindStyle& style = StyleForKind("spaceship");
    EXPECT_STREQ(style.kind, "default");
    EXPECT_EQ(style.color, IM_COL32(0x6B, 0x72, 0x80, 0xFF));
    EXPECT_EQ(GlyphForKind(""), GlyphForKind("spaceship"));
    // Lookup is case sensitive.
    EXPECT_STREQ(StyleForKind("Person").kind, "default");
}

TEST(NodePaletteTest, RadiusShrinksWithDistance) {
    EXPECT_FLOAT_EQ(RadiusForDistance(1.0f), 19.5f);
    EXPECT_FLOAT_EQ(RadiusForDistance(kDefaultDistanceHint), 14.5f);
    EXPECT_FLOAT_EQ(RadiusForDistance(5.0f), 9.5f);
    EXPECT_LT(RadiusForDistance(5.0f), RadiusForDistance(1.0f));
    EXPECT_GT(kSourceNodeRadius, RadiusForDistance(kMinDistanceHint));
}

TEST(NodePaletteTest, IndirectLinksRestFurtherOut) {
    EXPECT_FLOAT_EQ(RestLengthFor(1.0f, Relationship::DIRECT), 100.0f);
    EXPECT_FLOAT_EQ(RestLengthFor(1.0f, Relationship::INDIRECT), 140.0f);
    EXPECT_FLOAT_EQ(RestLengthFor(3.0f, Relationship::DIRECT), 180.0f);
    for (float hint = kMinDistanceHint; hint <= kMaxDistanceHint; hint += 1.0f) {
        EXPECT_GT(RestLengthFor(hint, Relationship::INDIRECT), RestLengthFor(hint, Relationship::DIRECT));
    }
}

TEST(NodePaletteTest, DistanceHintRange) {
    EXPECT_TRUE(IsValidDistanceHint(1.0));
    EXPECT_TRUE(IsValidDistanceHint(2.5));
    EXPECT_TRUE(IsValidDistanceHint(5.0));
    EXPECT_FALSE(IsValidDistanceHint(0.0));
    EXPECT_FALSE(IsValidDistanceHint(5.01));
    EXPECT_FALSE(IsValidDistanceHint(-3.0));
    EXPECT_FALSE(IsValidDistanceHint(std::numeric_limits<double>::quiet_NaN()));
    EXPECT_FALSE(IsValidDistanceHint(std::numeric_limits<double>::infinity()));
}

TEST(NodePaletteTest, ParsesHexColors) {
    auto six = ParseHexColor("#3B82F6");
    ASSERT_TRUE(six.has_value());
    EXPECT_EQ(six.value(), IM_COL32(0x3B, 0x82, 0xF6, 0xFF));

    auto three = ParseHexColor("#f0a");
    ASSERT_TRUE(three.has_value());
    EXPECT_EQ(three.value(), IM_COL32(0xFF, 0x00, 0xAA, 0xFF));

    auto eight = ParseHexColor("#10203040");
    ASSERT_TRUE(eight.has_value());
    EXPECT_EQ(eight.value(), IM_COL32(0x10, 0x20, 0x30, 0x40));

    EXPECT_FALSE(ParseHexColor("").has_value());
    EXPECT_FALSE(ParseHexColor("3B82F6").has_value());
    EXPECT_FALSE(ParseHexColor("#12345").has_value());
    EXPECT_FALSE(ParseHexColor("#GG0000").has_value());
    EXPECT_FALSE(ParseHexColor("blue").has_value());
}

TEST(NodePaletteTest, FormatsHexColors) {
    EXPECT_EQ(ToHexColor(IM_COL32(0x3B, 0x82, 0xF6, 0xFF)), "#3B82F6");
    EXPECT_EQ(ToHexColor(IM_COL32(0x10, 0x20, 0x30, 0x40)), "#10203040");
    EXPECT_EQ(ToHexColor(ParseHexColor("#abc").value()), "#AABBCC");
}
