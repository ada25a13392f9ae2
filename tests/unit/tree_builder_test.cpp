#include <gtest/gtest.h>
#include <freestyle/css/tree_builder.h>
#include <string>
#include <vector>

using namespace freestyle::css;

class TreeBuilderTest : public ::testing::Test {
protected:
    Container container;
    TreeBuilder builder{container};
};

// =============================================================================
// Class names
// =============================================================================
TEST_F(TreeBuilderTest, SingleProperty) {
    auto class_name = builder.register_styles({{"color", "red"}});
    EXPECT_EQ(class_name, "1rscope");
    EXPECT_EQ(container.render(), ".1rscope{color:red;}");
}

TEST_F(TreeBuilderTest, KeyOrderDoesNotMatter) {
    auto a = builder.register_styles({{"background", "blue"}, {"color", "red"}});
    auto b = builder.register_styles({{"color", "red"}, {"background", "blue"}});
    EXPECT_EQ(a, "jtsac9");
    EXPECT_EQ(a, b);
    EXPECT_EQ(container.render(), ".jtsac9{background:blue;color:red;}");
}

TEST_F(TreeBuilderTest, StructuralPositionChangesHash) {
    // Same declarations, one top level and one nested.
    auto flat = builder.register_styles({{"color", "red"}});
    auto nested = builder.register_styles({{".x", StyleLayer{{"color", "red"}}}});
    EXPECT_NE(flat, nested);
}

// =============================================================================
// Nesting
// =============================================================================
TEST_F(TreeBuilderTest, IdenticalNestedDeclarationsShareOneStyle) {
    auto class_name = builder.register_styles({
        {"color", "red"},
        {".foo", StyleLayer{{"color", "red"}}},
    });
    EXPECT_EQ(class_name, "3q7qhvt");
    EXPECT_EQ(container.render(), ".3q7qhvt,.3q7qhvt .foo{color:red;}");
    EXPECT_EQ(container.rules().size(), 1u);
}

TEST_F(TreeBuilderTest, PlaceholderSelectors) {
    auto class_name = builder.register_styles({
        {"&:hover", StyleLayer{{"color", "blue"}}},
        {"color", "red"},
    });
    EXPECT_EQ(class_name, "88avfg");
    EXPECT_EQ(container.render(), ".88avfg{color:red;}.88avfg:hover{color:blue;}");
}

TEST_F(TreeBuilderTest, TrimmedKeys) {
    auto class_name = builder.register_styles({
        {" color ", "red"},
        {" .x ", StyleLayer{{"color", "blue"}}},
    });
    EXPECT_EQ(class_name, "39lsgeu");
    EXPECT_EQ(container.render(), ".39lsgeu{color:red;}.39lsgeu .x{color:blue;}");
}

// =============================================================================
// At-rules
// =============================================================================
TEST_F(TreeBuilderTest, AtRuleHoistsButKeepsSelector) {
    auto class_name = builder.register_styles({
        {"@media (min-width: 500px)", StyleLayer{{"color", "blue"}}},
        {"color", "red"},
    });
    EXPECT_EQ(class_name, "3gq7lj0");
    EXPECT_EQ(container.render(),
              ".3gq7lj0{color:red;}@media (min-width: 500px){.3gq7lj0{color:blue;}}");
}

TEST_F(TreeBuilderTest, SameAtRuleMergesAcrossRegistrations) {
    const std::string media = "@media (min-width: 600px)";
    auto first = builder.register_styles({{media, StyleLayer{{"color", "red"}}}});
    auto second = builder.register_styles({{media, StyleLayer{{"color", "blue"}}}});
    EXPECT_EQ(first, "30lvkvq");
    EXPECT_EQ(second, "3n934cn");
    EXPECT_EQ(container.render(),
              "@media (min-width: 600px){.30lvkvq{color:red;}.3n934cn{color:blue;}}");
}

TEST_F(TreeBuilderTest, AtRulesInsideNestedSelectors) {
    auto class_name = builder.register_styles({
        {"@media print", StyleLayer{{".a", StyleLayer{{"color", "red"}}}}},
        {".b", StyleLayer{{"@supports (display: grid)", StyleLayer{{"display", "grid"}}}}},
    });
    EXPECT_EQ(class_name, "1f9nhm8");
    EXPECT_EQ(container.render(),
              "@supports (display: grid){.1f9nhm8 .b{display:grid;}}"
              "@media print{.1f9nhm8 .a{color:red;}}");
}

TEST_F(TreeBuilderTest, EmptyAtRuleStillRendersWrapper) {
    auto class_name = builder.register_styles({{"@media print", StyleLayer{}}});
    EXPECT_EQ(class_name, "2ls2avd");
    EXPECT_EQ(container.render(), "@media print{}");
}

// =============================================================================
// Sharing between registrations
// =============================================================================
TEST_F(TreeBuilderTest, SharedNestedBlockRendersOnce) {
    auto a = builder.register_styles({{"color", "red"}, {".a", StyleLayer{{"margin", 0}}}});
    auto b = builder.register_styles({{"color", "blue"}, {".b", StyleLayer{{"margin", 0}}}});
    EXPECT_EQ(a, "kq6uma");
    EXPECT_EQ(b, "10ct28a");
    EXPECT_EQ(container.render(),
              ".kq6uma{color:red;}.kq6uma .a,.10ct28a .b{margin:0;}.10ct28a{color:blue;}");
}

TEST_F(TreeBuilderTest, RepeatedRegistrationBumpsCounts) {
    StyleLayer styles{{"color", "red"}};
    builder.register_styles(styles);
    builder.register_styles(styles);
    auto values = container.rules().values();
    ASSERT_EQ(values.size(), 1u);
    EXPECT_EQ(container.rules().count(*values[0]), 2u);
    auto& style = std::get<Style>(*values[0]);
    EXPECT_EQ(style.selectors().count(Selector(".1rscope")), 2u);
}

// =============================================================================
// unregister_styles
// =============================================================================
TEST_F(TreeBuilderTest, UnregisterReturnsSameClassName) {
    StyleLayer styles{{"color", "red"}};
    auto registered = builder.register_styles(styles);
    EXPECT_EQ(builder.unregister_styles(styles), registered);
    EXPECT_EQ(container.render(), "");
    EXPECT_TRUE(container.rules().is_empty());
}

TEST_F(TreeBuilderTest, UnregisterIsSymmetric) {
    StyleLayer styles{
        {"color", "red"},
        {".foo", StyleLayer{{"color", "red"}}},
        {"@media print", StyleLayer{{"display", "none"}}},
    };
    builder.register_styles(styles);
    auto expected = container.render();
    builder.register_styles(styles);

    builder.unregister_styles(styles);
    EXPECT_EQ(container.render(), expected);

    builder.unregister_styles(styles);
    EXPECT_EQ(container.render(), "");
    EXPECT_TRUE(container.rules().is_empty());
}

TEST_F(TreeBuilderTest, UnregisterKeepsSharedNodes) {
    StyleLayer a{{"color", "red"}, {".a", StyleLayer{{"margin", 0}}}};
    StyleLayer b{{"color", "blue"}, {".b", StyleLayer{{"margin", 0}}}};
    builder.register_styles(a);
    auto class_b = builder.register_styles(b);

    builder.unregister_styles(a);
    EXPECT_EQ(container.render(),
              "." + class_b + " .b{margin:0;}." + class_b + "{color:blue;}");
}

TEST_F(TreeBuilderTest, UnregisterMergedAtRuleKeepsOtherRegistration) {
    const std::string media = "@media (min-width: 600px)";
    StyleLayer first{{media, StyleLayer{{"color", "red"}}}};
    StyleLayer second{{media, StyleLayer{{"color", "blue"}}}};
    builder.register_styles(first);
    builder.register_styles(second);

    builder.unregister_styles(first);
    EXPECT_EQ(container.render(), "@media (min-width: 600px){.3n934cn{color:blue;}}");

    builder.unregister_styles(second);
    EXPECT_EQ(container.render(), "");
}

TEST_F(TreeBuilderTest, UnregisterUnknownTreeIsNoOp) {
    builder.register_styles({{"color", "red"}});
    builder.unregister_styles({{"@media print", StyleLayer{{"color", "green"}}}});
    EXPECT_EQ(container.render(), ".1rscope{color:red;}");
}

TEST_F(TreeBuilderTest, RegisterIntoAtRuleBody) {
    AtRule at_rule("@media print");
    TreeBuilder nested(at_rule.body());
    auto class_name = nested.register_styles({{"color", "red"}});
    EXPECT_EQ(at_rule.render(), "@media print{." + class_name + "{color:red;}}");
}
