#include <gtest/gtest.h>
#include "../routing/route.h"

using qb::route::parse_route_params;
using Params = std::vector<std::string>;

TEST(RouteParamsTest, NoParameters) {
    EXPECT_TRUE(parse_route_params("/").empty());
    EXPECT_TRUE(parse_route_params("/users/list").empty());
}

TEST(RouteParamsTest, NamedParameters) {
    EXPECT_EQ(parse_route_params("/users/:id"), (Params{"id"}));
    EXPECT_EQ(parse_route_params("/users/:user_id/posts/:post_id"), (Params{"user_id", "post_id"}));
}

TEST(RouteParamsTest, OptionalParameter) {
    EXPECT_EQ(parse_route_params("/users/:id?"), (Params{"id"}));
}

TEST(RouteParamsTest, DashAndDotEndNames) {
    EXPECT_EQ(parse_route_params("/flights/:from-:to"), (Params{"from", "to"}));
    EXPECT_EQ(parse_route_params("/files/:name.:ext"), (Params{"name", "ext"}));
}

TEST(RouteParamsTest, WildcardsAreNumbered) {
    EXPECT_EQ(parse_route_params("/*"), (Params{"*1"}));
    EXPECT_EQ(parse_route_params("/src/*/dst/*"), (Params{"*1", "*2"}));
    EXPECT_EQ(parse_route_params("/static/+"), (Params{"+1"}));
}

TEST(RouteParamsTest, MixedParameters) {
    EXPECT_EQ(parse_route_params("/api/:version/+/files/*"), (Params{"version", "+1", "*1"}));
}

TEST(RouteParamsTest, EscapedMarkersAreLiteral) {
    EXPECT_TRUE(parse_route_params("/time\\:now").empty());
    EXPECT_EQ(parse_route_params("/v1\\*/:id"), (Params{"id"}));
}

TEST(RouteParamsTest, BareColonIsIgnored) {
    EXPECT_TRUE(parse_route_params("/a/:/b").empty());
}

int
main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
