#include <gtest/gtest.h>
#include "../routing/path.h"

using qb::route::compose_path;
using qb::route::route_pattern;
using qb::route::trim_slashes;

TEST(PathTest, TrimSlashes) {
    EXPECT_EQ(trim_slashes("/users"), "users");
    EXPECT_EQ(trim_slashes("users/"), "users");
    EXPECT_EQ(trim_slashes("//users//"), "users");
    EXPECT_EQ(trim_slashes("/"), "");
    EXPECT_EQ(trim_slashes(""), "");
    EXPECT_EQ(trim_slashes("/a/b/"), "a/b");
}

TEST(PathTest, ComposeJoinsWithSingleSlash) {
    EXPECT_EQ(compose_path("/api", "/v1"), "/api/v1");
    EXPECT_EQ(compose_path("/api/", "v1"), "/api/v1");
    EXPECT_EQ(compose_path("api", "v1/"), "/api/v1");
    EXPECT_EQ(compose_path("/api//", "//v1"), "/api/v1");
}

TEST(PathTest, ComposeWithEmptySides) {
    EXPECT_EQ(compose_path("/api", ""), "/api");
    EXPECT_EQ(compose_path("/api", "/"), "/api");
    EXPECT_EQ(compose_path("", "users"), "/users");
    EXPECT_EQ(compose_path("/", "/users"), "/users");
    EXPECT_EQ(compose_path("/", "/"), "/");
    EXPECT_EQ(compose_path("", ""), "/");
}

TEST(PathTest, ComposeKeepsInnerSegments) {
    EXPECT_EQ(compose_path("/api/v1", "/users/:id"), "/api/v1/users/:id");
    EXPECT_EQ(compose_path("/files", "*"), "/files/*");
}

TEST(PathTest, ComposeIsAssociative) {
    const char *samples[] = {"", "/", "/a", "b/", "/c/d/", "//e"};
    for (const char *a : samples) {
        for (const char *b : samples) {
            for (const char *c : samples) {
                EXPECT_EQ(compose_path(compose_path(a, b), c), compose_path(a, compose_path(b, c)))
                    << "a='" << a << "' b='" << b << "' c='" << c << "'";
            }
        }
    }
}

TEST(PathTest, ComposeWithEmptyChildIsIdempotent) {
    const auto once = compose_path("/api/", "");
    EXPECT_EQ(once, "/api");
    EXPECT_EQ(compose_path(once, ""), once);
}

TEST(PathTest, RoutePatternFoldsCaseUnlessSensitive) {
    EXPECT_EQ(route_pattern("/Users/Profile", false, false), "/users/profile");
    EXPECT_EQ(route_pattern("/Users/Profile", true, false), "/Users/Profile");
}

TEST(PathTest, RoutePatternTrimsTrailingSlashUnlessStrict) {
    EXPECT_EQ(route_pattern("/users/", false, false), "/users");
    EXPECT_EQ(route_pattern("/users/", false, true), "/users/");
    EXPECT_EQ(route_pattern("/", false, false), "/");
}

TEST(PathTest, RoutePatternAddsLeadingSlash) {
    EXPECT_EQ(route_pattern("users", false, false), "/users");
    EXPECT_EQ(route_pattern("", false, false), "/");
}

int
main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
