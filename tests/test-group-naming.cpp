#include <gtest/gtest.h>
#include "../route.h"

using namespace qb::route;

class GroupNamingTest : public ::testing::Test {
protected:
    std::shared_ptr<Application> app;
    Handler noop = [](Context &) {};

    void
    SetUp() override {
        app = Application::create();
    }

    std::vector<std::string>
    names_at(const std::string &path) const {
        std::vector<std::string> names;
        for (auto &route : app->routes()) {
            if (route.path == path)
                names.push_back(route.method + "=" + route.name);
        }
        return names;
    }
};

TEST_F(GroupNamingTest, UnusedGroupNamesItself) {
    auto &users = app->group("/users").name("user.");
    EXPECT_EQ(users.name(), "user.");
    EXPECT_FALSE(users.any_route_defined());
    EXPECT_TRUE(app->routes().empty());
}

TEST_F(GroupNamingTest, NamingTwiceReplacesTheName) {
    auto &users = app->group("/users");
    users.name("a.");
    users.name("b.");
    EXPECT_EQ(users.name(), "b.");
}

TEST_F(GroupNamingTest, ChildNameExtendsTheParentName) {
    auto &api = app->group("/api").name("api.");
    auto &v1 = api.group("/v1").name("v1.");
    auto &users = v1.group("/users").name("users.");
    EXPECT_EQ(v1.name(), "api.v1.");
    EXPECT_EQ(users.name(), "api.v1.users.");
}

TEST_F(GroupNamingTest, ChildSelfNameBeforeAnyRoute) {
    auto &user = app->group("/user").name("user.");
    auto &list = user.group("/list").name("list");
    EXPECT_EQ(list.name(), "user.list");

    list.get("/", noop);
    list.name("all");
    EXPECT_EQ(list.name(), "user.list");
    EXPECT_EQ(app->latest_route()->name, "user.listall");
}

TEST_F(GroupNamingTest, NoSeparatorIsInserted) {
    auto &api = app->group("/api").name("api");
    auto &v1 = api.group("/v1").name("v1");
    EXPECT_EQ(v1.name(), "apiv1");
}

TEST_F(GroupNamingTest, UnnamedParentContributesNothing) {
    auto &api = app->group("/api");
    auto &v1 = api.group("/v1").name("v1.");
    EXPECT_EQ(v1.name(), "v1.");
}

TEST_F(GroupNamingTest, ChildNameUsesTheParentNameAtNamingTime) {
    auto &api = app->group("/api");
    auto &early = api.group("/early").name("early.");
    api.name("api.");
    auto &late = api.group("/late").name("late.");
    EXPECT_EQ(early.name(), "early.");
    EXPECT_EQ(late.name(), "api.late.");
}

TEST_F(GroupNamingTest, RouteNameIsPrefixedWithTheGroupName) {
    auto &users = app->group("/users").name("user.");
    users.get("/list", noop).name("list");

    auto route = app->route_by_name("user.list");
    ASSERT_TRUE(route.has_value());
    EXPECT_EQ(route->path, "/users/list");
    EXPECT_EQ(route->method, "GET");
    EXPECT_EQ(users.name(), "user.");
}

TEST_F(GroupNamingTest, AfterARouteTheGroupNamesTheLatestRoute) {
    auto &users = app->group("/users").name("user.");
    users.post("/", noop);
    users.name("create");

    EXPECT_EQ(users.name(), "user.");
    EXPECT_EQ(names_at("/users"), (std::vector<std::string>{"POST=user.create"}));
}

TEST_F(GroupNamingTest, NestedGroupRoutes) {
    auto &api = app->group("/api").name("api.");
    auto &v1 = api.group("/v1").name("v1.");
    v1.get("/users/:id", noop).name("user.show");

    auto route = app->route_by_name("api.v1.user.show");
    ASSERT_TRUE(route.has_value());
    EXPECT_EQ(route->path, "/api/v1/users/:id");
    EXPECT_EQ(route->group, &v1);
}

TEST_F(GroupNamingTest, GetNameCoversHead) {
    app->head("/page", noop);
    app->post("/page", noop);
    app->get("/page", noop).name("page");

    EXPECT_EQ(names_at("/page"), (std::vector<std::string>{"HEAD=page", "POST=", "GET=page"}));
}

TEST_F(GroupNamingTest, HeadNameDoesNotCoverGet) {
    app->get("/page", noop);
    app->head("/page", noop).name("page.head");
    EXPECT_EQ(names_at("/page"), (std::vector<std::string>{"GET=", "HEAD=page.head"}));
}

TEST_F(GroupNamingTest, MiddlewareNameCoversEveryMethod) {
    app->get("/mw", noop);
    app->use("/mw", noop);
    app->name("mw");

    for (auto &entry : names_at("/mw"))
        EXPECT_EQ(entry.substr(entry.find('=') + 1), "mw") << entry;
}

TEST_F(GroupNamingTest, NameGoesToTheApplicationLatestRoute) {
    auto &a = app->group("/a").name("a.");
    auto &b = app->group("/b").name("b.");
    a.get("/x", noop);
    b.get("/y", noop);
    a.name("late");

    EXPECT_EQ(names_at("/a/x"), (std::vector<std::string>{"GET="}));
    EXPECT_EQ(names_at("/b/y"), (std::vector<std::string>{"GET=b.late"}));
}

TEST_F(GroupNamingTest, NothingToName) {
    try {
        app->name("orphan");
        FAIL() << "expected a SetupError";
    } catch (const SetupError &error) {
        EXPECT_EQ(error.kind(), SetupError::Kind::NO_ROUTE_TO_NAME);
    }
}

TEST_F(GroupNamingTest, HookRejectionKeepsTheName) {
    app->hooks().on_group_name([](const GroupSnapshot &grp) -> HookStatus {
        if (grp.name.back() != '.')
            return "group names must end with '.'";
        return std::nullopt;
    });

    auto &users = app->group("/users");
    try {
        users.name("user");
        FAIL() << "expected a SetupError";
    } catch (const SetupError &error) {
        EXPECT_EQ(error.kind(), SetupError::Kind::HOOK_FAILED);
        EXPECT_STREQ(error.what(), "OnGroupName hook failed: group names must end with '.'");
    }
    EXPECT_EQ(users.name(), "user");
    EXPECT_FALSE(users.any_route_defined());

    users.name("user.");
    EXPECT_EQ(users.name(), "user.");
}

TEST_F(GroupNamingTest, HookSeesTheParentName) {
    GroupSnapshot seen;
    app->hooks().on_group_name([&](const GroupSnapshot &grp) -> HookStatus {
        seen = grp;
        return std::nullopt;
    });

    auto &api = app->group("/api").name("api.");
    (void) api.group("/v1").name("v1.");
    EXPECT_EQ(seen.prefix, "/api/v1");
    EXPECT_EQ(seen.name, "api.v1.");
    EXPECT_TRUE(seen.has_parent);
    EXPECT_EQ(seen.parent_name, "api.");
}

int
main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
