#include <gtest/gtest.h>
#include "../route.h"

using namespace qb::route;

class GroupTest : public ::testing::Test {
protected:
    std::shared_ptr<Application> app;
    Handler noop = [](Context &) {};

    void
    SetUp() override {
        app = Application::create();
    }

    std::vector<Route>
    routes_at(const std::string &path) const {
        std::vector<Route> result;
        for (auto &route : app->routes()) {
            if (route.path == path)
                result.push_back(route);
        }
        return result;
    }
};

TEST_F(GroupTest, RootGroup) {
    auto &root = app->root();
    EXPECT_EQ(root.prefix(), "/");
    EXPECT_EQ(root.parent(), nullptr);
    EXPECT_TRUE(root.name().empty());
    EXPECT_FALSE(root.any_route_defined());
    EXPECT_EQ(&root.app(), app.get());
}

TEST_F(GroupTest, PrefixesCompose) {
    auto &api = app->group("/api/");
    auto &v1 = api.group("v1");
    auto &users = v1.group("//users//");

    EXPECT_EQ(api.prefix(), "/api");
    EXPECT_EQ(v1.prefix(), "/api/v1");
    EXPECT_EQ(users.prefix(), "/api/v1/users");
    EXPECT_EQ(users.parent(), &v1);
    EXPECT_EQ(v1.parent(), &api);
    EXPECT_EQ(api.parent(), &app->root());
}

TEST_F(GroupTest, VerbsRegisterUnderThePrefix) {
    auto &api = app->group("/api");
    api.get("/users", noop)
       .head("/users", noop)
       .post("/users", noop)
       .put("/users/:id", noop)
       .del("/users/:id", noop)
       .connect("/tunnel", noop)
       .options("/users", noop)
       .trace("/trace", noop)
       .patch("/users/:id", noop);

    auto routes = app->routes();
    ASSERT_EQ(routes.size(), 9u);
    const std::vector<std::string> methods = {"GET", "HEAD", "POST", "PUT", "DELETE",
                                              "CONNECT", "OPTIONS", "TRACE", "PATCH"};
    for (std::size_t i = 0; i < routes.size(); ++i) {
        EXPECT_EQ(routes[i].method, methods[i]);
        EXPECT_EQ(routes[i].group, &api);
        EXPECT_EQ(routes[i].position, i);
        EXPECT_FALSE(routes[i].use);
    }
    EXPECT_EQ(routes[0].path, "/api/users");
    EXPECT_EQ(routes[3].path, "/api/users/:id");
    EXPECT_EQ(routes[3].params, (std::vector<std::string>{"id"}));
}

TEST_F(GroupTest, EmptyPathIsTheGroupPrefix) {
    auto &api = app->group("/api");
    api.get("", noop);
    api.get("/", noop);
    EXPECT_EQ(routes_at("/api").size(), 2u);
}

TEST_F(GroupTest, AnyRouteDefinedOnlyOnTheCalledGroup) {
    auto &api = app->group("/api");
    auto &v1 = api.group("/v1");
    EXPECT_FALSE(api.any_route_defined());
    EXPECT_FALSE(v1.any_route_defined());

    v1.get("/ping", noop);
    EXPECT_TRUE(v1.any_route_defined());
    EXPECT_FALSE(api.any_route_defined());
    EXPECT_FALSE(app->root().any_route_defined());
}

TEST_F(GroupTest, AnyRouteDefinedIsMonotonic) {
    auto &api = app->group("/api");
    api.use(noop);
    EXPECT_TRUE(api.any_route_defined());
    (void) api.group("/v2");
    api.name("ignored");
    EXPECT_TRUE(api.any_route_defined());
}

TEST_F(GroupTest, FailedRegistrationDoesNotMarkTheGroup) {
    auto &api = app->group("/api");
    EXPECT_THROW(api.add({"BREW"}, "/coffee", noop), SetupError);
    EXPECT_FALSE(api.any_route_defined());
}

TEST_F(GroupTest, AddWithSeveralMethods) {
    auto &api = app->group("/api");
    api.add({"get", "Post"}, "/items", noop);

    auto routes = routes_at("/api/items");
    ASSERT_EQ(routes.size(), 2u);
    EXPECT_EQ(routes[0].method, "GET");
    EXPECT_EQ(routes[1].method, "POST");
}

TEST_F(GroupTest, AllReadsTheMethodListAtCallTime) {
    auto &api = app->group("/api");
    api.all("/any", noop);
    EXPECT_EQ(routes_at("/api/any").size(), default_request_methods().size());

    app->config().request_methods({"GET", "POST"});
    api.all("/few", noop);
    EXPECT_EQ(routes_at("/api/few").size(), 2u);
}

TEST_F(GroupTest, MiddlewareRunsBeforeTheHandler) {
    std::vector<int> order;
    auto &api = app->group("/api");
    api.get("/ordered",
            [&](Context &) { order.push_back(3); },
            {[&](Context &) { order.push_back(1); }, [&](Context &) { order.push_back(2); }});

    auto routes = routes_at("/api/ordered");
    ASSERT_EQ(routes.size(), 1u);
    ASSERT_EQ(routes[0].handlers.size(), 3u);
    Context ctx("GET", "/api/ordered");
    for (auto &handler : routes[0].handlers)
        handler(ctx);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST_F(GroupTest, GroupMiddlewareIsOwnedByTheParent) {
    auto &api = app->group("/api");
    auto &admin = api.group("/admin", {noop});

    auto routes = routes_at("/api/admin");
    ASSERT_EQ(routes.size(), default_request_methods().size());
    for (auto &route : routes) {
        EXPECT_TRUE(route.use);
        EXPECT_EQ(route.group, &api);
    }
    EXPECT_FALSE(api.any_route_defined());
    EXPECT_FALSE(admin.any_route_defined());
}

TEST_F(GroupTest, StaticFiles) {
    auto &assets = app->group("/assets");
    assets.static_files("/", "./public", StaticOptions().with_browse(true));

    auto statics = app->statics();
    ASSERT_EQ(statics.size(), 1u);
    EXPECT_EQ(statics[0].path, "/assets");
    EXPECT_EQ(statics[0].root, "./public");
    EXPECT_TRUE(statics[0].options.browse);

    auto routes = routes_at("/assets");
    ASSERT_EQ(routes.size(), 2u);
    EXPECT_EQ(routes[0].method, "HEAD");
    EXPECT_EQ(routes[1].method, "GET");
    EXPECT_TRUE(routes[0].is_static);
    EXPECT_TRUE(routes[1].is_static);
    EXPECT_TRUE(assets.any_route_defined());
    EXPECT_EQ(app->handlers_count(), 1u);
}

TEST_F(GroupTest, StaticFilesRequireARoot) {
    auto &assets = app->group("/assets");
    try {
        assets.static_files("/", "");
        FAIL() << "expected a SetupError";
    } catch (const SetupError &error) {
        EXPECT_EQ(error.kind(), SetupError::Kind::INVALID_STATIC_ROOT);
    }
    EXPECT_TRUE(app->statics().empty());
    EXPECT_FALSE(assets.any_route_defined());
}

int
main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
