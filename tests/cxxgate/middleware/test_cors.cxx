#include <gtest/gtest.h>

#include "../mock_client.hxx"

using namespace cxxgate;
using namespace cxxgate::http;
using namespace cxxgate::middleware;

namespace {
    domains::c_domain_registry make_registry() {
        return domains::c_domain_registry(
            {"http://localhost:3000"},
            {"https://*.example.com"},

            {{"development-key-1", "App 1"}}
        );
    }

    response_t run(cors::c_cors_middleware& middleware, const request_t& request, bool* reached = nullptr) {
        return tests::run_awaitable([&]() -> boost::asio::awaitable<response_t> {
            co_return co_await middleware.handle(request, [reached](const request_t&) -> boost::asio::awaitable<response_t> {
                if (reached)
                    *reached = true;

                co_return json_response_t(json_t::json_obj_t{{"ok", true}});
            });
        });
    }
}

TEST(CorsTest, ConfiguredOriginIsEchoed) {
    auto registry = make_registry();

    cors::c_cors_middleware middleware(registry);

    auto response = run(middleware, tests::make_request(e_method::get, "/health", {{"Origin", "http://localhost:3000"}}));

    EXPECT_EQ(response.status(), e_status::ok);
    EXPECT_EQ(response.headers().at("Access-Control-Allow-Origin"), "http://localhost:3000");
    EXPECT_EQ(response.headers().at("Access-Control-Allow-Credentials"), "true");
    EXPECT_EQ(response.headers().at("Vary"), "Origin");
}

TEST(CorsTest, PatternAndRegisteredOriginsAreAllowed) {
    auto registry = make_registry();

    cors::c_cors_middleware middleware(registry);

    auto by_pattern = run(middleware, tests::make_request(e_method::get, "/health", {{"Origin", "https://app.example.com"}}));

    EXPECT_EQ(by_pattern.status(), e_status::ok);

    ASSERT_TRUE(registry.register_domain("https://partner.io", "development-key-1"));

    auto registered = run(middleware, tests::make_request(e_method::get, "/health", {{"Origin", "https://partner.io"}}));

    EXPECT_EQ(registered.status(), e_status::ok);
    EXPECT_EQ(registered.headers().at("Access-Control-Allow-Origin"), "https://partner.io");
}

TEST(CorsTest, UnknownOriginIsRejected) {
    auto registry = make_registry();

    cors::c_cors_middleware middleware(registry);

    bool reached{false};

    auto response = run(middleware, tests::make_request(e_method::get, "/health", {{"Origin", "https://evil.io"}}), &reached);

    const auto body = tests::body_of(response);

    EXPECT_FALSE(reached);
    EXPECT_EQ(response.status(), e_status::forbidden);
    EXPECT_EQ(body.at("error"), "CORS Error");
    EXPECT_EQ(body.at("message"), "CORS policy violation: Origin https://evil.io not allowed");
    EXPECT_EQ(body.at("origin"), "https://evil.io");
}

TEST(CorsTest, MissingOriginPassesWithoutCorsHeaders) {
    auto registry = make_registry();

    cors::c_cors_middleware middleware(registry);

    bool reached{false};

    auto response = run(middleware, tests::make_request(e_method::get, "/health"), &reached);

    EXPECT_TRUE(reached);
    EXPECT_FALSE(response.headers().contains("Access-Control-Allow-Origin"));
}

TEST(CorsTest, PreflightIsAnsweredDirectly) {
    auto registry = make_registry();

    cors::c_cors_middleware middleware(registry);

    bool reached{false};

    auto response = run(middleware, tests::make_request(e_method::options, "/api/users", {{"Origin", "http://localhost:3000"}}), &reached);

    EXPECT_FALSE(reached);
    EXPECT_EQ(response.status(), e_status::ok);
    EXPECT_EQ(response.headers().at("Access-Control-Allow-Methods"), "GET, POST, PUT, DELETE, OPTIONS");
    EXPECT_EQ(response.headers().at("Access-Control-Allow-Headers"), "Content-Type, Authorization, X-API-Key, X-Client-Domain");
    EXPECT_EQ(response.headers().at("Access-Control-Max-Age"), "86400");
}

TEST(CorsTest, PreflightEchoesRequestedHeadersWhenUnconfigured) {
    auto registry = make_registry();

    cors::cors_options_t options{};

    options.m_allowed_headers.clear();
    options.m_exposed_headers = {"X-Gateway-Request-ID"};

    cors::c_cors_middleware middleware(registry, options);

    auto response = run(
        middleware,

        tests::make_request(e_method::options, "/api/users", {{"Origin", "http://localhost:3000"}, {"Access-Control-Request-Headers", "X-Custom-Trace"}})
    );

    EXPECT_EQ(response.headers().at("Access-Control-Allow-Headers"), "X-Custom-Trace");
    EXPECT_EQ(response.headers().at("Access-Control-Expose-Headers"), "X-Gateway-Request-ID");
}
