#include <gtest/gtest.h>

#include "../mock_client.hxx"

using namespace cxxgate;
using namespace cxxgate::http;
using namespace cxxgate::middleware;

namespace {
    struct auth_run_t {
        response_t m_response{};

        std::optional<request_t> m_forwarded{};
    };

    auth_run_t run(auth::c_auth_middleware& middleware, const request_t& request) {
        auth_run_t out{};

        out.m_response = tests::run_awaitable([&]() -> boost::asio::awaitable<response_t> {
            co_return co_await middleware.handle(request, [&out](const request_t& forwarded) -> boost::asio::awaitable<response_t> {
                out.m_forwarded = forwarded;

                co_return json_response_t(json_t::json_obj_t{{"ok", true}});
            });
        });

        return out;
    }

    domains::c_domain_registry make_registry() {
        return domains::c_domain_registry(
            {"http://localhost:3000"},
            {"http://localhost:*"},

            {{"development-key-1", "App 1"}, {"development-key-2", "App 2"}}
        );
    }
}

TEST(AuthTest, PublicPathsSkipAuthentication) {
    EXPECT_TRUE(auth::c_auth_middleware::is_public_path("/health"));
    EXPECT_TRUE(auth::c_auth_middleware::is_public_path("/gateway/info"));
    EXPECT_FALSE(auth::c_auth_middleware::is_public_path("/api/users"));
    EXPECT_FALSE(auth::c_auth_middleware::is_public_path("/healthz"));

    auto registry = make_registry();

    auth::c_auth_middleware middleware(registry);

    auto result = run(middleware, tests::make_request(e_method::get, "/gateway/stats", {{"Origin", "https://unknown.io"}}));

    EXPECT_EQ(result.m_response.status(), e_status::ok);
    ASSERT_TRUE(result.m_forwarded.has_value());
    EXPECT_FALSE(result.m_forwarded->auth().has_value());
}

TEST(AuthTest, TrustedOriginNeedsNoKey) {
    auto registry = make_registry();

    auth::c_auth_middleware middleware(registry);

    auto configured = run(middleware, tests::make_request(e_method::get, "/api/users", {{"Origin", "http://localhost:3000"}}));
    auto by_pattern = run(middleware, tests::make_request(e_method::get, "/api/users", {{"Origin", "http://localhost:5173"}}));

    EXPECT_EQ(configured.m_response.status(), e_status::ok);
    EXPECT_EQ(by_pattern.m_response.status(), e_status::ok);
}

TEST(AuthTest, MissingKeyIsRejected) {
    auto registry = make_registry();

    auth::c_auth_middleware middleware(registry);

    auto result = run(middleware, tests::make_request(e_method::get, "/api/users", {{"Origin", "https://partner.io"}}));

    const auto body = tests::body_of(result.m_response);

    EXPECT_FALSE(result.m_forwarded.has_value());
    EXPECT_EQ(result.m_response.status(), e_status::unauthorized);
    EXPECT_EQ(body.at("error"), "Authentication Required");
    EXPECT_EQ(body.at("origin"), "https://partner.io");
}

TEST(AuthTest, InvalidKeyIsRejected) {
    auto registry = make_registry();

    auth::c_auth_middleware middleware(registry);

    auto result = run(middleware, tests::make_request(e_method::get, "/api/users", {{"X-API-Key", "stolen-key"}}));

    const auto body = tests::body_of(result.m_response);

    EXPECT_EQ(result.m_response.status(), e_status::unauthorized);
    EXPECT_EQ(body.at("error"), "Invalid API Key");
    EXPECT_EQ(body.at("origin"), "unknown");
}

TEST(AuthTest, ValidKeyAttachesAuthAndRegistersOrigin) {
    auto registry = make_registry();

    auth::c_auth_middleware middleware(registry);

    auto result = run(
        middleware,

        tests::make_request(
            e_method::post, "/api/tickets",

            {{"Origin", "https://partner.io"}, {"X-API-Key", "development-key-2"}, {"X-Client-Domain", "partner.io"}, {"User-Agent", "sdk-test"}}
        )
    );

    ASSERT_TRUE(result.m_forwarded.has_value());
    ASSERT_TRUE(result.m_forwarded->auth().has_value());

    const auto& info = *result.m_forwarded->auth();

    EXPECT_EQ(info.m_api_key, "development-key-2");
    EXPECT_EQ(info.m_origin, "https://partner.io");
    EXPECT_EQ(info.m_client_domain, "partner.io");
    EXPECT_EQ(info.m_app_name, "App 2");

    EXPECT_TRUE(registry.is_registered("https://partner.io"));

    const auto domains = registry.registered_domains();
    const auto& metadata = domains.at("https://partner.io").at("metadata");

    EXPECT_EQ(metadata.at("userAgent"), "sdk-test");
    EXPECT_EQ(metadata.at("clientDomain"), "partner.io");
    EXPECT_TRUE(metadata.contains("firstSeen"));
}

TEST(AuthTest, ValidKeyWithoutOriginDoesNotRegister) {
    auto registry = make_registry();

    auth::c_auth_middleware middleware(registry);

    auto result = run(middleware, tests::make_request(e_method::get, "/api/users", {{"X-API-Key", "development-key-1"}}));

    EXPECT_EQ(result.m_response.status(), e_status::ok);
    EXPECT_TRUE(registry.registered_domains().empty());
}
