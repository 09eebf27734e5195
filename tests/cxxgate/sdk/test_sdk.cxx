#include <gtest/gtest.h>

#include "../mock_client.hxx"

using namespace cxxgate;
using namespace cxxgate::sdk;

namespace {
    class recording_observer : public c_base_observer {
      public:
        void on_request(const request_event_t& event) override { m_requests.push_back(event); }

        void on_response(const response_event_t& event) override { m_responses.push_back(event); }

        void on_error(const error_event_t& event) override { m_errors.push_back(event); }

      public:
        std::vector<request_event_t> m_requests{};

        std::vector<response_event_t> m_responses{};

        std::vector<error_event_t> m_errors{};
    };

    class throwing_observer : public c_base_observer {
      public:
        void on_request(const request_event_t&) override { throw std::runtime_error("observer failure"); }
    };

    struct sdk_fixture_t {
        std::shared_ptr<tests::c_mock_http_client> m_client{std::make_shared<tests::c_mock_http_client>()};

        std::shared_ptr<recording_observer> m_observer{std::make_shared<recording_observer>()};

        c_gateway_client m_sdk;

        explicit sdk_fixture_t(std::optional<std::string> api_key = "development-key-1")
            : m_sdk(
                  sdk_cfg_t{
                      "http://gateway.local:9000/",
                      std::move(api_key),
                      "portal.example.com",
                      std::chrono::seconds(2),
                      retry_policy_t{3u, std::chrono::milliseconds(1), 2.0, std::chrono::milliseconds(4)}
                  },

                  m_client
              ) {
            m_sdk.add_observer(m_observer);
        }

        template <typename _fn_t>
        auto run(_fn_t&& fn) {
            return tests::run_awaitable(std::forward<_fn_t>(fn));
        }
    };
}

TEST(RetryPolicyTest, ExponentialDelayIsCapped) {
    const retry_policy_t policy{};

    EXPECT_EQ(policy.delay_for(0u), std::chrono::milliseconds(0));
    EXPECT_EQ(policy.delay_for(1u), std::chrono::milliseconds(1000));
    EXPECT_EQ(policy.delay_for(2u), std::chrono::milliseconds(2000));
    EXPECT_EQ(policy.delay_for(3u), std::chrono::milliseconds(4000));
    EXPECT_EQ(policy.delay_for(10u), std::chrono::seconds(30));
}

TEST(RetryPolicyTest, RetryableStatuses) {
    const retry_policy_t policy{};

    EXPECT_TRUE(policy.should_retry(std::nullopt));
    EXPECT_TRUE(policy.should_retry(500));
    EXPECT_TRUE(policy.should_retry(503));
    EXPECT_TRUE(policy.should_retry(408));
    EXPECT_TRUE(policy.should_retry(429));

    EXPECT_FALSE(policy.should_retry(400));
    EXPECT_FALSE(policy.should_retry(401));
    EXPECT_FALSE(policy.should_retry(404));
}

TEST(GatewayClientTest, RequestIdFormat) {
    const auto id = c_gateway_client::make_request_id();

    EXPECT_TRUE(id.starts_with("req-"));
    EXPECT_NE(id, c_gateway_client::make_request_id());
}

TEST(GatewayClientTest, InvokeTemplateSendsPayloadAndHeaders) {
    sdk_fixture_t fixture{};

    fixture.m_client->respond(200, R"({"success":true,"status":200,"data":{"message":"ok"}})");

    const auto result = fixture.run([&]() -> boost::asio::awaitable<shared::json_traits_t::json_obj_t> {
        co_return co_await fixture.m_sdk.invoke_template("getTest", {{"userId", "7"}});
    });

    EXPECT_EQ(result.at("data").at("message"), "ok");

    const auto requests = fixture.m_client->requests();

    ASSERT_EQ(requests.size(), 1u);

    const auto& sent = requests.front();

    EXPECT_EQ(sent.m_method, http::e_method::post);
    EXPECT_EQ(sent.m_url, "http://gateway.local:9000/gateway/invoke-template");
    EXPECT_EQ(sent.m_timeout, std::chrono::seconds(2));
    EXPECT_EQ(sent.m_headers.at("X-API-Key"), "development-key-1");
    EXPECT_EQ(sent.m_headers.at("X-Client-Domain"), "portal.example.com");
    EXPECT_TRUE(sent.m_headers.at("X-Request-ID").starts_with("req-"));

    const auto payload = shared::json_traits_t::deserialize(sent.m_body);

    EXPECT_EQ(payload.at("templateName"), "getTest");
    EXPECT_EQ(payload.at("context").at("userId"), "7");
    EXPECT_FALSE(payload.contains("body"));

    ASSERT_EQ(fixture.m_observer->m_requests.size(), 1u);
    ASSERT_EQ(fixture.m_observer->m_responses.size(), 1u);
    EXPECT_EQ(fixture.m_observer->m_responses.front().m_status, 200);
    EXPECT_TRUE(fixture.m_observer->m_errors.empty());
}

TEST(GatewayClientTest, RetriesTransportFailuresThenSucceeds) {
    sdk_fixture_t fixture{};

    fixture.m_client->fail("Connection refused");
    fixture.m_client->respond(502, R"({"message":"bad upstream"})");
    fixture.m_client->respond(200, R"({"status":"healthy"})");

    const auto result = fixture.run([&]() -> boost::asio::awaitable<shared::json_traits_t::json_obj_t> {
        co_return co_await fixture.m_sdk.health_check();
    });

    EXPECT_EQ(result.at("status"), "healthy");
    EXPECT_EQ(fixture.m_client->requests().size(), 3u);

    ASSERT_EQ(fixture.m_observer->m_requests.size(), 3u);
    EXPECT_EQ(fixture.m_observer->m_requests[2].m_attempt, 3u);
    EXPECT_EQ(fixture.m_observer->m_requests[0].m_request_id, fixture.m_observer->m_requests[2].m_request_id);
}

TEST(GatewayClientTest, ExhaustedRetriesThrow) {
    sdk_fixture_t fixture{};

    fixture.m_client->respond(503, R"({"message":"down"})");
    fixture.m_client->respond(503, R"({"message":"down"})");
    fixture.m_client->respond(503, R"({"message":"still down"})");

    try {
        fixture.run([&]() -> boost::asio::awaitable<shared::json_traits_t::json_obj_t> {
            co_return co_await fixture.m_sdk.gateway_stats();
        });

        FAIL() << "expected sdk_exception_t";
    }
    catch (const exceptions::sdk_exception_t& e) {
        EXPECT_EQ(e.message(), "API request failed: 503 - still down");
        EXPECT_EQ(e.status(), 503u);
    }

    ASSERT_EQ(fixture.m_observer->m_errors.size(), 1u);
    EXPECT_EQ(fixture.m_observer->m_errors.front().m_attempts, 3u);
    EXPECT_EQ(fixture.m_observer->m_errors.front().m_status, 503);
}

TEST(GatewayClientTest, ClientErrorsAreNotRetried) {
    sdk_fixture_t fixture{};

    fixture.m_client->respond(401, R"({"success":false,"error":"Invalid API Key","message":"The provided API key is not valid"})");

    EXPECT_THROW(
        fixture.run([&]() -> boost::asio::awaitable<shared::json_traits_t::json_obj_t> {
            co_return co_await fixture.m_sdk.request(http::e_method::get, "users");
        }),

        exceptions::sdk_exception_t
    );

    const auto requests = fixture.m_client->requests();

    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests.front().m_url, "http://gateway.local:9000/api/users");
}

TEST(GatewayClientTest, ReportedFailureIsNotRetried) {
    sdk_fixture_t fixture{};

    fixture.m_client->respond(200, R"({"success":false,"error":"Template \"x\" not found"})");

    EXPECT_THROW(
        fixture.run([&]() -> boost::asio::awaitable<shared::json_traits_t::json_obj_t> {
            co_return co_await fixture.m_sdk.invoke_template("x");
        }),

        exceptions::sdk_exception_t
    );

    EXPECT_EQ(fixture.m_client->requests().size(), 1u);
}

TEST(GatewayClientTest, InvalidJsonIsRetried) {
    sdk_fixture_t fixture{};

    fixture.m_client->respond(200, "<html>", {{"Content-Type", "text/html"}});
    fixture.m_client->respond(200, R"({"success":true})");

    fixture.run([&]() -> boost::asio::awaitable<shared::json_traits_t::json_obj_t> {
        co_return co_await fixture.m_sdk.gateway_info();
    });

    EXPECT_EQ(fixture.m_client->requests().size(), 2u);
}

TEST(GatewayClientTest, RequestForwardsBodyExceptForGet) {
    sdk_fixture_t fixture{};

    fixture.run([&]() -> boost::asio::awaitable<shared::json_traits_t::json_obj_t> {
        co_await fixture.m_sdk.request(http::e_method::get, "/users", shared::json_traits_t::json_obj_t{{"ignored", true}});

        co_return co_await fixture.m_sdk.request(http::e_method::put, "/users/1", shared::json_traits_t::json_obj_t{{"name", "Ada"}});
    });

    const auto requests = fixture.m_client->requests();

    ASSERT_EQ(requests.size(), 2u);
    EXPECT_TRUE(requests[0].m_body.empty());
    EXPECT_EQ(shared::json_traits_t::deserialize(requests[1].m_body).at("name"), "Ada");
}

TEST(GatewayClientTest, RegisterDomainRequiresKey) {
    sdk_fixture_t fixture{std::nullopt};

    EXPECT_THROW(
        fixture.run([&]() -> boost::asio::awaitable<shared::json_traits_t::json_obj_t> {
            co_return co_await fixture.m_sdk.register_domain();
        }),

        exceptions::sdk_exception_t
    );

    EXPECT_TRUE(fixture.m_client->requests().empty());
}

TEST(GatewayClientTest, RegisterDomainPayload) {
    sdk_fixture_t fixture{};

    fixture.m_client->respond(200, R"({"success":true,"message":"Domain registered successfully"})");

    fixture.run([&]() -> boost::asio::awaitable<shared::json_traits_t::json_obj_t> {
        co_return co_await fixture.m_sdk.register_domain({{"team", "support"}});
    });

    const auto payload = shared::json_traits_t::deserialize(fixture.m_client->requests().front().m_body);

    EXPECT_EQ(payload.at("domain"), "portal.example.com");
    EXPECT_EQ(payload.at("apiKey"), "development-key-1");
    EXPECT_EQ(payload.at("metadata").at("team"), "support");
    EXPECT_EQ(payload.at("metadata").at("sdkVersion"), "1.0.0");
    EXPECT_TRUE(payload.at("metadata").contains("timestamp"));
}

TEST(GatewayClientTest, ObserversCanBeRemovedAndFailuresAreContained) {
    sdk_fixture_t fixture{};

    fixture.m_sdk.add_observer(std::make_shared<throwing_observer>());

    EXPECT_TRUE(fixture.m_sdk.remove_observer(fixture.m_observer));
    EXPECT_FALSE(fixture.m_sdk.remove_observer(fixture.m_observer));

    EXPECT_NO_THROW(fixture.run([&]() -> boost::asio::awaitable<shared::json_traits_t::json_obj_t> {
        co_return co_await fixture.m_sdk.templates();
    }));

    EXPECT_TRUE(fixture.m_observer->m_requests.empty());
}
