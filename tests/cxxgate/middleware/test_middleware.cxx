#include <gtest/gtest.h>

#include "../mock_client.hxx"

using namespace cxxgate;
using namespace cxxgate::middleware;
using namespace cxxgate::http;

namespace {
    class header_middleware : public c_base_middleware {
      public:
        header_middleware(std::string header, std::string value, std::vector<std::string>& trace)
            : m_header(std::move(header)), m_value(std::move(value)), m_trace(trace) {}

        boost::asio::awaitable<response_t> handle(const request_t& request, next_t next) override {
            m_trace.push_back(m_value);

            auto response = co_await next(request);

            response.headers()[m_header] = m_value;

            co_return response;
        }

      private:
        std::string m_header;
        std::string m_value;

        std::vector<std::string>& m_trace;
    };

    class terminating_middleware : public c_base_middleware {
      public:
        explicit terminating_middleware(response_t response)
            : m_response(std::move(response)) {}

        boost::asio::awaitable<response_t> handle(const request_t&, next_t) override {
            co_return m_response;
        }

      private:
        response_t m_response;
    };

    class throwing_middleware : public c_base_middleware {
      public:
        boost::asio::awaitable<response_t> handle(const request_t&, next_t) override {
            throw std::runtime_error("boom");

            co_return response_t{};
        }
    };
}

TEST(MiddlewareTest, RunsInRegistrationOrder) {
    std::vector<std::string> trace{};

    c_cxxgate app{};

    app.add_middleware(std::make_shared<header_middleware>("X-First", "first", trace));
    app.add_middleware(std::make_shared<header_middleware>("X-Second", "second", trace));

    app.add_method(e_method::get, "/health", [](http_ctx_t&&) -> response_t {
        return response_t("healthy", e_status::ok);
    });

    app.build();

    auto response = tests::run_awaitable([&]() -> boost::asio::awaitable<response_t> {
        co_return co_await app._handle_request(tests::make_request(e_method::get, "/health"));
    });

    ASSERT_EQ(trace.size(), 2u);
    EXPECT_EQ(trace[0], "first");
    EXPECT_EQ(trace[1], "second");

    EXPECT_EQ(response.body(), "healthy");
    EXPECT_EQ(response.headers().at("X-First"), "first");
    EXPECT_EQ(response.headers().at("X-Second"), "second");
}

TEST(MiddlewareTest, ChainIsReusableAcrossRequests) {
    std::vector<std::string> trace{};

    c_cxxgate app{};

    app.add_middleware(std::make_shared<header_middleware>("X-Seen", "yes", trace));

    app.add_method(e_method::get, "/health", [](http_ctx_t&&) -> response_t {
        return response_t("healthy", e_status::ok);
    });

    app.build();

    for (int i = 0; i < 3; ++i) {
        auto response = tests::run_awaitable([&]() -> boost::asio::awaitable<response_t> {
            co_return co_await app._handle_request(tests::make_request(e_method::get, "/health"));
        });

        EXPECT_EQ(response.status(), e_status::ok);
        EXPECT_EQ(response.headers().at("X-Seen"), "yes");
    }

    EXPECT_EQ(trace.size(), 3u);
}

TEST(MiddlewareTest, TerminatingMiddlewareShortCircuits) {
    c_cxxgate app{};

    bool reached{false};

    app.add_middleware(std::make_shared<terminating_middleware>(response_t("denied", e_status::forbidden)));

    app.add_method(e_method::get, "/health", [&reached](http_ctx_t&&) -> response_t {
        reached = true;

        return response_t("healthy", e_status::ok);
    });

    app.build();

    auto response = tests::run_awaitable([&]() -> boost::asio::awaitable<response_t> {
        co_return co_await app._handle_request(tests::make_request(e_method::get, "/health"));
    });

    EXPECT_FALSE(reached);
    EXPECT_EQ(response.status(), e_status::forbidden);
    EXPECT_EQ(response.body(), "denied");
}

TEST(MiddlewareTest, ExceptionBecomesInternalError) {
    c_cxxgate app{};

    app.add_middleware(std::make_shared<throwing_middleware>());

    app.build();

    auto response = tests::run_awaitable([&]() -> boost::asio::awaitable<response_t> {
        co_return co_await app._handle_request(tests::make_request(e_method::get, "/health"));
    });

    EXPECT_EQ(response.status(), e_status::internal_server_error);
    EXPECT_EQ(tests::body_of(response).at("error"), "Internal Server Error");
}

TEST(MiddlewareTest, NotFoundHandlerAndDefault) {
    c_cxxgate app{};

    app.build();

    auto fallback = tests::run_awaitable([&]() -> boost::asio::awaitable<response_t> {
        co_return co_await app._handle_request(tests::make_request(e_method::get, "/missing"));
    });

    EXPECT_EQ(fallback.status(), e_status::not_found);
    EXPECT_EQ(tests::body_of(fallback).at("message"), "Not found");

    app.set_not_found_handler([](const request_t& request) {
        return response_t(fmt::format("no route for {}", request.path()), e_status::not_found);
    });

    auto custom = tests::run_awaitable([&]() -> boost::asio::awaitable<response_t> {
        co_return co_await app._handle_request(tests::make_request(e_method::get, "/missing?x=1"));
    });

    EXPECT_EQ(custom.body(), "no route for /missing");
}

TEST(MiddlewareTest, RouteParamsReachHandler) {
    c_cxxgate app{};

    app.add_method(e_method::get, "/users/{id}", [](http_ctx_t&& ctx) -> boost::asio::awaitable<response_t> {
        co_return response_t(std::string(ctx.params()["id"]), e_status::ok);
    });

    app.build();

    auto response = tests::run_awaitable([&]() -> boost::asio::awaitable<response_t> {
        co_return co_await app._handle_request(tests::make_request(e_method::get, "/users/42?verbose=1"));
    });

    EXPECT_EQ(response.body(), "42");
}

TEST(MiddlewareTest, UnbuiltChainThrows) {
    c_cxxgate app{};

    EXPECT_THROW(
        tests::run_awaitable([&]() -> boost::asio::awaitable<response_t> {
            co_return co_await app._handle_request(tests::make_request(e_method::get, "/health"));
        }),

        base_exception_t
    );
}
