#include <gtest/gtest.h>

#include "../mock_client.hxx"

using namespace cxxgate::http;

TEST(HttpCtxTest, ParamsAndRequestAccess) {
    http_ctx_t ctx(cxxgate::tests::make_request(e_method::get, "/users/42"), params_t{{"id", "42"}});

    EXPECT_EQ(ctx.params()["id"], "42");
    EXPECT_EQ(ctx.request().path(), "/users/42");
    EXPECT_EQ(ctx.request().client().remote_addr(), "10.0.0.7");
}

TEST(HttpCtxTest, JsonBodyIsParsedOnce) {
    http_ctx_t ctx(
        cxxgate::tests::make_request(e_method::post, "/gateway/invoke-template", {}, R"({"templateName":"getTest"})"),

        params_t{}
    );

    const auto& first = ctx.json();

    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->at("templateName"), "getTest");

    ctx.request().body() = "changed";

    EXPECT_TRUE(ctx.json().has_value());
}

TEST(HttpCtxTest, EmptyOrMalformedBody) {
    http_ctx_t empty(cxxgate::tests::make_request(e_method::post, "/"), params_t{});
    http_ctx_t malformed(cxxgate::tests::make_request(e_method::post, "/", {}, "{oops"), params_t{});

    EXPECT_FALSE(empty.json().has_value());
    EXPECT_FALSE(malformed.json().has_value());
}
