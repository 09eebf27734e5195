#include <gtest/gtest.h>

#include "../mock_client.hxx"

using namespace cxxgate::http;

TEST(HttpTest, MethodConversion) {
    EXPECT_EQ(str_to_method("GET"), e_method::get);
    EXPECT_EQ(str_to_method("DELETE"), e_method::delete_);
    EXPECT_EQ(str_to_method("OPTIONS"), e_method::options);
    EXPECT_EQ(str_to_method("get"), e_method::unknown);
    EXPECT_EQ(str_to_method("FETCH"), e_method::unknown);

    EXPECT_EQ(method_to_str(e_method::patch), "PATCH");
    EXPECT_EQ(method_to_str(e_method::unknown), "UNKNOWN");
}

TEST(HttpTest, IsoTimestamp) {
    const auto tp = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123));

    EXPECT_EQ(iso_timestamp(tp), "2023-11-14T22:13:20.123Z");
}

TEST(HttpTest, Base36) {
    EXPECT_EQ(utils::to_base36(0u), "0");
    EXPECT_EQ(utils::to_base36(35u), "z");
    EXPECT_EQ(utils::to_base36(36u), "10");
}

TEST(HttpTest, RequestPathAndQuery) {
    auto request = cxxgate::tests::make_request(e_method::get, "/api/users?page=2&limit=10&page=3");

    EXPECT_EQ(request.path(), "/api/users");
    EXPECT_EQ(request.raw_query(), "page=2&limit=10&page=3");

    const auto query = request.query();

    EXPECT_EQ(query.at("page"), "2");
    EXPECT_EQ(query.at("limit"), "10");
}

TEST(HttpTest, RequestPathWithoutQuery) {
    auto request = cxxgate::tests::make_request(e_method::get, "/health");

    EXPECT_EQ(request.path(), "/health");
    EXPECT_TRUE(request.raw_query().empty());
    EXPECT_TRUE(request.query().empty());
}

TEST(HttpTest, RequestHeadersAreCaseInsensitive) {
    auto request = cxxgate::tests::make_request(e_method::get, "/", {{"X-API-Key", "development-key-1"}});

    EXPECT_EQ(request.header("x-api-key"), "development-key-1");
    EXPECT_FALSE(request.header("Origin").has_value());
}

TEST(HttpTest, RequestKeepAlive) {
    EXPECT_TRUE(cxxgate::tests::make_request(e_method::get, "/").keep_alive());
    EXPECT_TRUE(cxxgate::tests::make_request(e_method::get, "/", {{"Connection", "Keep-Alive"}}).keep_alive());
    EXPECT_FALSE(cxxgate::tests::make_request(e_method::get, "/", {{"Connection", "close"}}).keep_alive());
}

TEST(HttpTest, PlainResponse) {
    response_t response("Not Found", e_status::not_found, {{"X-Test", "1"}});

    EXPECT_EQ(response.body(), "Not Found");
    EXPECT_EQ(response.status(), e_status::not_found);
    EXPECT_EQ(response.headers().at("content-type"), "text/plain");
    EXPECT_EQ(response.headers().at("X-Test"), "1");
}

TEST(HttpTest, JsonResponseKeepsExplicitContentType) {
    json_response_t response(json_t::json_obj_t{{"success", true}}, e_status::created, {{"Content-Type", "application/vnd.api+json"}});

    EXPECT_EQ(response.status(), e_status::created);
    EXPECT_EQ(response.headers().at("Content-Type"), "application/vnd.api+json");
    EXPECT_TRUE(cxxgate::tests::body_of(response).at("success").get<bool>());
}

TEST(HttpTest, ErrorResponse) {
    auto response = error_response("Internal Server Error", "An unexpected error occurred", e_status::internal_server_error);

    const auto body = cxxgate::tests::body_of(response);

    EXPECT_EQ(response.status(), e_status::internal_server_error);
    EXPECT_EQ(body.at("error"), "Internal Server Error");
    EXPECT_EQ(body.at("message"), "An unexpected error occurred");
    EXPECT_TRUE(body.contains("timestamp"));
}

TEST(HttpTest, ResponseClassFactory) {
    auto plain = response_class_t<response_t>::make_response(std::string("ok"));
    auto json = response_class_t<json_response_t>::make_response(json_t::json_obj_t{{"ok", true}}, e_status::accepted);

    EXPECT_EQ(plain.headers().at("Content-Type"), "text/plain");
    EXPECT_EQ(json.headers().at("Content-Type"), "application/json");
    EXPECT_EQ(json.status(), e_status::accepted);
}
