#include <gtest/gtest.h>

#include <cxxgate.hxx>

using namespace cxxgate::templates;

namespace {
    json_obj_t parse(const std::string_view& text) {
        return shared::json_traits_t::deserialize(text);
    }
}

TEST(ProcessorTest, ParseSplitsLiteralsAndPlaceholders) {
    const auto segments = c_processor::parse("/users/<%= context.userId %>/posts");

    ASSERT_EQ(segments.size(), 3u);

    EXPECT_EQ(segments[0].m_kind, e_segment_kind::literal);
    EXPECT_EQ(segments[0].m_text, "/users/");

    EXPECT_EQ(segments[1].m_kind, e_segment_kind::placeholder);
    EXPECT_EQ(segments[1].m_text, "<%= context.userId %>");
    ASSERT_EQ(segments[1].m_path.size(), 2u);
    EXPECT_EQ(segments[1].m_path[0], "context");
    EXPECT_EQ(segments[1].m_path[1], "userId");

    EXPECT_EQ(segments[2].m_text, "/posts");
}

TEST(ProcessorTest, ParseTreatsUnclosedOpenerAsLiteral) {
    const auto segments = c_processor::parse("a <%= b and <%=c%>");

    ASSERT_EQ(segments.size(), 2u);
    EXPECT_EQ(segments[0].m_kind, e_segment_kind::literal);
    EXPECT_EQ(segments[0].m_text, "a <%= b and ");
    EXPECT_EQ(segments[1].m_kind, e_segment_kind::placeholder);
    EXPECT_EQ(segments[1].m_path[0], "c");
}

TEST(ProcessorTest, ParseEmptyPlaceholderIsLiteral) {
    const auto segments = c_processor::parse("x<%=%>y");

    ASSERT_EQ(segments.size(), 1u);
    EXPECT_EQ(segments[0].m_text, "x<%=%>y");
}

TEST(ProcessorTest, ResolveWalksObjectsAndArrays) {
    const auto context = parse(R"({"user": {"id": 42, "tags": ["a", "b"], "active": true, "none": null}})");

    EXPECT_EQ(c_processor::resolve({"user", "id"}, context), "42");
    EXPECT_EQ(c_processor::resolve({"user", "tags", "1"}, context), "b");
    EXPECT_EQ(c_processor::resolve({"user", "active"}, context), "true");
    EXPECT_EQ(c_processor::resolve({"user", "none"}, context), "null");

    EXPECT_FALSE(c_processor::resolve({"user", "tags", "2"}, context).has_value());
    EXPECT_FALSE(c_processor::resolve({"user", "tags", "x"}, context).has_value());
    EXPECT_FALSE(c_processor::resolve({"user", "id", "deeper"}, context).has_value());
    EXPECT_FALSE(c_processor::resolve({"missing"}, context).has_value());
}

TEST(ProcessorTest, ResolveAcceptsContextRoot) {
    const auto context = parse(R"({"userId": "u-1", "context": {"shadow": "inner"}})");

    EXPECT_EQ(c_processor::resolve({"context", "userId"}, context), "u-1");
    EXPECT_EQ(c_processor::resolve({"userId"}, context), "u-1");
    EXPECT_EQ(c_processor::resolve({"context", "shadow"}, context), "inner");
}

TEST(ProcessorTest, ResolveObjectLeafIsSerialized) {
    const auto context = parse(R"({"filter": {"a": 1}})");

    EXPECT_EQ(c_processor::resolve({"filter"}, context), R"({"a":1})");
}

TEST(ProcessorTest, RenderStringKeepsUnresolvedPlaceholders) {
    const auto context = parse(R"({"apiKey": "k-1"})");

    std::vector<std::string> unresolved{};

    const auto out = c_processor::render_string("Bearer <%= context.apiKey %> for <%=context.user%>", context, &unresolved);

    EXPECT_EQ(out, "Bearer k-1 for <%=context.user%>");

    ASSERT_EQ(unresolved.size(), 1u);
    EXPECT_EQ(unresolved[0], "<%=context.user%>");
}

TEST(ProcessorTest, RenderStringWithoutPlaceholdersIsUnchanged) {
    EXPECT_EQ(c_processor::render_string("/api/test", json_obj_t::object()), "/api/test");
}

TEST(ProcessorTest, RenderTemplate) {
    const auto request_template = request_template_t::from_json(
        "getUser",

        parse(R"({
            "method": "GET",
            "host": "localhost:8000",
            "path": "/api/users/<%= context.userId %>",
            "headers": {"X-Custom-Client": "<%= context.clientName %>"},
            "query": {"expand": "<%= context.expand %>"}
        })")
    );

    const auto processed = c_processor::render(
        request_template,

        parse(R"({"userId": 7, "clientName": "portal"})"),

        parse(R"({"note": "hi"})")
    );

    EXPECT_EQ(processed.m_template.m_path, "/api/users/7");
    EXPECT_EQ(processed.m_template.m_headers.at("X-Custom-Client"), "portal");
    EXPECT_EQ(processed.m_template.m_query.at("expand"), "<%= context.expand %>");

    ASSERT_EQ(processed.m_unresolved.size(), 1u);
    ASSERT_TRUE(processed.m_body.has_value());
    EXPECT_EQ(processed.m_body->at("note"), "hi");

    EXPECT_EQ(request_template.m_path, "/api/users/<%= context.userId %>");
}

TEST(ProcessorTest, RenderDropsNullBody) {
    const auto request_template = request_template_t::from_json("t", parse(R"({"method": "POST", "host": "h", "path": "/"})"));

    EXPECT_FALSE(c_processor::render(request_template, json_obj_t::object(), json_obj_t{}).m_body.has_value());
    EXPECT_FALSE(c_processor::render(request_template, json_obj_t::object()).m_body.has_value());
}
