#include <gtest/gtest.h>

#include <cxxgate.hxx>

using namespace cxxgate::templates;

namespace {
    json_obj_t parse(const std::string_view& text) {
        return shared::json_traits_t::deserialize(text);
    }
}

TEST(TemplateStoreTest, LoadsEntriesAndNormalizesMethod) {
    c_template_store store{};

    const auto count = store.load(parse(R"({
        "getUsers": {
            "method": "get",
            "protocol": "https:",
            "host": "api.example.com",
            "path": "/users",
            "headers": {"Accept": "application/json", "X-Retry": 3},
            "query": {"page": "<%= context.page %>"}
        },
        "broken": "not an object"
    })"));

    EXPECT_EQ(count, 1u);
    EXPECT_TRUE(store.loaded());
    EXPECT_TRUE(store.contains("getUsers"));
    EXPECT_FALSE(store.contains("broken"));

    const auto request_template = store.get("getUsers");

    ASSERT_TRUE(request_template.has_value());
    EXPECT_EQ(request_template->m_name, "getUsers");
    EXPECT_EQ(request_template->m_method, "GET");
    EXPECT_EQ(request_template->m_protocol, "https:");
    EXPECT_EQ(request_template->m_headers.at("X-Retry"), "3");
    EXPECT_EQ(request_template->m_query.at("page"), "<%= context.page %>");
}

TEST(TemplateStoreTest, LoadsOnlyOnce) {
    c_template_store store{};

    store.load(parse(R"({"a": {"method": "GET", "host": "h", "path": "/a"}})"));

    EXPECT_EQ(store.load(parse(R"({"b": {"method": "GET", "host": "h", "path": "/b"}})")), 1u);
    EXPECT_FALSE(store.contains("b"));
}

TEST(TemplateStoreTest, MissingFieldsStayEmpty) {
    c_template_store store{};

    store.load(parse(R"({"partial": {"path": 12, "host": "h"}})"));

    const auto request_template = store.get("partial");

    ASSERT_TRUE(request_template.has_value());
    EXPECT_TRUE(request_template->m_method.empty());
    EXPECT_TRUE(request_template->m_path.empty());
    EXPECT_FALSE(request_template->m_protocol.has_value());
}

TEST(TemplateStoreTest, MissingFileYieldsEmptyStore) {
    c_template_store store{};

    EXPECT_EQ(store.load(boost::filesystem::path("/nonexistent/cxxgate/requests.json")), 0u);
    EXPECT_TRUE(store.loaded());
    EXPECT_EQ(store.size(), 0u);
}

TEST(TemplateStoreTest, MalformedFileYieldsEmptyStore) {
    const auto path = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("cxxgate-%%%%-%%%%.json");

    {
        std::ofstream out(path.string());

        out << "{ this is not json";
    }

    c_template_store store{};

    EXPECT_EQ(store.load(path), 0u);
    EXPECT_TRUE(store.loaded());

    boost::filesystem::remove(path);
}

TEST(TemplateStoreTest, NamesAreSorted) {
    c_template_store store{};

    store.load(parse(R"({"zeta": {}, "alpha": {}, "mid": {}})"));

    const auto names = store.names();

    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "alpha");
    EXPECT_EQ(names[2], "zeta");
}

TEST(TemplateStoreTest, ToJsonRoundTripsConfigurationShape) {
    const auto request_template = request_template_t::from_json(
        "createTicket",

        parse(R"({"method": "POST", "host": "h:8000", "path": "/tickets", "headers": {"Authorization": "Bearer x"}})")
    );

    const auto out = request_template.to_json();

    EXPECT_EQ(out.at("method"), "POST");
    EXPECT_EQ(out.at("headers").at("Authorization"), "Bearer x");
    EXPECT_FALSE(out.contains("query"));
    EXPECT_FALSE(out.contains("protocol"));
}

TEST(PermissionRegistryTest, LoadsDeclaredTemplatesPerProduct) {
    c_permission_registry permissions{};

    const auto count = permissions.load("app2", parse(R"({
        "product": {
            "support": {"requests": {"createTicket": {}, "getTest": {}}},
            "directory": {"requests": {"getUsers": {}}},
            "empty": {}
        }
    })"));

    EXPECT_EQ(count, 3u);
    EXPECT_EQ(permissions.products(), 3u);
    EXPECT_EQ(permissions.application(), "app2");

    EXPECT_TRUE(permissions.is_declared("getUsers"));
    EXPECT_FALSE(permissions.is_declared("submitData"));

    const auto entry = permissions.entry("createTicket");

    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->m_product, "support");
    EXPECT_EQ(entry->m_application, "app2");
    EXPECT_TRUE(entry->m_declared);

    EXPECT_EQ(permissions.declared().size(), 3u);
}

TEST(PermissionRegistryTest, ManifestWithoutProductsDeclaresNothing) {
    c_permission_registry permissions{};

    EXPECT_EQ(permissions.load("app2", parse(R"({"name": "app2"})")), 0u);
    EXPECT_EQ(permissions.load("app2", parse(R"([1, 2])")), 0u);
    EXPECT_TRUE(permissions.declared().empty());
}

TEST(PermissionRegistryTest, MissingManifestFile) {
    c_permission_registry permissions{};

    EXPECT_EQ(permissions.load("app9", boost::filesystem::path("/nonexistent/app9/manifest.json")), 0u);
    EXPECT_EQ(permissions.application(), "app9");
}
