#include <gtest/gtest.h>

#include <cxxgate.hxx>

using namespace cxxgate;
using namespace cxxgate::domains;

namespace {
    c_domain_registry make_registry() {
        return c_domain_registry(
            {"http://localhost:3000", "http://localhost:3001"},
            {"http://localhost:*", "https://*.example.com"},

            {{"development-key-1", "Development App 1"}, {"development-key-2", "Development App 2"}}
        );
    }
}

TEST(DomainRegistryTest, ApiKeys) {
    const auto registry = make_registry();

    EXPECT_TRUE(registry.validate_api_key("development-key-1"));
    EXPECT_FALSE(registry.validate_api_key("development-key-9"));
    EXPECT_FALSE(registry.validate_api_key(""));

    EXPECT_EQ(registry.api_key_info("development-key-2"), "Development App 2");
    EXPECT_EQ(registry.api_key_info("nope"), "Unknown");
}

TEST(DomainRegistryTest, PatternMatching) {
    const auto registry = make_registry();

    EXPECT_TRUE(registry.matches_pattern("http://localhost:5173"));
    EXPECT_TRUE(registry.matches_pattern("https://app.example.com"));

    EXPECT_FALSE(registry.matches_pattern("https://a.b.example.com"));
    EXPECT_FALSE(registry.matches_pattern("https://example.com"));
    EXPECT_FALSE(registry.matches_pattern("https://appXexample.com"));
    EXPECT_FALSE(registry.matches_pattern(""));
}

TEST(DomainRegistryTest, MatchOriginPrecedence) {
    auto registry = make_registry();

    EXPECT_EQ(registry.match_origin(""), e_origin_match::no_origin);
    EXPECT_EQ(registry.match_origin("http://localhost:3000"), e_origin_match::configured);
    EXPECT_EQ(registry.match_origin("http://localhost:4000"), e_origin_match::pattern);
    EXPECT_EQ(registry.match_origin("https://partner.io"), e_origin_match::denied);

    ASSERT_TRUE(registry.register_domain("https://partner.io", "development-key-1"));

    EXPECT_EQ(registry.match_origin("https://partner.io"), e_origin_match::registered);
    EXPECT_EQ(origin_match_to_str(e_origin_match::registered), "registered");
}

TEST(DomainRegistryTest, RegisterRequiresValidKey) {
    auto registry = make_registry();

    EXPECT_FALSE(registry.register_domain("https://partner.io", "bogus"));
    EXPECT_FALSE(registry.is_registered("https://partner.io"));
}

TEST(DomainRegistryTest, RegisterAndUnregister) {
    auto registry = make_registry();

    ASSERT_TRUE(registry.register_domain("https://partner.io", "development-key-2", {{"team", "support"}}));

    const auto domains = registry.registered_domains();

    ASSERT_TRUE(domains.contains("https://partner.io"));
    EXPECT_EQ(domains.at("https://partner.io").at("appName"), "Development App 2");
    EXPECT_EQ(domains.at("https://partner.io").at("metadata").at("team"), "support");
    EXPECT_TRUE(domains.at("https://partner.io").contains("registeredAt"));

    EXPECT_TRUE(registry.unregister_domain("https://partner.io"));
    EXPECT_FALSE(registry.unregister_domain("https://partner.io"));
    EXPECT_FALSE(registry.is_registered("https://partner.io"));
}

TEST(DomainRegistryTest, GeneratedKeysHaveValidFormat) {
    const auto first = c_domain_registry::generate_api_key();
    const auto second = c_domain_registry::generate_api_key("partner");

    EXPECT_TRUE(first.starts_with("sdk-"));
    EXPECT_TRUE(second.starts_with("partner-"));
    EXPECT_NE(first, c_domain_registry::generate_api_key());

    EXPECT_TRUE(c_domain_registry::is_valid_api_key_format(first));
    EXPECT_TRUE(c_domain_registry::is_valid_api_key_format(second));
    EXPECT_TRUE(c_domain_registry::is_valid_api_key_format("development-key-12"));

    EXPECT_FALSE(c_domain_registry::is_valid_api_key_format(""));
    EXPECT_FALSE(c_domain_registry::is_valid_api_key_format("UPPER-abc-def"));
    EXPECT_FALSE(c_domain_registry::is_valid_api_key_format("no dashes"));
}

TEST(DomainRegistryTest, PatternMetacharactersAreLiteral) {
    const c_domain_registry registry({}, {"https://(weird]+.example.com"}, {});

    EXPECT_TRUE(registry.matches_pattern("https://(weird]+.example.com"));
    EXPECT_FALSE(registry.matches_pattern("https://weirdd.example.com"));
}
