#include <gtest/gtest.h>

#include <cxxgate.hxx>

using namespace cxxgate;
using namespace cxxgate::templates;

namespace {
    struct validator_fixture_t {
        c_template_store m_store{};

        c_permission_registry m_permissions{};

        c_validator m_validator{m_store, m_permissions};

        validator_fixture_t() {
            m_store.load(shared::json_traits_t::deserialize(R"({
                "getUsers": {"method": "GET", "host": "localhost:8000", "path": "/api/users"},
                "submitData": {"method": "POST", "host": "localhost:8000", "path": "/api/data"},
                "noMethod": {"host": "localhost:8000", "path": "/x"},
                "badMethod": {"method": "FETCH", "host": "localhost:8000", "path": "/x"},
                "noHost": {"method": "GET", "path": "/x"}
            })"));

            m_permissions.load("app2", shared::json_traits_t::deserialize(R"({
                "product": {
                    "directory": {"requests": {"getUsers": {}, "noMethod": {}, "badMethod": {}, "noHost": {}, "ghost": {}}}
                }
            })"));
        }

        e_invoke_error failure_of(const std::string& name) const {
            try {
                static_cast<void>(m_validator.validate(name));
            }
            catch (const exceptions::template_exception_t& e) {
                return e.kind();
            }

            ADD_FAILURE() << "validation of " << name << " did not fail";

            return e_invoke_error::transport_failure;
        }
    };
}

TEST(ValidatorTest, ValidTemplateIsReturned) {
    validator_fixture_t fixture{};

    const auto request_template = fixture.m_validator.validate("getUsers");

    EXPECT_EQ(request_template.m_method, "GET");
    EXPECT_EQ(request_template.m_path, "/api/users");
}

TEST(ValidatorTest, FailureKinds) {
    validator_fixture_t fixture{};

    EXPECT_EQ(fixture.failure_of("unknown"), e_invoke_error::template_not_found);
    EXPECT_EQ(fixture.failure_of("ghost"), e_invoke_error::template_not_found);
    EXPECT_EQ(fixture.failure_of("submitData"), e_invoke_error::template_not_declared);
    EXPECT_EQ(fixture.failure_of("noMethod"), e_invoke_error::template_malformed);
    EXPECT_EQ(fixture.failure_of("badMethod"), e_invoke_error::template_malformed);
    EXPECT_EQ(fixture.failure_of("noHost"), e_invoke_error::template_malformed);
}

TEST(ValidatorTest, FailureMessagesNameTheTemplate) {
    validator_fixture_t fixture{};

    try {
        static_cast<void>(fixture.m_validator.validate("submitData"));

        FAIL() << "expected template_exception_t";
    }
    catch (const exceptions::template_exception_t& e) {
        EXPECT_EQ(e.message(), "Template \"submitData\" not declared in manifest for application \"app2\"");
    }
}

TEST(ValidatorTest, ListingSeparatesConfiguredDeclaredAndValid) {
    validator_fixture_t fixture{};

    const auto listing = fixture.m_validator.list();

    EXPECT_EQ(listing.m_configured.size(), 5u);
    EXPECT_EQ(listing.m_declared.size(), 5u);

    const std::vector<std::string> expected_valid{"badMethod", "getUsers", "noHost", "noMethod"};

    EXPECT_EQ(listing.m_valid, expected_valid);

    const auto json = listing.to_json();

    EXPECT_EQ(json.at("valid").size(), 4u);
    EXPECT_EQ(fixture.m_validator.application(), "app2");
}
