#include <catch2/catch_test_macros.hpp>
#include "../src/account_directory.hpp"

TEST_CASE("Account directory", "[accounts]") {
    SECTION("Valid entries are loaded with credentials") {
        auto doc = nlohmann::json::parse(R"([
            {"id": "acct_1", "integrationId": "stripe", "label": "Main",
             "credentials": {"secret_key": "sk_test_x"}},
            {"id": "acct_2", "integrationId": "stripe", "label": "Old", "isActive": false}
        ])");

        auto directory = AccountDirectory::from_json(doc);
        REQUIRE(directory.size() == 2);
        REQUIRE(directory.find("acct_1")->credentials.at("secret_key") == "sk_test_x");
        REQUIRE(directory.active().size() == 1);
        REQUIRE_FALSE(directory.find("acct_3"));
    }

    SECTION("Invalid and duplicate entries are skipped") {
        auto doc = nlohmann::json::parse(R"([
            {"id": "../etc", "integrationId": "stripe", "label": "Bad"},
            {"id": "acct_1", "integrationId": "stripe", "label": "   "},
            {"id": "acct_1", "integrationId": "stripe", "label": "First"},
            {"id": "acct_1", "integrationId": "stripe", "label": "Second"},
            {"id": "acct_2", "integrationId": "stripe", "label": "Flag", "isActive": "yes"},
            "not an object"
        ])");

        auto directory = AccountDirectory::from_json(doc);
        REQUIRE(directory.size() == 1);
        REQUIRE(directory.find("acct_1")->label == "First");
    }

    SECTION("Document must be an array") {
        REQUIRE_THROWS(AccountDirectory::from_json(nlohmann::json::object()));
    }

    SECTION("Missing file yields an empty directory") {
        auto directory = AccountDirectory::load_file("/nonexistent/accounts.json");
        REQUIRE(directory.size() == 0);
    }
}
