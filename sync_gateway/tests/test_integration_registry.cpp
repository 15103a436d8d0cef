#include <catch2/catch_test_macros.hpp>
#include "../src/integration_registry.hpp"
#include <stdexcept>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace {
class NamedIntegration : public Integration {
public:
    explicit NamedIntegration(std::string id) : id_(std::move(id)) {}

    std::string id() const override { return id_; }
    std::string name() const override { return "Named " + id_; }
    std::string description() const override { return "test double"; }

    FetchResult sync(const AccountConfig&, std::optional<int64_t>, const StepReporter&) override {
        FetchResult result;
        result.success = true;
        return result;
    }
    bool validate_credentials(const std::map<std::string, std::string>&) override { return true; }

private:
    std::string id_;
};
}

TEST_CASE("Integration registry", "[registry]") {
    IntegrationRegistry registry;

    SECTION("Register and look up") {
        REQUIRE(registry.register_integration(std::make_shared<NamedIntegration>("stripe")));
        REQUIRE(registry.has("stripe"));
        REQUIRE(registry.get("stripe")->name() == "Named stripe");
        REQUIRE(registry.get("unknown") == nullptr);
    }

    SECTION("Duplicate ids keep the first registration") {
        auto first = std::make_shared<NamedIntegration>("stripe");
        registry.register_integration(first);
        REQUIRE_FALSE(registry.register_integration(std::make_shared<NamedIntegration>("stripe")));
        REQUIRE(registry.size() == 1);
        REQUIRE(registry.get("stripe") == first);
    }

    SECTION("Discovery runs once") {
        int calls = 0;
        auto discover = [&calls](IntegrationRegistry& r) {
            calls++;
            r.register_integration(std::make_shared<NamedIntegration>("a"));
            r.register_integration(std::make_shared<NamedIntegration>("b"));
        };

        REQUIRE_FALSE(registry.is_loaded());
        registry.load_all(discover);
        registry.load_all(discover);

        REQUIRE(calls == 1);
        REQUIRE(registry.is_loaded());
        REQUIRE(registry.all().size() == 2);
    }

    SECTION("Failed discovery is retried") {
        int calls = 0;
        auto discover = [&calls](IntegrationRegistry& r) {
            if (++calls == 1) throw std::runtime_error("module failed to load");
            r.register_integration(std::make_shared<NamedIntegration>("a"));
        };

        REQUIRE_THROWS(registry.load_all(discover));
        REQUIRE_FALSE(registry.is_loaded());

        registry.load_all(discover);
        REQUIRE(calls == 2);
        REQUIRE(registry.has("a"));
    }
}

TEST_CASE("Integration registry loads once under contention", "[registry]") {
    IntegrationRegistry registry;
    std::atomic<int> calls{0};
    auto discover = [&calls](IntegrationRegistry& r) {
        calls++;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        r.register_integration(std::make_shared<NamedIntegration>("stripe"));
    };

    std::atomic<bool> go{false};
    std::atomic<int> saw_loaded{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++) {
        threads.emplace_back([&]() {
            while (!go) std::this_thread::yield();
            registry.load_all(discover);
            if (registry.has("stripe")) saw_loaded++;
        });
    }
    go = true;
    for (auto& t : threads) t.join();

    REQUIRE(calls.load() == 1);
    REQUIRE(saw_loaded.load() == 8);
    REQUIRE(registry.size() == 1);
}
