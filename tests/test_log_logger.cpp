/**
 * @file test_log_logger.cpp
 * @brief Synchronous logger: filtering, entry construction and fan-out
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "log_logger.hpp"
#include "test_helpers.hpp"

using namespace sluice;
using namespace sluice_test;

namespace
{

enum class order_state
{
    pending,
    shipped,
};

struct fixture
{
    std::shared_ptr<memory_destination> sink = std::make_shared<memory_destination>();
    logger log{"orders", log_level::trace, {sink}};
};

} // namespace

TEST_CASE("Level threshold", "[logger][level]")
{
    auto minimum = GENERATE(log_level::trace, log_level::debug, log_level::info, log_level::warn, log_level::error,
                            log_level::critical, log_level::none);
    auto level   = GENERATE(log_level::trace, log_level::debug, log_level::info, log_level::warn, log_level::error,
                            log_level::critical);

    auto sink = std::make_shared<memory_destination>();
    logger log("levels", minimum, {sink});

    log.log(level, "message at {Level}", log_level_name(level));

    bool expected = minimum != log_level::none && level >= minimum;
    REQUIRE(log.is_enabled(level) == expected);
    REQUIRE(sink->count() == (expected ? 1u : 0u));
}

TEST_CASE("Level none never logs", "[logger][level]")
{
    fixture f;
    f.log.log(log_level::none, "ignored");
    REQUIRE(f.sink->count() == 0);
}

TEST_CASE("Minimum level can change at runtime", "[logger][level]")
{
    fixture f;
    f.log.set_minimum_level(log_level::error);
    f.log.warn("dropped");
    f.log.error("kept");
    REQUIRE(f.sink->messages() == std::vector<std::string>{"kept"});
    REQUIRE(f.log.minimum_level() == log_level::error);
}

TEST_CASE("Entry construction", "[logger]")
{
    fixture f;

    SECTION("Fields from the call")
    {
        auto before = log_clock::now();
        f.log.info("Order {OrderId} placed by {Customer}", 1042, "acme");
        auto after = log_clock::now();

        auto entries = f.sink->entries();
        REQUIRE(entries.size() == 1);
        auto &e = *entries[0];
        REQUIRE(e.level == log_level::info);
        REQUIRE(e.category == "orders");
        REQUIRE(e.message == "Order 1042 placed by acme");
        REQUIRE(e.message_template == "Order {OrderId} placed by {Customer}");
        REQUIRE(std::get<int64_t>(e.properties.at("OrderId")) == 1042);
        REQUIRE(std::get<std::string>(e.properties.at("Customer")) == "acme");
        REQUIRE(e.timestamp >= before);
        REQUIRE(e.timestamp <= after);
        REQUIRE(e.event_id == log_event_id{});
        REQUIRE_FALSE(e.exception);
    }

    SECTION("Event id")
    {
        f.log.log(log_level::warn, log_event_id{17, "Retry"}, "Retrying {Attempt}", 3);
        auto e = f.sink->entries().at(0);
        REQUIRE(e->event_id.id == 17);
        REQUIRE(e->event_id.name == "Retry");
    }

    SECTION("Exception is captured")
    {
        std::runtime_error failure("timeout");
        f.log.error(failure, "Payment for {OrderId} failed", 7);
        auto e = f.sink->entries().at(0);
        REQUIRE(e->exception);
        REQUIRE(e->exception->type == "std::runtime_error");
        REQUIRE(e->exception->message == "timeout");
        REQUIRE(e->message == "Payment for 7 failed");
    }

    SECTION("Exception with empty message still logs")
    {
        f.log.critical(std::logic_error("invariant broken"), "");
        auto entries = f.sink->entries();
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0]->message.empty());
        REQUIRE_FALSE(entries[0]->message_template.has_value());
    }

    SECTION("Empty message without exception is skipped")
    {
        f.log.info("");
        REQUIRE(f.sink->count() == 0);
    }

    SECTION("Enums, chars and time points become values")
    {
        auto when = std::chrono::system_clock::now();
        f.log.debug("{State} {Grade} {When}", order_state::shipped, 'A', when);
        auto e = f.sink->entries().at(0);
        REQUIRE(std::get<int64_t>(e->properties.at("State")) == 1);
        REQUIRE(std::get<std::string>(e->properties.at("Grade")) == "A");
        REQUIRE(std::holds_alternative<log_timestamp>(e->properties.at("When")));
    }

    SECTION("Active scopes are attached")
    {
        auto outer = f.log.begin_scope({{"RequestId", "r-17"}});
        auto inner = f.log.begin_scope("Checkout for {Customer}", "acme");
        f.log.info("in scope");
        inner.end();
        f.log.info("outer only");
        outer.end();
        f.log.info("no scope");

        auto entries = f.sink->entries();
        REQUIRE(entries.size() == 3);
        REQUIRE(entries[0]->scope_properties.size() == 2);
        REQUIRE(std::get<std::string>(entries[0]->scope_properties.at("Customer")) == "acme");
        REQUIRE(entries[1]->scope_properties.size() == 1);
        REQUIRE(entries[2]->scope_properties.empty());
    }
}

TEST_CASE("Destinations receive entries in order", "[logger]")
{
    auto first  = std::make_shared<memory_destination>();
    auto second = std::make_shared<memory_destination>();
    logger log("fanout", log_level::info, {first, second});

    log.info("a");
    log.info("b");
    REQUIRE(first->messages() == std::vector<std::string>{"a", "b"});
    REQUIRE(second->messages() == std::vector<std::string>{"a", "b"});
}

TEST_CASE("Failing destination does not affect the others", "[logger][failure]")
{
    diagnostics_capture diag;
    auto bad     = std::make_shared<failing_destination>(failure_kind::exception);
    auto healthy = std::make_shared<memory_destination>();
    logger log("isolation", log_level::info, {bad, healthy});

    REQUIRE_NOTHROW(log.error("Something broke"));
    REQUIRE_NOTHROW(log.info("Still going"));

    REQUIRE(healthy->messages() == std::vector<std::string>{"Something broke", "Still going"});
    REQUIRE(bad->attempts() == 2);
    REQUIRE(diag.contains("failing"));
}

TEST_CASE("Closed logger drops entries", "[logger]")
{
    fixture f;
    f.log.info("before");
    f.log.close();
    REQUIRE(f.log.is_closed());
    f.log.info("after");
    REQUIRE(f.sink->messages() == std::vector<std::string>{"before"});
    // Destinations are left open for their owner
    REQUIRE_FALSE(f.sink->is_closed());
}

TEST_CASE("Flush reaches buffered destinations", "[logger]")
{
    auto sink = std::make_shared<memory_destination>(destination_options{.mode = write_mode::buffered, .buffer_threshold = 50});
    logger log("buffered", log_level::info, {sink});

    log.info("one");
    log.info("two");
    REQUIRE(sink->count() == 0);
    log.flush();
    REQUIRE(sink->count() == 2);
}
