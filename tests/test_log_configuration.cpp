/**
 * @file test_log_configuration.cpp
 * @brief Fluent builders and JSON configuration documents
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <fstream>
#include <memory>
#include <string>

#include "log_configuration.hpp"
#include "test_helpers.hpp"

using namespace sluice;
using namespace sluice_test;
using namespace Catch::Matchers;

TEST_CASE("Builder validation", "[config]")
{
    temp_dir dir;

    SECTION("At least one destination")
    {
        REQUIRE_THROWS_AS(logger_configuration{}.build(), config_error);
        REQUIRE_THROWS_AS(async_logger_configuration{}.build(), config_error);
    }

    SECTION("Paths are checked before anything is opened")
    {
        auto good = dir.file("good.log");
        logger_configuration config;
        config.add_text_file(good).add_json_file("");
        REQUIRE_THROWS_AS(config.build(), config_error);
        REQUIRE_FALSE(std::filesystem::exists(good));
    }

    SECTION("Sizes must be positive")
    {
        REQUIRE_THROWS_AS(logger_configuration{}.add_sqlite(dir.file("x.db"), {}, 0).build(), config_error);
        REQUIRE_THROWS_AS(
            logger_configuration{}.add_console({.mode = write_mode::buffered, .buffer_threshold = 0}).build(),
            config_error);
        REQUIRE_THROWS_AS(async_logger_configuration{}.add_console().queue_capacity(0).build(), config_error);
    }

    SECTION("Null custom destination")
    {
        REQUIRE_THROWS_AS(logger_configuration{}.add_destination(std::shared_ptr<buffered_destination>{}), config_error);
    }
}

TEST_CASE("Builder produces a working factory", "[config]")
{
    temp_dir dir;
    auto text_path = dir.file("app.log");
    auto json_path = dir.file("app.jsonl");
    auto db_path   = dir.file("app.db");
    auto custom    = std::make_shared<memory_destination>();

    {
        auto factory = logger_configuration{}
                           .minimum_level(log_level::debug)
                           .add_text_file(text_path)
                           .add_json_file(json_path, {.mode = write_mode::buffered, .buffer_threshold = 10})
                           .add_sqlite(db_path, {}, 2)
                           .add_destination(custom)
                           .build();

        REQUIRE(factory->destinations().size() == 4);
        REQUIRE(factory->minimum_level() == log_level::debug);

        auto log = factory->create_logger("configured");
        log->debug("Configured {Count} destinations", 4);
        log->trace("filtered");
        factory->close();
    }

    REQUIRE(read_lines(text_path).size() == 1);
    REQUIRE(read_lines(json_path).size() == 1);
    REQUIRE(custom->messages() == std::vector<std::string>{"Configured 4 destinations"});

    sqlite_connection conn(db_path);
    auto stmt = conn.prepare("SELECT COUNT(*) FROM LogEntries");
    REQUIRE(stmt.step());
    REQUIRE(stmt.column_int64(0) == 1);
}

TEST_CASE("Async builder", "[config][async]")
{
    auto custom  = std::make_shared<memory_destination>();
    auto factory = async_logger_configuration{}.queue_capacity(32).add_destination(custom).build();
    REQUIRE(factory->queue_capacity() == 32);

    factory->create_logger("async")->warn("queued");
    factory->close();
    REQUIRE(custom->count() == 1);
}

TEST_CASE("JSON configuration documents", "[config][json]")
{
    temp_dir dir;

    SECTION("Full document")
    {
        auto doc = R"({
            "minimum_level": "warning",
            "destinations": [
                { "kind": "console", "stream": "stderr", "colors": false, "write_mode": "buffered", "buffer_threshold": 5 },
                { "kind": "text", "path": ")" + dir.file("a.log") + R"(", "append": true },
                { "kind": "sqlite", "path": ")" + dir.file("a.db") + R"(", "pool_size": 3, "thread_safety": "not_thread_safe" }
            ]
        })";

        auto config = configuration_from_json(doc);
        REQUIRE(config.minimum() == log_level::warn);

        auto &specs = config.destination_specs();
        REQUIRE(specs.size() == 3);

        REQUIRE(specs[0].kind == destination_kind::console);
        REQUIRE(specs[0].console.fd == STDERR_FILENO);
        REQUIRE_FALSE(specs[0].console.use_colors);
        REQUIRE(specs[0].options.mode == write_mode::buffered);
        REQUIRE(specs[0].options.buffer_threshold == 5);

        REQUIRE(specs[1].kind == destination_kind::text);
        REQUIRE(specs[1].append);
        REQUIRE(specs[1].options.mode == write_mode::immediate);

        REQUIRE(specs[2].kind == destination_kind::sqlite);
        REQUIRE(specs[2].pool_size == 3);
        REQUIRE(specs[2].options.safety == thread_safety::not_thread_safe);

        auto factory = config.build();
        factory->create_logger("json")->error("from a JSON config");
        factory->close();
        REQUIRE(read_lines(dir.file("a.log")).size() == 1);
    }

    SECTION("Async document reads the queue capacity")
    {
        auto config = configuration_from_json<async_logger_configuration>(
            R"({ "queue_capacity": 7, "destinations": [ { "kind": "console" } ] })");
        REQUIRE(config.queue_capacity() == 7);
        REQUIRE(config.minimum() == log_level::info);
    }

    SECTION("Errors")
    {
        REQUIRE_THROWS_AS(configuration_from_json("{ not json"), config_error);
        REQUIRE_THROWS_AS(configuration_from_json("[]"), config_error);
        REQUIRE_THROWS_AS(configuration_from_json(R"({ "destinations": [] })"), config_error);
        REQUIRE_THROWS_AS(configuration_from_json(R"({ "destinations": {} })"), config_error);
        REQUIRE_THROWS_WITH(configuration_from_json(R"({ "minimum_level": "loud", "destinations": [ { "kind": "console" } ] })"),
                            ContainsSubstring("loud"));
        REQUIRE_THROWS_WITH(configuration_from_json(R"({ "destinations": [ { "kind": "syslog" } ] })"),
                            ContainsSubstring("syslog"));
        REQUIRE_THROWS_AS(configuration_from_json(R"({ "destinations": [ { "kind": "text" } ] })"), config_error);
        REQUIRE_THROWS_AS(configuration_from_json(R"({ "destinations": [ { "kind": "console", "colors": "yes" } ] })"),
                          config_error);
        REQUIRE_THROWS_AS(configuration_from_json(R"({ "destinations": [ { "kind": "json", "path": "x", "buffer_threshold": -1 } ] })"),
                          config_error);
        REQUIRE_THROWS_AS(configuration_from_json(R"({ "destinations": [ { "kind": "console", "write_mode": "lazy" } ] })"),
                          config_error);
    }

    SECTION("From a file")
    {
        auto path = dir.file("logging.json");
        {
            std::ofstream out(path);
            out << R"({ "minimum_level": "error", "destinations": [ { "kind": "console" } ] })";
        }
        auto config = configuration_from_file(path);
        REQUIRE(config.minimum() == log_level::error);

        REQUIRE_THROWS_AS(configuration_from_file(dir.file("missing.json")), config_error);
    }
}
