/**
 * @file test_sqlite_pool.cpp
 * @brief Bounded SQLite connection pool
 */

#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "sqlite_connection_pool.hpp"
#include "test_helpers.hpp"

using namespace sluice;
using namespace sluice_test;
using namespace std::chrono_literals;

TEST_CASE("sqlite_connection basics", "[sqlite]")
{
    temp_dir dir;
    sqlite_connection conn(dir.file("basic.db"));

    conn.execute("CREATE TABLE t (id INTEGER, name TEXT)");
    conn.prepare("INSERT INTO t VALUES (?, ?)").bind(1, int64_t{1}).bind(2, std::string_view("one")).execute();
    conn.prepare("INSERT INTO t VALUES (?, ?)").bind(1, int64_t{2}).bind_null(2).execute();

    auto stmt = conn.prepare("SELECT id, name FROM t ORDER BY id");
    REQUIRE(stmt.step());
    REQUIRE(stmt.column_int64(0) == 1);
    REQUIRE(stmt.column_text(1) == "one");
    REQUIRE(stmt.step());
    REQUIRE_FALSE(stmt.column_text(1).has_value());
    REQUIRE_FALSE(stmt.step());

    REQUIRE_THROWS_AS(conn.execute("SELECT * FROM missing_table"), sqlite_error);
    REQUIRE(conn.is_usable());
}

TEST_CASE("Pool construction", "[sqlite][pool]")
{
    temp_dir dir;
    REQUIRE_THROWS_AS(sqlite_connection_pool(dir.file("x.db"), 0), config_error);

    sqlite_connection_pool pool(dir.file("x.db"), 3);
    auto stats = pool.get_stats();
    REQUIRE(stats.max_size == 3);
    REQUIRE(stats.live == 0); // connections open lazily
    REQUIRE(stats.available_permits == 3);
}

TEST_CASE("Pool reuses returned connections", "[sqlite][pool]")
{
    temp_dir dir;
    sqlite_connection_pool pool(dir.file("reuse.db"), 2);

    sqlite_connection *first = nullptr;
    {
        auto conn = pool.acquire();
        first     = conn.get();
        REQUIRE(pool.get_stats().live == 1);
    }
    REQUIRE(pool.get_stats().resting == 1);

    auto again = pool.acquire();
    REQUIRE(again.get() == first);
    REQUIRE(pool.get_stats().live == 1);
}

TEST_CASE("Pool blocks beyond its maximum", "[sqlite][pool][concurrent]")
{
    temp_dir dir;
    sqlite_connection_pool pool(dir.file("bounded.db"), 2);

    auto a = pool.acquire();
    auto b = pool.acquire();

    SECTION("Timed acquire gives up")
    {
        auto start = std::chrono::steady_clock::now();
        auto c     = pool.try_acquire_for(50ms);
        REQUIRE_FALSE(c.has_value());
        REQUIRE(std::chrono::steady_clock::now() - start >= 40ms);
    }

    SECTION("Blocked acquire resumes after a release")
    {
        std::atomic<bool> acquired{false};
        std::thread waiter(
            [&]
            {
                auto c = pool.acquire();
                acquired.store(true);
            });

        std::this_thread::sleep_for(50ms);
        REQUIRE_FALSE(acquired.load());

        {
            auto released = std::move(a);
        }
        waiter.join();
        REQUIRE(acquired.load());
    }

    SECTION("Stop request ends the wait")
    {
        std::stop_source source;
        std::optional<pooled_connection> result;
        std::thread waiter([&] { result = pool.acquire(source.get_token()); });

        std::this_thread::sleep_for(30ms);
        source.request_stop();
        waiter.join();
        REQUIRE_FALSE(result.has_value());
        REQUIRE(pool.get_stats().available_permits == 0);
    }

    REQUIRE(pool.get_stats().live <= 2);
}

TEST_CASE("Live connections never exceed the maximum", "[sqlite][pool][concurrent]")
{
    temp_dir dir;
    const size_t max_size = 3;
    sqlite_connection_pool pool(dir.file("stress.db"), max_size);

    std::atomic<int> in_use{0};
    std::atomic<int> peak{0};
    std::atomic<bool> over_limit{false};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t)
    {
        threads.emplace_back(
            [&]
            {
                for (int i = 0; i < 50; ++i)
                {
                    auto conn = pool.acquire();
                    int now   = in_use.fetch_add(1) + 1;
                    int prev  = peak.load();
                    while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
                    if (pool.get_stats().live > max_size) { over_limit.store(true); }
                    std::this_thread::sleep_for(100us);
                    in_use.fetch_sub(1);
                }
            });
    }
    for (auto &th : threads) { th.join(); }

    REQUIRE_FALSE(over_limit.load());
    REQUIRE(peak.load() <= static_cast<int>(max_size));
    REQUIRE(pool.get_stats().live <= max_size);
    REQUIRE(pool.get_stats().available_permits == max_size);
}

TEST_CASE("Unusable connections are discarded on return", "[sqlite][pool]")
{
    temp_dir dir;
    sqlite_connection_pool pool(dir.file("broken.db"), 2);

    {
        auto conn = pool.acquire();
        conn->invalidate();
    }
    auto stats = pool.get_stats();
    REQUIRE(stats.live == 0);
    REQUIRE(stats.resting == 0);
    REQUIRE(stats.available_permits == 2);
    REQUIRE(stats.discarded == 1);

    auto fresh = pool.acquire();
    REQUIRE(fresh->is_usable());
}

TEST_CASE("Resting connections are checked on checkout", "[sqlite][pool]")
{
    temp_dir dir;
    auto path = dir.file("checked.db");
    sqlite_connection_pool pool(path, 1);
    {
        auto conn = pool.acquire();
        conn->execute("CREATE TABLE t (x INTEGER)");
    }
    REQUIRE(pool.get_stats().resting == 1);

    SECTION("Healthy connection is handed out again")
    {
        auto conn = pool.acquire();
        REQUIRE(conn->is_usable());
        REQUIRE(pool.get_stats().discarded == 0);
        REQUIRE(pool.get_stats().live == 1);
    }

    SECTION("Connection to an overwritten file is replaced")
    {
        auto size = std::filesystem::file_size(path);
        {
            std::fstream file(path, std::ios::in | std::ios::out | std::ios::binary);
            file << std::string(size, 'x');
        }

        auto conn  = pool.acquire();
        auto stats = pool.get_stats();
        REQUIRE(stats.discarded == 1);
        REQUIRE(stats.live == 1);
        REQUIRE(stats.resting == 0);

        // The replacement sees the same broken file
        REQUIRE_THROWS_AS(conn->execute("SELECT x FROM t"), sqlite_error);
    }
}

TEST_CASE("Closed pool", "[sqlite][pool]")
{
    temp_dir dir;
    sqlite_connection_pool pool(dir.file("closed.db"), 2);

    auto held = pool.acquire();
    {
        auto resting = pool.acquire();
    }
    pool.close();
    REQUIRE(pool.get_stats().live == 1);

    REQUIRE_THROWS_AS(pool.acquire(), std::logic_error);

    // Connections returned after close are closed, not pooled
    {
        auto released = std::move(held);
    }
    REQUIRE(pool.get_stats().live == 0);
}

TEST_CASE("Opening a database in a missing directory fails", "[sqlite][pool]")
{
    temp_dir dir;
    sqlite_connection_pool pool(dir.file("missing/dir/x.db"), 1);
    REQUIRE_THROWS_AS(pool.acquire(), sqlite_error);
    // The permit is handed back
    REQUIRE(pool.get_stats().available_permits == 1);
}
