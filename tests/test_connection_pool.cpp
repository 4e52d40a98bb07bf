#include <catch2/catch_test_macros.hpp>
#include "db/generic_connection_pool.hpp"
#include "mocks/mock_connection.hpp"

#include <thread>

using namespace relsync;
using namespace relsync::testing;

TEST_CASE("Pool: pre-warms min_connections", "[pool]") {
    auto factory = std::make_shared<MockFactory>();

    PoolSettings config;
    config.min_connections = 2;
    config.max_connections = 4;

    GenericConnectionPool pool("db.test:5432/relsync", "dbname=relsync", config, factory);

    auto stats = pool.stats();
    CHECK(factory->total_created() == 2);
    CHECK(stats.open == 2);
    CHECK(stats.idle == 2);
    CHECK(stats.in_use == 0);
}

TEST_CASE("Pool: short max_lifetime causes connection recycling", "[pool][lifetime]") {
    auto factory = std::make_shared<MockFactory>();

    PoolSettings config;
    config.min_connections = 1;
    config.max_connections = 2;
    config.max_lifetime = std::chrono::seconds(1);

    GenericConnectionPool pool("db.test:5432/relsync", "dbname=relsync", config, factory);

    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(1200));

    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
        CHECK(conn->is_valid());
    }

    auto stats = pool.stats();
    CHECK(stats.expired_replaced >= 1);
    CHECK(factory->script()->closed.load() >= 1);
}

TEST_CASE("Pool: max_lifetime=0 disables recycling", "[pool][lifetime]") {
    auto factory = std::make_shared<MockFactory>();

    PoolSettings config;
    config.min_connections = 1;
    config.max_connections = 2;
    config.max_lifetime = std::chrono::seconds(0);

    GenericConnectionPool pool("db.test:5432/relsync", "dbname=relsync", config, factory);

    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
    }

    auto stats = pool.stats();
    CHECK(stats.expired_replaced == 0);
    CHECK(factory->total_created() == 1);
}

TEST_CASE("Pool: acquire times out when every connection is checked out", "[pool]") {
    auto factory = std::make_shared<MockFactory>();

    PoolSettings config;
    config.min_connections = 1;
    config.max_connections = 1;

    GenericConnectionPool pool("db.test:5432/relsync", "dbname=relsync", config, factory);

    auto held = pool.acquire();
    REQUIRE(held != nullptr);

    auto second = pool.acquire(std::chrono::milliseconds(50));
    CHECK(second == nullptr);
    CHECK(pool.stats().failed_acquires == 1);

    held.reset();
    auto third = pool.acquire(std::chrono::milliseconds(50));
    CHECK(third != nullptr);
}

TEST_CASE("Pool: discarded connection is dropped, not recycled", "[pool]") {
    auto factory = std::make_shared<MockFactory>();

    PoolSettings config;
    config.min_connections = 1;
    config.max_connections = 2;

    GenericConnectionPool pool("db.test:5432/relsync", "dbname=relsync", config, factory);

    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
        conn->discard();
        CHECK_FALSE(conn->is_valid());
    }

    auto stats = pool.stats();
    CHECK(stats.open == 0);
    CHECK(stats.idle == 0);
    CHECK(factory->script()->closed.load() == 1);

    // The slot was released: a fresh connection is created on demand
    auto conn = pool.acquire(std::chrono::milliseconds(50));
    REQUIRE(conn != nullptr);
    CHECK(factory->total_created() == 2);
}

TEST_CASE("Pool: unhealthy long-idle connection is replaced", "[pool][health]") {
    auto factory = std::make_shared<MockFactory>();

    PoolSettings config;
    config.min_connections = 1;
    config.max_connections = 1;
    config.idle_timeout = std::chrono::milliseconds(10);

    GenericConnectionPool pool("db.test:5432/relsync", "dbname=relsync", config, factory);

    factory->script()->healthy.store(false);
    std::this_thread::sleep_for(std::chrono::milliseconds(30));

    auto conn = pool.acquire();
    REQUIRE(conn != nullptr);
    CHECK(pool.stats().unhealthy_replaced == 1);
    CHECK(factory->total_created() == 2);
}

TEST_CASE("Pool: sessions are opened with the configured connection string", "[pool]") {
    auto factory = std::make_shared<MockFactory>();

    PoolSettings config;
    config.min_connections = 1;

    GenericConnectionPool pool("db.test:5432/relsync", "host=db.test dbname=relsync", config, factory);
    CHECK(factory->last_connection_string() == "host=db.test dbname=relsync");
}

TEST_CASE("Pool: factory failure yields nullptr", "[pool]") {
    auto factory = std::make_shared<MockFactory>();
    factory->set_fail(true);

    PoolSettings config;
    config.min_connections = 1;
    config.max_connections = 1;

    GenericConnectionPool pool("db.test:5432/relsync", "dbname=relsync", config, factory);
    CHECK(pool.stats().open == 0);

    auto conn = pool.acquire(std::chrono::milliseconds(50));
    CHECK(conn == nullptr);
    CHECK(pool.stats().failed_acquires == 1);

    // The failed attempt must not leak the semaphore slot
    factory->set_fail(false);
    auto retry = pool.acquire(std::chrono::milliseconds(50));
    CHECK(retry != nullptr);
}

TEST_CASE("Pool: drain closes idle connections and refuses acquires", "[pool]") {
    auto factory = std::make_shared<MockFactory>();

    PoolSettings config;
    config.min_connections = 2;
    config.max_connections = 2;

    GenericConnectionPool pool("db.test:5432/relsync", "dbname=relsync", config, factory);
    pool.drain();

    CHECK(factory->script()->closed.load() == 2);
    CHECK(pool.stats().open == 0);
    CHECK(pool.acquire(std::chrono::milliseconds(10)) == nullptr);
}

TEST_CASE("Pool: concurrent acquires never exceed max_connections", "[pool][concurrency]") {
    auto factory = std::make_shared<MockFactory>();

    PoolSettings config;
    config.min_connections = 0;
    config.max_connections = 3;

    GenericConnectionPool pool("db.test:5432/relsync", "dbname=relsync", config, factory);

    std::atomic<int> in_use{0};
    std::atomic<int> peak{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < 20; ++i) {
                auto conn = pool.acquire(std::chrono::milliseconds(2000));
                if (!conn) continue;
                const int now = in_use.fetch_add(1) + 1;
                int prev = peak.load();
                while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
                std::this_thread::sleep_for(std::chrono::microseconds(200));
                in_use.fetch_sub(1);
            }
        });
    }
    for (auto& w : workers) w.join();

    CHECK(peak.load() <= 3);
    CHECK(factory->total_created() <= 3);
    CHECK(pool.stats().acquires == pool.stats().releases);
}
