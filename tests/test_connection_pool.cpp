#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

#include "fake_connection.hpp"
#include "poolhttp/config.hpp"
#include "poolhttp/connection/connection_pool.hpp"
#include "poolhttp/endpoint.hpp"

using namespace poolhttp;
using namespace poolhttp_test;
using namespace std::chrono_literals;

namespace {

    PoolKey make_key(std::string host = "localhost", std::string port = "80") {
        PoolKey key;
        key.endpoint.host = std::move(host);
        key.endpoint.port = std::move(port);
        return key;
    }

    PoolConfiguration default_cfg(std::size_t maxsize = 2, bool block = false) {
        PoolConfiguration cfg;
        cfg.maxsize = maxsize;
        cfg.block = block;
        return cfg;
    }

    struct PoolFixture {
        explicit PoolFixture(PoolConfiguration cfg)
            : state(std::make_shared<FakeState>()),
              pool(ConnectionPool::create(make_key(), cfg,
                                          make_fake_factory(state))) {}

        std::shared_ptr<FakeState> state;
        std::shared_ptr<ConnectionPool> pool;
    };

    TEST(ConnectionPoolTest, RejectsZeroMaxsizeAndMissingFactory) {
        auto state = std::make_shared<FakeState>();
        EXPECT_THROW(ConnectionPool::create(make_key(), default_cfg(0),
                                            make_fake_factory(state)),
                     std::invalid_argument);
        EXPECT_THROW(
            ConnectionPool::create(make_key(), default_cfg(), nullptr),
            std::invalid_argument);
    }

    TEST(ConnectionPoolTest, TryAcquireCreatesAndReusesIdle) {
        PoolFixture f(default_cfg());
        // First acquire creates new
        auto lease1 = f.pool->try_acquire();
        ASSERT_TRUE(lease1.has_value());
        Connection* conn1 = lease1.value().get();
        // Release returns to idle
        f.pool->release(std::move(lease1.value()));
        EXPECT_EQ(f.pool->stats().idle, 1U);
        // Next acquire reuses idle
        auto lease2 = f.pool->try_acquire();
        ASSERT_TRUE(lease2.has_value());
        EXPECT_EQ(lease2.value().get(), conn1);
        EXPECT_EQ(f.state->created.load(), 1);
        EXPECT_EQ(f.pool->metrics().connection_reused.load(), 1U);
        EXPECT_EQ(conn1->reuse_count(), 1U);
    }

    TEST(ConnectionPoolTest, LeaseDestructionReleases) {
        PoolFixture f(default_cfg());
        {
            auto lease = f.pool->try_acquire();
            ASSERT_TRUE(lease.has_value());
            EXPECT_EQ(f.pool->stats().checked_out, 1U);
        }
        auto s = f.pool->stats();
        EXPECT_EQ(s.checked_out, 0U);
        EXPECT_EQ(s.idle, 1U);
    }

    TEST(ConnectionPoolTest, IdleStoreIsLifo) {
        PoolFixture f(default_cfg(3));
        auto a = f.pool->try_acquire();
        auto b = f.pool->try_acquire();
        ASSERT_TRUE(a.has_value());
        ASSERT_TRUE(b.has_value());
        Connection* ca = a.value().get();
        Connection* cb = b.value().get();

        f.pool->release(std::move(a.value()));
        f.pool->release(std::move(b.value()));

        auto next = f.pool->try_acquire();
        ASSERT_TRUE(next.has_value());
        EXPECT_EQ(next.value().get(), cb);
        auto after = f.pool->try_acquire();
        ASSERT_TRUE(after.has_value());
        EXPECT_EQ(after.value().get(), ca);
    }

    TEST(ConnectionPoolTest, NonBlockingPoolFailsWhenFull) {
        PoolFixture f(default_cfg(2, false));
        auto l1 = f.pool->try_acquire();
        auto l2 = f.pool->acquire(1s);
        ASSERT_TRUE(l1.has_value());
        ASSERT_TRUE(l2.has_value());

        const auto start = std::chrono::steady_clock::now();
        auto l3 = f.pool->acquire(5s);
        EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
        ASSERT_TRUE(l3.has_error());
        EXPECT_EQ(l3.error().code, ErrorCode::PoolExhausted);
        EXPECT_EQ(f.pool->metrics().acquire_exhausted.load(), 1U);
    }

    TEST(ConnectionPoolTest, BlockingPoolWaitsForRelease) {
        PoolFixture f(default_cfg(1, true));

        auto first = f.pool->acquire(std::chrono::milliseconds(0));
        ASSERT_TRUE(first.has_value());

        // Zero timeout fails at once while the only slot is taken
        auto immediate = f.pool->acquire(std::chrono::milliseconds(0));
        ASSERT_TRUE(immediate.has_error());
        EXPECT_EQ(immediate.error().code, ErrorCode::PoolExhausted);

        Connection* held = first.value().get();
        std::thread releaser([&] {
            std::this_thread::sleep_for(50ms);
            f.pool->release(std::move(first.value()));
        });

        auto second = f.pool->acquire(5s);
        releaser.join();
        ASSERT_TRUE(second.has_value());
        EXPECT_EQ(second.value().get(), held);
        EXPECT_EQ(f.state->created.load(), 1);
    }

    TEST(ConnectionPoolTest, BlockingPoolTimesOut) {
        PoolFixture f(default_cfg(1, true));
        auto first = f.pool->acquire(std::nullopt);
        ASSERT_TRUE(first.has_value());

        const auto start = std::chrono::steady_clock::now();
        auto second = f.pool->acquire(100ms);
        const auto took = std::chrono::steady_clock::now() - start;
        ASSERT_TRUE(second.has_error());
        EXPECT_EQ(second.error().code, ErrorCode::PoolExhausted);
        EXPECT_GE(took, 90ms);
        EXPECT_EQ(f.pool->metrics().acquire_timeout.load(), 1U);
    }

    TEST(ConnectionPoolTest, DroppedIdleConnectionIsReplaced) {
        PoolFixture f(default_cfg(1, true));

        auto lease = f.pool->try_acquire();
        ASSERT_TRUE(lease.has_value());
        auto* fake = static_cast<FakeConnection*>(lease.value().get());
        f.pool->release(std::move(lease.value()));

        // Peer closes the socket while the connection sits idle
        fake->drop();

        auto fresh = f.pool->acquire(1s);
        ASSERT_TRUE(fresh.has_value());
        EXPECT_NE(fresh.value().get(), nullptr);
        EXPECT_EQ(f.state->created.load(), 2);
        EXPECT_EQ(f.pool->metrics().connection_dropped.load(), 1U);

        auto s = f.pool->stats();
        EXPECT_EQ(s.idle, 0U);
        EXPECT_EQ(s.checked_out, 1U);
        EXPECT_LE(s.idle + s.checked_out, s.maxsize);
    }

    TEST(ConnectionPoolTest, ExpiredIdleConnectionIsReplaced) {
        PoolConfiguration cfg = default_cfg(1);
        cfg.connection_idle_ttl = 20ms;
        PoolFixture f(cfg);

        {
            auto lease = f.pool->try_acquire();
            ASSERT_TRUE(lease.has_value());
        }
        std::this_thread::sleep_for(60ms);

        auto lease = f.pool->try_acquire();
        ASSERT_TRUE(lease.has_value());
        EXPECT_EQ(f.state->created.load(), 2);
        EXPECT_EQ(f.pool->metrics().connection_expired.load(), 1U);
    }

    TEST(ConnectionPoolTest, InvalidateClosesAndFreesSlot) {
        PoolFixture f(default_cfg(1));
        auto lease = f.pool->try_acquire();
        ASSERT_TRUE(lease.has_value());

        f.pool->invalidate(std::move(lease.value()));
        EXPECT_EQ(f.state->closed.load(), 1);
        auto s = f.pool->stats();
        EXPECT_EQ(s.idle, 0U);
        EXPECT_EQ(s.checked_out, 0U);
        EXPECT_EQ(f.pool->metrics().connection_invalidated.load(), 1U);

        auto again = f.pool->try_acquire();
        ASSERT_TRUE(again.has_value());
        EXPECT_EQ(f.state->created.load(), 2);
    }

    TEST(ConnectionPoolTest, MarkBadLeaseIsNotParked) {
        PoolFixture f(default_cfg(2));
        {
            auto lease = f.pool->try_acquire();
            ASSERT_TRUE(lease.has_value());
            lease.value().mark_bad();
        }
        EXPECT_EQ(f.pool->stats().idle, 0U);
        EXPECT_EQ(f.state->closed.load(), 1);
    }

    TEST(ConnectionPoolTest, CloseAllRefusesAcquireAndWakesWaiters) {
        PoolFixture f(default_cfg(1, true));
        auto held = f.pool->acquire(std::nullopt);
        ASSERT_TRUE(held.has_value());

        std::atomic<bool> done{false};
        ErrorCode waiter_code = ErrorCode::Unknown;
        std::thread waiter([&] {
            auto r = f.pool->acquire(std::nullopt);
            if (r.has_error()) waiter_code = r.error().code;
            done = true;
        });

        // Let the waiter block
        for (int i = 0; i < 100 && f.pool->stats().waiters == 0; ++i) {
            std::this_thread::sleep_for(5ms);
        }
        f.pool->close_all();
        waiter.join();

        EXPECT_TRUE(done.load());
        EXPECT_EQ(waiter_code, ErrorCode::PoolClosed);
        EXPECT_TRUE(f.pool->is_closed());

        auto after = f.pool->try_acquire();
        ASSERT_TRUE(after.has_error());
        EXPECT_EQ(after.error().code, ErrorCode::PoolClosed);

        // A connection returned after close is closed, not parked
        f.pool->release(std::move(held.value()));
        EXPECT_EQ(f.pool->stats().idle, 0U);
        EXPECT_EQ(f.pool->stats().checked_out, 0U);
    }

    TEST(ConnectionPoolTest, LeaseOutlivingPoolClosesConnection) {
        auto state = std::make_shared<FakeState>();
        auto pool = ConnectionPool::create(make_key(), default_cfg(),
                                           make_fake_factory(state));
        auto lease = pool->try_acquire();
        ASSERT_TRUE(lease.has_value());
        ConnectionPool::Lease kept = std::move(lease.value());
        pool.reset();

        EXPECT_EQ(state->closed.load(), 0);
        kept.reset();
        EXPECT_EQ(state->closed.load(), 1);
    }

    TEST(ConnectionPoolTest, FactoryFailureFreesSlot) {
        int calls = 0;
        auto pool = ConnectionPool::create(
            make_key(), default_cfg(1),
            [&calls](const PoolKey&) -> std::unique_ptr<Connection> {
                ++calls;
                throw std::runtime_error("no sockets left");
            });

        auto r = pool->try_acquire();
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, ErrorCode::ConnectionFailed);
        EXPECT_EQ(pool->stats().checked_out, 0U);

        auto again = pool->try_acquire();
        ASSERT_TRUE(again.has_error());
        EXPECT_EQ(calls, 2);
    }

    TEST(ConnectionPoolTest, CapacityHoldsUnderContention) {
        constexpr std::size_t kMax = 3;
        PoolFixture f(default_cfg(kMax, true));

        std::atomic<int> in_use{0};
        std::atomic<int> peak{0};
        std::atomic<int> failures{0};
        std::atomic<int> double_hand_outs{0};

        // Connections currently held by some lease
        std::mutex held_mu;
        std::set<const Connection*> held;

        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&] {
                for (int i = 0; i < 50; ++i) {
                    auto lease = f.pool->acquire(5s);
                    if (lease.has_error()) {
                        ++failures;
                        continue;
                    }
                    const Connection* conn = lease.value().get();
                    {
                        std::lock_guard<std::mutex> lk(held_mu);
                        if (!held.insert(conn).second) ++double_hand_outs;
                    }

                    int now = ++in_use;
                    int prev = peak.load();
                    while (now > prev &&
                           !peak.compare_exchange_weak(prev, now)) {
                    }
                    std::this_thread::yield();
                    --in_use;

                    {
                        std::lock_guard<std::mutex> lk(held_mu);
                        held.erase(conn);
                    }
                    f.pool->release(std::move(lease.value()));
                }
            });
        }
        for (auto& th : threads) th.join();

        EXPECT_EQ(failures.load(), 0);
        EXPECT_EQ(double_hand_outs.load(), 0);
        EXPECT_TRUE(held.empty());
        EXPECT_LE(peak.load(), static_cast<int>(kMax));
        EXPECT_LE(f.state->created.load(), static_cast<int>(kMax));

        auto s = f.pool->stats();
        EXPECT_EQ(s.checked_out, 0U);
        EXPECT_LE(s.idle, kMax);
    }

}  // namespace
