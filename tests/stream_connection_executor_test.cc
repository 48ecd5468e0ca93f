/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <boost/test/unit_test.hpp>
#include <seastar/core/sharded.hh>
#include <seastar/core/shared_future.hh>
#include <seastar/util/defer.hh>
#include <seastar/testing/test_case.hh>
#include <seastar/testing/thread_test_case.hh>

#include "streaming/stream_connection_executor.hh"
#include "streaming/stream_coordinator.hh"
#include "streaming/stream_exception.hh"
#include "streaming/stream_manager.hh"
#include "streaming/stream_session.hh"
#include "tests/eventually.hh"
#include "tests/stream_test_utils.hh"

using namespace streaming;
using namespace streaming::test;

namespace {

const gms::inet_address peer1("127.0.0.2");
const gms::inet_address peer2("127.0.0.3");
const gms::inet_address peer3("127.0.0.4");

size_t count_in_state(const stream_coordinator& coordinator, stream_session_state state) {
    size_t n = 0;
    for (auto& s : coordinator.get_all_stream_sessions()) {
        n += s->get_state() == state;
    }
    return n;
}

}

SEASTAR_THREAD_TEST_CASE(test_bounded_executor_limits_concurrency) {
    bounded_connection_executor executor(2, "test_establisher");
    BOOST_REQUIRE_EQUAL(executor.name(), "test_establisher");

    shared_promise<> release;
    size_t started = 0;
    size_t finished = 0;
    for (int i = 0; i < 5; ++i) {
        executor.submit([&] {
            ++started;
            return release.get_shared_future().then([&] {
                ++finished;
            });
        });
    }

    REQUIRE_EVENTUALLY_EQUAL(started, 2);
    BOOST_REQUIRE_EQUAL(executor.running(), 2);
    BOOST_REQUIRE_EQUAL(executor.waiters(), 3);
    BOOST_REQUIRE_EQUAL(executor.pending(), 5);

    release.set_value();
    executor.stop().get();
    BOOST_REQUIRE_EQUAL(started, 5);
    BOOST_REQUIRE_EQUAL(finished, 5);
    BOOST_REQUIRE_EQUAL(executor.running(), 0);
}

SEASTAR_THREAD_TEST_CASE(test_bounded_executor_zero_parallelism_runs_one) {
    bounded_connection_executor executor(0, "test_establisher");
    shared_promise<> release;
    size_t started = 0;
    for (int i = 0; i < 2; ++i) {
        executor.submit([&] {
            ++started;
            return release.get_shared_future();
        });
    }
    REQUIRE_EVENTUALLY_EQUAL(started, 1);
    BOOST_REQUIRE_EQUAL(executor.waiters(), 1);
    release.set_value();
    executor.stop().get();
    BOOST_REQUIRE_EQUAL(started, 2);
}

SEASTAR_THREAD_TEST_CASE(test_bounded_executor_survives_failing_task) {
    bounded_connection_executor executor(1, "test_establisher");
    bool second_ran = false;
    executor.submit([] {
        return make_exception_future<>(std::runtime_error("task failed"));
    });
    executor.submit([&] {
        second_ran = true;
        return make_ready_future<>();
    });
    executor.stop().get();
    BOOST_REQUIRE(second_ran);
}

SEASTAR_THREAD_TEST_CASE(test_bounded_executor_rejects_after_stop) {
    bounded_connection_executor executor(1, "test_establisher");
    executor.stop().get();
    BOOST_REQUIRE_THROW(executor.submit([] { return make_ready_future<>(); }), gate_closed_exception);
}

SEASTAR_THREAD_TEST_CASE(test_manager_executors_share_node_parallelism) {
    stream_config cfg;
    cfg.connection_establisher_parallelism = 2 * smp::count + 1;
    sharded<stream_manager> sm;
    sm.start(cfg,
            sharded_parameter([] { return shared_ptr<stream_connection_factory>(make_shared<failing_connection_factory>()); }),
            default_scheduling_group()).get();
    auto stop = defer([&] { sm.stop().get(); });

    auto total = sm.map_reduce0([] (stream_manager& m) {
        return dynamic_cast<bounded_connection_executor&>(m.connection_executor()).parallelism();
    }, size_t(0), std::plus<size_t>()).get();
    BOOST_REQUIRE_EQUAL(total, cfg.establisher_parallelism());
    BOOST_REQUIRE_EQUAL(dynamic_cast<bounded_connection_executor&>(sm.local().connection_executor()).parallelism(),
            cfg.establisher_parallelism_of_shard(this_shard_id(), smp::count));
}

SEASTAR_THREAD_TEST_CASE(test_connect_three_peers_two_sessions_each) {
    bounded_connection_executor executor(4, "test_establisher");
    auto factory = make_shared<blocking_connection_factory>();
    factory->block(peer1);
    stream_coordinator coordinator(2, factory, executor);

    for (auto peer : {peer1, peer2, peer3}) {
        coordinator.get_or_create_next_session(peer);
        coordinator.get_or_create_next_session(peer);
    }
    BOOST_REQUIRE_EQUAL(coordinator.get_all_stream_sessions().size(), 6);

    coordinator.connect_all_stream_sessions();

    // The blocked peer holds two establishment slots; the other peers still connect.
    REQUIRE_EVENTUALLY_EQUAL(count_in_state(coordinator, stream_session_state::PREPARING), 4);
    BOOST_REQUIRE_EQUAL(factory->in_flight(), 2);
    for (auto& s : coordinator.get_all_stream_sessions()) {
        if (s->peer == peer1) {
            BOOST_REQUIRE(s->get_state() == stream_session_state::INITIALIZED);
        } else {
            BOOST_REQUIRE(s->get_state() == stream_session_state::PREPARING);
        }
    }

    factory->release(peer1);
    REQUIRE_EVENTUALLY_EQUAL(count_in_state(coordinator, stream_session_state::PREPARING), 6);
    BOOST_REQUIRE_EQUAL(factory->dials(), 6);
    BOOST_REQUIRE_LE(factory->max_in_flight(), 4);

    coordinator.stop().get();
    executor.stop().get();
    BOOST_REQUIRE(!coordinator.has_active_sessions());
}

SEASTAR_THREAD_TEST_CASE(test_connection_establishment_is_bounded) {
    bounded_connection_executor executor(2, "test_establisher");
    auto factory = make_shared<blocking_connection_factory>();
    for (auto peer : {peer1, peer2, peer3}) {
        factory->block(peer);
    }
    stream_coordinator coordinator(1, factory, executor);
    for (auto peer : {peer1, peer2, peer3}) {
        coordinator.get_or_create_next_session(peer);
    }

    coordinator.connect_all_stream_sessions();
    REQUIRE_EVENTUALLY_EQUAL(factory->dials(), 2);
    BOOST_REQUIRE_EQUAL(executor.waiters(), 1);

    for (auto peer : {peer1, peer2, peer3}) {
        factory->release(peer);
    }
    REQUIRE_EVENTUALLY_EQUAL(count_in_state(coordinator, stream_session_state::PREPARING), 3);
    BOOST_REQUIRE_EQUAL(factory->max_in_flight(), 2);

    coordinator.stop().get();
    executor.stop().get();
}

SEASTAR_THREAD_TEST_CASE(test_session_aborted_while_connecting) {
    bounded_connection_executor executor(1, "test_establisher");
    auto factory = make_shared<blocking_connection_factory>();
    factory->block(peer1);
    stream_coordinator coordinator(1, factory, executor);
    auto session = coordinator.get_or_create_next_session(peer1);

    coordinator.connect_all_stream_sessions();
    REQUIRE_EVENTUALLY_EQUAL(factory->dials(), 1);
    session->abort();
    BOOST_REQUIRE(session->get_state() == stream_session_state::FAILED);

    factory->release(peer1);
    executor.stop().get();
    BOOST_REQUIRE(session->get_state() == stream_session_state::FAILED);
    coordinator.stop().get();
}

namespace {

// Fails the first dials, then connects.
class flaky_connection_factory final : public stream_connection_factory {
    size_t _failures_left;
    size_t _attempts = 0;
public:
    explicit flaky_connection_factory(size_t failures)
        : _failures_left(failures) {
    }
    virtual future<std::unique_ptr<stream_connection>> create_connection(gms::inet_address peer, gms::inet_address connecting) override {
        ++_attempts;
        if (_failures_left) {
            --_failures_left;
            return make_exception_future<std::unique_ptr<stream_connection>>(std::runtime_error("connection refused"));
        }
        auto [client, server] = make_loopback_connection();
        return make_ready_future<std::unique_ptr<stream_connection>>(std::move(client));
    }
    size_t attempts() const {
        return _attempts;
    }
};

}

SEASTAR_TEST_CASE(test_retrying_factory_retries_failed_dials) {
    auto dialer = make_shared<flaky_connection_factory>(2);
    auto factory = make_shared<retrying_connection_factory>(dialer, 3, std::chrono::milliseconds(1));
    return factory->create_connection(peer1, peer1).then([dialer, factory] (std::unique_ptr<stream_connection> conn) {
        BOOST_REQUIRE(conn);
        BOOST_REQUIRE_EQUAL(dialer->attempts(), 3);
        return conn->close().finally([conn = std::move(conn)] {});
    });
}

SEASTAR_TEST_CASE(test_retrying_factory_gives_up) {
    auto dialer = make_shared<failing_connection_factory>();
    auto factory = make_shared<retrying_connection_factory>(dialer, 3, std::chrono::milliseconds(1));
    return factory->create_connection(peer1, peer2).then_wrapped([dialer, factory] (future<std::unique_ptr<stream_connection>> f) {
        BOOST_REQUIRE(f.failed());
        BOOST_REQUIRE_THROW(f.get(), stream_connection_exception);
        BOOST_REQUIRE_EQUAL(dialer->attempts(), 3);
    });
}
