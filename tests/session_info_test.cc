/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <boost/test/unit_test.hpp>
#include <seastar/testing/thread_test_case.hh>
#include <fmt/format.h>

#include "streaming/session_info.hh"
#include "streaming/stream_message.hh"
#include "streaming/stream_transfer_task.hh"
#include "streaming/stream_receive_task.hh"

using namespace streaming;

namespace {

const gms::inet_address peer("127.0.0.2");

}

SEASTAR_THREAD_TEST_CASE(test_progress_info_completion) {
    progress_info p(peer, 0, "f1", progress_info::direction::OUT, 0, 100);
    BOOST_REQUIRE(!p.is_completed());
    p.current_bytes = 100;
    BOOST_REQUIRE(p.is_completed());

    progress_info empty(peer, 0, "f2", progress_info::direction::IN, 0, 0);
    BOOST_REQUIRE(empty.is_completed());
    BOOST_REQUIRE_EQUAL(fmt::format("{}", empty), "f2 0/0 (100.0%) received from 127.0.0.2 ID#0");
}

SEASTAR_THREAD_TEST_CASE(test_session_info_totals) {
    session_info si(peer, 1, peer,
            {stream_summary("ks.a", 2, 300)},
            {stream_summary("ks.b", 1, 50), stream_summary("ks.c", 3, 10)},
            stream_session_state::STREAMING);

    BOOST_REQUIRE_EQUAL(si.get_total_files_to_receive(), 2);
    BOOST_REQUIRE_EQUAL(si.get_total_size_to_receive(), 300);
    BOOST_REQUIRE_EQUAL(si.get_total_files_to_send(), 4);
    BOOST_REQUIRE_EQUAL(si.get_total_size_to_send(), 60);

    si.update_progress(progress_info(peer, 1, "r1", progress_info::direction::IN, 100, 100));
    si.update_progress(progress_info(peer, 1, "r2", progress_info::direction::IN, 50, 200));
    si.update_progress(progress_info(peer, 1, "s1", progress_info::direction::OUT, 0, 50));
    BOOST_REQUIRE_EQUAL(si.get_total_files_received(), 1);
    BOOST_REQUIRE_EQUAL(si.get_total_size_received(), 150);
    BOOST_REQUIRE_EQUAL(si.get_total_files_sent(), 0);

    // A newer report for the same file replaces the previous one.
    si.update_progress(progress_info(peer, 1, "s1", progress_info::direction::OUT, 50, 50));
    BOOST_REQUIRE_EQUAL(si.get_sending_files().size(), 1u);
    BOOST_REQUIRE_EQUAL(si.get_total_files_sent(), 1);
    BOOST_REQUIRE_EQUAL(si.get_total_size_sent(), 50);

    BOOST_REQUIRE_EQUAL(fmt::format("{}", si), "[peer=127.0.0.2, ID#1, state=STREAMING, files received=1/2, files sent=1/4]");
}

SEASTAR_THREAD_TEST_CASE(test_session_info_rejects_foreign_progress) {
    session_info si(peer, 1, peer, {}, {}, stream_session_state::PREPARING);
    BOOST_REQUIRE_THROW(si.update_progress(progress_info(peer, 2, "f", progress_info::direction::IN, 1, 1)), std::invalid_argument);
    BOOST_REQUIRE_THROW(si.update_progress(progress_info(gms::inet_address("127.0.0.3"), 1, "f", progress_info::direction::IN, 1, 1)), std::invalid_argument);
    BOOST_REQUIRE(si.get_receiving_files().empty());
}

SEASTAR_THREAD_TEST_CASE(test_transfer_task) {
    stream_transfer_task task("ks.cf");
    BOOST_REQUIRE(task.is_completed());
    task.add_file({"a", 10});
    task.add_file({"b", 20});
    BOOST_REQUIRE_THROW(task.add_file({"a", 5}), std::invalid_argument);
    BOOST_REQUIRE(task.get_summary() == stream_summary("ks.cf", 2, 30));
    BOOST_REQUIRE(!task.is_completed());

    BOOST_REQUIRE_EQUAL(task.complete("b"), 20);
    BOOST_REQUIRE_THROW(task.complete("b"), std::runtime_error);
    BOOST_REQUIRE_THROW(task.complete("unknown"), std::runtime_error);
    BOOST_REQUIRE_EQUAL(task.complete("a"), 10);
    BOOST_REQUIRE(task.is_completed());
    // The summary describes the whole task, acknowledged or not.
    BOOST_REQUIRE(task.get_summary() == stream_summary("ks.cf", 2, 30));
}

SEASTAR_THREAD_TEST_CASE(test_receive_task) {
    stream_receive_task task("ks.cf", 2, 30);
    BOOST_REQUIRE(!task.is_completed());
    BOOST_REQUIRE(task.received("a"));
    BOOST_REQUIRE(!task.received("a"));
    BOOST_REQUIRE(!task.is_completed());
    BOOST_REQUIRE(task.received("b"));
    BOOST_REQUIRE(task.is_completed());
    BOOST_REQUIRE(task.get_summary() == stream_summary("ks.cf", 2, 30));
}

SEASTAR_THREAD_TEST_CASE(test_stream_message_format) {
    stream_message file = file_message{"ks.cf", "f1", 42};
    BOOST_REQUIRE_EQUAL(fmt::format("{}", file), "FILE(ks.cf/f1, size=42)");
    stream_message complete = complete_message{};
    BOOST_REQUIRE_EQUAL(fmt::format("{}", complete), "COMPLETE");
}
