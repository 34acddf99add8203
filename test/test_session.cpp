#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include "fileshare/session/admission_gate.h"
#include "fileshare/session/event_broadcaster.h"
#include "fileshare/session/transfer_log.h"
#include "fileshare/session/transfer_session.h"
#include "fileshare/session/transfer_status.h"

using namespace fileshare;
using json = nlohmann::json;
using Catch::Matchers::EndsWith;
using Catch::Matchers::StartsWith;

namespace {

std::filesystem::path make_temp_file(const std::string& name, size_t size) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << std::string(size, 'x');
    return path;
}

} // anonymous namespace

TEST_CASE("Transfer Log Timestamps Entries", "[session][log]") {
    TransferLog log(10);
    std::string entry = log.append("Client 1.2.3.4 connected");

    REQUIRE_THAT(entry, StartsWith("["));
    REQUIRE_THAT(entry, EndsWith("] Client 1.2.3.4 connected"));
    // "[HH:MM:SS] "
    REQUIRE(entry.size() == std::string("[00:00:00] Client 1.2.3.4 connected").size());
    REQUIRE(log.size() == 1);
    REQUIRE(log.entries().front() == entry);
}

TEST_CASE("Transfer Log Drops Oldest Past Capacity", "[session][log]") {
    TransferLog log(3);
    for (int i = 0; i < 5; ++i) {
        log.append("line " + std::to_string(i));
    }

    auto entries = log.entries();
    REQUIRE(entries.size() == 3);
    REQUIRE_THAT(entries[0], EndsWith("line 2"));
    REQUIRE_THAT(entries[1], EndsWith("line 3"));
    REQUIRE_THAT(entries[2], EndsWith("line 4"));
}

TEST_CASE("Transfer Log Default Capacity", "[session][log]") {
    TransferLog log;
    for (int i = 1; i <= 100; ++i) {
        log.append("entry " + std::to_string(i));
    }
    REQUIRE(log.capacity() == 100);
    REQUIRE(log.size() == 100);
    REQUIRE_THAT(log.entries().front(), EndsWith("] entry 1"));

    log.append("entry 101");
    auto entries = log.entries();
    REQUIRE(entries.size() == 100);
    REQUIRE_THAT(entries.front(), EndsWith("] entry 2"));
    REQUIRE_THAT(entries.back(), EndsWith("] entry 101"));
    for (const auto& entry : entries) {
        REQUIRE_FALSE(entry.substr(entry.find(']')) == "] entry 1");
    }
}

TEST_CASE("Admission Gate Single Holder", "[session][gate]") {
    AdmissionGate gate;

    SECTION("First peer is admitted, others rejected") {
        REQUIRE(gate.try_acquire("10.0.0.1"));
        REQUIRE_FALSE(gate.try_acquire("10.0.0.2"));
        REQUIRE(gate.holder() == std::optional<std::string>("10.0.0.1"));
    }

    SECTION("Holder may re-enter") {
        REQUIRE(gate.try_acquire("10.0.0.1"));
        REQUIRE(gate.try_acquire("10.0.0.1"));
    }

    SECTION("Release by non-holder is ignored") {
        REQUIRE(gate.try_acquire("10.0.0.1"));
        REQUIRE_FALSE(gate.release("10.0.0.2"));
        REQUIRE(gate.holder().has_value());
        REQUIRE(gate.release("10.0.0.1"));
        REQUIRE_FALSE(gate.holder().has_value());
        REQUIRE(gate.try_acquire("10.0.0.2"));
    }

    SECTION("Force release returns previous holder") {
        REQUIRE_FALSE(gate.force_release().has_value());
        REQUIRE(gate.try_acquire("10.0.0.1"));
        auto previous = gate.force_release();
        REQUIRE(previous.has_value());
        REQUIRE(*previous == "10.0.0.1");
        REQUIRE_FALSE(gate.release("10.0.0.1"));
    }
}

TEST_CASE("Transfer Mode Parsing", "[session][status]") {
    REQUIRE(parse_transfer_mode("send") == TransferMode::Send);
    REQUIRE(parse_transfer_mode("recv") == TransferMode::Recv);
    REQUIRE_FALSE(parse_transfer_mode("upload").has_value());
    REQUIRE(to_string(TransferMode::Recv) == "recv");
    REQUIRE(to_string(TransferPhase::Transferring) == "transferring");
    REQUIRE(is_terminal(TransferPhase::Error));
    REQUIRE_FALSE(is_terminal(TransferPhase::Waiting));
}

TEST_CASE("Transfer Status Lifecycle", "[session][status]") {
    TransferStatus status(TransferMode::Send, "data.bin", 1000);

    auto initial = status.snapshot();
    REQUIRE(initial.phase == TransferPhase::Waiting);
    REQUIRE(initial.total_size == 1000);
    REQUIRE(initial.transferred_bytes == 0);

    uint64_t attempt = status.begin(1000);
    REQUIRE(status.is_current(attempt));

    auto half = status.advance(attempt, 500);
    REQUIRE(half.has_value());
    REQUIRE(half->phase == TransferPhase::Transferring);
    REQUIRE(half->progress_percent == 50.0);

    SECTION("Progress never decreases") {
        auto again = status.advance(attempt, 200);
        REQUIRE(again.has_value());
        REQUIRE(again->transferred_bytes == 500);
    }

    SECTION("Overshoot raises the total") {
        auto over = status.advance(attempt, 1500);
        REQUIRE(over.has_value());
        REQUIRE(over->total_size == 1500);
        REQUIRE(over->progress_percent == 100.0);
    }

    SECTION("Completion forces 100 percent") {
        auto done = status.complete(attempt);
        REQUIRE(done.has_value());
        REQUIRE(done->phase == TransferPhase::Completed);
        REQUIRE(done->progress_percent == 100.0);
        REQUIRE_FALSE(status.advance(attempt, 900).has_value());
    }

    SECTION("Failure records the message") {
        auto failed = status.fail(attempt, "disk full");
        REQUIRE(failed.has_value());
        REQUIRE(failed->phase == TransferPhase::Error);
        REQUIRE(failed->last_error == "disk full");
    }

    SECTION("Cancel supersedes the running attempt") {
        auto cancelled = status.cancel();
        REQUIRE(cancelled.phase == TransferPhase::Cancelled);
        REQUIRE_FALSE(status.is_current(attempt));
        REQUIRE_FALSE(status.advance(attempt, 900).has_value());
        REQUIRE_FALSE(status.complete(attempt).has_value());
        REQUIRE(status.snapshot().transferred_bytes == 500);
    }

    SECTION("A new attempt restarts the counters") {
        REQUIRE(status.complete(attempt).has_value());
        uint64_t next = status.begin(2000);
        REQUIRE(next != attempt);
        auto snap = status.snapshot();
        REQUIRE(snap.phase == TransferPhase::Transferring);
        REQUIRE(snap.transferred_bytes == 0);
        REQUIRE(snap.total_size == 2000);
        REQUIRE(snap.progress_percent == 0.0);
    }
}

TEST_CASE("Transfer Status Zero Size Progress", "[session][status]") {
    TransferStatus status(TransferMode::Recv, "incoming");
    uint64_t attempt = status.begin(0);
    auto snap = status.snapshot();
    REQUIRE(snap.progress_percent == 0.0);
    REQUIRE(status.complete(attempt).has_value());
    REQUIRE(status.snapshot().progress_percent == 100.0);
}

TEST_CASE("Status Snapshot JSON Fields", "[session][status]") {
    TransferStatus status(TransferMode::Send, "report.pdf", 300);
    uint64_t attempt = status.begin(300);
    REQUIRE(status.advance(attempt, 100).has_value());

    auto snap = status.snapshot();
    snap.active_peer = "192.168.1.20";
    auto j = json::parse(snap.to_json());

    REQUIRE(j["mode"] == "send");
    REQUIRE(j["path"] == "report.pdf");
    REQUIRE(j["size"] == 300);
    REQUIRE(j["transferred"] == 100);
    REQUIRE(j["progress"].get<double>() == 33.33);
    REQUIRE(j["status"] == "transferring");
    REQUIRE(j["error"] == "");
    REQUIRE(j["client_ip"] == "192.168.1.20");
    REQUIRE(j.contains("start_time"));
    REQUIRE(j.contains("last_update_time"));
}

TEST_CASE("Event Channel Is Bounded", "[session][events]") {
    EventChannel channel(2);
    REQUIRE(channel.try_push("a"));
    REQUIRE(channel.try_push("b"));
    REQUIRE_FALSE(channel.try_push("c"));
    REQUIRE(channel.dropped() == 1);

    REQUIRE(channel.try_pop() == std::optional<std::string>("a"));
    REQUIRE(channel.try_pop() == std::optional<std::string>("b"));
    REQUIRE_FALSE(channel.try_pop().has_value());

    channel.close();
    REQUIRE(channel.is_closed());
    REQUIRE_FALSE(channel.try_push("d"));
}

TEST_CASE("Event Broadcaster Fan Out", "[session][events]") {
    EventBroadcaster broadcaster(4);
    auto first = broadcaster.subscribe();
    auto second = broadcaster.subscribe();
    REQUIRE(broadcaster.subscriber_count() == 2);

    REQUIRE(broadcaster.publish("status") == 2);
    REQUIRE(first->try_pop() == std::optional<std::string>("status"));
    REQUIRE(second->try_pop() == std::optional<std::string>("status"));

    SECTION("Unsubscribe closes the channel and is idempotent") {
        broadcaster.unsubscribe(first);
        broadcaster.unsubscribe(first);
        REQUIRE(first->is_closed());
        REQUIRE(broadcaster.subscriber_count() == 1);
        REQUIRE(broadcaster.publish("next") == 1);
    }

    SECTION("A slow observer does not block others") {
        for (int i = 0; i < 4; ++i) {
            second->try_push("filler");
        }
        REQUIRE(broadcaster.publish("update") == 1);
        REQUIRE(first->try_pop() == std::optional<std::string>("update"));
        REQUIRE(second->dropped() == 1);
    }

    SECTION("Dropped subscriber handles are pruned") {
        second.reset();
        REQUIRE(broadcaster.publish("ping") == 1);
        REQUIRE(broadcaster.subscriber_count() == 1);
    }

    SECTION("Close all ends every channel") {
        broadcaster.close_all();
        REQUIRE(first->is_closed());
        REQUIRE(second->is_closed());
        REQUIRE(broadcaster.subscriber_count() == 0);
    }
}

TEST_CASE("Transfer Session Initial State", "[session]") {
    auto path = make_temp_file("fileshare_session_initial.bin", 2048);
    TransferSession session(TransferMode::Send, path);

    auto snap = session.snapshot();
    REQUIRE(snap.mode == TransferMode::Send);
    REQUIRE(snap.target_name == "fileshare_session_initial.bin");
    REQUIRE(snap.total_size == 2048);
    REQUIRE(snap.phase == TransferPhase::Waiting);
    REQUIRE(snap.active_peer.empty());
    REQUIRE_FALSE(session.finished());

    std::filesystem::remove(path);
}

TEST_CASE("Transfer Session Admission And Log", "[session]") {
    auto dir = std::filesystem::temp_directory_path() / "fileshare_session_recv";
    std::filesystem::create_directories(dir);
    auto session = std::make_shared<TransferSession>(TransferMode::Recv, dir);

    REQUIRE(session->try_admit("10.0.0.5"));
    REQUIRE_FALSE(session->try_admit("10.0.0.6"));
    REQUIRE(session->snapshot().active_peer == "10.0.0.5");

    {
        PeerLease lease(session, "10.0.0.5");
    }
    REQUIRE_FALSE(session->active_peer().has_value());

    auto entries = session->log_entries();
    REQUIRE(entries.size() == 1);
    REQUIRE_THAT(entries.back(), EndsWith("Client 10.0.0.5 disconnected"));

    // Releasing a peer that does not hold the slot logs nothing
    REQUIRE_FALSE(session->release_peer("10.0.0.6"));
    REQUIRE(session->log_entries().size() == 1);

    std::filesystem::remove_all(dir);
}

TEST_CASE("Transfer Session Cancel", "[session]") {
    auto path = make_temp_file("fileshare_session_cancel.bin", 100);
    TransferSession session(TransferMode::Send, path);
    auto observer = session.subscribe();

    REQUIRE(session.try_admit("10.0.0.7"));
    uint64_t attempt = session.begin_transfer(100);
    REQUIRE(session.report_progress(attempt, 40));

    auto snap = session.cancel("10.0.0.9");
    REQUIRE(snap.phase == TransferPhase::Cancelled);
    REQUIRE(snap.active_peer.empty());
    REQUIRE(snap.transferred_bytes == 40);
    REQUIRE(session.finished());

    // The superseded attempt can no longer change the record
    REQUIRE_FALSE(session.is_current(attempt));
    REQUIRE_FALSE(session.report_progress(attempt, 80));
    REQUIRE_FALSE(session.complete_transfer(attempt));
    REQUIRE(session.snapshot().phase == TransferPhase::Cancelled);

    auto entries = session.log_entries();
    REQUIRE(entries.size() == 2);
    REQUIRE_THAT(entries[0], EndsWith("Client 10.0.0.7 disconnected"));
    REQUIRE_THAT(entries[1], EndsWith("Transfer cancelled by 10.0.0.9"));

    // Observers saw the updates, ending with the cancelled status
    std::optional<std::string> last;
    while (auto message = observer->try_pop()) {
        last = message;
    }
    REQUIRE(last.has_value());
    REQUIRE(json::parse(*last)["status"] == "cancelled");

    std::filesystem::remove(path);
}

TEST_CASE("Transfer Session Failure", "[session]") {
    auto path = make_temp_file("fileshare_session_fail.bin", 10);
    TransferSession session(TransferMode::Send, path);

    uint64_t attempt = session.begin_transfer(10);
    REQUIRE(session.fail_transfer(attempt, "peer went away"));
    REQUIRE_FALSE(session.fail_transfer(attempt, "again"));

    auto snap = session.snapshot();
    REQUIRE(snap.phase == TransferPhase::Error);
    REQUIRE(snap.last_error == "peer went away");
    REQUIRE_THAT(session.log_entries().back(), EndsWith("Transfer failed: peer went away"));
    REQUIRE(session.finished());

    std::filesystem::remove(path);
}
