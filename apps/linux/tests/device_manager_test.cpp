#include "debug_utils.h"
#include "pen_device_manager.h"
#include "test_fakes.h"

#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

using namespace std::chrono;

// Manager wired to fakes; the raw pointers stay owned by the manager.
struct Rig {
    FakeClock clock;
    FakeSleeper sleeper;
    std::shared_ptr<FakeLinkAdapter> adapter = std::make_shared<FakeLinkAdapter>();
    FakeLinkSession* session = nullptr;
    FakeRadio* radio = nullptr;
    FakeRadio* probe = nullptr;
    std::unique_ptr<PenDeviceManager> mgr;

    explicit Rig(RadioState radio_state = RadioState::Ok,
                 RadioState probe_state = RadioState::Ok) {
        adapter->peers = {
            make_peer("AA:AA:AA:AA:AA:01", "Cpen-A"),
            make_peer("AA:AA:AA:AA:AA:02", "cpen-B"),
            make_peer("BB:BB:BB:BB:BB:03", "Keyboard"),
        };
        session = new FakeLinkSession();
        session->replies["getTotp"] = std::string("123456\n\0", 8);
        session->replies["getId"] = "PEN-0001";
        radio = new FakeRadio(radio_state);
        probe = new FakeRadio(probe_state);

        mgr.reset(new PenDeviceManager(adapter,
                                       std::unique_ptr<LinkSession>(session),
                                       std::unique_ptr<RadioCapability>(radio),
                                       std::unique_ptr<RadioCapability>(probe),
                                       DeviceManagerOptions(),
                                       clock.fn(),
                                       sleeper.fn()));
    }

    bool slept(milliseconds d) const {
        for (auto s : sleeper.calls) {
            if (s == d) return true;
        }
        return false;
    }
};

static bool test_single_session() {
    Rig rig;
    rig.mgr->ensure_connected();
    rig.mgr->ensure_connected();

    TEST_ASSERT(rig.session->connects.size() == 1, "second ensure_connected must reuse the link");
    TEST_ASSERT(rig.session->connects[0] == "AA:AA:AA:AA:AA:01", "first matching peer is chosen");
    TEST_ASSERT(rig.adapter->scans == 1, "a live link skips the scan");
    TEST_ASSERT(rig.mgr->phase() == ConnectionPhase::Connected, "phase is connected");
    TEST_ASSERT(rig.slept(milliseconds(500)), "settle pause after connect");
    return true;
}

static bool test_name_prefix_filter() {
    Rig rig;
    rig.adapter->peers = { make_peer("11:11", "Keyboard"), make_peer("22:22", "CPENx") };
    rig.mgr->ensure_connected();
    TEST_ASSERT(rig.session->connects.back() == "22:22", "prefix match is case-insensitive");

    Rig none;
    none.adapter->peers = { make_peer("11:11", "Keyboard"), make_peer("33:33", "cpe") };
    try {
        none.mgr->ensure_connected();
        TEST_ASSERT(false, "expected NoMatchingDevice");
    } catch (const PenError& e) {
        TEST_ASSERT(e.kind() == PenErrorKind::NoMatchingDevice, "kind is NoMatchingDevice");
    }
    TEST_ASSERT(none.mgr->phase() == ConnectionPhase::Disconnected, "phase back to disconnected");
    TEST_ASSERT(none.session->connects.empty(), "nothing connected");
    return true;
}

static bool test_totp_cache_and_set_time() {
    Rig rig;
    std::string code = rig.mgr->get_totp();
    TEST_ASSERT(code == "123456", "trailing newline and NUL are trimmed, got '" << code << "'");
    TEST_ASSERT(rig.session->count_sent("setTime:") == 1, "setTime precedes getTotp");
    TEST_ASSERT(rig.session->sent.size() == 2 && rig.session->sent[1] == "getTotp", "getTotp sent after setTime");
    TEST_ASSERT(rig.session->listens == 1, "listener armed once per link");

    rig.clock.advance(seconds(24));
    TEST_ASSERT(rig.mgr->get_totp() == "123456", "cached code at 24s");
    TEST_ASSERT(rig.session->count_sent("getTotp") == 1, "no traffic while the code is fresh");

    rig.clock.advance(seconds(1));
    rig.mgr->get_totp();
    TEST_ASSERT(rig.session->count_sent("getTotp") == 2, "fresh fetch once the code is 25s old");
    return true;
}

static bool test_reconnect_retry() {
    Rig rig;
    rig.session->drop_on_receive["getTotp"] = 1;

    std::string code = rig.mgr->get_totp();
    TEST_ASSERT(code == "123456", "code returned after one reconnect");
    TEST_ASSERT(rig.session->connects.size() == 2, "exactly one reconnect");
    TEST_ASSERT(rig.session->count_sent("getTotp") == 2, "getTotp sent twice");
    TEST_ASSERT(rig.session->disconnects >= 1, "dropped link is torn down before reconnect");
    TEST_ASSERT(rig.session->count_sent("setTime:") == 2, "clock set again on the new link");
    TEST_ASSERT(rig.session->sent.size() == 4 &&
                rig.session->sent[2].rfind("setTime:", 0) == 0 &&
                rig.session->sent[3] == "getTotp", "setTime precedes the retried getTotp");

    rig.mgr->get_totp();
    TEST_ASSERT(rig.session->count_sent("getTotp") == 2, "code cached after the retried fetch");
    return true;
}

static bool test_retry_budget() {
    Rig rig;
    rig.session->drop_on_receive["getId"] = 10;
    try {
        rig.mgr->get_device_id();
        TEST_ASSERT(false, "expected ConnectionDropped");
    } catch (const PenError& e) {
        TEST_ASSERT(e.kind() == PenErrorKind::ConnectionDropped, "link failure surfaces");
    }
    TEST_ASSERT(rig.session->count_sent("getId") == 3, "one attempt plus two retries");
    return true;
}

static bool test_protocol_errors_not_retried() {
    Rig rig;
    rig.session->replies.erase("getId");
    try {
        rig.mgr->get_device_id();
        TEST_ASSERT(false, "expected ProtocolTimeout");
    } catch (const PenError& e) {
        TEST_ASSERT(e.kind() == PenErrorKind::ProtocolTimeout, "timeout propagates");
    }
    TEST_ASSERT(rig.session->count_sent("getId") == 1, "timeouts are not retried");
    TEST_ASSERT(rig.session->connects.size() == 1, "no reconnect on timeout");
    return true;
}

static bool test_disconnect_clears_identity() {
    Rig rig;
    rig.mgr->get_device_id();
    rig.mgr->get_totp();

    rig.mgr->disconnect();
    TEST_ASSERT(rig.mgr->phase() == ConnectionPhase::Disconnected, "phase disconnected");
    TEST_ASSERT(!rig.mgr->is_connected(), "not connected");
    TEST_ASSERT(!rig.mgr->current_device(), "no current device");

    rig.mgr->get_device_id();
    TEST_ASSERT(rig.session->count_sent("getId") == 2, "device id fetched again after disconnect");
    rig.mgr->get_totp();
    TEST_ASSERT(rig.session->count_sent("getTotp") == 2, "TOTP fetched again after disconnect");

    rig.mgr->disconnect();
    rig.mgr->disconnect();
    TEST_ASSERT(rig.mgr->connection_status() == "disconnected", "repeated disconnect is harmless");
    return true;
}

static bool test_radio_fallback() {
    Rig rig(RadioState::Denied, RadioState::Ok);
    rig.mgr->ensure_connected();
    TEST_ASSERT(rig.radio->calls == 1 && rig.probe->calls == 1, "probe consulted after primary failed");
    TEST_ASSERT(rig.session->connects.size() == 1, "connected through the fallback");

    Rig dead(RadioState::Unavailable, RadioState::Unavailable);
    try {
        dead.mgr->ensure_connected();
        TEST_ASSERT(false, "expected RadioUnavailable");
    } catch (const PenError& e) {
        TEST_ASSERT(e.kind() == PenErrorKind::RadioUnavailable, "kind is RadioUnavailable");
    }
    TEST_ASSERT(dead.adapter->scans == 0, "no scan without a radio");
    return true;
}

static bool test_invalid_utf8() {
    Rig rig;
    rig.session->replies["getId"] = std::string("\xff\xfe", 2);
    try {
        rig.mgr->get_device_id();
        TEST_ASSERT(false, "expected EncodingError");
    } catch (const PenError& e) {
        TEST_ASSERT(e.kind() == PenErrorKind::EncodingError, "kind is EncodingError");
    }
    rig.session->replies["getId"] = "PEN-0002";
    TEST_ASSERT(rig.mgr->get_device_id() == "PEN-0002", "bad reply was not cached");
    return true;
}

static bool test_status_and_stale_link() {
    Rig rig;
    TEST_ASSERT(rig.mgr->connection_status() == "disconnected", "initial status");

    rig.mgr->ensure_connected();
    TEST_ASSERT(rig.mgr->connection_status() == "connected: Cpen-A (AA:AA:AA:AA:AA:01)",
                "status names the peer, got " << rig.mgr->connection_status());
    TEST_ASSERT(rig.mgr->is_connected(), "is_connected while alive");

    rig.session->alive = false;
    TEST_ASSERT(rig.mgr->connection_status() == "disconnected",
                "status re-checks the link, got " << rig.mgr->connection_status());
    TEST_ASSERT(!rig.mgr->is_connected(), "is_connected asks the live session");
    TEST_ASSERT(rig.mgr->phase() == ConnectionPhase::Disconnected, "phase demoted with the link");

    rig.mgr->ensure_connected();
    TEST_ASSERT(rig.session->connects.size() == 2, "stale link is replaced");
    TEST_ASSERT(rig.adapter->scans == 2, "replacement goes through a new scan");
    return true;
}

static bool test_new_pen_drops_old_credentials() {
    Rig rig;
    TEST_ASSERT(rig.mgr->get_device_id() == "PEN-0001", "first pen id");

    rig.session->alive = false;
    rig.adapter->peers = { make_peer("CC:CC:CC:CC:CC:09", "Cpen-C") };
    rig.session->replies["getId"] = "PEN-0009";
    rig.mgr->ensure_connected();

    TEST_ASSERT(rig.mgr->get_device_id() == "PEN-0009", "id of the new pen, not the cached one");
    return true;
}

static bool test_listener_armed_before_first_command() {
    Rig rig;
    TEST_ASSERT(rig.mgr->get_device_id() == "PEN-0001", "device id on a fresh link");
    TEST_ASSERT(rig.session->listens == 1, "listener armed during connect");
    TEST_ASSERT(!rig.session->listening_at_send.empty() && rig.session->listening_at_send[0],
                "getId written with the listener already running");

    rig.session->drop_on_receive["getTotp"] = 1;
    rig.mgr->get_totp();
    TEST_ASSERT(rig.session->listens == 2, "reconnect re-arms the listener");
    for (bool armed : rig.session->listening_at_send) {
        TEST_ASSERT(armed, "no command is written without a listener");
    }
    return true;
}

static bool test_connect_failure_is_retried() {
    Rig rig;
    rig.session->fail_connects = 1;
    TEST_ASSERT(rig.mgr->get_device_id() == "PEN-0001", "second connect attempt succeeds");
    TEST_ASSERT(rig.session->connects.size() == 1, "one established link");
    TEST_ASSERT(rig.adapter->scans == 2, "the retry scans again");
    TEST_ASSERT(rig.slept(milliseconds(500)), "retry delay before reconnecting");

    Rig dead;
    dead.session->fail_connects = 10;
    try {
        dead.mgr->get_totp();
        TEST_ASSERT(false, "expected ConnectFailed");
    } catch (const PenError& e) {
        TEST_ASSERT(e.kind() == PenErrorKind::ConnectFailed, "connect failure surfaces after the budget");
    }
    TEST_ASSERT(dead.session->fail_connects == 7, "one attempt plus two retries");
    TEST_ASSERT(dead.session->sent.empty(), "nothing written without a link");
    TEST_ASSERT(dead.mgr->phase() == ConnectionPhase::Disconnected, "phase disconnected");
    return true;
}

static bool test_radio_errors_by_dbus_name() {
    PenError denied(PenErrorKind::RadioUnavailable, "Set failed", "org.bluez.Error.NotPermitted");
    TEST_ASSERT(radio_state_for(denied) == RadioState::Denied, "NotPermitted is a denial");

    PenError policy(PenErrorKind::RadioUnavailable, "Set failed",
                    "org.freedesktop.DBus.Error.AccessDenied");
    TEST_ASSERT(radio_state_for(policy) == RadioState::Denied, "bus policy refusal is a denial");

    PenError wording(PenErrorKind::RadioUnavailable, "Blocked through rfkill: AccessDenied");
    TEST_ASSERT(radio_state_for(wording) == RadioState::Unavailable,
                "message text alone does not decide");

    PenError other(PenErrorKind::RadioUnavailable, "Set failed", "org.bluez.Error.Failed");
    TEST_ASSERT(radio_state_for(other) == RadioState::Unavailable, "other BlueZ errors are unavailable");
    return true;
}

static bool test_concurrent_callers_share_one_link() {
    Rig rig;
    rig.session->connect_delay = milliseconds(5);

    const int kThreads = 4;
    std::atomic<int> wrong_codes{0};
    std::atomic<int> errors{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 20; ++i) {
                try {
                    if ((i + t) % 2 == 0) {
                        rig.mgr->ensure_connected();
                    } else if (rig.mgr->get_totp() != "123456") {
                        ++wrong_codes;
                    }
                } catch (const PenError&) {
                    ++errors;
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    TEST_ASSERT(errors == 0 && wrong_codes == 0, "every caller succeeds with the same code");
    TEST_ASSERT(rig.session->connects.size() == 1, "one connection for all callers, got "
                << rig.session->connects.size());
    TEST_ASSERT(rig.session->max_in_connect == 1, "never two connects at the same time");
    TEST_ASSERT(rig.session->count_sent("getTotp") == 1, "callers after the first use the cache");
    return true;
}

int main() {
    set_log_enabled(false);
    std::cout << "--- PenDeviceManager tests ---" << std::endl;

    if (test_single_session())              std::cout << "PASS: single session" << std::endl;
    if (test_name_prefix_filter())          std::cout << "PASS: name prefix filter" << std::endl;
    if (test_totp_cache_and_set_time())     std::cout << "PASS: TOTP cache and setTime" << std::endl;
    if (test_reconnect_retry())             std::cout << "PASS: reconnect retry" << std::endl;
    if (test_retry_budget())                std::cout << "PASS: retry budget" << std::endl;
    if (test_protocol_errors_not_retried()) std::cout << "PASS: protocol errors not retried" << std::endl;
    if (test_disconnect_clears_identity())  std::cout << "PASS: disconnect clears identity" << std::endl;
    if (test_radio_fallback())              std::cout << "PASS: radio fallback" << std::endl;
    if (test_invalid_utf8())                std::cout << "PASS: invalid UTF-8 reply" << std::endl;
    if (test_status_and_stale_link())       std::cout << "PASS: status and stale link" << std::endl;
    if (test_new_pen_drops_old_credentials()) std::cout << "PASS: new pen drops old credentials" << std::endl;
    if (test_listener_armed_before_first_command()) std::cout << "PASS: listener armed before first command" << std::endl;
    if (test_connect_failure_is_retried())  std::cout << "PASS: connect failure is retried" << std::endl;
    if (test_radio_errors_by_dbus_name())   std::cout << "PASS: radio errors by D-Bus name" << std::endl;
    if (test_concurrent_callers_share_one_link()) std::cout << "PASS: concurrent callers share one link" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }
    std::cout << "ALL PASS" << std::endl;
    return 0;
}
