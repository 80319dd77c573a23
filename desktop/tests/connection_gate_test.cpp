#include "connection_gate.h"
#include "logger.h"
#include <iostream>
#include <string>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

using std::chrono::milliseconds;
using Clock = ConnectionGate::Clock;

bool test_cooldown_after_max_failures() {
    std::cout << "Testing ConnectionGate cooldown..." << std::endl;
    ConnectionGate gate(3, milliseconds(10000));
    const Clock::time_point t0 = Clock::time_point{} + std::chrono::hours(1);

    TEST_ASSERT(gate.canAttempt("p", t0), "Unknown peer should be admitted");
    gate.recordFailure("p", t0);
    gate.recordFailure("p", t0 + milliseconds(100));
    TEST_ASSERT(gate.canAttempt("p", t0 + milliseconds(200)), "Two failures should not gate");

    gate.recordFailure("p", t0 + milliseconds(200));
    TEST_ASSERT(gate.stats("p").failed_attempts == 3, "Three failures recorded");
    TEST_ASSERT(!gate.canAttempt("p", t0 + milliseconds(200)), "Third failure should gate");
    TEST_ASSERT(!gate.tryBeginAttempt("p", t0 + milliseconds(5000)), "Still cooling down at +4.8s");
    TEST_ASSERT(gate.stats("p").last_attempt_at == t0 + milliseconds(200), "A refused attempt must not stamp");
    TEST_ASSERT(gate.remainingCooldown("p", t0 + milliseconds(5200)) == milliseconds(5000), "5s of cooldown left");

    TEST_ASSERT(!gate.canAttempt("p", t0 + milliseconds(10199)), "Cooldown lasts the full interval");
    TEST_ASSERT(gate.tryBeginAttempt("p", t0 + milliseconds(10200)), "Attempt allowed after cooldown");
    TEST_ASSERT(gate.stats("p").failed_attempts == 0, "First attempt after cooldown resets the counter");
    TEST_ASSERT(gate.stats("p").last_attempt_at == t0 + milliseconds(10200), "Admitted attempt stamps the time");
    TEST_ASSERT(gate.remainingCooldown("p", t0 + milliseconds(10200)) == milliseconds(0), "No cooldown left");

    std::cout << "ConnectionGate cooldown Passed!" << std::endl;
    return true;
}

bool test_success_and_isolation() {
    std::cout << "Testing ConnectionGate success and per-peer isolation..." << std::endl;
    ConnectionGate gate(2, milliseconds(1000));
    const Clock::time_point t0 = Clock::time_point{} + std::chrono::hours(1);

    gate.recordFailure("a", t0);
    gate.recordFailure("a", t0);
    TEST_ASSERT(!gate.canAttempt("a", t0), "Peer a should be gated");
    TEST_ASSERT(gate.canAttempt("b", t0), "Peer b is unaffected");

    gate.recordSuccess("a");
    TEST_ASSERT(gate.canAttempt("a", t0), "Success clears the failure run");
    TEST_ASSERT(gate.stats("a").failed_attempts == 0, "Counter reset by success");

    ConnectionGate strict(0, milliseconds(1000));
    strict.recordFailure("c", t0);
    TEST_ASSERT(!strict.canAttempt("c", t0), "A non-positive maximum behaves as one");

    std::cout << "ConnectionGate success and per-peer isolation Passed!" << std::endl;
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);
    std::cout << "Running Connection Gate Tests..." << std::endl;

    test_cooldown_after_max_failures();
    test_success_and_isolation();

    if (tests_failed == 0) {
        std::cout << "ALL CONNECTION GATE TESTS PASSED" << std::endl;
        return 0;
    } else {
        std::cerr << tests_failed << " TESTS FAILED" << std::endl;
        return 1;
    }
}
