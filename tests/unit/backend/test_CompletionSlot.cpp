#include <doctest/doctest.h>
#include "backend/CompletionSlot.hpp"
#include "backend/Reentrancy.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;
using Outcome = HD::CompletionSlot::Outcome;

TEST_SUITE("backend.completion_slot") {

TEST_CASE("complete_wakes_the_waiter") {
    auto        slot = std::make_shared<HD::CompletionSlot>();
    std::thread producer([slot] {
        std::this_thread::sleep_for(10ms);
        CHECK(slot->complete());
    });
    CHECK(slot->waitUntil(std::nullopt) == Outcome::Completed);
    producer.join();
    CHECK(slot->settled());
    CHECK_FALSE(slot->takeError());
}

TEST_CASE("error_is_handed_over") {
    HD::CompletionSlot slot;
    slot.complete(std::make_exception_ptr(std::runtime_error("boom")));
    CHECK(slot.waitUntil(std::nullopt) == Outcome::Completed);
    auto error = slot.takeError();
    REQUIRE(error);
    CHECK_THROWS_WITH_AS(std::rethrow_exception(error), "boom", std::runtime_error);
    CHECK_FALSE(slot.takeError());
}

TEST_CASE("late_completion_after_timeout_is_ignored") {
    auto slot     = std::make_shared<HD::CompletionSlot>();
    auto start    = std::chrono::steady_clock::now();
    auto outcome  = slot->waitUntil(start + 30ms);
    auto elapsed  = std::chrono::steady_clock::now() - start;
    CHECK(outcome == Outcome::TimedOut);
    CHECK(elapsed >= 30ms);
    CHECK(elapsed < 1s);

    // The main thread finishing afterwards must not disturb anything.
    std::thread late([slot] { CHECK_FALSE(slot->complete(std::make_exception_ptr(std::runtime_error("late")))); });
    late.join();
    CHECK_FALSE(slot->takeError());
}

TEST_CASE("abandon_settles_once") {
    HD::CompletionSlot slot;
    slot.abandon();
    CHECK(slot.waitUntil(std::nullopt) == Outcome::Abandoned);
    CHECK_FALSE(slot.complete());
}

TEST_CASE("completion_before_wait_returns_immediately") {
    HD::CompletionSlot slot;
    CHECK(slot.complete());
    CHECK(slot.waitUntil(std::chrono::steady_clock::now()) == Outcome::Completed);
}

} // TEST_SUITE

TEST_SUITE("backend.reentrancy") {

TEST_CASE("scopes_nest_and_unwind") {
    CHECK(HD::detail::servicingDepth() == 0);
    CHECK(HD::detail::waitingDepth() == 0);
    {
        HD::detail::ServicingScope outer;
        {
            HD::detail::ServicingScope inner;
            HD::detail::WaitingScope   waiting;
            CHECK(HD::detail::servicingDepth() == 2);
            CHECK(HD::detail::waitingDepth() == 1);
        }
        CHECK(HD::detail::servicingDepth() == 1);
        CHECK(HD::detail::waitingDepth() == 0);
    }
    CHECK(HD::detail::servicingDepth() == 0);
}

TEST_CASE("depths_are_thread_local") {
    HD::detail::WaitingScope waiting;
    int                      otherDepth = -1;
    std::thread([&] { otherDepth = HD::detail::waitingDepth(); }).join();
    CHECK(otherDepth == 0);
    CHECK(HD::detail::waitingDepth() == 1);
}

} // TEST_SUITE
