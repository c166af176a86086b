// tests/test_session_registry.cpp
//
// Session lifetime: priming, one session per channel, teardown and stale ids.

#include <doctest/doctest.h>

#include "test_support/SessionHarness.h"

using namespace nooku;
using namespace std::chrono_literals;
using session::SessionError;
using session::SessionId;

TEST_CASE("SessionRegistry: Open primes the current and next slot")
{
    test::SessionHarness h(test::FullCatalog(), test::At(13, 40), 601);
    test::FakeSink* sink = nullptr;
    const auto id = h.Open("lobby", sink, 0.8f);
    REQUIRE(id.has_value());
    CHECK(id->Valid());

    CHECK(sink->CurrentName() == "213 song.mp3");
    CHECK(sink->Looping());
    CHECK(sink->Volume() == doctest::Approx(0.8f));
    CHECK(sink->HasListener());

    const auto s = h.registry.Find(*id);
    REQUIRE(s);
    CHECK(s->State() == session::SessionState::Playing);
    CHECK(s->Channel() == "lobby");
    CHECK(s->Buffer().CurrentKey()->ToString() == "213");
    CHECK(s->Buffer().LookaheadKey()->ToString() == "214");
    CHECK(s->Weather().Playing() == weather::WeatherClass::Snowy);
    CHECK(h.weatherClient.Calls() == 1);
    CHECK(h.registry.Count() == 1);
}

TEST_CASE("SessionRegistry: a second join of the same channel is refused")
{
    test::SessionHarness h(test::FullCatalog(), test::At(9));
    test::FakeSink* first = nullptr;
    test::FakeSink* second = nullptr;
    REQUIRE(h.Open("lobby", first).has_value());

    const auto again = h.Open("lobby", second);
    REQUIRE_FALSE(again.has_value());
    CHECK(again.error().code == SessionError::Code::AlreadyJoined);
    CHECK(again.error().message == "Already in same voice channel!");
    CHECK(h.registry.Count() == 1);

    CHECK(h.Open("games", second).has_value());
    CHECK(h.registry.Count() == 2);
}

TEST_CASE("SessionRegistry: priming failure is reported and leaves nothing behind")
{
    test::SessionHarness h(test::CatalogOf({"010"}), test::At(9));
    test::FakeSink* sink = nullptr;
    const auto id = h.Open("lobby", sink);
    REQUIRE_FALSE(id.has_value());
    CHECK(id.error().code == SessionError::Code::PrimeFailed);
    CHECK(h.registry.Count() == 0);
    CHECK(h.timers.Pending() == 0);
    CHECK_FALSE(h.registry.FindByChannel("lobby").has_value());

    // The channel is free again.
    h.clock.Set(test::At(10, 5));
    CHECK(h.Open("lobby", sink).has_value());
}

TEST_CASE("SessionRegistry: priming decode failure is fatal for the session")
{
    test::SessionHarness h(test::FullCatalog(), test::At(9));
    h.decoder.FailOn(test::SongPath("009"));
    test::FakeSink* sink = nullptr;
    const auto id = h.Open("lobby", sink);
    REQUIRE_FALSE(id.has_value());
    CHECK(id.error().code == SessionError::Code::PrimeFailed);
    CHECK(id.error().message.find("DecodeFailure") != std::string::npos);
}

TEST_CASE("SessionRegistry: Close cancels every trigger and stops playback")
{
    test::SessionHarness h(test::FullCatalog(), test::At(9, 30));
    test::FakeSink* sink = nullptr;
    const auto id = h.Open("lobby", sink);
    REQUIRE(id.has_value());
    REQUIRE(h.timers.Pending() == 1);

    auto held = h.registry.Find(*id); // an in-flight handler would hold this
    REQUIRE(held);

    CHECK(h.registry.Close(*id));
    CHECK(h.timers.Pending() == 0);
    CHECK_FALSE(sink->HasListener());
    CHECK(sink->Stops() == 1);
    CHECK(held->State() == session::SessionState::Idle);
    CHECK(held->Buffer().Size() == 0);
    CHECK_FALSE(h.registry.Find(*id));
    CHECK_FALSE(h.registry.Close(*id));

    // Late triggers on the held session do nothing.
    const auto plays = sink->Plays();
    session::HourScheduler::OnHour(*held);
    session::LoopWeatherMonitor::OnLoop(*held);
    CHECK(sink->Plays() == plays);

    // No hour trigger fires after teardown.
    CHECK(h.AdvanceTo(test::At(12)) == 0);
}

TEST_CASE("SessionRegistry: reused slots get a new generation")
{
    test::SessionHarness h(test::FullCatalog(), test::At(9));
    test::FakeSink* sink = nullptr;
    const auto first = h.Open("lobby", sink);
    REQUIRE(first.has_value());
    REQUIRE(h.registry.Close(*first));

    const auto second = h.Open("games", sink);
    REQUIRE(second.has_value());
    CHECK(second->index == first->index);
    CHECK(second->generation != first->generation);

    CHECK_FALSE(h.registry.Find(*first));
    CHECK_FALSE(h.registry.Close(*first));
    CHECK(h.registry.Find(*second));
    CHECK_FALSE(h.registry.Find(SessionId{}));
    CHECK_FALSE(h.registry.Find(SessionId{99, 1}));
}

TEST_CASE("SessionRegistry: sessions keep independent weather state")
{
    test::SessionHarness h(test::FullCatalog(), test::At(9), 800);
    test::FakeSink* a = nullptr;
    test::FakeSink* b = nullptr;
    REQUIRE(h.Open("lobby", a).has_value());

    h.weatherClient.SetCode(502);
    REQUIRE(h.Open("games", b).has_value());

    // Each session has its own cooldown, so the second one fetched fresh.
    CHECK(h.weatherClient.Calls() == 2);
    CHECK(a->CurrentName() == "009 song.mp3");
    CHECK(b->CurrentName() == "109 song.mp3");
}

TEST_CASE("SessionRegistry: FindByChannel, Ids and CloseAll")
{
    test::SessionHarness h(test::FullCatalog(), test::At(9));
    test::FakeSink* a = nullptr;
    test::FakeSink* b = nullptr;
    const auto ida = h.Open("lobby", a);
    const auto idb = h.Open("games", b);
    REQUIRE(ida.has_value());
    REQUIRE(idb.has_value());

    CHECK(h.registry.FindByChannel("games") == *idb);
    CHECK_FALSE(h.registry.FindByChannel("nowhere").has_value());
    CHECK(h.registry.Ids().size() == 2);

    // The sinks are owned by the sessions; keep them alive for the checks below.
    const auto sa = h.registry.Find(*ida);
    const auto sb = h.registry.Find(*idb);

    h.registry.CloseAll();
    CHECK(h.registry.Count() == 0);
    CHECK(h.timers.Pending() == 0);
    CHECK(a->Stops() == 1);
    CHECK(b->Stops() == 1);
}

TEST_CASE("SessionRegistry: muting silences the sink across swaps until unmuted")
{
    test::SessionHarness h(test::FullCatalog(), test::At(4, 59));
    test::FakeSink* sink = nullptr;
    const auto id = h.Open("lobby", sink, 0.5f);
    REQUIRE(id.has_value());
    const auto s = h.registry.Find(*id);
    REQUIRE(s);

    CHECK(s->SetMuted(true));
    CHECK_FALSE(s->SetMuted(true));
    CHECK(s->Muted());
    CHECK(sink->Volume() == doctest::Approx(0.0f));

    REQUIRE(h.AdvanceTo(test::At(5) + 500ms) == 1);
    CHECK(sink->CurrentName() == "005 song.mp3");
    CHECK(sink->Volume() == doctest::Approx(0.0f));

    CHECK(s->SetMuted(false));
    CHECK_FALSE(s->SetMuted(false));
    CHECK(sink->Volume() == doctest::Approx(0.5f));

    h.weatherClient.SetCode(502);
    h.clock.Set(test::At(5, 20));
    REQUIRE(sink->FireLoop());
    CHECK(sink->CurrentName() == "105 song.mp3");
    CHECK(sink->Volume() == doctest::Approx(0.5f));
}
