// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include "audio_file.h"
#include "retry_coordinator.h"

using namespace recscribe;
using std::chrono::milliseconds;

namespace {

Meeting failed_meeting(const std::string& id, const std::string& error = "Network error") {
    Meeting m;
    m.id = id;
    m.title = "Meeting " + id;
    m.audio_path = "/tmp/" + id + ".m4a";
    m.status = MeetingStatus::Failed;
    m.error_message = error;
    return m;
}

TranscriptionResult ok_result(const std::string& text = "hello") {
    TranscriptionResult r;
    r.text = text;
    r.duration_seconds = 60.0;
    r.cost_cents = 1;
    TranscriptSegment s;
    s.start = 0.0;
    s.end = 2.0;
    s.text = text;
    r.segments.push_back(s);
    return r;
}

struct SleepRecorder {
    std::vector<milliseconds> calls;
    SleepFn fn() {
        return [this](milliseconds d) { calls.push_back(d); };
    }
};

} // anonymous namespace

TEST_CASE("RetryCoordinator: failed meeting becomes ready", "[retry]") {
    MemoryMeetingStore store;
    store.save(failed_meeting("m1"));

    MeetingStatus observed = MeetingStatus::Recording;
    std::optional<std::string> observed_error = std::string("unset");
    RetryCoordinator coord(store, [&](const Meeting& m) {
        auto stored = store.load(m.id);
        observed = stored->status;
        observed_error = stored->error_message;
        return ok_result();
    });

    auto m = coord.retry("m1");
    CHECK(observed == MeetingStatus::Transcribing);
    CHECK_FALSE(observed_error);

    CHECK(m.status == MeetingStatus::Ready);
    CHECK_FALSE(m.error_message);
    REQUIRE(m.transcript);
    CHECK(m.transcript->find("hello") != std::string::npos);
    CHECK(m.api_cost_cents == std::optional<int>(1));
    CHECK(m.duration_seconds == 60.0);
    CHECK(m.segments.size() == 1);

    auto stored = store.load("m1");
    CHECK(stored->status == MeetingStatus::Ready);
    CHECK_FALSE(coord.in_flight("m1"));
}

TEST_CASE("RetryCoordinator: generated title replaces the meeting title", "[retry]") {
    MemoryMeetingStore store;
    store.save(failed_meeting("m1"));
    RetryCoordinator coord(store, [](const Meeting&) {
        auto r = ok_result();
        r.title = "Budget Sync";
        r.speaker_count = 2;
        return r;
    });
    auto m = coord.retry("m1");
    CHECK(m.title == "Budget Sync");
    CHECK(m.speaker_count == std::optional<int>(2));
}

TEST_CASE("RetryCoordinator: failure records the error and keeps the transcript", "[retry]") {
    MemoryMeetingStore store;
    auto seed = failed_meeting("m1");
    seed.status = MeetingStatus::Ready;
    seed.error_message.reset();
    seed.transcript = "earlier transcript";
    store.save(seed);

    RetryCoordinator coord(store, [](const Meeting&) -> TranscriptionResult {
        throw PipelineError(ErrorKind::QuotaExceeded, "You exceeded your current quota", 429);
    });

    auto m = coord.retry("m1");
    CHECK(m.status == MeetingStatus::Failed);
    CHECK(m.error_message == std::optional<std::string>("You exceeded your current quota"));
    CHECK(m.transcript == std::optional<std::string>("earlier transcript"));
    CHECK(store.load("m1")->status == MeetingStatus::Failed);
}

TEST_CASE("RetryCoordinator: non-pipeline exceptions also fail the meeting", "[retry]") {
    MemoryMeetingStore store;
    store.save(failed_meeting("m1"));
    RetryCoordinator coord(store, [](const Meeting&) -> TranscriptionResult {
        throw std::runtime_error("disk on fire");
    });
    auto m = coord.retry("m1");
    CHECK(m.status == MeetingStatus::Failed);
    CHECK(m.error_message == std::optional<std::string>("disk on fire"));
}

TEST_CASE("RetryCoordinator: cancellation restores the prior status", "[retry]") {
    MemoryMeetingStore store;
    auto cancel = [](const Meeting&) -> TranscriptionResult {
        throw PipelineError(ErrorKind::Cancelled, "stopped");
    };

    SECTION("from failed") {
        store.save(failed_meeting("m1"));
        RetryCoordinator coord(store, cancel);
        auto m = coord.retry("m1");
        CHECK(m.status == MeetingStatus::Failed);
        CHECK(m.error_message == std::optional<std::string>("Transcription cancelled"));
    }

    SECTION("from ready") {
        auto seed = failed_meeting("m1");
        seed.status = MeetingStatus::Ready;
        seed.error_message.reset();
        seed.transcript = "keep me";
        store.save(seed);
        RetryCoordinator coord(store, cancel);
        auto m = coord.retry("m1");
        CHECK(m.status == MeetingStatus::Ready);
        CHECK_FALSE(m.error_message);
        CHECK(m.transcript == std::optional<std::string>("keep me"));
    }
}

TEST_CASE("RetryCoordinator: retry recovers a meeting stuck in transcribing", "[retry]") {
    MemoryMeetingStore store;
    auto seed = failed_meeting("stuck");
    seed.status = MeetingStatus::Transcribing;
    store.save(seed);

    int calls = 0;
    RetryCoordinator coord(store, [&](const Meeting&) { ++calls; return ok_result(); });
    CHECK_FALSE(coord.in_flight("stuck"));

    auto m = coord.retry("stuck");
    CHECK(calls == 1);
    CHECK(m.status == MeetingStatus::Ready);
    CHECK(store.load("stuck")->status == MeetingStatus::Ready);
}

TEST_CASE("RetryCoordinator: first attempt leaves a stored transcribing alone", "[retry]") {
    MemoryMeetingStore store;
    auto seed = failed_meeting("stuck");
    seed.status = MeetingStatus::Transcribing;
    store.save(seed);

    int calls = 0;
    RetryCoordinator coord(store, [&](const Meeting&) { ++calls; return ok_result(); });
    try {
        coord.transcribe_meeting("stuck");
        FAIL("expected throw");
    } catch (const PipelineError& e) {
        CHECK(e.kind() == ErrorKind::AlreadyInProgress);
    }
    CHECK(calls == 0);
    CHECK(store.load("stuck")->status == MeetingStatus::Transcribing);
}

TEST_CASE("RetryCoordinator: cancelling a recovered attempt ends failed", "[retry]") {
    MemoryMeetingStore store;
    auto seed = failed_meeting("stuck");
    seed.status = MeetingStatus::Transcribing;
    store.save(seed);

    RetryCoordinator coord(store, [](const Meeting&) -> TranscriptionResult {
        throw PipelineError(ErrorKind::Cancelled, "stopped");
    });
    auto m = coord.retry("stuck");
    CHECK(m.status == MeetingStatus::Failed);
    CHECK(m.error_message == std::optional<std::string>("Transcription cancelled"));
}

TEST_CASE("RetryCoordinator: recording meetings are never uploaded", "[retry]") {
    MemoryMeetingStore store;
    auto seed = failed_meeting("rec");
    seed.status = MeetingStatus::Recording;
    seed.error_message.reset();
    store.save(seed);

    int calls = 0;
    RetryCoordinator coord(store, [&](const Meeting&) { ++calls; return ok_result(); });
    for (bool explicit_retry : {true, false}) {
        try {
            if (explicit_retry)
                coord.retry("rec");
            else
                coord.transcribe_meeting("rec");
            FAIL("expected throw");
        } catch (const PipelineError& e) {
            CHECK(e.kind() == ErrorKind::InvalidState);
        }
    }
    CHECK(calls == 0);
    CHECK(store.load("rec")->status == MeetingStatus::Recording);
    CHECK_FALSE(coord.in_flight("rec"));
}

TEST_CASE("RetryCoordinator: re-entrant attempt is rejected", "[retry]") {
    MemoryMeetingStore store;
    store.save(failed_meeting("m1"));

    RetryCoordinator* self = nullptr;
    bool rejected = false;
    RetryCoordinator coord(store, [&](const Meeting& m) {
        CHECK(self->in_flight(m.id));
        try {
            self->retry(m.id);
        } catch (const PipelineError& e) {
            rejected = e.kind() == ErrorKind::AlreadyInProgress;
        }
        return ok_result();
    });
    self = &coord;

    auto m = coord.retry("m1");
    CHECK(rejected);
    CHECK(m.status == MeetingStatus::Ready);
}

TEST_CASE("RetryCoordinator: first attempt requires pending or failed", "[retry]") {
    MemoryMeetingStore store;
    Meeting pending;
    pending.id = "p";
    store.save(pending);
    auto ready = failed_meeting("r");
    ready.status = MeetingStatus::Ready;
    store.save(ready);

    RetryCoordinator coord(store, [](const Meeting&) { return ok_result(); });
    CHECK(coord.transcribe_meeting("p").status == MeetingStatus::Ready);
    try {
        coord.transcribe_meeting("r");
        FAIL("expected throw");
    } catch (const PipelineError& e) {
        CHECK(e.kind() == ErrorKind::InvalidState);
    }
    CHECK(coord.retry("r").status == MeetingStatus::Ready);
}

TEST_CASE("RetryCoordinator: unknown meeting", "[retry]") {
    MemoryMeetingStore store;
    RetryCoordinator coord(store, [](const Meeting&) { return ok_result(); });
    CHECK_THROWS_AS(coord.retry("ghost"), RecscribeError);
    CHECK_FALSE(coord.in_flight("ghost"));
}

TEST_CASE("RetryCoordinator: bulk retry paces sequential attempts", "[retry]") {
    MemoryMeetingStore store;
    store.save(failed_meeting("a"));
    Meeting ready;
    ready.id = "skip";
    ready.status = MeetingStatus::Ready;
    store.save(ready);
    store.save(failed_meeting("b"));
    store.save(failed_meeting("c"));

    std::vector<std::string> order;
    SleepRecorder sleeps;
    RetryCoordinator coord(store, [&](const Meeting& m) -> TranscriptionResult {
        order.push_back(m.id);
        if (m.id == "b")
            throw PipelineError(ErrorKind::ServerError, "Server error (500): boom", 500);
        return ok_result();
    }, sleeps.fn(), milliseconds(250));

    std::vector<std::string> progress;
    auto summary = coord.retry_all_failed([&](const std::string& s) { progress.push_back(s); });

    CHECK(summary.attempted == 3);
    CHECK(summary.succeeded == 2);
    CHECK(summary.failed == 1);
    CHECK(order == std::vector<std::string>{"a", "b", "c"});
    CHECK(progress == std::vector<std::string>{"Retrying 1 of 3", "Retrying 2 of 3", "Retrying 3 of 3"});
    REQUIRE(sleeps.calls.size() == 2);
    CHECK(sleeps.calls[0] == milliseconds(250));

    CHECK(store.load("a")->status == MeetingStatus::Ready);
    CHECK(store.load("b")->status == MeetingStatus::Failed);
    CHECK(store.load("skip")->status == MeetingStatus::Ready);
}

TEST_CASE("RetryCoordinator: bulk retry uses a snapshot", "[retry]") {
    MemoryMeetingStore store;
    store.save(failed_meeting("a"));

    SleepRecorder sleeps;
    RetryCoordinator coord(store, [&](const Meeting&) -> TranscriptionResult {
        // A meeting failing during the run is not picked up
        store.save(failed_meeting("late"));
        throw PipelineError(ErrorKind::NetworkError, "offline");
    }, sleeps.fn());

    auto summary = coord.retry_all_failed();
    CHECK(summary.attempted == 1);
    CHECK(summary.failed == 1);
    CHECK(sleeps.calls.empty());
}

TEST_CASE("RetryCoordinator: empty bulk retry", "[retry]") {
    MemoryMeetingStore store;
    SleepRecorder sleeps;
    int calls = 0;
    RetryCoordinator coord(store, [&](const Meeting&) { ++calls; return ok_result(); }, sleeps.fn());
    auto summary = coord.retry_all_failed();
    CHECK(summary.attempted == 0);
    CHECK(calls == 0);
    CHECK(sleeps.calls.empty());
}

TEST_CASE("make_transcribe_fn: passes audio and title to the orchestrator", "[retry]") {
    fs::path dir = fs::temp_directory_path() / "recscribe_test_retry";
    fs::create_directories(dir);
    fs::path wav = dir / "m.wav";
    write_wav(wav, std::vector<int16_t>(16000, 100), 16000, 1);

    StaticSecretStore keys;
    keys.set(Provider::OpenAI, "sk-test");
    int uploads = 0;
    Orchestrator orch(keys, [&](const HttpRequest& r) {
        if (r.url.find("/audio/transcriptions") != std::string::npos) ++uploads;
        return HttpResponse{200, R"({"text":"from orchestrator","duration":30})"};
    });

    TranscriptionOptions opts;
    opts.enable_diarization = false;
    opts.generate_title = false;
    opts.identify_speakers = false;

    MemoryMeetingStore store;
    auto m = failed_meeting("m1");
    m.audio_path = wav;
    store.save(m);

    RetryCoordinator coord(store, make_transcribe_fn(orch, opts));
    auto done = coord.retry("m1");
    CHECK(done.status == MeetingStatus::Ready);
    CHECK(done.transcript->find("from orchestrator") != std::string::npos);
    CHECK(uploads == 1);

    fs::remove_all(dir);
}
