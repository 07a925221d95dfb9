// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "retry_coordinator.h"
#include "log.h"

#include <thread>

namespace recscribe {

namespace {

const char* CANCELLED_MESSAGE = "Transcription cancelled";

// Holds a meeting id in the in-flight set for the lifetime of one attempt.
class InFlightGuard {
public:
    InFlightGuard(std::mutex& mutex, std::set<std::string>& set, const std::string& id)
        : mutex_(mutex), set_(set), id_(id) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!set_.insert(id_).second)
            throw PipelineError(ErrorKind::AlreadyInProgress,
                                "Transcription already in progress for meeting " + id_);
    }
    ~InFlightGuard() {
        std::lock_guard<std::mutex> lock(mutex_);
        set_.erase(id_);
    }
    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    std::mutex& mutex_;
    std::set<std::string>& set_;
    std::string id_;
};

void apply_success(Meeting& m, const TranscriptionResult& r) {
    m.status = MeetingStatus::Ready;
    m.error_message.reset();
    m.transcript = r.to_string();
    m.api_cost_cents = r.cost_cents;
    m.duration_seconds = r.duration_seconds;
    m.segments = r.segments;
    m.speaker_count = r.speaker_count;
    m.speaker_labels = r.speaker_labels;
    if (r.title)
        m.title = *r.title;
}

} // anonymous namespace

TranscribeFn make_transcribe_fn(const Orchestrator& orchestrator,
                                TranscriptionOptions options,
                                const StopToken* stop) {
    return [&orchestrator, options, stop](const Meeting& m) {
        TranscriptionOptions opts = options;
        if (opts.meeting_title.empty())
            opts.meeting_title = m.title;
        return orchestrator.transcribe(m.audio_path, opts, stop);
    };
}

RetryCoordinator::RetryCoordinator(MeetingStore& store, TranscribeFn transcribe,
                                   SleepFn sleep, std::chrono::milliseconds delay)
    : store_(store), transcribe_(std::move(transcribe)), sleep_(std::move(sleep)),
      delay_(delay) {
    if (!sleep_)
        sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

bool RetryCoordinator::in_flight(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.count(id) > 0;
}

Meeting RetryCoordinator::transcribe_meeting(const std::string& id) {
    return attempt(id, false);
}

Meeting RetryCoordinator::retry(const std::string& id) {
    return attempt(id, true);
}

Meeting RetryCoordinator::attempt(const std::string& id, bool explicit_retry) {
    InFlightGuard guard(mutex_, in_flight_, id);

    auto loaded = store_.load(id);
    if (!loaded)
        throw RecscribeError("Meeting not found: " + id);
    Meeting m = std::move(*loaded);

    const MeetingStatus prior = m.status;
    if (prior == MeetingStatus::Recording)
        throw PipelineError(ErrorKind::InvalidState,
                            "Meeting " + id + " is still recording");
    // A stored "transcribing" with nothing in flight here is left over from an
    // interrupted run; only an explicit retry takes it over.
    if (prior == MeetingStatus::Transcribing && !explicit_retry)
        throw PipelineError(ErrorKind::AlreadyInProgress,
                            "Meeting " + id + " is already transcribing");
    if (!explicit_retry && prior != MeetingStatus::PendingTranscription &&
        prior != MeetingStatus::Failed)
        throw PipelineError(ErrorKind::InvalidState,
                            "Meeting " + id + " is " + meeting_status_name(prior) +
                            ", not awaiting transcription");

    const auto prior_error = m.error_message;
    m.status = MeetingStatus::Transcribing;
    m.error_message.reset();
    store_.save(m);
    log_info("Meeting %s: %s -> transcribing", id.c_str(), meeting_status_name(prior));

    try {
        TranscriptionResult r = transcribe_(m);
        apply_success(m, r);
        log_info("Meeting %s: ready (%d cent(s))", id.c_str(), r.cost_cents);
    } catch (const PipelineError& e) {
        if (e.kind() == ErrorKind::Cancelled) {
            if (prior == MeetingStatus::Ready) {
                m.status = prior;
                m.error_message = prior_error;
            } else {
                m.status = prior == MeetingStatus::Transcribing ? MeetingStatus::Failed : prior;
                m.error_message = CANCELLED_MESSAGE;
            }
            log_info("Meeting %s: cancelled, back to %s", id.c_str(), meeting_status_name(prior));
        } else {
            m.status = MeetingStatus::Failed;
            m.error_message = e.what();
            log_error("Meeting %s: failed (%s): %s", id.c_str(),
                      error_kind_name(e.kind()), e.what());
        }
    } catch (const std::exception& e) {
        m.status = MeetingStatus::Failed;
        m.error_message = e.what();
        log_error("Meeting %s: failed: %s", id.c_str(), e.what());
    }

    store_.save(m);
    return m;
}

BulkRetrySummary RetryCoordinator::retry_all_failed(const ProgressFn& progress) {
    const auto snapshot = store_.list_by_status(MeetingStatus::Failed);
    BulkRetrySummary summary;
    const int total = static_cast<int>(snapshot.size());

    log_info("Bulk retry: %d failed meeting(s)", total);

    for (int i = 0; i < total; ++i) {
        if (progress)
            progress("Retrying " + std::to_string(i + 1) + " of " + std::to_string(total));

        ++summary.attempted;
        try {
            Meeting m = retry(snapshot[i].id);
            if (m.status == MeetingStatus::Ready)
                ++summary.succeeded;
            else
                ++summary.failed;
        } catch (const RecscribeError& e) {
            log_warn("Bulk retry: skipping %s: %s", snapshot[i].id.c_str(), e.what());
            ++summary.failed;
        }

        if (i + 1 < total)
            sleep_(delay_);
    }

    log_info("Bulk retry done: %d succeeded, %d failed", summary.succeeded, summary.failed);
    return summary;
}

} // namespace recscribe
