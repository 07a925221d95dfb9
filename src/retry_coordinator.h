// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "meeting.h"
#include "orchestrator.h"

#include <chrono>
#include <functional>
#include <mutex>
#include <set>
#include <string>

namespace recscribe {

using TranscribeFn = std::function<TranscriptionResult(const Meeting&)>;
using SleepFn = std::function<void(std::chrono::milliseconds)>;
using ProgressFn = std::function<void(const std::string&)>;

constexpr std::chrono::milliseconds DEFAULT_RETRY_DELAY{500};

/// Adapts an Orchestrator to TranscribeFn: the meeting's audio and title
/// are passed through with the given base options.
TranscribeFn make_transcribe_fn(const Orchestrator& orchestrator,
                                TranscriptionOptions options,
                                const StopToken* stop = nullptr);

struct BulkRetrySummary {
    int attempted = 0;
    int succeeded = 0;
    int failed = 0;
};

// ---------------------------------------------------------------------------
// RetryCoordinator: drives Meeting status through one transcription attempt
// ---------------------------------------------------------------------------

class RetryCoordinator {
public:
    RetryCoordinator(MeetingStore& store, TranscribeFn transcribe,
                     SleepFn sleep = {},
                     std::chrono::milliseconds delay = DEFAULT_RETRY_DELAY);

    /// First attempt for a meeting in pendingTranscription or failed.
    Meeting transcribe_meeting(const std::string& id);

    /// Explicit user retry from any state but recording. A stored
    /// "transcribing" with no attempt in flight is recovered.
    Meeting retry(const std::string& id);

    /// Retry every meeting failed at the time of the call, one at a time,
    /// sleeping the configured delay between items.
    BulkRetrySummary retry_all_failed(const ProgressFn& progress = {});

    bool in_flight(const std::string& id) const;

private:
    Meeting attempt(const std::string& id, bool explicit_retry);

    MeetingStore& store_;
    TranscribeFn transcribe_;
    SleepFn sleep_;
    std::chrono::milliseconds delay_;

    mutable std::mutex mutex_;
    std::set<std::string> in_flight_;
};

} // namespace recscribe
