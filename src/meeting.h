// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "transcript.h"
#include "util.h"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace recscribe {

enum class MeetingStatus { Recording, PendingTranscription, Transcribing, Ready, Failed };

/// "recording", "pendingTranscription", "transcribing", "ready", "failed"
const char* meeting_status_name(MeetingStatus status);
std::optional<MeetingStatus> parse_meeting_status(const std::string& name);

struct Meeting {
    std::string id;
    std::string title;
    fs::path audio_path;
    MeetingStatus status = MeetingStatus::PendingTranscription;

    std::optional<std::string> transcript;
    std::optional<std::string> error_message;
    std::optional<int> api_cost_cents;
    double duration_seconds = 0.0;
    std::optional<int> speaker_count;
    std::vector<TranscriptSegment> segments;
    std::vector<SpeakerLabel> speaker_labels;
};

// ---------------------------------------------------------------------------
// MeetingStore: persistence collaborator
// ---------------------------------------------------------------------------

class MeetingStore {
public:
    virtual ~MeetingStore() = default;

    virtual std::optional<Meeting> load(const std::string& id) const = 0;
    virtual void save(const Meeting& meeting) = 0;

    /// Matching meetings in a stable order.
    virtual std::vector<Meeting> list_by_status(MeetingStatus status) const = 0;

    /// Case-insensitive match over title and transcript.
    virtual std::vector<Meeting> search(const std::string& query) const = 0;
};

/// Thread-safe in-process store. Keeps insertion order; saving an existing
/// id replaces it in place.
class MemoryMeetingStore : public MeetingStore {
public:
    std::optional<Meeting> load(const std::string& id) const override;
    void save(const Meeting& meeting) override;
    std::vector<Meeting> list_by_status(MeetingStatus status) const override;
    std::vector<Meeting> search(const std::string& query) const override;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<Meeting> meetings_;
};

} // namespace recscribe
