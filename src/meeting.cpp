// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "meeting.h"

#include <algorithm>
#include <cctype>

namespace recscribe {

namespace {

struct StatusName {
    MeetingStatus status;
    const char* name;
};

const StatusName STATUS_NAMES[] = {
    {MeetingStatus::Recording,            "recording"},
    {MeetingStatus::PendingTranscription, "pendingTranscription"},
    {MeetingStatus::Transcribing,         "transcribing"},
    {MeetingStatus::Ready,                "ready"},
    {MeetingStatus::Failed,               "failed"},
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anonymous namespace

const char* meeting_status_name(MeetingStatus status) {
    for (const auto& s : STATUS_NAMES)
        if (s.status == status) return s.name;
    return "unknown";
}

std::optional<MeetingStatus> parse_meeting_status(const std::string& name) {
    for (const auto& s : STATUS_NAMES)
        if (name == s.name) return s.status;
    return std::nullopt;
}

std::optional<Meeting> MemoryMeetingStore::load(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& m : meetings_)
        if (m.id == id) return m;
    return std::nullopt;
}

void MemoryMeetingStore::save(const Meeting& meeting) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& m : meetings_) {
        if (m.id == meeting.id) {
            m = meeting;
            return;
        }
    }
    meetings_.push_back(meeting);
}

std::vector<Meeting> MemoryMeetingStore::list_by_status(MeetingStatus status) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Meeting> out;
    for (const auto& m : meetings_)
        if (m.status == status) out.push_back(m);
    return out;
}

std::vector<Meeting> MemoryMeetingStore::search(const std::string& query) const {
    std::string q = to_lower(query);
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Meeting> out;
    for (const auto& m : meetings_) {
        if (to_lower(m.title).find(q) != std::string::npos ||
            (m.transcript && to_lower(*m.transcript).find(q) != std::string::npos))
            out.push_back(m);
    }
    return out;
}

size_t MemoryMeetingStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return meetings_.size();
}

} // namespace recscribe
