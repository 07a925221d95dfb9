// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "transcript.h"

#include <cstdio>
#include <sstream>

namespace recscribe {

std::string format_timestamp(double seconds) {
    int total = seconds > 0 ? static_cast<int>(seconds) : 0;
    int mins = total / 60;
    int secs = total % 60;
    char buf[16];
    snprintf(buf, sizeof(buf), "%02d:%02d", mins, secs);
    return buf;
}

std::string TranscriptionResult::to_string() const {
    if (segments.empty())
        return text.empty() ? "" : text + "\n";

    std::ostringstream oss;
    for (const auto& seg : segments) {
        oss << "[" << format_timestamp(seg.start) << " - "
            << format_timestamp(seg.end) << "] ";
        if (seg.speaker)
            oss << *seg.speaker << ": ";
        oss << seg.text << "\n";
    }
    return oss.str();
}

} // namespace recscribe
