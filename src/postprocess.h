// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "transcript.h"
#include "transcription_client.h"

#include <optional>
#include <string>
#include <vector>

namespace recscribe {

// ---------------------------------------------------------------------------
// Title generation
// ---------------------------------------------------------------------------

constexpr size_t TITLE_TRANSCRIPT_CHARS = 2000;
constexpr int TITLE_MAX_WORDS = 6;

std::string build_title_prompt(const std::string& transcript);

/// Trim, drop surrounding quotes and a trailing period, cap at six words.
/// nullopt if nothing is left.
std::optional<std::string> clean_title(const std::string& raw);

/// Throws whatever the chat call throws; callers treat failure as non-fatal.
std::optional<std::string> generate_title(const TranscriptionClient& client, Provider provider,
                                          const std::string& transcript);

// ---------------------------------------------------------------------------
// LLM diarization, for providers that return no speaker labels
// ---------------------------------------------------------------------------

constexpr size_t DIARIZATION_TRANSCRIPT_CHARS = 8000;

struct DiarizationResult {
    std::vector<TranscriptSegment> segments;
    int speaker_count = 0;
    int cost_cents = 0;
};

std::string build_diarization_prompt(const std::string& transcript);

/// Accepts {"segments":[...]}, {"speakers":[...]} or a bare array. Items need
/// a speaker (speakerId, speaker_id or speaker) and text; others are skipped.
/// Timings are estimated at 2.5 words per second, at least 1 s per item.
std::vector<TranscriptSegment> parse_diarization_response(const std::string& content);

/// ceil(prompt_chars/4 * 0.00015 + 1000 * 0.0006)
int estimate_diarization_cost_cents(size_t prompt_chars);

DiarizationResult diarize_with_llm(const TranscriptionClient& client, Provider provider,
                                   const std::string& transcript);

// ---------------------------------------------------------------------------
// Speaker identification
// ---------------------------------------------------------------------------

/// Speaker ids in first-appearance order.
std::vector<std::string> unique_speakers(const std::vector<TranscriptSegment>& segments);

std::string build_speaker_prompt(const std::string& transcript,
                                 const std::vector<TranscriptSegment>& segments,
                                 const std::string& meeting_title,
                                 const std::vector<std::string>& speakers);

/// Parse {"speakers":[{speakerId, inferredName, confidence, evidence, role}]}
/// or a bare array. Unparseable content yields "Unknown" at confidence 0 for
/// every id in `speakers`.
std::vector<SpeakerLabel> parse_speaker_identification(const std::string& content,
                                                       const std::vector<std::string>& speakers);

/// max(1, ceil(dollars * 100)) at $0.15/M input and $0.60/M output tokens.
int chat_cost_cents(int prompt_tokens, int completion_tokens);

struct SpeakerIdentification {
    std::vector<SpeakerLabel> labels;
    int cost_cents = 0;
};

SpeakerIdentification identify_speakers(const TranscriptionClient& client, Provider provider,
                                        const std::string& transcript,
                                        const std::vector<TranscriptSegment>& segments,
                                        const std::string& meeting_title);

} // namespace recscribe
