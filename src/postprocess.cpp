// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "postprocess.h"
#include "log.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>

namespace recscribe {

using json = nlohmann::json;

namespace {

const char* TITLE_SYSTEM_PROMPT =
    "You are a helpful assistant that generates concise meeting titles.";

const char* DIARIZE_SYSTEM_PROMPT =
    "You are an expert at speaker diarization. Analyze transcripts and identify "
    "different speakers. Always respond with valid JSON only.";

const char* SPEAKER_SYSTEM_PROMPT =
    "You identify speakers from meeting transcripts. Return valid JSON only.";

constexpr size_t SPEAKER_EXCERPT_CHARS = 3000;
constexpr size_t SPEAKER_RAW_CHARS = 4000;

// Models sometimes wrap JSON in a Markdown code fence.
std::string strip_code_fence(const std::string& s) {
    std::string t = trim(s);
    if (t.compare(0, 3, "```") != 0) return t;
    auto nl = t.find('\n');
    auto close = t.rfind("```");
    if (nl == std::string::npos || close <= nl) return t;
    return trim(t.substr(nl + 1, close - nl - 1));
}

const json* find_array(const json& j, std::initializer_list<const char*> keys) {
    if (j.is_array()) return &j;
    if (!j.is_object()) return nullptr;
    for (const char* k : keys) {
        auto it = j.find(k);
        if (it != j.end() && it->is_array()) return &*it;
    }
    return nullptr;
}

std::string first_string(const json& item, std::initializer_list<const char*> keys) {
    for (const char* k : keys) {
        auto it = item.find(k);
        if (it != item.end() && it->is_string()) return it->get<std::string>();
    }
    return "";
}

size_t count_words(const std::string& text) {
    std::istringstream iss(text);
    std::string w;
    size_t n = 0;
    while (iss >> w) ++n;
    return n;
}

} // anonymous namespace

// --- Title ---

std::string build_title_prompt(const std::string& transcript) {
    std::ostringstream oss;
    oss << "Based on this meeting transcript, generate a short, descriptive title (max "
        << TITLE_MAX_WORDS << " words).\n"
        << "The title should capture the main topic or purpose of the meeting.\n"
        << "Return ONLY the title, no quotes or extra text.\n\n"
        << "Transcript:\n" << transcript.substr(0, TITLE_TRANSCRIPT_CHARS);
    return oss.str();
}

std::optional<std::string> clean_title(const std::string& raw) {
    std::string t = trim(raw);
    while (t.size() >= 2 && (t.front() == '"' || t.front() == '\'') && t.back() == t.front())
        t = trim(t.substr(1, t.size() - 2));
    if (!t.empty() && t.back() == '.')
        t.pop_back();

    std::istringstream iss(t);
    std::string word, out;
    int n = 0;
    while (iss >> word && n < TITLE_MAX_WORDS) {
        if (n++) out += ' ';
        out += word;
    }
    if (out.empty()) return std::nullopt;
    return out;
}

std::optional<std::string> generate_title(const TranscriptionClient& client, Provider provider,
                                          const std::string& transcript) {
    ChatRequest req;
    req.system_prompt = TITLE_SYSTEM_PROMPT;
    req.user_prompt = build_title_prompt(transcript);
    req.max_tokens = 20;
    req.temperature = 0.3;
    req.timeout_seconds = 10;

    auto title = clean_title(client.chat_completion(provider, req).content);
    if (title)
        log_info("Generated title: %s", title->c_str());
    return title;
}

// --- Diarization ---

std::string build_diarization_prompt(const std::string& transcript) {
    std::string excerpt = transcript.size() > DIARIZATION_TRANSCRIPT_CHARS
        ? transcript.substr(0, DIARIZATION_TRANSCRIPT_CHARS) + "..."
        : transcript;

    std::ostringstream oss;
    oss << "Analyze this meeting transcript and identify different speakers. For each "
           "segment of speech, assign a speaker ID (speaker_0, speaker_1, etc.).\n\n"
        << "Return a JSON object {\"segments\": [...]} where each element has:\n"
        << "- \"speakerId\": string like \"speaker_0\", \"speaker_1\"\n"
        << "- \"text\": the text spoken by this speaker\n\n"
        << "Try to detect speaker changes based on:\n"
        << "- Topic shifts\n"
        << "- Questions and answers\n"
        << "- Different speaking styles\n"
        << "- Context clues like \"thanks John\" or \"as I mentioned\"\n\n"
        << "Return ONLY the JSON, no explanation.\n\n"
        << "Transcript:\n" << excerpt;
    return oss.str();
}

std::vector<TranscriptSegment> parse_diarization_response(const std::string& content) {
    std::vector<TranscriptSegment> segments;
    json j = json::parse(strip_code_fence(content), nullptr, false);
    if (j.is_discarded()) {
        log_warn("Diarization response is not JSON");
        return segments;
    }

    const json* items = find_array(j, {"segments", "speakers"});
    if (!items) return segments;

    double t = 0.0;
    for (const auto& item : *items) {
        if (!item.is_object()) continue;
        std::string speaker = first_string(item, {"speakerId", "speaker_id", "speaker"});
        auto text = item.find("text");
        if (speaker.empty() || text == item.end() || !text->is_string()) continue;

        TranscriptSegment seg;
        seg.text = text->get<std::string>();
        seg.speaker = speaker;
        double est = std::max(1.0, count_words(seg.text) / 2.5);
        seg.start = t;
        seg.end = t + est;
        t += est;
        segments.push_back(std::move(seg));
    }
    return segments;
}

int estimate_diarization_cost_cents(size_t prompt_chars) {
    double input_tokens = static_cast<double>(prompt_chars / 4);
    return static_cast<int>(std::ceil(input_tokens * 0.00015 + 1000 * 0.0006));
}

DiarizationResult diarize_with_llm(const TranscriptionClient& client, Provider provider,
                                   const std::string& transcript) {
    DiarizationResult result;
    if (trim(transcript).empty()) return result;

    ChatRequest req;
    req.system_prompt = DIARIZE_SYSTEM_PROMPT;
    req.user_prompt = build_diarization_prompt(transcript);
    req.max_tokens = 4000;
    req.temperature = 0.3;
    req.json_mode = true;
    req.timeout_seconds = 60;

    auto reply = client.chat_completion(provider, req);
    result.segments = parse_diarization_response(reply.content);
    result.speaker_count = static_cast<int>(unique_speakers(result.segments).size());
    result.cost_cents = estimate_diarization_cost_cents(
        std::min(transcript.size(), DIARIZATION_TRANSCRIPT_CHARS));

    log_info("LLM diarization: %zu segment(s), %d speaker(s)",
             result.segments.size(), result.speaker_count);
    return result;
}

// --- Speaker identification ---

std::vector<std::string> unique_speakers(const std::vector<TranscriptSegment>& segments) {
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto& s : segments) {
        if (s.speaker && seen.insert(*s.speaker).second)
            out.push_back(*s.speaker);
    }
    return out;
}

std::string build_speaker_prompt(const std::string& transcript,
                                 const std::vector<TranscriptSegment>& segments,
                                 const std::string& meeting_title,
                                 const std::vector<std::string>& speakers) {
    std::ostringstream ctx;
    if (!meeting_title.empty())
        ctx << "Meeting Title: " << meeting_title << "\n\n";

    auto line = [](const TranscriptSegment& s) {
        return "[" + s.speaker.value_or("unknown") + "]: " + s.text + "\n";
    };

    if (!segments.empty()) {
        ctx << "Transcript with speaker labels:\n\n";
        size_t chars = 0;
        for (const auto& s : segments) {
            if (chars > SPEAKER_EXCERPT_CHARS) break;
            std::string l = line(s);
            ctx << l;
            chars += l.size();
        }
        // Long meetings: add a slice from the middle and the end.
        if (segments.size() > 20) {
            size_t mid = segments.size() / 2;
            size_t mid_end = std::min(mid + 5, segments.size());
            ctx << "\n[...]\n\n";
            for (size_t i = mid; i < mid_end; ++i) ctx << line(segments[i]);
            ctx << "\n[...]\n\n";
            for (size_t i = std::max(segments.size() - 5, mid_end); i < segments.size(); ++i)
                ctx << line(segments[i]);
        }
    } else {
        ctx << "Transcript:\n\n" << transcript.substr(0, SPEAKER_RAW_CHARS);
        if (transcript.size() > SPEAKER_RAW_CHARS)
            ctx << "\n\n[...transcript continues...]";
    }

    std::string list;
    for (const auto& s : speakers) {
        if (!list.empty()) list += ", ";
        list += s;
    }

    std::ostringstream oss;
    oss << "Analyze this meeting transcript and identify who each speaker is.\n\n"
        << "Speakers to identify: " << list << "\n\n"
        << "Look for clues like:\n"
        << "- Introductions (\"Hi, I'm John\" or \"Thanks for joining, Sarah\")\n"
        << "- Name mentions in conversation (\"John, what do you think?\")\n"
        << "- Role references (\"As the product manager...\" or \"From engineering...\")\n"
        << "- Self-references (\"I'll follow up with the client\")\n\n"
        << ctx.str() << "\n\n"
        << "Respond with a JSON object. For each speaker, provide:\n"
        << "- speakerId: the original label\n"
        << "- inferredName: your best guess for their name (use \"Unknown\" if truly uncertain)\n"
        << "- confidence: 0.0 to 1.0 (1.0 = explicitly stated, 0.5 = inferred, 0.2 = guess)\n"
        << "- evidence: quote or reasoning that led to this identification\n"
        << "- role: their role if identifiable (e.g., \"Host\", \"Engineer\", \"Customer\")\n\n"
        << "Format: {\"speakers\": [{\"speakerId\": \"speaker_0\", \"inferredName\": \"John\", "
           "\"confidence\": 0.9, \"evidence\": \"...\", \"role\": \"Engineer\"}]}\n\n"
        << "Return ONLY the JSON object, no other text.";
    return oss.str();
}

std::vector<SpeakerLabel> parse_speaker_identification(const std::string& content,
                                                       const std::vector<std::string>& speakers) {
    json j = json::parse(strip_code_fence(content), nullptr, false);
    const json* items = j.is_discarded() ? nullptr : find_array(j, {"speakers"});

    if (!items) {
        log_warn("Speaker identification response unparseable, marking speakers Unknown");
        std::vector<SpeakerLabel> unknown;
        for (const auto& id : speakers)
            unknown.push_back({id, "Unknown", 0.0, "", ""});
        return unknown;
    }

    std::vector<SpeakerLabel> labels;
    for (const auto& item : *items) {
        if (!item.is_object()) continue;
        std::string id = first_string(item, {"speakerId"});
        std::string name = first_string(item, {"inferredName"});
        if (id.empty() || name.empty()) continue;

        SpeakerLabel label;
        label.speaker_id = id;
        label.name = name;
        auto conf = item.find("confidence");
        label.confidence = (conf != item.end() && conf->is_number()) ? conf->get<double>() : 0.5;
        label.evidence = first_string(item, {"evidence"});
        label.role = first_string(item, {"role"});
        labels.push_back(std::move(label));
    }
    return labels;
}

int chat_cost_cents(int prompt_tokens, int completion_tokens) {
    double dollars = prompt_tokens * 0.15 / 1e6 + completion_tokens * 0.60 / 1e6;
    return std::max(1, static_cast<int>(std::ceil(dollars * 100)));
}

SpeakerIdentification identify_speakers(const TranscriptionClient& client, Provider provider,
                                        const std::string& transcript,
                                        const std::vector<TranscriptSegment>& segments,
                                        const std::string& meeting_title) {
    SpeakerIdentification result;
    auto speakers = unique_speakers(segments);
    if (speakers.empty()) return result;

    ChatRequest req;
    req.system_prompt = SPEAKER_SYSTEM_PROMPT;
    req.user_prompt = build_speaker_prompt(transcript, segments, meeting_title, speakers);
    req.max_tokens = 2048;
    req.temperature = 0.1;
    req.json_mode = true;
    req.timeout_seconds = 60;

    auto reply = client.chat_completion(provider, req);
    result.labels = parse_speaker_identification(reply.content, speakers);
    result.cost_cents = chat_cost_cents(reply.prompt_tokens, reply.completion_tokens);

    log_info("Speaker identification: %zu label(s), %d cent(s)",
             result.labels.size(), result.cost_cents);
    return result;
}

} // namespace recscribe
