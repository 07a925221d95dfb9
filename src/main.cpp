// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "cli.h"
#include "config.h"
#include "log.h"
#include "meeting.h"
#include "orchestrator.h"
#include "retry_coordinator.h"
#include "secret_store.h"
#include "silence_cropper.h"
#include "silence_detector.h"
#include "util.h"
#include "version.h"

#include <csignal>
#include <cstdio>
#include <cstdlib>

using namespace recscribe;

static StopToken g_stop;

static void signal_handler(int) {
    g_stop.request();
}

static void print_usage() {
    fprintf(stderr,
        "Usage: recscribe [OPTIONS] FILE...\n"
        "\n"
        "Transcribe recorded meetings and dictation through a cloud provider.\n"
        "\n"
        "Options:\n"
        "  --provider NAME        Transcription provider: openai, groq (default: openai)\n"
        "  --model NAME           Transcription model (default: provider's default)\n"
        "  --language CODE        Language hint (e.g. en, de; default: auto-detect)\n"
        "  --crop-silences        Remove long silences before upload\n"
        "  --silence-threshold S  Shortest silence to crop, in seconds (default: 3.0)\n"
        "  --no-diarize           Skip speaker diarization and naming\n"
        "  --no-title             Skip title generation\n"
        "  --no-compress          Fail instead of compressing oversized files\n"
        "  --dictate              Fast plain-text transcription of short clips\n"
        "  --detect-silences      Print silent regions and exit\n"
        "  --crop-only            Write <name>_cropped.<ext> and exit\n"
        "  --retry-failed         Retry failed files once more after the first pass\n"
        "  --retry-delay MS       Delay between bulk retries (default: 500)\n"
        "  --log-level LEVEL      none, error, warn, info, debug (default: none)\n"
        "  --config PATH          Config file (default: ~/.config/recscribe/config.yaml)\n"
        "  -h, --help             Show this help\n"
        "  -v, --version          Show version\n"
    );
}

static void print_version() {
    printf("recscribe %s\n", RECSCRIBE_VERSION);
}

static int run_detect(const CliResult& cli) {
    int rc = 0;
    for (const auto& file : cli.files) {
        try {
            auto regions = detect_silences(file, cli.cfg.silence_threshold_db,
                                           cli.cfg.silence_crop_threshold);
            printf("%s: %zu silent region(s)\n", file.c_str(), regions.size());
            for (const auto& r : regions)
                printf("  %8.2f - %8.2f  (%.2fs)\n", r.start, r.end, r.duration());
        } catch (const RecscribeError& e) {
            fprintf(stderr, "%s: %s\n", file.c_str(), e.what());
            rc = 1;
        }
    }
    return rc;
}

static int run_crop(const CliResult& cli) {
    int rc = 0;
    for (const auto& file : cli.files) {
        try {
            auto res = crop_silences(file, cli.cfg.silence_crop_threshold, cli.cfg.keep_pad,
                                     cli.cfg.silence_threshold_db, &g_stop);
            if (res.regions_cropped == 0) {
                printf("%s: nothing to crop\n", file.c_str());
                continue;
            }
            printf("%s -> %s: %d region(s), %.1fs -> %.1fs (saved %.1fs)\n",
                   file.c_str(), res.output_path.c_str(), res.regions_cropped,
                   res.original_duration, res.new_duration, res.time_saved);
        } catch (const RecscribeError& e) {
            fprintf(stderr, "%s: %s\n", file.c_str(), e.what());
            rc = 1;
        }
    }
    return rc;
}

static int run_dictate(const CliResult& cli, const SecretStore& secrets) {
    TranscriptionClient client(secrets);
    Provider provider = parse_provider(cli.cfg.provider);
    int rc = 0;
    for (const auto& file : cli.files) {
        try {
            auto res = client.transcribe_dictation(file, provider, &g_stop);
            printf("%s\n", res.text.c_str());
            fprintf(stderr, "(%.2fs, %d cent(s))\n", res.latency_seconds, res.cost_cents);
        } catch (const RecscribeError& e) {
            fprintf(stderr, "%s: %s\n", file.c_str(), e.what());
            rc = 1;
        }
    }
    return rc;
}

static void write_transcript(const Meeting& m) {
    fs::path out = transcript_path_for(m.audio_path);
    std::string body;
    if (!m.title.empty()) body += "# " + m.title + "\n\n";
    body += m.transcript.value_or("");
    write_text_file(out, body);
    printf("%s -> %s (%d cent(s))\n", m.audio_path.c_str(), out.c_str(),
           m.api_cost_cents.value_or(0));
}

static int run_transcribe(const CliResult& cli, const SecretStore& secrets) {
    MemoryMeetingStore store;
    for (const auto& file : cli.files) {
        Meeting m;
        m.id = file.string();
        m.title = file.stem().string();
        m.audio_path = file;
        m.status = MeetingStatus::PendingTranscription;
        store.save(m);
    }

    Orchestrator orchestrator(secrets);
    RetryCoordinator coordinator(store,
                                 make_transcribe_fn(orchestrator,
                                                    cli.cfg.transcription_options(), &g_stop),
                                 {}, std::chrono::milliseconds(cli.cfg.retry_delay_ms));

    auto report = [](const Meeting& m) {
        if (m.status == MeetingStatus::Ready) {
            try {
                write_transcript(m);
            } catch (const RecscribeError& e) {
                fprintf(stderr, "%s: %s\n", m.audio_path.c_str(), e.what());
            }
        } else {
            fprintf(stderr, "%s: %s\n", m.audio_path.c_str(),
                    m.error_message.value_or(meeting_status_name(m.status)).c_str());
        }
    };

    for (const auto& file : cli.files) {
        if (g_stop.stop_requested()) break;
        try {
            report(coordinator.transcribe_meeting(file.string()));
        } catch (const RecscribeError& e) {
            // Same file named twice: the first attempt already settled it.
            log_warn("%s: %s", file.c_str(), e.what());
        }
    }

    auto failed = store.list_by_status(MeetingStatus::Failed);
    if (cli.retry_failed && !g_stop.stop_requested() && !failed.empty()) {
        auto summary = coordinator.retry_all_failed([](const std::string& msg) {
            fprintf(stderr, "%s...\n", msg.c_str());
        });
        fprintf(stderr, "Retry: %d succeeded, %d failed\n", summary.succeeded, summary.failed);
        for (const auto& before : failed) {
            auto m = store.load(before.id);
            if (m && m->status == MeetingStatus::Ready)
                report(*m);
        }
    }

    for (const auto& file : cli.files) {
        auto m = store.load(file.string());
        if (!m || m->status != MeetingStatus::Ready)
            return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    auto cli = recscribe::parse_cli(argc, argv);
    if (!cli.error.empty()) {
        fprintf(stderr, "Error: %s\n", cli.error.c_str());
        return 2;
    }
    if (cli.show_version) { print_version(); return 0; }
    if (cli.show_help) { print_usage(); return 0; }
    if (cli.files.empty()) {
        print_usage();
        return 2;
    }

    LogLevel level = parse_log_level(cli.cfg.log_level_str);
    log_init(level, cli.cfg.log_dir);
    log_set_stderr(level != LogLevel::NONE);
    log_info("recscribe %s starting, provider %s", RECSCRIBE_VERSION, cli.cfg.provider.c_str());

    struct sigaction sa{};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    EnvSecretStore secrets(cli.cfg.api_keys);

    int rc = 0;
    try {
        switch (cli.mode) {
            case CliMode::DetectSilences: rc = run_detect(cli); break;
            case CliMode::CropOnly:       rc = run_crop(cli); break;
            case CliMode::Dictate:        rc = run_dictate(cli, secrets); break;
            case CliMode::Transcribe:     rc = run_transcribe(cli, secrets); break;
        }
    } catch (const RecscribeError& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        rc = 1;
    } catch (const std::exception& e) {
        fprintf(stderr, "Unexpected error: %s\n", e.what());
        rc = 1;
    }

    log_shutdown();
    return rc;
}
