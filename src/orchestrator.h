// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "audio_compressor.h"
#include "http_client.h"
#include "secret_store.h"
#include "transcript.h"
#include "transcription_client.h"

#include <functional>

namespace recscribe {

using CompressFn = std::function<CompressionResult(const fs::path&, int64_t target_bytes,
                                                   const StopToken*)>;

/// Policy layer over TranscriptionClient: silence cropping, compression,
/// model selection, cost accounting and post-processing.
class Orchestrator {
public:
    explicit Orchestrator(const SecretStore& secrets, HttpTransport transport = curl_transport);

    /// Run the whole pipeline for one file. Errors while resolving the
    /// provider, checking the file, compressing or uploading abort with the
    /// originating PipelineError. Cropping and post-processing failures are
    /// logged and skipped.
    TranscriptionResult transcribe(const fs::path& path, const TranscriptionOptions& options,
                                   const StopToken* stop = nullptr) const;

    void set_compressor(CompressFn fn) { compress_ = std::move(fn); }

    const TranscriptionClient& client() const { return client_; }

private:
    fs::path fit_to_limit(const fs::path& path, const ProviderInfo& info,
                          const TranscriptionOptions& options, const StopToken* stop,
                          TranscriptionResult& result) const;
    void post_process(const TranscriptionOptions& options, TranscriptionResult& result) const;

    TranscriptionClient client_;
    CompressFn compress_;
};

} // namespace recscribe
