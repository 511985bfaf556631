#include "stt/whisper_recognizer.hpp"

#include "audio/wav_codec.hpp"
#include "core/log.hpp"
#include "stream/cancellation.hpp"

#include <whisper.h>

#include <cstdio>
#include <stdexcept>

namespace {

const char* kTag = "Whisper STT";

// Keep ggml warnings and errors; info only with debug logging on.
void whisper_log_cb(ggml_log_level level, const char* text, void*) {
    switch (level) {
    case GGML_LOG_LEVEL_ERROR:
    case GGML_LOG_LEVEL_WARN:
        std::fputs(text, stderr);
        break;
    default:
        if (log_level() == LogLevel::Debug) std::fputs(text, stderr);
        break;
    }
}

bool abort_requested(void* user_data) {
    const auto* cancel = static_cast<const CancellationToken*>(user_data);
    return cancel != nullptr && cancel->isCancelled();
}

struct StateGuard {
    whisper_state* state = nullptr;
    ~StateGuard() {
        if (state) whisper_free_state(state);
    }
};

} // namespace

// Constructor
WhisperRecognizer::WhisperRecognizer(const Config& config) : config_(config) {
    whisper_log_set(whisper_log_cb, nullptr);

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = config_.useGpu;
    cparams.flash_attn = false;

    context_ = whisper_init_from_file_with_params_no_state(config_.modelPath.c_str(), cparams);
    if (!context_) throw std::runtime_error("whisper_init_from_file_with_params_no_state failed: " + config_.modelPath);

    log_info(kTag, "model loaded: " + config_.modelPath);
}

// Destructor
WhisperRecognizer::~WhisperRecognizer() {
    if (context_) whisper_free(context_);
}

std::vector<std::string> WhisperRecognizer::recognize(const std::vector<uint8_t>& wav,
                                                      const RecognitionOptions& options,
                                                      const CancellationToken* cancel) {
    const WavAudio audio = decode_wav_pcm16(wav);
    if (audio.sampleRate != WHISPER_SAMPLE_RATE) {
        throw std::runtime_error("whisper needs " + std::to_string(WHISPER_SAMPLE_RATE) +
                                 " Hz audio, got " + std::to_string(audio.sampleRate));
    }
    if (audio.samples.empty()) return {};

    StateGuard guard;
    guard.state = whisper_init_state(context_);
    if (!guard.state) throw std::runtime_error("whisper_init_state failed");

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    params.n_threads = options.threads;
    params.language = options.language.c_str();
    params.translate = false;
    params.temperature = options.temperature;

    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.print_special = false;
    params.single_segment = false;

    params.no_speech_thold = config_.noSpeechThreshold;

    params.abort_callback = abort_requested;
    params.abort_callback_user_data = const_cast<CancellationToken*>(cancel);

    const int rc = whisper_full_with_state(context_, guard.state, params,
                                           audio.samples.data(), (int)audio.samples.size());
    if (cancel && cancel->isCancelled()) throw Cancelled();
    if (rc != 0) throw std::runtime_error("whisper_full_with_state failed (" + std::to_string(rc) + ")");

    std::vector<std::string> fragments;
    const int n_segments = whisper_full_n_segments_from_state(guard.state);
    fragments.reserve(n_segments);
    for (int i = 0; i < n_segments; ++i) {
        const char* text = whisper_full_get_segment_text_from_state(guard.state, i);
        if (text) fragments.emplace_back(text);
    }
    return fragments;
}
