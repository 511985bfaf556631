#include "stt/segment_transcriber.hpp"

#include "audio/wav_codec.hpp"
#include "core/log.hpp"
#include "stream/cancellation.hpp"

namespace {
const char* kTag = "Transcriber";
}

std::string trim_copy(const std::string& s) {
    const char* ws = " \t\n\r";
    const size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    const size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

SegmentTranscriber::SegmentTranscriber(SpeechRecognizer& recognizer, const PipelineConfig& config)
    : recognizer_(recognizer) {
    options_.sampleRate = config.sampleRate;
    options_.language = config.language;
    options_.temperature = config.temperature;
    options_.threads = config.threads;
}

std::string SegmentTranscriber::transcribe(const VoiceSegment& segment, const CancellationToken* cancel) {
    if (segment.samples.empty()) return {};
    if (cancel) cancel->throwIfCancelled();

    const std::vector<uint8_t> wav = encode_wav_pcm16(segment.samples, options_.sampleRate, 1);

    std::vector<std::string> fragments;
    try {
        fragments = recognizer_.recognize(wav, options_, cancel);
    } catch (const Cancelled&) {
        throw;
    } catch (const std::exception& e) {
        throw TranscriptionFailed(segment.sequence, "segment #" + std::to_string(segment.sequence) +
                                                        ": " + e.what());
    }

    std::string text;
    for (const auto& f : fragments) text += f;
    text = trim_copy(text);

    log_debug(kTag, "segment #" + std::to_string(segment.sequence) + " -> \"" + text + "\"");
    return text;
}
