#ifndef SEGMENT_TRANSCRIBER_HPP
#define SEGMENT_TRANSCRIBER_HPP

#include "core/pipeline_config.hpp"
#include "stt/speech_recognizer.hpp"
#include "vad/voice_activity_segmenter.hpp"

#include <stdexcept>
#include <string>

class CancellationToken;

class TranscriptionFailed : public std::runtime_error {
public:
    TranscriptionFailed(uint64_t sequence, const std::string& what)
        : std::runtime_error(what), sequence_(sequence) {}

    uint64_t sequence() const { return sequence_; }

private:
    uint64_t sequence_;
};

class SegmentTranscriber {
public:
    SegmentTranscriber(SpeechRecognizer& recognizer, const PipelineConfig& config);

    // Trimmed text for one segment; empty when there is nothing to emit.
    // Throws TranscriptionFailed, or Cancelled if the token fires.
    std::string transcribe(const VoiceSegment& segment, const CancellationToken* cancel = nullptr);

private:
    SpeechRecognizer& recognizer_;
    RecognitionOptions options_;
};

std::string trim_copy(const std::string& s);

#endif
