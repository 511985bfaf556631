#ifndef STREAM_ORCHESTRATOR_HPP
#define STREAM_ORCHESTRATOR_HPP

#include "audio/window_accumulator.hpp"
#include "core/pipeline_config.hpp"
#include "stream/chunk_queue.hpp"
#include "stt/segment_transcriber.hpp"
#include "vad/voice_activity_segmenter.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <utility>

// Pending: a session that has not finished a run yet. run() returns only the other two.
enum class StreamStatus { Pending, Completed, Cancelled };

struct StreamStats {
    uint64_t chunks = 0;
    uint64_t droppedChunks = 0;
    uint64_t windows = 0;
    uint64_t segments = 0;
    uint64_t results = 0;
    uint64_t failedSegments = 0;
};

// bytes -> samples -> windows -> segments -> text, for one connection.
// Single use: one run() per instance.
class StreamOrchestrator {
public:
    using TextCallback = std::function<void(const std::string& text)>;

    // Asked while trailing silence is pending; returning true closes the segment early.
    using ShouldClose = std::function<bool(int silenceMs)>;

    StreamOrchestrator(const PipelineConfig& config, VadModel& vad, SpeechRecognizer& recognizer);

    void setShouldClose(ShouldClose predicate) { shouldClose_ = std::move(predicate); }

    StreamStatus run(ChunkSource& source, const TextCallback& onText, const CancellationToken& cancel);

    // One chunk worth of work: decode, window, segment, transcribe.
    void processChunk(const AudioChunk& chunk, const TextCallback& onText, const CancellationToken& cancel);

    // End of stream: close the open segment and transcribe what is left.
    void finish(const TextCallback& onText, const CancellationToken& cancel);

    const StreamStats& stats() const { return stats_; }
    const VoiceActivitySegmenter& segmenter() const { return segmenter_; }

private:
    void drainSegments(const TextCallback& onText, const CancellationToken& cancel);
    void logStats(const char* how) const;

    WindowAccumulator accumulator_;
    VoiceActivitySegmenter segmenter_;
    SegmentTranscriber transcriber_;
    ShouldClose shouldClose_;
    StreamStats stats_;
};

#endif
