#include "stream/stream_orchestrator.hpp"

#include "audio/chunk_decoder.hpp"
#include "core/log.hpp"
#include "stream/cancellation.hpp"

namespace {
const char* kTag = "Stream";
}

StreamOrchestrator::StreamOrchestrator(const PipelineConfig& config, VadModel& vad, SpeechRecognizer& recognizer)
    : accumulator_(config.windowSize),
      segmenter_(config, vad),
      transcriber_(recognizer, config) {}

StreamStatus StreamOrchestrator::run(ChunkSource& source, const TextCallback& onText, const CancellationToken& cancel) {
    try {
        AudioChunk chunk;
        while (true) {
            const NextResult r = source.next(chunk, cancel);
            if (r == NextResult::Cancelled) throw Cancelled();
            if (r == NextResult::EndOfStream) break;

            processChunk(chunk, onText, cancel);
        }

        finish(onText, cancel);
    } catch (const Cancelled&) {
        logStats("cancelled");
        return StreamStatus::Cancelled;
    }

    logStats("completed");
    return StreamStatus::Completed;
}

void StreamOrchestrator::processChunk(const AudioChunk& chunk, const TextCallback& onText, const CancellationToken& cancel) {
    cancel.throwIfCancelled();
    ++stats_.chunks;

    std::vector<float> samples;
    try {
        samples = decode_chunk(chunk);
    } catch (const MalformedAudioChunk& e) {
        ++stats_.droppedChunks;
        log_warn(kTag, std::string("dropping chunk: ") + e.what());
        return;
    }
    if (samples.empty()) return;

    for (const Window& w : accumulator_.push(samples)) {
        cancel.throwIfCancelled();
        ++stats_.windows;

        segmenter_.accept(w);

        if (shouldClose_ &&
            segmenter_.state() == VoiceActivitySegmenter::State::EndingPendingConfirmation &&
            shouldClose_(segmenter_.silenceDurationMs())) {
            segmenter_.closePending();
        }

        drainSegments(onText, cancel);
    }
}

void StreamOrchestrator::finish(const TextCallback& onText, const CancellationToken& cancel) {
    cancel.throwIfCancelled();

    const size_t leftover = accumulator_.drain().size();
    if (leftover > 0) log_debug(kTag, "discarding " + std::to_string(leftover) + " samples short of a window");

    segmenter_.flush();
    drainSegments(onText, cancel);
}

void StreamOrchestrator::drainSegments(const TextCallback& onText, const CancellationToken& cancel) {
    while (!segmenter_.empty()) {
        cancel.throwIfCancelled();

        const VoiceSegment& segment = segmenter_.front();
        ++stats_.segments;

        std::string text;
        try {
            text = transcriber_.transcribe(segment, &cancel);
        } catch (const TranscriptionFailed& e) {
            ++stats_.failedSegments;
            log_warn(kTag, std::string("transcription failed, skipping ") + e.what());
        }
        segmenter_.pop();

        if (!text.empty()) {
            ++stats_.results;
            if (onText) onText(text);
        }
    }
}

void StreamOrchestrator::logStats(const char* how) const {
    log_info(kTag, std::string("stream ") + how + ": " + std::to_string(stats_.chunks) + " chunks (" +
                       std::to_string(stats_.droppedChunks) + " dropped), " +
                       std::to_string(stats_.segments) + " segments, " +
                       std::to_string(stats_.results) + " results, " +
                       std::to_string(stats_.failedSegments) + " failed");
}
