#ifndef STT_SESSION_HPP
#define STT_SESSION_HPP

#include "stream/cancellation.hpp"
#include "stream/chunk_queue.hpp"
#include "stream/stream_orchestrator.hpp"

#include <atomic>
#include <functional>
#include <string>
#include <thread>

// One audio connection: a chunk queue feeding a pipeline on its own worker thread.
class SttSession {
public:
    using TextCallback = StreamOrchestrator::TextCallback;
    using DoneCallback = std::function<void(StreamStatus status)>;

    SttSession(const PipelineConfig& config, VadModel& vad, SpeechRecognizer& recognizer);
    ~SttSession();

    SttSession(const SttSession&) = delete;
    SttSession& operator=(const SttSession&) = delete;

    void setShouldClose(StreamOrchestrator::ShouldClose predicate);

    // Single use: a second call throws std::logic_error.
    void start(TextCallback onText, DoneCallback onDone = nullptr);

    bool pushChunk(AudioChunk chunk);
    void finish();  // end of stream; remaining audio is flushed
    void cancel();  // stop now, no flush
    void join();

    bool running() const { return running_.load(); }
    StreamStatus status() const { return status_.load(); }

    // Written by the worker thread; only read it after join().
    const StreamStats& stats() const { return orchestrator_.stats(); }

private:
    void run();

    ChunkQueue queue_;
    CancellationToken cancel_;
    StreamOrchestrator orchestrator_;

    TextCallback onText_;
    DoneCallback onDone_;

    std::thread thread_;
    std::atomic<bool> started_{false};
    std::atomic<bool> running_{false};
    std::atomic<StreamStatus> status_{StreamStatus::Pending};
};

#endif
