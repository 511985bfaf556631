#include "stream/stt_session.hpp"

#include "core/log.hpp"

#include <stdexcept>
#include <utility>

namespace {
const char* kTag = "STT Session";
}

// Constructor
SttSession::SttSession(const PipelineConfig& config, VadModel& vad, SpeechRecognizer& recognizer)
    : orchestrator_(config, vad, recognizer) {}

// Destructor
SttSession::~SttSession() {
    if (thread_.joinable()) {
        cancel();
        join();
    }
}

void SttSession::setShouldClose(StreamOrchestrator::ShouldClose predicate) {
    orchestrator_.setShouldClose(std::move(predicate));
}

// Starts the pipeline thread
void SttSession::start(TextCallback onText, DoneCallback onDone) {
    if (started_.exchange(true)) throw std::logic_error("STT session already started");
    running_.store(true);
    onText_ = std::move(onText);
    onDone_ = std::move(onDone);
    thread_ = std::thread(&SttSession::run, this);
}

bool SttSession::pushChunk(AudioChunk chunk) {
    return queue_.push(std::move(chunk));
}

void SttSession::finish() { queue_.close(); }

void SttSession::cancel() {
    cancel_.cancel();
    queue_.close();
}

void SttSession::join() {
    if (thread_.joinable()) thread_.join();
}

// Thread function that drives the orchestrator until end of stream or cancel
void SttSession::run() {
    StreamStatus status = StreamStatus::Cancelled;
    try {
        status = orchestrator_.run(queue_, onText_, cancel_);
    } catch (const std::exception& e) {
        log_error(kTag, e.what());
    }
    status_.store(status);
    running_.store(false);

    if (onDone_) {
        try {
            onDone_(status);
        } catch (const std::exception& e) {
            log_error(kTag, std::string("done callback threw: ") + e.what());
        }
    }
}
