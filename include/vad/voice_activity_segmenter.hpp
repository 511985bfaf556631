#ifndef VOICE_ACTIVITY_SEGMENTER_HPP
#define VOICE_ACTIVITY_SEGMENTER_HPP

#include "core/pipeline_config.hpp"
#include "vad/vad_model.hpp"

#include <cstdint>
#include <deque>
#include <vector>

struct VoiceSegment {
    uint64_t sequence = 0;
    int64_t startSample = 0;   // offset in the stream
    bool forced = false;       // closed by the duration cap or by flush()
    std::vector<float> samples;

    float durationMs(int sampleRate) const { return 1000.0f * samples.size() / sampleRate; }
};

// Turns a stream of windows into closed speech segments.
//
// Silent -> Speaking on the first window scoring above the threshold. While speaking
// every window is kept; a run of below-threshold windows moves to
// EndingPendingConfirmation and, once it lasts minSilence, the segment is cut where the
// run started. Segments shorter than minSpeech are dropped. A segment that would grow
// past maxSpeech is cut and a new one opened with the next window.
class VoiceActivitySegmenter {
public:
    enum class State { Silent, Speaking, EndingPendingConfirmation };

    VoiceActivitySegmenter(const PipelineConfig& config, VadModel& model);

    void accept(const std::vector<float>& window);

    // End of stream: close whatever is open without waiting for silence.
    void flush();

    // Closes the segment now if trailing silence is pending. Returns true if it did.
    bool closePending();

    bool empty() const { return queue_.empty(); }
    const VoiceSegment& front() const;
    void pop();
    size_t queued() const { return queue_.size(); }

    State state() const { return state_; }
    int silenceDurationMs() const;
    size_t openSamples() const { return current_.size(); }
    uint64_t discarded() const { return discarded_; }

    void reset();

private:
    void openSegment(const std::vector<float>& window, int64_t start);
    void closeSegment(size_t keep, bool forced);

    VadModel& model_;
    int sampleRate_;
    size_t windowSize_;
    float threshold_;

    size_t minSpeechSamples_;
    size_t minSilenceSamples_;
    size_t maxSpeechSamples_;

    State state_ = State::Silent;
    std::vector<float> current_;
    int64_t currentStart_ = 0;
    size_t silenceStart_ = 0;
    size_t silenceSamples_ = 0;

    int64_t streamPos_ = 0;
    uint64_t nextSequence_ = 0;
    uint64_t discarded_ = 0;

    std::deque<VoiceSegment> queue_;
};

#endif
