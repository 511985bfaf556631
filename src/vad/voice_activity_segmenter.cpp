#include "vad/voice_activity_segmenter.hpp"

#include "core/log.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace {
const char* kTag = "Segmenter";
}

VoiceActivitySegmenter::VoiceActivitySegmenter(const PipelineConfig& config, VadModel& model)
    : model_(model),
      sampleRate_(config.sampleRate),
      windowSize_((size_t)config.windowSize),
      threshold_(config.threshold) {
    config.validate();

    minSpeechSamples_ = (size_t)config.samplesFor(config.minSpeechSeconds);
    minSilenceSamples_ = (size_t)config.samplesFor(config.minSilenceSeconds);
    maxSpeechSamples_ = (size_t)config.samplesFor(config.maxSpeechSeconds);

    current_.reserve(maxSpeechSamples_);
}

void VoiceActivitySegmenter::reset() {
    state_ = State::Silent;
    current_.clear();
    currentStart_ = 0;
    silenceStart_ = 0;
    silenceSamples_ = 0;
    queue_.clear();
}

int VoiceActivitySegmenter::silenceDurationMs() const {
    if (state_ != State::EndingPendingConfirmation) return 0;
    return (int)(1000 * (int64_t)silenceSamples_ / sampleRate_);
}

const VoiceSegment& VoiceActivitySegmenter::front() const {
    if (queue_.empty()) throw std::logic_error("front() on empty segment queue");
    return queue_.front();
}

void VoiceActivitySegmenter::pop() {
    if (queue_.empty()) throw std::logic_error("pop() on empty segment queue");
    queue_.pop_front();
}

void VoiceActivitySegmenter::openSegment(const std::vector<float>& window, int64_t start) {
    current_.assign(window.begin(), window.end());
    currentStart_ = start;
    silenceStart_ = 0;
    silenceSamples_ = 0;
    state_ = State::Speaking;
}

void VoiceActivitySegmenter::closeSegment(size_t keep, bool forced) {
    if (keep < current_.size()) current_.resize(keep);

    if (!current_.empty() && current_.size() >= minSpeechSamples_) {
        VoiceSegment seg;
        seg.sequence = nextSequence_++;
        seg.startSample = currentStart_;
        seg.forced = forced;
        seg.samples.swap(current_);

        log_debug(kTag, "segment #" + std::to_string(seg.sequence) + " closed, " +
                            std::to_string((int)seg.durationMs(sampleRate_)) + " ms" +
                            (forced ? " (forced)" : ""));
        queue_.push_back(std::move(seg));
    } else if (!current_.empty()) {
        ++discarded_;
        log_debug(kTag, "dropped " + std::to_string(1000 * (int64_t)current_.size() / sampleRate_) +
                            " ms of audio shorter than min speech");
    }

    current_.clear();
    silenceStart_ = 0;
    silenceSamples_ = 0;
    state_ = State::Silent;
}

void VoiceActivitySegmenter::accept(const std::vector<float>& window) {
    if (window.size() != windowSize_) {
        throw std::invalid_argument("window of " + std::to_string(window.size()) +
                                    " samples, expected " + std::to_string(windowSize_));
    }

    const int64_t windowStart = streamPos_;
    streamPos_ += (int64_t)window.size();

    const bool speech = model_.score(window) > threshold_;

    bool reopened = false;

    // Duration cap
    if (state_ != State::Silent && current_.size() + window.size() > maxSpeechSamples_) {
        const bool pending = state_ == State::EndingPendingConfirmation;
        closeSegment(pending ? silenceStart_ : current_.size(), !pending);

        if (!pending) {
            openSegment(window, windowStart);
            if (!speech) {
                state_ = State::EndingPendingConfirmation;
                silenceSamples_ = window.size();
            }
            reopened = true;
        }
    }

    if (!reopened) {
        switch (state_) {
        case State::Silent:
            if (speech) openSegment(window, windowStart);
            break;

        case State::Speaking:
            current_.insert(current_.end(), window.begin(), window.end());
            if (!speech) {
                state_ = State::EndingPendingConfirmation;
                silenceStart_ = current_.size() - window.size();
                silenceSamples_ = window.size();
            }
            break;

        case State::EndingPendingConfirmation:
            current_.insert(current_.end(), window.begin(), window.end());
            if (speech) {
                state_ = State::Speaking;
                silenceSamples_ = 0;
            } else {
                silenceSamples_ += window.size();
            }
            break;
        }
    }

    if (state_ == State::EndingPendingConfirmation && silenceSamples_ >= minSilenceSamples_) {
        closeSegment(silenceStart_, false);
    }
}

bool VoiceActivitySegmenter::closePending() {
    if (state_ != State::EndingPendingConfirmation) return false;
    closeSegment(silenceStart_, false);
    return true;
}

void VoiceActivitySegmenter::flush() {
    if (state_ == State::Silent) return;
    closeSegment(state_ == State::EndingPendingConfirmation ? silenceStart_ : current_.size(), true);
}
