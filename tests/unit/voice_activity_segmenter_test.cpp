#include <cassert>
#include <cmath>
#include <vector>

#include "audio/window_accumulator.hpp"
#include "core/pipeline_config.hpp"
#include "vad/energy_vad.hpp"
#include "vad/voice_activity_segmenter.hpp"
#include "../support/test_audio.hpp"

using namespace test_audio;
using State = VoiceActivitySegmenter::State;

static void feed(VoiceActivitySegmenter& seg, WindowAccumulator& acc, const std::vector<float>& samples) {
    for (const auto& w : acc.push(samples)) seg.accept(w);
}

static std::vector<VoiceSegment> drain(VoiceActivitySegmenter& seg) {
    std::vector<VoiceSegment> out;
    while (!seg.empty()) {
        out.push_back(seg.front());
        seg.pop();
    }
    return out;
}

static void speech_then_silence_gives_one_segment() {
    PipelineConfig cfg;
    EnergyVad vad;
    VoiceActivitySegmenter seg(cfg, vad);
    WindowAccumulator acc(cfg.windowSize);

    feed(seg, acc, concat(constant(2.0f, 0.5f), silence(1.0f)));
    assert(seg.state() == State::Silent);

    const auto segments = drain(seg);
    assert(segments.size() == 1);
    assert(!segments[0].forced);
    assert(segments[0].sequence == 0);
    assert(segments[0].startSample == 0);
    assert(std::fabs(segments[0].durationMs(cfg.sampleRate) - 2000.0f) <= cfg.windowMs());

    seg.flush();
    assert(seg.empty());
}

static void continuous_speech_is_split_at_the_cap() {
    PipelineConfig cfg;
    cfg.maxSpeechSeconds = 1.024f; // 32 windows
    EnergyVad vad;
    VoiceActivitySegmenter seg(cfg, vad);
    WindowAccumulator acc(cfg.windowSize);

    const float seconds = 3.0f;
    feed(seg, acc, constant(seconds, 0.5f));
    seg.flush();

    const auto segments = drain(seg);
    assert(segments.size() == (size_t)std::ceil(seconds / cfg.maxSpeechSeconds));
    for (size_t i = 0; i < segments.size(); ++i) {
        assert(segments[i].sequence == i);
        assert(segments[i].samples.size() <= (size_t)cfg.samplesFor(cfg.maxSpeechSeconds));
        assert(segments[i].forced);
    }
    // Contiguous: each split starts where the previous one stopped.
    assert(segments[1].startSample == (int64_t)segments[0].samples.size());
    assert(segments[2].startSample == segments[1].startSample + (int64_t)segments[1].samples.size());
}

static void short_burst_is_discarded() {
    PipelineConfig cfg;
    EnergyVad vad;
    VoiceActivitySegmenter seg(cfg, vad);
    WindowAccumulator acc(cfg.windowSize);

    feed(seg, acc, concat(concat(silence(0.5f), constant(0.2f, 0.5f)), silence(1.0f)));
    assert(seg.empty());
    assert(seg.discarded() == 1);
    assert(seg.state() == State::Silent);
}

static void flush_keeps_min_speech_filter() {
    PipelineConfig cfg;
    EnergyVad vad;

    {
        VoiceActivitySegmenter seg(cfg, vad);
        WindowAccumulator acc(cfg.windowSize);
        feed(seg, acc, constant(0.2f, 0.5f));
        assert(seg.state() == State::Speaking);
        seg.flush();
        assert(seg.empty());
        assert(seg.state() == State::Silent);
    }
    {
        VoiceActivitySegmenter seg(cfg, vad);
        WindowAccumulator acc(cfg.windowSize);
        feed(seg, acc, constant(1.0f, 0.5f));
        assert(seg.empty());
        seg.flush();
        const auto segments = drain(seg);
        assert(segments.size() == 1);
        assert(segments[0].forced);
        assert(segments[0].samples.size() == 31 * 512); // 128 samples still in the accumulator
    }
}

static void brief_pause_does_not_split() {
    PipelineConfig cfg;
    EnergyVad vad;
    VoiceActivitySegmenter seg(cfg, vad);
    WindowAccumulator acc(cfg.windowSize);

    feed(seg, acc, constant(1.0f, 0.5f));
    feed(seg, acc, silence(0.3f));
    assert(seg.state() == State::EndingPendingConfirmation);
    assert(seg.silenceDurationMs() > 0);
    feed(seg, acc, constant(1.0f, 0.5f));
    assert(seg.state() == State::Speaking);
    feed(seg, acc, silence(1.0f));

    const auto segments = drain(seg);
    assert(segments.size() == 1);
    assert(std::fabs(segments[0].durationMs(cfg.sampleRate) - 2300.0f) <= 2 * cfg.windowMs());
}

static void trailing_silence_is_trimmed() {
    PipelineConfig cfg;
    EnergyVad vad;
    VoiceActivitySegmenter seg(cfg, vad);
    WindowAccumulator acc(cfg.windowSize);

    // Exactly 40 windows of speech then silence.
    feed(seg, acc, constant(40 * 512 / 16000.0f, 0.5f));
    feed(seg, acc, silence(1.0f));
    const auto segments = drain(seg);
    assert(segments.size() == 1);
    assert(segments[0].samples.size() == 40 * 512);
    for (float s : segments[0].samples) assert(s != 0.0f);
}

static void close_pending_cuts_early() {
    PipelineConfig cfg;
    EnergyVad vad;
    VoiceActivitySegmenter seg(cfg, vad);
    WindowAccumulator acc(cfg.windowSize);

    assert(!seg.closePending());

    feed(seg, acc, constant(40 * 512 / 16000.0f, 0.5f));
    feed(seg, acc, silence(5 * 512 / 16000.0f));
    assert(seg.state() == State::EndingPendingConfirmation);
    assert(seg.silenceDurationMs() == 160);
    assert(seg.empty());

    assert(seg.closePending());
    assert(seg.state() == State::Silent);
    const auto segments = drain(seg);
    assert(segments.size() == 1);
    assert(!segments[0].forced);
    assert(segments[0].samples.size() == 40 * 512);
}

static void flush_trims_pending_silence() {
    PipelineConfig cfg;
    EnergyVad vad;
    VoiceActivitySegmenter seg(cfg, vad);
    WindowAccumulator acc(cfg.windowSize);

    feed(seg, acc, constant(40 * 512 / 16000.0f, 0.5f));
    feed(seg, acc, silence(5 * 512 / 16000.0f));
    assert(seg.state() == State::EndingPendingConfirmation);

    seg.flush();
    assert(seg.state() == State::Silent);
    const auto segments = drain(seg);
    assert(segments.size() == 1);
    assert(segments[0].samples.size() == 40 * 512);
    for (float s : segments[0].samples) assert(s != 0.0f);
}

static void cap_during_pending_silence_cuts_at_silence_start() {
    PipelineConfig cfg;
    cfg.maxSpeechSeconds = 1.024f; // 32 windows
    EnergyVad vad;
    const std::vector<float> speech(512, 0.5f);
    const std::vector<float> quiet(512, 0.0f);

    // Window 33 hits the cap while silence is pending; it is then classified from Silent.
    {
        VoiceActivitySegmenter seg(cfg, vad);
        for (int i = 0; i < 30; ++i) seg.accept(speech);
        seg.accept(quiet);
        seg.accept(quiet);
        assert(seg.state() == State::EndingPendingConfirmation);
        assert(seg.empty());

        seg.accept(quiet);
        assert(seg.state() == State::Silent);
        assert(seg.openSamples() == 0);
        const auto segments = drain(seg);
        assert(segments.size() == 1);
        assert(segments[0].samples.size() == 30 * 512);
        assert(!segments[0].forced);
    }
    {
        VoiceActivitySegmenter seg(cfg, vad);
        for (int i = 0; i < 30; ++i) seg.accept(speech);
        seg.accept(quiet);
        seg.accept(quiet);

        seg.accept(speech);
        assert(seg.state() == State::Speaking);
        assert(seg.openSamples() == 512);
        const auto segments = drain(seg);
        assert(segments.size() == 1);
        assert(segments[0].samples.size() == 30 * 512);
        assert(!segments[0].forced);
        assert(seg.discarded() == 0);
    }
}

static void reset_drops_open_and_queued_audio() {
    PipelineConfig cfg;
    EnergyVad vad;
    VoiceActivitySegmenter seg(cfg, vad);
    WindowAccumulator acc(cfg.windowSize);

    feed(seg, acc, concat(constant(1.0f, 0.5f), silence(1.0f)));
    feed(seg, acc, constant(1.0f, 0.5f));
    assert(seg.queued() == 1);
    assert(seg.openSamples() > 0);

    seg.reset();
    assert(seg.empty());
    assert(seg.openSamples() == 0);
    assert(seg.state() == State::Silent);
    seg.flush();
    assert(seg.empty());
}

static void wrong_window_size_throws() {
    PipelineConfig cfg;
    EnergyVad vad;
    VoiceActivitySegmenter seg(cfg, vad);
    bool threw = false;
    try {
        seg.accept(std::vector<float>(100, 0.5f));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    PipelineConfig bad;
    bad.windowSize = 600;
    threw = false;
    try {
        VoiceActivitySegmenter s(bad, vad);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);
}

int main() {
    speech_then_silence_gives_one_segment();
    continuous_speech_is_split_at_the_cap();
    short_burst_is_discarded();
    flush_keeps_min_speech_filter();
    brief_pause_does_not_split();
    trailing_silence_is_trimmed();
    close_pending_cuts_early();
    flush_trims_pending_silence();
    cap_during_pending_silence_cuts_at_silence_start();
    reset_drops_open_and_queued_audio();
    wrong_window_size_throws();
    return 0;
}
