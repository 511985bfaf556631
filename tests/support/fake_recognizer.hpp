#ifndef FAKE_RECOGNIZER_HPP
#define FAKE_RECOGNIZER_HPP

#include <atomic>
#include <functional>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "audio/wav_codec.hpp"
#include "stream/cancellation.hpp"
#include "stt/speech_recognizer.hpp"

// Stands in for the whisper engine: returns canned fragments and records what it was given.
class FakeRecognizer : public SpeechRecognizer {
public:
    std::vector<std::string> fragments{" hello", " world"};
    std::set<int> failOnCalls;            // 1-based call numbers that throw
    std::function<void()> onRecognize;    // runs inside the call

    std::vector<std::string> recognize(const std::vector<uint8_t>& wav,
                                       const RecognitionOptions& options,
                                       const CancellationToken* cancel) override {
        const int n = ++calls;
        {
            std::lock_guard<std::mutex> lock(mutex);
            samplesSeen.push_back(decode_wav_pcm16(wav).samples.size());
            lastOptions = options;
        }
        if (onRecognize) onRecognize();
        if (cancel && cancel->isCancelled()) throw Cancelled();
        if (failOnCalls.count(n)) throw std::runtime_error("engine error");
        return fragments;
    }

    std::atomic<int> calls{0};
    std::mutex mutex;
    std::vector<size_t> samplesSeen;
    RecognitionOptions lastOptions;
};

#endif
