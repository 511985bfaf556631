#include "audio/mic_capture.hpp"
#include "core/log.hpp"
#include "core/pipeline_config.hpp"
#include "stream/stt_session.hpp"
#include "stt/whisper_recognizer.hpp"
#include "vad/energy_vad.hpp"

#include <atomic>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

const char* kTag = "Main";

void usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "  --model PATH          whisper ggml model\n"
              << "  --pcm PATH            read 16 kHz s16le mono PCM from a file instead of the mic\n"
              << "  --language CODE       default en\n"
              << "  --threads N           whisper threads\n"
              << "  --threshold P         VAD threshold (0..1)\n"
              << "  --min-speech S        seconds\n"
              << "  --min-silence S       seconds\n"
              << "  --max-speech S        seconds\n"
              << "  --stop-on-silence MS  close an utterance after MS of silence\n"
              << "  --verbose             debug logging\n";
}

struct Options {
    PipelineConfig pipeline;
    WhisperRecognizer::Config whisper;
    std::string pcmPath;
    int stopOnSilenceMs = 0;
};

// Returns false when the program should exit (help or bad flag).
bool parse_args(int argc, char** argv, Options& opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument("missing value for " + a);
            return argv[++i];
        };

        if (a == "--help" || a == "-h") { usage(argv[0]); return false; }
        else if (a == "--model") opt.whisper.modelPath = value();
        else if (a == "--pcm") opt.pcmPath = value();
        else if (a == "--language") opt.pipeline.language = value();
        else if (a == "--threads") opt.pipeline.threads = std::stoi(value());
        else if (a == "--threshold") opt.pipeline.threshold = std::stof(value());
        else if (a == "--min-speech") opt.pipeline.minSpeechSeconds = std::stof(value());
        else if (a == "--min-silence") opt.pipeline.minSilenceSeconds = std::stof(value());
        else if (a == "--max-speech") opt.pipeline.maxSpeechSeconds = std::stof(value());
        else if (a == "--stop-on-silence") opt.stopOnSilenceMs = std::stoi(value());
        else if (a == "--verbose") set_log_level(LogLevel::Debug);
        else throw std::invalid_argument("unknown option: " + a);
    }
    return true;
}

int run_file(SttSession& session, const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        log_error(kTag, "cannot open " + path);
        session.cancel();
        session.join();
        return 1;
    }

    const size_t chunkBytes = 3200; // 100 ms
    while (in) {
        AudioChunk chunk(chunkBytes);
        in.read(reinterpret_cast<char*>(chunk.data()), (std::streamsize)chunk.size());
        chunk.resize((size_t)in.gcount());
        if (chunk.empty()) break;
        session.pushChunk(std::move(chunk));
    }

    session.finish();
    session.join();
    return 0;
}

int run_mic(SttSession& session, int sampleRate) {
    MicCapture::Config micConfig;
    micConfig.sampleRate = sampleRate;
    micConfig.framesPerBuffer = sampleRate / 10;

    MicCapture mic(micConfig);
    std::atomic<bool> stop{false};

    std::thread capture([&] {
        try {
            mic.run([&](AudioChunk chunk) { return session.pushChunk(std::move(chunk)); }, stop);
        } catch (const std::exception& e) {
            log_error("Mic", e.what());
        }
        session.finish();
    });

    std::string line;
    std::cout << "\nListening... Press enter to quit." << std::endl;
    std::getline(std::cin, line);

    stop.store(true);
    capture.join();
    session.join();
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    init_log_level_from_env();

    Options opt;
    try {
        if (!parse_args(argc, argv, opt)) return 0;
        opt.pipeline.validate();
    } catch (const std::exception& e) {
        log_error(kTag, e.what());
        usage(argv[0]);
        return 2;
    }

    try {
        EnergyVad vad;
        WhisperRecognizer recognizer(opt.whisper);

        SttSession session(opt.pipeline, vad, recognizer);
        if (opt.stopOnSilenceMs > 0) {
            const int limit = opt.stopOnSilenceMs;
            session.setShouldClose([limit](int silenceMs) { return silenceMs >= limit; });
        }

        session.start([](const std::string& text) { std::cout << "STT: " << text << std::endl; });

        if (!opt.pcmPath.empty()) return run_file(session, opt.pcmPath);
        return run_mic(session, opt.pipeline.sampleRate);
    } catch (const std::exception& e) {
        log_error(kTag, e.what());
        return 1;
    }
}
