// Streaming speech console: microphone or WAV-backed simulated microphone
#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <thread>
#include <atomic>
#include <cstdlib>
#include <csignal>
#include "asr/whisper_backend.hpp"
#include "audio/file_frame_source.hpp"
#include "audio/portaudio_frame_source.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "pipeline/pipeline_builder.hpp"
#include "wakeword/onnx_keyword_backend.hpp"

namespace {

std::atomic<bool> g_interrupted{false};

void on_sigint(int) { g_interrupted.store(true); }

// Prints every pipeline event on its own line
class ConsoleListener : public pipeline::SpeechListener {
public:
    explicit ConsoleListener(bool verbose) : verbose_(verbose) {}

    void on_init() override { if (verbose_) std::cout << "[event] initialized" << std::endl; }
    void on_start() override { std::cout << "[event] started" << std::endl; }
    void on_stop() override { std::cout << "[event] stopped" << std::endl; }
    void on_activate() override { std::cout << "[event] activated, listening..." << std::endl; }
    void on_deactivate() override { if (verbose_) std::cout << "[event] deactivated" << std::endl; }
    void on_recognize(const pipeline::RecognitionSnapshot& r) override {
        std::cout << "> " << r.transcript << "  (" << static_cast<int>(r.confidence * 100.0f) << "%)" << std::endl;
    }
    void on_partial_recognize(const pipeline::RecognitionSnapshot& r) override {
        if (verbose_) std::cout << "  ... " << r.transcript << std::endl;
    }
    void on_timeout() override { std::cout << "[event] timed out" << std::endl; }
    void on_trace(const std::string& message) override { std::cout << "[trace] " << message << std::endl; }
    void on_error(const core::SpeechError& error) override {
        std::cerr << "[event] error: " << error.to_string() << std::endl;
    }

private:
    bool verbose_;
};

void print_usage() {
    std::cout <<
        "Usage: speech_console [options]\n"
        "  --profile wakeword|vad|ptt   stage chain (default: wakeword)\n"
        "  --model NAME|PATH            whisper model (default: small.en)\n"
        "  --keyword-model PATH         ONNX keyword model; whisper spots the wake phrase if omitted\n"
        "  --labels a,b,c               keyword model labels\n"
        "  --file PATH                  read a WAV file instead of the microphone\n"
        "  --no-realtime                deliver file frames as fast as possible\n"
        "  --device INDEX               PortAudio input device (see list_devices)\n"
        "  --limit-seconds N            stop after N seconds (0 = until Ctrl+C or end of file)\n"
        "  --set KEY=VALUE              any pipeline option, e.g. --set wake_phrases=hey computer\n"
        "  -v, --verbose                partial results and debug logs\n";
}

} // namespace

int main(int argc, char** argv) {
    bool verbose = false;
    bool realtime = true;
    int limit_sec = 0;
    std::string profile_name = "wakeword";
    std::string path;

    pipeline::SpeechPipelineBuilder builder;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "-h" || a == "--help") { print_usage(); return 0; }
            if (a == "-v" || a == "--verbose") { verbose = true; continue; }
            if (a == "--no-realtime") { realtime = false; continue; }
            if (a == "--profile" && i + 1 < argc) { profile_name = argv[++i]; continue; }
            if (a == "--model" && i + 1 < argc) { builder.set_property("whisper_model_path", argv[++i]); continue; }
            if (a == "--keyword-model" && i + 1 < argc) { builder.set_property("keyword_model_path", argv[++i]); continue; }
            if (a == "--labels" && i + 1 < argc) { builder.set_property("keyword_labels", argv[++i]); continue; }
            if (a == "--file" && i + 1 < argc) { path = argv[++i]; continue; }
            if (a == "--device" && i + 1 < argc) { builder.set_property("input_device", argv[++i]); continue; }
            if (a == "--limit-seconds" && i + 1 < argc) { limit_sec = std::atoi(argv[++i]); continue; }
            if (a == "--set" && i + 1 < argc) {
                std::string kv = argv[++i];
                size_t eq = kv.find('=');
                if (eq == std::string::npos) {
                    std::cerr << "--set expects KEY=VALUE, got '" << kv << "'" << std::endl;
                    return 2;
                }
                builder.set_property(kv.substr(0, eq), kv.substr(eq + 1));
                continue;
            }
            std::cerr << "Unknown argument: " << a << std::endl;
            print_usage();
            return 2;
        }
        builder.use_profile(pipeline::parse_profile(profile_name));
    } catch (const core::ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    }

    core::set_log_level(verbose ? core::LogLevel::Debug : core::LogLevel::Warn);
    const core::SpeechConfig& config = builder.configuration();

    // Whisper
    asr::WhisperRecognitionBackend::Options wopts;
    wopts.model_path = config.whisper_model_path.empty() ? std::string("small.en") : config.whisper_model_path;
    wopts.language = config.whisper_language;
    wopts.threads = config.whisper_threads;
    wopts.sample_rate = config.sample_rate;
    wopts.partial_interval = std::chrono::milliseconds(config.whisper_partial_interval_ms);
    auto whisper = std::make_shared<asr::WhisperRecognitionBackend>(wopts);
    if (!whisper->load_model()) {
        std::cerr << "Whisper model not found. Place a model under models/, e.g.:\n"
                     "  models/small.en.gguf or models/small.gguf (GGUF)\n"
                     "  models/small.en.bin  (legacy GGML BIN)\n";
        return 1;
    }
    builder.set_speech_backend(whisper);

    // Wakeword: keyword model when given, otherwise whisper's partial transcripts
    try {
        if (!config.keyword_model_path.empty()) {
            wakeword::OnnxKeywordBackend::Config kcfg;
            kcfg.model_path = config.keyword_model_path;
            kcfg.labels = config.keyword_label_list();
            kcfg.threshold = config.keyword_threshold;
            kcfg.sample_rate = config.sample_rate;
            kcfg.window_ms = config.keyword_window_ms;
            kcfg.verbose = verbose;
            builder.set_wakeword_backend(std::make_shared<wakeword::OnnxKeywordBackend>(kcfg));
        } else {
            builder.set_wakeword_backend(whisper);
        }
    } catch (const core::ConfigurationError& e) {
        std::cerr << "Keyword model error: " << e.what() << std::endl;
        return 1;
    }

    // Frame source
    audio::FrameFormat format;
    format.sample_rate = config.sample_rate;
    format.frame_width_ms = config.frame_width;
    std::shared_ptr<audio::FileFrameSource> file_source;
    if (!path.empty()) {
        audio::FileFrameSource::Options fopts;
        fopts.path = path;
        fopts.realtime = realtime;
        fopts.trailing_silence_ms = config.wake_active_max_ms;
        file_source = std::make_shared<audio::FileFrameSource>(format, fopts);
        builder.set_frame_source(file_source);
        std::cout << "Input: " << path << std::endl;
    } else {
        int device = config.input_device.empty() ? -1 : std::atoi(config.input_device.c_str());
        builder.set_frame_source(std::make_shared<audio::PortAudioFrameSource>(format, config.buffer_width, device));
        std::cout << "Input: microphone" << (device >= 0 ? " #" + std::to_string(device) : std::string(" (default)")) << std::endl;
    }

    builder.add_listener(std::make_shared<ConsoleListener>(verbose));

    std::unique_ptr<pipeline::SpeechPipeline> speech;
    try {
        speech = builder.build();
    } catch (const core::ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    }

    std::signal(SIGINT, on_sigint);
    speech->start();
    if (!speech->frame_source().is_capturing()) {
        std::cerr << "Failed to start capture" << std::endl;
        speech->stop();
        return 1;
    }

    if (profile_name == "ptt") {
        std::cout << "Push to talk: press Enter to speak" << std::endl;
    } else {
        std::cout << "Say \"" << config.wake_phrases << "\"... press Ctrl+C to stop" << std::endl;
    }

    std::thread ptt_thread;
    if (profile_name == "ptt") {
        pipeline::SpeechPipeline* p = speech.get();
        ptt_thread = std::thread([p] {
            std::string line;
            while (!g_interrupted.load() && std::getline(std::cin, line)) {
                p->activate();
            }
        });
        ptt_thread.detach();
    }

    const auto started = std::chrono::steady_clock::now();
    while (!g_interrupted.load()) {
        if (limit_sec > 0 && std::chrono::steady_clock::now() - started >= std::chrono::seconds(limit_sec)) break;
        if (file_source && !file_source->is_capturing()) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    speech->stop();
    return 0;
}
