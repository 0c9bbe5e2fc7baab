#include "asr/whisper_backend.hpp"
#include "core/logging.hpp"
#include <string>
#include <filesystem>
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>
#include <cstdlib>
#include <cstdio>
#include <iostream>
#include "whisper.h"

namespace {
bool is_verbose() {
	return std::getenv("WHISPER_DEBUG") != nullptr;
}

// Filter whisper/ggml logs: keep errors/warnings always; info/debug only if verbose
void log_cb(ggml_log_level level, const char * text, void *) {
	switch (level) {
	case GGML_LOG_LEVEL_ERROR:
	case GGML_LOG_LEVEL_WARN:
		std::fputs(text, stderr);
		break;
	case GGML_LOG_LEVEL_INFO:
	case GGML_LOG_LEVEL_DEBUG:
	default:
		if (is_verbose()) std::fputs(text, stderr);
		break;
	}
}

std::string resolve_model_path(const std::string& model_name) {
	std::string path = model_name;
	auto exists = [](const std::string& p){ return std::filesystem::exists(std::filesystem::u8path(p)); };
	const bool has_ext = (path.find(".gguf") != std::string::npos) || (path.find(".bin") != std::string::npos);
	if (has_ext) return path;

	const std::string candidates[] = {
		std::string("models/") + model_name + ".gguf",
		std::string("models/ggml-") + model_name + "-q5_1.gguf",
		std::string("models/ggml-") + model_name + ".gguf",
		std::string("models/") + model_name + ".bin",
		std::string("models/ggml-") + model_name + ".bin",
		std::string("models/ggml-") + model_name + "-q5_1.bin",
	};
	for (const auto& c : candidates) {
		if (exists(c)) return c;
	}
	return candidates[0]; // fallback, may fail
}

// Strip whitespace and drop bracketed non-speech markers ("[BLANK_AUDIO]", "[ Silence ]")
void append_segment_text(std::string& out, const char* txt) {
	if (!txt) return;
	std::string s(txt);
	size_t a = s.find_first_not_of(" \t\r\n");
	size_t b = s.find_last_not_of(" \t\r\n");
	if (a == std::string::npos) return;
	s = s.substr(a, b - a + 1);
	if (s.size() > 2 && s.front() == '[' && s.back() == ']') return;
	if (!out.empty()) out += ' ';
	out += s;
}
} // anonymous namespace

namespace asr {

struct WhisperRecognitionBackend::Impl {
	Options options;
	whisper_context* ctx = nullptr;
	whisper_state* state = nullptr;
	std::mutex decode_mutex; // one whisper_full at a time on the shared state

	~Impl() {
		if (state) whisper_free_state(state);
		if (ctx) whisper_free(ctx);
	}

	// Decode pcm; returns whisper_full's status. `abort` is polled by whisper.
	int decode(const std::vector<float>& pcm, const std::atomic<bool>& abort, std::string& text, float& confidence) {
		std::lock_guard<std::mutex> lock(decode_mutex);
		whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
		wparams.print_realtime   = false;
		wparams.print_progress   = false;
		wparams.print_timestamps = false;
		wparams.print_special    = false;
		wparams.translate        = false;
		wparams.language         = options.language.c_str();
		wparams.detect_language  = false;
		wparams.n_threads        = (options.threads <= 0) ? static_cast<int>(std::max(1u, std::thread::hardware_concurrency())) : options.threads;
		wparams.no_context       = true;
		wparams.single_segment   = false;
		wparams.greedy.best_of   = 1;
		wparams.abort_callback   = [](void* user) { return static_cast<const std::atomic<bool>*>(user)->load(); };
		wparams.abort_callback_user_data = const_cast<std::atomic<bool>*>(&abort);

		if (is_verbose()) {
			std::cerr << "[whisper] running on samples=" << pcm.size() << ", threads=" << wparams.n_threads << "\n";
		}
		int ret = whisper_full_with_state(ctx, state, wparams, pcm.data(), static_cast<int>(pcm.size()));
		if (ret != 0) {
			return ret;
		}

		text.clear();
		double p_sum = 0.0;
		int p_count = 0;
		const int n = whisper_full_n_segments_from_state(state);
		for (int i = 0; i < n; ++i) {
			append_segment_text(text, whisper_full_get_segment_text_from_state(state, i));
			const int n_tokens = whisper_full_n_tokens_from_state(state, i);
			for (int t = 0; t < n_tokens; ++t) {
				p_sum += whisper_full_get_token_p_from_state(state, i, t);
				++p_count;
			}
		}
		confidence = (p_count > 0) ? static_cast<float>(p_sum / p_count) : 0.0f;
		confidence = std::min(confidence, 0.999f);
		if (is_verbose()) whisper_print_timings(ctx);
		return 0;
	}
};

namespace {

// One open request: audio buffer plus a decode worker
class WhisperRequest : public IRecognitionRequest {
public:
	WhisperRequest(WhisperRecognitionBackend::Impl& impl, RecognitionCallbacks callbacks)
		: impl_(impl)
		, callbacks_(std::move(callbacks))
		, max_samples_(static_cast<size_t>(impl.options.sample_rate) * 30) {
		worker_ = std::thread(&WhisperRequest::worker_loop, this);
	}

	~WhisperRequest() override {
		cancel();
		if (worker_.joinable()) worker_.join();
	}

	void append(const audio::Frame& frame) override {
		constexpr float scale = 1.0f / 32768.0f;
		std::lock_guard<std::mutex> lock(mutex_);
		if (finished_ || cancelled_) return;
		for (int16_t s : frame) pcm_.push_back(static_cast<float>(s) * scale);
		if (pcm_.size() > max_samples_) {
			// Keep the most recent 30 s window
			pcm_.erase(pcm_.begin(), pcm_.begin() + static_cast<std::ptrdiff_t>(pcm_.size() - max_samples_));
		}
		dirty_ = true;
	}

	void finish() override {
		{
			std::lock_guard<std::mutex> lock(mutex_);
			finished_ = true;
		}
		cv_.notify_all();
	}

	void cancel() override {
		{
			std::lock_guard<std::mutex> lock(mutex_);
			cancelled_ = true;
			abort_.store(true);
		}
		cv_.notify_all();
	}

private:
	void worker_loop() {
		const auto interval = impl_.options.partial_interval;
		std::unique_lock<std::mutex> lock(mutex_);
		for (;;) {
			cv_.wait_for(lock, interval, [this] { return finished_ || cancelled_; });
			if (cancelled_) return;

			const bool final_pass = finished_;
			if (!final_pass && !dirty_) continue;
			std::vector<float> pcm = pcm_;
			dirty_ = false;
			lock.unlock();

			std::string text;
			float confidence = 0.0f;
			int ret = 0;
			if (!pcm.empty()) {
				ret = impl_.decode(pcm, abort_, text, confidence);
			}

			if (abort_.load()) return;
			if (ret != 0) {
				std::cerr << "[whisper] whisper_full FAILED, ret=" << ret << "\n";
				if (callbacks_.on_failure) {
					callbacks_.on_failure(BackendFailure{WhisperRecognitionBackend::kDecodeFailed, "whisper",
					                                     "whisper_full failed with " + std::to_string(ret)});
				}
				return;
			}
			if (callbacks_.on_result) {
				callbacks_.on_result(RecognitionResult{text, confidence, final_pass});
			}
			if (final_pass) return;
			lock.lock();
		}
	}

	WhisperRecognitionBackend::Impl& impl_;
	RecognitionCallbacks callbacks_;
	const size_t max_samples_;

	std::mutex mutex_;
	std::condition_variable cv_;
	std::vector<float> pcm_;
	bool dirty_ = false;
	bool finished_ = false;
	bool cancelled_ = false;
	std::atomic<bool> abort_{false};
	std::thread worker_;
};

} // namespace

WhisperRecognitionBackend::WhisperRecognitionBackend(Options options)
	: impl_(std::make_unique<Impl>()) {
	impl_->options = std::move(options);
}

WhisperRecognitionBackend::~WhisperRecognitionBackend() = default;

bool WhisperRecognitionBackend::load_model() {
	if (impl_->ctx) return true;
	const std::string path = resolve_model_path(impl_->options.model_path);
	// Set logging verbosity before creating context to suppress init spam when not verbose
	whisper_log_set(log_cb, nullptr);

	whisper_context_params cparams = whisper_context_default_params();
	cparams.use_gpu = false; // CPU path
	std::cerr << "[whisper] init from: " << path << "\n";
	impl_->ctx = whisper_init_from_file_with_params(path.c_str(), cparams);
	if (!impl_->ctx) {
		std::cerr << "[whisper] init FAILED for path: " << path << "\n";
		return false;
	}
	std::cerr << "[whisper] init OK: " << path << "\n";
	if (is_verbose()) {
		std::cerr << "[whisper] system: " << whisper_print_system_info() << "\n";
	}
	// persistent state for repeated decodes
	impl_->state = whisper_init_state(impl_->ctx);
	if (!impl_->state) {
		std::cerr << "[whisper] state allocation FAILED\n";
		whisper_free(impl_->ctx);
		impl_->ctx = nullptr;
		return false;
	}
	return true;
}

bool WhisperRecognitionBackend::is_loaded() const {
	return impl_->ctx != nullptr && impl_->state != nullptr;
}

std::unique_ptr<IRecognitionRequest> WhisperRecognitionBackend::open_request(RecognitionCallbacks callbacks) {
	if (!is_loaded()) {
		core::log_error("whisper", "request refused, model not loaded");
		return nullptr;
	}
	return std::make_unique<WhisperRequest>(*impl_, std::move(callbacks));
}

bool WhisperRecognitionBackend::is_retryable(const BackendFailure& failure) const {
	return failure.domain == "whisper" && failure.code == kDecodeFailed;
}

} // namespace asr
