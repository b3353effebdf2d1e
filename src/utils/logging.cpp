#include "commodex/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <utility>

namespace commodex::utils {

namespace {

std::mutex &registryMutex() {
	static std::mutex mutex;
	return mutex;
}

constexpr const char *kLoggerName = "commodex";
constexpr const char *kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [thread %t] %v";

} // namespace

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	std::lock_guard<std::mutex> lock(registryMutex());
	if (!logger_) {
		logger_ = spdlog::get(kLoggerName);
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt(kLoggerName);
			logger_->set_pattern(kPattern);
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		init();
	}
	return logger_;
}

spdlog::level::level_enum Logging::level() {
	return getLogger()->level();
}

StageTimer::StageTimer(std::string stage) : stage_(std::move(stage)), start_(std::chrono::steady_clock::now()) {
	COMMODEX_DEBUG("{} started", stage_);
}

StageTimer::~StageTimer() {
	COMMODEX_DEBUG("{} finished in {:.1f} ms", stage_, elapsedMilliseconds());
}

double StageTimer::elapsedMilliseconds() const {
	return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_).count();
}

} // namespace commodex::utils
