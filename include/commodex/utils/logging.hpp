#pragma once

#include <spdlog/spdlog.h>

#include <chrono>
#include <memory>
#include <string>

namespace commodex::utils {

/**
 * @class Logging
 * @brief Process-wide `commodex` logger shared by every engine stage.
 *
 * The logger is created on first use with a colour console sink. Applications
 * call init() once at startup to pick the verbosity.
 */
class Logging {
public:
	/// Returns the shared logger, creating it at info level when needed.
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Creates the logger if necessary and sets its level.
	 * @param level Minimum level written; messages at this level also flush the sink.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

	static spdlog::level::level_enum level();

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

/**
 * @brief Logs the wall-clock duration of an engine stage at debug level on destruction.
 */
class StageTimer {
public:
	explicit StageTimer(std::string stage);
	~StageTimer();

	StageTimer(const StageTimer &) = delete;
	StageTimer &operator=(const StageTimer &) = delete;

	double elapsedMilliseconds() const;

private:
	std::string stage_;
	std::chrono::steady_clock::time_point start_;
};

} // namespace commodex::utils

#define COMMODEX_TRACE(...)    commodex::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define COMMODEX_DEBUG(...)    commodex::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define COMMODEX_INFO(...)     commodex::utils::Logging::getLogger()->info(__VA_ARGS__)
#define COMMODEX_WARN(...)     commodex::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define COMMODEX_ERROR(...)    commodex::utils::Logging::getLogger()->error(__VA_ARGS__)
#define COMMODEX_CRITICAL(...) commodex::utils::Logging::getLogger()->critical(__VA_ARGS__)
