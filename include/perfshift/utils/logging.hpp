#pragma once

#ifndef PERFSHIFT_NO_LOGGING
#include <spdlog/spdlog.h>
#include <memory>

namespace perfshift::utils {

/**
 * @class Logging
 * @brief Process-wide spdlog logger named "perfshift".
 *
 * The detectors and the batch runner all write through the same instance.
 * It is created on first use; call init() at startup to change the level.
 */
class Logging {
public:
	/// The shared logger, created with the default level if init() was never called.
	static std::shared_ptr<spdlog::logger> &getLogger();

	/// Creates the logger if needed and sets its level; messages below `level` are discarded.
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace perfshift::utils

// Format-string logging through the shared logger.
#define PERFSHIFT_TRACE(...)    perfshift::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define PERFSHIFT_DEBUG(...)    perfshift::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define PERFSHIFT_INFO(...)     perfshift::utils::Logging::getLogger()->info(__VA_ARGS__)
#define PERFSHIFT_WARN(...)     perfshift::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define PERFSHIFT_ERROR(...)    perfshift::utils::Logging::getLogger()->error(__VA_ARGS__)
#define PERFSHIFT_CRITICAL(...) perfshift::utils::Logging::getLogger()->critical(__VA_ARGS__)

#else
// PERFSHIFT_NO_LOGGING builds drop spdlog; the macros compile to empty statements.

namespace perfshift::utils {

class Logging {
public:
	static void init() {}
};

} // namespace perfshift::utils

#define PERFSHIFT_TRACE(...)    do {} while(0)
#define PERFSHIFT_DEBUG(...)    do {} while(0)
#define PERFSHIFT_INFO(...)     do {} while(0)
#define PERFSHIFT_WARN(...)     do {} while(0)
#define PERFSHIFT_ERROR(...)    do {} while(0)
#define PERFSHIFT_CRITICAL(...) do {} while(0)

#endif // PERFSHIFT_NO_LOGGING
