#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string>

namespace duckdb {

enum class ProfileLogLevel {
	DEBUG = 0, // Per-page and per-pass diagnostics
	INFO = 1,  // Run start/finish
	WARN = 2,  // Recoverable oddities in the data or options
	ERR = 3,   // Run aborted
	NONE = 4
};

const char *LogLevelToString(ProfileLogLevel level);

// Case insensitive; also accepts WARNING and ERR. Anything else is NONE
ProfileLogLevel ParseLogLevel(const std::string &text);

struct ProfileLogEntry {
	ProfileLogLevel level;
	std::string message;
	// Basename of the emitting source file, nullptr when unknown
	const char *file;
	int line;
};

// Receives every entry at or above the logger's level. An empty sink drops them
using ProfileLogSink = std::function<void(const ProfileLogEntry &)>;

// Writes "[FireProfile] 12:00:01.250 WARN profile_runner.cpp:42 - message" to stderr
ProfileLogSink StderrLogSink();

// Process-wide logger behind the FP_LOG_* macros. Silent until a level is set
class ProfileLogger {
public:
	static ProfileLogger &Instance();

	// Level from the named environment variable; an unset variable changes nothing
	void ConfigureFromEnvironment(const char *variable);

	// Enabling a level while no sink is installed installs StderrLogSink
	void SetLogLevel(ProfileLogLevel level);
	ProfileLogLevel GetLogLevel() const {
		return level_.load();
	}
	void SetSink(ProfileLogSink sink);
	// Level NONE, no sink
	void ResetToDefault();

	bool ShouldLog(ProfileLogLevel level) const {
		return level != ProfileLogLevel::NONE && level >= level_.load();
	}

	void Write(ProfileLogLevel level, const std::string &message, const char *file, int line);

	ProfileLogger(const ProfileLogger &) = delete;
	ProfileLogger &operator=(const ProfileLogger &) = delete;

private:
	ProfileLogger() = default;

	std::atomic<ProfileLogLevel> level_ {ProfileLogLevel::NONE};
	ProfileLogSink sink_;
	std::mutex sink_mutex_;
};

#define FP_LOG_AT(level, msg)                                                                                          \
	do {                                                                                                               \
		auto &fp_logger = ::duckdb::ProfileLogger::Instance();                                                         \
		if (fp_logger.ShouldLog(level)) {                                                                              \
			fp_logger.Write(level, msg, __FILE__, __LINE__);                                                           \
		}                                                                                                              \
	} while (0)

#define FP_LOG_DEBUG(msg) FP_LOG_AT(::duckdb::ProfileLogLevel::DEBUG, msg)
#define FP_LOG_INFO(msg)  FP_LOG_AT(::duckdb::ProfileLogLevel::INFO, msg)
#define FP_LOG_WARN(msg)  FP_LOG_AT(::duckdb::ProfileLogLevel::WARN, msg)
#define FP_LOG_ERROR(msg) FP_LOG_AT(::duckdb::ProfileLogLevel::ERR, msg)

} // namespace duckdb
