#include "profile_logger.hpp"
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace duckdb {

const char *LogLevelToString(ProfileLogLevel level) {
	switch (level) {
	case ProfileLogLevel::DEBUG:
		return "DEBUG";
	case ProfileLogLevel::INFO:
		return "INFO";
	case ProfileLogLevel::WARN:
		return "WARN";
	case ProfileLogLevel::ERR:
		return "ERROR";
	default:
		return "NONE";
	}
}

ProfileLogLevel ParseLogLevel(const std::string &text) {
	std::string upper;
	for (char c : text) {
		upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
	}
	if (upper == "DEBUG") {
		return ProfileLogLevel::DEBUG;
	}
	if (upper == "INFO") {
		return ProfileLogLevel::INFO;
	}
	if (upper == "WARN" || upper == "WARNING") {
		return ProfileLogLevel::WARN;
	}
	if (upper == "ERROR" || upper == "ERR") {
		return ProfileLogLevel::ERR;
	}
	return ProfileLogLevel::NONE;
}

static std::string ClockTime() {
	auto now = std::chrono::system_clock::now();
	auto seconds = std::chrono::system_clock::to_time_t(now);
	auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
	std::tm local {};
	localtime_r(&seconds, &local);

	std::ostringstream out;
	out << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis;
	return out.str();
}

ProfileLogSink StderrLogSink() {
	return [](const ProfileLogEntry &entry) {
		std::ostringstream line;
		line << "[FireProfile] " << ClockTime() << ' ' << LogLevelToString(entry.level);
		if (entry.file) {
			line << ' ' << entry.file << ':' << entry.line;
		}
		line << " - " << entry.message << '\n';
		std::cerr << line.str();
	};
}

ProfileLogger &ProfileLogger::Instance() {
	static ProfileLogger instance;
	return instance;
}

void ProfileLogger::ConfigureFromEnvironment(const char *variable) {
	const char *value = std::getenv(variable);
	if (value) {
		SetLogLevel(ParseLogLevel(value));
	}
}

void ProfileLogger::SetLogLevel(ProfileLogLevel level) {
	std::lock_guard<std::mutex> lock(sink_mutex_);
	if (level != ProfileLogLevel::NONE && !sink_) {
		sink_ = StderrLogSink();
	}
	level_.store(level);
}

void ProfileLogger::SetSink(ProfileLogSink sink) {
	std::lock_guard<std::mutex> lock(sink_mutex_);
	sink_ = std::move(sink);
}

void ProfileLogger::ResetToDefault() {
	std::lock_guard<std::mutex> lock(sink_mutex_);
	level_.store(ProfileLogLevel::NONE);
	sink_ = nullptr;
}

void ProfileLogger::Write(ProfileLogLevel level, const std::string &message, const char *file, int line) {
	if (!ShouldLog(level)) {
		return;
	}
	if (file) {
		const char *slash = std::strrchr(file, '/');
		file = slash ? slash + 1 : file;
	}

	ProfileLogSink sink;
	{
		std::lock_guard<std::mutex> lock(sink_mutex_);
		sink = sink_;
	}
	// Sinks run unlocked so one may log or swap the sink
	if (sink) {
		sink(ProfileLogEntry {level, message, file, line});
	}
}

} // namespace duckdb
