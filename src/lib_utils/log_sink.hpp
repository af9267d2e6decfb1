#pragma once

#include <mutex>

enum Level {
	Quiet = -1,
	Error = 0,
	Warning,
	Info,
	Debug
};

struct LogSink {
		virtual ~LogSink() = default;

		// stations are decoded on several threads: one line at a time
		void log(Level level, const char* msg) {
			if ((level != Quiet) && (level <= m_logLevel)) {
				std::lock_guard<std::mutex> lock(m_mutex);
				send(level, msg);
			}
		}

		void setLevel(Level level) {
			m_logLevel = level;
		}

		Level m_logLevel = Warning;

	private:
		virtual void send(Level level, const char* msg) = 0;
		std::mutex m_mutex;
};
