#include "log.hpp"
#include "os.hpp"
#include <cstdio>
#include <ctime>
#include <iostream>
#include <stdexcept>

#define RED    "\x1b[31m"
#define YELLOW "\x1b[33m"
#define GREEN  "\x1b[32m"
#define CYAN   "\x1b[36m"
#define RESET  "\x1b[0m"

static std::ostream& get(Level level) {
	switch (level) {
	case Info:
		return std::cout;
	default:
		return std::cerr;
	}
}

static std::string getTime() {
	char szOut[255];
	const std::time_t t = std::time(nullptr);
	std::tm tm {};
	gmtime_r(&t, &tm);
	auto const size = strftime(szOut, sizeof szOut, "[%Y/%m/%d %H:%M:%S]", &tm);
	return std::string(szOut, size);
}

struct ConsoleLogger : LogSink {
	const char* getColorBegin(Level level) const {
		if (!m_color) return "";
		switch (level) {
		case Error: return RED;
		case Warning: return YELLOW;
		case Info: return GREEN;
		case Debug: return CYAN;
		default: return "";
		}
	}

	const char* getColorEnd() const {
		return m_color ? RESET : "";
	}

	void send(Level level, const char* msg) override {
		get(level) << getColorBegin(level) << getTime() << " " << msg << getColorEnd() << std::endl;
	}
	bool m_color = true;
};

static ConsoleLogger consoleLogger;

struct CsvLogger : LogSink {
	CsvLogger(const char* path) : m_fp(fopen(path, "w")) {
		if(!m_fp)
			throw std::runtime_error("Can't open '" + std::string(path) + "' for writing");
	}
	~CsvLogger() {
		fclose(m_fp);
	}
	void send(Level level, const char* msg) override {
		fprintf(m_fp, "%d, \"%s\", \"%s\"\n", level, getTime().c_str(), msg);
		fflush(m_fp);
	}
	FILE* const m_fp;
};

void setGlobalLogConsole(bool colorEnable)  {
	consoleLogger.m_color = colorEnable;
	g_Log = &consoleLogger;
}

void setGlobalLogCSV(const char* path) {
	static CsvLogger csvLogger(path);
	g_Log = &csvLogger;
}

static
LogSink* getDefaultLogger() {
	auto const path = getEnvironmentVariable("TTX_LOGPATH");
	if(!path.empty()) {
		setGlobalLogCSV(path.c_str());
		return g_Log;
	}
	return &consoleLogger;
}

LogSink* g_Log = getDefaultLogger();

Level getGlobalLogLevel() {
	return g_Log->m_logLevel;
}

void setGlobalLogLevel(Level level) {
	g_Log->setLevel(level);
}

Level parseLogLevel(const char* slevel) {
	auto level = std::string(slevel);
	if (level == "quiet") {
		return Quiet;
	} else if (level == "error") {
		return Error;
	} else if (level == "warning") {
		return Warning;
	} else if (level == "info") {
		return Info;
	} else if (level == "debug") {
		return Debug;
	} else
		throw std::runtime_error("Unknown log level: " + level);
}
