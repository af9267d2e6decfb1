#include "log.hpp"
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>
#include <string>
#include <syslog.h>

namespace {

const char* levelName(Level level) {
	switch (level) {
	case Error: return "error";
	case Warning: return "warning";
	case Info: return "info";
	default: return "debug";
	}
}

struct SyslogLogger : LogSink {
	SyslogLogger(const char *ident, const char *channelName): identLog(ident), channelName(channelName) {
		openlog(identLog.c_str(), LOG_PID, LOG_USER|LOG_SYSLOG);
	}
	~SyslogLogger() {
		closelog();
	}
	void send(Level level, const char* msg) override {
		static const int levelToSysLog[] = {LOG_ERR, LOG_WARNING, LOG_INFO, LOG_DEBUG};

		rapidjson::StringBuffer s;
		rapidjson::Writer<rapidjson::StringBuffer> writer(s);
		writer.StartObject();
		writer.Key("message");
		writer.String(msg);
		writer.Key("level");
		writer.String(levelName(level));
		writer.Key("channel");
		writer.String(channelName.c_str());
		writer.EndObject();

		::syslog(levelToSysLog[level], "%s", s.GetString());
	}
	const std::string identLog; // openlog() keeps the pointer
	const std::string channelName;
};

}

void setGlobalLogSyslog(const char *ident, const char *channelName) {
	static SyslogLogger syslogLogger(ident, channelName);
	g_Log = &syslogLogger;
}
