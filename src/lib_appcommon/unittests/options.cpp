#include "tests/tests.hpp"
#include "lib_appcommon/options.hpp"
#include <cstdio> // sscanf

#define NELEMENTS(a) \
  sizeof(a)/sizeof(*(a))

unittest("CmdLineOptions: no flags") {
	int jobs = 0;
	CmdLineOptions opt;
	opt.add("j", "jobs", &jobs);

	const char* argv[] = {
		"ttxarchive", "pages/"
	};
	auto res = opt.parse(NELEMENTS(argv), argv);
	ASSERT_EQUALS(std::vector<std::string>({"pages/"}), res);
	ASSERT_EQUALS(0, jobs);
}

unittest("CmdLineOptions: short names") {
	std::string input;
	int jobs = -1;
	CmdLineOptions opt;
	opt.add("i", "input", &input);
	opt.add("j", "jobs", &jobs);

	const char* argv[] = {
		"ttxarchive", "-i", "/var/spool/teletext", "-j", "4"
	};
	opt.parse(NELEMENTS(argv), argv);
	ASSERT_EQUALS("/var/spool/teletext", input);
	ASSERT_EQUALS(4, jobs);
}

unittest("CmdLineOptions: long names") {
	std::string timestamp;
	int jobs = -1;
	CmdLineOptions opt;
	opt.add("t", "timestamp", &timestamp);
	opt.add("j", "jobs", &jobs);

	const char* argv[] = {
		"ttxarchive", "--timestamp", "2022-01-28T14:13:12", "--jobs", "8"
	};
	opt.parse(NELEMENTS(argv), argv);
	ASSERT_EQUALS("2022-01-28T14:13:12", timestamp);
	ASSERT_EQUALS(8, jobs);
}

unittest("CmdLineOptions: word lists") {
	std::vector<std::string> stations;
	bool help = false;
	CmdLineOptions opt;
	opt.add("s", "station", &stations);
	opt.addFlag("h", "help", &help);

	const char* argv[] = {
		"ttxarchive", "-s", "zdf", "ndr", "3sat", "-h"
	};
	auto res = opt.parse(NELEMENTS(argv), argv);
	ASSERT_EQUALS(std::vector<std::string>({"zdf", "ndr", "3sat"}), stations);
	ASSERT_EQUALS(true, help);
	ASSERT(res.empty());
}

unittest("CmdLineOptions: repeated option") {
	std::vector<int> pages;
	CmdLineOptions opt;
	opt.add("p", "page", &pages);

	const char* argv[] = {
		"ttxarchive", "--page", "100", "--page", "101", "-p", "899"
	};
	opt.parse(NELEMENTS(argv), argv);
	ASSERT_EQUALS(std::vector<int>({100, 101, 899}), pages);
}

unittest("CmdLineOptions: not an integer") {
	int jobs = 0;
	CmdLineOptions opt;
	opt.add("j", "jobs", &jobs);

	const char* argv[] = {
		"ttxarchive", "-j", "4x"
	};
	ASSERT_THROWN(opt.parse(NELEMENTS(argv), argv));
}

unittest("CmdLineOptions: unknown option") {
	bool help = false;
	CmdLineOptions opt;
	opt.addFlag("h", "help", &help);

	const char* argv[] = {
		"ttxarchive", "--dry-run"
	};
	ASSERT_THROWN(opt.parse(NELEMENTS(argv), argv));
}

unittest("CmdLineOptions: unexpected end of command line") {
	std::string configPath;
	CmdLineOptions opt;
	opt.add("c", "config", &configPath);

	const char* argv[] = {
		"ttxarchive", "-c"
	};
	ASSERT_THROWN(opt.parse(NELEMENTS(argv), argv));
}

struct PageAddress {
	int page, subPage;
};

static inline void parseValue(PageAddress& var, ArgQueue& args) {
	auto s = safePop(args);
	var.subPage = 1;
	if(sscanf(s.c_str(), "%d/%d", &var.page, &var.subPage) < 1)
		throw std::runtime_error("expected <page>[/<sub-page>], got \"" + s + "\"");
}

unittest("CmdLineOptions: custom parsing") {
	PageAddress start {};
	CmdLineOptions opt;
	opt.add("f", "from", &start);

	const char* argv[] = {
		"ttxarchive", "-f", "101/2"
	};
	opt.parse(NELEMENTS(argv), argv);
	ASSERT_EQUALS(101, start.page);
	ASSERT_EQUALS(2, start.subPage);
}

unittest("CmdLineOptions: help") {
	std::string configPath;
	CmdLineOptions opt;
	opt.add("c", "config", &configPath, "JSON configuration file.");

	std::stringstream ss;
	opt.printHelp(ss);
	ASSERT_EQUALS("    -c, --config                  JSON configuration file.\n", ss.str());
}
