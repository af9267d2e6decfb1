#include "lib_appcommon/options.hpp"
#include "lib_teletext/station.hpp"
#include "lib_teletext/station_run.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/log.hpp"
#include "lib_utils/os.hpp"
#include "lib_utils/time.hpp"
#include "lib_utils/tools.hpp" // make_unique
#include "config.hpp"
#include <algorithm>
#include <cstdio> // sscanf
#include <fstream>
#include <iostream>
#include <memory>
#include <thread>

const char *g_appName = "ttxarchive";
const char *g_version = TTX_VERSION;

using namespace Teletext;

namespace {
Config parseCommandLine(int argc, char const* argv[]) {
	Config cfg;

	CmdLineOptions opt;
	opt.add("c", "config", &cfg.configPath, "JSON configuration file (default: built-in station profiles).");
	opt.add("i", "input", &cfg.input, "Directory of the fetched pages: <input>/<station>/<page>_<sub>.<ext> (default: '.').");
	opt.add("o", "output", &cfg.output, "Directory of the <station>.ndjson archives (default: '.').");
	opt.add("t", "timestamp", &cfg.timestamp, "Capture time, UTC, as YYYY-MM-DDTHH:MM:SS (default: now).");
	opt.add("s", "station", &cfg.stations, "Only run these stations.");
	opt.add("j", "jobs", &cfg.jobs, "Number of stations decoded concurrently (default: one per core).");
	opt.add("g", "loglevel", &cfg.logLevel, "Log level: quiet, error, warning, info, debug.");
	opt.addFlag("h", "help", &cfg.help, "Print usage and exit.");

	auto args = opt.parse(argc, argv);

	if(cfg.help) {
		std::cout << "Usage: " << g_appName << " [options]" << std::endl << "Options:" << std::endl;
		opt.printHelp(std::cout);
		std::cout << std::endl << "Built-in stations:";
		for(auto& name : builtinStationNames())
			std::cout << " " << name;
		std::cout << std::endl;
		return cfg;
	}

	if(!args.empty())
		throw std::runtime_error("Unexpected argument: \"" + args[0] + "\"");

	if(cfg.jobs < 0)
		throw std::runtime_error("--jobs must be positive");

	return cfg;
}

std::vector<StationConfig> loadStations(const Config &cfg) {
	std::vector<StationConfig> stations;
	if(!cfg.configPath.empty()) {
		stations = parseConfig(loadFile(cfg.configPath));
	} else {
		for(auto& name : listDir(cfg.input))
			if(isBuiltinStation(name))
				stations.push_back(builtinStation(name));
	}

	if(!cfg.stations.empty()) {
		std::vector<StationConfig> selected;
		for(auto& name : cfg.stations) {
			auto i = std::find_if(stations.begin(), stations.end(), [&](StationConfig const& s) {
				return s.id == name;
			});
			if(i == stations.end())
				throw std::runtime_error("Station '" + name + "' is not configured");
			selected.push_back(*i);
		}
		stations = selected;
	}

	if(stations.empty())
		throw std::runtime_error("No station to run");

	return stations;
}

bool hasPayloadExtension(const StationConfig &station, const std::string &ext) {
	if(station.format == Format::Json)
		return ext == "json";
	return ext == "html" || ext == "htm";
}

// "<page>_<sub>.<ext>" or "<page>.<ext>"
bool parsePageFileName(const std::string &name, int &page, int &subPage, std::string &ext) {
	char extension[16] {};
	int consumed = 0;
	subPage = 0;
	if(sscanf(name.c_str(), "%3d_%d.%15[a-z]%n", &page, &subPage, extension, &consumed) == 3 && consumed == (int)name.size()) {
		ext = extension;
		return true;
	}
	consumed = 0;
	subPage = 0;
	if(sscanf(name.c_str(), "%3d.%15[a-z]%n", &page, extension, &consumed) == 2 && consumed == (int)name.size()) {
		ext = extension;
		return true;
	}
	return false;
}

std::vector<RawPage> loadPages(const StationConfig &station, const std::string &dir, int64_t timestamp) {
	auto const names = listDir(dir);
	auto exists = [&](std::string const& name) {
		return std::find(names.begin(), names.end(), name) != names.end();
	};

	std::string stationFontMap;
	if(station.format == Format::HtmlFontMap && exists("fontmap.json"))
		stationFontMap = loadFile(dir + "/fontmap.json");

	std::vector<RawPage> pages;
	for(auto& name : names) {
		RawPage raw;
		std::string ext;
		if(!parsePageFileName(name, raw.page, raw.subPage, ext) || !hasPayloadExtension(station, ext)) {
			g_Log->log(Debug, format("[%s] ignoring '%s'", station.id, name).c_str());
			continue;
		}

		raw.timestamp = timestamp;
		raw.body = loadFile(dir + "/" + name);

		if(station.format == Format::HtmlFontMap) {
			// a missing map is reported when the page is decoded
			auto const pageFontMap = name.substr(0, name.rfind('.')) + ".fontmap";
			raw.fontMap = exists(pageFontMap) ? loadFile(dir + "/" + pageFontMap) : stationFontMap;
		}

		pages.push_back(std::move(raw));
	}

	std::stable_sort(pages.begin(), pages.end(), [](RawPage const& a, RawPage const& b) {
		return a.page != b.page ? a.page < b.page : a.subPage < b.subPage;
	});

	g_Log->log(Info, format("[%s] %s pages in '%s'", station.id, pages.size(), dir).c_str());
	return pages;
}
}

void safeMain(int argc, const char* argv[]) {
	auto const cfg = parseCommandLine(argc, argv);
	if(cfg.help)
		return;

	auto stations = loadStations(cfg);

	// a command-line level wins over the configuration file
	if(!cfg.logLevel.empty())
		setGlobalLogLevel(parseLogLevel(cfg.logLevel.c_str()));

	auto const timestamp = cfg.timestamp.empty() ? getUtcSeconds() : parseDate(cfg.timestamp);

	if(!dirExists(cfg.output))
		mkdir(cfg.output);

	std::vector<StationJob> jobs;
	std::vector<std::unique_ptr<std::ofstream>> files;
	std::vector<std::string> tmpPaths;
	for(auto& station : stations) {
		auto const dir = cfg.input + "/" + station.id;
		if(!dirExists(dir)) {
			g_Log->log(Warning, format("[%s] no input directory '%s', skipping", station.id, dir).c_str());
			continue;
		}

		auto const tmpPath = cfg.output + "/" + station.id + ".ndjson.tmp";
		files.push_back(make_unique<std::ofstream>(tmpPath, std::ios::binary | std::ios::trunc));
		if(!files.back()->is_open())
			throw std::runtime_error("Can't open '" + tmpPath + "' for writing");
		tmpPaths.push_back(tmpPath);

		jobs.push_back({ station, loadPages(station, dir, timestamp), files.back().get() });
	}

	std::vector<RunReport> reports;
	try {
		reports = runStations(jobs, timestamp, cfg.jobs ? cfg.jobs : std::thread::hardware_concurrency());
	} catch(std::exception const&) {
		files.clear();
		for(auto& path : tmpPaths)
			std::remove(path.c_str());
		throw;
	}

	for(size_t i = 0; i < jobs.size(); ++i) {
		files[i]->close();
		if(!*files[i])
			throw std::runtime_error("Can't write '" + tmpPaths[i] + "'");
		moveFile(tmpPaths[i], cfg.output + "/" + jobs[i].cfg.id + ".ndjson");
	}

	for(auto& report : reports) {
		std::cout << report.station << ": " << report.decoded << " pages, " << report.failures.size() << " failed" << std::endl;
		for(auto& failure : report.failures)
			std::cout << "  " << failure.page << "/" << failure.subPage << " " << failure.kind << ": " << failure.reason << std::endl;
	}
}
