#pragma once

#include <string>
#include <vector>

struct Config {
	std::string configPath; // built-in profiles of the input station dirs when empty
	std::string input = ".";
	std::string output = ".";
	std::string timestamp; // capture time of the run, now when empty
	std::vector<std::string> stations; // all configured stations when empty
	int jobs = 0; // one per core when 0
	std::string logLevel;
	bool help = false;
};
