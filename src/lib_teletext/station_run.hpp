#pragma once

#include "decoder.hpp"
#include "station.hpp"
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace Teletext {

struct PageFailure {
	int page;
	int subPage;
	std::string kind; // Error::kind()
	std::string reason;
};

struct RunReport {
	std::string station;
	int decoded = 0;
	std::vector<PageFailure> failures;
};

// Decode, assemble and serialize the pages of one station, in the order given.
// A page failing with a Teletext::Error is logged, reported and skipped.
// Any other exception aborts the run.
class StationRun {
	public:
		// Writes the session header.
		StationRun(const StationConfig &cfg, int64_t timestamp, std::ostream &out);

		void process(const RawPage &raw);

		const RunReport& report() const {
			return runReport;
		}

	private:
		void write(const std::string &lines);

		const StationConfig &cfg;
		const int64_t timestamp;
		std::ostream &out;
		RunReport runReport;
};

RunReport runStation(const StationConfig &cfg, int64_t timestamp, const std::vector<RawPage> &pages, std::ostream &out);

struct StationJob {
	StationConfig cfg;
	std::vector<RawPage> pages;
	std::ostream *out;
};

// One task per station on a pool of 'threadCount' workers.
// Reports are in job order. The first aborted run is rethrown once all tasks are done.
std::vector<RunReport> runStations(const std::vector<StationJob> &jobs, int64_t timestamp, int threadCount);

}
