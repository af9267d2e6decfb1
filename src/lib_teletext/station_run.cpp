#include "station_run.hpp"
#include "assembler.hpp"
#include "charset.hpp"
#include "error.hpp"
#include "serializer.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/log.hpp"
#include "lib_utils/profiler.hpp"
#include "lib_utils/threadpool.hpp"
#include <exception>
#include <stdexcept>

namespace Teletext {

StationRun::StationRun(const StationConfig &cfg, int64_t timestamp, std::ostream &out)
	: cfg(cfg), timestamp(timestamp), out(out) {
	runReport.station = cfg.id;
	write(serialize(SessionHeader { cfg.id, timestamp }));
}

void StationRun::write(const std::string &lines) {
	out << lines;
	if(!out)
		throw std::runtime_error(format("[%s] can't write the archive", cfg.id));
}

void StationRun::process(const RawPage &raw) {
	auto const captured = raw.timestamp ? raw.timestamp : timestamp;

	std::string lines;
	try {
		auto rows = decode(raw, cfg);
		lines = serialize(assemble(cfg, raw.page, raw.subPage, std::move(rows), captured));
	} catch(Error const& e) {
		g_Log->log(Warning, format("[%s] page %s/%s: %s: %s", cfg.id, raw.page, raw.subPage, e.kind(), e.what()).c_str());
		runReport.failures.push_back({ raw.page, raw.subPage, e.kind(), e.what() });

		if(cfg.recordFailures) {
			Page failed;
			failed.station = cfg.id;
			failed.page = raw.page;
			failed.subPage = raw.subPage ? raw.subPage : 1;
			failed.timestamp = captured;
			failed.error = std::string(e.kind()) + ": " + e.what();
			write(serialize(failed));
		}
		return;
	}

	write(lines);
	++runReport.decoded;
	g_Log->log(Debug, format("[%s] page %s/%s", cfg.id, raw.page, raw.subPage).c_str());
}

RunReport runStation(const StationConfig &cfg, int64_t timestamp, const std::vector<RawPage> &pages, std::ostream &out) {
	Tools::Profiler profiler("Station " + cfg.id);

	StationRun run(cfg, timestamp, out);
	for(auto& raw : pages)
		run.process(raw);

	auto const &report = run.report();
	g_Log->log(Info, format("[%s] %s pages archived, %s failed", cfg.id, report.decoded, report.failures.size()).c_str());
	return report;
}

std::vector<RunReport> runStations(const std::vector<StationJob> &jobs, int64_t timestamp, int threadCount) {
	loadCharsetTables();

	std::vector<RunReport> reports(jobs.size());
	std::vector<std::exception_ptr> errors(jobs.size());

	{
		ThreadPool pool("stations", threadCount);
		for(size_t i = 0; i < jobs.size(); ++i) {
			pool.submit([&, i]() {
				try {
					reports[i] = runStation(jobs[i].cfg, timestamp, jobs[i].pages, *jobs[i].out);
				} catch(...) {
					errors[i] = std::current_exception();
				}
			});
		}
	}

	for(auto& error : errors)
		if(error)
			std::rethrow_exception(error);

	return reports;
}

}
