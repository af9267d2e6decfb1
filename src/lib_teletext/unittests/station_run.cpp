#include "fixtures.hpp"
#include "lib_teletext/station_run.hpp"
#include "tests/tests.hpp"
#include <sstream>

using namespace Teletext;
using namespace Fixtures;

namespace {
int64_t const runTime = 1643379192; // 2022-01-28T14:13:12

RawPage rawPage(int page, const std::string &body, int64_t timestamp = 0) {
	RawPage raw;
	raw.page = page;
	raw.body = body;
	raw.timestamp = timestamp;
	return raw;
}

// five pages, the third one without its container
std::vector<RawPage> srPages() {
	std::vector<RawPage> pages;
	for(int page = 100; page < 105; ++page)
		pages.push_back(rawPage(page, page == 102 ? "<html><body>Wartungsarbeiten</body></html>" : srPage(page)));
	return pages;
}

Snapshot readArchive(const std::string &text) {
	std::istringstream in(text);
	return deserialize(in);
}
}

unittest("station run: failed pages are skipped") {
	std::ostringstream out;
	auto const report = runStation(builtinStation("sr"), runTime, srPages(), out);

	ASSERT_EQUALS("sr", report.station);
	ASSERT_EQUALS(4, report.decoded);
	ASSERT_EQUALS(1u, report.failures.size());
	ASSERT_EQUALS(102, report.failures[0].page);
	ASSERT_EQUALS("MalformedPayload", report.failures[0].kind);
	ASSERT_EQUALS("no element matches 'pre.saartext_page'", report.failures[0].reason);

	auto const text = out.str();
	auto const firstPage =
	    "{\"scraper\":\"sr\",\"timestamp\":\"2022-01-28T14:13:12\"}\n"
	    "{\"page\":100,\"sub_page\":1,\"timestamp\":\"2022-01-28T14:13:12\"}\n" + srRows(100);
	ASSERT_EQUALS(firstPage, text.substr(0, firstPage.size()));

	auto const snapshot = readArchive(text);
	ASSERT_EQUALS("sr", snapshot.header.station);
	ASSERT_EQUALS(runTime, snapshot.header.timestamp);
	ASSERT_EQUALS(4u, snapshot.pages.size());
	ASSERT_EQUALS(101, snapshot.pages[1].page);
	ASSERT_EQUALS(103, snapshot.pages[2].page);
	ASSERT(!snapshot.findPage(102));
}

unittest("station run: invalid UTF-8 only fails its own page") {
	auto pages = srPages();
	pages[2].body = "<pre class=\"saartext_page\">A\xed\xa0\x80</pre>";
	pages.push_back(rawPage(105, "<pre class=\"saartext_page\">\xf4\x90\x80\x80</pre>"));

	std::ostringstream out;
	auto const report = runStation(builtinStation("sr"), runTime, pages, out);
	ASSERT_EQUALS(4, report.decoded);
	ASSERT_EQUALS(2u, report.failures.size());
	ASSERT_EQUALS(102, report.failures[0].page);
	ASSERT_EQUALS("MalformedPayload", report.failures[0].kind);
	ASSERT_EQUALS(105, report.failures[1].page);
	ASSERT_EQUALS("MalformedPayload", report.failures[1].kind);

	auto const snapshot = readArchive(out.str());
	ASSERT_EQUALS(4u, snapshot.pages.size());
	ASSERT_EQUALS(104, snapshot.pages[3].page);
}

unittest("station run: failed pages recorded") {
	auto cfg = builtinStation("sr");
	cfg.recordFailures = true;

	std::ostringstream out;
	auto const report = runStation(cfg, runTime, srPages(), out);
	ASSERT_EQUALS(4, report.decoded);
	ASSERT_EQUALS(1u, report.failures.size());

	auto const snapshot = readArchive(out.str());
	ASSERT_EQUALS(5u, snapshot.pages.size());
	auto const failed = snapshot.findPage(102);
	ASSERT(failed);
	ASSERT_EQUALS(1, failed->subPage);
	ASSERT(failed->rows.empty());
	ASSERT_EQUALS("MalformedPayload: no element matches 'pre.saartext_page'", failed->error);
}

unittest("station run: failure kinds") {
	std::vector<RawPage> pages;
	pages.push_back(rawPage(100, zdfPage()));
	pages.push_back(rawPage(101, "<div id=\"content\"><div class=\"row\"><span class=\"teletextlinedrawregular\">\xc2\xa5</span></div></div>"));
	pages.push_back(rawPage(102, "<div id=\"content\"></div>"));
	pages.push_back(rawPage(1000, zdfPage()));

	std::ostringstream out;
	auto const report = runStation(builtinStation("zdf"), runTime, pages, out);
	ASSERT_EQUALS(1, report.decoded);
	ASSERT_EQUALS(3u, report.failures.size());
	ASSERT_EQUALS("UnmappedCharacter", report.failures[0].kind);
	ASSERT_EQUALS("IncompletePage", report.failures[1].kind);
	ASSERT_EQUALS("MalformedPayload", report.failures[2].kind);
	ASSERT_EQUALS(1000, report.failures[2].page);
}

unittest("station run: capture time") {
	std::vector<RawPage> pages;
	pages.push_back(rawPage(100, srPage(100), runTime + 60));
	pages.push_back(rawPage(101, srPage(101)));

	std::ostringstream out;
	runStation(builtinStation("sr"), runTime, pages, out);

	auto const snapshot = readArchive(out.str());
	ASSERT_EQUALS(runTime + 60, snapshot.findPage(100)->timestamp);
	ASSERT_EQUALS(runTime, snapshot.findPage(101)->timestamp);
}

unittest("station run: session header only") {
	std::ostringstream out;
	auto const report = runStation(builtinStation("ntv"), runTime, {}, out);
	ASSERT_EQUALS(0, report.decoded);
	ASSERT_EQUALS("{\"scraper\":\"ntv\",\"timestamp\":\"2022-01-28T14:13:12\"}\n", out.str());
}

unittest("station run: write errors abort the run") {
	std::ostringstream out;
	out.setstate(std::ios::badbit);

	bool thrown = false;
	try {
		StationRun run(builtinStation("sr"), runTime, out);
	} catch(Teletext::Error const&) {
		ASSERT(false);
	} catch(std::runtime_error const&) {
		thrown = true;
	}
	ASSERT(thrown);
}

unittest("station run: several stations") {
	std::ostringstream zdfOut, ntvOut, sat3Out;

	std::vector<StationJob> jobs(3);
	jobs[0].cfg = builtinStation("zdf");
	jobs[0].pages.push_back(rawPage(100, zdfPage()));
	jobs[0].out = &zdfOut;

	jobs[1].cfg = builtinStation("ntv");
	jobs[1].pages.push_back(rawPage(200, ntvPage()));
	jobs[1].pages.push_back(rawPage(201, "{}"));
	jobs[1].out = &ntvOut;

	jobs[2].cfg = builtinStation("3sat");
	auto raw = rawPage(502, sat3Page());
	raw.fontMap = sat3FontMap();
	jobs[2].pages.push_back(raw);
	jobs[2].out = &sat3Out;

	auto const reports = runStations(jobs, runTime, 2);
	ASSERT_EQUALS(3u, reports.size());
	ASSERT_EQUALS("zdf", reports[0].station);
	ASSERT_EQUALS("ntv", reports[1].station);
	ASSERT_EQUALS("3sat", reports[2].station);
	ASSERT_EQUALS(1, reports[1].decoded);
	ASSERT_EQUALS(1u, reports[1].failures.size());
	ASSERT_EQUALS(1, reports[2].decoded);

	auto const zdf = readArchive(zdfOut.str());
	ASSERT_EQUALS(zdfRows(), rowLines(zdf.pages[0].rows));

	auto const ntv = readArchive(ntvOut.str());
	ASSERT_EQUALS(1u, ntv.pages.size());
	ASSERT_EQUALS(ntvRows(), rowLines(ntv.pages[0].rows));
}

unittest("station run: an aborted station is rethrown") {
	std::ostringstream good, bad;
	bad.setstate(std::ios::badbit);

	std::vector<StationJob> jobs(2);
	jobs[0].cfg = builtinStation("sr");
	jobs[0].pages = srPages();
	jobs[0].out = &good;
	jobs[1].cfg = builtinStation("ndr");
	jobs[1].pages.push_back(rawPage(100, ndrPage()));
	jobs[1].out = &bad;

	ASSERT_THROWN(runStations(jobs, runTime, 2));

	// the other station still completed
	ASSERT_EQUALS(4u, readArchive(good.str()).pages.size());
}
