#include "lib_teletext/station.hpp"
#include "tests/tests.hpp"
#include <stdexcept>
#include <string>
#include <vector>

using namespace Teletext;

namespace {
bool configOk(const std::string &text) {
	try {
		parseConfig(text);
		return true;
	} catch(std::runtime_error const&) {
		return false;
	}
}

std::string withStations(const std::string &stations) {
	return "{ \"version\": 1, \"stations\": " + stations + " }";
}
}

unittest("station: built-in profiles") {
	auto const expected = std::vector<std::string>({ "zdf", "zdf-info", "zdf-neo", "ndr", "sr", "ntv", "3sat" });
	ASSERT_EQUALS(expected, builtinStationNames());

	for(auto& name : builtinStationNames())
		ASSERT_EQUALS(name, builtinStation(name).id);

	ASSERT(isBuiltinStation("zdf-info"));
	ASSERT(!isBuiltinStation("mdr"));
	ASSERT_THROWN(builtinStation("mdr"));

	ASSERT(builtinStation("3sat").format == Format::HtmlFontMap);
	ASSERT(builtinStation("ntv").format == Format::Json);
	ASSERT(builtinStation("ndr").rows == RowMode::Lines);
	ASSERT_EQUALS(0xe000u, builtinStation("ndr").mosaicBase);
	ASSERT_EQUALS("teletextlinedrawregular", builtinStation("zdf-neo").mosaicClass);
}

unittest("station: format names") {
	for(auto f : { Format::Html, Format::HtmlFontMap, Format::Json })
		ASSERT(parseFormat(formatName(f)) == f);
	ASSERT_EQUALS("html-with-font-map", std::string(formatName(Format::HtmlFontMap)));
	ASSERT_THROWN(parseFormat("xml"));
}

unittest("station: config") {
	auto const stations = parseConfig(withStations(R"|({
		"zdf": {},
		"ndr-nord": { "extends": "ndr", "row_count": 24, "unmapped": "substitute", "placeholder": "?" },
		"sr": { "strict_links": true, "record_failures": true },
		"mdr": {
			"type": "html",
			"container": "#page",
			"rows": "lines",
			"colors": "inline-style",
			"mosaic_base": 57344,
			"double_height_class": "dh",
			"flash_class": "blink",
			"row_width": 40
		}
	})|"));

	ASSERT_EQUALS(4u, stations.size());

	ASSERT_EQUALS("zdf", stations[0].id);
	ASSERT_EQUALS("#content", stations[0].container);

	auto const &ndr = stations[1];
	ASSERT_EQUALS("ndr-nord", ndr.id);
	ASSERT_EQUALS("pre.txt", ndr.container);
	ASSERT_EQUALS(24, ndr.rowCount);
	ASSERT(ndr.unmapped == UnmappedPolicy::Substitute);
	ASSERT_EQUALS((uint32_t)'?', ndr.placeholder);

	ASSERT(stations[2].strictLinks);
	ASSERT(stations[2].recordFailures);
	ASSERT_EQUALS("pre.saartext_page", stations[2].container);

	auto const &mdr = stations[3];
	ASSERT(mdr.format == Format::Html);
	ASSERT(mdr.rows == RowMode::Lines);
	ASSERT(mdr.colors == ColorScheme::InlineStyle);
	ASSERT_EQUALS(0xe000u, mdr.mosaicBase);
	ASSERT_EQUALS("dh", mdr.doubleHeightClass);
	ASSERT_EQUALS("blink", mdr.flashClass);
	ASSERT_EQUALS(40, mdr.rowWidth);
	ASSERT(mdr.unmapped == UnmappedPolicy::Abort);
	ASSERT_EQUALS(0xfffdu, mdr.placeholder);
}

unittest("station: extends applies before the other members") {
	auto const stations = parseConfig(withStations(R"({ "zdf-test": { "row_width": 0, "extends": "zdf" } })"));
	ASSERT_EQUALS(0, stations[0].rowWidth);
	ASSERT_EQUALS("teletextlinedrawregular", stations[0].mosaicClass);
}

unittest("station: invalid configs") {
	ASSERT(configOk(withStations(R"({ "ntv": {} })")));

	ASSERT(!configOk(""));
	ASSERT(!configOk(R"({ "stations": { "zdf": {} } })"));
	ASSERT(!configOk(R"({ "version": 2, "stations": { "zdf": {} } })"));
	ASSERT(!configOk(R"({ "version": 1 })"));
	ASSERT(!configOk(R"({ "version": 1, "stations": {}, "proxy": "x" })"));
	ASSERT(!configOk(withStations("{}")));
	ASSERT(!configOk(withStations("[]")));
	ASSERT(!configOk(withStations(R"({ "mdr": {} })")));
	ASSERT(!configOk(withStations(R"({ "mdr": { "extends": "wdr" } })")));
	ASSERT(!configOk(withStations(R"({ "zdf": { "colour": "rgb-classes" } })")));
	ASSERT(!configOk(withStations(R"({ "zdf": { "colors": "hsl" } })")));
	ASSERT(!configOk(withStations(R"({ "zdf": { "rows": "cells" } })")));
	ASSERT(!configOk(withStations(R"({ "zdf": { "row_width": -1 } })")));
	ASSERT(!configOk(withStations(R"({ "zdf": { "row_width": "40" } })")));
	ASSERT(!configOk(withStations(R"({ "zdf": { "strict_links": 1 } })")));
	ASSERT(!configOk(withStations(R"({ "zdf": { "unmapped": "ignore" } })")));
	ASSERT(!configOk(withStations(R"({ "zdf": { "placeholder": "??" } })")));
	ASSERT(!configOk(withStations(R"({ "zdf": { "row_selector": "" } })")));
	ASSERT(!configOk(withStations(R"({ "zdf": "html" })")));
	ASSERT(!configOk(withStations(R"({ "zdf": {}, "zdf": {} })")));
}

unittest("station: invalid log section") {
	ASSERT(!configOk(R"({ "version": 1, "log": { "type": "carrier-pigeon" }, "stations": { "zdf": {} } })"));
	ASSERT(!configOk(R"({ "version": 1, "log": { "verbosity": 3 }, "stations": { "zdf": {} } })"));
}
