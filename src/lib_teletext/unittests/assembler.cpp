#include "fixtures.hpp"
#include "lib_teletext/assembler.hpp"
#include "lib_teletext/decoder.hpp"
#include "tests/tests.hpp"

using namespace Teletext;
using namespace Fixtures;

namespace {
int64_t const captured = 1643379192; // 2022-01-28T14:13:12

Row textRow(const std::string &text) {
	Row row;
	Segment seg;
	seg.text = text;
	row.push_back(seg);
	return row;
}

std::vector<Row> decodeFixture(const std::string &station, const std::string &body, const std::string &fontMap = "") {
	RawPage raw;
	raw.page = 100;
	raw.body = body;
	raw.fontMap = fontMap;
	return decode(raw, builtinStation(station));
}
}

unittest("assembler: page identity") {
	auto const cfg = builtinStation("zdf");
	auto const page = assemble(cfg, 100, 3, decodeFixture("zdf", zdfPage()), captured);
	ASSERT_EQUALS("zdf", page.station);
	ASSERT_EQUALS(100, page.page);
	ASSERT_EQUALS(3, page.subPage);
	ASSERT_EQUALS(captured, page.timestamp);
	ASSERT_EQUALS(3u, page.rows.size());
	ASSERT(page.error.empty());
}

unittest("assembler: no sub-paging means sub-page 1") {
	auto const page = assemble(builtinStation("sr"), 100, 0, decodeFixture("sr", srPage()), captured);
	ASSERT_EQUALS(1, page.subPage);
}

unittest("assembler: every fixture has the station row width") {
	struct Fixture {
		const char* station;
		std::string body, fontMap;
	};
	Fixture const fixtures[] = {
		{ "zdf", zdfPage(), "" },
		{ "ndr", ndrPage(), "" },
		{ "sr", srPage(), "" },
		{ "ntv", ntvPage(), "" },
		{ "3sat", sat3Page(), sat3FontMap() },
	};
	for(auto& f : fixtures) {
		auto const cfg = builtinStation(f.station);
		auto const page = assemble(cfg, 100, 1, decodeFixture(f.station, f.body, f.fontMap), captured);
		for(auto& row : page.rows)
			ASSERT_EQUALS((size_t)cfg.rowWidth, rowWidth(row));
	}
	ASSERT_EQUALS(38, builtinStation("3sat").rowWidth);
}

unittest("assembler: coalesces segments") {
	StationConfig cfg;
	cfg.id = "test";

	Attribute wb;
	wb.fg = Color::White;
	wb.bg = Color::Black;

	Row row;
	for(auto c : { "1", "0", "0" })
		row.push_back({ wb, c, Link() });
	row.push_back({ wb, "", Link() });

	auto const page = assemble(cfg, 100, 1, { row }, captured);
	ASSERT_EQUALS(1u, page.rows[0].size());
	ASSERT_EQUALS("100", page.rows[0][0].text);
}

unittest("assembler: page number out of range") {
	auto const cfg = builtinStation("sr");
	ASSERT_EQUALS("MalformedPayload", errorKind([&]() {
		assemble(cfg, 99, 1, decodeFixture("sr", srPage()), captured);
	}));
	ASSERT_EQUALS("MalformedPayload", errorKind([&]() {
		assemble(cfg, 900, 1, decodeFixture("sr", srPage()), captured);
	}));
	ASSERT_EQUALS("MalformedPayload", errorKind([&]() {
		assemble(cfg, 100, -1, decodeFixture("sr", srPage()), captured);
	}));
}

unittest("assembler: incomplete pages") {
	StationConfig cfg;
	cfg.id = "test";
	ASSERT_EQUALS("IncompletePage", errorKind([&]() {
		assemble(cfg, 100, 1, {}, captured);
	}));

	cfg.rowCount = 3;
	ASSERT_EQUALS("IncompletePage", errorKind([&]() {
		assemble(cfg, 100, 1, { textRow("a"), textRow("b") }, captured);
	}));
	ASSERT_EQUALS(3u, assemble(cfg, 100, 1, { textRow("a"), textRow("b"), textRow("c") }, captured).rows.size());
}

unittest("assembler: row width mismatch") {
	auto const cfg = builtinStation("sr");
	auto rows = decodeFixture("sr", srPage());
	rows[1].back().text.pop_back();
	ASSERT_EQUALS("MalformedPayload", errorKind([&]() {
		assemble(cfg, 100, 1, rows, captured);
	}));

	// unchecked when the station has no width
	StationConfig loose;
	loose.id = "test";
	ASSERT_EQUALS(2u, assemble(loose, 100, 1, rows, captured).rows.size());
}
