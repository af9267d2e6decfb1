#include "fixtures.hpp"
#include "lib_teletext/assembler.hpp"
#include "lib_teletext/decoder.hpp"
#include "lib_teletext/serializer.hpp"
#include "tests/tests.hpp"
#include <sstream>

using namespace Teletext;
using namespace Fixtures;

namespace {
int64_t const captured = 1643379192;

Page zdfDecoded() {
	RawPage raw;
	raw.body = zdfPage();
	auto const cfg = builtinStation("zdf");
	return assemble(cfg, 100, 1, decode(raw, cfg), captured);
}

Snapshot readArchive(const std::string &text) {
	std::istringstream in(text);
	return deserialize(in);
}

std::string const header = "{\"scraper\":\"zdf\",\"timestamp\":\"2022-01-28T14:13:12\"}\n";
}

unittest("serializer: session header") {
	SessionHeader h;
	h.station = "zdf";
	h.timestamp = captured;
	ASSERT_EQUALS(header, serialize(h));
	ASSERT(deserializeHeader(serialize(h)) == h);
}

unittest("serializer: page") {
	auto const expected = "{\"page\":100,\"sub_page\":1,\"timestamp\":\"2022-01-28T14:13:12\"}\n" + zdfRows();
	ASSERT_EQUALS(expected, serialize(zdfDecoded()));
}

unittest("serializer: page read back") {
	auto const page = zdfDecoded();
	ASSERT(deserializePage(serialize(page), "zdf") == page);
}

unittest("serializer: failed page marker") {
	Page page;
	page.page = 123;
	page.subPage = 2;
	page.timestamp = captured;
	page.error = "MalformedPayload: no element matches '#content'";
	ASSERT_EQUALS(
	    "{\"page\":123,\"sub_page\":2,\"timestamp\":\"2022-01-28T14:13:12\",\"error\":\"MalformedPayload: no element matches '#content'\"}\n",
	    serialize(page));
}

unittest("serializer: text escaping") {
	Row row;
	Segment seg;
	seg.text = "\"A\\B\"";
	seg.link.page = 300;
	seg.link.subPage = 4;
	row.push_back(seg);

	Page page;
	page.page = 100;
	page.rows.push_back(row);
	auto const lines = serialize(page);
	ASSERT_EQUALS("[[\"__\",\"\\\"A\\\\B\\\"\",[300,4]]]\n", lines.substr(lines.find('\n') + 1));
	ASSERT(deserializePage(lines, "") == page);
}

unittest("serializer: archive") {
	auto const archive = header
	    + "{\"page\":100,\"sub_page\":1,\"timestamp\":\"2022-01-28T14:13:12\"}\n"
	    + "[[\"wb\",\"100\"],[\"yb\",\"Seite 101\",101]]\n"
	    + "\n"
	    + "{\"page\":100,\"sub_page\":2,\"timestamp\":\"2022-01-28T14:13:20\"}\r\n"
	    + "[[\"wb\",\"100\"]]\r\n"
	    + "[]\n"
	    + "{\"page\":101,\"sub_page\":1,\"timestamp\":\"2022-01-28T14:13:30\",\"error\":\"IncompletePage: page 101/1 has no row\"}\n";

	auto const snapshot = readArchive(archive);
	ASSERT_EQUALS("zdf", snapshot.header.station);
	ASSERT_EQUALS(captured, snapshot.header.timestamp);
	ASSERT_EQUALS(3u, snapshot.pages.size());

	auto p = snapshot.findPage(100);
	ASSERT(p);
	ASSERT_EQUALS(1, p->subPage);
	ASSERT_EQUALS("zdf", p->station);
	ASSERT_EQUALS(2u, p->rows[0].size());
	ASSERT_EQUALS(101, p->rows[0][1].link.page);

	p = snapshot.findPage(100, 2);
	ASSERT(p);
	ASSERT_EQUALS(captured + 8, p->timestamp);
	ASSERT_EQUALS(2u, p->rows.size());
	ASSERT(p->rows[1].empty());

	p = snapshot.findPage(101);
	ASSERT(p);
	ASSERT(p->rows.empty());
	ASSERT_EQUALS("IncompletePage: page 101/1 has no row", p->error);

	ASSERT(!snapshot.findPage(102));
	ASSERT(!snapshot.findPage(100, 3));
}

unittest("serializer: legacy segment order") {
	auto const snapshot = readArchive(header
	        + "{\"page\":100,\"sub_page\":1,\"timestamp\":\"2022-01-28T14:13:12\"}\n"
	        + "[[\"yb\",[101,2],\"Seite 101\"],[\"yb\",\"Seite 102\",102]]\n");
	auto const &row = snapshot.pages[0].rows[0];
	ASSERT_EQUALS("Seite 101", row[0].text);
	ASSERT_EQUALS(101, row[0].link.page);
	ASSERT_EQUALS(2, row[0].link.subPage);
	ASSERT_EQUALS("Seite 102", row[1].text);
	ASSERT_EQUALS(102, row[1].link.page);
}

unittest("serializer: malformed archives") {
	auto const marker = std::string("{\"page\":100,\"sub_page\":1,\"timestamp\":\"2022-01-28T14:13:12\"}\n");
	std::string const archives[] = {
		"",
		marker,
		header + header,
		header + "[[\"wb\",\"100\"]]\n",
		header + marker + "{\"page\":100\n",
		header + marker + "42\n",
		header + marker + "[[\"wb\"]]\n",
		header + marker + "[[\"wx\",\"100\"]]\n",
		header + marker + "[[\"wb\",\"100\",50]]\n",
		header + marker + "[[\"wb\",\"100\",[101,0]]]\n",
		header + marker + "[[\"wb\",\"100\",\"101\"]]\n",
		header + "{\"page\":100,\"sub_page\":1,\"timestamp\":\"28.01.2022\"}\n",
		header + "{\"page\":\"100\",\"sub_page\":1,\"timestamp\":\"2022-01-28T14:13:12\"}\n",
		header + "{\"page\":101,\"sub_page\":1,\"timestamp\":\"2022-01-28T14:13:12\",\"error\":\"x\"}\n[]\n",
	};
	for(auto& archive : archives) {
		ASSERT_EQUALS("MalformedRecord", errorKind([&]() {
			readArchive(archive);
		}));
	}
}

unittest("serializer: malformed record line number") {
	try {
		readArchive(header + "\n[[\"wb\",\"100\"]]\n");
		ASSERT(false);
	} catch(MalformedRecord const& e) {
		ASSERT_EQUALS(0u, std::string(e.what()).find("line 3:"));
	}
}
