#include "fixtures.hpp"
#include "lib_teletext/decoder.hpp"
#include "lib_teletext/font_map.hpp"
#include "tests/tests.hpp"

using namespace Teletext;
using namespace Fixtures;

namespace {
RawPage rawPage(const std::string &body, const std::string &fontMap = "") {
	RawPage raw;
	raw.page = 100;
	raw.body = body;
	raw.fontMap = fontMap;
	return raw;
}

std::string decoded(const std::string &station, const std::string &body, const std::string &fontMap = "") {
	return rowLines(decode(rawPage(body, fontMap), builtinStation(station)));
}

std::string zdfRow(const std::string &content) {
	return "<html><body><div id=\"content\"><div class=\"row\">" + content + "</div></div></body></html>";
}
}

unittest("decoder: zdf") {
	ASSERT_EQUALS(zdfRows(), decoded("zdf", zdfPage()));
	ASSERT_EQUALS(zdfRows(), decoded("zdf-neo", zdfPage()));
}

unittest("decoder: ndr") {
	ASSERT_EQUALS(ndrRows(), decoded("ndr", ndrPage()));
}

unittest("decoder: sr") {
	ASSERT_EQUALS(srRows(), decoded("sr", srPage()));
}

unittest("decoder: ntv") {
	ASSERT_EQUALS(ntvRows(), decoded("ntv", ntvPage()));
}

unittest("decoder: 3sat") {
	auto const expected = "[[\"rb\",\"502 \"],[\"bb\",\"K\xc3\xb6ln will Benin-Bronzen" + spaces(11) + "\"]]\n";
	ASSERT_EQUALS(expected, decoded("3sat", sat3Page(), sat3FontMap()));
}

unittest("decoder: 3sat needs the station font map") {
	ASSERT_EQUALS("MalformedPayload", errorKind([]() {
		decoded("3sat", sat3Page());
	}));
	ASSERT_EQUALS("MalformedPayload", errorKind([]() {
		decoded("3sat", sat3Page(), "{\"ranges\":[]}");
	}));
}

unittest("decoder: glyph outside the font map") {
	auto const body = "<div id=\"content\"><div class=\"row\">caf\xc3\xa9</div></div>";
	ASSERT_EQUALS("UnmappedCharacter", errorKind([&]() {
		decoded("3sat", body, sat3FontMap());
	}));
}

unittest("decoder: font map") {
	auto const fm = parseFontMap(sat3FontMap());
	ASSERT_EQUALS(2u, fm.ranges.size());

	auto cell = fm.lookup(0xe03f);
	ASSERT(cell.charset == Charset::Mosaic);
	ASSERT_EQUALS(0x3fu, cell.code);

	cell = fm.lookup('|');
	ASSERT(cell.charset == Charset::LatinGerman);
	ASSERT_EQUALS(0x7cu, cell.code);

	ASSERT_EQUALS("UnmappedCharacter", errorKind([&]() {
		fm.lookup(0x1f);
	}));
}

unittest("decoder: invalid font maps") {
	for(auto text : {
	            "",
	            "{}",
	            "{\"ranges\":[{\"from\":32,\"to\":127,\"charset\":\"latin\"}]}",
	            "{\"ranges\":[{\"from\":32,\"to\":31,\"charset\":\"latin\",\"base\":32}]}",
	            "{\"ranges\":[{\"from\":\"0xzz\",\"to\":127,\"charset\":\"latin\",\"base\":32}]}",
	            "{\"ranges\":[{\"from\":32,\"to\":127,\"charset\":\"latin\",\"base\":32,\"size\":12}]}",
	        }) {
		ASSERT_EQUALS("MalformedPayload", errorKind([&]() {
			parseFontMap(text);
		}));
	}
}

unittest("decoder: missing container") {
	ASSERT_EQUALS("MalformedPayload", errorKind([]() {
		decoded("zdf", "<html><body><div class=\"row\">404</div></body></html>");
	}));
	ASSERT_EQUALS("MalformedPayload", errorKind([]() {
		decoded("ndr", "<html><body>Seite nicht gefunden</body></html>");
	}));
}

unittest("decoder: truncated document") {
	ASSERT_EQUALS("MalformedPayload", errorKind([]() {
		decoded("zdf", "<html><body><div id=\"content\"><div class=\"row\"><span class=\"cf");
	}));
}

unittest("decoder: unusable link degrades to text") {
	auto const body = zdfRow("<a href=\"/impressum.html\"><span class=\"cfff bc000\">Impressum</span></a>");
	ASSERT_EQUALS("[[\"wb\",\"Impressum\"]]\n", decoded("zdf", body));

	auto cfg = builtinStation("zdf");
	cfg.strictLinks = true;
	ASSERT_EQUALS("InvalidLinkTarget", errorKind([&]() {
		decode(rawPage(body), cfg);
	}));
}

unittest("decoder: line-drawing cells abort by default") {
	auto const body = zdfRow("<span class=\"cf00 bc000 teletextlinedrawregular\">\xc2\xa1!</span>");
	ASSERT_EQUALS("UnmappedCharacter", errorKind([&]() {
		decoded("zdf", body);
	}));
}

unittest("decoder: line-drawing cells substituted") {
	auto const body = zdfRow("<span class=\"cf00 bc000 teletextlinedrawregular\">\xc2\xa1!</span>");

	auto cfg = builtinStation("zdf");
	cfg.unmapped = UnmappedPolicy::Substitute;
	ASSERT_EQUALS("[[\"rb1\",\"\xef\xbf\xbd\"],[\"rbG\",\"\xf0\x9f\xac\x80\"]]\n", rowLines(decode(rawPage(body), cfg)));

	cfg.placeholder = '?';
	ASSERT_EQUALS("[[\"rb1\",\"?\"],[\"rbG\",\"\xf0\x9f\xac\x80\"]]\n", rowLines(decode(rawPage(body), cfg)));
}

unittest("decoder: thin private-use mosaics") {
	auto const body = "<pre class=\"txt\"><b class=\"f7 b0\">&#xe041;</b></pre>";
	ASSERT_EQUALS("UnmappedCharacter", errorKind([&]() {
		decoded("ndr", body);
	}));

	auto cfg = builtinStation("ndr");
	cfg.unmapped = UnmappedPolicy::Substitute;
	ASSERT_EQUALS("[[\"wb1\",\"\xef\xbf\xbd\"]]\n", rowLines(decode(rawPage(body), cfg)));
}

unittest("decoder: line-draw font only knows the G1 positions") {
	auto const body = zdfRow("<span class=\"cf00 bc000 teletextlinedrawregular\">BZ</span>");
	ASSERT_EQUALS("UnmappedCharacter", errorKind([&]() {
		decoded("zdf", body);
	}));

	auto cfg = builtinStation("zdf");
	cfg.unmapped = UnmappedPolicy::Substitute;
	cfg.placeholder = '?';
	ASSERT_EQUALS("[[\"rb\",\"??\"]]\n", rowLines(decode(rawPage(body), cfg)));
}

unittest("decoder: private-use glyphs past the mosaic range") {
	auto const body = "<pre class=\"txt\"><b class=\"f7 b0\">&#xe0a5;</b></pre>";
	ASSERT_EQUALS("UnmappedCharacter", errorKind([&]() {
		decoded("ndr", body);
	}));

	auto cfg = builtinStation("ndr");
	cfg.unmapped = UnmappedPolicy::Substitute;
	ASSERT_EQUALS("[[\"wb\",\"\xef\xbf\xbd\"]]\n", rowLines(decode(rawPage(body), cfg)));
}

unittest("decoder: invalid UTF-8 in the page body") {
	ASSERT_EQUALS("MalformedPayload", errorKind([]() {
		decoded("sr", "<pre class=\"saartext_page\">A\xed\xa0\x80</pre>");
	}));
	ASSERT_EQUALS("MalformedPayload", errorKind([]() {
		decoded("ntv", "{\"content\":{\"row\":[{\"columns\":[{\"value\":\"\xf4\x90\x80\x80\"}]}]}}");
	}));
}

unittest("decoder: double height and flashing classes") {
	auto cfg = builtinStation("zdf");
	cfg.doubleHeightClass = "dh";
	cfg.flashClass = "blink";
	auto const body = zdfRow("<span class=\"cfff bc000 dh\">AB<span class=\"blink\">C</span></span><span class=\"cfff bc000\">D</span>");
	ASSERT_EQUALS("[[\"wbD\",\"AB\"],[\"wbDF\",\"C\"],[\"wb\",\"D\"]]\n", rowLines(decode(rawPage(body), cfg)));
}

unittest("decoder: classes that only look like colors") {
	auto const body = zdfRow("<span class=\"center bc000\">x</span><span class=\"cfff bcgreen\">y</span>");
	ASSERT_EQUALS("[[\"_b\",\"x\"],[\"w_\",\"y\"]]\n", decoded("zdf", body));
}

unittest("decoder: line breaks") {
	auto const body = "<pre class=\"saartext_page\">Zeile 1<br>Zeile 2<br/>\r\nZeile 3\n\n</pre>";
	ASSERT_EQUALS(
	    "[[\"__\",\"Zeile 1\"]]\n"
	    "[[\"__\",\"Zeile 2\"]]\n"
	    "[]\n"
	    "[[\"__\",\"Zeile 3\"]]\n"
	    "[]\n",
	    decoded("sr", body));
}

unittest("decoder: inline styles") {
	auto const body =
	    "<pre class=\"saartext_page\">"
	    "<span style=\"color: yellow; background-color: #00f\">A</span>"
	    "<span style=\"COLOR:#0f0;background:transparent url(x.png)\">B</span>"
	    "<span style=\"font-weight:bold\">C</span>"
	    "</pre>";
	ASSERT_EQUALS("[[\"yl\",\"A\"],[\"g_\",\"B\"],[\"__\",\"C\"]]\n", decoded("sr", body));

	ASSERT_EQUALS("MalformedPayload", errorKind([]() {
		decoded("sr", "<pre class=\"saartext_page\"><span style=\"color:rgb(0,0,0)\">A</span></pre>");
	}));
}

unittest("decoder: json cells") {
	auto const body =
	    "{\"content\":{\"row\":[{\"columns\":["
	    "{\"value\":\"A\",\"font\":null,\"flash\":1,\"conceal\":true},"
	    "{\"value\":\"\xc2\xa0\",\"font\":\"#fff\"},"
	    "{\"value\":53,\"graphic\":true,\"font\":\"red\"}"
	    "]}]}}";
	ASSERT_EQUALS("[[\"__FC\",\"A\"],[\"w_\",\" \"],[\"r_G\",\"\xe2\x96\x8c\"]]\n", decoded("ntv", body));
}

unittest("decoder: invalid json payloads") {
	for(auto body : {
	            "",
	            "{\"content\":",
	            "[]",
	            "{\"content\":{}}",
	            "{\"content\":{\"row\":{}}}",
	            "{\"content\":{\"row\":[{}]}}",
	            "{\"content\":{\"row\":[{\"columns\":[{\"value\":\"AB\"}]}]}}",
	            "{\"content\":{\"row\":[{\"columns\":[{\"value\":\"\"}]}]}}",
	            "{\"content\":{\"row\":[{\"columns\":[{\"value\":65}]}]}}",
	            "{\"content\":{\"row\":[{\"columns\":[{\"value\":\"A\",\"flash\":\"yes\"}]}]}}",
	            "{\"content\":{\"row\":[{\"columns\":[{\"value\":\"x\",\"graphic\":true}]}]}}",
	            "{\"content\":{\"row\":[{\"columns\":[{\"value\":\"A\",\"font\":\"#12\"}]}]}}",
	        }) {
		ASSERT_EQUALS("MalformedPayload", errorKind([&]() {
			decoded("ntv", body);
		}));
	}
}

fuzztest("decoder: html") {
	uint8_t const* data;
	size_t len;
	Tests::GetFuzzTestData(data, len);

	try {
		decodeHtml(std::string((char const*)data, len), builtinStation("zdf"), nullptr);
		decodeHtml(std::string((char const*)data, len), builtinStation("ndr"), nullptr);
	} catch(std::runtime_error const&) {
	}
}
