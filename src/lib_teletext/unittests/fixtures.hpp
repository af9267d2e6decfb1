#pragma once

// Station payloads as fetched, and helpers shared by the teletext tests.

#include "lib_teletext/error.hpp"
#include "lib_teletext/page.hpp"
#include "lib_teletext/serializer.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/utf8.hpp"
#include <string>
#include <vector>

namespace Fixtures {

inline std::string spaces(int n) {
	return std::string(n, ' ');
}

// serialized rows, without the page marker
inline std::string rowLines(const std::vector<Teletext::Row> &rows) {
	Teletext::Page page;
	page.page = 100;
	page.rows = rows;
	auto const lines = Teletext::serialize(page);
	return lines.substr(lines.find('\n') + 1);
}

// Teletext::Error::kind() of what 'f' throws, empty if nothing.
template<typename F>
std::string errorKind(F f) {
	try {
		f();
	} catch(Teletext::Error const& e) {
		return e.kind();
	}
	return "";
}

////////////////////////////////////////
// zdf: div rows, RGB classes, line-draw font for mosaics

inline std::string zdfPage() {
	return
	    "<!DOCTYPE html>\n"
	    "<html><head><title>ZDFtext</title><script>var x = 1 < 2;</script></head><body>\n"
	    "<div class=\"row\">Navigation</div>\n"
	    "<div id=\"content\">\n"
	    "<div class=\"row\">\n"
	    "  <span class=\"cfff bc000\">100 ZDFtext </span><span class=\"cff0 bc00f\">Nachrichten</span><span class=\"cfff bc000\">28.01.22 14:13:12</span>\n"
	    "</div>\n"
	    "<div class=\"row\"><span class=\"cf00 bc000 teletextlinedrawregular\">&nbsp;!A5</span>"
	    "<span class=\"cfff bc000\">Bundestag ber\xc3\xa4t Haushalt" + spaces(12) + "</span></div>\n"
	    "<div class=\"row\"><span class=\"cfff bc000\">Mehr: </span><a href=\"104.html\"><span class=\"cff0 bc000\">Seite 104</span></a>"
	    "<span class=\"cfff bc000\">" + spaces(25) + "</span></div>\n"
	    "</div>\n"
	    "</body></html>\n";
}

inline std::string zdfRows() {
	return
	    "[[\"wb\",\"100 ZDFtext \"],[\"yl\",\"Nachrichten\"],[\"wb\",\"28.01.22 14:13:12\"]]\n"
	    "[[\"rbG\",\" \xf0\x9f\xac\x80\xe2\x96\x88\xe2\x96\x8c\"],[\"wb\",\"Bundestag ber\xc3\xa4t Haushalt" + spaces(12) + "\"]]\n"
	    "[[\"wb\",\"Mehr: \"],[\"yb\",\"Seite 104\",104],[\"wb\",\"" + spaces(25) + "\"]]\n";
}

////////////////////////////////////////
// ndr: lines of <pre class="txt">, palette index classes, private-use mosaics

inline std::string ndrPage() {
	return
	    "<html><body><div class=\"nav\"><a href=\"100_01.htm\">Index</a></div>"
	    "<pre class=\"txt\">\n"
	    "<b class=\"f7 b0\">100 NDR Text </b><b class=\"f3 b4\">Fr 28.01.22 14:13:12</b>" + spaces(7) + "\n"
	    "<b class=\"f2 b0\">&#xe03f;&#xe001;\xee\x80\x80</b><b class=\"f7 b0\"> Hamburg: Elbtunnel gesperrt</b>" + spaces(9) + "\n"
	    "<b class=\"f7 b0\">Mehr </b><a href=\"101_01.htm\"><b class=\"f6 b0\">101</b></a>" + spaces(32) + "\n"
	    "</pre></body></html>";
}

inline std::string ndrRows() {
	return
	    "[[\"wb\",\"100 NDR Text \"],[\"yl\",\"Fr 28.01.22 14:13:12\"],[\"__\",\"" + spaces(7) + "\"]]\n"
	    "[[\"gbG\",\"\xe2\x96\x88\xf0\x9f\xac\x80 \"],[\"wb\",\" Hamburg: Elbtunnel gesperrt\"],[\"__\",\"" + spaces(9) + "\"]]\n"
	    "[[\"wb\",\"Mehr \"],[\"cb\",\"101\",[101,1]],[\"__\",\"" + spaces(32) + "\"]]\n";
}

////////////////////////////////////////
// sr: lines of <pre class="saartext_page">, no colors

inline std::string srPage(int page = 100) {
	return
	    "<html><body><a id=\"nextButton\" href=\"/101/01\">&gt;</a>"
	    "<pre class=\"saartext_page\">"
	    " " + format("%s", page) + " SAARTEXT" + spaces(27) + "\n"
	    "Regional <a href=\"/101/02\">101</a>" + spaces(28) + "\n"
	    "</pre></body></html>";
}

inline std::string srRows(int page = 100) {
	return
	    "[[\"__\",\" " + format("%s", page) + " SAARTEXT" + spaces(27) + "\"]]\n"
	    "[[\"__\",\"Regional \"],[\"__\",\"101\",[101,2]],[\"__\",\"" + spaces(28) + "\"]]\n";
}

////////////////////////////////////////
// 3sat: glyph positions of the station font, inline styles

inline std::string sat3Page() {
	return
	    "<html><body><div id=\"content\">"
	    "<div class=\"row\"><span style=\"color:#f00;background-color:#000\">502 </span>"
	    "<span style=\"color: #000; background: #000 none\">K|ln will Benin-Bronzen" + spaces(11) + "</span></div>"
	    "</div></body></html>";
}

inline std::string sat3FontMap() {
	return
	    "{\"ranges\":["
	    "{\"from\":32,\"to\":126,\"charset\":\"latin-german\",\"base\":32},"
	    "{\"from\":\"0xe020\",\"to\":\"0xe07f\",\"charset\":\"mosaic\",\"base\":\"0x20\"}"
	    "]}";
}

////////////////////////////////////////
// ntv: JSON cells

inline std::string ntvCells(const std::string &text, const char* font, const char* background, const char* extra = "") {
	std::string r;
	for(auto c : decodeUtf8(text)) {
		std::string value;
		appendUtf8(value, c);
		if(!r.empty())
			r += ",";
		r += "{\"value\":\"" + value + "\",\"font\":\"" + font + "\",\"background\":\"" + background + "\"" + extra + "}";
	}
	return r;
}

inline std::string ntvPage() {
	auto const row1 = ntvCells("n-tv", "#ffffff", "#0000ff") + "," + ntvCells(spaces(36), "#ffffff", "#000000");
	auto const row2 = "{\"value\":\"127\",\"graphic\":true,\"font\":\"#00ff00\",\"background\":\"#000000\"},"
	    + ntvCells("B\xc3\xb6rse", "#ffff00", "#000000", ",\"doubleheight\":true") + ","
	    + ntvCells(spaces(34), "#ffffff", "#000000");
	return "{\"date\":\"28.01.2022\",\"content\":{\"page\":\"200\",\"row\":[{\"columns\":[" + row1 + "]},{\"columns\":[" + row2 + "]}]}}";
}

inline std::string ntvRows() {
	return
	    "[[\"wl\",\"n-tv\"],[\"wb\",\"" + spaces(36) + "\"]]\n"
	    "[[\"gbG\",\"\xe2\x96\x88\"],[\"ybD\",\"B\xc3\xb6rse\"],[\"wb\",\"" + spaces(34) + "\"]]\n";
}

}
