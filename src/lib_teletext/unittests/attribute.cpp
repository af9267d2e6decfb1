#include "fixtures.hpp"
#include "lib_teletext/attribute.hpp"
#include "lib_teletext/link.hpp"
#include "lib_teletext/page.hpp"
#include "tests/tests.hpp"

using namespace Teletext;
using namespace Fixtures;

namespace {
Attribute attr(Color fg, Color bg) {
	Attribute r;
	r.fg = fg;
	r.bg = bg;
	return r;
}

Link link(int page, int subPage = 0) {
	Link r;
	r.page = page;
	r.subPage = subPage;
	return r;
}
}

unittest("attribute: codes") {
	ASSERT_EQUALS("__", Attribute().code());
	ASSERT_EQUALS("wb", attr(Color::White, Color::Black).code());
	ASSERT_EQUALS("yl", attr(Color::Yellow, Color::Blue).code());
	ASSERT_EQUALS("rbG", attr(Color::Red, Color::Black).with(Flag::Graphics).code());

	auto a = attr(Color::Cyan, Color::Magenta).with(Flag::Graphics).with(Flag::DoubleHeight);
	a.charsetMarker = 1;
	ASSERT_EQUALS("cm1DG", a.code());
}

unittest("attribute: plain attributes keep two-character codes") {
	for(auto fg : { Color::Black, Color::Red, Color::Green, Color::Yellow, Color::Blue, Color::Magenta, Color::Cyan, Color::White })
		for(auto bg : { Color::Black, Color::Blue, Color::White }) {
			ASSERT_EQUALS(2u, attr(fg, bg).code().size());
			ASSERT_EQUALS(3u, attr(fg, bg).with(Flag::Graphics).code().size());
		}
}

unittest("attribute: parse") {
	auto a = Attribute::parse("wb1DG");
	ASSERT_EQUALS((int)Color::White, (int)a.fg);
	ASSERT_EQUALS((int)Color::Black, (int)a.bg);
	ASSERT_EQUALS(1, a.charsetMarker);
	ASSERT(a.has(Flag::DoubleHeight));
	ASSERT(a.has(Flag::Graphics));
	ASSERT(!a.has(Flag::Flashing));

	ASSERT(Attribute::parse("__") == Attribute());
	ASSERT(Attribute::parse("yl") == attr(Color::Yellow, Color::Blue));
	ASSERT_EQUALS("gbFC", Attribute::parse("gbFC").code());
}

unittest("attribute: parse rejects non-canonical codes") {
	ASSERT_THROWN(Attribute::parse(""));
	ASSERT_THROWN(Attribute::parse("w"));
	ASSERT_THROWN(Attribute::parse("xb"));
	ASSERT_THROWN(Attribute::parse("wb0"));
	ASSERT_THROWN(Attribute::parse("wbGD"));
	ASSERT_THROWN(Attribute::parse("wbDD"));
	ASSERT_THROWN(Attribute::parse("wbZ"));
}

unittest("attribute: css colors") {
	ASSERT_EQUALS((int)Color::White, (int)colorFromCss("#fff"));
	ASSERT_EQUALS((int)Color::White, (int)colorFromCss("#888"));
	ASSERT_EQUALS((int)Color::Black, (int)colorFromCss("#555"));
	ASSERT_EQUALS((int)Color::Red, (int)colorFromCss("ff0000"));
	ASSERT_EQUALS((int)Color::Blue, (int)colorFromCss("#123456"));
	ASSERT_EQUALS((int)Color::Yellow, (int)colorFromCss("Yellow"));
	ASSERT_EQUALS((int)Color::Cyan, (int)colorFromCss(" aqua "));
	ASSERT_EQUALS((int)Color::Magenta, (int)colorFromCss("#F0F"));

	ASSERT_EQUALS("MalformedPayload", errorKind([]() {
		colorFromCss("rgb(1,2,3)");
	}));
	ASSERT_EQUALS("MalformedPayload", errorKind([]() {
		colorFromCss("#ffff");
	}));
}

unittest("attribute: palette index") {
	ASSERT_EQUALS((int)Color::Black, (int)colorFromIndex(0));
	ASSERT_EQUALS((int)Color::Yellow, (int)colorFromIndex(3));
	ASSERT_EQUALS((int)Color::White, (int)colorFromIndex(7));
	ASSERT_EQUALS("MalformedPayload", errorKind([]() {
		colorFromIndex(8);
	}));
	ASSERT_THROWN(parseColorCode('x'));
	ASSERT_EQUALS('_', colorCode(Color::Unset));
}

unittest("link: targets") {
	ASSERT(parseLinkTarget("101") == link(101));
	ASSERT(parseLinkTarget("101/5") == link(101, 5));
	ASSERT(parseLinkTarget("101_05") == link(101, 5));
	ASSERT(parseLinkTarget("899-12") == link(899, 12));
	ASSERT(!Link());
}

unittest("link: invalid targets") {
	for(auto target : { "", "99", "900", "1000", "abc", "101/", "101/0", "101/x", "/101" }) {
		ASSERT_EQUALS("InvalidLinkTarget", errorKind([&]() {
			parseLinkTarget(target);
		}));
	}
}

unittest("link: station hrefs") {
	ASSERT(parseLinkHref("/101/02") == link(101, 2));
	ASSERT(parseLinkHref("101_01.htm") == link(101, 1));
	ASSERT(parseLinkHref("104.html") == link(104));
	ASSERT(parseLinkHref("?page=101") == link(101));
	ASSERT(parseLinkHref("/203/?from=100") == link(203));
	ASSERT(parseLinkHref("102.html#top") == link(102));
}

unittest("link: invalid href is reported as written") {
	try {
		parseLinkHref("/impressum.html");
		ASSERT(false);
	} catch(InvalidLinkTarget const& e) {
		ASSERT_EQUALS("/impressum.html", e.target);
	}
}

unittest("row: width counts cells") {
	Row row;
	row.push_back({ attr(Color::White, Color::Black), "Bundestag ber\xc3\xa4t", Link() });
	row.push_back({ attr(Color::Red, Color::Black).with(Flag::Graphics), "\xf0\x9f\xac\x80\xe2\x96\x88", Link() });
	ASSERT_EQUALS(17u, rowWidth(row));
	ASSERT_EQUALS(0u, rowWidth(Row()));
}

unittest("row: coalesce") {
	auto const wb = attr(Color::White, Color::Black);
	auto const yb = attr(Color::Yellow, Color::Black);

	Row row;
	row.push_back({ wb, "Mehr", Link() });
	row.push_back({ wb, "", link(101) });
	row.push_back({ wb, ": ", Link() });
	row.push_back({ yb, "Seite ", link(104) });
	row.push_back({ yb, "104", link(104) });
	row.push_back({ yb, "!", link(105) });
	row.push_back({ wb, " ", Link() });

	auto merged = coalesce(row);
	ASSERT_EQUALS(4u, merged.size());
	ASSERT_EQUALS("Mehr: ", merged[0].text);
	ASSERT_EQUALS("Seite 104", merged[1].text);
	ASSERT(merged[1].link == link(104));
	ASSERT(merged[2].link == link(105));
	ASSERT_EQUALS(rowWidth(row), rowWidth(merged));
	ASSERT(coalesce(merged) == merged);
}
