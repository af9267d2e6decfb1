#include "fixtures.hpp"
#include "lib_teletext/charset.hpp"
#include "tests/tests.hpp"
#include <set>

using namespace Teletext;
using namespace Fixtures;

unittest("charset: latin") {
	ASSERT_EQUALS((uint32_t)'A', mapCharacter(Charset::Latin, 'A'));
	ASSERT_EQUALS((uint32_t)'|', mapCharacter(Charset::Latin, 0x7c));
	ASSERT_EQUALS(0x25a0u, mapCharacter(Charset::Latin, 0x7f));
}

unittest("charset: german national option") {
	ASSERT_EQUALS(0xf6u, mapCharacter(Charset::LatinGerman, 0x7c)); // ö
	ASSERT_EQUALS(0xc4u, mapCharacter(Charset::LatinGerman, 0x5b)); // Ä
	ASSERT_EQUALS(0xa7u, mapCharacter(Charset::LatinGerman, 0x40)); // §
	ASSERT_EQUALS(0xdfu, mapCharacter(Charset::LatinGerman, 0x7e)); // ß
	ASSERT_EQUALS((uint32_t)'K', mapCharacter(Charset::LatinGerman, 'K'));
}

unittest("charset: mosaic sextants") {
	ASSERT_EQUALS(0x20u, mapCharacter(Charset::Mosaic, 0x20));
	ASSERT_EQUALS(0x1fb00u, mapCharacter(Charset::Mosaic, 0x21));
	ASSERT_EQUALS(0x258cu, mapCharacter(Charset::Mosaic, 0x35));
	ASSERT_EQUALS(0x2590u, mapCharacter(Charset::Mosaic, 0x6a));
	ASSERT_EQUALS(0x2588u, mapCharacter(Charset::Mosaic, 0x7f));
	ASSERT_EQUALS(0x1fb3bu, mapCharacter(Charset::Mosaic, 0x7e));
}

unittest("charset: mosaic blast-through capitals") {
	ASSERT_EQUALS((uint32_t)'A', mapCharacter(Charset::Mosaic, 0x41));
	ASSERT_EQUALS((uint32_t)'Z', mapCharacter(Charset::Mosaic, 0x5a));
}

unittest("charset: every sextant pattern has its own glyph") {
	std::set<uint32_t> glyphs;
	int count = 0;
	for(auto code : charsetCodes(Charset::Mosaic)) {
		if(code >= 0x40 && code < 0x60)
			continue;
		glyphs.insert(mapCharacter(Charset::Mosaic, code));
		++count;
	}
	ASSERT_EQUALS(64, count);
	ASSERT_EQUALS(64u, glyphs.size());
}

unittest("charset: unmapped codes") {
	ASSERT_EQUALS("UnmappedCharacter", errorKind([]() {
		mapCharacter(Charset::LineDrawing, 0x21);
	}));
	ASSERT_EQUALS("UnmappedCharacter", errorKind([]() {
		mapCharacter(Charset::Latin, 0x19);
	}));
	ASSERT_EQUALS("UnmappedCharacter", errorKind([]() {
		mapCharacter(Charset::Mosaic, 0x80);
	}));

	try {
		mapCharacter(Charset::LineDrawing, 0x3f);
		ASSERT(false);
	} catch(UnmappedCharacter const& e) {
		ASSERT_EQUALS("line-drawing", e.charset);
		ASSERT_EQUALS(0x3fu, e.code);
	}
}

unittest("charset: names and markers") {
	for(auto cs : { Charset::Latin, Charset::LatinGerman, Charset::Mosaic, Charset::LineDrawing })
		ASSERT(parseCharset(charsetName(cs)) == cs);
	ASSERT_THROWN(parseCharset("cyrillic"));

	ASSERT_EQUALS(0, charsetMarker(Charset::Latin));
	ASSERT_EQUALS(0, charsetMarker(Charset::Mosaic));
	ASSERT_EQUALS(1, charsetMarker(Charset::LineDrawing));
	ASSERT(charsetCodes(Charset::LineDrawing).empty());
}
