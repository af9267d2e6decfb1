#include "tests/tests.hpp"
#include "lib_utils/utf8.hpp"

unittest("utf8: encode") {
	std::string s;
	appendUtf8(s, 'K');
	appendUtf8(s, 0xf6);    // ö
	appendUtf8(s, 0x25a0);  // ■
	appendUtf8(s, 0x1fb00); // sextant 1
	ASSERT_EQUALS("K\xc3\xb6\xe2\x96\xa0\xf0\x9f\xac\x80", s);

	ASSERT_THROWN(appendUtf8(s, 0x110000));
	ASSERT_THROWN(appendUtf8(s, 0xd800));
}

unittest("utf8: decode") {
	auto const codes = decodeUtf8("K\xc3\xb6ln \xf0\x9f\xac\x80");
	ASSERT_EQUALS(std::vector<uint32_t>({ 'K', 0xf6, 'l', 'n', ' ', 0x1fb00 }), codes);

	ASSERT_THROWN(decodeUtf8("\xc3"));
	ASSERT_THROWN(decodeUtf8("\xf0\x9f\xac"));
	ASSERT_THROWN(decodeUtf8("\xc3\x41"));
	ASSERT_THROWN(decodeUtf8("\xff"));
}

unittest("utf8: decode rejects what cannot be encoded") {
	ASSERT_THROWN(decodeUtf8("A\xed\xa0\x80"));     // surrogate
	ASSERT_THROWN(decodeUtf8("\xf4\x90\x80\x80"));  // past U+10FFFF
	ASSERT_THROWN(decodeUtf8("\xf5\x80\x80\x80"));
	ASSERT_THROWN(decodeUtf8("\xc0\xaf"));           // overlong '/'
	ASSERT_THROWN(decodeUtf8("\xe0\x80\xaf"));
	ASSERT_THROWN(decodeUtf8("\xf0\x8f\xbf\xbf"));

	ASSERT_EQUALS(std::vector<uint32_t>({ 0xd7ff, 0xe000, 0x10ffff }), decodeUtf8("\xed\x9f\xbf\xee\x80\x80\xf4\x8f\xbf\xbf"));
}

unittest("utf8: length counts cells") {
	ASSERT_EQUALS(0u, utf8Length(""));
	ASSERT_EQUALS(23u, utf8Length("K\xc3\xb6ln will Benin-Bronzen"));
	ASSERT_EQUALS(2u, utf8Length("\xf0\x9f\xac\x80\xe2\x96\x88"));
}
