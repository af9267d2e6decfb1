#include "charset.hpp"
#include "error.hpp"
#include "lib_utils/format.hpp"
#include <map>
#include <mutex>
#include <stdexcept>

namespace Teletext {

UnmappedCharacter::UnmappedCharacter(const std::string &charset, uint32_t code)
	: Error(format("no Unicode mapping for code %x in charset '%s'", code, charset)), charset(charset), code(code) {
}

namespace {

auto const NUM_CHARSETS = 4;

struct NationalCharacter {
	uint8_t position;
	uint32_t codepoint;
};

// ETS 300 706, table 36: German national option subset
NationalCharacter const germanSubset[] = {
	{ 0x23, '#' },
	{ 0x24, '$' },
	{ 0x40, 0xa7 }, // §
	{ 0x5b, 0xc4 }, // Ä
	{ 0x5c, 0xd6 }, // Ö
	{ 0x5d, 0xdc }, // Ü
	{ 0x5e, '^' },
	{ 0x5f, '_' },
	{ 0x60, 0xb0 }, // °
	{ 0x7b, 0xe4 }, // ä
	{ 0x7c, 0xf6 }, // ö
	{ 0x7d, 0xfc }, // ü
	{ 0x7e, 0xdf }, // ß
};

uint32_t const G0_BLOCK = 0x25a0; // 0x7f in all G0 sets

// G1 codes carry the six cells in bits 0-4 and 6.
uint32_t sextant(uint32_t code) {
	auto const cells = (code & 0x1f) | ((code & 0x40) >> 1);
	switch(cells) {
	case 0x00: return 0x20;
	case 0x15: return 0x258c; // left column
	case 0x2a: return 0x2590; // right column
	case 0x3f: return 0x2588;
	}

	// U+1FB00.. enumerates the remaining 60 patterns in order
	auto index = cells - 1;
	if(cells > 0x15)
		--index;
	if(cells > 0x2a)
		--index;
	return 0x1fb00 + index;
}

bool isMosaic(uint32_t code) {
	return (code >= 0x20 && code <= 0x3f) || (code >= 0x60 && code <= 0x7f);
}

struct Tables {
	Tables() {
		auto& latin = maps[(int)Charset::Latin];
		for(uint32_t code = 0x20; code < 0x7f; ++code)
			latin[code] = code;
		latin[0x7f] = G0_BLOCK;

		auto& german = maps[(int)Charset::LatinGerman];
		german = latin;
		for(auto& c : germanSubset)
			german[c.position] = c.codepoint;

		// "blast-through": 0x40-0x5f show the G0 capitals
		auto& mosaic = maps[(int)Charset::Mosaic];
		for(uint32_t code = 0x20; code <= 0x7f; ++code)
			mosaic[code] = isMosaic(code) ? sextant(code) : latin[code];

		// Charset::LineDrawing has no glyph table

		validate();
	}

	void validate() const {
		for(int i = 0; i < NUM_CHARSETS; ++i) {
			for(auto& entry : maps[i]) {
				auto const cp = entry.second;
				if(entry.first < 0x20 || entry.first > 0xff || cp < 0x20 || cp >= 0x110000 || (cp >= 0xd800 && cp <= 0xdfff))
					throw std::runtime_error(format("Corrupt charset table '%s': %x -> %x", charsetName((Charset)i), entry.first, cp));
			}
		}
	}

	std::map<uint32_t, uint32_t> maps[NUM_CHARSETS];
};

std::once_flag g_tablesOnce;
Tables const* g_tables = nullptr;

Tables const& tables() {
	loadCharsetTables();
	return *g_tables;
}

}

const char* charsetName(Charset charset) {
	switch(charset) {
	case Charset::Latin: return "latin";
	case Charset::LatinGerman: return "latin-german";
	case Charset::Mosaic: return "mosaic";
	case Charset::LineDrawing: return "line-drawing";
	}
	throw std::runtime_error("Unknown charset");
}

Charset parseCharset(const std::string &name) {
	for(int i = 0; i < NUM_CHARSETS; ++i) {
		if(name == charsetName((Charset)i))
			return (Charset)i;
	}
	throw std::runtime_error("Unknown charset '" + name + "'");
}

int charsetMarker(Charset charset) {
	return charset == Charset::LineDrawing ? 1 : 0;
}

void loadCharsetTables() {
	std::call_once(g_tablesOnce, []() {
		static const Tables instance;
		g_tables = &instance;
	});
}

uint32_t mapCharacter(Charset charset, uint32_t rawCode) {
	auto& map = tables().maps[(int)charset];
	auto i = map.find(rawCode);
	if(i == map.end())
		throw UnmappedCharacter(charsetName(charset), rawCode);
	return i->second;
}

std::vector<uint32_t> charsetCodes(Charset charset) {
	std::vector<uint32_t> r;
	for(auto& entry : tables().maps[(int)charset])
		r.push_back(entry.first);
	return r;
}

}
