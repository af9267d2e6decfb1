#pragma once

#include "charset.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace Teletext {

// Glyph positions of a station web font, as teletext character codes.
struct FontMap {
	struct Range {
		uint32_t from, to; // inclusive
		Charset charset;
		uint32_t base;     // code of glyph 'from' in 'charset'
	};

	std::vector<Range> ranges;

	struct Cell {
		Charset charset;
		uint32_t code;
	};

	// Throws UnmappedCharacter when no range covers 'glyph'.
	Cell lookup(uint32_t glyph) const;
};

// {"ranges":[{"from":32,"to":127,"charset":"latin-german","base":32}, ...]}
// "from", "to" and "base" may also be hexadecimal strings ("0xe020").
// Throws MalformedPayload.
FontMap parseFontMap(const std::string &jsonText);

}
