#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace Teletext {

enum class Charset {
	Latin,       // G0 Latin primary set
	LatinGerman, // G0 Latin, German national option
	Mosaic,      // G1 contiguous block mosaics
	LineDrawing, // thin box graphics: no Unicode mapping, marker only
};

const char* charsetName(Charset charset);
Charset parseCharset(const std::string &name);

// Non-zero when output segments must carry the charset in their attribute.
int charsetMarker(Charset charset);

// Builds and validates the tables. Called once at startup; mapCharacter()
// calls it as well so that tests and library users don't have to.
// Throws std::runtime_error on a corrupt table: nothing can be decoded then.
void loadCharsetTables();

// Throws UnmappedCharacter when 'rawCode' has no entry for 'charset'.
uint32_t mapCharacter(Charset charset, uint32_t rawCode);

// Every raw code of 'charset' that has a mapping, in increasing order.
std::vector<uint32_t> charsetCodes(Charset charset);

}
