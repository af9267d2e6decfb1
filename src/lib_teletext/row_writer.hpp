#pragma once

// Internal to the decoders.

#include "charset.hpp"
#include "page.hpp"
#include "station.hpp"
#include <vector>

namespace Teletext {

class UnmappedCharacter;

// Accumulates decoded cells into rows. Consecutive cells sharing
// attribute and link extend the same segment.
class RowWriter {
	public:
		RowWriter(const StationConfig &cfg) : cfg(cfg) {
		}

		void beginRow();

		// 'codepoint' is already Unicode
		void put(const Attribute &attr, const Link &link, uint32_t codepoint);

		// Maps 'code' through 'charset'. The cell carries the charset marker,
		// mosaic cells the graphics flag.
		void putCode(Attribute attr, const Link &link, Charset charset, uint32_t code);

		// Applies the station policy to a character that couldn't be mapped:
		// rethrows 'e', or logs it and writes the placeholder.
		void putUnmapped(const Attribute &attr, const Link &link, const UnmappedCharacter &e);

		void dropTrailingEmptyRow();

		std::vector<Row> release();

	private:
		const StationConfig &cfg;
		std::vector<Row> rows;
};

}
