#include "utf8.hpp"
#include "format.hpp"
#include <stdexcept>

void appendUtf8(std::string& out, uint32_t in) {
	if (in >= 0x110000 || (in >= 0xd800 && in <= 0xdfff))
		throw std::runtime_error(format("Invalid Unicode codepoint %x", in));

	if (in < 0x80) {
		out += (char)in;
	} else if (in < 0x800) {
		out += (char)((in >> 6) | 0xc0);
		out += (char)((in & 0x3f) | 0x80);
	} else if (in < 0x10000) {
		out += (char)((in >> 12) | 0xe0);
		out += (char)(((in >> 6) & 0x3f) | 0x80);
		out += (char)((in & 0x3f) | 0x80);
	} else {
		out += (char)((in >> 18) | 0xf0);
		out += (char)(((in >> 12) & 0x3f) | 0x80);
		out += (char)(((in >> 6) & 0x3f) | 0x80);
		out += (char)((in & 0x3f) | 0x80);
	}
}

std::vector<uint32_t> decodeUtf8(const std::string& text) {
	std::vector<uint32_t> r;
	r.reserve(text.size());

	size_t i = 0;
	while (i < text.size()) {
		auto const lead = (uint8_t)text[i];
		uint32_t cp;
		int extra;
		if (lead < 0x80) {
			cp = lead;
			extra = 0;
		} else if ((lead & 0xe0) == 0xc0) {
			cp = lead & 0x1f;
			extra = 1;
		} else if ((lead & 0xf0) == 0xe0) {
			cp = lead & 0x0f;
			extra = 2;
		} else if ((lead & 0xf8) == 0xf0) {
			cp = lead & 0x07;
			extra = 3;
		} else
			throw std::runtime_error(format("Invalid UTF-8 lead byte %x at offset %s", lead, i));

		if (i + extra >= text.size())
			throw std::runtime_error("Truncated UTF-8 sequence");

		for (int k = 1; k <= extra; ++k) {
			auto const cont = (uint8_t)text[i + k];
			if ((cont & 0xc0) != 0x80)
				throw std::runtime_error(format("Invalid UTF-8 continuation byte %x at offset %s", cont, i + k));
			cp = (cp << 6) | (cont & 0x3f);
		}

		static const uint32_t minimum[] = { 0, 0x80, 0x800, 0x10000 };
		if (cp < minimum[extra])
			throw std::runtime_error(format("Overlong UTF-8 sequence at offset %s", i));
		if (cp >= 0x110000 || (cp >= 0xd800 && cp <= 0xdfff))
			throw std::runtime_error(format("Invalid Unicode codepoint %x at offset %s", cp, i));

		r.push_back(cp);
		i += 1 + extra;
	}

	return r;
}

size_t utf8Length(const std::string& text) {
	size_t n = 0;
	for (auto c : text)
		if (((uint8_t)c & 0xc0) != 0x80)
			++n;
	return n;
}
