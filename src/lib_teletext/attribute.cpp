#include "attribute.hpp"
#include "error.hpp"
#include "lib_utils/tools.hpp" // Flag bit operations
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace Teletext {

namespace {
char const colorCodes[] = { 'b', 'r', 'g', 'y', 'l', 'm', 'c', 'w', '_' };

struct FlagCode {
	Flag flag;
	char code;
};

FlagCode const flagCodes[] = {
	{ Flag::DoubleHeight, 'D' },
	{ Flag::Flashing, 'F' },
	{ Flag::Concealed, 'C' },
	{ Flag::Graphics, 'G' },
};

struct NamedColor {
	const char* name;
	Color color;
};

NamedColor const namedColors[] = {
	{ "black", Color::Black },
	{ "red", Color::Red },
	{ "lime", Color::Green },
	{ "green", Color::Green },
	{ "yellow", Color::Yellow },
	{ "blue", Color::Blue },
	{ "magenta", Color::Magenta },
	{ "fuchsia", Color::Magenta },
	{ "cyan", Color::Cyan },
	{ "aqua", Color::Cyan },
	{ "white", Color::White },
};

Color colorFromRgb(bool r, bool g, bool b) {
	return colorFromIndex((r ? 1 : 0) | (g ? 2 : 0) | (b ? 4 : 0));
}
}

char colorCode(Color color) {
	return colorCodes[(int)color];
}

Color parseColorCode(char code) {
	for(int i = 0; i <= (int)Color::Unset; ++i)
		if(colorCodes[i] == code)
			return (Color)i;
	throw std::runtime_error(std::string("Unknown color code '") + code + "'");
}

Color colorFromIndex(int index) {
	if(index < 0 || index > 7)
		throw MalformedPayload("color index " + std::to_string(index) + " is out of the teletext palette");
	// red=1, green=2, blue=4: the palette order is the RGB bit order
	static const Color palette[] = {
		Color::Black, Color::Red, Color::Green, Color::Yellow,
		Color::Blue, Color::Magenta, Color::Cyan, Color::White,
	};
	return palette[index];
}

Color colorFromCss(const std::string &value) {
	std::string s;
	for(auto c : value)
		if(!isspace((unsigned char)c))
			s += (char)tolower((unsigned char)c);

	for(auto& named : namedColors)
		if(s == named.name)
			return named.color;

	if(!s.empty() && s[0] == '#')
		s = s.substr(1);

	if((s.size() != 3 && s.size() != 6) || s.find_first_not_of("0123456789abcdef") != std::string::npos)
		throw MalformedPayload("can't convert color value '" + value + "'");

	auto const rgb = strtoul(s.c_str(), nullptr, 16);
	if(s.size() == 3)
		return colorFromRgb(((rgb >> 8) & 0xf) > 5, ((rgb >> 4) & 0xf) > 5, (rgb & 0xf) > 5);
	return colorFromRgb(((rgb >> 16) & 0xff) > 0x50, ((rgb >> 8) & 0xff) > 0x50, (rgb & 0xff) > 0x50);
}

bool Attribute::has(Flag flag) const {
	return (flags & flag) != Flag::None;
}

Attribute Attribute::with(Flag flag) const {
	auto r = *this;
	r.flags = r.flags | flag;
	return r;
}

std::string Attribute::code() const {
	std::string r;
	r += colorCode(fg);
	r += colorCode(bg);
	if(charsetMarker)
		r += (char)('0' + charsetMarker);
	for(auto& f : flagCodes)
		if(has(f.flag))
			r += f.code;
	return r;
}

Attribute Attribute::parse(const std::string &code) {
	if(code.size() < 2)
		throw std::runtime_error("Invalid attribute code '" + code + "'");

	Attribute r;
	r.fg = parseColorCode(code[0]);
	r.bg = parseColorCode(code[1]);

	size_t i = 2;
	if(i < code.size() && isdigit((unsigned char)code[i])) {
		r.charsetMarker = code[i] - '0';
		if(r.charsetMarker == 0)
			throw std::runtime_error("Invalid attribute code '" + code + "': explicit default charset");
		++i;
	}

	// flags must come in canonical order, each at most once
	int nextFlag = 0;
	for(; i < code.size(); ++i) {
		auto const n = (int)(sizeof flagCodes / sizeof *flagCodes);
		while(nextFlag < n && flagCodes[nextFlag].code != code[i])
			++nextFlag;
		if(nextFlag == n)
			throw std::runtime_error("Invalid attribute code '" + code + "'");
		r.flags = r.flags | flagCodes[nextFlag].flag;
		++nextFlag;
	}

	return r;
}

}
