#pragma once

#include <string>

namespace Teletext {

// Teletext palette, in the order of the spacing attribute codes 0-7.
enum class Color {
	Black,
	Red,
	Green,
	Yellow,
	Blue,
	Magenta,
	Cyan,
	White,
	Unset,
};

// 'b', 'r', 'g', 'y', 'l', 'm', 'c', 'w', or '_' for Unset
char colorCode(Color color);
Color parseColorCode(char code); // throws std::runtime_error

// Palette index 0-7. Throws MalformedPayload otherwise.
Color colorFromIndex(int index);

// "#rgb", "#rrggbb" (leading '#' optional) or a CSS color name.
// Each channel is thresholded to on/off. Throws MalformedPayload.
Color colorFromCss(const std::string &value);

enum class Flag {
	None = 0,
	DoubleHeight = 1,
	Flashing = 2,
	Concealed = 4,
	Graphics = 8,
};

struct Attribute {
	Color fg = Color::Unset;
	Color bg = Color::Unset;
	int charsetMarker = 0; // 0-9
	Flag flags = Flag::None;

	bool has(Flag flag) const;
	Attribute with(Flag flag) const;

	// Two letters for plain attributes, e.g. "wb" for white on black.
	// Followed, when set, by the charset marker digit then the flag letters "DFCG".
	std::string code() const;
	static Attribute parse(const std::string &code); // throws std::runtime_error

	bool operator==(const Attribute &other) const {
		return fg == other.fg && bg == other.bg && charsetMarker == other.charsetMarker && flags == other.flags;
	}
	bool operator!=(const Attribute &other) const {
		return !(*this == other);
	}
};

}
