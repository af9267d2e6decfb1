#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace Teletext {

// Source format families. The set is closed: decode() switches on it.
enum class Format {
	Html,        // inline styling: ZDF, NDR, SR
	HtmlFontMap, // glyph positions resolved through the station's web font map: 3sat
	Json,        // pre-structured cells: n-tv
};

enum class RowMode {
	Elements, // one row per element matching 'rowSelector'
	Lines,    // newline-separated text of the container
};

enum class ColorScheme {
	RgbClasses,   // "c<hex>" foreground, "bc<hex>" background
	IndexClasses, // "f<n>" foreground, "b<n>" background, n = palette index
	InlineStyle,  // style="color:..;background-color:.."
};

enum class UnmappedPolicy {
	Abort,      // the page fails with UnmappedCharacter
	Substitute, // log and insert 'placeholder'
};

struct StationConfig {
	std::string id;
	Format format = Format::Html;

	// HTML families
	std::string container; // selector of the page body, whole document when empty
	RowMode rows = RowMode::Elements;
	std::string rowSelector = "div.row";
	ColorScheme colors = ColorScheme::RgbClasses;
	std::string mosaicClass;   // elements whose characters are G1 codes
	uint32_t mosaicBase = 0;   // private-use base of G1 characters, 0 = none
	std::string doubleHeightClass;
	std::string flashClass;

	// validation, 0 = unchecked
	int rowWidth = 0;
	int rowCount = 0;

	UnmappedPolicy unmapped = UnmappedPolicy::Abort;
	uint32_t placeholder = 0xfffd;
	bool strictLinks = false;    // InvalidLinkTarget fails the page instead of degrading to text
	bool recordFailures = false; // write an error marker for failed pages
};

const char* formatName(Format format);
Format parseFormat(const std::string &name); // throws std::runtime_error

// Built-in profiles: "zdf", "zdf-info", "zdf-neo", "ndr", "sr", "ntv", "3sat".
bool isBuiltinStation(const std::string &name);
StationConfig builtinStation(const std::string &name); // throws std::runtime_error
std::vector<std::string> builtinStationNames();

// Reads the JSON configuration file contents and applies its "log" section.
// Throws std::runtime_error on unknown members or bad values.
std::vector<StationConfig> parseConfig(const std::string &jsonText);

}
