#include "station.hpp"
#include "lib_utils/json.hpp"
#include "lib_utils/log.hpp"
#include "lib_utils/utf8.hpp"
#include <stdexcept>

namespace Teletext {

namespace {
auto const JSON_VERSION = 1;

struct FormatName {
	Format format;
	const char* name;
};

FormatName const formatNames[] = {
	{ Format::Html, "html" },
	{ Format::HtmlFontMap, "html-with-font-map" },
	{ Format::Json, "json" },
};

StationConfig zdf(const char* id) {
	StationConfig cfg;
	cfg.id = id;
	cfg.format = Format::Html;
	cfg.container = "#content";
	cfg.rows = RowMode::Elements;
	cfg.rowSelector = "div.row";
	cfg.colors = ColorScheme::RgbClasses;
	cfg.mosaicClass = "teletextlinedrawregular";
	cfg.rowWidth = 40;
	return cfg;
}

StationConfig ndr() {
	StationConfig cfg;
	cfg.id = "ndr";
	cfg.format = Format::Html;
	cfg.container = "pre.txt";
	cfg.rows = RowMode::Lines;
	cfg.colors = ColorScheme::IndexClasses;
	cfg.mosaicBase = 0xe000;
	cfg.rowWidth = 40;
	return cfg;
}

StationConfig sr() {
	StationConfig cfg;
	cfg.id = "sr";
	cfg.format = Format::Html;
	cfg.container = "pre.saartext_page";
	cfg.rows = RowMode::Lines;
	cfg.colors = ColorScheme::InlineStyle;
	cfg.rowWidth = 40;
	return cfg;
}

StationConfig ntv() {
	StationConfig cfg;
	cfg.id = "ntv";
	cfg.format = Format::Json;
	cfg.rowWidth = 40;
	return cfg;
}

StationConfig sat3() {
	StationConfig cfg;
	cfg.id = "3sat";
	cfg.format = Format::HtmlFontMap;
	cfg.container = "#content";
	cfg.rows = RowMode::Elements;
	cfg.rowSelector = "div.row";
	cfg.colors = ColorScheme::InlineStyle;
	cfg.rowWidth = 38;
	return cfg;
}

std::vector<StationConfig> builtins() {
	return {
		zdf("zdf"),
		zdf("zdf-info"),
		zdf("zdf-neo"),
		ndr(),
		sr(),
		ntv(),
		sat3(),
	};
}

RowMode parseRowMode(const std::string &s) {
	if(s == "elements")
		return RowMode::Elements;
	if(s == "lines")
		return RowMode::Lines;
	throw std::runtime_error("Unknown row mode '" + s + "', expected 'elements' or 'lines'");
}

ColorScheme parseColorScheme(const std::string &s) {
	if(s == "rgb-classes")
		return ColorScheme::RgbClasses;
	if(s == "index-classes")
		return ColorScheme::IndexClasses;
	if(s == "inline-style")
		return ColorScheme::InlineStyle;
	throw std::runtime_error("Unknown color scheme '" + s + "'");
}

UnmappedPolicy parseUnmappedPolicy(const std::string &s) {
	if(s == "abort")
		return UnmappedPolicy::Abort;
	if(s == "substitute")
		return UnmappedPolicy::Substitute;
	throw std::runtime_error("Unknown unmapped character policy '" + s + "', expected 'abort' or 'substitute'");
}

std::string const& stringMember(const std::string &station, SmallMap<std::string, json::Value>::Pair const &prop) {
	if(prop.value.type != json::Value::Type::String)
		throw std::runtime_error("Station '" + station + "': \"" + prop.key + "\" must be a string, got " + prop.value.typeName());
	return prop.value.stringValue;
}

int intMember(const std::string &station, SmallMap<std::string, json::Value>::Pair const &prop) {
	if(prop.value.type != json::Value::Type::Integer || prop.value.intValue < 0)
		throw std::runtime_error("Station '" + station + "': \"" + prop.key + "\" must be a non-negative integer");
	return prop.value.intValue;
}

bool boolMember(const std::string &station, SmallMap<std::string, json::Value>::Pair const &prop) {
	if(prop.value.type != json::Value::Type::Boolean)
		throw std::runtime_error("Station '" + station + "': \"" + prop.key + "\" must be a boolean, got " + prop.value.typeName());
	return prop.value.boolValue;
}

StationConfig parseStation(const std::string &id, json::Value const &desc) {
	if(desc.type != json::Value::Type::Object)
		throw std::runtime_error("Station '" + id + "': expected an object, got " + desc.typeName());

	// the base profile is resolved first: members override it whatever their order
	StationConfig cfg;
	if(desc.has("extends")) {
		cfg = builtinStation(desc["extends"]);
	} else if(isBuiltinStation(id)) {
		cfg = builtinStation(id);
	} else if(!desc.has("type")) {
		throw std::runtime_error("Station '" + id + "': missing \"type\" (or \"extends\")");
	}
	cfg.id = id;

	for (auto const &prop : desc.objectValue) {
		if (prop.key == "extends") {
			// already applied
		} else if (prop.key == "type") {
			cfg.format = parseFormat(stringMember(id, prop));
		} else if (prop.key == "container") {
			cfg.container = stringMember(id, prop);
		} else if (prop.key == "rows") {
			cfg.rows = parseRowMode(stringMember(id, prop));
		} else if (prop.key == "row_selector") {
			cfg.rowSelector = stringMember(id, prop);
		} else if (prop.key == "colors") {
			cfg.colors = parseColorScheme(stringMember(id, prop));
		} else if (prop.key == "mosaic_class") {
			cfg.mosaicClass = stringMember(id, prop);
		} else if (prop.key == "mosaic_base") {
			cfg.mosaicBase = intMember(id, prop);
		} else if (prop.key == "double_height_class") {
			cfg.doubleHeightClass = stringMember(id, prop);
		} else if (prop.key == "flash_class") {
			cfg.flashClass = stringMember(id, prop);
		} else if (prop.key == "row_width") {
			cfg.rowWidth = intMember(id, prop);
		} else if (prop.key == "row_count") {
			cfg.rowCount = intMember(id, prop);
		} else if (prop.key == "unmapped") {
			cfg.unmapped = parseUnmappedPolicy(stringMember(id, prop));
		} else if (prop.key == "placeholder") {
			auto const glyph = decodeUtf8(stringMember(id, prop));
			if(glyph.size() != 1)
				throw std::runtime_error("Station '" + id + "': \"placeholder\" must be a single character");
			cfg.placeholder = glyph[0];
		} else if (prop.key == "strict_links") {
			cfg.strictLinks = boolMember(id, prop);
		} else if (prop.key == "record_failures") {
			cfg.recordFailures = boolMember(id, prop);
		} else {
			auto const err = "Station '" + id + "': unknown member: " + prop.key;
			throw std::runtime_error(err.c_str());
		}
	}

	if(cfg.format != Format::Json && cfg.rows == RowMode::Elements && cfg.rowSelector.empty())
		throw std::runtime_error("Station '" + id + "': \"row_selector\" is required when rows are elements");

	return cfg;
}

void setLogConsole(SmallMap<std::string, json::Value> const& params) {
	bool color = false;

	for (auto const &prop : params) {
		if (prop.key == "color") {
			color = prop.value.boolValue;
		} else {
			auto const err = std::string("\"console log config\" unknown member: ") + prop.key;
			throw std::runtime_error(err.c_str());
		}
	}

	setGlobalLogConsole(color);
}

void setLogSyslog(SmallMap<std::string, json::Value> const& params) {
	std::string ident = "ttxarchive";
	std::string channelName;

	for (auto const &prop : params) {
		if (prop.key == "ident") {
			ident = prop.value.stringValue;
		} else if (prop.key == "channel_name") {
			channelName = prop.value.stringValue;
		} else {
			auto const err = std::string("\"syslog log config\" unknown member: ") + prop.key;
			throw std::runtime_error(err.c_str());
		}
	}

	setGlobalLogSyslog(ident.c_str(), channelName.c_str());
}

void setLogCSV(SmallMap<std::string, json::Value> const& params) {
	std::string path;

	for (auto const &prop : params) {
		if (prop.key == "path") {
			path = prop.value.stringValue;
		} else {
			auto const err = std::string("\"CSV log config\" unknown member: ") + prop.key;
			throw std::runtime_error(err.c_str());
		}
	}

	if (path.empty())
		throw std::runtime_error("\"CSV log config\" requires a \"path\"");

	setGlobalLogCSV(path.c_str());
}

void setLogConfig(const std::string &logType, Level logLevel, SmallMap<std::string, json::Value> const &params) {
	if (logType == "console")
		setLogConsole(params);
	else if (logType == "syslog")
		setLogSyslog(params);
	else if (logType == "csv")
		setLogCSV(params);
	else
		throw std::runtime_error("Unknown log type '" + logType + "'");

	setGlobalLogLevel(logLevel);
}
}

const char* formatName(Format format) {
	for(auto& f : formatNames)
		if(f.format == format)
			return f.name;
	throw std::runtime_error("Unknown format");
}

Format parseFormat(const std::string &name) {
	for(auto& f : formatNames)
		if(name == f.name)
			return f.format;
	throw std::runtime_error("Unknown station type '" + name + "', expected 'html', 'html-with-font-map' or 'json'");
}

bool isBuiltinStation(const std::string &name) {
	for(auto& cfg : builtins())
		if(cfg.id == name)
			return true;
	return false;
}

StationConfig builtinStation(const std::string &name) {
	for(auto& cfg : builtins())
		if(cfg.id == name)
			return cfg;
	throw std::runtime_error("Unknown station profile '" + name + "'");
}

std::vector<std::string> builtinStationNames() {
	std::vector<std::string> r;
	for(auto& cfg : builtins())
		r.push_back(cfg.id);
	return r;
}

std::vector<StationConfig> parseConfig(const std::string &jsonText) {
	auto json = json::parse(jsonText);

	if (!json.has("version"))
		throw std::runtime_error("Config: missing \"version\"");

	auto const &version = json["version"].intValue;
	if (version != JSON_VERSION) {
		auto const err = std::string("Config version is ") + std::to_string(version) + ", expected " + std::to_string(JSON_VERSION);
		throw std::runtime_error(err.c_str());
	}

	for (auto const &prop : json.objectValue) {
		if (prop.key != "version" && prop.key != "log" && prop.key != "stations") {
			auto const err = std::string("Config: unknown member: ") + prop.key;
			throw std::runtime_error(err.c_str());
		}
	}

	if (json.has("log")) {
		std::string logType = "console";
		Level logLevel = Info;
		SmallMap<std::string, json::Value> logConfig;

		auto &log = json["log"];
		for (auto const &prop : log.objectValue) {
			if (prop.key == "type") {
				logType = prop.value.stringValue;
			} else if (prop.key == "level") {
				logLevel = parseLogLevel(prop.value.stringValue.c_str());
			} else if (prop.key == "config") {
				logConfig = prop.value.objectValue;
			} else {
				auto const err = std::string("\"log\" unknown member: ") + prop.key;
				throw std::runtime_error(err.c_str());
			}
		}

		setLogConfig(logType, logLevel, logConfig);
	}

	if (!json.has("stations"))
		throw std::runtime_error("Config: missing \"stations\"");

	std::vector<StationConfig> stations;
	auto &desc = json["stations"];
	desc.enforceType(json::Value::Type::Object);
	for (auto const &station : desc.objectValue)
		stations.push_back(parseStation(station.key, station.value));

	if (stations.empty())
		throw std::runtime_error("Config: no station");

	return stations;
}

}
