#include "font_map.hpp"
#include "error.hpp"
#include "lib_utils/json.hpp"
#include <cstdlib>

namespace Teletext {

namespace {
uint32_t parseCode(json::Value const &v, const char* name) {
	if(v.type == json::Value::Type::Integer && v.intValue >= 0)
		return v.intValue;

	if(v.type == json::Value::Type::String && !v.stringValue.empty()) {
		char* end = nullptr;
		auto const code = strtoul(v.stringValue.c_str(), &end, 0);
		if(*end == '\0' && code <= 0x10ffff)
			return (uint32_t)code;
	}

	throw MalformedPayload(std::string("font map: invalid \"") + name + "\" value");
}
}

FontMap::Cell FontMap::lookup(uint32_t glyph) const {
	for(auto& range : ranges)
		if(glyph >= range.from && glyph <= range.to)
			return { range.charset, range.base + (glyph - range.from) };
	throw UnmappedCharacter("font map", glyph);
}

FontMap parseFontMap(const std::string &jsonText) {
	FontMap r;
	try {
		auto const doc = json::parse(jsonText);
		for(auto& desc : doc["ranges"].arrayValue) {
			FontMap::Range range {};
			int found = 0;
			for(auto const &prop : desc.objectValue) {
				if(prop.key == "from") {
					range.from = parseCode(prop.value, "from");
				} else if(prop.key == "to") {
					range.to = parseCode(prop.value, "to");
				} else if(prop.key == "base") {
					range.base = parseCode(prop.value, "base");
				} else if(prop.key == "charset") {
					range.charset = parseCharset(prop.value);
				} else {
					throw MalformedPayload("font map: unknown member: " + prop.key);
				}
				++found;
			}
			if(found != 4)
				throw MalformedPayload("font map: a range needs \"from\", \"to\", \"charset\" and \"base\"");
			if(range.to < range.from)
				throw MalformedPayload("font map: empty range");
			r.ranges.push_back(range);
		}
	} catch(MalformedPayload const&) {
		throw;
	} catch(std::runtime_error const& e) {
		// syntax and type errors of the reader
		throw MalformedPayload(std::string("font map: ") + e.what());
	}

	if(r.ranges.empty())
		throw MalformedPayload("font map: no range");

	return r;
}

}
