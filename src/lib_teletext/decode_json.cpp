#include "decoder.hpp"
#include "error.hpp"
#include "row_writer.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/utf8.hpp"
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <cstdlib>

namespace Teletext {

namespace {

rapidjson::Value const& member(rapidjson::Value const &obj, const char* name, const std::string &where) {
	if(!obj.IsObject())
		throw MalformedPayload(where + ": expected an object");
	auto it = obj.FindMember(name);
	if(it == obj.MemberEnd())
		throw MalformedPayload(where + ": missing \"" + name + "\"");
	return it->value;
}

bool optionalFlag(rapidjson::Value const &col, const char* name, const std::string &where) {
	auto it = col.FindMember(name);
	if(it == col.MemberEnd() || it->value.IsNull())
		return false;
	if(it->value.IsBool())
		return it->value.GetBool();
	if(it->value.IsInt())
		return it->value.GetInt() != 0;
	throw MalformedPayload(where + ": \"" + name + "\" must be a boolean");
}

Color optionalColor(rapidjson::Value const &col, const char* name, const std::string &where) {
	auto it = col.FindMember(name);
	if(it == col.MemberEnd() || it->value.IsNull())
		return Color::Unset;
	if(!it->value.IsString())
		throw MalformedPayload(where + ": \"" + name + "\" must be a string");
	return colorFromCss(it->value.GetString());
}

// G1 code as a decimal number or string
uint32_t graphicCode(rapidjson::Value const &value, const std::string &where) {
	if(value.IsUint())
		return value.GetUint();
	if(value.IsString() && value.GetStringLength() > 0) {
		char* end = nullptr;
		auto const code = strtoul(value.GetString(), &end, 10);
		if(*end == '\0')
			return (uint32_t)code;
	}
	throw MalformedPayload(where + ": invalid graphic code");
}

}

std::vector<Row> decodeJson(const std::string &body, const StationConfig &cfg) {
	rapidjson::Document doc;
	doc.Parse(body.c_str(), body.size());
	if(doc.HasParseError())
		throw MalformedPayload(format("JSON error at offset %s: %s", doc.GetErrorOffset(), rapidjson::GetParseError_En(doc.GetParseError())));

	auto const &rows = member(member(doc, "content", "page"), "row", "content");
	if(!rows.IsArray())
		throw MalformedPayload("content: \"row\" must be an array");

	RowWriter writer(cfg);
	for(rapidjson::SizeType r = 0; r < rows.Size(); ++r) {
		auto const rowName = format("row %s", r);
		auto const &columns = member(rows[r], "columns", rowName);
		if(!columns.IsArray())
			throw MalformedPayload(rowName + ": \"columns\" must be an array");

		writer.beginRow();
		for(rapidjson::SizeType c = 0; c < columns.Size(); ++c) {
			auto const where = format("row %s column %s", r, c);
			auto const &col = columns[c];
			auto const &value = member(col, "value", where);

			Attribute attr;
			attr.fg = optionalColor(col, "font", where);
			attr.bg = optionalColor(col, "background", where);
			if(optionalFlag(col, "doubleheight", where))
				attr = attr.with(Flag::DoubleHeight);
			if(optionalFlag(col, "flash", where))
				attr = attr.with(Flag::Flashing);
			if(optionalFlag(col, "conceal", where))
				attr = attr.with(Flag::Concealed);

			if(optionalFlag(col, "graphic", where)) {
				writer.putCode(attr, Link(), Charset::Mosaic, graphicCode(value, where));
				continue;
			}

			if(!value.IsString())
				throw MalformedPayload(where + ": \"value\" must be a string");

			std::vector<uint32_t> chars;
			try {
				chars = decodeUtf8(std::string(value.GetString(), value.GetStringLength()));
			} catch(std::runtime_error const& e) {
				throw MalformedPayload(where + ": " + e.what());
			}
			if(chars.size() != 1)
				throw MalformedPayload(where + ": a cell holds exactly one character");

			writer.put(attr, Link(), chars[0] == 0xa0 ? ' ' : chars[0]);
		}
	}

	return writer.release();
}

}
