#include "decoder.hpp"
#include "error.hpp"
#include "font_map.hpp"

namespace Teletext {

std::vector<Row> decode(const RawPage &raw, const StationConfig &cfg) {
	switch(cfg.format) {
	case Format::Html:
		return decodeHtml(raw.body, cfg, nullptr);
	case Format::HtmlFontMap: {
		if(raw.fontMap.empty())
			throw MalformedPayload("missing font map");
		auto const fontMap = parseFontMap(raw.fontMap);
		return decodeHtml(raw.body, cfg, &fontMap);
	}
	case Format::Json:
		return decodeJson(raw.body, cfg);
	}
	throw std::runtime_error("Unknown station format");
}

}
