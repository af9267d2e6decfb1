#pragma once

#include "page.hpp"
#include "station.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace Teletext {

// One page as handed over by the fetcher.
struct RawPage {
	int page = 0;
	int subPage = 0;       // 0 when the station has no sub-paging
	int64_t timestamp = 0; // capture time, UTC seconds
	std::string body;      // HTML document or JSON object
	std::string fontMap;   // html-with-font-map only
};

// Rows in source order. Throws MalformedPayload, UnmappedCharacter,
// and InvalidLinkTarget when 'cfg.strictLinks' is set.
std::vector<Row> decode(const RawPage &raw, const StationConfig &cfg);

struct FontMap;

std::vector<Row> decodeHtml(const std::string &body, const StationConfig &cfg, const FontMap *fontMap);
std::vector<Row> decodeJson(const std::string &body, const StationConfig &cfg);

}
