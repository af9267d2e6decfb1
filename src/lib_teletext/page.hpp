#pragma once

#include "attribute.hpp"
#include "link.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace Teletext {

struct Segment {
	Attribute attr;
	std::string text; // UTF-8, one codepoint per cell
	Link link;

	bool operator==(const Segment &other) const {
		return attr == other.attr && text == other.text && link == other.link;
	}
	bool operator!=(const Segment &other) const {
		return !(*this == other);
	}
};

typedef std::vector<Segment> Row;

// Number of cells covered by the row.
size_t rowWidth(const Row &row);

// Merges adjacent segments with equal attribute and link. Drops empty segments.
Row coalesce(const Row &row);

struct Page {
	std::string station;
	int page = 0;
	int subPage = 1;
	int64_t timestamp = 0; // UTC seconds
	std::vector<Row> rows;

	// archive marker for a page that couldn't be converted: no rows then
	std::string error;

	bool operator==(const Page &other) const {
		return station == other.station && page == other.page && subPage == other.subPage
		    && timestamp == other.timestamp && rows == other.rows && error == other.error;
	}
	bool operator!=(const Page &other) const {
		return !(*this == other);
	}
};

struct SessionHeader {
	std::string station;
	int64_t timestamp = 0;

	bool operator==(const SessionHeader &other) const {
		return station == other.station && timestamp == other.timestamp;
	}
};

}
