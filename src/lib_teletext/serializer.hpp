#pragma once

#include "page.hpp"
#include <istream>
#include <string>
#include <vector>

namespace Teletext {

// Archive lines (NDJSON). Each returned line ends with '\n'.
//   {"scraper":"zdf","timestamp":"2022-01-28T14:13:12"}
//   {"page":100,"sub_page":1,"timestamp":"2022-01-28T14:13:12"}
//   [["wb","ZDFtext "],["yb","Nachrichten",[101,1]], ...]
std::string serialize(const SessionHeader &header);
std::string serialize(const Page &page); // page marker, then one line per row

// One station run as read back from an archive.
struct Snapshot {
	SessionHeader header;
	std::vector<Page> pages; // archive order

	// First page with that number when 'subPage' is 0. Null if absent.
	Page const* findPage(int page, int subPage = 0) const;
};

// Throw MalformedRecord.
SessionHeader deserializeHeader(const std::string &line);
Page deserializePage(const std::string &lines, const std::string &station); // one serialize(Page) output
Snapshot deserialize(std::istream &in);

}
