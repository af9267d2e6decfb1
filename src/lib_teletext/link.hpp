#pragma once

#include <string>

namespace Teletext {

struct Link {
	int page = 0;    // 100-899, 0 means 'no link'
	int subPage = 0; // 0 when the target doesn't name one

	explicit operator bool() const {
		return page != 0;
	}
	bool operator==(const Link &other) const {
		return page == other.page && subPage == other.subPage;
	}
	bool operator!=(const Link &other) const {
		return !(*this == other);
	}
};

// "101", "101/5", "101_05", "101-5".
// Throws InvalidLinkTarget on anything else or on out-of-range numbers.
Link parseLinkTarget(const std::string &target);

// Resolves a station href: "/101/02", "101_01.htm", "?page=101".
// The query string, surrounding slashes and any .htm/.html suffix are ignored.
Link parseLinkHref(const std::string &href);

}
