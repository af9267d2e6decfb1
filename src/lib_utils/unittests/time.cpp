#include "tests/tests.hpp"
#include "lib_utils/time.hpp"

unittest("time: parseDate") {
	ASSERT_EQUALS(0, parseDate("1970-01-01T00:00:00"));
	ASSERT_EQUALS(3600 + 60 + 1, parseDate("1970-01-01T01:01:01"));
	ASSERT_EQUALS(951782400, parseDate("2000-02-29T00:00:00"));
	ASSERT_EQUALS(1643379192, parseDate("2022-01-28T14:13:12"));

	ASSERT_THROWN(parseDate(""));
	ASSERT_THROWN(parseDate("1970-01-01"));
	ASSERT_THROWN(parseDate("1970-01-01T00:00:00Z"));
	ASSERT_THROWN(parseDate("1970-01-01T00:00:00.000"));
	ASSERT_THROWN(parseDate("1970-01-01 00:00:00"));
	ASSERT_THROWN(parseDate("19700-01-01T02:00:00"));
	ASSERT_THROWN(parseDate("1970-13-01T02:00:00"));
	ASSERT_THROWN(parseDate("1970-01-01T24:00:00"));
}

unittest("time: formatDate") {
	ASSERT_EQUALS("1970-01-01T00:00:00", formatDate(0));
	ASSERT_EQUALS("2022-01-28T14:13:12", formatDate(1643379192));
	ASSERT_EQUALS(1643379192, parseDate(formatDate(1643379192)));
}
