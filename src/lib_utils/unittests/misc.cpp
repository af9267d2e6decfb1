#include "tests/tests.hpp"
#include "lib_utils/tools.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/small_map.hpp"
#include "lib_utils/os.hpp"
#include <cstdlib> // setenv

using namespace Tests;

namespace {

enum class Bits {
	None = 0,
	A = 1,
	B = 2,
};

unittest("format: one argument") {
	ASSERT_EQUALS("45", format("%s", 45));
}

unittest("format: one char argument") {
	ASSERT_EQUALS("A", format("%s", 'A'));
}

unittest("format: string argument") {
	std::string s = "Hello";
	ASSERT_EQUALS("Hello, world", format("%s, world", s));
}

unittest("format: several arguments") {
	ASSERT_EQUALS("page 101/2: 38 cells", format("page %s/%s: %s cells", 101, 2, (size_t)38));
}

unittest("format: hexadecimal argument") {
	ASSERT_EQUALS("code 0x7f", format("code %x", 0x7f));
	ASSERT_EQUALS("100%", format("%s%%", 100));
}

unittest("format: vector argument") {
	std::vector<int> v { 1, 2, 3 };
	ASSERT_EQUALS("[1, 2, 3]", format("%s", v));
}

unittest("format: nested vector argument") {
	std::vector<std::vector<int>> v;
	v.resize(3);
	v[1].resize(2);
	v[1][1] = 7;
	v[2].resize(1);
	ASSERT_EQUALS("[[], [0, 7], [0]]", format("%s", v));
}

unittest("flag enums: bit operations") {
	auto const both = Bits::A | Bits::B;
	ASSERT((both & Bits::A) == Bits::A);
	ASSERT((both & Bits::B) == Bits::B);
	ASSERT((Bits::A & Bits::B) == Bits::None);
}

unittest("enforce") {
	enforce(true, "unused");
	ASSERT_THROWN(enforce(false, "failed"));
}

unittest("SmallMap: keeps insertion order") {
	SmallMap<std::string, int> m;
	m["zdf"] = 1;
	m["ndr"] = 2;
	m["zdf"] = 3;
	ASSERT_EQUALS(2u, m.size());
	ASSERT_EQUALS(std::string("zdf"), m.pairs[0].key);
	ASSERT_EQUALS(3, m.pairs[0].value);
	ASSERT(m.contains("ndr"));
	ASSERT(!m.contains("sr"));

	auto const &cm = m;
	ASSERT_EQUALS(2, cm["ndr"]);
	ASSERT_THROWN(cm["sr"]);
}

unittest("os: environment variables") {
	setenv("TTX_TEST_VAR", "101", 1);
	ASSERT_EQUALS("101", getEnvironmentVariable("TTX_TEST_VAR"));
	unsetenv("TTX_TEST_VAR");
	ASSERT_EQUALS("", getEnvironmentVariable("TTX_TEST_VAR"));
}

}
