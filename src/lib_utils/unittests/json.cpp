#include "lib_utils/json.hpp"
#include "tests/tests.hpp"
#include <vector>

using namespace std;

namespace {
bool jsonOk(string text) {
	try {
		json::parse(text);
		return true;
	} catch(exception const &) {
		return false;
	}
}
}

unittest("Json parser: empty") {
	ASSERT(jsonOk("{}"));
	ASSERT(!jsonOk("{"));
	ASSERT(!jsonOk(""));
}

unittest("Json parser: objectValue") {
	ASSERT(jsonOk("{ \"var\": 0 }"));
	ASSERT(jsonOk("{ \"var\": -10 }"));
	ASSERT(jsonOk("{ \"hello\": \"world\" }"));
	ASSERT(jsonOk("{ \"N1\": \"V1\", \"N2\": \"V2\" }"));

	ASSERT(!jsonOk("{ \"N1\" : : \"V2\" }"));
}

unittest("Json parser: duplicate members are rejected") {
	ASSERT(!jsonOk("{ \"zdf\": {}, \"zdf\": {} }"));
}

unittest("Json parser: booleans and null") {
	auto o = json::parse("{ \"strict_links\" : true, \"record_failures\": false, \"extends\": null }");
	ASSERT_EQUALS((int)json::Value::Type::Boolean, (int)o["strict_links"].type);
	ASSERT_EQUALS(true, o["strict_links"].boolValue);
	ASSERT_EQUALS(false, o["record_failures"].boolValue);
	ASSERT_EQUALS((int)json::Value::Type::Null, (int)o["extends"].type);
	ASSERT_EQUALS(std::string("null"), std::string(o["extends"].typeName()));
}

unittest("Json parser: non-zero terminated") {
	ASSERT(!jsonOk("{ \"isCool\" : true } _invalid_json_token_"));
	ASSERT(!jsonOk("{} {}"));
}

unittest("Json parser: arrays") {
	ASSERT(jsonOk("{ \"A\": [] }"));
	ASSERT(jsonOk("{ \"A\": [ { }, { } ] }"));
	ASSERT(jsonOk("{ \"A\": [ \"hello\", \"world\" ] }"));

	ASSERT(!jsonOk("{ \"A\": [ }"));
	ASSERT(!jsonOk("{ \"A\": ] }"));

	auto o = json::parse("{ \"ranges\": [ 32, 127 ] }");
	ASSERT_EQUALS(127, (int)o["ranges"][1]);
	ASSERT_THROWN(o["ranges"][2]);
}

unittest("Json parser: string escapes") {
	auto o = json::parse("{ \"s\": \"a\\\"b\\\\c\\/d\\n\", \"u\": \"K\\u00f6ln \\ud83e\\udf00\" }");
	ASSERT_EQUALS("a\"b\\c/d\n", o["s"].stringValue);
	ASSERT_EQUALS("K\xc3\xb6ln \xf0\x9f\xac\x80", o["u"].stringValue);

	ASSERT(!jsonOk("{ \"s\": \"\\q\" }"));
	ASSERT(!jsonOk("{ \"s\": \"\\ud83e\" }"));
}

unittest("Json parser: returned value") {
	{
		auto o = json::parse("{}");
		ASSERT_EQUALS(0u, o.objectValue.size());
	}
	{
		auto o = json::parse("{ \"N\" : \"hello\"}");
		ASSERT_EQUALS(1u, o.objectValue.size());
		auto s = o.objectValue["N"];
		ASSERT_EQUALS("hello", s.stringValue);
	}
	{
		auto o = json::parse("{ \"N\" : -1234 }");
		ASSERT_EQUALS(1u, o.objectValue.size());
		auto s = o.objectValue["N"];
		ASSERT_EQUALS((int)json::Value::Type::Integer, (int)s.type);
		ASSERT_EQUALS(-1234, s.intValue);
	}
}

unittest("Json value: member access") {
	auto o = json::parse("{ \"version\": 1, \"stations\": { \"ndr\": {} } }");
	ASSERT(o.has("version"));
	ASSERT(!o.has("log"));
	ASSERT_EQUALS(1, (int)o["version"]);
	ASSERT_THROWN(o["log"]);
	ASSERT_THROWN((std::string)o["version"]);
	ASSERT_EQUALS(std::string("ndr"), o["stations"].objectValue.pairs[0].key);
}
