#include "serializer.hpp"
#include "error.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/time.hpp"
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <sstream>
#include <utility>

namespace Teletext {

namespace {
typedef rapidjson::Writer<rapidjson::StringBuffer> Writer;

void writeString(Writer &w, const std::string &s) {
	w.String(s.c_str(), (rapidjson::SizeType)s.size());
}

std::string toLine(const rapidjson::StringBuffer &buffer) {
	return std::string(buffer.GetString(), buffer.GetSize()) + "\n";
}

void writeLink(Writer &w, const Link &link) {
	if(link.subPage) {
		w.StartArray();
		w.Int(link.page);
		w.Int(link.subPage);
		w.EndArray();
	} else {
		w.Int(link.page);
	}
}

std::string serializeRow(const Row &row) {
	rapidjson::StringBuffer buffer;
	Writer w(buffer);
	w.StartArray();
	for(auto& seg : row) {
		w.StartArray();
		writeString(w, seg.attr.code());
		writeString(w, seg.text);
		if(seg.link)
			writeLink(w, seg.link);
		w.EndArray();
	}
	w.EndArray();
	return toLine(buffer);
}

////////////////////////////////////////
// reading

void parseLine(rapidjson::Document &doc, const std::string &line, int lineNumber) {
	doc.Parse(line.c_str(), line.size());
	if(doc.HasParseError())
		throw MalformedRecord(format("line %s: %s (offset %s)", lineNumber, rapidjson::GetParseError_En(doc.GetParseError()), doc.GetErrorOffset()));
}

std::string getString(const rapidjson::Value &obj, const char* name, int lineNumber) {
	auto it = obj.FindMember(name);
	if(it == obj.MemberEnd() || !it->value.IsString())
		throw MalformedRecord(format("line %s: missing string \"%s\"", lineNumber, name));
	return std::string(it->value.GetString(), it->value.GetStringLength());
}

int getInt(const rapidjson::Value &obj, const char* name, int lineNumber) {
	auto it = obj.FindMember(name);
	if(it == obj.MemberEnd() || !it->value.IsInt())
		throw MalformedRecord(format("line %s: missing integer \"%s\"", lineNumber, name));
	return it->value.GetInt();
}

int64_t getTimestamp(const rapidjson::Value &obj, int lineNumber) {
	auto const s = getString(obj, "timestamp", lineNumber);
	try {
		return parseDate(s);
	} catch(std::runtime_error const& e) {
		throw MalformedRecord(format("line %s: %s", lineNumber, e.what()));
	}
}

bool isLink(const rapidjson::Value &v) {
	return v.IsInt() || v.IsArray();
}

Link readLink(const rapidjson::Value &v, int lineNumber) {
	Link link;
	if(v.IsInt()) {
		link.page = v.GetInt();
	} else if(v.IsArray() && v.Size() == 2 && v[0].IsInt() && v[1].IsInt()) {
		link.page = v[0].GetInt();
		link.subPage = v[1].GetInt();
		if(link.subPage < 1)
			throw MalformedRecord(format("line %s: invalid link sub-page %s", lineNumber, link.subPage));
	} else if(v.IsArray() && v.Size() == 1 && v[0].IsInt()) {
		link.page = v[0].GetInt();
	} else {
		throw MalformedRecord(format("line %s: invalid link", lineNumber));
	}
	if(link.page < 100 || link.page > 899)
		throw MalformedRecord(format("line %s: link to page %s", lineNumber, link.page));
	return link;
}

Segment readSegment(const rapidjson::Value &v, int lineNumber) {
	if(!v.IsArray() || v.Size() < 2 || v.Size() > 3 || !v[0].IsString())
		throw MalformedRecord(format("line %s: a segment is [code, text] or [code, text, link]", lineNumber));

	Segment seg;
	try {
		seg.attr = Attribute::parse(v[0].GetString());
	} catch(std::runtime_error const& e) {
		throw MalformedRecord(format("line %s: %s", lineNumber, e.what()));
	}

	rapidjson::Value const* text = &v[1];
	if(v.Size() == 3) {
		// older archives put the link before the text
		rapidjson::Value const* link = &v[2];
		if(isLink(v[1]) && v[2].IsString())
			std::swap(text, link);
		seg.link = readLink(*link, lineNumber);
	}

	if(!text->IsString())
		throw MalformedRecord(format("line %s: segment text must be a string", lineNumber));
	seg.text.assign(text->GetString(), text->GetStringLength());
	return seg;
}

Row readRow(const rapidjson::Value &v, int lineNumber) {
	Row row;
	for(rapidjson::SizeType i = 0; i < v.Size(); ++i)
		row.push_back(readSegment(v[i], lineNumber));
	return row;
}

// Reads archive lines, one record at a time.
class Reader {
	public:
		Reader(std::istream &in) : in(in) {
		}

		// false at the end of the stream
		bool next(rapidjson::Document &doc) {
			std::string line;
			while(std::getline(in, line)) {
				++lineNumber;
				if(!line.empty() && line.back() == '\r')
					line.pop_back();
				if(line.empty())
					continue;
				parseLine(doc, line, lineNumber);
				return true;
			}
			return false;
		}

		int lineNumber = 0;

	private:
		std::istream &in;
};

// Pages of the stream, including an optional header which is returned separately.
std::vector<Page> readPages(Reader &reader, const std::string &station, SessionHeader *header) {
	std::vector<Page> pages;
	rapidjson::Document doc;
	while(reader.next(doc)) {
		auto const n = reader.lineNumber;
		if(doc.IsObject() && doc.HasMember("scraper")) {
			if(!header || !pages.empty() || !header->station.empty())
				throw MalformedRecord(format("line %s: unexpected session header", n));
			header->station = getString(doc, "scraper", n);
			header->timestamp = getTimestamp(doc, n);
		} else if(doc.IsObject()) {
			if(header && header->station.empty())
				throw MalformedRecord(format("line %s: page before the session header", n));
			Page page;
			page.station = header ? header->station : station;
			page.page = getInt(doc, "page", n);
			page.subPage = getInt(doc, "sub_page", n);
			page.timestamp = getTimestamp(doc, n);
			if(doc.HasMember("error"))
				page.error = getString(doc, "error", n);
			pages.push_back(std::move(page));
		} else if(doc.IsArray()) {
			if(pages.empty())
				throw MalformedRecord(format("line %s: row before any page marker", n));
			if(!pages.back().error.empty())
				throw MalformedRecord(format("line %s: row of a failed page", n));
			pages.back().rows.push_back(readRow(doc, n));
		} else {
			throw MalformedRecord(format("line %s: unexpected JSON value", n));
		}
	}
	return pages;
}
}

std::string serialize(const SessionHeader &header) {
	rapidjson::StringBuffer buffer;
	Writer w(buffer);
	w.StartObject();
	w.Key("scraper");
	writeString(w, header.station);
	w.Key("timestamp");
	writeString(w, formatDate(header.timestamp));
	w.EndObject();
	return toLine(buffer);
}

std::string serialize(const Page &page) {
	rapidjson::StringBuffer buffer;
	Writer w(buffer);
	w.StartObject();
	w.Key("page");
	w.Int(page.page);
	w.Key("sub_page");
	w.Int(page.subPage);
	w.Key("timestamp");
	writeString(w, formatDate(page.timestamp));
	if(!page.error.empty()) {
		w.Key("error");
		writeString(w, page.error);
	}
	w.EndObject();

	auto r = toLine(buffer);
	for(auto& row : page.rows)
		r += serializeRow(row);
	return r;
}

Page const* Snapshot::findPage(int page, int subPage) const {
	for(auto& p : pages)
		if(p.page == page && (!subPage || p.subPage == subPage))
			return &p;
	return nullptr;
}

SessionHeader deserializeHeader(const std::string &line) {
	rapidjson::Document doc;
	parseLine(doc, line, 1);
	if(!doc.IsObject())
		throw MalformedRecord("line 1: the session header is an object");
	SessionHeader r;
	r.station = getString(doc, "scraper", 1);
	r.timestamp = getTimestamp(doc, 1);
	return r;
}

Page deserializePage(const std::string &lines, const std::string &station) {
	std::istringstream in(lines);
	Reader reader(in);
	auto pages = readPages(reader, station, nullptr);
	if(pages.size() != 1)
		throw MalformedRecord(format("expected one page, got %s", pages.size()));
	return pages[0];
}

Snapshot deserialize(std::istream &in) {
	Reader reader(in);
	Snapshot r;
	r.pages = readPages(reader, "", &r.header);
	if(r.header.station.empty())
		throw MalformedRecord("missing session header");
	return r;
}

}
