#include "row_writer.hpp"
#include "error.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/log.hpp"
#include "lib_utils/tools.hpp" // enforce
#include "lib_utils/utf8.hpp"

namespace Teletext {

void RowWriter::beginRow() {
	rows.emplace_back();
}

void RowWriter::put(const Attribute &attr, const Link &link, uint32_t codepoint) {
	enforce(!rows.empty(), "RowWriter: no row was started");
	auto &row = rows.back();
	if(row.empty() || row.back().attr != attr || row.back().link != link)
		row.push_back({ attr, "", link });
	appendUtf8(row.back().text, codepoint);
}

void RowWriter::putCode(Attribute attr, const Link &link, Charset charset, uint32_t code) {
	attr.charsetMarker = charsetMarker(charset);
	if(charset == Charset::Mosaic)
		attr = attr.with(Flag::Graphics);

	try {
		put(attr, link, mapCharacter(charset, code));
	} catch(UnmappedCharacter const& e) {
		putUnmapped(attr, link, e);
	}
}

void RowWriter::putUnmapped(const Attribute &attr, const Link &link, const UnmappedCharacter &e) {
	if(cfg.unmapped == UnmappedPolicy::Abort)
		throw e;

	g_Log->log(Warning, format("[%s] row %s: %s, using placeholder", cfg.id, rows.size(), e.what()).c_str());
	put(attr, link, cfg.placeholder);
}

void RowWriter::dropTrailingEmptyRow() {
	if(!rows.empty() && rows.back().empty())
		rows.pop_back();
}

std::vector<Row> RowWriter::release() {
	return std::move(rows);
}

}
