#include "assembler.hpp"
#include "error.hpp"
#include "lib_utils/format.hpp"

namespace Teletext {

Page assemble(const StationConfig &cfg, int page, int subPage, std::vector<Row> rows, int64_t timestamp) {
	if(page < 100 || page > 899)
		throw MalformedPayload(format("page number %s is out of range", page));
	if(subPage < 0)
		throw MalformedPayload(format("page %s: invalid sub-page %s", page, subPage));

	if(rows.empty())
		throw IncompletePage(format("page %s/%s has no row", page, subPage));
	if(cfg.rowCount && (int)rows.size() < cfg.rowCount)
		throw IncompletePage(format("page %s/%s has %s rows, expected %s", page, subPage, rows.size(), cfg.rowCount));

	Page r;
	r.station = cfg.id;
	r.page = page;
	r.subPage = subPage ? subPage : 1;
	r.timestamp = timestamp;

	for(auto& row : rows) {
		auto merged = coalesce(row);
		if(cfg.rowWidth) {
			auto const width = rowWidth(merged);
			if(width != (size_t)cfg.rowWidth)
				throw MalformedPayload(format("page %s/%s row %s is %s cells wide, expected %s",
				        page, r.subPage, r.rows.size(), width, cfg.rowWidth));
		}
		r.rows.push_back(std::move(merged));
	}

	return r;
}

}
