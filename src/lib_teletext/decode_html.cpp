#include "decoder.hpp"
#include "error.hpp"
#include "font_map.hpp"
#include "row_writer.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/html.hpp"
#include "lib_utils/log.hpp"
#include "lib_utils/utf8.hpp"
#include <cctype>
#include <cstdlib>
#include <cstring>

namespace Teletext {

namespace {

// What an element passes down to its descendants.
struct Context {
	Attribute attr;
	Link link;
	bool mosaic = false;
};

std::string trim(const std::string &s) {
	auto const first = s.find_first_not_of(" \t\r\n");
	if(first == std::string::npos)
		return "";
	auto const last = s.find_last_not_of(" \t\r\n");
	return s.substr(first, last - first + 1);
}

// "c0f0" with prefix "c" yields "0f0". Classes merely starting with the prefix don't qualify.
bool colorClass(const std::string &cls, const char* prefix, const char* allowed, std::string &value) {
	auto const n = strlen(prefix);
	if(cls.size() <= n || cls.compare(0, n, prefix) != 0)
		return false;
	value = cls.substr(n);
	return value.find_first_not_of(allowed) == std::string::npos;
}

Color styleColor(const std::string &value) {
	// "background" may be a shorthand: the color comes first
	auto const v = trim(value);
	auto const color = v.substr(0, v.find(' '));
	if(color == "transparent" || color == "inherit")
		return Color::Unset;
	return colorFromCss(color);
}

bool isFormattingWhitespace(const std::string &text) {
	return text.find('\n') != std::string::npos && text.find_first_not_of(" \t\r\n") == std::string::npos;
}

class HtmlDecoder {
	public:
		HtmlDecoder(const StationConfig &cfg, const FontMap *fontMap)
			: cfg(cfg), fontMap(fontMap), writer(cfg) {
		}

		std::vector<Row> run(const std::string &body) {
			html::Node doc;
			try {
				doc = html::parse(body);
			} catch(std::runtime_error const& e) {
				throw MalformedPayload(std::string("HTML: ") + e.what());
			}

			html::Node const* container = &doc;
			if(!cfg.container.empty()) {
				container = html::findFirst(doc, cfg.container);
				if(!container)
					throw MalformedPayload(format("no element matches '%s'", cfg.container));
			}

			if(cfg.rows == RowMode::Elements) {
				for(auto row : html::findAll(*container, cfg.rowSelector)) {
					writer.beginRow();
					walk(*row, inherit(*row, Context()));
				}
			} else {
				writer.beginRow();
				walk(*container, inherit(*container, Context()));
				writer.dropTrailingEmptyRow();
			}

			return writer.release();
		}

	private:
		Context inherit(const html::Node &elem, Context ctx) {
			for(auto& cls : elem.classes()) {
				std::string value;
				if(cfg.colors == ColorScheme::RgbClasses) {
					if(colorClass(cls, "c", "0123456789abcdefABCDEF", value))
						ctx.attr.fg = colorFromCss(value);
					else if(colorClass(cls, "bc", "0123456789abcdefABCDEF", value))
						ctx.attr.bg = colorFromCss(value);
				} else if(cfg.colors == ColorScheme::IndexClasses) {
					if(colorClass(cls, "f", "0123456789", value))
						ctx.attr.fg = colorFromIndex(atoi(value.c_str()));
					else if(colorClass(cls, "b", "0123456789", value))
						ctx.attr.bg = colorFromIndex(atoi(value.c_str()));
				}

				if(!cfg.mosaicClass.empty() && cls == cfg.mosaicClass)
					ctx.mosaic = true;
				if(!cfg.doubleHeightClass.empty() && cls == cfg.doubleHeightClass)
					ctx.attr = ctx.attr.with(Flag::DoubleHeight);
				if(!cfg.flashClass.empty() && cls == cfg.flashClass)
					ctx.attr = ctx.attr.with(Flag::Flashing);
			}

			if(cfg.colors == ColorScheme::InlineStyle && elem.hasAttribute("style"))
				applyStyle(elem.attribute("style"), ctx.attr);

			if(elem.name == "a" && elem.hasAttribute("href"))
				ctx.link = resolveLink(elem.attribute("href"));

			return ctx;
		}

		void applyStyle(const std::string &style, Attribute &attr) {
			size_t pos = 0;
			while(pos < style.size()) {
				auto end = style.find(';', pos);
				if(end == std::string::npos)
					end = style.size();
				auto const decl = style.substr(pos, end - pos);
				pos = end + 1;

				auto const colon = decl.find(':');
				if(colon == std::string::npos)
					continue;
				auto name = trim(decl.substr(0, colon));
				for(auto& c : name)
					c = (char)tolower((unsigned char)c);
				auto const value = decl.substr(colon + 1);

				if(name == "color")
					attr.fg = styleColor(value);
				else if(name == "background-color" || name == "background")
					attr.bg = styleColor(value);
			}
		}

		Link resolveLink(const std::string &href) {
			try {
				return parseLinkHref(href);
			} catch(InvalidLinkTarget const& e) {
				if(cfg.strictLinks)
					throw;
				g_Log->log(Warning, format("[%s] %s: kept as text", cfg.id, e.what()).c_str());
				return Link();
			}
		}

		void walk(const html::Node &elem, const Context &ctx) {
			for(auto& child : elem.children) {
				if(child.isText()) {
					text(child.text, ctx);
				} else if(child.name == "script" || child.name == "style" || child.name == "head") {
					continue;
				} else if(child.name == "br") {
					if(cfg.rows == RowMode::Lines)
						newLine();
				} else {
					walk(child, inherit(child, ctx));
				}
			}
		}

		void newLine() {
			if(atStart) {
				// a line break right after the opening tag isn't content
				atStart = false;
				return;
			}
			writer.beginRow();
		}

		void text(const std::string &content, const Context &ctx) {
			if(cfg.rows == RowMode::Elements && isFormattingWhitespace(content))
				return;

			std::vector<uint32_t> codes;
			try {
				codes = decodeUtf8(content);
			} catch(std::runtime_error const& e) {
				throw MalformedPayload(std::string("HTML text: ") + e.what());
			}

			for(auto c : codes) {
				if(c == '\r')
					continue;
				if(c == '\n') {
					if(cfg.rows == RowMode::Lines)
						newLine();
					continue;
				}
				atStart = false;
				cell(c == 0xa0 ? ' ' : c, ctx);
			}
		}

		void cell(uint32_t c, const Context &ctx) {
			if(fontMap) {
				FontMap::Cell glyph;
				try {
					glyph = fontMap->lookup(c);
				} catch(UnmappedCharacter const& e) {
					writer.putUnmapped(ctx.attr, ctx.link, e);
					return;
				}
				writer.putCode(ctx.attr, ctx.link, glyph.charset, glyph.code);
			} else if(ctx.mosaic) {
				// line-draw font: G1 positions, the thin variant shifted by 0x80
				if(c >= 0xa0)
					writer.putCode(ctx.attr, ctx.link, Charset::LineDrawing, c - 0x80);
				else if(c == 0x41)
					writer.putCode(ctx.attr, ctx.link, Charset::Mosaic, 0x7f);
				else if(c >= 0x40 && c <= 0x5f)
					writer.putUnmapped(ctx.attr, ctx.link, UnmappedCharacter("mosaic", c));
				else
					writer.putCode(ctx.attr, ctx.link, Charset::Mosaic, c);
			} else if(cfg.mosaicBase && c >= cfg.mosaicBase) {
				// private-use mosaics: sixel bits 0-5, bit 6 selects the thin variant
				auto g1 = c - cfg.mosaicBase;
				if(g1 >= 0x80) {
					writer.putUnmapped(ctx.attr, ctx.link, UnmappedCharacter("mosaic", c));
					return;
				}
				auto charset = Charset::Mosaic;
				if(g1 > 0x40) {
					charset = Charset::LineDrawing;
					g1 -= 0x40;
				}
				auto code = g1 + 0x20;
				if(code >= 0x40 && code <= 0x5f)
					code += 0x20;
				writer.putCode(ctx.attr, ctx.link, charset, code);
			} else {
				writer.put(ctx.attr, ctx.link, c);
			}
		}

		const StationConfig &cfg;
		const FontMap * const fontMap;
		RowWriter writer;
		bool atStart = true;
};

}

std::vector<Row> decodeHtml(const std::string &body, const StationConfig &cfg, const FontMap *fontMap) {
	HtmlDecoder decoder(cfg, fontMap);
	return decoder.run(body);
}

}
