// Simplistic standalone JSON-parser

#include "json.hpp"
#include "utf8.hpp"
#include <cstdlib>
#include <stdexcept>

namespace json {
namespace {

struct Token {
	enum Type {
		EOF_ = 0,
		LBRACE,
		RBRACE,
		LBRACKET,
		RBRACKET,
		STRING,
		NUMBER,
		BOOLEAN,
		NULL_,
		COLON,
		COMMA,
	};

	std::string lexem;
	Type type;
};

class Tokenizer {
	public:
		Tokenizer(const char* text_, size_t len) {
			text = text_;
			textEnd = text_ + len;
			decodeToken();
		}

		const Token& front() const {
			return curr;
		}
		bool empty() const {
			return curr.type == Token::EOF_;
		}
		void popFront() {
			decodeToken();
		}

	private:
		void decodeToken() {
			while(whitespace(frontChar()))
				++text;

			curr.lexem = "";
			switch(frontChar()) {
			case '\0':
				curr.type = Token::EOF_;
				break;
			case '[':
				accept();
				curr.type = Token::LBRACKET;
				break;
			case ']':
				accept();
				curr.type = Token::RBRACKET;
				break;
			case '{':
				accept();
				curr.type = Token::LBRACE;
				break;
			case '}':
				accept();
				curr.type = Token::RBRACE;
				break;
			case ':':
				accept();
				curr.type = Token::COLON;
				break;
			case ',':
				accept();
				curr.type = Token::COMMA;
				break;
			case '"':
				++text;
				decodeString();
				curr.type = Token::STRING;
				break;
			case 't':
				curr.type = Token::BOOLEAN;
				expect('t');
				expect('r');
				expect('u');
				expect('e');
				break;
			case 'f':
				curr.type = Token::BOOLEAN;
				expect('f');
				expect('a');
				expect('l');
				expect('s');
				expect('e');
				break;
			case 'n':
				curr.type = Token::NULL_;
				expect('n');
				expect('u');
				expect('l');
				expect('l');
				break;
			case '-': case '0': case '1': case '2':
			case '3': case '4': case '5': case '6':
			case '7': case '8': case '9': {
				curr.type = Token::NUMBER;

				if(frontChar() == '-')
					accept();

				while(isdigit(frontChar()))
					accept();

				break;
			}
			default: {
				std::string msg = "Unknown char '";
				msg += frontChar();
				msg += "'";
				throw std::runtime_error(msg);
			}
			}
		}

		void decodeString() {
			while(frontChar() != '"') {
				if(text >= textEnd)
					throw std::runtime_error("Unterminated string");

				if(frontChar() != '\\') {
					accept();
					continue;
				}

				++text;
				auto const c = frontChar();
				++text;
				switch(c) {
				case '"': curr.lexem += '"'; break;
				case '\\': curr.lexem += '\\'; break;
				case '/': curr.lexem += '/'; break;
				case 'b': curr.lexem += '\b'; break;
				case 'f': curr.lexem += '\f'; break;
				case 'n': curr.lexem += '\n'; break;
				case 'r': curr.lexem += '\r'; break;
				case 't': curr.lexem += '\t'; break;
				case 'u': {
					auto cp = decodeHex4();
					if(cp >= 0xd800 && cp <= 0xdbff) {
						expect('\\');
						expect('u');
						auto const low = decodeHex4();
						if(low < 0xdc00 || low > 0xdfff)
							throw std::runtime_error("Invalid surrogate pair");
						cp = 0x10000 + ((cp - 0xd800) << 10) + (low - 0xdc00);
						curr.lexem.resize(curr.lexem.size() - 2);
					}
					appendUtf8(curr.lexem, cp);
					break;
				}
				default:
					throw std::runtime_error("Invalid escape sequence");
				}
			}
			++text;
		}

		uint32_t decodeHex4() {
			uint32_t r = 0;
			for(int i = 0; i < 4; ++i) {
				auto const c = frontChar();
				++text;
				r <<= 4;
				if(c >= '0' && c <= '9')
					r |= c - '0';
				else if(c >= 'a' && c <= 'f')
					r |= c - 'a' + 10;
				else if(c >= 'A' && c <= 'F')
					r |= c - 'A' + 10;
				else
					throw std::runtime_error("Invalid \\u escape");
			}
			return r;
		}

		void expect(char c) {
			if(frontChar() != c)
				throw std::runtime_error("Unexpected character");

			accept();
		}

		void accept() {
			curr.lexem += frontChar();
			++text;
		}

		char frontChar() const {
			if(text >= textEnd)
				return 0;

			return *text;
		}

		static bool whitespace(char c) {
			return c == ' ' || c == '\n' || c == '\r' || c == '\t';
		}

		const char* text;
		const char* textEnd;
		Token curr;
};

std::string expect(Tokenizer& tk, Token::Type type) {
	auto front = tk.front();

	if(front.type != type) {
		std::string msg;

		if(front.type == Token::EOF_)
			msg += "Unexpected end of file found";
		else {
			msg += "Unexpected token '" + front.lexem + "'";
			msg += " of type " + std::to_string(front.type);
			msg += " instead of " + std::to_string(type);
		}

		throw std::runtime_error(msg);
	}

	auto r = front.lexem;
	tk.popFront();
	return r;
}

Value parseValue(Tokenizer& tk);

Value parseObject(Tokenizer& tk) {
	Value r;
	r.type = Value::Type::Object;
	expect(tk, Token::LBRACE);
	int idx = 0;

	while(tk.front().type != Token::RBRACE) {
		if(idx > 0)
			expect(tk, Token::COMMA);

		auto const name = expect(tk, Token::STRING);
		expect(tk, Token::COLON);
		if(r.objectValue.contains(name))
			throw std::runtime_error("Duplicate member '" + name + "'");
		r.objectValue[name] = parseValue(tk);
		++idx;
	}

	expect(tk, Token::RBRACE);
	return r;
}

Value parseArray(Tokenizer& tk) {
	Value r;
	r.type = Value::Type::Array;
	expect(tk, Token::LBRACKET);
	int idx = 0;

	while(tk.front().type != Token::RBRACKET) {
		if(idx > 0)
			expect(tk, Token::COMMA);

		r.arrayValue.push_back(parseValue(tk));
		++idx;
	}

	expect(tk, Token::RBRACKET);
	return r;
}

Value parseValue(Tokenizer& tk) {
	if(tk.front().type == Token::LBRACKET) {
		return parseArray(tk);
	} else if(tk.front().type == Token::LBRACE) {
		return parseObject(tk);
	} else if(tk.front().type == Token::BOOLEAN) {
		Value r;
		r.type = Value::Type::Boolean;
		r.boolValue = expect(tk, Token::BOOLEAN) == "true";
		return r;
	} else if(tk.front().type == Token::NULL_) {
		expect(tk, Token::NULL_);
		return Value();
	} else if(tk.front().type == Token::NUMBER) {
		Value r;
		r.type = Value::Type::Integer;
		r.intValue = atoi(expect(tk, Token::NUMBER).c_str());
		return r;
	} else {
		Value r;
		r.type = Value::Type::String;
		r.stringValue = expect(tk, Token::STRING);
		return r;
	}
}
} /*anonymous*/

const char* Value::typeName() const {
	switch(type) {
	case Type::Null: return "null";
	case Type::String: return "string";
	case Type::Object: return "object";
	case Type::Array: return "array";
	case Type::Integer: return "integer";
	case Type::Boolean: return "boolean";
	}
	return "unknown";
}

void Value::enforceType(Type expected) const {
	if(type != expected) {
		Value v;
		v.type = expected;
		throw std::runtime_error(std::string("Type error: expected ") + v.typeName() + ", got " + typeName());
	}
}

Value const& Value::operator[] (const char* name) const {
	enforceType(Type::Object);
	auto it = objectValue.find(name);
	if(it == objectValue.end())
		throw std::runtime_error("Member '" + std::string(name) + "' was not found");

	return (*it).value;
}

Value parse(const std::string &s) {
	Tokenizer tokenizer(s.c_str(), s.size());
	auto r = parseObject(tokenizer);
	if(!tokenizer.empty())
		throw std::runtime_error("Trailing characters after JSON object");
	return r;
}
}
