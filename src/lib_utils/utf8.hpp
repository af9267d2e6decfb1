#pragma once

#include <cstdint>
#include <string>
#include <vector>

void appendUtf8(std::string& out, uint32_t codepoint);

// throws on malformed input
std::vector<uint32_t> decodeUtf8(const std::string& text);

// number of codepoints, i.e. the number of cells on a teletext row
size_t utf8Length(const std::string& text);
