#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace Teletext {

// Page-level failure: a station run reports it and moves on to the next page.
// Anything not derived from Error aborts the run.
class Error : public std::runtime_error {
	public:
		Error(const std::string &msg) : std::runtime_error(msg) {
		}
		virtual const char* kind() const = 0;
};

class UnmappedCharacter : public Error {
	public:
		UnmappedCharacter(const std::string &charset, uint32_t code);
		const char* kind() const override {
			return "UnmappedCharacter";
		}

		const std::string charset;
		const uint32_t code;
};

class MalformedPayload : public Error {
	public:
		MalformedPayload(const std::string &msg) : Error(msg) {
		}
		const char* kind() const override {
			return "MalformedPayload";
		}
};

class InvalidLinkTarget : public Error {
	public:
		InvalidLinkTarget(const std::string &target) : Error("invalid link target '" + target + "'"), target(target) {
		}
		const char* kind() const override {
			return "InvalidLinkTarget";
		}

		const std::string target;
};

class IncompletePage : public Error {
	public:
		IncompletePage(const std::string &msg) : Error(msg) {
		}
		const char* kind() const override {
			return "IncompletePage";
		}
};

// an archived line that can't be read back
class MalformedRecord : public Error {
	public:
		MalformedRecord(const std::string &msg) : Error(msg) {
		}
		const char* kind() const override {
			return "MalformedRecord";
		}
};

}
