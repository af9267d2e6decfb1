#pragma once

#include <memory>
#include <ostream>
#include <queue>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

typedef std::queue<std::string> ArgQueue;

std::string safePop(ArgQueue& args);

void parseValue(int& var, ArgQueue& args);
void parseValue(bool& var, ArgQueue& args);
void parseValue(std::string& var, ArgQueue& args);

// every word up to the next option
void parseValue(std::vector<std::string>& var, ArgQueue& args);

// one element per occurrence of the option
template<typename T>
void parseValue(std::vector<T>& var, ArgQueue& args) {
	T val {};
	parseValue(val, args);
	var.push_back(val);
}

struct CmdLineOptions {
		void addFlag(std::string shortName, std::string longName, bool* pVar, std::string desc="") {
			add(shortName, longName, pVar, desc);
		}

		template<typename T>
		void add(std::string shortName, std::string longName, T* pVar, std::string desc="") {
			auto opt = std::make_unique<TypedOption<T>>();
			opt->pVar = pVar;
			opt->shortName = "-" + shortName;
			opt->longName = "--" + longName;
			opt->desc = desc;
			m_Options.push_back(std::move(opt));
		}

		// returns the words that aren't options
		std::vector<std::string> parse(int argc, const char* argv[]);
		void printHelp(std::ostream& out);

	private:
		struct AbstractOption {
			virtual ~AbstractOption() = default;
			std::string shortName, longName;
			std::string desc;
			virtual void parse(ArgQueue& args) = 0;
		};

		std::vector<std::unique_ptr<AbstractOption>> m_Options;

		template<typename T>
		struct TypedOption : AbstractOption {
			T* pVar;
			void parse(ArgQueue& args) override {
				parseValue(*pVar, args);
			}
		};
};
