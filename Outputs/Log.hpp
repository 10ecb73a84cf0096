//
//  Log.hpp
//  Z80Step
//
//  Created by Thomas Harte on 18/06/2018.
//  Copyright © 2018 Thomas Harte. All rights reserved.
//

#pragma once

#include <cstdio>
#include <cstdarg>
#include <cstring>
#include <string>

namespace Z80Step::Log {
// I prefer C files to C++ streams, so output here is via fprintf.

enum class Source {
	Console,
	ImageLoader,
	Memory,
	Processor,
};

enum class EnabledLevel {
	None,				// No logged statements are presented.
	Errors,				// The error stream is presented, but not the info stream.
	ErrorsAndInfo,		// All streams are presented.
};

constexpr EnabledLevel enabled_level(const Source source) {
#ifdef NDEBUG
	return EnabledLevel::None;
#endif

	// Allow for compile-time source-level enabling and disabling of different sources.
	switch(source) {
		default:
			return EnabledLevel::ErrorsAndInfo;

		case Source::Memory:
			return EnabledLevel::Errors;
	}
}

constexpr const char *prefix(const Source source) {
	switch(source) {
		case Source::Console:		return "Console";
		case Source::ImageLoader:	return "Image loader";
		case Source::Memory:		return "Memory";
		case Source::Processor:		return "Z80";
	}

	return nullptr;
}

template <Source source, bool enabled>
struct LogLine;

struct RepeatAccumulator {
	std::string last;
	Source source;

	size_t count = 0;
	FILE *stream = nullptr;

	/// Outputs whatever line is currently being held back, annotated with its repeat count if it is greater than one.
	void flush() {
		if(last.empty()) return;

		const char *const unadorned_prefix = prefix(source);
		std::string full_prefix;
		if(unadorned_prefix) {
			full_prefix = "[";
			full_prefix += unadorned_prefix;
			full_prefix += "] ";
		}

		if(count > 1) {
			fprintf(
				stream,
				"%s%s [* %zu]\n",
					full_prefix.c_str(),
					last.c_str(),
					count
			);
		} else {
			fprintf(
				stream,
				"%s%s\n",
					full_prefix.c_str(),
					last.c_str()
			);
		}
		last.clear();
		count = 0;
	}

	~RepeatAccumulator() {
		flush();
	}
};

struct AccumulatingLog {
	inline static thread_local RepeatAccumulator accumulator_;
};

/// Outputs any line currently held back for repeat counting; use before writing to a logged stream directly.
inline void flush() {
	AccumulatingLog::accumulator_.flush();
}

template <Source source>
struct LogLine<source, true>: private AccumulatingLog {
public:
	explicit LogLine(FILE *const stream) noexcept :
		stream_(stream) {}

	~LogLine() {
		if(output_ == accumulator_.last && source == accumulator_.source && stream_ == accumulator_.stream) {
			++accumulator_.count;
			return;
		}

		accumulator_.flush();
		accumulator_.count = 1;
		accumulator_.last = output_;
		accumulator_.source = source;
		accumulator_.stream = stream_;
	}

	template <size_t size, typename... Args>
	auto &append(const char (&format)[size], Args... args) {
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat"
#pragma GCC diagnostic ignored "-Wformat-security"
		const auto append_size = std::snprintf(nullptr, 0, format, args...);
		const auto end = output_.size();
		output_.resize(output_.size() + size_t(append_size) + 1);
		std::snprintf(output_.data() + end, size_t(append_size) + 1, format, args...);
		output_.pop_back();
#pragma GCC diagnostic pop
		return *this;
	}

	template <size_t size, typename... Args>
	auto &append_if(const bool condition, const char (&format)[size], Args... args) {
		if(!condition) return *this;
		return append(format, args...);
	}

private:
	FILE *stream_;
	std::string output_;
};

template <Source source>
struct LogLine<source, false> {
	explicit LogLine(FILE *) noexcept {}

	template <size_t size, typename... Args>
	auto &append(const char (&)[size], Args...) { return *this; }

	template <size_t size, typename... Args>
	auto &append_if(bool, const char (&)[size], Args...) { return *this; }
};

template <Source source>
class Logger {
public:
	static constexpr bool InfoEnabled = enabled_level(source) == EnabledLevel::ErrorsAndInfo;
	static constexpr bool ErrorsEnabled = enabled_level(source) >= EnabledLevel::Errors;

	static auto info()	{	return LogLine<source, InfoEnabled>(stdout);	}
	static auto error()	{	return LogLine<source, ErrorsEnabled>(stderr);	}
};

}
