//
//  Runner.hpp
//  Z80Step
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#pragma once

#include <cstdint>
#include <cstdio>
#include <map>
#include <string>
#include <vector>

#include "Processors/Z80/Processor.hpp"
#include "Reflection/Struct.hpp"

namespace Z80Step::Console {

/// Options that affect only what the console front end prints and for how long it runs.
struct Options: public Reflection::StructImpl<Options> {
	bool trace = true;
	bool memory_dump = true;
	int64_t max_instructions = 0;	// 0 = no limit.

	Options() {
		if(needs_declare()) {
			DeclareField(trace);
			DeclareField(memory_dump);
			DeclareField(max_instructions);
		}
	}
};

struct ParsedArguments {
	std::vector<std::string> file_names;
	std::map<std::string, std::string> selections;	// The empty string will be inserted for arguments without an = suffix.

	/// Applies all selections to whichever of @c reflectables declares them, reporting failures to @c errors.
	/// @returns @c false if any selection could not be applied.
	bool apply(const std::vector<Reflection::Struct *> &reflectables, FILE *errors) const;
};

/*! Parses an argc/argv pair to discern program arguments. */
ParsedArguments parse_arguments(int argc, const char *const argv[]);

std::string final_path_component(const std::string &path);

void print_usage(FILE *stream, const std::string &program, const std::vector<Reflection::Struct *> &reflectables);
void dump_registers(FILE *stream, const CPU::Processor &processor);

/*!
	Steps @c processor until its program counter leaves the loaded image, it halts or the
	instruction limit in @c options is reached. An instruction that extends beyond 0xffff
	also ends the run, since the program counter cannot pass the end of a 64kb image.

	@returns The number of steps performed.
*/
int64_t run(CPU::Processor &processor, const Options &options, FILE *output);

/*!
	The whole console front end: parses @c argv, loads the named image, runs it and prints
	the trace, T-state total and memory dump to @c output. Usage and failures go to @c errors.

	@returns @c EXIT_SUCCESS or @c EXIT_FAILURE.
*/
int run_program(int argc, const char *const argv[], FILE *output, FILE *errors);

}
