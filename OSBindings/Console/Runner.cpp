//
//  Runner.cpp
//  Z80Step
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#include "OSBindings/Console/Runner.hpp"

#include <algorithm>
#include <cinttypes>
#include <cstdlib>
#include <iterator>
#include <typeinfo>
#include <utility>

#include "Outputs/Log.hpp"
#include "Reflection/Enum.hpp"
#include "Storage/ImageLoader.hpp"

using namespace Z80Step::Console;

namespace {

using Logger = Z80Step::Log::Logger<Z80Step::Log::Source::Console>;
using Processor = Z80Step::CPU::Processor;
using Register = Z80Step::CPU::Register;

}

bool ParsedArguments::apply(const std::vector<Reflection::Struct *> &reflectables, FILE *errors) const {
	for(const auto &argument: selections) {
		// Replace any dashes with underscores in the argument name.
		std::string property;
		std::transform(argument.first.begin(), argument.first.end(), std::back_inserter(property), [](char c) { return c == '-' ? '_' : c; });

		const auto target = std::find_if(reflectables.begin(), reflectables.end(), [&property](Reflection::Struct *reflectable) {
			return reflectable->type_of(property) != nullptr;
		});
		if(target == reflectables.end()) {
			fprintf(errors, "Unknown option: %s\n", argument.first.c_str());
			return false;
		}

		const bool applied = argument.second.empty() ?
			Reflection::set<bool>(**target, property, true) :
			Reflection::fuzzy_set(**target, property, argument.second);
		if(!applied) {
			fprintf(errors, "Can't apply %s to option %s\n", argument.second.empty() ? "(no value)" : argument.second.c_str(), argument.first.c_str());
			return false;
		}
	}

	return true;
}

ParsedArguments Z80Step::Console::parse_arguments(int argc, const char *const argv[]) {
	ParsedArguments arguments;

	for(int index = 1; index < argc; ++index) {
		const char *arg = argv[index];

		// Accepted format is:
		//
		//	--flag			sets a Boolean option to true.
		//	--flag=value	sets the value for any other option.
		//	name			sets the file name to load.

		// Anything starting with a dash always makes a selection; otherwise it's a file name.
		if(arg[0] == '-') {
			while(*arg == '-') arg++;

			std::string argument = arg;
			std::size_t split_index = argument.find("=");

			if(split_index == std::string::npos) {
				arguments.selections[argument];	// To create an entry with the default empty string.
			} else {
				const std::string name = argument.substr(0, split_index);
				arguments.selections[name] = argument.substr(split_index+1, std::string::npos);
			}
		} else {
			arguments.file_names.push_back(arg);
		}
	}

	return arguments;
}

std::string Z80Step::Console::final_path_component(const std::string &path) {
	// An empty path has no final component.
	if(path.empty()) {
		return "";
	}

	// Find the last slash...
	auto final_slash = path.find_last_of("/\\");

	// If no slash was found at all, return the whole path.
	if(final_slash == std::string::npos) {
		return path;
	}

	// If a slash was found in the final position, remove it and recurse.
	if(final_slash == path.size() - 1) {
		return final_path_component(path.substr(0, path.size() - 1));
	}

	// Otherwise return everything from just after the slash to the end of the path.
	return path.substr(final_slash+1, path.size() - final_slash - 1);
}

void Z80Step::Console::print_usage(FILE *stream, const std::string &program, const std::vector<Reflection::Struct *> &reflectables) {
	fprintf(stream, "Usage: %s [file]", program.c_str());
	for(const auto reflectable: reflectables) {
		for(const auto &key: reflectable->all_keys()) {
			std::string option;
			std::transform(key.begin(), key.end(), std::back_inserter(option), [](char c) { return c == '_' ? '-' : c; });

			const auto values = reflectable->values_for(key);
			if(!values.empty()) {
				std::string list;
				for(const auto &value: values) {
					if(!list.empty()) list += "|";
					list += value;
				}
				fprintf(stream, " [--%s=%s]", option.c_str(), list.c_str());
			} else if(*reflectable->type_of(key) == typeid(bool)) {
				fprintf(stream, " [--%s=yes|no]", option.c_str());
			} else {
				fprintf(stream, " [--%s=N]", option.c_str());
			}
		}
	}
	fprintf(stream, "\n");
}

void Z80Step::Console::dump_registers(FILE *stream, const Processor &processor) {
	const auto print16 = [stream, &processor] (const char *name, Register r) {
		fprintf(stream, "%s = %04Xh\n", name, processor.value_of(r));
	};

	print16("PC", Register::ProgramCounter);
	print16("SP", Register::StackPointer);
	print16("AF", Register::AF);
	print16("BC", Register::BC);
	print16("DE", Register::DE);
	print16("HL", Register::HL);
	print16("AF'", Register::AFDash);
	print16("BC'", Register::BCDash);
	print16("DE'", Register::DEDash);
	print16("HL'", Register::HLDash);
	fprintf(stream, "R = %02Xh\n", processor.value_of(Register::R));
}

int64_t Z80Step::Console::run(Processor &processor, const Options &options, FILE *output) {
	int64_t performed = 0;
	while(
		processor.value_of(Register::ProgramCounter) < processor.memory().size() &&
		!processor.is_halted() &&
		(options.max_instructions <= 0 || performed < options.max_instructions)
	) {
		const uint16_t pc = processor.value_of(Register::ProgramCounter);
		const auto instruction = processor.decode(pc);

		if(options.trace) {
			Log::flush();
			fprintf(output, "\n%04X\t%s\n\n", pc, instruction.mnemonic.c_str());
		}

		processor.step();
		++performed;

		if(options.trace) {
			Log::flush();
			dump_registers(output, processor);
		}

		if(size_t(pc) + size_t(instruction.length) > 0xffff) {
			break;
		}
	}

	return performed;
}

int Z80Step::Console::run_program(int argc, const char *const argv[], FILE *output, FILE *errors) {
	const auto arguments = parse_arguments(argc, argv);
	const std::string program = argc > 0 ? final_path_component(argv[0]) : "z80step";

	Options console_options;
	Processor::Options processor_options;
	const std::vector<Reflection::Struct *> reflectables = {&console_options, &processor_options};

	if(arguments.selections.find("help") != arguments.selections.end()) {
		print_usage(output, program, reflectables);
		return EXIT_SUCCESS;
	}

	if(arguments.file_names.empty()) {
		print_usage(errors, program, reflectables);
		return EXIT_FAILURE;
	}

	if(!arguments.apply(reflectables, errors)) {
		return EXIT_FAILURE;
	}
	Logger::info().append("Console options: %s", console_options.description().c_str());
	Logger::info().append("Processor options: %s", processor_options.description().c_str());

	const auto &file_name = arguments.file_names.front();
	std::vector<uint8_t> image;
	try {
		image = Storage::ImageLoader::load(file_name);
	} catch(Storage::ImageLoader::Error error) {
		switch(error) {
			case Storage::ImageLoader::Error::CantOpen:
				fprintf(errors, "Couldn't open %s\n", file_name.c_str());
			break;
			case Storage::ImageLoader::Error::TooLarge:
				fprintf(errors, "%s is too large; images may be at most %zu bytes\n", file_name.c_str(), Storage::ImageLoader::MaximumSize);
			break;
		}
		return EXIT_FAILURE;
	}

	Processor processor(std::move(image), processor_options);

	// Diagnostic defaults, independent of the program.
	processor.set_value_of(Register::HL, 0xfe00);
	processor.set_value_of(Register::BC, 0x00ff);

	Log::flush();
	fprintf(output, "init\n");
	dump_registers(output, processor);

	run(processor, console_options, output);

	Log::flush();
	fprintf(output, "\nT-states: %" PRId64 "\n", processor.cycles().as_integral());

	if(console_options.memory_dump) {
		fprintf(output, "\nMemory Dump\n\n");
		const auto &memory = processor.memory().data();
		for(size_t address = 0; address < memory.size(); ++address) {
			fprintf(output, "%04zX = %02Xh\n", address, memory[address]);
		}
	}

	return EXIT_SUCCESS;
}
