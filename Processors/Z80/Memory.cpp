//
//  Memory.cpp
//  Z80Step
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#include "Processors/Z80/Memory.hpp"

#include "Outputs/Log.hpp"

#include <algorithm>
#include <utility>

using namespace Z80Step::CPU;

namespace {
using Logger = Z80Step::Log::Logger<Z80Step::Log::Source::Memory>;
}

Memory::Memory(std::vector<uint8_t> image) : memory_(std::move(image)) {}

uint8_t Memory::read(uint16_t address) const {
	if(address >= memory_.size()) {
		Logger::error().append("Read from %04x beyond end of memory", address);
		return 0xff;
	}
	return memory_[address];
}

void Memory::write(uint16_t address, uint8_t value) {
	if(address >= memory_.size()) {
		Logger::error().append("Write of %02x to %04x beyond end of memory discarded", value, address);
		return;
	}
	memory_[address] = value;
}

uint16_t Memory::read_word(uint16_t address) const {
	return uint16_t(read(address) | (read(uint16_t(address + 1)) << 8));
}

void Memory::write_word(uint16_t address, uint16_t value) {
	write(address, uint8_t(value));
	write(uint16_t(address + 1), uint8_t(value >> 8));
}

void Memory::set_data_at_address(size_t start_address, size_t length, const uint8_t *data) {
	if(start_address >= memory_.size()) return;
	const size_t end_address = std::min(start_address + length, memory_.size());
	std::copy_n(data, end_address - start_address, &memory_[start_address]);
}

size_t Memory::get_data_at_address(size_t start_address, size_t length, uint8_t *data) const {
	if(start_address >= memory_.size()) return 0;
	const size_t end_address = std::min(start_address + length, memory_.size());
	std::copy_n(&memory_[start_address], end_address - start_address, data);
	return end_address - start_address;
}
