//
//  Memory.hpp
//  Z80Step
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace Z80Step::CPU {

/*!
	A flat, all-RAM address space the size of the loaded image.

	Addresses are reduced modulo 65536. Reads beyond the end of the image return 0xff,
	as if from an undriven data bus; writes beyond the end are discarded. Both are logged.
*/
class Memory {
public:
	explicit Memory(std::vector<uint8_t> image);

	uint8_t read(uint16_t address) const;
	void write(uint16_t address, uint8_t value);

	/// @returns The little-endian word at @c address, wrapping from 0xffff to 0x0000 for the high byte.
	uint16_t read_word(uint16_t address) const;
	void write_word(uint16_t address, uint16_t value);

	/// @returns The number of bytes of memory actually present.
	size_t size() const {
		return memory_.size();
	}

	const std::vector<uint8_t> &data() const {
		return memory_;
	}

	/// Copies up to @c length bytes from @c data to memory, starting at @c start_address and stopping at the end of memory.
	void set_data_at_address(size_t start_address, size_t length, const uint8_t *data);

	/// Copies up to @c length bytes from memory to @c data, starting at @c start_address and stopping at the end of memory.
	/// @returns The number of bytes copied.
	size_t get_data_at_address(size_t start_address, size_t length, uint8_t *data) const;

private:
	std::vector<uint8_t> memory_;
};

}
