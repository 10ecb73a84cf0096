//
//  ImageLoader.hpp
//  Z80Step
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Z80Step::Storage {

/*!
	Loads raw, headerless memory images. Images may optionally be gzip compressed.
*/
class ImageLoader {
public:
	enum class Error {
		CantOpen = -1,
		TooLarge = -2,
	};

	/// The largest image that can be loaded; anything larger could not be addressed.
	static constexpr size_t MaximumSize = 65536;

	/*!
		@returns The contents of @c file_name.

		@throws Error::CantOpen if the file cannot be opened or read.
		@throws Error::TooLarge if the file holds more than @c MaximumSize bytes.
	*/
	static std::vector<uint8_t> load(const std::string &file_name);
};

}
