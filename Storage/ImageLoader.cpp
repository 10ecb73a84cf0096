//
//  ImageLoader.cpp
//  Z80Step
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#include "Storage/ImageLoader.hpp"

#include "Outputs/Log.hpp"

#include <zlib.h>

using namespace Z80Step::Storage;

namespace {

using Logger = Z80Step::Log::Logger<Z80Step::Log::Source::ImageLoader>;

struct GZFile {
	gzFile file;

	explicit GZFile(const std::string &file_name) : file(gzopen(file_name.c_str(), "rb")) {}
	~GZFile() {
		if(file) gzclose(file);
	}

	GZFile(const GZFile &) = delete;
	GZFile &operator =(const GZFile &) = delete;
};

}

std::vector<uint8_t> ImageLoader::load(const std::string &file_name) {
	GZFile image(file_name);
	if(!image.file) {
		Logger::error().append("Couldn't open %s", file_name.c_str());
		throw Error::CantOpen;
	}

	// Read one byte beyond the maximum, to be able to spot an oversized image.
	std::vector<uint8_t> contents(MaximumSize + 1);
	size_t size = 0;
	while(size < contents.size()) {
		const int bytes_read = gzread(image.file, &contents[size], unsigned(contents.size() - size));
		if(bytes_read < 0) {
			Logger::error().append("Couldn't read %s", file_name.c_str());
			throw Error::CantOpen;
		}
		if(!bytes_read) break;
		size += size_t(bytes_read);
	}

	if(size > MaximumSize) {
		Logger::error().append("%s is larger than %zu bytes", file_name.c_str(), MaximumSize);
		throw Error::TooLarge;
	}

	contents.resize(size);
	Logger::info().append("Loaded %zu bytes from %s", size, file_name.c_str());
	return contents;
}
