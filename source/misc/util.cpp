// util.cpp
// Copyright (c) 2021, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include <cerrno>
#include <cstdio>

#include "defs.h"

namespace util
{
	std::optional<zst::byte_buffer> readEntireFile(const std::string& path)
	{
		FILE* fd = fopen(path.c_str(), "rb");
		if(fd == nullptr)
			return std::nullopt;

		zst::byte_buffer ret {};

		uint8_t chunk[4096];
		while(true)
		{
			auto n = fread(&chunk[0], 1, sizeof(chunk), fd);
			ret.append(&chunk[0], n);

			if(n < sizeof(chunk))
				break;
		}

		bool failed = ferror(fd) != 0;
		fclose(fd);

		if(failed)
		{
			folio::warn("util", "failed to read '{}': {}", path, strerror(errno));
			return std::nullopt;
		}

		return ret;
	}

	bool writeEntireFile(const std::string& path, zst::byte_span contents)
	{
		FILE* fd = fopen(path.c_str(), "wb");
		if(fd == nullptr)
		{
			folio::warn("util", "failed to open '{}' for writing: {}", path, strerror(errno));
			return false;
		}

		bool ok = fwrite(contents.data(), 1, contents.size(), fd) == contents.size();
		ok &= (fclose(fd) == 0);

		if(not ok)
			folio::warn("util", "failed to write '{}': {}", path, strerror(errno));

		return ok;
	}
}
