/*
 * Copyright (C) 2026 The fsparse authors
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License version 2 as
 * published by the Free Software Foundation.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <system_error>

#include "fsparse/error.hpp"

namespace fsparse
{
	enum class item_kind
	{
		data,
		hole,
	};

	const char *kind_name(item_kind kind);

	/*
	 * Backend answering "where does the next region of a given kind start?".
	 *
	 * seek() returns the absolute offset of the first region of kind `want`
	 * at or after `offset`. When no such region exists before end of file it
	 * sets `ec` to errc::no_more_data. Every other failure is fatal.
	 *
	 * end_offset() returns the current file length.
	 *
	 * Both may change the file position of the underlying descriptor.
	 */
	class seeker
	{
	public:
		virtual ~seeker() {}

		virtual uint64_t seek(uint64_t offset, item_kind want, std::error_code &ec) = 0;
		virtual uint64_t end_offset(std::error_code &ec) = 0;
	};

	/*
	 * Per-platform lseek() capabilities, selected once at compile time.
	 */
	struct platform_caps
	{
		const char *name;
		int         seek_data;                // whence value, -1 when unavailable
		int         seek_hole;
		bool        reliable_first_extent;    // starting inside an extent reports that extent

		bool supported() const { return seek_data >= 0 and seek_hole >= 0; }
	};

	const platform_caps &native_caps();

	// SEEK_DATA/SEEK_HOLE backend over a borrowed descriptor. The descriptor
	// must stay open for the lifetime of the returned object.
	std::unique_ptr<seeker> make_native_seeker(int fd);
}
