/*
 * Copyright (C) 2026 The fsparse authors
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License version 2 as
 * published by the Free Software Foundation.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <system_error>
#include <vector>

#include "fsparse/seeker.hpp"

#ifdef __linux__
struct fiemap;
#endif

namespace fsparse
{
	// One allocated range of a file.
	struct table_entry
	{
		uint64_t logic_offset;
		uint64_t logic_size;
	};

	/*
	 * Answers data/hole queries from a table of allocated ranges, the form in
	 * which FS_IOC_FIEMAP and FSCTL_QUERY_ALLOCATED_RANGES describe a file.
	 *
	 * The table is sorted, clipped to `length` and merged on construction.
	 * Queries at or past `length` fail with errc::no_more_data for both kinds,
	 * as lseek() does on Linux.
	 */
	class extent_table_seeker : public seeker
	{
	public:
		extent_table_seeker(std::vector<table_entry> table, uint64_t length);

		uint64_t seek(uint64_t offset, item_kind want, std::error_code &ec) override;
		uint64_t end_offset(std::error_code &ec) override;

		const std::vector<table_entry> &table() const { return entries; }

	private:
		std::vector<table_entry> entries;
		uint64_t                 length;
	};

#ifdef __linux__
	// Reads the data extents of `fd` with FS_IOC_FIEMAP. Unwritten
	// (preallocated) extents read back as zeroes and are left out.
	std::error_code get_fiemap_entries(int fd, std::vector<table_entry> &table);

	// Converts a FS_IOC_FIEMAP answer for `requested` extents. A final extent
	// without FIEMAP_EXTENT_LAST means the file grew extents since it was
	// sized, reported as std::errc::resource_unavailable_try_again.
	std::error_code fiemap_to_table(const ::fiemap &map, size_t requested, std::vector<table_entry> &table);
#endif
}
