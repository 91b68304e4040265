/*
 * Copyright (C) 2026 The fsparse authors
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License version 2 as
 * published by the Free Software Foundation.
 */

#include <linux/fiemap.h>
#include <linux/fs.h>
#include <sys/ioctl.h>
#include <errno.h>
#include <stdint.h>
#include <string.h>

#include "fsparse/extent_table.hpp"

std::error_code fsparse::get_fiemap_entries(int fd, std::vector<table_entry> &table)
{
	table.clear();

	size_t extent_count = 0;

	{
		struct fiemap map;

		memset(&map, 0, sizeof(map));

		map.fm_start        = 0;
		map.fm_length       = FIEMAP_MAX_OFFSET;
		map.fm_flags        = FIEMAP_FLAG_SYNC;
		map.fm_extent_count = 0;

		if ( ioctl(fd, FS_IOC_FIEMAP, &map) == -1 )
		{
			return std::error_code(errno, std::system_category());
		}

		extent_count = map.fm_mapped_extents;
	}

	if ( extent_count == 0 )
	{
		return std::error_code();
	}

	size_t buffer_size = sizeof(struct fiemap) + extent_count * sizeof(struct fiemap_extent);
	std::vector<uint64_t> buffer((buffer_size + sizeof(uint64_t) - 1) / sizeof(uint64_t), 0);

	auto map = reinterpret_cast<struct fiemap *>(buffer.data());

	map->fm_start        = 0;
	map->fm_length       = FIEMAP_MAX_OFFSET;
	map->fm_flags        = FIEMAP_FLAG_SYNC;
	map->fm_extent_count = extent_count;

	if ( ioctl(fd, FS_IOC_FIEMAP, map) == -1 )
	{
		return std::error_code(errno, std::system_category());
	}

	return fiemap_to_table(*map, extent_count, table);
}

std::error_code fsparse::fiemap_to_table(const ::fiemap &map, size_t requested, std::vector<table_entry> &table)
{
	table.clear();

	// file was modified while reading
	if ( map.fm_mapped_extents != requested )
	{
		return std::make_error_code(std::errc::resource_unavailable_try_again);
	}

	for(size_t i = 0; i < requested; ++i)
	{
		auto extent = &map.fm_extents[i];

		bool last = extent->fe_flags & FIEMAP_EXTENT_LAST;

		if ( last and i + 1 != requested )
		{
			table.clear();
			return make_error_code(errc::protocol_violation);
		}

		if ( !last and i + 1 == requested )
		{
			// more extents than requested, the kernel stopped at the limit
			table.clear();
			return std::make_error_code(std::errc::resource_unavailable_try_again);
		}

		// allocated but reads as zeroes, SEEK_DATA reports these as holes
		if ( extent->fe_flags & FIEMAP_EXTENT_UNWRITTEN )
		{
			continue;
		}

		table.push_back({extent->fe_logical, extent->fe_length});
	}

	return std::error_code();
}
