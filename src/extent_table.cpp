/*
 * Copyright (C) 2026 The fsparse authors
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License version 2 as
 * published by the Free Software Foundation.
 */

#include <algorithm>
#include <utility>

#include "fsparse/extent_table.hpp"

namespace
{
	uint64_t entry_end(const fsparse::table_entry &e)
	{
		return e.logic_offset + e.logic_size;
	}

	std::vector<fsparse::table_entry> normalize(std::vector<fsparse::table_entry> table, uint64_t length)
	{
		std::sort(table.begin(), table.end(), [](const fsparse::table_entry &a, const fsparse::table_entry &b)
		{
			return a.logic_offset < b.logic_offset;
		});

		std::vector<fsparse::table_entry> res;

		for(const auto &i: table)
		{
			if ( i.logic_offset >= length or i.logic_size == 0 )
			{
				continue;
			}

			uint64_t end = i.logic_offset + std::min(i.logic_size, length - i.logic_offset);

			if ( !res.empty() and i.logic_offset <= entry_end(res.back()) )
			{
				auto &last = res.back();
				last.logic_size = std::max(entry_end(last), end) - last.logic_offset;
				continue;
			}

			res.push_back({i.logic_offset, end - i.logic_offset});
		}

		return res;
	}
}

fsparse::extent_table_seeker::extent_table_seeker(std::vector<table_entry> table, uint64_t length)
	: entries(normalize(std::move(table), length)),
	  length(length)
{
}

uint64_t fsparse::extent_table_seeker::seek(uint64_t offset, item_kind want, std::error_code &ec)
{
	ec.clear();

	if ( offset >= length )
	{
		ec = errc::no_more_data;
		return 0;
	}

	// first extent ending after offset
	auto it = std::upper_bound(entries.begin(), entries.end(), offset, [](uint64_t off, const table_entry &e)
	{
		return off < entry_end(e);
	});

	if ( want == item_kind::data )
	{
		if ( it == entries.end() )
		{
			ec = errc::no_more_data;
			return 0;
		}

		return std::max(it->logic_offset, offset);
	}

	// entries are merged, so the gap starts where this extent ends
	if ( it == entries.end() or it->logic_offset > offset )
	{
		return offset;
	}

	return entry_end(*it);
}

uint64_t fsparse::extent_table_seeker::end_offset(std::error_code &ec)
{
	ec.clear();
	return length;
}
