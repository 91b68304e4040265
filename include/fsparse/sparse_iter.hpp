/*
 * Copyright (C) 2026 The fsparse authors
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License version 2 as
 * published by the Free Software Foundation.
 */

#pragma once

#include <cstdint>
#include <system_error>

#include "fsparse/seeker.hpp"

/*
 * Iteration over the data and holes of a file.
 *
 * A hole is a range the filesystem reports as zero filled. It need not be a
 * range that was never written: some filesystems (zfsonlinux 0.8.4 at least)
 * turn written zero blocks into holes.
 *
 * File position
 *
 *   The native backend is lseek() based and moves the descriptor's file
 *   position. Read with pread() at the returned offsets. Mixing read(),
 *   write() or lseek() on the same descriptor with iteration gives platform
 *   dependent results.
 *
 * Concurrent writes
 *
 *   A write can turn a hole into data after the iterator went past it, and a
 *   truncation can end the file before the iterator gets there. Iteration
 *   stays well formed (offsets never decrease, nothing is reported twice) but
 *   the layout may not match any single state of the file.
 *
 * Portability
 *
 *   - openzfs needs zfs_dmu_offset_next_sync=1 for accurate hole reporting.
 *   - APFS does not report the extent containing the start offset. Start at
 *     offset 0 or at an offset previously returned by an iterator.
 *   - Filesystems without hole support report the whole file as data. This
 *     is not an error.
 *   - On Windows only files marked sparse report holes. That backend answers
 *     from a table of allocated ranges, see extent_table.hpp.
 */

namespace fsparse
{
	// A transition: from `offset` on the file is of `kind`.
	struct sparse_item
	{
		item_kind kind;
		uint64_t  offset;
	};

	// The half open range [start, end).
	struct sparse_range_item
	{
		item_kind kind;
		uint64_t  start;
		uint64_t  end;

		uint64_t size() const { return end - start; }
	};

	bool operator==(const sparse_item &a, const sparse_item &b);
	bool operator!=(const sparse_item &a, const sparse_item &b);
	bool operator==(const sparse_range_item &a, const sparse_range_item &b);
	bool operator!=(const sparse_range_item &a, const sparse_range_item &b);

	/*
	 * Yields the transition points of a file starting at `start`.
	 *
	 * The first point is at `start`. Points alternate between data and hole,
	 * and a non empty scan ends with a hole point at the file length (the
	 * virtual hole at end of file). That final point may follow another hole
	 * point when the file ends in a hole. An empty file, or a start at or past
	 * the end, yields nothing.
	 *
	 * next() returns true with a point, false with `ec` cleared when the scan
	 * is over, or false with `ec` set once on error. After that it keeps
	 * returning false without touching the backend.
	 *
	 * The backend is borrowed and nothing is queried before the first next().
	 */
	class sparse_iter
	{
	public:
		explicit sparse_iter(seeker &backend, uint64_t start = 0);

		bool next(sparse_item &item, std::error_code &ec);

	private:
		enum class state
		{
			seeking_data,
			seeking_hole,
			pending_data,
			at_end,
			done,
			failed,
		};

		bool step_data(sparse_item &item, std::error_code &ec);
		bool step_hole(sparse_item &item, std::error_code &ec);
		bool fail(std::error_code &ec, std::error_code cause);

		seeker   *backend;
		uint64_t  offset;
		uint64_t  pending;
		state     st;
		bool      first;
	};

	/*
	 * Pairs consecutive points of a sparse_iter into ranges.
	 *
	 * On an unmodified file the ranges are non empty, contiguous, alternate in
	 * kind and cover [start, length).
	 */
	class sparse_range_iter
	{
	public:
		explicit sparse_range_iter(const sparse_iter &points);

		bool next(sparse_range_item &range, std::error_code &ec);

	private:
		sparse_iter inner;
		sparse_item prev;
		bool        has_prev;
		bool        done;
	};
}
