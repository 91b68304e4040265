/*
 * Copyright (C) 2026 The fsparse authors
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License version 2 as
 * published by the Free Software Foundation.
 */

#include <algorithm>

#include "fsparse/sparse_iter.hpp"

const char *fsparse::kind_name(item_kind kind)
{
	return kind == item_kind::data ? "DATA" : "HOLE";
}

bool fsparse::operator==(const sparse_item &a, const sparse_item &b)
{
	return a.kind == b.kind and a.offset == b.offset;
}

bool fsparse::operator!=(const sparse_item &a, const sparse_item &b)
{
	return !(a == b);
}

bool fsparse::operator==(const sparse_range_item &a, const sparse_range_item &b)
{
	return a.kind == b.kind and a.start == b.start and a.end == b.end;
}

bool fsparse::operator!=(const sparse_range_item &a, const sparse_range_item &b)
{
	return !(a == b);
}

fsparse::sparse_iter::sparse_iter(seeker &backend, uint64_t start)
	: backend(&backend),
	  offset(start),
	  pending(0),
	  st(state::seeking_data),
	  first(true)
{
}

bool fsparse::sparse_iter::next(sparse_item &item, std::error_code &ec)
{
	ec.clear();

	switch( st )
	{
		case state::seeking_data:
			return step_data(item, ec);

		case state::seeking_hole:
			return step_hole(item, ec);

		case state::pending_data:
			item   = sparse_item{item_kind::data, pending};
			offset = pending;
			st     = state::seeking_hole;
			return true;

		case state::at_end:
			item = sparse_item{item_kind::hole, pending};
			st   = state::done;
			return true;

		case state::done:
		case state::failed:
			break;
	}

	return false;
}

bool fsparse::sparse_iter::fail(std::error_code &ec, std::error_code cause)
{
	st = state::failed;
	ec = cause;
	return false;
}

bool fsparse::sparse_iter::step_data(sparse_item &item, std::error_code &ec)
{
	bool first_step = first;
	first = false;

	std::error_code seek_ec;
	uint64_t pos = backend->seek(offset, item_kind::data, seek_ec);

	if ( seek_ec == errc::no_more_data )
	{
		// hole from offset up to the end of the file
		uint64_t length = backend->end_offset(ec);
		if ( ec )
		{
			return fail(ec, ec);
		}

		if ( first_step )
		{
			if ( offset >= length )
			{
				st = state::done;
				return false;
			}

			item    = sparse_item{item_kind::hole, offset};
			pending = length;
			st      = state::at_end;
			return true;
		}

		// the hole at offset was already reported, close it
		item = sparse_item{item_kind::hole, std::max(length, offset)};
		st   = state::done;
		return true;
	}

	if ( seek_ec )
	{
		return fail(ec, seek_ec);
	}

	if ( pos < offset )
	{
		return fail(ec, errc::protocol_violation);
	}

	if ( first_step and pos > offset )
	{
		// the file starts with a hole
		item    = sparse_item{item_kind::hole, offset};
		pending = pos;
		st      = state::pending_data;
		return true;
	}

	item   = sparse_item{item_kind::data, pos};
	offset = pos;
	st     = state::seeking_hole;
	return true;
}

bool fsparse::sparse_iter::step_hole(sparse_item &item, std::error_code &ec)
{
	std::error_code seek_ec;
	uint64_t pos = backend->seek(offset, item_kind::hole, seek_ec);

	if ( seek_ec and seek_ec != errc::no_more_data )
	{
		return fail(ec, seek_ec);
	}

	uint64_t length = backend->end_offset(ec);
	if ( ec )
	{
		return fail(ec, ec);
	}

	if ( seek_ec )
	{
		// there is always the virtual hole at end of file, unless the file
		// was truncated below offset since the data query
		if ( offset < length )
		{
			return fail(ec, errc::protocol_violation);
		}

		item = sparse_item{item_kind::hole, offset};
		st   = state::done;
		return true;
	}

	if ( pos < offset )
	{
		return fail(ec, errc::protocol_violation);
	}

	if ( pos >= length )
	{
		// the file may have shrunk since the seek
		item = sparse_item{item_kind::hole, std::max(offset, length)};
		st   = state::done;
		return true;
	}

	// data at offset must be at least one byte long
	if ( pos == offset )
	{
		return fail(ec, errc::protocol_violation);
	}

	item   = sparse_item{item_kind::hole, pos};
	offset = pos;
	st     = state::seeking_data;
	return true;
}

fsparse::sparse_range_iter::sparse_range_iter(const sparse_iter &points)
	: inner(points),
	  prev(),
	  has_prev(false),
	  done(false)
{
}

bool fsparse::sparse_range_iter::next(sparse_range_item &range, std::error_code &ec)
{
	ec.clear();

	if ( done )
	{
		return false;
	}

	sparse_item cur;
	while( inner.next(cur, ec) )
	{
		if ( has_prev and cur.offset > prev.offset )
		{
			range = sparse_range_item{prev.kind, prev.offset, cur.offset};
			prev  = cur;
			return true;
		}

		// first point, or an empty region left by a concurrent change
		prev     = cur;
		has_prev = true;
	}

	done = true;
	return false;
}
