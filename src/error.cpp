/*
 * Copyright (C) 2026 The fsparse authors
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License version 2 as
 * published by the Free Software Foundation.
 */

#include <string>

#include "fsparse/error.hpp"

namespace
{
	class fsparse_category : public std::error_category
	{
	public:
		const char *name() const noexcept override
		{
			return "fsparse";
		}

		std::string message(int ev) const override
		{
			switch( static_cast<fsparse::errc>(ev) )
			{
				case fsparse::errc::no_more_data:       return "no more data before end of file";
				case fsparse::errc::unsupported:        return "sparse file queries are not supported";
				case fsparse::errc::protocol_violation: return "data/hole query answered outside the seek contract";
				case fsparse::errc::offset_overflow:    return "offset does not fit in off_t";
			}

			return "unknown fsparse error";
		}
	};
}

const std::error_category &fsparse::category()
{
	static fsparse_category instance;
	return instance;
}

std::error_code fsparse::make_error_code(errc e)
{
	return std::error_code(static_cast<int>(e), category());
}
