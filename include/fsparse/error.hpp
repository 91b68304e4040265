/*
 * Copyright (C) 2026 The fsparse authors
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License version 2 as
 * published by the Free Software Foundation.
 */

#pragma once

#include <system_error>

namespace fsparse
{
	// Conditions raised by the library itself. Errors coming from the OS are
	// carried as std::system_category() codes.
	enum class errc
	{
		no_more_data = 1,    // ENXIO from a data/hole query, never surfaced by the iterators
		unsupported,         // no sparse query on this platform or filesystem
		protocol_violation,  // the OS answered outside the documented seek contract
		offset_overflow,     // offset does not fit the platform's off_t
	};

	const std::error_category &category();

	std::error_code make_error_code(errc e);
}

namespace std
{
	template <>
	struct is_error_code_enum<fsparse::errc> : true_type {};
}
