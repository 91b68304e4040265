/*
 * Copyright (C) 2026 The fsparse authors
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License version 2 as
 * published by the Free Software Foundation.
 */

#ifndef _GNU_SOURCE
#define _GNU_SOURCE
#endif

#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>
#include <errno.h>
#include <limits>

#include "fsparse/seeker.hpp"

namespace
{
	// Apple does not export the whence values; these are the ones its kernel
	// accepts.
#if defined(__APPLE__)
	const fsparse::platform_caps caps = { "apple", 4, 3, false };
#elif defined(__linux__) && defined(SEEK_DATA) && defined(SEEK_HOLE)
	const fsparse::platform_caps caps = { "linux", SEEK_DATA, SEEK_HOLE, true };
#elif defined(SEEK_DATA) && defined(SEEK_HOLE)
	const fsparse::platform_caps caps = { "unix", SEEK_DATA, SEEK_HOLE, true };
#else
	const fsparse::platform_caps caps = { "unsupported", -1, -1, false };
#endif

	class posix_seeker : public fsparse::seeker
	{
	public:
		explicit posix_seeker(int fd)
			: fd(fd)
		{
		}

		uint64_t seek(uint64_t offset, fsparse::item_kind want, std::error_code &ec) override
		{
			ec.clear();

			if ( !caps.supported() )
			{
				ec = fsparse::errc::unsupported;
				return 0;
			}

			if ( offset > static_cast<uint64_t>(std::numeric_limits<off_t>::max()) )
			{
				ec = fsparse::errc::offset_overflow;
				return 0;
			}

			int whence = want == fsparse::item_kind::data ? caps.seek_data : caps.seek_hole;

			off_t res = lseek(fd, static_cast<off_t>(offset), whence);
			if ( res == (off_t)-1 )
			{
				int err = errno;

				if ( err == ENXIO )
				{
					ec = fsparse::errc::no_more_data;
				}
				else if ( err == EINVAL )
				{
					// offset is non-negative, so the kernel rejected the whence
					ec = fsparse::errc::unsupported;
				}
				else
				{
					ec = std::error_code(err, std::system_category());
				}

				return 0;
			}

			return static_cast<uint64_t>(res);
		}

		uint64_t end_offset(std::error_code &ec) override
		{
			ec.clear();

			struct stat st;
			if ( fstat(fd, &st) == -1 )
			{
				ec = std::error_code(errno, std::system_category());
				return 0;
			}

			return static_cast<uint64_t>(st.st_size);
		}

	private:
		int fd;
	};
}

const fsparse::platform_caps &fsparse::native_caps()
{
	return caps;
}

std::unique_ptr<fsparse::seeker> fsparse::make_native_seeker(int fd)
{
	return std::unique_ptr<seeker>(new posix_seeker(fd));
}
