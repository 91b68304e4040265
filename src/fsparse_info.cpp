/*
 * Copyright (C) 2026 The fsparse authors
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License version 2 as
 * published by the Free Software Foundation.
 */

#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <stdlib.h>
#include <ctype.h>
#include <stdio.h>
#include <string.h>
#include <errno.h>
#include <inttypes.h>

#include <memory>
#include <string>
#include <vector>

#include "fsparse/extent_table.hpp"
#include "fsparse/sparse_iter.hpp"

namespace
{
	enum class backend_kind
	{
		seek,
		fiemap,
	};

	struct options
	{
		bool                      points  = false;
		bool                      verbose = false;
		uint64_t                  start   = 0;
		backend_kind              backend = backend_kind::seek;
		std::vector<const char *> files;
	};

	void usage(const char *name, int code)
	{
		FILE *out = code == 0 ? stdout : stderr;

		fprintf(out,
			"Dump file layout info\n"
			"\n"
			"Usage: %s [options] <input_file>...\n"
			"\n"
			"  -p, --points          print transition points instead of ranges\n"
			"  -s, --start <offset>  start the scan at <offset>\n"
			"  -b, --backend <name>  seek (default) or fiemap\n"
			"  -v                    verbose\n"
			"  -h, --help            show this help\n",
			name);

		exit(code);
	}

	bool parse_offset(const char *s, uint64_t &res)
	{
		// strtoull skips leading blanks and accepts a sign
		if ( *s == '\0' or *s == '-' or *s == '+' or isspace((unsigned char)*s) )
		{
			return false;
		}

		char *end = nullptr;
		errno = 0;
		unsigned long long v = strtoull(s, &end, 0);

		if ( errno != 0 or *end != '\0' )
		{
			return false;
		}

		res = v;
		return true;
	}

	options parse_args(int argc, char *argv[])
	{
		options opts;

		for(int i = 1; i < argc; ++i)
		{
			std::string arg = argv[i];

			if ( arg == "-h" or arg == "--help" )
			{
				usage(argv[0], 0);
			}
			else if ( arg == "-p" or arg == "--points" )
			{
				opts.points = true;
			}
			else if ( arg == "-v" )
			{
				opts.verbose = true;
			}
			else if ( arg == "-s" or arg == "--start" )
			{
				if ( i + 1 == argc or !parse_offset(argv[i + 1], opts.start) )
				{
					fprintf(stderr, "%s: invalid start offset\n", argv[0]);
					usage(argv[0], 2);
				}
				++i;
			}
			else if ( arg == "-b" or arg == "--backend" )
			{
				std::string name = i + 1 < argc ? argv[i + 1] : "";

				if ( name == "seek" )
				{
					opts.backend = backend_kind::seek;
				}
				else if ( name == "fiemap" )
				{
					opts.backend = backend_kind::fiemap;
				}
				else
				{
					fprintf(stderr, "%s: unknown backend '%s'\n", argv[0], name.c_str());
					usage(argv[0], 2);
				}
				++i;
			}
			else if ( arg.size() > 1 and arg[0] == '-' )
			{
				fprintf(stderr, "%s: unknown option '%s'\n", argv[0], arg.c_str());
				usage(argv[0], 2);
			}
			else
			{
				opts.files.push_back(argv[i]);
			}
		}

		if ( opts.files.empty() )
		{
			usage(argv[0], 2);
		}

		return opts;
	}

	std::unique_ptr<fsparse::seeker> open_backend(int fd, backend_kind kind, std::error_code &ec)
	{
		ec.clear();

		if ( kind == backend_kind::seek )
		{
			return fsparse::make_native_seeker(fd);
		}

#ifdef __linux__
		std::vector<fsparse::table_entry> table;

		ec = fsparse::get_fiemap_entries(fd, table);
		if ( ec )
		{
			return nullptr;
		}

		struct stat st;
		if ( fstat(fd, &st) == -1 )
		{
			ec = std::error_code(errno, std::system_category());
			return nullptr;
		}

		return std::unique_ptr<fsparse::seeker>(new fsparse::extent_table_seeker(table, static_cast<uint64_t>(st.st_size)));
#else
		ec = fsparse::errc::unsupported;
		return nullptr;
#endif
	}

	void print_points(fsparse::sparse_iter iter, std::error_code &ec)
	{
		fsparse::sparse_item item;

		while( iter.next(item, ec) )
		{
			printf("%s %16" PRIu64 "\n", fsparse::kind_name(item.kind), item.offset);
		}
	}

	void print_ranges(const char *path, fsparse::sparse_iter iter, std::error_code &ec)
	{
		fsparse::sparse_range_iter ranges(iter);
		fsparse::sparse_range_item range;

		uint64_t data_size = 0;
		uint64_t hole_size = 0;

		while( ranges.next(range, ec) )
		{
			printf("%s %16" PRIu64 " %16" PRIu64 "\n", fsparse::kind_name(range.kind), range.start, range.end);

			if ( range.kind == fsparse::item_kind::data )
			{
				data_size += range.size();
			}
			else
			{
				hole_size += range.size();
			}
		}

		if ( !ec )
		{
			printf("%s: %" PRIu64 " data bytes, %" PRIu64 " hole bytes, %" PRIu64 " total\n",
				path, data_size, hole_size, data_size + hole_size);
		}
	}

	void one_file(const char *path, const options &opts)
	{
		int fd = open(path, O_RDONLY);
		if ( fd < 0 )
		{
			fprintf(stderr, "Could not open input file %s: %s\n", path, strerror(errno));
			exit(1);
		}

		std::error_code ec;

		auto backend = open_backend(fd, opts.backend, ec);
		if ( ec )
		{
			fprintf(stderr, "Could not query extents of %s: %s\n", path, ec.message().c_str());
			exit(1);
		}

		if ( opts.verbose )
		{
			const auto &caps = fsparse::native_caps();

			fprintf(stderr, "platform %s, SEEK_DATA %d, SEEK_HOLE %d\n", caps.name, caps.seek_data, caps.seek_hole);

			uint64_t length = backend->end_offset(ec);
			if ( ec )
			{
				fprintf(stderr, "Could not get size of %s: %s\n", path, ec.message().c_str());
				exit(1);
			}

			fprintf(stderr, "%s: %" PRIu64 " bytes\n", path, length);
		}

		if ( opts.start != 0 and opts.backend == backend_kind::seek and !fsparse::native_caps().reliable_first_extent )
		{
			fprintf(stderr, "warning: the extent containing offset %" PRIu64 " may not be reported on this platform\n", opts.start);
		}

		fsparse::sparse_iter iter(*backend, opts.start);

		if ( opts.points )
		{
			print_points(iter, ec);
		}
		else
		{
			print_ranges(path, iter, ec);
		}

		if ( ec )
		{
			fprintf(stderr, "Could not read layout of %s: %s\n", path, ec.message().c_str());
			exit(1);
		}

		close(fd);
	}
}

int main(int argc, char *argv[])
{
	options opts = parse_args(argc, argv);

	for(const auto path: opts.files)
	{
		one_file(path, opts);
	}

	return 0;
}
