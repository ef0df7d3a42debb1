// upack - Unicode break property table packer in C++
// Copyright (c) 2017-2025 Jesse W. Towner

// Parses the Unicode word break properties (auxiliary/WordBreakProperty.txt)
// or line break properties (LineBreak.txt) and generates a C++ header holding
// the packed property ranges.
//
//   unicodesync -w ucd/auxiliary/WordBreakProperty.txt -o word_break_properties.hpp
//   unicodesync -l ucd/LineBreak.txt -o line_break_properties.hpp
//   unicodesync -d -l ucd/LineBreak.txt

#include <upack/upack.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace stdfs = std::filesystem;

// Exit status for command line usage errors, as in sysexits.h
constexpr int exit_usage = 64;

class usage_error : public upack::upack_error
{
	using upack::upack_error::upack_error;
};

// Command line options
struct options
{
	std::string words;
	std::string lines;
	std::string output;
	bool dry{false};
	bool verbose{false};
};

// Prints verbose output
struct verbose_cerr
{
	options const& opts;

	template <typename T>
	friend verbose_cerr&& operator<<(verbose_cerr&& os, T&& v)
	{
		if (os.opts.verbose)
			std::cerr << std::forward<T>(v);
		return static_cast<verbose_cerr&&>(os);
	}
};

// Prints usage information
void print_usage(std::ostream& out)
{
	out << "Usage: unicodesync (-w <file> | -l <file>) [options]\n"
	    << "Options:\n"
	    << "  -w, --words <file>   Sync the word break properties\n"
	    << "  -l, --lines <file>   Sync the line break properties\n"
	    << "  -o, --output <file>  Write the generated header to file\n"
	    << "  -d, --dry            Print the generated header to stdout, write nothing\n"
	    << "  -v, --verbose        Report progress on stderr\n"
	    << "  -h, --help           Show this help\n";
}

// Parses command line arguments
options parse_args(int argc, char* argv[])
{
	options opts;
	auto const value_of = [&](int& i, std::string_view arg) {
		if (i + 1 >= argc || argv[i + 1][0] == '-')
			throw usage_error("Missing value for option: " + std::string{arg});
		return std::string{argv[++i]};
	};
	for (int i = 1; i < argc; ++i) {
		std::string_view const arg{argv[i]};
		if (arg == "-h" || arg == "--help") {
			print_usage(std::cout);
			std::exit(EXIT_SUCCESS);
		} else if (arg == "-w" || arg == "--words") {
			opts.words = value_of(i, arg);
		} else if (arg == "-l" || arg == "--lines") {
			opts.lines = value_of(i, arg);
		} else if (arg == "-o" || arg == "--output") {
			opts.output = value_of(i, arg);
		} else if (arg == "-d" || arg == "--dry") {
			opts.dry = true;
		} else if (arg == "-v" || arg == "--verbose") {
			opts.verbose = true;
		} else {
			throw usage_error("Unknown option: " + std::string{arg});
		}
	}
	if (opts.words.empty() && opts.lines.empty())
		throw usage_error("Expecting either a word break properties file or a line break properties file. None was given.");
	if (!opts.words.empty() && !opts.lines.empty())
		throw usage_error("Expecting either a word break properties file or a line break properties file. Both were given.");
	if (!opts.dry && opts.output.empty())
		throw usage_error("Expecting an output file unless running in dry mode.");
	return opts;
}

std::vector<std::string> read_lines(stdfs::path const& filepath)
{
	std::ifstream input{filepath};
	if (!input)
		throw upack::upack_error("unable to open " + filepath.string());
	std::vector<std::string> lines;
	std::string line;
	while (std::getline(input, line)) {
		if (!line.empty() && line.back() == '\r')
			line.pop_back();
		lines.push_back(std::move(line));
	}
	if (input.bad())
		throw upack::upack_error("unable to read data from " + filepath.string());
	return lines;
}

// Writes the whole file or, on failure, removes what was written
void write_file(stdfs::path const& filepath, std::string const& contents)
{
	std::ofstream output{filepath, std::ios::out | std::ios::trunc | std::ios::binary};
	if (!output)
		throw upack::upack_error("unable to open " + filepath.string() + " for writing");
	upack::detail::scope_fail cleanup{[&output, &filepath] {
		output.close();
		std::error_code ec;
		stdfs::remove(filepath, ec);
	}};
	output << contents;
	output.flush();
	if (!output)
		throw upack::upack_error("unable to write data to " + filepath.string());
}

std::string generate(options const& opts, upack::property_family const& family, stdfs::path const& source)
{
	verbose_cerr{opts} << "Syncing " << family.name << " properties from " << source.string() << "\n";
	auto const lines = read_lines(source);
	verbose_cerr{opts} << "Read " << lines.size() << " lines\n";
	auto const collection = upack::build_property_collection(lines, family);
	verbose_cerr{opts} << "Merged into " << collection.ranges.size() << " ranges of "
		<< collection.registry.size() << " properties\n";
	auto const packed = upack::pack_properties(collection.ranges, collection.registry);
	upack::verify_packed_properties(packed, collection.ranges);
	verbose_cerr{opts} << "Packed " << packed.data.size() << " characters, "
		<< packed.single_ranges << " single codepoint ranges\n";
	return upack::generate_source(family, collection, packed);
}

int main(int argc, char* argv[])
try {
	auto const opts = parse_args(argc, argv);
	auto const& family = opts.words.empty() ? upack::line_break_family : upack::word_break_family;
	auto const source = generate(opts, family, opts.words.empty() ? opts.lines : opts.words);
	if (opts.dry) {
		std::cout << source << std::flush;
	} else {
		write_file(opts.output, source);
		verbose_cerr{opts} << "Wrote " << opts.output << "\n";
	}
	return EXIT_SUCCESS;
} catch (usage_error const& e) {
	std::cerr << e.what() << "\n\n";
	print_usage(std::cerr);
	return exit_usage;
} catch (std::exception const& e) {
	std::cerr << "Error: " << e.what() << "\nExiting...\n" << std::flush;
	return EXIT_FAILURE;
}
