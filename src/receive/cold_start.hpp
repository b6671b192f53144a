#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <core/types.hpp>

// Launch-argument contract: zero or more leading path arguments, consumed
// until the first argument starting with '-'. Nothing after it is inspected.
// Paths are returned as given; ReceiptDispatcher makes them absolute.
FileList parse_initial_file_list(const std::vector<std::string>& args);

// Same, from main()'s argv (argv[0] is the program and is skipped).
FileList parse_initial_file_list(int argc, char** argv);

// Index in args where option parsing resumes (args.size() when none).
std::size_t options_start(const std::vector<std::string>& args);
