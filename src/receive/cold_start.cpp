#include "cold_start.hpp"

std::size_t options_start(const std::vector<std::string>& args) {
    for (std::size_t i = 0; i < args.size(); i++) {
        if (!args[i].empty() && args[i][0] == '-') return i;
    }
    return args.size();
}

FileList parse_initial_file_list(const std::vector<std::string>& args) {
    return FileList(args.begin(), args.begin() + static_cast<std::ptrdiff_t>(options_start(args)));
}

FileList parse_initial_file_list(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) args.emplace_back(argv[i]);
    return parse_initial_file_list(args);
}
