#include "utils.hpp"
#include <cctype>

std::string sanitize_identifier(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        unsigned char uc = static_cast<unsigned char>(c);
        out += (std::isalnum(uc) || c == '-' || c == '_') ? c : '_';
    }
    return out;
}
