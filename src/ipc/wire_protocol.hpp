#pragma once

#include <string>
#include <core/types.hpp>

// Hot-send message: one UTF-8 line holding {"files": ["<abs-path>", ...]}.
// The encoded text never contains a raw newline; the transport appends one.
// MalformedMessage when a path is not valid UTF-8 and so cannot travel as
// JSON unchanged.
Result<std::string> encode_file_list(const FileList& files);

// Decode one line. MalformedMessage when the text is not JSON, not an
// object, lacks a "files" array, or the array holds a non-string.
Result<FileList> decode_file_list(const std::string& line);
