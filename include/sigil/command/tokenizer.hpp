#pragma once

#include <string>
#include <vector>

namespace sigil::command {

// Splits on whitespace. Double quotes group words and may produce an empty
// token; a backslash escapes the next character only inside quotes. An
// unterminated quote runs to the end of the input.
//
// With keep_trailing_empty, input ending in unquoted whitespace yields a final
// empty token, which completion treats as the in-progress word.
std::vector<std::string> tokenize(const std::string& input,
                                  bool keep_trailing_empty = false);

// Joins host-supplied arguments and tokenizes them again so quotes that span
// several host arguments are honoured.
std::vector<std::string> retokenize(const std::vector<std::string>& args,
                                    bool keep_trailing_empty = false);

struct CommandLine {
    // First word, without a leading '/'
    std::string label;
    // Raw text after the whitespace that ends the label, quotes intact
    std::string rest;
    bool has_rest = false;
};

CommandLine split_command_line(const std::string& line);

}  // namespace sigil::command
