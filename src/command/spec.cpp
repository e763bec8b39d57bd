#include "sigil/command/spec.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <cctype>
#include <set>

#include "sigil/command/errors.hpp"

namespace sigil::command {

void validate_specs(const std::string& path,
                    const std::vector<ArgumentSpec>& arguments,
                    const std::vector<FlagSpec>& flags) {
    std::set<std::string> arg_names;
    bool seen_optional = false;
    for (size_t i = 0; i < arguments.size(); ++i) {
        const auto& arg = arguments[i];
        if (arg.name.empty()) {
            throw ProcessingException("'" + path + "': argument #" +
                                      std::to_string(i) + " has no name");
        }
        if (!arg_names.insert(boost::algorithm::to_lower_copy(arg.name))
                 .second) {
            throw ProcessingException("'" + path +
                                      "': duplicate argument '" + arg.name +
                                      "'");
        }
        if (arg.is_required() && seen_optional) {
            throw ProcessingException("'" + path + "': required argument '" +
                                      arg.name +
                                      "' follows an optional argument");
        }
        if (!arg.is_required()) {
            seen_optional = true;
        }
    }

    std::set<std::string> flag_names;
    std::set<char> short_names;
    for (const auto& flag : flags) {
        const auto lower = boost::algorithm::to_lower_copy(flag.name);
        if (lower.empty()) {
            throw ProcessingException("'" + path + "': flag has no name");
        }
        const auto short_name =
            flag.short_name ? std::optional<char>(static_cast<char>(
                                  std::tolower(static_cast<unsigned char>(
                                      *flag.short_name))))
                            : std::nullopt;
        if (lower == "help" || lower == "h" || short_name == 'h') {
            throw ProcessingException("'" + path + "': flag '" + flag.name +
                                      "' uses the reserved help name");
        }
        if (!flag_names.insert(lower).second) {
            throw ProcessingException("'" + path + "': duplicate flag '" +
                                      flag.name + "'");
        }
        if (short_name && !short_names.insert(*short_name).second) {
            throw ProcessingException("'" + path + "': duplicate short flag '-" +
                                      std::string(1, *flag.short_name) + "'");
        }
    }
}

}  // namespace sigil::command
