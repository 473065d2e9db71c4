/*******************************************************************************
    Project: Volcano Controller Manager

    File: plugin_arguments.cpp

    Description:
        Flag parser for plugin arguments.
*******************************************************************************/

#include "plugins/plugin_arguments.h"
#include "common/errors.h"

#include <cstddef>

namespace volcano {
namespace plugins {

void PluginArguments::add_bool(const std::string& name, bool* target) {
    bool_flags_[name] = target;
}

void PluginArguments::add_string(const std::string& name, std::string* target) {
    string_flags_[name] = target;
}

bool PluginArguments::parse_bool(const std::string& text, bool& value) {
    if (text == "1" || text == "t" || text == "T" || text == "true" ||
        text == "TRUE" || text == "True") {
        value = true;
        return true;
    }
    if (text == "0" || text == "f" || text == "F" || text == "false" ||
        text == "FALSE" || text == "False") {
        value = false;
        return true;
    }
    return false;
}

void PluginArguments::parse(const std::vector<std::string>& arguments) {
    remaining_.clear();

    size_t i = 0;
    for (; i < arguments.size(); ++i) {
        const std::string& arg = arguments[i];

        if (arg.size() < 2 || arg[0] != '-') break;     // first non-flag token
        if (arg == "--") {
            ++i;
            break;
        }

        size_t dashes = (arg[1] == '-') ? 2 : 1;
        std::string body = arg.substr(dashes);
        if (body.empty() || body[0] == '-' || body[0] == '=') {
            throw PluginError("plugin " + plugin_name_ + ": bad flag syntax: " + arg);
        }

        std::string name = body;
        std::string value;
        bool has_value = false;
        auto eq = body.find('=');
        if (eq != std::string::npos) {
            name = body.substr(0, eq);
            value = body.substr(eq + 1);
            has_value = true;
        }

        auto bool_it = bool_flags_.find(name);
        if (bool_it != bool_flags_.end()) {
            bool parsed = true;
            if (has_value && !parse_bool(value, parsed)) {
                throw PluginError("plugin " + plugin_name_ + ": invalid boolean value \"" +
                                  value + "\" for -" + name);
            }
            *bool_it->second = parsed;
            continue;
        }

        auto string_it = string_flags_.find(name);
        if (string_it != string_flags_.end()) {
            if (!has_value) {
                if (i + 1 >= arguments.size()) {
                    throw PluginError("plugin " + plugin_name_ + ": flag needs an argument: -" + name);
                }
                value = arguments[++i];
            }
            *string_it->second = value;
            continue;
        }

        throw PluginError("plugin " + plugin_name_ + ": flag provided but not defined: -" + name);
    }

    remaining_.assign(arguments.begin() + static_cast<std::ptrdiff_t>(i), arguments.end());
}

} // namespace plugins
} // namespace volcano
