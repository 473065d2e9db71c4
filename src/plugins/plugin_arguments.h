/*******************************************************************************
    Project: Volcano Controller Manager

    File: plugin_arguments.h

    Description:
        Flag-style parser for the raw argument list a job attaches to each
        plugin, e.g. {"--no-root", "--ssh-key-file-path=/home/user/.ssh"}.

        Accepted forms:
            -name  --name                 boolean flag set to true
            -name=value  --name=value     any flag
            -name value  --name value     string flags only
        Parsing stops at the first token that is not a flag, or after "--".
        Unknown flags and bad boolean values throw PluginError.
*******************************************************************************/

#ifndef PLUGIN_ARGUMENTS_H
#define PLUGIN_ARGUMENTS_H

#include <map>
#include <string>
#include <vector>

namespace volcano {
namespace plugins {

class PluginArguments {
private:
    std::string plugin_name_;
    std::map<std::string, bool*> bool_flags_;
    std::map<std::string, std::string*> string_flags_;
    std::vector<std::string> remaining_;

    static bool parse_bool(const std::string& text, bool& value);

public:
    explicit PluginArguments(const std::string& plugin_name) : plugin_name_(plugin_name) {}

    void add_bool(const std::string& name, bool* target);
    void add_string(const std::string& name, std::string* target);

    void parse(const std::vector<std::string>& arguments);

    // Tokens left over after flag parsing stopped.
    const std::vector<std::string>& remaining() const { return remaining_; }
};

} // namespace plugins
} // namespace volcano

#endif // PLUGIN_ARGUMENTS_H
