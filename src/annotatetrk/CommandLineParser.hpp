#pragma once

#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

/*
Simple command line parser; works on Windows or Unix-based platforms.
Options may be given as -x value, --name value or --name=value. Options
that take a value may be repeated; every value is kept. Arguments that
don't start with '-' are collected as positional arguments.

Usage example:

    CommandLineParser parser;
    parser.addOption('a', "airport-file", true);
    parser.addOption('v', "verbose", false);

    if (!parser.parse(argc, argv)) {
        return 1; // parsing error
    }

    std::string airports = parser.getOption("airport-file");
    bool verbose = parser.hasFlag("verbose");
    for (const auto &path : parser.positionals()) {
        ...
    }
*/

class CommandLineParser {
public:
    CommandLineParser() = default;

    // shortOpt of 0 registers a long-only option
    void addOption(char shortOpt, const std::string& longOpt, bool requiresValue = true) {
        if (shortOpt != 0) {
            shortToLong[shortOpt] = longOpt;
        }
        optionRequiresValue[longOpt] = requiresValue;
    }

    bool parse(int argc, char* argv[]) {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg.rfind("--", 0) == 0) {
                // Long option
                size_t eq = arg.find('=');
                std::string key = (eq != std::string::npos) ? arg.substr(2, eq - 2) : arg.substr(2);
                auto known = optionRequiresValue.find(key);
                if (known == optionRequiresValue.end()) {
                    std::cerr << "Unknown option: --" << key << "\n";
                    return false;
                }
                if (eq != std::string::npos) {
                    if (!known->second) {
                        std::cerr << "Option takes no value: --" << key << "\n";
                        return false;
                    }
                    options[key].push_back(arg.substr(eq + 1));
                } else if (known->second) {
                    if ((i + 1) < argc && argv[i + 1][0] != '-') {
                        options[key].push_back(argv[++i]);
                    } else {
                        std::cerr << "Missing value for option: --" << key << "\n";
                        return false;
                    }
                } else {
                    flags[key] = true;
                }
            } else if (arg.rfind("-", 0) == 0 && arg.length() == 2) {
                // Short option
                char shortKey = arg[1];
                if (shortToLong.count(shortKey)) {
                    std::string key = shortToLong[shortKey];
                    if (optionRequiresValue[key]) {
                        if ((i + 1) < argc && argv[i + 1][0] != '-') {
                            options[key].push_back(argv[++i]);
                        } else {
                            std::cerr << "Missing value for option: -" << shortKey << "\n";
                            return false;
                        }
                    } else {
                        flags[key] = true;
                    }
                } else {
                    std::cerr << "Unknown option: -" << shortKey << "\n";
                    return false;
                }
            } else if (arg.rfind("-", 0) != 0) {
                positionalArgs.push_back(arg);
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                return false;
            }
        }

        return true;
    }

    bool hasFlag(const std::string& name) const {
        return flags.count(name) > 0;
    }

    bool hasOption(const std::string& name) const {
        return options.count(name) > 0;
    }

    // last value given for the option
    std::string getOption(const std::string& name, const std::string& defaultValue = "") const {
        auto it = options.find(name);
        return it != options.end() ? it->second.back() : defaultValue;
    }

    std::vector<std::string> getOptionValues(const std::string& name) const {
        auto it = options.find(name);
        return it != options.end() ? it->second : std::vector<std::string>{};
    }

    const std::vector<std::string>& positionals() const {
        return positionalArgs;
    }

private:
    std::map<char, std::string> shortToLong;
    std::map<std::string, bool> optionRequiresValue;
    std::map<std::string, std::vector<std::string>> options;
    std::map<std::string, bool> flags;
    std::vector<std::string> positionalArgs;
};

// "a, b,,c" -> {"a", "b", "c"}; blank items are dropped
inline std::vector<std::string> splitCommaList(const std::string& value) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        std::string item = value.substr(start, (comma == std::string::npos) ? std::string::npos : comma - start);
        size_t first = item.find_first_not_of(" \t");
        if (first != std::string::npos) {
            items.push_back(item.substr(first, item.find_last_not_of(" \t") - first + 1));
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return items;
}

// nullopt when the list has no items, so callers fall back to their default
inline std::optional<std::vector<std::string>> commaListOrNone(const std::string& value) {
    auto items = splitCommaList(value);
    if (items.empty()) {
        return std::nullopt;
    }
    return items;
}
