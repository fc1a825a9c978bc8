#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Small command line parser for long and short options.
 *
 * Long options are written `--flag`, `--opt value` or `--opt=value`. Short
 * options (`-r`) are translated to their long form through a mapping and may
 * be grouped (`-rp src`). Only options listed in @p value_flags consume a
 * value; every other option is a boolean switch, so `-r src` leaves `src` as
 * a positional argument. Options missing from a non-empty @p known_flags set
 * are collected in `unknown_flags()`.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Option values keyed by flag
    std::vector<std::string> positional_;        ///< Positional arguments in order
    std::vector<std::string> unknown_flags_;     ///< Flags not present in known_flags
    std::vector<std::string> missing_values_;    ///< Value flags given without a value
    std::set<std::string> known_flags_;
    std::map<char, std::string> short_map_;
    std::set<std::string> value_flags_;

    bool known(const std::string& key) const {
        return known_flags_.empty() || known_flags_.count(key) > 0;
    }

    void record(const std::string& key, const std::string* value) {
        if (!known(key)) {
            unknown_flags_.push_back(key);
            return;
        }
        flags_.insert(key);
        if (value)
            options_[key] = *value;
    }

  public:
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::map<char, std::string>& short_map = {},
              const std::set<std::string>& value_flags = {})
        : known_flags_(known_flags), short_map_(short_map), value_flags_(value_flags) {
        bool only_positional = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (only_positional || arg == "-" || arg.empty() || arg[0] != '-') {
                positional_.push_back(arg);
                continue;
            }
            if (arg == "--") {
                only_positional = true;
                continue;
            }
            if (arg.rfind("--", 0) == 0) {
                size_t eq = arg.find('=');
                if (eq != std::string::npos) {
                    std::string key = arg.substr(0, eq);
                    std::string val = arg.substr(eq + 1);
                    record(key, &val);
                } else if (value_flags_.count(arg)) {
                    if (i + 1 < argc) {
                        std::string val = argv[++i];
                        record(arg, &val);
                    } else {
                        missing_values_.push_back(arg);
                    }
                } else {
                    record(arg, nullptr);
                }
                continue;
            }
            // Grouped short options; a value flag takes the rest of the group
            // or the next argument.
            for (size_t j = 1; j < arg.size(); ++j) {
                auto it = short_map_.find(arg[j]);
                if (it == short_map_.end()) {
                    unknown_flags_.push_back(std::string("-") + arg[j]);
                    continue;
                }
                const std::string& key = it->second;
                if (!value_flags_.count(key)) {
                    record(key, nullptr);
                    continue;
                }
                std::string val = arg.substr(j + 1);
                if (!val.empty() && val[0] == '=')
                    val.erase(0, 1);
                if (val.empty()) {
                    if (i + 1 >= argc) {
                        missing_values_.push_back(key);
                        break;
                    }
                    val = argv[++i];
                }
                record(key, &val);
                break;
            }
        }
    }

    /// `true` if @p flag (with leading `--`) was given.
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /// Value of @p opt, or an empty string.
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    const std::set<std::string>& flags() const { return flags_; }
    const std::map<std::string, std::string>& options() const { return options_; }
    const std::vector<std::string>& positional() const { return positional_; }
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }
    const std::vector<std::string>& missing_values() const { return missing_values_; }
};

#endif // ARG_PARSER_HPP
