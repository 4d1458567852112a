#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace MT::CLI {

// Small "--name value" / "--name=value" parser shared by the tools.
class CommandLine {
public:
    using ParseError = std::optional<std::string>;

    explicit CommandLine(std::string_view program_name);

    void set_error_logger(std::function<void(std::string const&)> logger);

    struct FlagOption {
        std::function<void()> on_set;
        std::string           help;
    };

    struct ValueOption {
        std::function<ParseError(std::string_view)> on_value;
        std::string                                 placeholder = "VALUE";
        std::string                                 help;
    };

    struct IntOption {
        std::function<ParseError(int)> on_value;
        std::string                    help;
    };

    void add_flag(std::string_view name, FlagOption option);
    void add_value(std::string_view name, ValueOption option);
    void add_int(std::string_view name, IntOption option);
    void add_alias(std::string_view alias, std::string_view target);

    // Unknown arguments are errors. Every problem is reported, parsing does not stop at the first one.
    [[nodiscard]] bool parse(int argc, char const* const* argv);
    [[nodiscard]] bool had_errors() const { return had_error_; }

    [[nodiscard]] auto usage() const -> std::string;

private:
    struct OptionEntry {
        std::string                                 name;
        std::vector<std::string>                    aliases;
        bool                                        expects_value = false;
        std::string                                 placeholder;
        std::string                                 help;
        std::function<void()>                       flag_handler;
        std::function<ParseError(std::string_view)> value_handler;
    };

    auto find_option(std::string_view name) -> OptionEntry*;
    void register_option(OptionEntry entry);
    void report(std::string_view message);

    std::vector<OptionEntry>                        options_;
    std::unordered_map<std::string, std::size_t>    option_lookup_;
    std::string                                     program_name_;
    std::function<void(std::string const&)>         error_logger_;
    bool                                            had_error_ = false;
};

} // namespace MT::CLI
