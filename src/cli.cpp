#include "cli.hpp"
#include "logger.hpp"

#include <ostream>

namespace switcher
{
    const std::string_view usage = " [-v|--verbose]... [-q|--quiet]... [-c|--config FILE] [list|next]";

    const std::string_view help = R"(
Commands:
  list    List all devices, the devices matching the config file and the current default device (default)
  next    Set the next matching device as the new default device

Options:
  -v, --verbose        Add debug messages, pass twice for trace messages
  -q, --quiet          Only show warnings and errors, twice for only errors, thrice for silence
  -c, --config FILE    JSON config file, default '$XDG_CONFIG_HOME/pulse-switcher/config.json' if it exists
  -h, --help           Print this help
  -V, --version        Print the version

The config file is a JSON object with the optional string arrays "include_names",
"include_descriptions", "exclude_names" and "exclude_descriptions". TOML files are not read.
)";

    static bool repeated_flag(std::string_view arg)
    {
        if (arg.size() < 3 || arg[0] != '-' || (arg[1] != 'v' && arg[1] != 'q'))
        {
            return false;
        }

        return arg.find_first_not_of(arg[1], 1) == std::string_view::npos;
    }

    std::optional<arguments> parse_arguments(int argc, const char *const *args)
    {
        arguments rtn;
        std::optional<command> cmd;

        for (auto i = 1; i < argc; i++)
        {
            const std::string_view arg{args[i]};

            if (arg == "-h" || arg == "--help")
            {
                rtn.help = true;
            }
            else if (arg == "-V" || arg == "--version")
            {
                rtn.version = true;
            }
            else if (arg == "-v" || arg == "--verbose")
            {
                rtn.verbose++;
            }
            else if (arg == "-q" || arg == "--quiet")
            {
                rtn.quiet++;
            }
            else if (repeated_flag(arg))
            {
                (arg[1] == 'v' ? rtn.verbose : rtn.quiet) += static_cast<int>(arg.size() - 1);
            }
            else if (arg == "-c" || arg == "--config")
            {
                if (i + 1 >= argc)
                {
                    logger::get()->error("Missing value for {}", arg);
                    return std::nullopt;
                }

                rtn.config.emplace(args[++i]);
            }
            else if (arg.starts_with("--config="))
            {
                rtn.config.emplace(std::string{arg.substr(9)});
            }
            else if (!cmd && arg == "list")
            {
                cmd.emplace(command::list);
            }
            else if (!cmd && arg == "next")
            {
                cmd.emplace(command::next);
            }
            else
            {
                logger::get()->error(R"(Unexpected argument "{}")", arg);
                return std::nullopt;
            }
        }

        if (rtn.verbose > 0 && rtn.quiet > 0)
        {
            logger::get()->error("--verbose conflicts with --quiet");
            return std::nullopt;
        }

        rtn.cmd = cmd.value_or(command::list);

        return rtn;
    }

    void print_list(std::ostream &out, const snapshot &snapshot)
    {
        out << "All devices:\n";

        for (const auto &device : snapshot.devices)
        {
            out << fmt::format("{}\n", device);
        }

        out << "\nMatching devices:\n";

        for (const auto &device : snapshot.matching)
        {
            out << fmt::format("{}\n", device);
        }

        if (snapshot.current)
        {
            out << fmt::format("\nDefault device: {}\n", snapshot.current.value());
            return;
        }

        out << "\nDefault device: none\n";
    }
} // namespace switcher
