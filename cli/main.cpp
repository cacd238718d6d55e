#include <iostream>
#include <exception>

#include <switcher/cli.hpp>
#include <switcher/pulse.hpp>
#include <switcher/config.hpp>
#include <switcher/logger.hpp>

namespace
{
    int run(const switcher::arguments &args)
    {
        using switcher::logger;

        auto patterns = args.config ? switcher::load_config(args.config.value()) : switcher::load_default_config();
        auto filter   = switcher::device_filter::compile(patterns);

        switcher::pulse pulse;

        if (args.cmd == switcher::command::list)
        {
            switcher::print_list(std::cout, switcher::take_snapshot(pulse, filter));
            return 0;
        }

        auto selected = switcher::cycle(pulse, filter);

        if (!selected)
        {
            logger::get()->error("{}", switcher::describe(selected.error()));
            return 1;
        }

        return 0;
    }
} // namespace

int main(int argc, char **args)
{
    using switcher::logger;

    auto parsed = switcher::parse_arguments(argc, args);

    if (!parsed)
    {
        std::cerr << "Usage: " << args[0] << switcher::usage << '\n';
        return 1;
    }

    if (parsed->help)
    {
        std::cout << "Usage: " << args[0] << switcher::usage << '\n' << switcher::help;
        return 0;
    }

    if (parsed->version)
    {
        std::cout << "pulse-switcher " << SWITCHER_VERSION << '\n';
        return 0;
    }

    logger::get().verbosity(parsed->verbose - parsed->quiet);

    try
    {
        return run(parsed.value());
    }
    catch (const std::exception &ex)
    {
        logger::get()->error("{}", ex.what());
    }

    return 1;
}
