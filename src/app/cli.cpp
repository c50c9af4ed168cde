#include "app/cli.hpp"
#include <boost/program_options.hpp>
#include <charconv>
#include <sstream>

namespace po = boost::program_options;

namespace
{
    po::options_description make_description()
    {
        po::options_description desc("pvalve [options] < input > output\nsupported options");
        desc.add_options()
        ("help,h", "display this help message")
        ("rate-limit,L", po::value<std::string>(), "limit the transfer to N units per second (N > 0)")
        ("line-mode,l", po::bool_switch(), "measure and limit lines ('\\n'-separated) instead of bytes")
        ("null,0", po::bool_switch(), "same as line mode, except the records are NUL-separated")
        ("size,s", po::value<std::string>(), "expected total size in bytes, enables the percentage display")
        ("config,c", po::value<std::string>()->default_value("pvalve.toml"), "TOML configuration file")
        ("quiet,q", po::bool_switch(), "do not draw the status line on stderr");
        return desc;
    }

    template<typename Integer>
    Integer parse_positive(const std::string& option, const std::string& text)
    {
        Integer value = 0;
        auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if(ec != std::errc() || end != text.data() + text.size() || value == 0)
            throw po::invalid_option_value(option + " " + text);
        return value;
    }
}

Cli_options parse_command_line(int argc, const char* const argv[])
{
    auto desc = make_description();
    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);

    Cli_options options;
    options.help = vm.count("help") > 0;
    if(vm.count("rate-limit"))
        options.rate_limit = parse_positive<std::uint32_t>("--rate-limit", vm["rate-limit"].as<std::string>());
    if(vm["null"].as<bool>())
        options.unit = Unit::Null;
    else if(vm["line-mode"].as<bool>())
        options.unit = Unit::Line;
    if(vm.count("size"))
        options.expected_size = parse_positive<std::uint64_t>("--size", vm["size"].as<std::string>());
    options.config_file = vm["config"].as<std::string>();
    options.quiet = vm["quiet"].as<bool>();
    return options;
}

std::string usage()
{
    std::ostringstream out;
    out << make_description() << "\n"
        << "signals: SIGUSR1 pause/resume, SIGUSR2 limit on/off, SIGHUP reload config, SIGINT/SIGTERM cancel\n"
        << "keys: +/= or right limit +10, -/_ or left limit -10, t limit on/off, u next unit, b/l/n bytes/lines/nulls, p or space pause\n";
    return out.str();
}

void apply_overrides(const Cli_options& options, Valve_Config::Valve_Settings& settings)
{
    if(options.rate_limit)
        settings.speed_limit = *options.rate_limit;
    if(options.unit)
        settings.unit = unit_name(*options.unit);
    if(options.expected_size)
        settings.expected_size = static_cast<int64_t>(*options.expected_size);
}
