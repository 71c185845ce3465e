#include "CommandLine.hpp"

#include "ConfigParser.hpp"

#include <string>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace {
constexpr const char* kUsage = "Usage: explode [options] <source> [destination]";
}

CommandLine::CommandLine(std::ostream& out, std::ostream& err) : m_out(out), m_err(err) {
}

bool CommandLine::parse(int argc, const char* const argv[]) {
    m_config = ExplodeConfig{};
    m_exitRequested = false;

    po::options_description visible("Options");
    visible.add_options()
        ("help,h", "Show this help and exit")
        ("version,V", "Show the version and exit")
        ("verbose,v", po::bool_switch(), "Print what is being done")
        ("dry-run,d", po::bool_switch(), "Don't do anything, only report what would be done")
        ("force,f", po::bool_switch(), "Overwrite entries that already exist in the destination")
        ("config,c", po::value<std::string>(), "Read default settings from a JSON file");

    po::options_description hidden;
    hidden.add_options()
        ("source", po::value<std::string>(), "The directory to explode")
        ("destination", po::value<std::string>(), "The output directory");

    po::options_description all;
    all.add(visible).add(hidden);

    po::positional_options_description positional;
    positional.add("source", 1).add("destination", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        m_err << "Error: " << e.what() << "\n" << kUsage << "\nTry `explode --help` for more information." << std::endl;
        return false;
    }

    if (vm.count("help")) {
        m_out << kUsage << "\n\nMove every entry of <source> into [destination] (default: .), then remove <source>.\n\n"
              << visible << std::endl;
        m_exitRequested = true;
        return true;
    }

    if (vm.count("version")) {
        m_out << "explode " << EXPLODE_VERSION << std::endl;
        m_exitRequested = true;
        return true;
    }

    if (!vm.count("source") || vm["source"].as<std::string>().empty()) {
        m_err << "Error: missing required argument <source>\n" << kUsage << std::endl;
        return false;
    }

    ConfigParser parser;
    if (vm.count("config")) {
        const std::string configPath = vm["config"].as<std::string>();
        if (!parser.load(configPath)) {
            m_err << "Error: could not load configuration from `" << configPath << "`" << std::endl;
            return false;
        }
    }
    const ConfigDefaults& defaults = parser.getDefaults();

    m_config.source = vm["source"].as<std::string>();
    if (vm.count("destination") && !vm["destination"].as<std::string>().empty()) {
        m_config.destination = vm["destination"].as<std::string>();
    } else if (parser.hasDestination()) {
        m_config.destination = defaults.destination;
    } else {
        m_config.destination = ".";
    }

    m_config.verbose = vm["verbose"].as<bool>() || defaults.verbose;
    m_config.dryRun = vm["dry-run"].as<bool>() || defaults.dryRun;
    m_config.force = vm["force"].as<bool>() || defaults.force;

    return true;
}
