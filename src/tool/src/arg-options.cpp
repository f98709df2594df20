#include "ssz/tool/arg-options.h"

#include <algorithm>
#include <boost/program_options.hpp>
#include <cctype>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace po = boost::program_options;
namespace ssz::tool {

namespace {
bool
is_known_level(std::string level)
{
    std::transform(
        level.begin(), level.end(), level.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
    return level == "none" || level == "error" || level == "warn" ||
        level == "warning" || level == "info" || level == "debug";
}
}  // namespace

CommandLineOptions
parse_argv(int argc, char* argv[])
{
    CommandLineOptions options;

    po::options_description desc("Allowed options");
    desc.add_options()("help,h", "Display this help message")(
        "input-file", po::value<std::string>(), "File of raw chunk bytes")(
        "hex,x", po::value<std::string>(), "Chunk bytes as a hex string")(
        "pack,p", po::bool_switch(), "Zero pad the input to whole chunks")(
        "limit,n",
        po::value<std::size_t>(),
        "Declared maximum number of chunks")(
        "mix-in-length",
        po::value<std::uint64_t>(),
        "Mix a sequence length into the root")(
        "mix-in-selector",
        po::value<std::uint64_t>(),
        "Mix a union selector into the root")(
        "branch-for,b",
        po::value<std::uint64_t>(),
        "Also print the Merkle branch of this chunk index")(
        "verify", po::bool_switch(), "Verify a Merkle branch")(
        "leaf", po::value<std::string>(), "Leaf to verify (hex)")(
        "branch",
        po::value<std::vector<std::string>>()->composing(),
        "Branch node (hex), lowest first; repeat for each level")(
        "index", po::value<std::uint64_t>(), "Leaf index to verify")(
        "root", po::value<std::string>(), "Expected root (hex)")(
        "level,l",
        po::value<std::string>()->default_value("error"),
        "Set log verbosity (none, error, warn, info, debug)");

    po::positional_options_description pos_desc;
    pos_desc.add("input-file", 1);

    std::ostringstream help_stream;
    help_stream << "Usage: " << (argc > 0 ? argv[0] : "ssz-root")
                << " [options] [<chunk_file> | --hex <bytes>]" << std::endl
                << "       " << (argc > 0 ? argv[0] : "ssz-root")
                << " --verify --leaf <node> --branch <node>... --index <i> "
                   "--root <node>"
                << std::endl
                << desc << std::endl
                << "Computes hash tree roots and checks Merkle branches."
                << std::endl;
    options.help_text = help_stream.str();

    try
    {
        po::variables_map vm;
        po::store(
            po::command_line_parser(argc, argv)
                .options(desc)
                .positional(pos_desc)
                .run(),
            vm);
        po::notify(vm);

        if (vm.count("help"))
        {
            options.show_help = true;
            return options;
        }

        options.log_level = vm["level"].as<std::string>();
        if (!is_known_level(options.log_level))
        {
            options.valid = false;
            options.error_message = "Unknown log level: " + options.log_level;
            return options;
        }

        options.verify = vm["verify"].as<bool>();
        options.pack = vm["pack"].as<bool>();

        if (vm.count("input-file"))
            options.input_file = vm["input-file"].as<std::string>();
        if (vm.count("hex"))
            options.input_hex = vm["hex"].as<std::string>();
        if (vm.count("limit"))
            options.limit = vm["limit"].as<std::size_t>();
        if (vm.count("mix-in-length"))
            options.mix_in_length = vm["mix-in-length"].as<std::uint64_t>();
        if (vm.count("mix-in-selector"))
            options.mix_in_selector =
                vm["mix-in-selector"].as<std::uint64_t>();
        if (vm.count("branch-for"))
            options.branch_index = vm["branch-for"].as<std::uint64_t>();
        if (vm.count("leaf"))
            options.leaf = vm["leaf"].as<std::string>();
        if (vm.count("branch"))
            options.branch = vm["branch"].as<std::vector<std::string>>();
        if (vm.count("index"))
            options.index = vm["index"].as<std::uint64_t>();
        if (vm.count("root"))
            options.root = vm["root"].as<std::string>();

        if (options.verify)
        {
            if (!options.leaf || !options.index || !options.root)
            {
                options.valid = false;
                options.error_message =
                    "--verify requires --leaf, --index and --root";
            }
            return options;
        }

        if (options.input_file.has_value() == options.input_hex.has_value())
        {
            options.valid = false;
            options.error_message =
                "Specify exactly one of an input file or --hex";
            return options;
        }

        if (options.mix_in_length && options.mix_in_selector)
        {
            options.valid = false;
            options.error_message =
                "--mix-in-length and --mix-in-selector are exclusive";
            return options;
        }
    }
    catch (const po::error& e)
    {
        options.valid = false;
        options.error_message = e.what();
    }
    catch (const std::exception& e)
    {
        options.valid = false;
        options.error_message = std::string("Unexpected error: ") + e.what();
    }

    return options;
}

}  // namespace ssz::tool
