#include "ssz/core/log-macros.h"
#include "ssz/core/logger.h"
#include "ssz/core/types.h"
#include "ssz/merkle/chunks.h"
#include "ssz/merkle/context.h"
#include "ssz/merkle/leaf-count.h"
#include "ssz/merkle/merkle-errors.h"
#include "ssz/merkle/merkleize.h"
#include "ssz/merkle/mix-in.h"
#include "ssz/merkle/pack.h"
#include "ssz/merkle/proofs.h"
#include "ssz/tool/arg-options.h"

#include <cstdint>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

using namespace ssz;
using namespace ssz::merkle;

namespace {

std::vector<uint8_t>
read_input(const tool::CommandLineOptions& options)
{
    if (options.input_hex)
    {
        return hex_to_bytes(*options.input_hex);
    }

    std::ifstream file(*options.input_file, std::ios::binary);
    if (!file.is_open())
    {
        throw std::runtime_error("Could not open file: " + *options.input_file);
    }
    return std::vector<uint8_t>(
        std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

int
verify(const tool::CommandLineOptions& options, const Context& context)
{
    std::vector<Node> branch;
    branch.reserve(options.branch.size());
    for (const auto& hex : options.branch)
    {
        branch.push_back(Node::from_hex(hex));
    }

    const bool valid = is_valid_merkle_branch(
        Node::from_hex(*options.leaf),
        branch,
        branch.size(),
        *options.index,
        Node::from_hex(*options.root));

    LOGI(
        "Checked branch of depth ",
        branch.size(),
        " at index ",
        *options.index);
    if (valid)
    {
        std::cout << ssz::color::BOLD_GREEN << "valid" << ssz::color::RESET
                  << std::endl;
        return 0;
    }
    std::cout << ssz::color::BOLD_RED << "invalid" << ssz::color::RESET
              << std::endl;
    return 1;
}

int
compute_root(const tool::CommandLineOptions& options, const Context& context)
{
    std::vector<uint8_t> chunks = read_input(options);
    if (options.pack)
    {
        pack_bytes(chunks);
    }
    LOGI(
        "Merkleizing ",
        chunk_count(chunks),
        " chunks",
        options.limit ? " with limit " + std::to_string(*options.limit) : "");

    Node root = merkleize(chunks, options.limit, context);
    LOGD_NODE("Data root: ", root);
    if (options.mix_in_length)
    {
        root = mix_in_length(root, *options.mix_in_length, context);
    }
    else if (options.mix_in_selector)
    {
        root = mix_in_selector(root, *options.mix_in_selector, context);
    }
    std::cout << root.hex() << std::endl;

    if (options.branch_index)
    {
        const auto leaf_count =
            LeafCount::covering(options.limit.value_or(chunk_count(chunks)));
        for (const auto& node : compute_merkle_branch(
                 chunks, leaf_count, *options.branch_index, context))
        {
            std::cout << node.hex() << std::endl;
        }
    }
    return 0;
}

}  // namespace

int
main(int argc, char* argv[])
{
    tool::CommandLineOptions options = tool::parse_argv(argc, argv);

    if (options.show_help)
    {
        std::cout << options.help_text;
        return 0;
    }

    if (!options.valid)
    {
        std::cerr << "Error: "
                  << options.error_message.value_or("Invalid arguments")
                  << std::endl
                  << std::endl
                  << options.help_text;
        return 2;
    }

    Logger::set_level(options.log_level);

    try
    {
        const Context context;
        return options.verify ? verify(options, context)
                              : compute_root(options, context);
    }
    catch (const MerkleizationException& e)
    {
        LOGE(e.what());
        return 1;
    }
    catch (const std::exception& e)
    {
        LOGE("Unexpected error: ", e.what());
        return 1;
    }
}
