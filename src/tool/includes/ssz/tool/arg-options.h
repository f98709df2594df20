#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ssz::tool {

/**
 * Type-safe structure for command line options
 */
struct CommandLineOptions
{
    /** Raw chunk bytes read from a file */
    std::optional<std::string> input_file;

    /** Chunk bytes given inline as hex */
    std::optional<std::string> input_hex;

    /** Pad the input to a chunk boundary before merkleizing */
    bool pack = false;

    /** Declared maximum number of chunks */
    std::optional<std::size_t> limit;

    /** Length to mix into the root */
    std::optional<std::uint64_t> mix_in_length;

    /** Union selector to mix into the root */
    std::optional<std::uint64_t> mix_in_selector;

    /** Print the Merkle branch of this chunk index after the root */
    std::optional<std::uint64_t> branch_index;

    /** Verify a Merkle branch instead of computing a root */
    bool verify = false;
    std::optional<std::string> leaf;
    std::vector<std::string> branch;
    std::optional<std::uint64_t> index;
    std::optional<std::string> root;

    /** Log verbosity level (none, error, warn, info, debug) */
    std::string log_level = "error";

    /** Whether to display help information */
    bool show_help = false;

    /** Whether parsing completed successfully */
    bool valid = true;

    /** Any error message to display */
    std::optional<std::string> error_message;

    /** Pre-formatted help text */
    std::string help_text;
};

/**
 * Parse command line arguments into a structured options object
 *
 * @param argc Argument count from main
 * @param argv Argument values from main
 * @return A populated CommandLineOptions structure
 */
CommandLineOptions
parse_argv(int argc, char* argv[]);

}  // namespace ssz::tool
