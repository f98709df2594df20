#pragma once

#include <boost/filesystem.hpp>
#include <boost/json.hpp>
#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <vector>

// Helper class to manage paths of fixtures under tests/
class TestDataPath
{
public:
    static std::string
    get_path(const std::string& relative_path);
};

// Convert hex string to byte vector
std::vector<uint8_t>
hex_to_vector(const std::string& hex_string);

// JSON loading helper
boost::json::value
load_json_from_file(const std::string& file_path);
