#pragma once

#include "ssz/core/logger.h"
#include "ssz/core/types.h"

// Log a node at DEBUG, only formatting the hex when the level allows it
#define LOGD_NODE(label, node_obj)                                      \
    if (Logger::get_level() >= LogLevel::DEBUG)                         \
    Logger::log_with_format(                                            \
        LogLevel::DEBUG,                                                \
        [](const std::string& lbl, const ssz::Node& n) {                \
            return lbl + n.hex();                                       \
        },                                                              \
        std::string(label),                                             \
        node_obj)

// Partition-aware variant for classes exposing get_log_partition()
#define OLOGD_NODE(label, node_obj)                                     \
    if (get_log_partition().should_log(LogLevel::DEBUG))                \
    Logger::log_with_format(                                            \
        LogLevel::DEBUG,                                                \
        [](const std::string& partition_name,                           \
           const std::string& lbl,                                      \
           const ssz::Node& n) {                                        \
            return "[" + partition_name + "] " + lbl + n.hex();         \
        },                                                              \
        get_log_partition().name(),                                     \
        std::string(label),                                             \
        node_obj)
