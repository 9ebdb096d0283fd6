#pragma once

// Constants of the MDA scan file layout.

#include <cstdint>
#include <stdexcept>
#include <string>

namespace mdaio::mda {

// ============================================================================
// format_error - bytes decoded cleanly but do not describe a valid MDA file
// ============================================================================

class format_error : public std::runtime_error {
public:
    explicit format_error(const std::string& what) : std::runtime_error(what) {}
};

namespace layout {

// Versions written by the saveData record; tolerance for float comparison
constexpr float VERSION_1_3 = 1.3f;
constexpr float VERSION_1_4 = 1.4f;
constexpr float VERSION_TOLERANCE = 0.01f;

constexpr std::int32_t MAX_SCAN_RANK = 20;
constexpr int DEFAULT_MAX_RANK = 4;

constexpr std::int32_t MAX_POSITIONERS = 4;
constexpr std::int32_t MAX_DETECTORS = 85;

// Bytes per data point in the positioner (double) and detector (float) blocks
constexpr std::int64_t POSITIONER_VALUE_SIZE = 8;
constexpr std::int64_t DETECTOR_VALUE_SIZE = 4;

} // namespace layout

// ============================================================================
// EPICS DBR types used by extra PVs
// ============================================================================

enum class dbr_type : std::int32_t {
    string = 0,
    ctrl_short = 29,
    ctrl_float = 30,
    ctrl_char = 32,
    ctrl_long = 33,
    ctrl_double = 34,
};

inline auto to_string(dbr_type type) -> const char* {
    switch (type) {
        case dbr_type::string: return "DBR_STRING";
        case dbr_type::ctrl_short: return "DBR_CTRL_SHORT";
        case dbr_type::ctrl_float: return "DBR_CTRL_FLOAT";
        case dbr_type::ctrl_char: return "DBR_CTRL_CHAR";
        case dbr_type::ctrl_long: return "DBR_CTRL_LONG";
        case dbr_type::ctrl_double: return "DBR_CTRL_DOUBLE";
    }
    return "DBR_UNKNOWN";
}

inline auto to_dbr_type(std::int32_t code) -> dbr_type {
    switch (code) {
        case 0: return dbr_type::string;
        case 29: return dbr_type::ctrl_short;
        case 30: return dbr_type::ctrl_float;
        case 32: return dbr_type::ctrl_char;
        case 33: return dbr_type::ctrl_long;
        case 34: return dbr_type::ctrl_double;
    }
    throw format_error("unsupported extra PV type " + std::to_string(code));
}

} // namespace mdaio::mda
