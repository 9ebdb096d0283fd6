#pragma once

// Records decoded from an MDA scan file.

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "format.hpp"

namespace mdaio::mda {

// Column names used by the scan record: P1..P4 for positioners;
// D1..D9, DA..DF, then D01..D70 for detectors.
auto positioner_field_name(std::int32_t number) -> std::string;
auto detector_field_name(std::int32_t number) -> std::string;

struct positioner_t {
    std::int32_t number = 0;
    std::string field_name;
    std::string name;
    std::string desc;
    std::string step_mode;
    std::string unit;
    std::string readback_name;
    std::string readback_desc;
    std::string readback_unit;
    std::vector<double> data;

    friend bool operator==(const positioner_t&, const positioner_t&) = default;
};

struct detector_t {
    std::int32_t number = 0;
    std::string field_name;
    std::string name;
    std::string desc;
    std::string unit;
    std::vector<float> data;

    friend bool operator==(const detector_t&, const detector_t&) = default;
};

struct trigger_t {
    std::int32_t number = 0;
    std::string name;
    float command = 0.0f;

    friend bool operator==(const trigger_t&, const trigger_t&) = default;
};

// =============================================================================
// scan_t - one dimension of a scan, with its inner scans
// =============================================================================
//
// An N-dimensional scan is a tree: the outermost scan has rank N and owns
// one scan of rank N-1 per acquired point. Data vectors hold npts values
// even when fewer (curr_pt) were acquired.
//
// =============================================================================

struct scan_t {
    std::int32_t rank = 1;
    std::int32_t npts = 0;
    std::int32_t curr_pt = 0;
    std::vector<std::int32_t> lower_scan_offsets;
    std::string name;
    std::string time;
    std::vector<positioner_t> positioners;
    std::vector<detector_t> detectors;
    std::vector<trigger_t> triggers;
    std::vector<scan_t> lower_scans;

    friend bool operator==(const scan_t&, const scan_t&) = default;
};

using pv_value_t = std::variant<std::string, std::vector<std::int32_t>, std::vector<float>, std::vector<double>>;

struct extra_pv_t {
    std::string name;
    std::string desc;
    std::string unit;
    dbr_type type = dbr_type::string;
    std::int32_t count = 0;
    pv_value_t value;

    friend bool operator==(const extra_pv_t&, const extra_pv_t&) = default;
};

struct file_t {
    std::string filename;
    float version = layout::VERSION_1_4;
    std::int32_t scan_number = 0;
    std::int32_t rank = 1;
    std::vector<std::int32_t> dimensions;
    std::int32_t is_regular = 1;
    std::int32_t extra_pv_offset = 0;
    scan_t scan;
    std::vector<extra_pv_t> extra_pvs;

    friend bool operator==(const file_t&, const file_t&) = default;
};

// curr_pt of the first scan at each level, outermost first
auto acquired_dimensions(const file_t& file) -> std::vector<std::int32_t>;

// Extra PV by name, or nullptr
auto find_extra_pv(const file_t& file, const std::string& name) -> const extra_pv_t*;

} // namespace mdaio::mda
