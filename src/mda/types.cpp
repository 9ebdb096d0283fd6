// types.cpp - naming helpers and queries over decoded MDA records

#include "mdaio/mda/types.hpp"

namespace mdaio::mda {

auto positioner_field_name(std::int32_t number) -> std::string {
    if (number >= 0 && number < layout::MAX_POSITIONERS) {
        return "P" + std::to_string(number + 1);
    }
    return "?";
}

auto detector_field_name(std::int32_t number) -> std::string {
    if (number >= 0 && number < 15) {
        return std::string("D") + "123456789ABCDEF"[number];
    }
    if (number >= 15 && number < layout::MAX_DETECTORS) {
        auto n = number - 14;
        return std::string("D") + (n < 10 ? "0" : "") + std::to_string(n);
    }
    return "?";
}

auto acquired_dimensions(const file_t& file) -> std::vector<std::int32_t> {
    auto dims = std::vector<std::int32_t>{};
    const scan_t* scan = &file.scan;
    while (scan) {
        dims.push_back(scan->curr_pt);
        scan = scan->lower_scans.empty() ? nullptr : &scan->lower_scans.front();
    }
    return dims;
}

auto find_extra_pv(const file_t& file, const std::string& name) -> const extra_pv_t* {
    for (const auto& pv : file.extra_pvs) {
        if (pv.name == name) return &pv;
    }
    return nullptr;
}

} // namespace mdaio::mda
