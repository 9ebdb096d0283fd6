// reader.cpp - implementation of reader_t

#include <cmath>
#include <fstream>
#include <iterator>
#include <sstream>
#include "mdaio/mda/reader.hpp"

namespace mdaio::mda {

using xdr::unpacker;

namespace {

auto supported_version(float version) -> bool {
    return std::abs(version - layout::VERSION_1_3) <= layout::VERSION_TOLERANCE ||
           std::abs(version - layout::VERSION_1_4) <= layout::VERSION_TOLERANCE;
}

// int length, then an XDR string only when the length is non-zero
auto read_counted_string(unpacker& u) -> std::string {
    auto length = u.unpack_int();
    if (length < 0) {
        throw format_error("negative string length");
    }
    return length ? u.unpack_string() : std::string{};
}

auto read_count(unpacker& u, const char* what) -> std::int32_t {
    auto n = u.unpack_int();
    if (n < 0) {
        throw format_error(std::string("negative ") + what);
    }
    return n;
}

auto join(const std::vector<std::int32_t>& v) -> std::string {
    auto oss = std::ostringstream{};
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (i > 0) oss << "x";
        oss << v[i];
    }
    return oss.str();
}

} // namespace

reader_t::reader_t(logger_t& log, options_t options)
    : log_(log), options_(options) {}

auto reader_t::read_file(const std::string& path) -> file_t {
    log_.debug("reading " + path);
    return decode(read_bytes(path), path);
}

auto reader_t::decode(xdr::bytes_t data, const std::string& filename) -> file_t {
    auto u = unpacker{std::move(data)};
    auto file = file_t{};
    file.filename = filename;

    file.version = u.unpack_float();
    if (!supported_version(file.version)) {
        throw format_error("unsupported MDA version " + std::to_string(file.version));
    }
    file.scan_number = u.unpack_int();
    file.rank = u.unpack_int();
    if (file.rank < 1 || file.rank > layout::MAX_SCAN_RANK) {
        throw format_error("file rank out of range: " + std::to_string(file.rank));
    }
    file.dimensions = u.unpack_array(&unpacker::unpack_int, static_cast<std::size_t>(file.rank));
    file.is_regular = u.unpack_int();
    file.extra_pv_offset = u.unpack_int();

    log_.info("scan " + std::to_string(file.scan_number) + ": rank " + std::to_string(file.rank) +
              ", dimensions " + join(file.dimensions));

    file.scan = read_scan(u, 1);
    if (file.scan.rank != file.rank) {
        throw format_error("outer scan rank " + std::to_string(file.scan.rank) +
                           " does not match file rank " + std::to_string(file.rank));
    }

    if (file.extra_pv_offset < 0) {
        throw format_error("negative extra PV offset");
    }
    if (file.extra_pv_offset > 0) {
        u.set_position(file.extra_pv_offset);
        file.extra_pvs = read_extra_pvs(u);
        log_.debug(std::to_string(file.extra_pvs.size()) + " extra PVs");
    }
    return file;
}

auto reader_t::read_scan(unpacker& u, int depth) -> scan_t {
    auto scan = scan_t{};
    scan.rank = u.unpack_int();
    if (scan.rank < 1 || scan.rank > layout::MAX_SCAN_RANK) {
        throw format_error("scan rank out of range: " + std::to_string(scan.rank));
    }
    scan.npts = read_count(u, "npts");
    scan.curr_pt = read_count(u, "curr_pt");
    if (scan.curr_pt > scan.npts) {
        throw format_error("curr_pt " + std::to_string(scan.curr_pt) +
                           " exceeds npts " + std::to_string(scan.npts));
    }
    // Offsets past curr_pt point at scans that were planned but never written
    if (scan.rank > 1) {
        scan.lower_scan_offsets = u.unpack_array(&unpacker::unpack_int, static_cast<std::size_t>(scan.npts));
    }
    scan.name = read_counted_string(u);
    scan.time = read_counted_string(u);

    auto np = read_count(u, "positioner count");
    auto nd = read_count(u, "detector count");
    auto nt = read_count(u, "trigger count");

    for (std::int32_t j = 0; j < np; ++j) {
        auto p = positioner_t{};
        p.number = u.unpack_int();
        p.field_name = positioner_field_name(p.number);
        p.name = read_counted_string(u);
        p.desc = read_counted_string(u);
        p.step_mode = read_counted_string(u);
        p.unit = read_counted_string(u);
        p.readback_name = read_counted_string(u);
        p.readback_desc = read_counted_string(u);
        p.readback_unit = read_counted_string(u);
        scan.positioners.push_back(std::move(p));
    }
    for (std::int32_t j = 0; j < nd; ++j) {
        auto d = detector_t{};
        d.number = u.unpack_int();
        d.field_name = detector_field_name(d.number);
        d.name = read_counted_string(u);
        d.desc = read_counted_string(u);
        d.unit = read_counted_string(u);
        scan.detectors.push_back(std::move(d));
    }
    for (std::int32_t j = 0; j < nt; ++j) {
        auto t = trigger_t{};
        t.number = u.unpack_int();
        t.name = read_counted_string(u);
        t.command = u.unpack_float();
        scan.triggers.push_back(std::move(t));
    }

    log_.debug("  " + std::string(static_cast<std::size_t>(depth - 1) * 2, ' ') + scan.name +
               ": rank " + std::to_string(scan.rank) +
               ", " + std::to_string(scan.curr_pt) + "/" + std::to_string(scan.npts) + " points, " +
               std::to_string(np) + " positioners, " + std::to_string(nd) + " detectors");

    if (options_.read_data) {
        auto n = static_cast<std::size_t>(scan.npts);
        for (auto& p : scan.positioners) {
            p.data = u.unpack_array(&unpacker::unpack_double, n);
        }
        for (auto& d : scan.detectors) {
            d.data = u.unpack_array(&unpacker::unpack_float, n);
        }
    } else {
        skip_data(u, scan);
    }

    if (scan.rank > 1 && depth < options_.max_rank) {
        for (std::int32_t i = 0; i < scan.curr_pt; ++i) {
            auto offset = scan.lower_scan_offsets[static_cast<std::size_t>(i)];
            if (offset == 0) {
                log_.warning("scan '" + scan.name + "' ends after " + std::to_string(i) + " inner scans");
                break;
            }
            u.set_position(offset);
            auto lower = read_scan(u, depth + 1);
            if (lower.rank != scan.rank - 1) {
                throw format_error("inner scan rank " + std::to_string(lower.rank) +
                                   " under a rank " + std::to_string(scan.rank) + " scan");
            }
            scan.lower_scans.push_back(std::move(lower));
        }
    }
    return scan;
}

void reader_t::skip_data(unpacker& u, const scan_t& scan) {
    auto points = static_cast<std::int64_t>(scan.npts);
    auto bytes = points * layout::POSITIONER_VALUE_SIZE * static_cast<std::int64_t>(scan.positioners.size()) +
                 points * layout::DETECTOR_VALUE_SIZE * static_cast<std::int64_t>(scan.detectors.size());
    u.set_position(static_cast<std::int64_t>(u.get_position()) + bytes);
}

auto reader_t::read_extra_pvs(unpacker& u) -> std::vector<extra_pv_t> {
    auto count = read_count(u, "extra PV count");
    auto pvs = std::vector<extra_pv_t>{};
    for (std::int32_t i = 0; i < count; ++i) {
        auto pv = extra_pv_t{};
        pv.name = read_counted_string(u);
        pv.desc = read_counted_string(u);
        pv.type = to_dbr_type(u.unpack_int());
        if (pv.type != dbr_type::string) {
            pv.count = read_count(u, "extra PV element count");
            pv.unit = read_counted_string(u);
        }
        auto n = static_cast<std::size_t>(pv.count);
        switch (pv.type) {
            case dbr_type::string:
                pv.value = read_counted_string(u);
                break;
            case dbr_type::ctrl_char: {
                auto chars = u.unpack_array(&unpacker::unpack_int, n);
                auto text = std::string{};
                for (auto c : chars) {
                    if (c == 0) break;
                    text += static_cast<char>(c);
                }
                pv.value = std::move(text);
                break;
            }
            case dbr_type::ctrl_short:
            case dbr_type::ctrl_long:
                pv.value = u.unpack_array(&unpacker::unpack_int, n);
                break;
            case dbr_type::ctrl_float:
                pv.value = u.unpack_array(&unpacker::unpack_float, n);
                break;
            case dbr_type::ctrl_double:
                pv.value = u.unpack_array(&unpacker::unpack_double, n);
                break;
        }
        pvs.push_back(std::move(pv));
    }
    return pvs;
}

auto read_bytes(const std::string& path) -> xdr::bytes_t {
    auto file = std::ifstream(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("cannot open file '" + path + "'");
    }
    auto data = xdr::bytes_t(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw std::runtime_error("failed to read file '" + path + "'");
    }
    return data;
}

auto read_mda(const std::string& path, options_t options) -> file_t {
    auto log = logger_t{};
    return reader_t{log, options}.read_file(path);
}

auto skim_mda(const std::string& path) -> file_t {
    auto options = options_t{};
    options.read_data = false;
    return read_mda(path, options);
}

} // namespace mdaio::mda
