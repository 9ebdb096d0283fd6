// writer.cpp - implementation of writer_t

#include <fstream>
#include <limits>
#include <variant>
#include "mdaio/mda/writer.hpp"

namespace mdaio::mda {

using xdr::packer;

namespace {

void pack_counted_string(packer& p, const std::string& s) {
    p.pack_int(s.size());
    if (!s.empty()) {
        p.pack_string(s);
    }
}

auto checked_offset(std::int64_t offset) -> std::int32_t {
    if (offset > std::numeric_limits<std::int32_t>::max()) {
        throw format_error("file too large for 32-bit offsets");
    }
    return static_cast<std::int32_t>(offset);
}

void append(xdr::bytes_t& out, const xdr::bytes_t& bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

template <typename T>
auto expect_value(const extra_pv_t& pv) -> const T& {
    if (!std::holds_alternative<T>(pv.value)) {
        throw format_error("extra PV '" + pv.name + "' value does not match " + to_string(pv.type));
    }
    return std::get<T>(pv.value);
}

} // namespace

writer_t::writer_t(logger_t& log) : log_(log) {}

auto writer_t::encode(const file_t& file) -> xdr::bytes_t {
    if (file.rank < 1 || file.rank > layout::MAX_SCAN_RANK) {
        throw format_error("file rank out of range: " + std::to_string(file.rank));
    }
    if (file.dimensions.size() != static_cast<std::size_t>(file.rank)) {
        throw format_error("dimensions do not match file rank");
    }
    if (file.scan.rank != file.rank) {
        throw format_error("outer scan rank does not match file rank");
    }

    auto pack_header = [&](std::int32_t extra_pv_offset) {
        auto p = packer{};
        p.pack_float(file.version);
        p.pack_int(file.scan_number);
        p.pack_int(file.rank);
        p.pack_array(file.dimensions, [](packer& p, std::int32_t n) { p.pack_int(n); });
        p.pack_int(file.is_regular);
        p.pack_int(extra_pv_offset);
        return p.get_buffer();
    };

    auto header_size = static_cast<std::int64_t>(pack_header(0).size());
    auto scans = encode_scan(file.scan, header_size);

    auto extra_pv_offset = std::int32_t{0};
    if (!file.extra_pvs.empty()) {
        extra_pv_offset = checked_offset(header_size + static_cast<std::int64_t>(scans.size()));
    }

    auto out = pack_header(extra_pv_offset);
    append(out, scans);
    if (!file.extra_pvs.empty()) {
        auto p = packer{};
        pack_extra_pvs(p, file.extra_pvs);
        append(out, p.get_buffer());
    }
    log_.info("encoded scan " + std::to_string(file.scan_number) + ": " + std::to_string(out.size()) + " bytes");
    return out;
}

// A scan is laid out as its header and data, followed by its inner scans in
// order; the header is packed twice, the second time with real offsets.
auto writer_t::encode_scan(const scan_t& scan, std::int64_t offset) -> xdr::bytes_t {
    if (scan.rank < 1 || scan.rank > layout::MAX_SCAN_RANK) {
        throw format_error("scan rank out of range: " + std::to_string(scan.rank));
    }
    if (scan.npts < 0 || scan.curr_pt < 0 || scan.curr_pt > scan.npts) {
        throw format_error("invalid point counts in scan '" + scan.name + "'");
    }
    if (scan.lower_scans.size() > static_cast<std::size_t>(scan.curr_pt)) {
        throw format_error("more inner scans than acquired points in scan '" + scan.name + "'");
    }
    if (scan.rank == 1 && !scan.lower_scans.empty()) {
        throw format_error("rank 1 scan '" + scan.name + "' has inner scans");
    }

    auto offsets = std::vector<std::int32_t>(scan.rank > 1 ? static_cast<std::size_t>(scan.npts) : 0, 0);
    auto sizing = packer{};
    pack_scan(sizing, scan, offsets);

    auto next = offset + static_cast<std::int64_t>(sizing.size());
    auto lower = xdr::bytes_t{};
    for (std::size_t i = 0; i < scan.lower_scans.size(); ++i) {
        const auto& inner = scan.lower_scans[i];
        if (inner.rank != scan.rank - 1) {
            throw format_error("inner scan rank " + std::to_string(inner.rank) +
                               " under a rank " + std::to_string(scan.rank) + " scan");
        }
        offsets[i] = checked_offset(next);
        auto bytes = encode_scan(inner, next);
        next += static_cast<std::int64_t>(bytes.size());
        append(lower, bytes);
    }

    auto p = packer{};
    pack_scan(p, scan, offsets);
    auto out = p.get_buffer();
    append(out, lower);
    return out;
}

void writer_t::pack_scan(packer& p, const scan_t& scan, const std::vector<std::int32_t>& offsets) {
    auto npts = static_cast<std::size_t>(scan.npts);

    p.pack_int(scan.rank);
    p.pack_int(scan.npts);
    p.pack_int(scan.curr_pt);
    if (scan.rank > 1) {
        p.pack_array(offsets, [](packer& p, std::int32_t n) { p.pack_int(n); });
    }
    pack_counted_string(p, scan.name);
    pack_counted_string(p, scan.time);
    p.pack_int(scan.positioners.size());
    p.pack_int(scan.detectors.size());
    p.pack_int(scan.triggers.size());

    for (const auto& pos : scan.positioners) {
        p.pack_int(pos.number);
        pack_counted_string(p, pos.name);
        pack_counted_string(p, pos.desc);
        pack_counted_string(p, pos.step_mode);
        pack_counted_string(p, pos.unit);
        pack_counted_string(p, pos.readback_name);
        pack_counted_string(p, pos.readback_desc);
        pack_counted_string(p, pos.readback_unit);
    }
    for (const auto& det : scan.detectors) {
        p.pack_int(det.number);
        pack_counted_string(p, det.name);
        pack_counted_string(p, det.desc);
        pack_counted_string(p, det.unit);
    }
    for (const auto& trig : scan.triggers) {
        p.pack_int(trig.number);
        pack_counted_string(p, trig.name);
        p.pack_float(trig.command);
    }

    for (const auto& pos : scan.positioners) {
        if (pos.data.size() != npts) {
            throw format_error("positioner '" + pos.name + "' has " + std::to_string(pos.data.size()) +
                               " values, expected " + std::to_string(npts));
        }
        p.pack_array(pos.data, [](packer& p, double x) { p.pack_double(x); });
    }
    for (const auto& det : scan.detectors) {
        if (det.data.size() != npts) {
            throw format_error("detector '" + det.name + "' has " + std::to_string(det.data.size()) +
                               " values, expected " + std::to_string(npts));
        }
        p.pack_array(det.data, [](packer& p, float x) { p.pack_float(x); });
    }
}

void writer_t::pack_extra_pvs(packer& p, const std::vector<extra_pv_t>& pvs) {
    p.pack_int(pvs.size());
    for (const auto& pv : pvs) {
        pack_counted_string(p, pv.name);
        pack_counted_string(p, pv.desc);
        p.pack_int(static_cast<std::int32_t>(pv.type));
        if (pv.type != dbr_type::string) {
            if (pv.count < 0) {
                throw format_error("extra PV '" + pv.name + "' has a negative count");
            }
            p.pack_int(pv.count);
            pack_counted_string(p, pv.unit);
        }
        auto count = static_cast<std::size_t>(pv.type == dbr_type::string ? 0 : pv.count);

        auto pack_numbers = [&](const auto& values, auto pack_one) {
            if (values.size() != count) {
                throw format_error("extra PV '" + pv.name + "' has " + std::to_string(values.size()) +
                                   " values, count is " + std::to_string(count));
            }
            p.pack_array(values, pack_one);
        };

        switch (pv.type) {
            case dbr_type::string:
                pack_counted_string(p, expect_value<std::string>(pv));
                break;
            case dbr_type::ctrl_char: {
                const auto& text = expect_value<std::string>(pv);
                if (text.size() > count) {
                    throw format_error("extra PV '" + pv.name + "' text longer than its count");
                }
                for (std::size_t i = 0; i < count; ++i) {
                    p.pack_int(i < text.size() ? static_cast<std::int32_t>(static_cast<unsigned char>(text[i])) : 0);
                }
                break;
            }
            case dbr_type::ctrl_short:
            case dbr_type::ctrl_long:
                pack_numbers(expect_value<std::vector<std::int32_t>>(pv),
                             [](packer& p, std::int32_t x) { p.pack_int(x); });
                break;
            case dbr_type::ctrl_float:
                pack_numbers(expect_value<std::vector<float>>(pv),
                             [](packer& p, float x) { p.pack_float(x); });
                break;
            case dbr_type::ctrl_double:
                pack_numbers(expect_value<std::vector<double>>(pv),
                             [](packer& p, double x) { p.pack_double(x); });
                break;
        }
    }
}

void writer_t::write_file(const std::string& path, const file_t& file) {
    auto bytes = encode(file);
    auto out = std::ofstream(path, std::ios::binary);
    if (!out) {
        throw std::runtime_error("cannot open file '" + path + "' for writing");
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        throw std::runtime_error("failed to write file '" + path + "'");
    }
    log_.debug("wrote " + path);
}

void write_mda(const std::string& path, const file_t& file) {
    auto log = logger_t{};
    writer_t{log}.write_file(path, file);
}

} // namespace mdaio::mda
