#include <cassert>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <string>
#include <variant>
#include <vector>
#include "mdaio/mda.hpp"
#include "mdaio/xdr.hpp"

using namespace mdaio;
using namespace mdaio::mda;

// =============================================================================
// Helpers
// =============================================================================

template<typename E, typename F>
auto throws(F&& f) -> bool {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

auto encode(const file_t& file) -> xdr::bytes_t {
    auto log = logger_t{};
    return writer_t{log}.encode(file);
}

auto decode(const xdr::bytes_t& bytes, options_t options = {}) -> file_t {
    auto log = logger_t{};
    return reader_t{log, options}.decode(bytes, "memory.mda");
}

void pack_counted(xdr::packer& p, const std::string& s) {
    p.pack_int(s.size());
    if (!s.empty()) p.pack_string(s);
}

// =============================================================================
// Test data factories
// =============================================================================

auto make_positioner(std::int32_t number, const std::string& name, std::vector<double> data) -> positioner_t {
    auto p = positioner_t{};
    p.number = number;
    p.field_name = positioner_field_name(number);
    p.name = name;
    p.desc = name + " motor";
    p.step_mode = "LINEAR";
    p.unit = "mm";
    p.readback_name = name + ".RBV";
    p.readback_desc = "";
    p.readback_unit = "mm";
    p.data = std::move(data);
    return p;
}

auto make_detector(std::int32_t number, const std::string& name, std::vector<float> data) -> detector_t {
    auto d = detector_t{};
    d.number = number;
    d.field_name = detector_field_name(number);
    d.name = name;
    d.desc = "";
    d.unit = "counts";
    d.data = std::move(data);
    return d;
}

auto make_1d_scan(const std::string& name, int npts, int curr_pt, double offset) -> scan_t {
    auto scan = scan_t{};
    scan.rank = 1;
    scan.npts = npts;
    scan.curr_pt = curr_pt;
    scan.name = name;
    scan.time = "JUN 01, 2024 12:00:00.000000000";

    auto x = std::vector<double>{};
    auto i0 = std::vector<float>{};
    auto sig = std::vector<float>{};
    for (int i = 0; i < npts; ++i) {
        x.push_back(offset + 0.25 * i);
        i0.push_back(1000.0f + static_cast<float>(i));
        sig.push_back(static_cast<float>(i * i) * 0.5f);
    }
    scan.positioners.push_back(make_positioner(0, "m1", x));
    scan.detectors.push_back(make_detector(0, "I0", i0));
    scan.detectors.push_back(make_detector(16, "sig", sig));

    auto t = trigger_t{};
    t.number = 0;
    t.name = "det:Acquire";
    t.command = 1.0f;
    scan.triggers.push_back(t);
    return scan;
}

auto make_extra_pvs() -> std::vector<extra_pv_t> {
    auto pvs = std::vector<extra_pv_t>{};

    auto s = extra_pv_t{};
    s.name = "sample";
    s.desc = "sample name";
    s.type = dbr_type::string;
    s.value = std::string("LaB6");
    pvs.push_back(s);

    auto c = extra_pv_t{};
    c.name = "operator";
    c.type = dbr_type::ctrl_char;
    c.count = 8;
    c.value = std::string("jdoe");
    pvs.push_back(c);

    auto l = extra_pv_t{};
    l.name = "ring:mode";
    l.desc = "fill pattern";
    l.unit = "";
    l.type = dbr_type::ctrl_long;
    l.count = 2;
    l.value = std::vector<std::int32_t>{24, -1};
    pvs.push_back(l);

    auto f = extra_pv_t{};
    f.name = "temp";
    f.unit = "K";
    f.type = dbr_type::ctrl_float;
    f.count = 1;
    f.value = std::vector<float>{295.5f};
    pvs.push_back(f);

    auto d = extra_pv_t{};
    d.name = "energy";
    d.unit = "keV";
    d.type = dbr_type::ctrl_double;
    d.count = 3;
    d.value = std::vector<double>{8.0, 8.05, 8.1};
    pvs.push_back(d);

    return pvs;
}

auto make_1d_file() -> file_t {
    auto file = file_t{};
    file.version = 1.4f;
    file.scan_number = 7;
    file.rank = 1;
    file.dimensions = {5};
    file.is_regular = 1;
    file.scan = make_1d_scan("xxx:scan1", 5, 5, -1.0);
    file.extra_pvs = make_extra_pvs();
    return file;
}

auto make_2d_file() -> file_t {
    auto outer = scan_t{};
    outer.rank = 2;
    outer.npts = 3;
    outer.curr_pt = 2;
    outer.name = "xxx:scan2";
    outer.time = "JUN 01, 2024 12:00:00.000000000";
    outer.positioners.push_back(make_positioner(1, "m2", {0.0, 1.0, 2.0}));
    outer.detectors.push_back(make_detector(2, "ring", {100.0f, 99.5f, 0.0f}));
    outer.lower_scans.push_back(make_1d_scan("xxx:scan1", 4, 4, 0.0));
    outer.lower_scans.push_back(make_1d_scan("xxx:scan1", 4, 4, 1.0));

    auto file = file_t{};
    file.version = 1.3f;
    file.scan_number = 12;
    file.rank = 2;
    file.dimensions = {3, 4};
    file.scan = outer;
    return file;
}

// A minimal file packed by hand, independent of writer_t
auto make_hand_packed_file() -> xdr::bytes_t {
    auto p = xdr::packer{};
    p.pack_float(1.3f);
    p.pack_int(3);    // scan number
    p.pack_int(1);    // rank
    p.pack_int(2);    // dimensions[0]
    p.pack_int(1);    // is_regular
    p.pack_int(0);    // no extra PVs

    p.pack_int(1);    // scan rank
    p.pack_int(2);    // npts
    p.pack_int(2);    // curr_pt
    pack_counted(p, "ioc:scan1");
    pack_counted(p, "");
    p.pack_int(1);    // np
    p.pack_int(1);    // nd
    p.pack_int(0);    // nt

    p.pack_int(0);
    pack_counted(p, "ioc:m1");
    pack_counted(p, "");
    pack_counted(p, "LINEAR");
    pack_counted(p, "deg");
    pack_counted(p, "");
    pack_counted(p, "");
    pack_counted(p, "");

    p.pack_int(9);
    pack_counted(p, "ioc:scaler1.S2");
    pack_counted(p, "monitor");
    pack_counted(p, "");

    p.pack_double(10.0);
    p.pack_double(10.5);
    p.pack_float(42.0f);
    p.pack_float(43.0f);
    return p.get_buffer();
}

// =============================================================================
// Reader
// =============================================================================

void test_hand_packed() {
    std::cout << "Testing hand-packed 1D file... ";

    auto file = decode(make_hand_packed_file());
    assert(file.filename == "memory.mda");
    assert(file.scan_number == 3);
    assert(file.rank == 1);
    assert(file.dimensions == std::vector<std::int32_t>{2});
    assert(file.extra_pvs.empty());

    const auto& scan = file.scan;
    assert(scan.name == "ioc:scan1");
    assert(scan.time.empty());
    assert(scan.lower_scan_offsets.empty());
    assert(scan.positioners.size() == 1 && scan.detectors.size() == 1);

    const auto& p = scan.positioners[0];
    assert(p.field_name == "P1" && p.name == "ioc:m1" && p.step_mode == "LINEAR" && p.unit == "deg");
    assert(p.desc.empty() && p.readback_name.empty());
    assert(p.data == (std::vector<double>{10.0, 10.5}));

    const auto& d = scan.detectors[0];
    assert(d.field_name == "DA" && d.name == "ioc:scaler1.S2" && d.desc == "monitor");
    assert(d.data == (std::vector<float>{42.0f, 43.0f}));

    std::cout << "PASSED\n";
}

void test_1d_round_trip() {
    std::cout << "Testing 1D write/read... ";

    auto original = make_1d_file();
    auto bytes = encode(original);
    auto loaded = decode(bytes);

    assert(loaded.version == original.version);
    assert(loaded.scan_number == 7);
    assert(loaded.dimensions == original.dimensions);
    assert(loaded.extra_pv_offset > 0);
    assert(loaded.scan == original.scan);
    assert(loaded.extra_pvs == original.extra_pvs);

    // Re-encoding a decoded file reproduces the bytes
    assert(encode(loaded) == bytes);

    const auto* op = find_extra_pv(loaded, "operator");
    assert(op && std::get<std::string>(op->value) == "jdoe" && op->count == 8);
    assert(find_extra_pv(loaded, "missing") == nullptr);

    std::cout << "PASSED\n";
}

void test_2d_round_trip() {
    std::cout << "Testing 2D write/read... ";

    auto original = make_2d_file();
    auto bytes = encode(original);
    auto loaded = decode(bytes);

    assert(loaded.rank == 2);
    assert(loaded.scan.lower_scans.size() == 2);
    assert(loaded.scan.lower_scan_offsets.size() == 3);
    assert(loaded.scan.lower_scan_offsets[0] > 0);
    assert(loaded.scan.lower_scan_offsets[1] > loaded.scan.lower_scan_offsets[0]);
    assert(loaded.scan.lower_scan_offsets[2] == 0);
    assert(loaded.scan.positioners == original.scan.positioners);
    assert(loaded.scan.detectors == original.scan.detectors);
    assert(loaded.scan.lower_scans[0] == original.scan.lower_scans[0]);
    assert(loaded.scan.lower_scans[1] == original.scan.lower_scans[1]);
    assert(loaded.scan.lower_scans[1].positioners[0].data[0] == 1.0);
    assert(acquired_dimensions(loaded) == (std::vector<std::int32_t>{2, 4}));
    assert(encode(loaded) == bytes);

    std::cout << "PASSED\n";
}

void test_skim() {
    std::cout << "Testing skim (headers only)... ";

    auto bytes = encode(make_2d_file());
    auto options = options_t{};
    options.read_data = false;
    auto skimmed = decode(bytes, options);

    assert(skimmed.scan.positioners.size() == 1);
    assert(skimmed.scan.positioners[0].name == "m2");
    assert(skimmed.scan.positioners[0].data.empty());
    assert(skimmed.scan.detectors[0].data.empty());
    assert(skimmed.scan.lower_scans.size() == 2);
    assert(skimmed.scan.lower_scans[1].detectors[1].field_name == "D02");
    assert(skimmed.scan.lower_scans[1].detectors[1].data.empty());

    std::cout << "PASSED\n";
}

void test_max_rank() {
    std::cout << "Testing max_rank limit... ";

    auto options = options_t{};
    options.max_rank = 1;
    auto loaded = decode(encode(make_2d_file()), options);
    assert(loaded.scan.lower_scans.empty());
    assert(loaded.scan.lower_scan_offsets.size() == 3);
    assert(acquired_dimensions(loaded) == (std::vector<std::int32_t>{2}));

    std::cout << "PASSED\n";
}

void test_aborted_outer_scan() {
    std::cout << "Testing zero inner-scan offset... ";

    // Outer scan claims two acquired points but only one inner scan was written
    auto file = make_2d_file();
    auto bytes = encode(file);
    auto loaded = decode(bytes);
    // File header is 5 + rank words; the scan's rank, npts and curr_pt precede its offsets
    auto offsets_at = static_cast<std::size_t>(4 * (5 + file.rank) + 12);
    // Zero the second offset
    for (std::size_t i = 0; i < 4; ++i) {
        bytes[offsets_at + 4 + i] = 0;
    }
    auto truncated = decode(bytes);
    assert(truncated.scan.curr_pt == 2);
    assert(truncated.scan.lower_scans.size() == 1);
    assert(truncated.scan.lower_scans[0] == loaded.scan.lower_scans[0]);

    std::cout << "PASSED\n";
}

// =============================================================================
// Errors
// =============================================================================

void test_bad_version() {
    std::cout << "Testing unsupported version... ";

    auto file = make_1d_file();
    file.version = 2.0f;
    auto bytes = encode(file);
    assert(throws<format_error>([&] { decode(bytes); }));

    file.version = 1.305f;
    assert(decode(encode(file)).scan_number == 7);

    std::cout << "PASSED\n";
}

void test_truncated_file() {
    std::cout << "Testing truncated file... ";

    auto bytes = make_hand_packed_file();
    bytes.resize(bytes.size() - 2);
    assert(throws<xdr::insufficient_data_error>([&] { decode(bytes); }));

    // Skimming seeks over the data block instead of reading it
    auto options = options_t{};
    options.read_data = false;
    assert(throws<xdr::position_error>([&] { decode(bytes, options); }));

    // Every codec failure is an xdr::error
    assert(throws<xdr::error>([&] { decode(xdr::bytes_t{0x3f, 0xa6}); }));

    std::cout << "PASSED\n";
}

void test_bad_layout() {
    std::cout << "Testing malformed layouts... ";

    auto p = xdr::packer{};
    p.pack_float(1.4f);
    p.pack_int(1);
    p.pack_int(1);
    p.pack_int(2);
    p.pack_int(1);
    p.pack_int(0);
    p.pack_int(99);  // scan rank out of range
    assert(throws<format_error>([&] { decode(p.get_buffer()); }));

    auto q = xdr::packer{};
    q.pack_float(1.4f);
    q.pack_int(1);
    q.pack_int(0);  // file rank zero
    assert(throws<format_error>([&] { decode(q.get_buffer()); }));

    auto r = xdr::packer{};
    r.pack_float(1.4f);
    r.pack_int(1);
    r.pack_int(1);
    r.pack_int(5);
    r.pack_int(1);
    r.pack_int(0);
    r.pack_int(1);
    r.pack_int(5);
    r.pack_int(6);  // curr_pt > npts
    assert(throws<format_error>([&] { decode(r.get_buffer()); }));

    std::cout << "PASSED\n";
}

void test_unknown_pv_type() {
    std::cout << "Testing unknown extra PV type... ";

    auto file = make_1d_file();
    file.extra_pvs.resize(1);
    auto bytes = encode(file);

    // Last PV record: counted name, counted desc, type, counted value
    auto u = xdr::unpacker{bytes};
    auto loaded = decode(bytes);
    u.set_position(loaded.extra_pv_offset);
    u.unpack_int();                        // count
    u.unpack_int(); u.unpack_string();     // name
    u.unpack_int(); u.unpack_string();     // desc
    auto type_at = u.get_position();
    bytes[type_at + 3] = 31;               // DBR_CTRL_ENUM is not recorded
    assert(throws<format_error>([&] { decode(bytes); }));

    std::cout << "PASSED\n";
}

void test_writer_rejects() {
    std::cout << "Testing writer validation... ";

    auto file = make_1d_file();
    file.scan.detectors[0].data.pop_back();
    assert(throws<format_error>([&] { encode(file); }));

    file = make_1d_file();
    file.dimensions = {5, 5};
    assert(throws<format_error>([&] { encode(file); }));

    file = make_1d_file();
    file.extra_pvs[2].value = std::vector<double>{1.0, 2.0};
    assert(throws<format_error>([&] { encode(file); }));

    file = make_1d_file();
    file.extra_pvs[1].value = std::string("a name longer than count");
    assert(throws<format_error>([&] { encode(file); }));

    auto two = make_2d_file();
    two.scan.lower_scans[0].rank = 2;
    assert(throws<format_error>([&] { encode(two); }));

    std::cout << "PASSED\n";
}

// =============================================================================
// Names, logging, files
// =============================================================================

void test_field_names() {
    std::cout << "Testing field names... ";

    assert(positioner_field_name(0) == "P1");
    assert(positioner_field_name(3) == "P4");
    assert(positioner_field_name(4) == "?");
    assert(detector_field_name(0) == "D1");
    assert(detector_field_name(8) == "D9");
    assert(detector_field_name(9) == "DA");
    assert(detector_field_name(14) == "DF");
    assert(detector_field_name(15) == "D01");
    assert(detector_field_name(84) == "D70");
    assert(detector_field_name(85) == "?");
    assert(detector_field_name(-1) == "?");
    assert(std::string(to_string(dbr_type::ctrl_double)) == "DBR_CTRL_DOUBLE");

    std::cout << "PASSED\n";
}

void test_reader_logging() {
    std::cout << "Testing reader logging... ";

    auto out = std::ostringstream{};
    auto log = logger_t{out, log_level::debug};
    auto reader = reader_t{log};
    reader.decode(encode(make_2d_file()), "two.mda");

    auto text = out.str();
    assert(text.find("INFO - mdaio - scan 12: rank 2, dimensions 3x4") != std::string::npos);
    assert(text.find("DEBUG - mdaio - ") != std::string::npos);

    auto quiet = std::ostringstream{};
    auto info_log = logger_t{quiet, log_level::warning};
    reader_t{info_log}.decode(encode(make_2d_file()));
    assert(quiet.str().empty());

    std::cout << "PASSED\n";
}

void test_file_io() {
    std::cout << "Testing file write/read... ";

    const char* filename = "test_mda_round_trip.mda";
    auto original = make_2d_file();
    write_mda(filename, original);

    auto loaded = read_mda(filename);
    assert(loaded.filename == filename);
    assert(loaded.scan.lower_scans[0] == original.scan.lower_scans[0]);

    auto skimmed = skim_mda(filename);
    assert(skimmed.scan.positioners[0].data.empty());
    std::remove(filename);

    assert(throws<std::runtime_error>([] { read_mda("does_not_exist.mda"); }));

    std::cout << "PASSED\n";
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== Reader ===\n\n";

    test_hand_packed();
    test_1d_round_trip();
    test_2d_round_trip();
    test_skim();
    test_max_rank();
    test_aborted_outer_scan();

    std::cout << "\n=== Errors ===\n\n";

    test_bad_version();
    test_truncated_file();
    test_bad_layout();
    test_unknown_pv_type();
    test_writer_rejects();

    std::cout << "\n=== Names, Logging, Files ===\n\n";

    test_field_names();
    test_reader_logging();
    test_file_io();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
