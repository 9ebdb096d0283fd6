#pragma once

#include <string>
#include <tuple>

#include "../config.hpp"
#include "../log.hpp"
#include "../xdr/unpacker.hpp"
#include "types.hpp"

namespace mdaio::mda {

// =============================================================================
// Reader options
// =============================================================================

struct options_t {
    int max_rank = layout::DEFAULT_MAX_RANK;  // scans deeper than this are not decoded
    bool read_data = true;                    // false: headers only, data blocks skipped
};

inline auto fields(const options_t& o) {
    return std::make_tuple(field("max_rank", o.max_rank), field("read_data", o.read_data));
}

inline auto fields(options_t& o) {
    return std::make_tuple(field("max_rank", o.max_rank), field("read_data", o.read_data));
}

// =============================================================================
// reader_t - decodes MDA files into records
// =============================================================================
//
// Issues the unpacker calls in the order the file layout defines. Codec
// errors (xdr::insufficient_data_error, xdr::position_error) propagate as
// raised; layout violations are reported as format_error. One reader may be
// used for many files; each call builds its own unpacker.
//
// =============================================================================

class reader_t {
public:
    explicit reader_t(logger_t& log, options_t options = {});

    auto read_file(const std::string& path) -> file_t;
    auto decode(xdr::bytes_t data, const std::string& filename = "") -> file_t;

    auto options() const -> const options_t& { return options_; }

private:
    logger_t& log_;
    options_t options_;

    auto read_scan(xdr::unpacker& u, int depth) -> scan_t;
    auto read_extra_pvs(xdr::unpacker& u) -> std::vector<extra_pv_t>;
    void skip_data(xdr::unpacker& u, const scan_t& scan);
};

// Read a whole file from disk
auto read_bytes(const std::string& path) -> xdr::bytes_t;

// Convenience wrappers with a silent logger
auto read_mda(const std::string& path, options_t options = {}) -> file_t;
auto skim_mda(const std::string& path) -> file_t;

} // namespace mdaio::mda
