#pragma once

#include <string>

#include "../log.hpp"
#include "../xdr/packer.hpp"
#include "types.hpp"

namespace mdaio::mda {

// =============================================================================
// writer_t - encodes records back into the MDA layout
// =============================================================================
//
// Lower-scan and extra-PV offsets are computed here; the offsets stored in
// the records are ignored. Data vectors must hold exactly npts values.
//
// =============================================================================

class writer_t {
public:
    explicit writer_t(logger_t& log);

    auto encode(const file_t& file) -> xdr::bytes_t;
    void write_file(const std::string& path, const file_t& file);

private:
    logger_t& log_;

    auto encode_scan(const scan_t& scan, std::int64_t offset) -> xdr::bytes_t;
    void pack_scan(xdr::packer& p, const scan_t& scan, const std::vector<std::int32_t>& offsets);
    void pack_extra_pvs(xdr::packer& p, const std::vector<extra_pv_t>& pvs);
};

// Convenience wrapper with a silent logger
void write_mda(const std::string& path, const file_t& file);

} // namespace mdaio::mda
