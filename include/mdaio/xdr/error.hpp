#pragma once

// Error types raised by the XDR packer and unpacker.

#include <stdexcept>
#include <string>

namespace mdaio::xdr {

// ============================================================================
// error - base of every codec failure
// ============================================================================

class error : public std::runtime_error {
public:
    explicit error(const std::string& what) : std::runtime_error(what) {}
};

// A value failed a range, type or length constraint before being packed
class conversion_error : public error {
public:
    explicit conversion_error(const std::string& what) : error(what) {}
};

// A read would run past the end of the buffer
class insufficient_data_error : public error {
public:
    explicit insufficient_data_error(const std::string& what = "data too short") : error(what) {}
};

// set_position() target outside [0, size]
class position_error : public error {
public:
    explicit position_error(const std::string& what = "position out of range") : error(what) {}
};

// done() found unread bytes
class incomplete_error : public error {
public:
    explicit incomplete_error(const std::string& what = "unpacked data too short") : error(what) {}
};

} // namespace mdaio::xdr
