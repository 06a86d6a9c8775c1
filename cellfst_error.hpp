#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace cellfst {

// ============================================================================
// errc -- every failure the library reports
// ============================================================================

enum class errc : uint8_t {
    invalid_cell,       // malformed identifier, or key bytes that decode to one
    duplicate_key,      // builder: key equal to the previous key
    out_of_order_key,   // builder: key smaller than the previous key
    corrupt_buffer,     // blob failed a format or integrity check
    io                  // file open / map / read / write failure
};

inline const char* errc_name(errc c) noexcept {
    switch (c) {
    case errc::invalid_cell:     return "invalid cell";
    case errc::duplicate_key:    return "duplicate key";
    case errc::out_of_order_key: return "out of order key";
    case errc::corrupt_buffer:   return "corrupt buffer";
    case errc::io:               return "i/o error";
    }
    return "unknown error";
}

// ============================================================================
// error -- base exception, carries an errc
// ============================================================================

class error : public std::runtime_error {
    errc code_;

public:
    error(errc code, const std::string& what)
        : std::runtime_error(std::string(errc_name(code)) + ": " + what),
          code_(code) {}

    [[nodiscard]] errc code() const noexcept { return code_; }
};

// ============================================================================
// build_error -- ordering violation reported by a container builder
//
// position: zero-based index of the rejected element in the input sequence
// cell:     raw bits of the rejected cell
// ============================================================================

class build_error : public error {
    std::size_t position_;
    uint64_t    cell_;

public:
    build_error(errc code, std::size_t position, uint64_t cell,
                const std::string& what)
        : error(code, what), position_(position), cell_(cell) {}

    [[nodiscard]] std::size_t position() const noexcept { return position_; }
    [[nodiscard]] uint64_t cell() const noexcept { return cell_; }
};

} // namespace cellfst
