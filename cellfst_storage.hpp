#pragma once

#include "cellfst_fst.hpp"
#include "cellfst_mmap.hpp"
#include "cellfst_support.hpp"

#include <concepts>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace cellfst {

// ============================================================================
// frozen_storage -- blob bytes plus the view over them
//
// DATA is any contiguous byte container:
//   std::vector<uint8_t>       owned
//   std::span<const uint8_t>   borrowed, the caller keeps the bytes alive
//   mapped_file                owned mapping of a file
//
// The view is re-pointed at the new bytes on copy and move, so storage
// that relocates its buffer (small strings) stays correct.
// ============================================================================

template <typename DATA>
class frozen_storage {
    DATA     data_;
    fst_view fst_;

public:
    frozen_storage(DATA data, fst_kind kind)
        : data_(std::move(data)),
          fst_(fst_view::open(byte_span(data_), kind)) {}

    frozen_storage(const frozen_storage& o) requires std::copy_constructible<DATA>
        : data_(o.data_), fst_(o.fst_.rebind(byte_span(data_))) {}

    frozen_storage(frozen_storage&& o) noexcept
        : data_(std::move(o.data_)), fst_(o.fst_.rebind(byte_span(data_))) {}

    frozen_storage& operator=(const frozen_storage& o)
        requires std::copy_constructible<DATA> {
        if (this != &o) {
            data_ = o.data_;
            fst_ = o.fst_.rebind(byte_span(data_));
        }
        return *this;
    }

    frozen_storage& operator=(frozen_storage&& o) noexcept {
        if (this != &o) {
            data_ = std::move(o.data_);
            fst_ = o.fst_.rebind(byte_span(data_));
        }
        return *this;
    }

    [[nodiscard]] const fst_view& fst() const noexcept { return fst_; }
    [[nodiscard]] const DATA& data() const noexcept { return data_; }

    [[nodiscard]] std::span<const uint8_t> bytes() const noexcept {
        return fst_.bytes();
    }

    void save(const std::string& path) const { write_file(path, bytes()); }
};

} // namespace cellfst
