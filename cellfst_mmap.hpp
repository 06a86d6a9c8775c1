#pragma once

#include "cellfst_error.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iterator>
#include <span>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace cellfst {

namespace detail {

[[noreturn]] inline void throw_io(const std::string& what,
                                  const std::string& path, int err) {
    throw error(errc::io, what + " '" + path + "': " + std::strerror(err));
}

} // namespace detail

// ============================================================================
// mapped_file -- read-only private mapping of a whole file
//
// Move-only. An empty file maps to an empty byte range.
// ============================================================================

class mapped_file {
    const uint8_t* data_ = nullptr;
    std::size_t    size_ = 0;

    void release() noexcept {
        if (data_) munmap(const_cast<uint8_t*>(data_), size_);
        data_ = nullptr;
        size_ = 0;
    }

public:
    mapped_file() = default;

    explicit mapped_file(const std::string& path) {
        int fd = ::open(path.c_str(), O_RDONLY);
        if (fd == -1) detail::throw_io("open failed for", path, errno);

        struct stat sb;
        if (fstat(fd, &sb) == -1) {
            int err = errno;
            ::close(fd);
            detail::throw_io("stat failed for", path, err);
        }

        std::size_t sz = static_cast<std::size_t>(sb.st_size);
        if (sz > 0) {
            void* ptr = mmap(nullptr, sz, PROT_READ, MAP_PRIVATE, fd, 0);
            if (ptr == MAP_FAILED) {
                int err = errno;
                ::close(fd);
                detail::throw_io("mmap failed for", path, err);
            }
            data_ = static_cast<const uint8_t*>(ptr);
            size_ = sz;
        }
        // The mapping stays valid after the descriptor is closed.
        ::close(fd);
    }

    ~mapped_file() { release(); }

    mapped_file(const mapped_file&) = delete;
    mapped_file& operator=(const mapped_file&) = delete;

    mapped_file(mapped_file&& o) noexcept : data_(o.data_), size_(o.size_) {
        o.data_ = nullptr;
        o.size_ = 0;
    }

    mapped_file& operator=(mapped_file&& o) noexcept {
        if (this != &o) {
            release();
            data_ = o.data_;
            size_ = o.size_;
            o.data_ = nullptr;
            o.size_ = 0;
        }
        return *this;
    }

    [[nodiscard]] const uint8_t* data() const noexcept { return data_; }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }
};

// ============================================================================
// Whole-file helpers
// ============================================================================

inline std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) detail::throw_io("open failed for", path, errno);
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
    if (in.bad()) detail::throw_io("read failed for", path, errno);
    return bytes;
}

inline void write_file(const std::string& path, std::span<const uint8_t> bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) detail::throw_io("open failed for", path, errno);
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) detail::throw_io("write failed for", path, errno);
}

} // namespace cellfst
