#ifndef ASYNC_FILE_TYPES_HPP
#define ASYNC_FILE_TYPES_HPP

#include <asio.hpp>
#include <asio/posix/stream_descriptor.hpp>
#include <memory>
#include <system_error> // For std::error_code
#include <string>       // For std::string
#include <cstdint>
#include <unistd.h>     // For ::open, ::close
#include <fcntl.h>      // For O_RDONLY etc.
#include <sys/stat.h>   // For fstat()

#include "StreamingVerifier.hpp"

// RAII wrapper for asio::posix::stream_descriptor to ensure close() is called.
class SafeStreamDescriptor {
public:
    explicit SafeStreamDescriptor(asio::io_context& io_context)
        : descriptor_(io_context) {}

    // Forbid copying
    SafeStreamDescriptor(const SafeStreamDescriptor&) = delete;
    SafeStreamDescriptor& operator=(const SafeStreamDescriptor&) = delete;

    SafeStreamDescriptor(SafeStreamDescriptor&& other) noexcept
        : descriptor_(std::move(other.descriptor_)) {}

    SafeStreamDescriptor& operator=(SafeStreamDescriptor&& other) noexcept {
        if (this != &other) {
            close(); // Close existing descriptor before move
            descriptor_ = std::move(other.descriptor_);
        }
        return *this;
    }

    ~SafeStreamDescriptor() {
        close();
    }

    void open(const std::string& path, int flags, std::error_code& ec) {
        close();
        int fd = ::open(path.c_str(), flags | O_CLOEXEC, 0666);
        if (fd == -1) {
            ec.assign(errno, std::system_category());
        } else {
            descriptor_.assign(fd, ec);
            if (ec) ::close(fd);
        }
    }

    void close(std::error_code& ec) {
        if (descriptor_.is_open()) {
            descriptor_.close(ec);
        }
    }

    void close() {
        std::error_code ignored_ec;
        close(ignored_ec);
    }

    bool is_open() const {
        return descriptor_.is_open();
    }

    int native_handle() {
        return descriptor_.native_handle();
    }

    // Size of a regular file, or an error for pipes and sockets.
    uint64_t file_size(std::error_code& ec) {
        struct stat st{};
        if (::fstat(native_handle(), &st) == -1) {
            ec.assign(errno, std::system_category());
            return 0;
        }
        if (!S_ISREG(st.st_mode)) {
            ec = std::make_error_code(std::errc::invalid_argument);
            return 0;
        }
        ec.clear();
        return static_cast<uint64_t>(st.st_size);
    }

    // Getter to access the underlying descriptor for Asio free functions
    asio::posix::stream_descriptor& get() { return descriptor_; }
    const asio::posix::stream_descriptor& get() const { return descriptor_; }

private:
    asio::posix::stream_descriptor descriptor_;
};

using async_file_t = SafeStreamDescriptor;

// ByteSource over a descriptor; eof is reported as a zero-length read.
class AsioFileSource : public ByteSource {
public:
    explicit AsioFileSource(async_file_t& file) : file_(file) {}

    size_t read_some(unsigned char* buf, size_t len, std::error_code& ec) override {
        size_t n = file_.get().read_some(asio::buffer(buf, len), ec);
        if (ec == asio::error::eof) {
            ec.clear();
            return 0;
        }
        return n;
    }

private:
    async_file_t& file_;
};

class AsioFileSink : public ByteSink {
public:
    explicit AsioFileSink(async_file_t& file) : file_(file) {}

    void write(const unsigned char* buf, size_t len, std::error_code& ec) override {
        asio::write(file_.get(), asio::buffer(buf, len), ec);
    }

private:
    async_file_t& file_;
};

#endif // ASYNC_FILE_TYPES_HPP
