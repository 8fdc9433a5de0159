#include "sanityml/io/mapped_file.hpp"
#include "sanityml/errors.hpp"

#include <fstream>
#include <system_error>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace sanityml {
namespace io {

// ============================================================================
// MappedFile Implementation
// ============================================================================

void MappedFile::close_handles() {
    if (data_ && data_ != MAP_FAILED) {
        munmap(data_, size_);
        data_ = nullptr;
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    size_ = 0;
}

MappedFile::~MappedFile() {
    close_handles();
}

MappedFile::MappedFile(MappedFile&& other) noexcept
    : data_(other.data_)
    , size_(other.size_)
    , fd_(other.fd_) {
    other.data_ = nullptr;
    other.size_ = 0;
    other.fd_ = -1;
}

MappedFile& MappedFile::operator=(MappedFile&& other) noexcept {
    if (this != &other) {
        close_handles();
        data_ = other.data_;
        size_ = other.size_;
        fd_ = other.fd_;
        other.data_ = nullptr;
        other.size_ = 0;
        other.fd_ = -1;
    }
    return *this;
}

std::unique_ptr<MappedFile> MappedFile::open(const fs::path& path) {
    auto file = std::make_unique<MappedFile>();

    file->fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (file->fd_ < 0) {
        return nullptr;
    }

    struct stat st;
    if (fstat(file->fd_, &st) < 0 || !S_ISREG(st.st_mode)) {
        return nullptr;
    }
    file->size_ = static_cast<size_t>(st.st_size);

    if (file->size_ == 0) {
        return nullptr;
    }

    file->data_ = mmap(nullptr, file->size_, PROT_READ, MAP_PRIVATE, file->fd_, 0);
    if (file->data_ == MAP_FAILED) {
        file->data_ = nullptr;
        return nullptr;
    }

    return file;
}

void MappedFile::advise_sequential() {
    if (data_) {
        madvise(data_, size_, MADV_SEQUENTIAL);
    }
}

// ============================================================================
// FileBuffer
// ============================================================================

FileBuffer FileBuffer::load(const fs::path& path, uint64_t max_bytes) {
    std::error_code ec;
    uint64_t size = fs::file_size(path, ec);
    if (ec) {
        throw ArtifactReadError("Cannot stat " + sanitize_path_for_error(path.string()) +
                                ": " + ec.message());
    }
    if (size > max_bytes) {
        throw StreamTooLargeError("File size " + std::to_string(size) + " exceeds limit of " +
                                  std::to_string(max_bytes) + " bytes", 0);
    }

    FileBuffer buffer;
    if (size == 0) {
        return buffer;
    }

    buffer.mapped_ = MappedFile::open(path);
    if (buffer.mapped_) {
        buffer.mapped_->advise_sequential();
        return buffer;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw ArtifactReadError("Cannot open " + sanitize_path_for_error(path.string()));
    }
    buffer.owned_.resize(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.owned_.data()),
                   static_cast<std::streamsize>(size))) {
        throw ArtifactReadError("Failed to read " + sanitize_path_for_error(path.string()));
    }
    return buffer;
}

ByteView FileBuffer::view() const {
    if (mapped_) {
        return ByteView(mapped_->data(), mapped_->size());
    }
    return ByteView(owned_.data(), owned_.size());
}

} // namespace io
} // namespace sanityml
