#include "mapped_model.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

std::string errnoMessage(const std::string& action, const std::string& path) {
    return action + " '" + path + "': " + std::strerror(errno);
}

} // namespace

MappedModel MappedModel::open(const std::string& path, int64_t startOffset, int64_t declaredLength) {
    if (startOffset < 0) {
        throw ModelLoadError("Negative start offset for model '" + path + "'");
    }

    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throw ModelLoadError(errnoMessage("Cannot open model", path));
    }

    struct stat st;
    if (fstat(fd, &st) != 0) {
        std::string msg = errnoMessage("Cannot stat model", path);
        ::close(fd);
        throw ModelLoadError(msg);
    }

    const int64_t fileSize = st.st_size;
    const int64_t length = declaredLength == kToEndOfFile ? fileSize - startOffset : declaredLength;
    // Compared without adding offset and length, which may overflow
    if (startOffset > fileSize || length <= 0 || length > fileSize - startOffset) {
        ::close(fd);
        throw ModelLoadError("Model range [" + std::to_string(startOffset) + ", +" +
                             std::to_string(length) + ") is outside '" + path + "' (" +
                             std::to_string(fileSize) + " bytes)");
    }

    // mmap offsets must be page aligned; map from the enclosing page and
    // point data_ at the requested offset.
    const int64_t pageSize = sysconf(_SC_PAGESIZE);
    const int64_t alignedOffset = startOffset - (startOffset % pageSize);
    const size_t delta = static_cast<size_t>(startOffset - alignedOffset);
    const size_t mapLength = static_cast<size_t>(length) + delta;

    void* base = mmap(nullptr, mapLength, PROT_READ, MAP_PRIVATE, fd, alignedOffset);
    if (base == MAP_FAILED) {
        std::string msg = errnoMessage("Cannot map model", path);
        ::close(fd);
        throw ModelLoadError(msg);
    }
    // The mapping stays valid after the descriptor is closed
    ::close(fd);

    MappedModel model;
    model.mapBase = base;
    model.mapLength = mapLength;
    model.data_ = static_cast<const uint8_t*>(base) + delta;
    model.size_ = static_cast<size_t>(length);
    model.path_ = path;
    return model;
}

MappedModel::~MappedModel() {
    release();
}

MappedModel::MappedModel(MappedModel&& other) noexcept
    : mapBase(std::exchange(other.mapBase, nullptr)),
      mapLength(std::exchange(other.mapLength, 0)),
      data_(std::exchange(other.data_, nullptr)),
      size_(std::exchange(other.size_, 0)),
      path_(std::move(other.path_)) {}

MappedModel& MappedModel::operator=(MappedModel&& other) noexcept {
    if (this != &other) {
        release();
        mapBase = std::exchange(other.mapBase, nullptr);
        mapLength = std::exchange(other.mapLength, 0);
        data_ = std::exchange(other.data_, nullptr);
        size_ = std::exchange(other.size_, 0);
        path_ = std::move(other.path_);
    }
    return *this;
}

void MappedModel::release() {
    if (mapBase != nullptr) {
        munmap(mapBase, mapLength);
        mapBase = nullptr;
        mapLength = 0;
        data_ = nullptr;
        size_ = 0;
    }
}
