#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

// Thrown when a model asset cannot be opened, mapped or accepted by the engine
class ModelLoadError : public std::runtime_error {
public:
    explicit ModelLoadError(const std::string& what) : std::runtime_error(what) {}
};

// Read-only memory mapping of a byte range inside a model file.
// The range is what an asset file descriptor describes: a start offset and a
// declared length. Weights stay in the page cache instead of being copied to
// the heap.
class MappedModel {
public:
    // Passed as declaredLength to map from startOffset to the end of the file
    static constexpr int64_t kToEndOfFile = -1;

    static MappedModel open(const std::string& path,
                            int64_t startOffset = 0,
                            int64_t declaredLength = kToEndOfFile);

    MappedModel() = default;
    ~MappedModel();

    MappedModel(MappedModel&& other) noexcept;
    MappedModel& operator=(MappedModel&& other) noexcept;
    MappedModel(const MappedModel&) = delete;
    MappedModel& operator=(const MappedModel&) = delete;

    const void* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return data_ == nullptr; }
    const std::string& path() const { return path_; }

private:
    void release();

    // Start of the page-aligned region returned by mmap
    void* mapBase = nullptr;
    size_t mapLength = 0;

    // Requested range inside that region
    const void* data_ = nullptr;
    size_t size_ = 0;

    std::string path_;
};
