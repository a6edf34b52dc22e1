#pragma once

#include <cstddef>
#include <memory>
#include <string_view>

namespace fastxio {

// Owned character store whose capacity only grows (doubling).
// clear() resets the length and keeps the allocation for the next record.
class GrowableBuffer {
public:
    explicit GrowableBuffer(size_t initial_capacity = 0);

    GrowableBuffer(const GrowableBuffer&) = delete;
    GrowableBuffer& operator=(const GrowableBuffer&) = delete;
    GrowableBuffer(GrowableBuffer&&) noexcept = default;
    GrowableBuffer& operator=(GrowableBuffer&&) noexcept = default;

    // Throws std::bad_alloc if growth fails; contents are kept in that case.
    void append(const char* data, size_t n);
    void append(std::string_view s) { append(s.data(), s.size()); }

    void clear() { size_ = 0; }
    void pop_back() { if (size_ > 0) size_--; }

    const char* data() const { return data_.get(); }
    size_t size() const { return size_; }
    size_t capacity() const { return capacity_; }
    bool empty() const { return size_ == 0; }
    char back() const { return data_[size_ - 1]; }

    std::string_view view() const { return std::string_view(data_.get(), size_); }

private:
    void grow(size_t min_capacity);

    std::unique_ptr<char[]> data_;
    size_t size_ = 0;
    size_t capacity_ = 0;
};

} // namespace fastxio
