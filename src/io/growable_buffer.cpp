#include "io/growable_buffer.hpp"

#include "core/config.hpp"

#include <cstring>

namespace fastxio {

GrowableBuffer::GrowableBuffer(size_t initial_capacity) {
    if (initial_capacity > 0) {
        data_.reset(new char[initial_capacity]);
        capacity_ = initial_capacity;
    }
}

void GrowableBuffer::append(const char* data, size_t n) {
    if (n == 0) return;
    if (size_ + n > capacity_) grow(size_ + n);
    std::memcpy(data_.get() + size_, data, n);
    size_ += n;
}

void GrowableBuffer::grow(size_t min_capacity) {
    size_t new_cap = capacity_ > 0 ? capacity_ : MIN_SIZE_HINT;
    while (new_cap < min_capacity) new_cap *= 2;

    std::unique_ptr<char[]> fresh(new char[new_cap]);
    if (size_ > 0) std::memcpy(fresh.get(), data_.get(), size_);
    data_ = std::move(fresh);
    capacity_ = new_cap;
}

} // namespace fastxio
