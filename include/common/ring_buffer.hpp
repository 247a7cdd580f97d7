#pragma once

#include <cstddef>
#include <stdexcept>
#include <vector>

namespace mpmm {

// Fixed-capacity FIFO. Pushing into a full buffer overwrites the oldest element.
template <class T>
class RingBuffer {
public:
    explicit RingBuffer(std::size_t capacity) : buf_(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("RingBuffer capacity must be positive");
        }
    }

    void push_back(const T& v) {
        buf_[(head_ + size_) % buf_.size()] = v;
        if (size_ == buf_.size()) {
            head_ = (head_ + 1) % buf_.size();
        } else {
            ++size_;
        }
    }

    void pop_front() {
        if (size_ == 0) return;
        head_ = (head_ + 1) % buf_.size();
        --size_;
    }

    // i = 0 is the oldest element
    const T& operator[](std::size_t i) const { return buf_[(head_ + i) % buf_.size()]; }

    const T& front() const { return (*this)[0]; }
    const T& back()  const { return (*this)[size_ - 1]; }

    std::size_t size()     const { return size_; }
    std::size_t capacity() const { return buf_.size(); }
    bool        empty()    const { return size_ == 0; }
    bool        full()     const { return size_ == buf_.size(); }

    void clear() {
        head_ = 0;
        size_ = 0;
    }

private:
    std::vector<T> buf_;
    std::size_t    head_ = 0;
    std::size_t    size_ = 0;
};

} // namespace mpmm
