#include "../../include/memory_stream.hpp"
#include <algorithm>
#include <limits>

namespace takiyasha {

MemoryStream::MemoryStream(std::vector<std::uint8_t> data, const bool read_only)
    : data_(std::move(data)), read_only_(read_only) {}

std::vector<std::uint8_t> MemoryStream::read(const std::size_t size) {
    if (pos_ >= data_.size()) {
        return {};
    }
    const auto available = static_cast<std::size_t>(data_.size() - pos_);
    const std::size_t count = std::min(size, available);
    const auto first = data_.begin() + static_cast<std::ptrdiff_t>(pos_);
    std::vector<std::uint8_t> out(first, first + static_cast<std::ptrdiff_t>(count));
    pos_ += count;
    return out;
}

std::uint64_t MemoryStream::seek(const std::int64_t offset, const SeekOrigin origin) {
    std::int64_t base = 0;
    switch (origin) {
        case SeekOrigin::Begin:   base = 0; break;
        case SeekOrigin::Current: base = static_cast<std::int64_t>(pos_); break;
        case SeekOrigin::End:     base = static_cast<std::int64_t>(data_.size()); break;
    }
    if (offset > 0 && offset > std::numeric_limits<std::int64_t>::max() - base) {
        throw StreamError("Seek offset " + std::to_string(offset) + " out of range on " + describe());
    }
    const std::int64_t target = base + offset;
    if (target < 0) {
        throw StreamError("Negative seek position " + std::to_string(target) + " on " + describe());
    }
    pos_ = static_cast<std::uint64_t>(target);
    return pos_;
}

std::size_t MemoryStream::write(const std::span<const std::uint8_t> data) {
    if (read_only_) {
        throw StreamError(describe() + " is read-only");
    }
    if (data.empty()) {
        return 0;
    }
    const auto end = static_cast<std::size_t>(pos_) + data.size();
    if (end > data_.size()) {
        data_.resize(end, 0);
    }
    std::copy(data.begin(), data.end(), data_.begin() + static_cast<std::ptrdiff_t>(pos_));
    pos_ = end;
    return data.size();
}

std::string MemoryStream::describe() const {
    return "<MemoryStream size=" + std::to_string(data_.size()) +
           (read_only_ ? " read-only>" : ">");
}

} // namespace takiyasha
