#include "../../include/stream.hpp"

namespace takiyasha {

std::vector<std::uint8_t> IStream::read(std::size_t /*size*/) {
    throw StreamError(describe() + " has no read operation");
}

std::uint64_t IStream::seek(std::int64_t /*offset*/, SeekOrigin /*origin*/) {
    throw StreamError(describe() + " has no seek operation");
}

std::size_t IStream::write(std::span<const std::uint8_t> /*data*/) {
    throw StreamError(describe() + " has no write operation");
}

} // namespace takiyasha
