/**
 * @file stream_validator.hpp
 * @brief Checks that a stream supports what a decoder is about to do with it.
 */

#ifndef TAKIYASHA_STREAM_VALIDATOR_HPP
#define TAKIYASHA_STREAM_VALIDATOR_HPP

#include "stream.hpp"
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace takiyasha {

enum class Capability {
    Read,
    Seek,
    Write
};

enum class CapabilityFault {
    Missing, ///< The stream does not expose the operation at all
    Faulty   ///< The operation exists but failed, or yielded text instead of bytes
};

const char* capability_to_string(Capability capability);

/**
 * @brief A required stream capability is missing or broken.
 */
class CapabilityError : public std::runtime_error {
public:
    CapabilityError(Capability capability, CapabilityFault fault, const std::string& message);

    [[nodiscard]] Capability capability() const noexcept { return capability_; }
    [[nodiscard]] CapabilityFault fault() const noexcept { return fault_; }

private:
    Capability capability_;
    CapabilityFault fault_;
};

/**
 * @brief Which probes validate() runs. Probing order is always read, seek, write.
 */
struct CapabilityRequest {
    bool read = true;
    bool seek = true;
    bool write = false;
};

/**
 * @brief Anything a caller may hand in as media input.
 *
 * Text and paths name a file still to be opened; a byte buffer is content
 * already in memory; only a stream handle is used as it is.
 */
using MediaSource = std::variant<std::string,
                                 std::vector<std::uint8_t>,
                                 std::filesystem::path,
                                 std::shared_ptr<IStream>>;

/**
 * @brief Probe @p stream for the capabilities in @p request.
 *
 * - read: a zero-length read must succeed on a binary stream
 * - seek: a seek to end of stream must succeed
 * - write: a zero-length write must succeed
 *
 * Stops at the first failing probe.
 *
 * @warning The seek probe leaves the cursor at end of stream. Callers that
 * read afterwards must seek back themselves.
 *
 * @throws CapabilityError naming the capability and whether it is missing
 * or faulty.
 */
void validate(IStream& stream, const CapabilityRequest& request = {});

/**
 * @return True if @p source is an open stream handle rather than a name,
 * a path or raw bytes.
 */
[[nodiscard]] bool is_stream_like(const MediaSource& source) noexcept;

/**
 * @brief Name of a stream for diagnostics.
 * @return The textual name, a descriptor number as text, or "" if unnamed.
 */
std::string display_name(const IStream& stream);

/**
 * @brief Turn a source into a stream.
 *
 * Stream-like sources are returned unchanged. Strings and paths are opened
 * as FileStream with @p mode; byte buffers are wrapped in a MemoryStream.
 *
 * @throws StreamError if a file cannot be opened or the stream handle is null.
 */
std::shared_ptr<IStream> open_source(const MediaSource& source, const std::string& mode = "rb");

} // namespace takiyasha

#endif // TAKIYASHA_STREAM_VALIDATOR_HPP
