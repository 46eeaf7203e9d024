#include "../../include/stream_validator.hpp"
#include "../../include/file_stream.hpp"
#include "../../include/logger.hpp"
#include "../../include/memory_stream.hpp"

namespace takiyasha {

static const char* validator_tag() {
    return "StreamValidator";
}

const char* capability_to_string(const Capability capability) {
    switch (capability) {
        case Capability::Read:  return "read";
        case Capability::Seek:  return "seek";
        case Capability::Write: return "write";
    }
    return "";
}

CapabilityError::CapabilityError(const Capability capability,
                                 const CapabilityFault fault,
                                 const std::string& message)
    : std::runtime_error(message), capability_(capability), fault_(fault) {}

namespace {

[[noreturn]] void fail(const Capability capability, const CapabilityFault fault, const std::string& message) {
    Logger::log(LogLevel::Debug, message, validator_tag());
    throw CapabilityError(capability, fault, message);
}

// Missing when the operation is not exposed, Faulty when it throws
template <typename Probe>
void probe(const IStream& stream, const Capability capability, const bool exposed,
           const std::string& verb, Probe&& op) {
    if (!exposed) {
        fail(capability, CapabilityFault::Missing,
             stream.describe() + " not a valid stream (no " + capability_to_string(capability) + " operation)");
    }
    try {
        op();
    } catch (const std::exception& e) {
        fail(capability, CapabilityFault::Faulty,
             "cannot " + verb + " stream " + stream.describe() + ": " + e.what());
    }
}

} // namespace

void validate(IStream& stream, const CapabilityRequest& request) {
    if (request.read) {
        probe(stream, Capability::Read, stream.has_read(), "read from",
              [&] { static_cast<void>(stream.read(0)); });
        if (!stream.is_binary()) {
            fail(Capability::Read, CapabilityFault::Faulty,
                 "stream " + stream.describe() + " not opened in binary mode");
        }
    }

    if (request.seek) {
        // cursor stays at the end
        probe(stream, Capability::Seek, stream.has_seek(), "seek in",
              [&] { static_cast<void>(stream.seek(0, SeekOrigin::End)); });
    }

    if (request.write) {
        probe(stream, Capability::Write, stream.has_write(), "write to",
              [&] { static_cast<void>(stream.write({})); });
    }
}

bool is_stream_like(const MediaSource& source) noexcept {
    const auto* handle = std::get_if<std::shared_ptr<IStream>>(&source);
    return handle != nullptr && *handle != nullptr;
}

std::string display_name(const IStream& stream) {
    const StreamName name = stream.name();
    if (const auto* text = std::get_if<std::string>(&name)) {
        return *text;
    }
    if (const auto* fd = std::get_if<int>(&name)) {
        return std::to_string(*fd);
    }
    return {};
}

std::shared_ptr<IStream> open_source(const MediaSource& source, const std::string& mode) {
    if (is_stream_like(source)) {
        return std::get<std::shared_ptr<IStream>>(source);
    }
    if (const auto* text = std::get_if<std::string>(&source)) {
        return std::make_shared<FileStream>(std::filesystem::path(*text), mode);
    }
    if (const auto* path = std::get_if<std::filesystem::path>(&source)) {
        return std::make_shared<FileStream>(*path, mode);
    }
    if (const auto* bytes = std::get_if<std::vector<std::uint8_t>>(&source)) {
        return std::make_shared<MemoryStream>(*bytes);
    }
    throw StreamError("Null stream handle given as media source");
}

} // namespace takiyasha
