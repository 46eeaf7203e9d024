#include "probe_runner.hpp"
#include "../../../libtakiyasha/include/extension_classifier.hpp"
#include "../../../libtakiyasha/include/file_stream.hpp"
#include "../../../libtakiyasha/include/file_utils.hpp"
#include "../../../libtakiyasha/include/format_sniffer.hpp"
#include "../../../libtakiyasha/include/logger.hpp"
#include "../../../libtakiyasha/include/mime_detector.hpp"
#include "../../../libtakiyasha/include/stream_validator.hpp"
#include <cstdio>

using namespace takiyasha;
namespace fs = std::filesystem;

static const char* probe_tag() {
    return "probe";
}

static std::string describe_failure(const CapabilityError& e) {
    return std::string(capability_to_string(e.capability())) +
           (e.fault() == CapabilityFault::Missing ? " missing" : " faulty");
}

ProbeResult probe_input(const fs::path& input, const bool check_write) {
    ProbeResult r;
    const bool from_stdin = input == "-";
    r.filename = input.string();

    MediaSource source = input;
    if (from_stdin) {
        source = std::static_pointer_cast<IStream>(std::make_shared<FileStream>(stdin, "rb", false));
    }

    std::shared_ptr<IStream> stream;
    try {
        stream = open_source(source, check_write ? "r+b" : "rb");
    } catch (const StreamError& e) {
        Logger::log(LogLevel::Error, e.what(), probe_tag());
        r.error_msg = e.what();
        return r;
    }

    if (from_stdin) {
        r.filename = "<stdin:" + display_name(*stream) + ">";
    } else {
        const std::string name = input.filename().string();
        r.extension = file_extension(name);
        r.scheme = classify_by_name(name).value_or("");
    }

    bool readable = true;
    bool seekable = true;
    try {
        validate(*stream, CapabilityRequest{ true, true, check_write });
        r.stream_ok = true;
    } catch (const CapabilityError& e) {
        Logger::log(LogLevel::Warning, e.what(), probe_tag());
        r.error_msg = describe_failure(e);
        readable = e.capability() != Capability::Read;
        seekable = readable && e.capability() != Capability::Seek;
    }

    if (!readable) {
        if (!from_stdin) {
            r.magic_mime = MimeDetector::detect(input);
        }
        return r;
    }

    try {
        if (seekable && !from_stdin) {
            r.audio_format = identify_stream_format(*stream, FormatDomain::Audio).value_or("");
            r.image_mime = identify_stream_format(*stream, FormatDomain::Image).value_or("");
            r.magic_mime = MimeDetector::detect(input);
        } else {
            // stdin: buffer whatever is left; rewind first if the cursor was moved to the end
            if (seekable) {
                stream->seek(0, SeekOrigin::Begin);
            }
            const auto content = read_to_end(*stream);
            r.audio_format = audio_format(content).value_or("");
            r.image_mime = image_mime(content).value_or("");
            r.magic_mime = MimeDetector::detect(content);
        }
    } catch (const StreamError& e) {
        Logger::log(LogLevel::Error, e.what(), probe_tag());
        r.stream_ok = false;
        r.error_msg = e.what();
    }

    Logger::log(LogLevel::Debug,
                r.filename + ": scheme=" + r.scheme + " audio=" + r.audio_format + " image=" + r.image_mime,
                probe_tag());
    return r;
}
