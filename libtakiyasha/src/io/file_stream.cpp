#include "../../include/file_stream.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <cerrno>
#include <cstring>

#ifdef _WIN32
#include <io.h>
#define fileno _fileno
#else
#include <sys/types.h>
#endif

namespace takiyasha {

static const char* stream_tag() {
    return "FileStream";
}

static std::string errno_message() {
    return std::strerror(errno);
}

FileStream::FileStream(const std::filesystem::path& path, const std::string& mode)
    : mode_(mode), name_(path.string()) {
    parse_mode(mode);
    file_ = open_file(path, mode.c_str());
    if (!file_) {
        throw StreamError("Cannot open '" + path.string() + "' (" + errno_message() + ")");
    }
    Logger::log(LogLevel::Debug, "Opened " + path.string() + " mode=" + mode, stream_tag());
}

FileStream::FileStream(std::FILE* file, const std::string& mode, const bool owns)
    : file_(file), owns_(owns), mode_(mode) {
    if (!file_) {
        throw StreamError("Cannot wrap a null FILE handle");
    }
    // the destructor does not run if the constructor throws
    try {
        parse_mode(mode);
    } catch (const StreamError&) {
        if (owns_) {
            std::fclose(file_);
        }
        throw;
    }
    name_ = fileno(file_);
}

FileStream::~FileStream() {
    if (file_ && owns_) {
        std::fclose(file_);
    }
}

void FileStream::parse_mode(const std::string& mode) {
    if (mode.empty()) {
        throw StreamError("Empty file mode");
    }
    switch (mode.front()) {
        case 'r':
            readable_ = true;
            break;
        case 'w':
        case 'a':
        case 'x':
            writable_ = true;
            break;
        default:
            throw StreamError("Invalid file mode '" + mode + "'");
    }
    if (mode.find('+') != std::string::npos) {
        readable_ = true;
        writable_ = true;
    }
    binary_ = mode.find('b') != std::string::npos;
}

std::vector<std::uint8_t> FileStream::read(const std::size_t size) {
    if (!readable_) {
        throw StreamError(describe() + " is not readable");
    }
    std::vector<std::uint8_t> buffer(size);
    if (size == 0) {
        return buffer;
    }
    const std::size_t got = std::fread(buffer.data(), 1, size, file_);
    if (got < size && std::ferror(file_)) {
        std::clearerr(file_);
        throw StreamError("Read failed on " + describe());
    }
    buffer.resize(got);
    return buffer;
}

std::uint64_t FileStream::seek(const std::int64_t offset, const SeekOrigin origin) {
    int whence = SEEK_SET;
    switch (origin) {
        case SeekOrigin::Begin:   whence = SEEK_SET; break;
        case SeekOrigin::Current: whence = SEEK_CUR; break;
        case SeekOrigin::End:     whence = SEEK_END; break;
    }
#ifdef _WIN32
    if (_fseeki64(file_, offset, whence) != 0) {
        throw StreamError("Seek failed on " + describe() + " (" + errno_message() + ")");
    }
    const auto pos = _ftelli64(file_);
#else
    if (fseeko(file_, static_cast<off_t>(offset), whence) != 0) {
        throw StreamError("Seek failed on " + describe() + " (" + errno_message() + ")");
    }
    const auto pos = ftello(file_);
#endif
    if (pos < 0) {
        throw StreamError("Cannot report position of " + describe() + " (" + errno_message() + ")");
    }
    return static_cast<std::uint64_t>(pos);
}

std::size_t FileStream::write(const std::span<const std::uint8_t> data) {
    if (!writable_) {
        throw StreamError(describe() + " is not writable");
    }
    if (data.empty()) {
        return 0;
    }
    const std::size_t written = std::fwrite(data.data(), 1, data.size(), file_);
    if (written != data.size()) {
        throw StreamError("Write failed on " + describe() + " (" + errno_message() + ")");
    }
    return written;
}

std::string FileStream::describe() const {
    std::string label;
    if (const auto* text = std::get_if<std::string>(&name_)) {
        label = "'" + *text + "'";
    } else if (const auto* fd = std::get_if<int>(&name_)) {
        label = std::to_string(*fd);
    }
    return "<FileStream name=" + label + " mode='" + mode_ + "'>";
}

} // namespace takiyasha
