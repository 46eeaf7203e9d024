#include <magic.h>
#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"

namespace takiyasha {

std::filesystem::path MimeDetector::database_;
std::mutex MimeDetector::mtx_;

namespace {

// magic_t is released on every exit path
class MagicHandle {
public:
    explicit MagicHandle(const std::filesystem::path& database)
        : magic_(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR)) {
        if (!magic_) {
            Logger::log(LogLevel::Warning, "magic_open failed", "libmagic");
            return;
        }
        const std::string db = database.string();
        if (magic_load(magic_, db.empty() ? nullptr : db.c_str()) != 0) {
            const char* err = magic_error(magic_);
            Logger::log(LogLevel::Warning,
                        std::string("magic_load failed: ") + (err ? err : "unknown error"), "libmagic");
            magic_close(magic_);
            magic_ = nullptr;
        }
    }

    ~MagicHandle() {
        if (magic_) {
            magic_close(magic_);
        }
    }

    MagicHandle(const MagicHandle&) = delete;
    MagicHandle& operator=(const MagicHandle&) = delete;

    [[nodiscard]] magic_t get() const noexcept { return magic_; }

private:
    magic_t magic_;
};

} // namespace

std::string MimeDetector::detect(const std::filesystem::path& path) {
    const MagicHandle magic(magic_database());
    if (!magic.get()) return {};
    const char* mime = ::magic_file(magic.get(), path.string().c_str());
    return mime ? mime : "";
}

std::string MimeDetector::detect(const std::span<const std::uint8_t> data) {
    const MagicHandle magic(magic_database());
    if (!magic.get()) return {};
    const char* mime = magic_buffer(magic.get(), data.data(), data.size());
    return mime ? mime : "";
}

void MimeDetector::set_magic_database(const std::filesystem::path& path) {
    std::lock_guard lock(mtx_);
    database_ = path;
}

std::filesystem::path MimeDetector::magic_database() {
    std::lock_guard lock(mtx_);
    return database_;
}

} // namespace takiyasha
