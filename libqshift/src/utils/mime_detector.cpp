#include <magic.h>
#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"

#include <array>

std::string qshift::MimeDetector::detect(const std::filesystem::path& path)
{
    const magic_t magic = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
    if (!magic) return {};
    if (magic_load(magic, nullptr) != 0)
    {
        Logger::log(LogLevel::Warning, std::string("magic_load failed: ") + magic_error(magic), "libmagic");
        magic_close(magic);
        return {};
    }
    const char* mime = magic_file(magic, path.c_str());
    std::string result = mime ? mime : "";
    magic_close(magic);
    return result;
}

bool qshift::MimeDetector::is_convertible(const std::string_view mime) noexcept
{
    if (mime.starts_with("video/")) return true;
    static constexpr std::array<std::string_view, 3> animated{
        "image/gif", "image/apng", "image/webp"
    };
    for (const auto candidate : animated)
    {
        if (mime == candidate) return true;
    }
    return false;
}
