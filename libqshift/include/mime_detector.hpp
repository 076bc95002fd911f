/**
 * @file mime_detector.hpp
 * @brief Content-based file type detection.
 */

#ifndef QSHIFT_MIME_DETECTOR_HPP
#define QSHIFT_MIME_DETECTOR_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace qshift {

/**
 * @brief Detects MIME types with libmagic.
 */
class MimeDetector {
public:
    /**
     * @brief Detect the MIME type of a file.
     *
     * @param path The filesystem path to the file.
     * @return A string representing the MIME type (e.g., "video/mp4"), or an
     *         empty string if libmagic could not be loaded.
     */
    static std::string detect(const std::filesystem::path& path);

    /**
     * @brief Whether a MIME type names something the engine can convert.
     *
     * Accepts any "video/" type plus the animated image containers
     * (GIF, APNG, WebP).
     */
    static bool is_convertible(std::string_view mime) noexcept;
};

} // namespace qshift

#endif // QSHIFT_MIME_DETECTOR_HPP
