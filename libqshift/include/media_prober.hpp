/**
 * @file media_prober.hpp
 * @brief Container inspection producing a MediaProbe.
 */

#ifndef QSHIFT_MEDIA_PROBER_HPP
#define QSHIFT_MEDIA_PROBER_HPP

#include "media_probe.hpp"
#include <filesystem>

namespace qshift {

/**
 * @brief Interface for anything that can describe a source file.
 */
class IMediaProber {
public:
    virtual ~IMediaProber() = default;

    /**
     * @brief Inspects a file.
     * @throws ProbeError{Unreadable} if the container cannot be opened or has
     *         no video stream.
     */
    [[nodiscard]] virtual MediaProbe probe(const std::filesystem::path& path) const = 0;
};

/**
 * @brief IMediaProber backed by libavformat.
 *
 * Reads the best video stream's codec parameters, then scans up to
 * @p gop_scan_packets packets to estimate the keyframe interval.
 */
class LibavMediaProber final : public IMediaProber {
public:
    explicit LibavMediaProber(unsigned gop_scan_packets = 600) : gop_scan_packets_(gop_scan_packets) {}

    [[nodiscard]] MediaProbe probe(const std::filesystem::path& path) const override;

private:
    unsigned gop_scan_packets_;
};

} // namespace qshift

#endif // QSHIFT_MEDIA_PROBER_HPP
