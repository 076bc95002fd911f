/**
 * @file encoder.hpp
 * @brief Abstract encode capability.
 */

#ifndef QSHIFT_ENCODER_HPP
#define QSHIFT_ENCODER_HPP

#include "call_context.hpp"
#include "media_probe.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

namespace qshift {

/**
 * @brief One encode invocation.
 */
struct EncodeRequest {
    std::filesystem::path input;
    std::filesystem::path output;
    double parameter = 0.0;
    std::optional<double> sample_secs; ///< Encode only the first N seconds
};

/**
 * @brief A successful encode.
 */
struct EncodeResult {
    std::uintmax_t size_bytes = 0;
};

/**
 * @brief Interface of an encoder backend.
 *
 * @details Two kinds of implementation exist: the exact path, whose output
 * may be committed, and the fast path (hardware encoder or bounded sample),
 * used only to find an approximate boundary and calibrate. Search logic is
 * identical whichever concrete backends are available.
 */
class IEncoder {
public:
    virtual ~IEncoder() = default;

    /// @return Backend name for logs (e.g. "libx265").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return True for an approximate backend whose output is never committed.
    [[nodiscard]] virtual bool is_fast_path() const noexcept = 0;

    /// @return Codec produced by this backend.
    [[nodiscard]] virtual TargetCodec target() const noexcept = 0;

    /// @return Extension of produced artifacts, with the leading dot.
    [[nodiscard]] virtual std::string_view output_extension() const noexcept = 0;

    /**
     * @brief Encodes request.input into request.output.
     * @return The size of the produced artifact.
     * @throws EncodeFailure on a failed, stuck or empty encode.
     * @throws OperationCancelled if ctx.stop was requested.
     */
    virtual EncodeResult encode(const EncodeRequest& request, const CallContext& ctx) = 0;
};

} // namespace qshift

#endif // QSHIFT_ENCODER_HPP
