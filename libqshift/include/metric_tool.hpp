/**
 * @file metric_tool.hpp
 * @brief Abstract perceptual metric capability.
 */

#ifndef QSHIFT_METRIC_TOOL_HPP
#define QSHIFT_METRIC_TOOL_HPP

#include "call_context.hpp"
#include "quality_report.hpp"
#include <filesystem>
#include <string_view>

namespace qshift {

/**
 * @brief Interface of a metric backend.
 */
class IMetricTool {
public:
    virtual ~IMetricTool() = default;

    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /**
     * @brief Computes one metric for a reference/candidate pair.
     * @return The score. A returned value always means the metric ran.
     * @throws MetricUnavailable when the metric cannot be computed.
     * @throws OperationCancelled if ctx.stop was requested.
     */
    virtual double measure(const std::filesystem::path& reference,
                           const std::filesystem::path& candidate,
                           MetricKind kind,
                           const CallContext& ctx) = 0;
};

} // namespace qshift

#endif // QSHIFT_METRIC_TOOL_HPP
