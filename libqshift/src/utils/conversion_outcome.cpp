#include "../../include/conversion_outcome.hpp"
#include <iomanip>
#include <sstream>

namespace qshift {

namespace {
template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
} // namespace

std::string_view to_string(const RejectReason reason) noexcept {
    switch (reason) {
        case RejectReason::NoCompression:          return "no-compression";
        case RejectReason::SizeOrQualityNotMet:    return "size-or-quality-not-met";
        case RejectReason::IterationLimitExceeded: return "iteration-limit-exceeded";
        case RejectReason::QualityUnverifiable:    return "quality-unverifiable";
        case RejectReason::ProbeFailed:            return "probe-failed";
        case RejectReason::EncodeFailed:           return "encode-failed";
        case RejectReason::CommitFailed:           return "commit-failed";
        case RejectReason::Cancelled:              return "cancelled";
        case RejectReason::Skipped:                return "skipped";
    }
    return "unknown";
}

bool is_committed(const ConversionOutcome& outcome) noexcept {
    return !std::holds_alternative<Rejected>(outcome);
}

std::string_view outcome_name(const ConversionOutcome& outcome) noexcept {
    return std::visit(overloaded{
        [](const Accepted&) { return std::string_view("accepted"); },
        [](const Rejected&) { return std::string_view("rejected"); },
        [](const BestEffortAccepted&) { return std::string_view("best-effort"); },
    }, outcome);
}

std::string describe(const ConversionOutcome& outcome) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    std::visit(overloaded{
        [&oss](const Accepted& a) {
            oss << "accepted at " << a.parameter << ", " << a.output_size << " bytes";
            if (a.report) oss << ", " << a.report->summary();
        },
        [&oss](const Rejected& r) {
            oss << "rejected (" << to_string(r.reason) << "): " << r.message;
        },
        [&oss](const BestEffortAccepted& b) {
            oss << "best-effort at " << b.parameter << ", " << b.output_size
                << " bytes: " << b.reason;
        },
    }, outcome);
    return oss.str();
}

} // namespace qshift
