/**
 * @file call_context.hpp
 * @brief Per-call cancellation and supervision handles.
 */

#ifndef QSHIFT_CALL_CONTEXT_HPP
#define QSHIFT_CALL_CONTEXT_HPP

#include <stop_token>
#include <string>

namespace qshift {

class HeartbeatSupervisor;

/**
 * @brief Passed to every blocking external call.
 *
 * @details `stop` is the worker's token; a request on it aborts the call with
 * OperationCancelled. When `heartbeat` is set the call registers itself under
 * `label` and reports progress to it. The supervisor is not owned.
 */
struct CallContext {
    std::stop_token stop;
    HeartbeatSupervisor* heartbeat = nullptr;
    std::string label;
};

} // namespace qshift

#endif // QSHIFT_CALL_CONTEXT_HPP
