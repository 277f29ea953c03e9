/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * Provider - Capability every backend exposes to the dispatcher
 */

#ifndef LLMGATE_PROVIDER_PROVIDER_HPP
#define LLMGATE_PROVIDER_PROVIDER_HPP

#include "core/types.hpp"

namespace llmgate::provider {

/**
 * Backend interface
 *
 * generate() runs on a dispatcher worker thread and may block on network I/O.
 * It reports failure by throwing and must eventually return or throw.
 *
 * health_check() must be fast and must not touch the network: it reports a
 * local or cached liveness signal and is called on every selection.
 */
class Provider {
public:
    virtual ~Provider() = default;

    virtual Response generate(const Request& request) = 0;

    virtual bool health_check() const = 0;
};

} // namespace llmgate::provider

#endif // LLMGATE_PROVIDER_PROVIDER_HPP
