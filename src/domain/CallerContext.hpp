/**
 * @file CallerContext.hpp
 * @brief Collaborators supplied by the hosting environment: who is calling, and where diagnostics go.
 */

#pragma once
#include <string>

namespace taskledger::domain {

/**
 * @class CallerIdentityResolver
 * @brief Returns an opaque, stable string naming the current caller.
 *
 * The ledger never validates the returned value.
 */
class CallerIdentityResolver {
public:
    virtual ~CallerIdentityResolver() = default;
    virtual std::string currentCaller() const = 0;
};

/**
 * @class EventLog
 * @brief Fire-and-forget sink for human-readable event strings.
 */
class EventLog {
public:
    virtual ~EventLog() = default;
    virtual void log(const std::string& message) = 0;
};

} // namespace taskledger::domain
