/**
 * @file CallerIdentity.hpp
 * @brief CallerIdentityResolver implementations.
 */

#pragma once
#include <string>
#include <utility>
#include "domain/CallerContext.hpp"

namespace taskledger::infrastructure {

/** @brief Always reports the identity it was built with. */
class FixedCallerIdentity : public domain::CallerIdentityResolver {
public:
    explicit FixedCallerIdentity(std::string caller) : m_caller(std::move(caller)) {}
    std::string currentCaller() const override { return m_caller; }

private:
    std::string m_caller;
};

/**
 * @brief Reads TASKLEDGER_CALLER, then USER. Falls back to "anonymous".
 */
class EnvCallerIdentity : public domain::CallerIdentityResolver {
public:
    std::string currentCaller() const override;
};

} // namespace taskledger::infrastructure
