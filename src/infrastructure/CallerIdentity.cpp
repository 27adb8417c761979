#include "infrastructure/CallerIdentity.hpp"
#include <cstdlib>

namespace taskledger::infrastructure {

std::string EnvCallerIdentity::currentCaller() const {
    const char* caller = std::getenv("TASKLEDGER_CALLER");
    if (caller && *caller) {
        return caller;
    }
    const char* user = std::getenv("USER");
    if (user && *user) {
        return user;
    }
    return "anonymous";
}

} // namespace taskledger::infrastructure
