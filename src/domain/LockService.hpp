/**
 * @file LockService.hpp
 * @brief Contract of the advisory single-writer lock guarding job records.
 */

#pragma once

#include <optional>
#include <string>

namespace jobledger::domain {

enum class AcquireOutcome {
    Acquired,      ///< The grant was free and now belongs to the caller.
    AlreadyHeld,   ///< The caller already held it.
    HeldByOther    ///< Someone else holds it; see LockGrant::owner.
};

/**
 * @struct LockGrant
 * @brief Result of a single acquire poll.
 */
struct LockGrant {
    AcquireOutcome outcome;
    std::string owner; ///< Identity currently holding the resource.

    /** @brief Acquired and AlreadyHeld both count as holding the lock. */
    bool held() const { return outcome != AcquireOutcome::HeldByOther; }
};

/**
 * @class LockService
 * @brief External mutual-exclusion primitive, one resource per job id.
 *
 * Acquisition is a single poll, never a wait. Grants are advisory and have no
 * lease: a holder that dies keeps the resource until someone clears it by hand.
 */
class LockService {
public:
    virtual ~LockService() = default;

    virtual LockGrant acquire(const std::string& ownerId, const std::string& resource) = 0;

    /**
     * @brief Frees @p resource if @p ownerId holds it.
     * @return False when the caller was not the holder.
     */
    virtual bool release(const std::string& ownerId, const std::string& resource) = 0;

    virtual std::optional<std::string> currentOwner(const std::string& resource) = 0;
};

} // namespace jobledger::domain
