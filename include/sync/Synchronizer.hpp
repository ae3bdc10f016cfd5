#pragma once

#include "sync/Observer.hpp"
#include "sync/model/Policy.hpp"
#include "sync/model/Result.hpp"
#include "storage/Engine.hpp"
#include "concurrency/Interrupt.hpp"

namespace sw::sync {

// Walks source and target in lock-step, one directory level at a time, and
// makes the target match the source as far as the policy allows.
class Synchronizer {
public:
    explicit Synchronizer(model::Policy policy);
    Synchronizer(model::Policy policy, Observer& observer);

    // Never throws for backend or cancellation failures; they end up in the Result.
    model::Result run(const storage::Root& source, const storage::Root& target,
                      const concurrency::Interrupt& interrupt) const;

    [[nodiscard]] const model::Policy& policy() const { return policy_; }

private:
    model::Policy policy_;
    Observer* observer_;
};

}
