#pragma once

#include "sync/model/Records.hpp"

namespace sw::sync {

// Called synchronously on the thread running the sync. Slow observers slow the walk.
class Observer {
public:
    virtual ~Observer() = default;

    virtual void onAction(const model::ActionRecord&) {}

    // May set `cancel`, or `skip` when the record is exhausted.
    virtual void onError(model::ErrorRecord&) {}

    virtual void onProgress(const model::ProgressRecord&) {}
};

}
