#pragma once

#include "sync/model/EqualityMethod.hpp"

#include <cstdint>
#include <exception>
#include <memory>
#include <string>

namespace sw::storage::model { struct Entry; }

namespace sw::sync::model {

enum class ActionKind { Create, Update, Delete, Skip };

std::string to_string(ActionKind k);

// A decided mutation, delivered before it is carried out.
struct ActionRecord {
    ActionKind kind = ActionKind::Skip;
    EqualityMethod method = EqualityMethod::None;
    std::shared_ptr<const storage::model::Entry> source{}, target{};   // either may be null
    std::string sourcePath, targetPath;                                // display paths
};

struct ErrorRecord {
    std::exception_ptr error{};
    std::string message;
    std::string operation;
    unsigned int attempt = 0;
    bool exhausted = false;   // retries are used up; the item is abandoned unless `skip` is set

    // Set by the observer.
    bool cancel = false;
    bool skip = false;        // only honored when exhausted: continue with the next item
};

struct ProgressRecord {
    uintmax_t transferred = 0;
    uintmax_t total = 0;
    std::shared_ptr<const storage::model::Entry> source{};
    std::string sourcePath, targetPath;
};

}
