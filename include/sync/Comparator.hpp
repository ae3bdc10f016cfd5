#pragma once

#include "sync/model/EqualityMethod.hpp"

#include <functional>
#include <string>

namespace sw::storage::model { struct File; }

namespace sw::sync {

struct Verdict {
    bool equal = true;
    // equal: the strongest method that ran (None if none did); unequal: the method that proved it
    model::EqualityMethod method = model::EqualityMethod::None;
};

// Cheapest check first; stops at the first difference. Content is only read
// through the hashers, and only when every cheaper check passed.
class Comparator {
public:
    using Hasher = std::function<std::string()>;

    explicit Comparator(const model::EqualityMethod methods) : methods_(methods) {}

    [[nodiscard]] Verdict compare(const storage::model::File& source, const storage::model::File& target,
                                  const Hasher& sourceDigest, const Hasher& targetDigest) const;

    [[nodiscard]] model::EqualityMethod methods() const { return methods_; }

private:
    model::EqualityMethod methods_;
};

}
