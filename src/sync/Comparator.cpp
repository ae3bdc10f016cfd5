#include "sync/Comparator.hpp"
#include "storage/model/File.hpp"

using namespace sw::sync::model;

namespace sw::sync {

Verdict Comparator::compare(const storage::model::File& source, const storage::model::File& target,
                            const Hasher& sourceDigest, const Hasher& targetDigest) const {
    if (hasFlag(methods_, EqualityMethod::Always)) return {false, EqualityMethod::Always};

    auto strongest = EqualityMethod::None;

    if (hasFlag(methods_, EqualityMethod::Length)) {
        if (source.size_bytes != target.size_bytes) return {false, EqualityMethod::Length};
        strongest = EqualityMethod::Length;
    }

    if (hasFlag(methods_, EqualityMethod::LastWriteTime)) {
        if (source.updated_at != target.updated_at) return {false, EqualityMethod::LastWriteTime};
        strongest = EqualityMethod::LastWriteTime;
    }

    if (hasFlag(methods_, EqualityMethod::ContentHash)) {
        if (sourceDigest() != targetDigest()) return {false, EqualityMethod::ContentHash};
        strongest = EqualityMethod::ContentHash;
    }

    return {true, strongest};
}

}
