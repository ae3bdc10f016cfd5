#include "sync/Synchronizer.hpp"
#include "sync/Comparator.hpp"
#include "sync/Planner.hpp"
#include "sync/Retry.hpp"
#include "storage/model/File.hpp"
#include "storage/model/Directory.hpp"
#include "crypto/util/hash.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace sw::sync::model;
using namespace sw::storage::model;

namespace sw::sync {

namespace {

Observer& nullObserver() {
    static Observer instance;
    return instance;
}

// The observer declined to continue after an exhausted error.
struct RunAborted : std::runtime_error {
    explicit RunAborted(const std::string& msg) : std::runtime_error(msg) {}
};

// Counts bytes through a copy and reports them; the interrupt is checked on every chunk.
class ProgressStream final : public storage::ReadStream {
public:
    ProgressStream(storage::ReadStream& inner, ProgressRecord& record, Observer& observer,
                   const concurrency::Interrupt& interrupt)
        : inner_(inner), record_(record), observer_(observer), interrupt_(interrupt) {}

    size_t read(uint8_t* buf, const size_t len) override {
        interrupt_.check();
        const auto n = inner_.read(buf, len);
        if (n) {
            record_.transferred += n;
            observer_.onProgress(record_);
        }
        return n;
    }

private:
    storage::ReadStream& inner_;
    ProgressRecord& record_;
    Observer& observer_;
    const concurrency::Interrupt& interrupt_;
};

std::string childPath(const std::string& parent, const std::string& name) {
    if (parent.empty()) return name;
    return parent.back() == '/' ? parent + name : parent + "/" + name;
}

// State for exactly one run.
struct Pass {
    const Policy& policy;
    Observer& observer;
    const storage::Root& src;
    const storage::Root& dst;
    const concurrency::Interrupt& interrupt;
    Retry retry;
    Comparator comparator;
    Stats stats{};

    Pass(const Policy& p, Observer& o, const storage::Root& s, const storage::Root& d,
         const concurrency::Interrupt& i)
        : policy(p), observer(o), src(s), dst(d), interrupt(i),
          retry(p.retryCount, o, i), comparator(p.equality) {}

    void syncDirectory(const Directory& source, const Directory& target, bool targetKnownEmpty);

private:
    void processPair(const Directory& target, const Pair& pair);
    void createFromSource(const Directory& target, const std::shared_ptr<Entry>& source);
    bool removeFromTarget(const std::shared_ptr<Entry>& target);
    bool purgeDirectory(const Directory& dir);
    void reconcileFiles(const Directory& target, const std::shared_ptr<File>& source,
                        const std::shared_ptr<File>& existing);
    std::shared_ptr<File> copy(const Directory& target, const std::shared_ptr<File>& source);

    std::vector<std::shared_ptr<Entry>> list(const storage::Root& root, const Directory& dir);
    void emit(ActionKind kind, EqualityMethod method, const std::shared_ptr<Entry>& source,
              const std::shared_ptr<Entry>& target, const std::string& targetPath);

    template <typename Fn>
    bool guarded(const std::string& operation, Fn&& fn);
};

template <typename Fn>
bool Pass::guarded(const std::string& operation, Fn&& fn) {
    try {
        fn();
        return true;
    } catch (const concurrency::Cancelled&) {
        throw;
    } catch (const RunAborted&) {
        throw;
    } catch (const std::exception& e) {
        ErrorRecord record{
            .error = std::current_exception(),
            .message = e.what(),
            .operation = operation,
            .attempt = policy.retryCount + 1,
            .exhausted = true
        };
        log::Registry::sync()->error("[Synchronizer] {} failed after {} attempt(s): {}",
                                     operation, record.attempt, e.what());
        observer.onError(record);

        if (record.cancel) throw concurrency::Cancelled();
        if (record.skip) {
            log::Registry::sync()->info("[Synchronizer] Skipping after failure: {}", operation);
            return false;
        }
        throw RunAborted(operation + ": " + e.what());
    }
}

void Pass::emit(const ActionKind kind, const EqualityMethod method, const std::shared_ptr<Entry>& source,
                const std::shared_ptr<Entry>& target, const std::string& targetPath) {
    ActionRecord record{
        .kind = kind,
        .method = method,
        .source = source,
        .target = target,
        .sourcePath = source ? src.display(*source) : std::string(),
        .targetPath = target ? dst.display(*target) : targetPath
    };
    log::Registry::sync()->debug("[Synchronizer] {} ({}): {} -> {}", to_string(kind), to_string(method),
                                 record.sourcePath, record.targetPath);
    observer.onAction(record);
}

std::vector<std::shared_ptr<Entry>> Pass::list(const storage::Root& root, const Directory& dir) {
    return retry.invoke("list " + root.display(dir), [&] { return root.engine->list(dir, interrupt); });
}

void Pass::syncDirectory(const Directory& source, const Directory& target, const bool targetKnownEmpty) {
    std::vector<std::shared_ptr<Entry>> sourceChildren, targetChildren;

    const bool listed = guarded("list " + src.display(source), [&] {
        sourceChildren = list(src, source);
        if (!targetKnownEmpty) targetChildren = list(dst, target);
    });
    if (!listed) return;

    for (const auto& pair : Planner::build(sourceChildren, targetChildren)) {
        interrupt.check();
        processPair(target, pair);
    }
}

void Pass::processPair(const Directory& target, const Pair& pair) {
    if (pair.source) {
        if (pair.source->isDirectory()) ++stats.directoriesSeen;
        else ++stats.filesSeen;
    }

    if (pair.sourceOnly()) {
        createFromSource(target, pair.source);
        return;
    }

    if (pair.targetOnly()) {
        removeFromTarget(pair.target);
        return;
    }

    if (pair.sameKind()) {
        if (pair.source->isDirectory()) {
            syncDirectory(static_cast<const Directory&>(*pair.source),
                          static_cast<const Directory&>(*pair.target), false);
        } else {
            reconcileFiles(target, std::static_pointer_cast<File>(pair.source),
                           std::static_pointer_cast<File>(pair.target));
        }
        return;
    }

    // Kind collision: the name must be freed before the source kind can take it.
    if (removeFromTarget(pair.target)) createFromSource(target, pair.source);
    else emit(ActionKind::Skip, EqualityMethod::None, pair.source, pair.target, {});
}

void Pass::createFromSource(const Directory& target, const std::shared_ptr<Entry>& source) {
    const auto targetPath = childPath(dst.display(target), source->name);

    if (source->isDirectory()) {
        if (!policy.createDirectories) {
            emit(ActionKind::Skip, EqualityMethod::None, source, nullptr, targetPath);
            return;
        }

        emit(ActionKind::Create, EqualityMethod::None, source, nullptr, targetPath);
        std::shared_ptr<Directory> created;
        const bool ok = guarded("create directory " + targetPath, [&] {
            created = retry.invoke("create directory " + targetPath, [&] {
                return dst.engine->createDirectory(target, source->name, interrupt);
            });
        });
        if (!ok) return;

        ++stats.directoriesCreated;
        syncDirectory(static_cast<const Directory&>(*source), *created, true);
        return;
    }

    if (!policy.createFiles) {
        emit(ActionKind::Skip, EqualityMethod::None, source, nullptr, targetPath);
        return;
    }

    emit(ActionKind::Create, EqualityMethod::None, source, nullptr, targetPath);
    if (guarded("copy " + src.display(*source), [&] { copy(target, std::static_pointer_cast<File>(source)); }))
        ++stats.filesCreated;
}

bool Pass::removeFromTarget(const std::shared_ptr<Entry>& target) {
    if (target->isDirectory()) {
        if (!policy.deleteDirectories) {
            emit(ActionKind::Skip, EqualityMethod::None, nullptr, target, {});
            return false;
        }

        if (!purgeDirectory(static_cast<const Directory&>(*target))) {
            log::Registry::sync()->info("[Synchronizer] Keeping {}: not everything inside it was removed",
                                        dst.display(*target));
            return false;
        }
    } else if (!policy.deleteFiles) {
        emit(ActionKind::Skip, EqualityMethod::None, nullptr, target, {});
        return false;
    }

    emit(ActionKind::Delete, EqualityMethod::None, nullptr, target, {});
    const bool removed = guarded("delete " + dst.display(*target), [&] {
        retry.invoke("delete " + dst.display(*target), [&] { dst.engine->remove(*target, interrupt); });
    });
    if (!removed) return false;

    if (target->isDirectory()) ++stats.directoriesDeleted;
    else ++stats.filesDeleted;
    return true;
}

// Target-only subtree: everything in it goes through the delete rules. True if it ended up empty.
bool Pass::purgeDirectory(const Directory& dir) {
    std::vector<std::shared_ptr<Entry>> children;
    if (!guarded("list " + dst.display(dir), [&] { children = list(dst, dir); })) return false;

    bool emptied = true;
    for (const auto& child : children) {
        interrupt.check();
        if (!removeFromTarget(child)) emptied = false;
    }
    return emptied;
}

void Pass::reconcileFiles(const Directory& target, const std::shared_ptr<File>& source,
                          const std::shared_ptr<File>& existing) {
    const auto digest = [this](const storage::Root& root, const File& file) {
        return [this, &root, &file] {
            return retry.invoke("hash " + root.display(file), [&] {
                const auto in = root.engine->openRead(file, interrupt);
                return crypto::hash::blake2b(*in, interrupt);
            });
        };
    };

    Verdict verdict;
    const bool compared = guarded("compare " + src.display(*source), [&] {
        verdict = comparator.compare(*source, *existing, digest(src, *source), digest(dst, *existing));
    });
    if (!compared) return;

    if (verdict.equal || !policy.updateFiles) {
        emit(ActionKind::Skip, verdict.method, source, existing, {});
        return;
    }

    emit(ActionKind::Update, verdict.method, source, existing, {});
    if (guarded("copy " + src.display(*source), [&] { copy(target, source); }))
        ++stats.filesUpdated;
}

// One retried unit: a failed attempt reopens the source and rewrites the target from scratch.
std::shared_ptr<File> Pass::copy(const Directory& target, const std::shared_ptr<File>& source) {
    const auto targetPath = childPath(dst.display(target), source->name);
    return retry.invoke("copy " + src.display(*source), [&] {
        ProgressRecord progress{
            .transferred = 0,
            .total = source->size_bytes,
            .source = source,
            .sourcePath = src.display(*source),
            .targetPath = targetPath
        };
        const auto in = src.engine->openRead(*source, interrupt);
        ProgressStream counted(*in, progress, observer, interrupt);
        return dst.engine->createFile(target, source->name, counted, source->size_bytes, interrupt,
                                      source->updated_at);
    });
}

}

Synchronizer::Synchronizer(Policy policy) : Synchronizer(std::move(policy), nullObserver()) {}

Synchronizer::Synchronizer(Policy policy, Observer& observer) : policy_(std::move(policy)), observer_(&observer) {}

Result Synchronizer::run(const storage::Root& source, const storage::Root& target,
                         const concurrency::Interrupt& interrupt) const {
    if (!source.engine || !source.directory || !target.engine || !target.directory)
        throw std::invalid_argument("Synchronizer::run requires resolved source and target roots");

    log::Registry::sync()->info("[Synchronizer] Syncing {} -> {} (equality: {}, retries: {})",
                                source.display(*source.directory), target.display(*target.directory),
                                to_string(policy_.equality), policy_.retryCount);

    Pass pass(policy_, *observer_, source, target, interrupt);
    Result result;

    try {
        pass.syncDirectory(*source.directory, *target.directory, false);
        result.outcome = Outcome::Completed;
    } catch (const concurrency::Cancelled& e) {
        result.outcome = Outcome::Cancelled;
        result.error = e.what();
    } catch (const std::exception& e) {
        result.outcome = Outcome::Failed;
        result.error = e.what();
    }

    result.stats = pass.stats;

    const auto& s = result.stats;
    const auto lvl = result.outcome == Outcome::Failed ? spdlog::level::err : spdlog::level::info;
    log::Registry::sync()->log(lvl, "[Synchronizer] Run {}: directories {} seen, {} created, {} deleted; "
                                    "files {} seen, {} created, {} updated, {} deleted{}",
                               to_string(result.outcome), s.directoriesSeen, s.directoriesCreated,
                               s.directoriesDeleted, s.filesSeen, s.filesCreated, s.filesUpdated, s.filesDeleted,
                               result.error.empty() ? "" : " (" + result.error + ")");
    return result;
}

}
