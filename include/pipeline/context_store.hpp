#ifndef CONTEXT_STORE_HPP
#define CONTEXT_STORE_HPP

#include "core/types.hpp"

#include <cstdint>
#include <memory>
#include <mutex>

// Candidate context for one session. Every update installs a new immutable
// snapshot (a new generation baseline); snapshots already handed to a
// generation request are never modified.
class ContextStore {
public:
    using Snapshot = std::shared_ptr<const ContextPayload>;

    ContextStore();

    // Returns the version of the installed snapshot.
    uint64_t update(ContextPayload payload);

    // Never null; an empty payload before the first update or after clear().
    Snapshot current() const;
    uint64_t version() const;
    bool hasContext() const;

    void clear();

private:
    mutable std::mutex mutex_;
    Snapshot current_;
    uint64_t version_ = 0;
    bool set_ = false;
};

#endif
