#include "pipeline/context_store.hpp"

#include <utility>

// Constructor
ContextStore::ContextStore() : current_(std::make_shared<const ContextPayload>()) {}

uint64_t ContextStore::update(ContextPayload payload) {
    Snapshot next = std::make_shared<const ContextPayload>(std::move(payload));

    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::move(next);
    set_ = true;
    return ++version_;
}

ContextStore::Snapshot ContextStore::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

uint64_t ContextStore::version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return version_;
}

bool ContextStore::hasContext() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return set_;
}

void ContextStore::clear() {
    Snapshot empty = std::make_shared<const ContextPayload>();

    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::move(empty);
    set_ = false;
    ++version_;
}
