#pragma once

#include <atomic>
#include <cstdint>
#include <utility>

/// Lock-free single-slot register with last-writer-wins semantics.
/// Each value carries the generation that produced it. Writes with a
/// generation not newer than the newest one ever written are rejected, so
/// a reader can never observe an older generation after a newer one.
///
/// Intended for one producer and one consumer. Intermediate values are
/// dropped when writes outpace reads.
template <typename T>
class LastWriterWinsSlot {
private:
    struct Entry {
        uint64_t generation;
        T value;
    };

    std::atomic<Entry*> latest_{nullptr};
    std::atomic<uint64_t> newest_generation_{0};

public:
    LastWriterWinsSlot() = default;

    ~LastWriterWinsSlot() {
        delete latest_.load(std::memory_order_acquire);
    }

    // Non-copyable, non-movable
    LastWriterWinsSlot(const LastWriterWinsSlot&) = delete;
    LastWriterWinsSlot& operator=(const LastWriterWinsSlot&) = delete;

    /// Publishes a value unless a newer generation was already written.
    /// Returns false if the value was rejected as stale.
    bool write(uint64_t generation, T&& value) {
        uint64_t newest = newest_generation_.load(std::memory_order_acquire);
        do {
            if (generation <= newest) {
                return false;
            }
        } while (!newest_generation_.compare_exchange_weak(
            newest, generation, std::memory_order_acq_rel));

        auto* new_ptr = new Entry{generation, std::move(value)};
        Entry* old_ptr = latest_.exchange(new_ptr, std::memory_order_acq_rel);
        delete old_ptr;
        return true;
    }

    /// Moves the latest value into 'out' and clears the slot.
    /// Returns false if nothing was written since the last read.
    bool try_read(T& out, uint64_t* generation = nullptr) {
        Entry* ptr = latest_.exchange(nullptr, std::memory_order_acquire);
        if (!ptr) {
            return false;
        }
        out = std::move(ptr->value);
        if (generation) {
            *generation = ptr->generation;
        }
        delete ptr;
        return true;
    }

    bool has_value() const {
        return latest_.load(std::memory_order_acquire) != nullptr;
    }

    uint64_t newest_generation() const {
        return newest_generation_.load(std::memory_order_acquire);
    }
};
