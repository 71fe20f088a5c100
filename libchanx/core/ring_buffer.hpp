#include <iostream>
#include <memory>
#include <optional>
#include <cstdint>
#include <assert.h>

#include "debug.hpp"


#ifndef __CHANX_RING_BUFFER_H__
#define __CHANX_RING_BUFFER_H__


namespace chanx {


// Capacity below which the ring buffer doubles on growth; at or above it,
// growth slows down to roughly 1.25x.
constexpr int64_t RING_GROW_THRESHOLD = 1024;

// Compute the next capacity for a ring buffer currently holding size slots.
// max_size <= 0 means unbounded. Returns size itself if the buffer cannot
// grow any more. Saturates at the max int64_t value on overflow.
int64_t GrowCap(int64_t size, int64_t max_size);


// Self-adaptive ring buffer. Template argument T specifies element type.
//
// Grows in place whenever a Put() fills it up, up to max_size slots, and can
// be shrunk back to init_size through Reset() once drained. It does no
// locking: exactly one thread may own and mutate an instance.
template <typename T>
class RingBuffer {
    private:
        std::unique_ptr<T[]> data;
        int64_t init_size = 0;
        int64_t max_size = 0;
        int64_t size = 0;

        // Read and write cursors, both in [0, size).
        int64_t r = 0;
        int64_t w = 0;

        // Set when w caught up with r and the buffer could not grow.
        bool full = false;

        bool Grow();

    public:
        RingBuffer() = delete;
        RingBuffer(int64_t init_size, int64_t max_size);
        ~RingBuffer() {}

        template <typename U>
        friend std::ostream& operator<<(std::ostream& s,
                                        const RingBuffer<U>& rb);

        // Returns false, leaving the buffer untouched, only if it is full
        // and already at max_size.
        bool Put(T elem);

        [[nodiscard]] std::optional<T> Peek() const;
        std::optional<T> Pop();

        // In-place access to the head slot for the owner; nullptr if empty.
        [[nodiscard]] T *Head();

        [[nodiscard]] int64_t Len() const;
        [[nodiscard]] int64_t Cap() const;
        [[nodiscard]] bool IsEmpty() const;
        [[nodiscard]] bool IsFull() const;

        // True if the buffer is empty and has grown beyond init_size.
        [[nodiscard]] bool NeedReset() const;

        // Reallocate at init_size. Must only be called when empty: anything
        // still queued is discarded.
        void Reset();
};


}


// Include template implementation in-place.
#include "ring_buffer.tpl.hpp"


#endif
