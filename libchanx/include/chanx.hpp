//
// Applications only need to include this header file, <chanx.hpp>, and link
// against libchanx.
//
// It provides:
//
//   Chan<T>, Sender<T>, Receiver<T>
//
//     bounded channel between threads, buffered (capacity > 0) or
//     unbuffered (capacity == 0), with blocking, non-blocking and
//     deadline-bound send/receive and idempotent close
//
//   RingBuffer<T>
//
//     single-owner circular buffer that grows when full (doubling below
//     1024 slots, then about 1.25x) up to an optional cap, and can be
//     shrunk back to its initial size once drained
//
//   ChannX<T>
//
//     self-adaptive channel: In() -> [input chan] -> ring buffer ->
//     [output chan] -> Out(), driven by one dispatch thread per instance;
//     behaves as an unbounded FIFO channel unless the ring buffer is capped
//
//   TokenBucket
//
//     max-in-flight limiter with non-blocking TryAcquire(), Release() and
//     Resize(); strategies are atomic (default), channel, mutex and
//     infinity
//
// Compile-time switches:
//
//   NDEBUG    disables DEBUG() logging to stderr and assert()s
//   NTIMER    disables the TIMER_xxx() macros
//


#include "debug.hpp"
#include "notifier.hpp"
#include "chan.hpp"
#include "ring_buffer.hpp"
#include "channx.hpp"
#include "token_bucket.hpp"
#include "atomic_bucket.hpp"
#include "channel_bucket.hpp"
#include "mutex_bucket.hpp"
#include "infinity_bucket.hpp"


#pragma once
