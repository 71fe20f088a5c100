#include <iostream>
#include <memory>
#include <thread>
#include <future>
#include <mutex>
#include <atomic>
#include <optional>
#include <cstdint>
#include <assert.h>

#include "debug.hpp"
#include "notifier.hpp"
#include "chan.hpp"
#include "ring_buffer.hpp"


#ifndef __CHANX_CHANNX_H__
#define __CHANX_CHANNX_H__


namespace chanx {


// Construction-time configuration of a ChannX. Setters can be chained and
// silently ignore values that make no sense, keeping the previous setting.
class ChannXConfig {
    public:
        // Capacity of the native input channel behind In().
        size_t in_chan_size = 0;
        // Capacity of the native output channel behind Out().
        size_t out_chan_size = 0;
        // Ring buffer capacity at start and after each shrink.
        int64_t init_buffer_size = 2;
        // Ring buffer capacity cap; 0 means unbounded.
        int64_t max_buffer_size = 0;
        // Whether to drop data still in the ring buffer and the input
        // channel once closed. Data already in the output channel can
        // still be received either way.
        bool drop_closed_buffer_data = false;

        ChannXConfig() {}
        ~ChannXConfig() {}

        friend std::ostream& operator<<(std::ostream& s,
                                        const ChannXConfig& c);

        ChannXConfig& InChanSize(long size);            // ignored if < 0
        ChannXConfig& OutChanSize(long size);           // ignored if < 0
        ChannXConfig& InitBufferSize(long size);        // ignored if <= 0
        ChannXConfig& MaxBufferSize(long size);         // <= 0 is unbounded
        ChannXConfig& DropClosedBufferData(bool drop = true);
};


// Self-adaptive channel. Template argument T specifies element type, which
// must be default-constructible and movable.
//
// Values sent on In() come out of Out() in the same order. In between sits
// a ring buffer that grows whenever the consumer falls behind and shrinks
// back to its initial size once drained, so a slow consumer does not block
// a fast producer until max_buffer_size is reached. It can be used as an
// unbounded channel.
//
// One dispatch thread per instance moves values from the input channel to
// the output channel and is the only one ever touching the ring buffer.
//
// Close() stops admission and, unless drop_closed_buffer_data is set,
// flushes everything still pending into Out() before closing it. Closing
// In() from outside is a fatal misuse. Destroying a ChannX closes it and
// abandons whatever has not reached Out() yet.
template <typename T>
class ChannX {
    private:
        const ChannXConfig cfg;

        std::shared_ptr<Chan<T>> in;
        std::shared_ptr<Chan<T>> out;

        // Bumped by both channels and by Close(); the dispatcher sleeps on
        // it when none of its cases is ready.
        std::shared_ptr<Notifier> notifier;

        std::once_flag close_once;
        std::atomic<bool> closing = false;

        // Snapshot of the ring buffer published by the dispatcher.
        std::atomic<int64_t> buffer_len = 0;
        std::atomic<int64_t> buffer_cap = 0;

        std::thread dispatcher;

        void DispatchLoop(std::promise<void> init_barrier);

        // Sleep until the notifier moves past seen, ready to take input.
        void WaitForChange(uint64_t seen);

        // Poll the input channel without blocking. Panics if someone else
        // closed it.
        ChanStatus PollInput(T& value);

        // Hand a freshly received value on, directly or through the ring
        // buffer. Returns false if the channel got terminated meanwhile.
        bool AdmitFromInput(RingBuffer<T>& buffer, T value);

        // Put value into the ring buffer; if that is full and capped, wait
        // until its head is forced out. Returns false, leaving value
        // intact, if closed while waiting.
        bool MustPutToBuffer(RingBuffer<T>& buffer, T& value);

        void Terminate(RingBuffer<T>& buffer, std::optional<T> pending);

        void PublishStats(const RingBuffer<T>& buffer);

    public:
        ChannX(const ChannXConfig& cfg = ChannXConfig());
        ~ChannX();

        ChannX(const ChannX&) = delete;
        ChannX& operator=(const ChannX&) = delete;

        [[nodiscard]] Sender<T> In() const;
        [[nodiscard]] Receiver<T> Out() const;

        // Idempotent and safe to call concurrently.
        void Close();

        [[nodiscard]] const ChannXConfig& Config() const;

        // Approximate view of the ring buffer, for monitoring only.
        [[nodiscard]] int64_t BufferLen() const;
        [[nodiscard]] int64_t BufferCap() const;
};


}


// Include template implementation in-place.
#include "channx.tpl.hpp"


#endif
