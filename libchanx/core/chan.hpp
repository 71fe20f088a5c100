#include <iostream>
#include <deque>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <optional>
#include <tuple>
#include <cstdint>
#include <assert.h>

#include "debug.hpp"
#include "notifier.hpp"


#ifndef __CHANX_CHAN_H__
#define __CHANX_CHAN_H__


namespace chanx {


// Outcome of a non-blocking or deadline-bound channel operation.
typedef enum ChanStatus {
    CHAN_OK,
    CHAN_BLOCKED,
    CHAN_CLOSED
} ChanStatus;

const char *ChanStatusStr(ChanStatus status);
std::ostream& operator<<(std::ostream& s, ChanStatus status);


// Bounded FIFO channel between threads. Template argument T specifies
// element type.
//
// With capacity > 0, up to capacity values are buffered and Send() only
// blocks while the buffer is full. With capacity == 0 the channel is
// unbuffered: a blocking Send() offers its value and returns once a
// receiver took it, and TrySend() only succeeds when a receiver is already
// waiting.
//
// Close() is idempotent. After close, Send()s fail, blocked senders whose
// offer was not taken get their failure, and receivers drain what is
// buffered before seeing the channel closed.
template <typename T>
class Chan {
    private:
        // A value offered by a sender blocked on an unbuffered channel.
        // Lives on that sender's stack; a receiver moves out of *value.
        struct Offer {
            T *value = nullptr;
            bool taken = false;
        };

        const size_t capacity;

        mutable std::mutex mu;
        std::condition_variable send_cv;
        std::condition_variable recv_cv;

        std::deque<T> items;
        std::deque<Offer *> offers;
        size_t recv_waiting = 0;
        bool closed = false;

        std::shared_ptr<Notifier> watcher;

        void NotifyWatcher();

        // Lock must be held by caller for the following helpers.
        bool CanPushNow() const;
        bool HasValue() const;
        T TakeValue();
        void WithdrawOffer(Offer *offer);

    public:
        Chan() = delete;
        Chan(size_t capacity);
        ~Chan() {}

        Chan(const Chan&) = delete;
        Chan& operator=(const Chan&) = delete;

        template <typename U>
        friend std::ostream& operator<<(std::ostream& s, const Chan<U>& ch);

        // Attach a notifier bumped on every state change. Must be called
        // before the channel is shared with other threads.
        void Watch(std::shared_ptr<Notifier> notifier);

        // Blocking send. Returns false if the channel was closed before
        // the value got accepted; the value is then not delivered.
        bool Send(T value);

        // Non-blocking send. value is moved from only on CHAN_OK.
        ChanStatus TrySend(T& value);

        // Send with a deadline. value is moved from only on CHAN_OK.
        template <typename Rep, typename Period>
        ChanStatus SendFor(T& value,
                           const std::chrono::duration<Rep, Period>& timeout);

        // Blocking receive. Returns nullopt once closed and drained.
        std::optional<T> Recv();

        ChanStatus TryRecv(T& value);

        template <typename Rep, typename Period>
        ChanStatus RecvFor(T& value,
                           const std::chrono::duration<Rep, Period>& timeout);

        // Count the caller as a receiver waiting on this channel while it
        // sleeps elsewhere, e.g. on a Notifier watching several channels,
        // so that TrySend() on an unbuffered channel can hand it a value.
        // Each ArmReceiver() must be paired with one DisarmReceiver().
        void ArmReceiver();
        void DisarmReceiver();

        // Returns true only for the call that actually closed the channel.
        bool Close();

        [[nodiscard]] bool IsClosed() const;
        [[nodiscard]] size_t Len() const;
        [[nodiscard]] size_t Cap() const;
};


// Send-only endpoint handle of a Chan. Cheap to copy; all copies refer to
// the same channel.
template <typename T>
class Sender {
    private:
        std::shared_ptr<Chan<T>> ch;

    public:
        Sender() = delete;
        Sender(std::shared_ptr<Chan<T>> ch) : ch(std::move(ch)) {}
        ~Sender() {}

        bool Send(T value) { return ch->Send(std::move(value)); }
        ChanStatus TrySend(T& value) { return ch->TrySend(value); }

        template <typename Rep, typename Period>
        ChanStatus SendFor(T& value,
                           const std::chrono::duration<Rep, Period>& timeout) {
            return ch->SendFor(value, timeout);
        }

        bool Close() { return ch->Close(); }

        [[nodiscard]] bool IsClosed() const { return ch->IsClosed(); }
        [[nodiscard]] size_t Len() const { return ch->Len(); }
        [[nodiscard]] size_t Cap() const { return ch->Cap(); }
};

// Receive-only endpoint handle of a Chan.
template <typename T>
class Receiver {
    private:
        std::shared_ptr<Chan<T>> ch;

    public:
        Receiver() = delete;
        Receiver(std::shared_ptr<Chan<T>> ch) : ch(std::move(ch)) {}
        ~Receiver() {}

        std::optional<T> Recv() { return ch->Recv(); }
        ChanStatus TryRecv(T& value) { return ch->TryRecv(value); }

        template <typename Rep, typename Period>
        ChanStatus RecvFor(T& value,
                           const std::chrono::duration<Rep, Period>& timeout) {
            return ch->RecvFor(value, timeout);
        }

        [[nodiscard]] bool IsClosed() const { return ch->IsClosed(); }
        [[nodiscard]] size_t Len() const { return ch->Len(); }
        [[nodiscard]] size_t Cap() const { return ch->Cap(); }
};


// Create a channel and hand out both of its endpoints.
template <typename T>
std::tuple<Sender<T>, Receiver<T>> MakeChan(size_t capacity) {
    auto ch = std::make_shared<Chan<T>>(capacity);
    return std::make_tuple(Sender<T>(ch), Receiver<T>(ch));
}


}


// Include template implementation in-place.
#include "chan.tpl.hpp"


#endif
