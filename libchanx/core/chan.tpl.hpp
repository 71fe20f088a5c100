// Template implementation should be included in-place with the ".hpp".


namespace chanx {


template <typename T>
Chan<T>::Chan(size_t capacity)
        : capacity(capacity) {
}


template <typename T>
std::ostream& operator<<(std::ostream& s, const Chan<T>& ch) {
    std::lock_guard<std::mutex> lk(ch.mu);
    s << "chan[" << ch.items.size() << "/" << ch.capacity << ",o"
      << ch.offers.size() << ",w" << ch.recv_waiting;
    if (ch.closed)
        s << ",closed";
    s << "]";
    return s;
}


template <typename T>
void Chan<T>::Watch(std::shared_ptr<Notifier> notifier) {
    watcher = std::move(notifier);
}

template <typename T>
void Chan<T>::NotifyWatcher() {
    // lock order is always chan -> notifier, the watching side never
    // touches a channel while holding the notifier's lock
    if (watcher != nullptr)
        watcher->Notify();
}


template <typename T>
bool Chan<T>::CanPushNow() const {
    if (capacity > 0)
        return items.size() < capacity;
    // unbuffered: need a waiting receiver not yet matched with a value
    return recv_waiting > items.size() + offers.size();
}

template <typename T>
bool Chan<T>::HasValue() const {
    return !items.empty() || !offers.empty();
}

template <typename T>
T Chan<T>::TakeValue() {
    assert(HasValue());
    if (!items.empty()) {
        T value(std::move(items.front()));
        items.pop_front();
        send_cv.notify_one();
        NotifyWatcher();
        return value;
    }

    Offer *offer = offers.front();
    offers.pop_front();
    T value(std::move(*offer->value));
    offer->taken = true;
    send_cv.notify_all();
    NotifyWatcher();
    return value;
}

template <typename T>
void Chan<T>::WithdrawOffer(Offer *offer) {
    for (auto it = offers.begin(); it != offers.end(); ++it) {
        if (*it == offer) {
            offers.erase(it);
            return;
        }
    }
    assert(false);
}


template <typename T>
bool Chan<T>::Send(T value) {
    std::unique_lock<std::mutex> lk(mu);
    if (closed)
        return false;

    if (capacity > 0) {
        send_cv.wait(lk, [&]() { return closed || CanPushNow(); });
        if (closed)
            return false;
        items.push_back(std::move(value));
        recv_cv.notify_one();
        NotifyWatcher();
        return true;
    }

    // unbuffered: offer the value and wait until some receiver takes it
    Offer offer{&value, false};
    offers.push_back(&offer);
    recv_cv.notify_one();
    NotifyWatcher();

    send_cv.wait(lk, [&]() { return offer.taken || closed; });
    if (!offer.taken) {
        WithdrawOffer(&offer);
        return false;
    }
    return true;
}

template <typename T>
ChanStatus Chan<T>::TrySend(T& value) {
    std::lock_guard<std::mutex> lk(mu);
    if (closed)
        return CHAN_CLOSED;
    if (!CanPushNow())
        return CHAN_BLOCKED;

    items.push_back(std::move(value));
    recv_cv.notify_one();
    NotifyWatcher();
    return CHAN_OK;
}

template <typename T>
template <typename Rep, typename Period>
ChanStatus Chan<T>::SendFor(T& value,
                            const std::chrono::duration<Rep, Period>& timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lk(mu);

    if (capacity > 0) {
        if (!send_cv.wait_until(lk, deadline,
                                [&]() { return closed || CanPushNow(); }))
            return CHAN_BLOCKED;
        if (closed)
            return CHAN_CLOSED;
        items.push_back(std::move(value));
        recv_cv.notify_one();
        NotifyWatcher();
        return CHAN_OK;
    }

    // unbuffered: offer from a local copy so that value stays intact
    // unless a receiver took it in time
    T local(std::move(value));
    Offer offer{&local, false};
    offers.push_back(&offer);
    recv_cv.notify_one();
    NotifyWatcher();

    send_cv.wait_until(lk, deadline,
                       [&]() { return offer.taken || closed; });
    if (offer.taken)
        return CHAN_OK;
    WithdrawOffer(&offer);
    value = std::move(local);
    return closed ? CHAN_CLOSED : CHAN_BLOCKED;
}


template <typename T>
std::optional<T> Chan<T>::Recv() {
    std::unique_lock<std::mutex> lk(mu);
    if (!HasValue() && !closed) {
        // announce ourselves so that a non-blocking sender on an
        // unbuffered channel can hand its value over
        recv_waiting++;
        NotifyWatcher();
        recv_cv.wait(lk, [&]() { return HasValue() || closed; });
        recv_waiting--;
    }

    if (!HasValue())
        return std::nullopt;
    return TakeValue();
}

template <typename T>
ChanStatus Chan<T>::TryRecv(T& value) {
    std::lock_guard<std::mutex> lk(mu);
    if (HasValue()) {
        value = TakeValue();
        return CHAN_OK;
    }
    return closed ? CHAN_CLOSED : CHAN_BLOCKED;
}

template <typename T>
template <typename Rep, typename Period>
ChanStatus Chan<T>::RecvFor(T& value,
                            const std::chrono::duration<Rep, Period>& timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lk(mu);
    if (!HasValue() && !closed) {
        recv_waiting++;
        NotifyWatcher();
        recv_cv.wait_until(lk, deadline,
                           [&]() { return HasValue() || closed; });
        recv_waiting--;
    }

    if (HasValue()) {
        value = TakeValue();
        return CHAN_OK;
    }
    return closed ? CHAN_CLOSED : CHAN_BLOCKED;
}


template <typename T>
void Chan<T>::ArmReceiver() {
    std::lock_guard<std::mutex> lk(mu);
    recv_waiting++;
}

template <typename T>
void Chan<T>::DisarmReceiver() {
    std::lock_guard<std::mutex> lk(mu);
    assert(recv_waiting > 0);
    recv_waiting--;
}


template <typename T>
bool Chan<T>::Close() {
    std::lock_guard<std::mutex> lk(mu);
    if (closed)
        return false;
    closed = true;
    send_cv.notify_all();
    recv_cv.notify_all();
    NotifyWatcher();
    return true;
}


template <typename T>
bool Chan<T>::IsClosed() const {
    std::lock_guard<std::mutex> lk(mu);
    return closed;
}

template <typename T>
size_t Chan<T>::Len() const {
    std::lock_guard<std::mutex> lk(mu);
    return items.size();
}

template <typename T>
size_t Chan<T>::Cap() const {
    return capacity;
}


}
