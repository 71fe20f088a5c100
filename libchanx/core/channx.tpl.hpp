// Template implementation should be included in-place with the ".hpp".


namespace chanx {


template <typename T>
ChannX<T>::ChannX(const ChannXConfig& cfg)
        : cfg(cfg),
          in(std::make_shared<Chan<T>>(cfg.in_chan_size)),
          out(std::make_shared<Chan<T>>(cfg.out_chan_size)),
          notifier(std::make_shared<Notifier>()) {
    in->Watch(notifier);
    out->Watch(notifier);

    // wait for the dispatcher to set up its ring buffer
    std::promise<void> init_barrier;
    std::future<void> init_done = init_barrier.get_future();
    dispatcher = std::thread(&ChannX<T>::DispatchLoop, this,
                             std::move(init_barrier));
    init_done.wait();

    DEBUG("inited ChannX %s\n", StreamStr(cfg).c_str());
}

template <typename T>
ChannX<T>::~ChannX() {
    Close();
    // nobody may be left to drain Out(), do not let the dispatcher block
    // on it forever
    out->Close();
    dispatcher.join();

    DEBUG("destroyed ChannX\n");
}


template <typename T>
Sender<T> ChannX<T>::In() const {
    return Sender<T>(in);
}

template <typename T>
Receiver<T> ChannX<T>::Out() const {
    return Receiver<T>(out);
}

template <typename T>
void ChannX<T>::Close() {
    std::call_once(close_once, [this]() {
        closing.store(true);
        notifier->Notify();
    });
}


template <typename T>
const ChannXConfig& ChannX<T>::Config() const {
    return cfg;
}

template <typename T>
int64_t ChannX<T>::BufferLen() const {
    return buffer_len.load(std::memory_order_relaxed);
}

template <typename T>
int64_t ChannX<T>::BufferCap() const {
    return buffer_cap.load(std::memory_order_relaxed);
}

template <typename T>
void ChannX<T>::PublishStats(const RingBuffer<T>& buffer) {
    buffer_len.store(buffer.Len(), std::memory_order_relaxed);
    buffer_cap.store(buffer.Cap(), std::memory_order_relaxed);
}


template <typename T>
ChanStatus ChannX<T>::PollInput(T& value) {
    ChanStatus status = in->TryRecv(value);
    PANIC_IF(status == CHAN_CLOSED,
             "input channel of ChannX can not be closed\n");
    return status;
}


template <typename T>
void ChannX<T>::DispatchLoop(std::promise<void> init_barrier) {
    // the ring buffer lives on this thread's stack and never escapes it
    RingBuffer<T> buffer(cfg.init_buffer_size, cfg.max_buffer_size);
    PublishStats(buffer);
    init_barrier.set_value();

    while (true) {
        // buffer is empty: wait for either input or close
        T value;
        while (true) {
            uint64_t seen = notifier->Epoch();
            if (closing.load()) {
                Terminate(buffer, std::nullopt);
                return;
            }
            if (PollInput(value) == CHAN_OK)
                break;
            WaitForChange(seen);
        }
        if (!AdmitFromInput(buffer, std::move(value)))
            return;

        // buffer has pending values: race input, output and close
        while (!buffer.IsEmpty()) {
            uint64_t seen = notifier->Epoch();
            if (closing.load()) {
                Terminate(buffer, std::nullopt);
                return;
            }

            bool progressed = false;
            if (out->TrySend(*buffer.Head()) == CHAN_OK) {
                buffer.Pop();
                if (buffer.NeedReset()) {
                    DEBUG("ring buffer drained, shrink %ld -> %ld\n",
                          buffer.Cap(), cfg.init_buffer_size);
                    buffer.Reset();
                }
                PublishStats(buffer);
                progressed = true;
            }

            if (PollInput(value) == CHAN_OK) {
                if (!AdmitFromInput(buffer, std::move(value)))
                    return;
                progressed = true;
            }

            if (!progressed)
                WaitForChange(seen);
        }
    }
}


template <typename T>
void ChannX<T>::WaitForChange(uint64_t seen) {
    // while parked, count as a receiver on the input channel so that a
    // non-blocking send into an unbuffered In() can get through
    in->ArmReceiver();
    notifier->WaitChange(seen);
    in->DisarmReceiver();
}


template <typename T>
bool ChannX<T>::AdmitFromInput(RingBuffer<T>& buffer, T value) {
    // fast path: nothing queued ahead, try to skip the buffer entirely
    if (buffer.IsEmpty() && out->TrySend(value) == CHAN_OK)
        return true;

    if (!MustPutToBuffer(buffer, value)) {
        Terminate(buffer, std::move(value));
        return false;
    }
    PublishStats(buffer);
    return true;
}

template <typename T>
bool ChannX<T>::MustPutToBuffer(RingBuffer<T>& buffer, T& value) {
    if (!buffer.IsFull()) {
        [[maybe_unused]] bool ok = buffer.Put(std::move(value));
        assert(ok);
        return true;
    }

    // buffer is full and capped: the only way to make room is to push its
    // head to the output channel, or give up when closed
    while (true) {
        uint64_t seen = notifier->Epoch();
        if (closing.load())
            return false;
        if (out->TrySend(*buffer.Head()) == CHAN_OK)
            break;
        notifier->WaitChange(seen);
    }

    buffer.Pop();
    [[maybe_unused]] bool ok = buffer.Put(std::move(value));
    assert(ok);
    return true;
}


template <typename T>
void ChannX<T>::Terminate(RingBuffer<T>& buffer, std::optional<T> pending) {
    // no more sends into this ChannX from here on
    in->Close();

    if (cfg.drop_closed_buffer_data) {
        DEBUG("ChannX closed, dropping %ld buffered value(s)%s\n",
              buffer.Len(), pending.has_value() ? " and one pending" : "");
        buffer.Reset();
        PublishStats(buffer);
        out->Close();
        return;
    }

    DEBUG("ChannX closed, flushing %ld buffered value(s)%s\n",
          buffer.Len(), pending.has_value() ? " and one pending" : "");

    // order matters: what sits in the ring buffer came in first, then the
    // value popped from input but not yet admitted, then what is still
    // left in the input channel
    bool delivering = true;
    while (delivering && !buffer.IsEmpty()) {
        std::optional<T> head = buffer.Pop();
        delivering = out->Send(std::move(*head));
    }
    buffer.Reset();
    PublishStats(buffer);

    if (delivering && pending.has_value())
        delivering = out->Send(std::move(*pending));

    T value;
    while (delivering && in->TryRecv(value) == CHAN_OK)
        delivering = out->Send(std::move(value));

    if (!delivering)
        DEBUG("output channel closed early, remaining values abandoned\n");
    out->Close();
}


}
