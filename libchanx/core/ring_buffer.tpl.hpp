// Template implementation should be included in-place with the ".hpp".


namespace chanx {


template <typename T>
RingBuffer<T>::RingBuffer(int64_t init_size, int64_t max_size)
        : init_size(init_size > 0 ? init_size : 1),
          max_size(max_size > 0 ? max_size : 0) {
    size = this->init_size;
    data = std::make_unique<T[]>(size);
}


template <typename T>
std::ostream& operator<<(std::ostream& s, const RingBuffer<T>& rb) {
    s << "rb[" << rb.Len() << "/" << rb.size << "," << rb.r << "," << rb.w;
    if (rb.full)
        s << ",full";
    s << "]";
    return s;
}


template <typename T>
bool RingBuffer<T>::Put(T elem) {
    if (full)
        return false;

    data[w] = std::move(elem);
    if (++w == size)
        w = 0;

    if (w == r) {
        // caught up with the read cursor, try to make more room
        if (!Grow())
            full = true;
    }
    return true;
}

template <typename T>
bool RingBuffer<T>::Grow() {
    int64_t new_size = GrowCap(size, max_size);
    if (new_size <= size)
        return false;

    // only called when w == r, so the old store is entirely occupied;
    // linearize it into the front of the new store
    auto new_data = std::make_unique<T[]>(new_size);
    int64_t idx = 0;
    for (int64_t i = r; i < size; ++i)
        new_data[idx++] = std::move(data[i]);
    for (int64_t i = 0; i < r; ++i)
        new_data[idx++] = std::move(data[i]);
    assert(idx == size);

    DEBUG("ring buffer grows %ld -> %ld\n", size, new_size);
    r = 0;
    w = size;
    size = new_size;
    data = std::move(new_data);
    return true;
}


template <typename T>
std::optional<T> RingBuffer<T>::Peek() const {
    if (IsEmpty())
        return std::nullopt;
    return data[r];
}

template <typename T>
std::optional<T> RingBuffer<T>::Pop() {
    if (IsEmpty())
        return std::nullopt;

    std::optional<T> elem(std::move(data[r]));
    data[r] = T{};      // drop whatever the moved-from slot still holds
    if (++r == size)
        r = 0;
    full = false;
    return elem;
}

template <typename T>
T *RingBuffer<T>::Head() {
    if (IsEmpty())
        return nullptr;
    return &data[r];
}


template <typename T>
int64_t RingBuffer<T>::Len() const {
    if (IsEmpty())
        return 0;
    if (w > r)
        return w - r;
    return size - r + w;
}

template <typename T>
int64_t RingBuffer<T>::Cap() const {
    return size;
}

template <typename T>
bool RingBuffer<T>::IsEmpty() const {
    return !full && r == w;
}

template <typename T>
bool RingBuffer<T>::IsFull() const {
    return full;
}

template <typename T>
bool RingBuffer<T>::NeedReset() const {
    return IsEmpty() && size > init_size;
}


template <typename T>
void RingBuffer<T>::Reset() {
    r = 0;
    w = 0;
    full = false;
    size = init_size;
    data = std::make_unique<T[]>(size);
}


}
