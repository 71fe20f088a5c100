#include <limits>
#include <cstdint>

#include "ring_buffer.hpp"


namespace chanx {


int64_t GrowCap(int64_t size, int64_t max_size) {
    constexpr int64_t max_int = std::numeric_limits<int64_t>::max();

    if (max_size > 0 && size >= max_size)
        return size;    // can not grow any more

    // same policy as amortized dynamic arrays: double small buffers, then
    // transition smoothly to 1.25x growth for large ones
    int64_t new_size;
    if (size < RING_GROW_THRESHOLD) {
        new_size = size > max_int - size ? max_int : size + size;
    } else {
        int64_t add = size > max_int - 3 * RING_GROW_THRESHOLD
                      ? max_int : size + 3 * RING_GROW_THRESHOLD;
        if (add == max_int || size > max_int - add / 4)
            new_size = max_int;
        else
            new_size = size + add / 4;
    }

    if (max_size > 0 && new_size > max_size)
        new_size = max_size;
    return new_size;
}


}
