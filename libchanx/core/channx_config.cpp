#include <iostream>

#include "channx.hpp"


namespace chanx {


std::ostream& operator<<(std::ostream& s, const ChannXConfig& c) {
    s << "cfg{in=" << c.in_chan_size << ",out=" << c.out_chan_size
      << ",buf=" << c.init_buffer_size << "~";
    if (c.max_buffer_size > 0)
        s << c.max_buffer_size;
    else
        s << "inf";
    if (c.drop_closed_buffer_data)
        s << ",drop";
    s << "}";
    return s;
}


ChannXConfig& ChannXConfig::InChanSize(long size) {
    if (size >= 0)
        in_chan_size = static_cast<size_t>(size);
    return *this;
}

ChannXConfig& ChannXConfig::OutChanSize(long size) {
    if (size >= 0)
        out_chan_size = static_cast<size_t>(size);
    return *this;
}

ChannXConfig& ChannXConfig::InitBufferSize(long size) {
    if (size > 0)
        init_buffer_size = size;
    return *this;
}

ChannXConfig& ChannXConfig::MaxBufferSize(long size) {
    max_buffer_size = size > 0 ? size : 0;
    return *this;
}

ChannXConfig& ChannXConfig::DropClosedBufferData(bool drop) {
    drop_closed_buffer_data = drop;
    return *this;
}


}
