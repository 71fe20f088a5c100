#include <iostream>

#include "chan.hpp"


namespace chanx {


const char *ChanStatusStr(ChanStatus status) {
    switch (status) {
    case CHAN_OK:      return "ok";
    case CHAN_BLOCKED: return "blocked";
    case CHAN_CLOSED:  return "closed";
    default:           return "unknown_status";
    }
}

std::ostream& operator<<(std::ostream& s, ChanStatus status) {
    s << ChanStatusStr(status);
    return s;
}


}
