#include "realtime_bridge/sip/pj_thread.hpp"

#include <pj/os.h>

namespace realtime_bridge::sip {

void ensure_pj_thread_registered(const char* name) {
    if (pj_thread_is_registered()) {
        return;
    }
    thread_local pj_thread_desc desc;
    pj_thread_t* thread = nullptr;
    pj_thread_register(name ? name : "rtbridge", desc, &thread);
}

}
