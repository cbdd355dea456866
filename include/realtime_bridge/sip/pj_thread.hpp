#pragma once

namespace realtime_bridge {
namespace sip {

// pjlib requires every thread that touches it to be registered once.
void ensure_pj_thread_registered(const char* name);

}
}
