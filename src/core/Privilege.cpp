#include "Privilege.h"
#include "Logging.h"
#include <unistd.h>
#ifdef LANPROBE_HAVE_LIBCAP
#include <sys/capability.h>
#endif

namespace lanprobe {

bool is_privilege_available(){
#ifdef LANPROBE_HAVE_LIBCAP
    return true;
#else
    return false;
#endif
}

void log_capabilities(const std::string& context) {
#ifdef LANPROBE_HAVE_LIBCAP
    cap_t caps = cap_get_proc();
    if (!caps) {
        Logger::instance().warn("Failed to get current capabilities for " + context);
        return;
    }
    char* cap_text = cap_to_text(caps, nullptr);
    if (cap_text) {
        Logger::instance().debug("Capabilities " + context + ": " + std::string(cap_text));
        cap_free(cap_text);
    }
    cap_free(caps);
#else
    Logger::instance().debug("Capabilities logging not available (libcap not compiled in)");
#endif
}

bool has_discovery_privilege(){
    if(geteuid()==0) return true;
#ifdef LANPROBE_HAVE_LIBCAP
    cap_t caps = cap_get_proc(); if(!caps) return false;
    cap_flag_value_t raw = CAP_CLEAR, admin = CAP_CLEAR;
    bool ok = cap_get_flag(caps, CAP_NET_RAW, CAP_EFFECTIVE, &raw)==0 && cap_get_flag(caps, CAP_NET_ADMIN, CAP_EFFECTIVE, &admin)==0;
    cap_free(caps);
    return ok && raw==CAP_SET && admin==CAP_SET;
#else
    return false;
#endif
}

void drop_capabilities(){
#ifdef LANPROBE_HAVE_LIBCAP
    Logger::instance().info("Dropping capabilities");
    log_capabilities("before drop");
    cap_t caps = cap_get_proc(); if(!caps) return; // best-effort
    cap_clear(caps);
    if(cap_set_proc(caps)!=0) Logger::instance().error("cap_set_proc failed");
    else log_capabilities("after drop");
    cap_free(caps);
#else
    Logger::instance().info("Capability dropping not available (libcap not compiled in)");
#endif
}

}
