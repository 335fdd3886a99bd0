#include "system_info.hpp"

#include <chrono>

#include <sys/utsname.h>

namespace stavily::plugins {

Json system_info() {
    utsname name{};
    if (::uname(&name) != 0) {
        return Json{{"hostname", "unknown"}, {"platform", "unknown"}};
    }
    return Json{{"hostname", name.nodename}, {"platform", name.sysname}};
}

std::string hostname() {
    utsname name{};
    if (::uname(&name) != 0) {
        return "unknown";
    }
    return name.nodename;
}

int64_t epoch_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace stavily::plugins
