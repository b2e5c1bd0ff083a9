#include "ovslink/netns.hpp"

#include <fcntl.h>
#include <sched.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace ovslink {

std::string network_namespace_path(pid_t pid) {
    return "/proc/" + std::to_string(pid) + "/ns/net";
}

std::optional<Error> enter_network_namespace(pid_t pid) {
    const std::string path = network_namespace_path(pid);
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return Error(ErrorKind::DeviceOperationFailed, "enter namespace", "cannot open " + path, std::strerror(errno));
    }
    int rc = ::setns(fd, CLONE_NEWNET);
    int saved_errno = errno;
    ::close(fd);
    if (rc < 0) {
        return Error(ErrorKind::DeviceOperationFailed, "enter namespace",
                     "cannot reassociate with " + path, std::strerror(saved_errno));
    }
    return std::nullopt;
}

} // namespace ovslink
