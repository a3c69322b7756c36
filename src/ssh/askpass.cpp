#include "askpass.hpp"
#include <core/utils.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace fs = std::filesystem;

static bool write_all(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

AskpassHelper::AskpassHelper(const std::string& secret) {
    std::string script = "#!/bin/sh\n"
                         "exec base64 -d <<'HPCSYNC_EOF'\n" +
                         base64_encode(secret) + "\n"
                         "HPCSYNC_EOF\n";

    for (int attempt = 0; attempt < 8; ++attempt) {
        fs::path candidate = platform::temp_file("hpcsync-askpass");
        candidate += ".sh";

        int fd = open(candidate.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0700);
        if (fd < 0) {
            if (errno == EEXIST) continue;
            throw std::runtime_error(fmt::format("Cannot create askpass helper: {}",
                                                 std::strerror(errno)));
        }

        bool ok = write_all(fd, script);
        close(fd);
        if (!ok) {
            std::error_code ec;
            fs::remove(candidate, ec);
            throw std::runtime_error("Cannot write askpass helper");
        }
        path_ = candidate;
        hpcsync_log("askpass: helper created " + path_.string());
        return;
    }
    throw std::runtime_error("Cannot create askpass helper: no free temp name");
}

AskpassHelper::~AskpassHelper() {
    if (path_.empty()) return;
    // Best effort: a helper that is already gone is fine.
    std::error_code ec;
    fs::remove(path_, ec);
    hpcsync_log("askpass: helper removed " + path_.string() +
                (ec ? " (" + ec.message() + ")" : ""));
}

std::map<std::string, std::string> AskpassHelper::environment() const {
    return {
        {"SSH_ASKPASS", path_.string()},
        {"SSH_ASKPASS_REQUIRE", "force"},
        {"DISPLAY", ":0"},
    };
}
