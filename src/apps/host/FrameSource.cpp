// FrameSource.cpp
#include "apps/host/FrameSource.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <errno.h>
#include <string.h>

#include <cctype>
#include <iostream>
#include <sstream>

namespace {

// Shortest decimal form, as ffmpeg options expect ("15", "12.5").
static std::string num(float v) {
    std::ostringstream os;
    os << v;
    return os.str();
}

} // anonymous namespace

namespace host {

const char* ScaleModeStr(ScaleMode m) {
    switch (m) {
        case ScaleMode::CROP: return "crop";
        case ScaleMode::FIT:  return "fit";
        default:              return "unknown";
    }
}

bool ParseScaleMode(const std::string& name, ScaleMode& out) {
    std::string n = name;
    for (auto& c : n) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (n == "crop") { out = ScaleMode::CROP; return true; }
    if (n == "fit")  { out = ScaleMode::FIT;  return true; }
    return false;
}

std::vector<std::string> BuildDecoderArgs(const DecoderConfig& cfg) {
    const std::string w = std::to_string(cfg.geometry.width);
    const std::string h = std::to_string(cfg.geometry.height);

    std::string vf;
    if (cfg.mode == ScaleMode::FIT) {
        vf = "scale=" + w + ":" + h + ":force_original_aspect_ratio=decrease:flags=" + cfg.scale_flags +
             ",pad=" + w + ":" + h + ":(ow-iw)/2:(oh-ih)/2";
    } else {
        vf = "scale=" + w + ":" + h + ":force_original_aspect_ratio=increase:flags=" + cfg.scale_flags +
             ",crop=" + w + ":" + h;
    }
    vf += ",format=gray,fps=" + num(cfg.fps);

    std::vector<std::string> args = {"ffmpeg", "-hide_banner", "-loglevel", "error"};
    if (cfg.seek_s > 0.0f) {
        args.push_back("-ss");
        args.push_back(num(cfg.seek_s));
    }
    args.insert(args.end(), {"-i", cfg.input, "-an", "-vf", vf,
                             "-f", "rawvideo", "-pix_fmt", "gray", "-"});
    return args;
}

std::vector<std::string> BuildPreviewArgs(const std::string& input, float seek_s, float offset_s, bool mute) {
    std::vector<std::string> args = {"ffplay", "-hide_banner", "-loglevel", "error", "-autoexit"};
    if (mute) args.push_back("-an");

    const float start = seek_s + offset_s;
    if (start > 0.0f) {
        args.push_back("-ss");
        args.push_back(num(start));
    }
    args.push_back("-i");
    args.push_back(input);
    return args;
}

// =======================
// DecoderSource
// =======================

DecoderSource::DecoderSource(const DecoderConfig& cfg)
: m_cfg(cfg) {}

bool DecoderSource::Start() {
    const std::vector<std::string> args = BuildDecoderArgs(m_cfg);
    if (!m_proc.Spawn(args, ChildProcess::Stdio::PIPE, ChildProcess::Stdio::PIPE)) {
        std::cerr << "[DECODER] spawn failed: " << ChildProcess::StatusStr(m_proc.lastStatus())
                  << " errno=" << m_proc.lastErrno() << "\n";
        return false;
    }
    std::cerr << "[DECODER] pid " << m_proc.pid() << ": " << m_cfg.input << " @ " << m_cfg.fps
              << " fps (" << ScaleModeStr(m_cfg.mode) << ")\n";
    return true;
}

bool DecoderSource::ReadFrame(uint8_t* dst, std::size_t n) {
    std::size_t got = 0;
    if (m_proc.ReadExact(dst, n, got)) return true;

    if (m_proc.lastStatus() == ChildProcess::Status::READ_FAIL) {
        std::cerr << "[DECODER] read failed errno=" << m_proc.lastErrno() << "\n";
    }
    return false;
}

int DecoderSource::Finish() {
    const int rc = m_proc.Terminate();
    if (rc != 0) {
        const std::string err = m_proc.DrainStderr();
        if (!err.empty()) std::cerr << err;
        std::cerr << "[DECODER] exited with code " << rc << "\n";
    }
    return rc;
}

// =======================
// RawStreamSource
// =======================

RawStreamSource::RawStreamSource(const std::string& path)
: m_path(path) {}

RawStreamSource::~RawStreamSource() {
    if (m_owns_fd && m_fd >= 0) ::close(m_fd);
}

bool RawStreamSource::Open() {
    if (m_fd >= 0) return true;

    if (m_path == "-") {
        m_fd = STDIN_FILENO;
        m_owns_fd = false;
        return true;
    }

    m_fd = ::open(m_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (m_fd < 0) {
        m_errno = errno;
        std::cerr << "[DECODER] open " << m_path << " failed: " << ::strerror(m_errno) << "\n";
        return false;
    }
    m_owns_fd = true;
    return true;
}

bool RawStreamSource::ReadFrame(uint8_t* dst, std::size_t n) {
    if (m_fd < 0) return false;

    std::size_t got = 0;
    while (got < n) {
        const ssize_t r = ::read(m_fd, dst + got, n - got);
        if (r > 0) { got += static_cast<std::size_t>(r); continue; }
        if (r == 0) return false;
        if (errno == EINTR) continue;
        m_errno = errno;
        return false;
    }
    return true;
}

} // namespace host
