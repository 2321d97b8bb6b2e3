// ControlChannel.cpp
#include "apps/host/ControlChannel.hpp"
#include "apps/wire/LineCodec.hpp"

#include <poll.h>
#include <stdio.h>
#include <unistd.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iostream>

namespace {

// Whole-token float.
static bool parseFloat(const std::string& s, float& out) {
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const float v = std::strtof(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0' || errno == ERANGE || !std::isfinite(v)) return false;
    out = v;
    return true;
}

// Anything but "0", "false", "off" or nothing at all switches on.
static bool parseSwitch(std::string s) {
    wire::ToLowerInPlace(s);
    return !(s.empty() || s == "0" || s == "false" || s == "off");
}

static bool is(const std::string& key, const char* a, const char* b = nullptr, const char* c = nullptr) {
    return key == a || (b && key == b) || (c && key == c);
}

// Queue an item, retrying while the queue is full. Gives up once stop is set.
template <typename Q, typename T>
static bool pushUntilStopped(Q& q, const T& item, const std::atomic<bool>& stop, int poll_ms) {
    while (!q.try_send(item)) {
        if (stop.load()) return false;
        Rtos::SleepMs(poll_ms);
    }
    return true;
}

static void logConfig(const char* what, const imgproc::ProcessingConfig& cfg) {
    std::cerr << "[HOST] " << what << " -> gamma=" << cfg.gamma
              << " contrast=" << cfg.contrast
              << " brightness=" << cfg.brightness
              << " dither=" << imgproc::DitherModeStr(cfg.dither)
              << " invert=" << cfg.invert
              << " rotate180=" << cfg.rotate180 << "\n";
}

} // anonymous namespace

namespace host {

ControlChannel::ControlChannel(const imgproc::ProcessingConfig& defaults)
: m_defaults(defaults) {}

ControlChannel::~ControlChannel() {
    Stop();
}

bool ControlChannel::Start(std::FILE* in) {
    m_in = in ? in : stdin;
    m_closed = false;
    m_stop = false;
    if (!m_task.Create("ControlChannel", &ControlChannel::TaskEntry, &m_ctx)) {
        std::cerr << "[HOST] could not start the stdin reader\n";
        return false;
    }
    return true;
}

void ControlChannel::Stop() {
    m_stop = true;
    m_task.Join();
}

void ControlChannel::TaskEntry(void* arg) {
    auto* ctx = static_cast<TaskCtx*>(arg);
    if (!ctx || !ctx->self) return;
    ctx->self->readerLoop();
}

ControlChannel::Route ControlChannel::Submit(const std::string& raw) {
    const std::string line = wire::Trim(raw);

    switch (wire::Classify(line)) {
        case wire::LineKind::EMPTY:
            return Route::IGNORED;

        case wire::LineKind::HOST_CONFIG: {
            msg::HostConfigCommand cmd;
            if (!wire::ParseHostLine(line, cmd)) return Route::IGNORED;
            if (!pushUntilStopped(m_host_q, cmd, m_stop, POLL_MS)) return Route::IGNORED;
            return Route::HOST;
        }

        case wire::LineKind::DEVICE_COMMAND:
            if (line.size() == 1) return Route::IGNORED;
            if (!pushUntilStopped(m_device_q, line, m_stop, POLL_MS)) return Route::IGNORED;
            return Route::DEVICE;

        case wire::LineKind::PAYLOAD:
        default:
            // Bare command name: supply the sigil.
            if (!pushUntilStopped(m_device_q, std::string(1, msg::DEVICE_SIGIL) + line, m_stop, POLL_MS)) {
                return Route::IGNORED;
            }
            return Route::DEVICE;
    }
}

std::size_t ControlChannel::DrainHost(imgproc::ProcessingConfig& cfg) {
    std::size_t applied = 0;
    msg::HostConfigCommand cmd;
    while (m_host_q.try_receive(cmd)) {
        if (Apply(cmd, cfg) == imgproc::ConfigStatus::OK) ++applied;
    }
    return applied;
}

bool ControlChannel::DrainDevice(SerialLink& link) {
    std::string line;
    while (m_device_q.try_receive(line)) {
        if (!link.SendLine(line)) return false;
    }
    return true;
}

imgproc::ConfigStatus ControlChannel::Apply(const msg::HostConfigCommand& cmd,
                                            imgproc::ProcessingConfig& cfg) const {
    const std::string& key = cmd.key;

    if (is(key, "help", "?")) {
        PrintHelp();
        return imgproc::ConfigStatus::OK;
    }
    if (is(key, "reset")) {
        cfg = m_defaults;
        logConfig("reset", cfg);
        return imgproc::ConfigStatus::OK;
    }

    imgproc::ProcessingConfig next = cfg;
    const char* canon = nullptr;
    std::string shown;
    float f = 0.0f;

    auto badValue = [&]() {
        std::cerr << "[HOST] @" << key << ": bad value '" << cmd.value << "'\n";
        return imgproc::ConfigStatus::BAD_VALUE;
    };

    if (is(key, "gamma", "g")) {
        if (!parseFloat(cmd.value, f)) return badValue();
        next.gamma = f;
        canon = "gamma";
        shown = cmd.value;
    } else if (is(key, "contrast", "c")) {
        if (!parseFloat(cmd.value, f)) return badValue();
        next.contrast = f;
        canon = "contrast";
        shown = cmd.value;
    } else if (is(key, "brightness", "b")) {
        if (!parseFloat(cmd.value, f) || std::fabs(f) > 1e6f) return badValue();
        next.brightness = static_cast<int>(f);   // truncates toward zero
        next = imgproc::sanitise(next);
        canon = "brightness";
        shown = std::to_string(next.brightness);
    } else if (is(key, "dither", "d")) {
        if (!imgproc::ParseDitherMode(cmd.value, next.dither)) {
            std::cerr << "[HOST] dither must be bayer|fs|atkinson\n";
            return imgproc::ConfigStatus::BAD_DITHER;
        }
        canon = "dither";
        shown = imgproc::DitherModeStr(next.dither);
    } else if (is(key, "invert", "inv")) {
        next.invert = parseSwitch(cmd.value);
        canon = "invert";
        shown = next.invert ? "true" : "false";
    } else if (is(key, "rotate180", "rot", "rotate")) {
        next.rotate180 = parseSwitch(cmd.value);
        canon = "rotate180";
        shown = next.rotate180 ? "true" : "false";
    } else {
        std::cerr << "[HOST] unknown @" << key << " (try @help)\n";
        return imgproc::ConfigStatus::UNKNOWN_KEY;
    }

    const imgproc::ConfigStatus st = imgproc::Validate(next);
    if (st != imgproc::ConfigStatus::OK) {
        std::cerr << "[HOST] @" << key << " " << cmd.value << " rejected: "
                  << imgproc::ConfigStatusStr(st) << "\n";
        return st;
    }

    cfg = next;
    std::cerr << "[HOST] " << canon << " -> " << shown << "\n";
    return imgproc::ConfigStatus::OK;
}

void ControlChannel::PrintHelp() {
    std::cerr << "\nInteractive commands:\n"
                 "  Device (sent to board): !contrast 40 | !bl 0.3 | !inv 1 | !reg 3 | !bias 1\n"
                 "  Host (video processing): @gamma 1.2 | @contrast 1.2 | @brightness -10 | @dither fs\n"
                 "  Host: @invert 1 | @rotate180 1 | @reset\n\n";
}

// -------------------- private helpers --------------------

void ControlChannel::readerLoop() {
    const int fd = ::fileno(m_in);
    std::string pending;
    char buf[512];

    // Poll with a timeout so Stop() is seen even while no input arrives.
    while (!m_stop.load()) {
        pollfd p{};
        p.fd = fd;
        p.events = POLLIN;
        const int r = ::poll(&p, 1, POLL_MS);
        if (r < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (r == 0) continue;

        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            break;
        }
        if (n == 0) {
            if (!pending.empty()) (void)Submit(pending);   // last line without '\n'
            break;
        }

        pending.append(buf, static_cast<std::size_t>(n));
        std::size_t nl;
        while ((nl = pending.find('\n')) != std::string::npos && !m_stop.load()) {
            (void)Submit(pending.substr(0, nl));
            pending.erase(0, nl + 1);
        }
    }

    m_closed = true;
    if (!m_stop.load()) std::cerr << "[HOST] interactive input closed\n";
}

} // namespace host
