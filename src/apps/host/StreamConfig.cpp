// StreamConfig.cpp
#include "apps/host/StreamConfig.hpp"

#include <getopt.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <limits>

namespace {

enum OptId : int {
    OPT_PORT = 1000,
    OPT_BAUD,
    OPT_FPS,
    OPT_LCD_CONTRAST,
    OPT_BACKLIGHT,
    OPT_GAMMA,
    OPT_BRIGHTNESS,
    OPT_CONTRAST,
    OPT_DITHER,
    OPT_SCALE_FLAGS,
    OPT_MODE,
    OPT_INVERT,
    OPT_ROTATE180,
    OPT_SEEK,
    OPT_FRAMES,
    OPT_INTERACTIVE,
    OPT_DROP_FRAMES,
    OPT_PREVIEW,
    OPT_PREVIEW_MUTE,
    OPT_PREVIEW_OFFSET,
    OPT_NO_REALTIME,
    OPT_INPUT,
    OPT_RAW,
    OPT_HELP,
};

static const option kLongOpts[] = {
    {"port",           required_argument, nullptr, OPT_PORT},
    {"baud",           required_argument, nullptr, OPT_BAUD},
    {"fps",            required_argument, nullptr, OPT_FPS},
    {"lcd-contrast",   required_argument, nullptr, OPT_LCD_CONTRAST},
    {"backlight",      required_argument, nullptr, OPT_BACKLIGHT},
    {"gamma",          required_argument, nullptr, OPT_GAMMA},
    {"brightness",     required_argument, nullptr, OPT_BRIGHTNESS},
    {"contrast",       required_argument, nullptr, OPT_CONTRAST},
    {"dither",         required_argument, nullptr, OPT_DITHER},
    {"scale-flags",    required_argument, nullptr, OPT_SCALE_FLAGS},
    {"mode",           required_argument, nullptr, OPT_MODE},
    {"invert",         no_argument,       nullptr, OPT_INVERT},
    {"rotate180",      no_argument,       nullptr, OPT_ROTATE180},
    {"seek",           required_argument, nullptr, OPT_SEEK},
    {"frames",         required_argument, nullptr, OPT_FRAMES},
    {"interactive",    no_argument,       nullptr, OPT_INTERACTIVE},
    {"drop-frames",    no_argument,       nullptr, OPT_DROP_FRAMES},
    {"preview",        no_argument,       nullptr, OPT_PREVIEW},
    {"preview-mute",   no_argument,       nullptr, OPT_PREVIEW_MUTE},
    {"preview-offset", required_argument, nullptr, OPT_PREVIEW_OFFSET},
    {"no-realtime",    no_argument,       nullptr, OPT_NO_REALTIME},
    {"input",          required_argument, nullptr, OPT_INPUT},
    {"raw",            required_argument, nullptr, OPT_RAW},
    {"help",           no_argument,       nullptr, OPT_HELP},
    {nullptr,          0,                 nullptr, 0},
};

static bool toFloat(const char* s, float& out) {
    if (!s || !*s) return false;
    errno = 0;
    char* end = nullptr;
    const float v = std::strtof(s, &end);
    if (*end != '\0' || errno == ERANGE || !std::isfinite(v)) return false;
    out = v;
    return true;
}

// Counts land in uint32_t fields; anything larger would wrap.
static constexpr long long COUNT_MAX = std::numeric_limits<uint32_t>::max();

static bool toLong(const char* s, long& out) {
    if (!s || !*s) return false;
    errno = 0;
    char* end = nullptr;
    const long v = std::strtol(s, &end, 10);
    if (*end != '\0' || errno == ERANGE) return false;
    out = v;
    return true;
}

static host::ParseResult bad(const char* opt, const char* value) {
    std::cerr << "[HOST] invalid value for --" << opt << ": '" << (value ? value : "") << "'\n";
    return host::ParseResult::ERROR;
}

} // anonymous namespace

namespace host {

ParseResult ParseStreamArgs(int argc, char** argv, StreamConfig& out) {
    StreamConfig cfg;
    long  l = 0;
    float f = 0.0f;

    optind = 0;   // full rescan, parsing may run more than once per process
    opterr = 1;

    int c;
    while ((c = ::getopt_long(argc, argv, "", kLongOpts, nullptr)) != -1) {
        switch (c) {
            case OPT_PORT:   cfg.port = optarg; break;
            case OPT_BAUD:
                if (!toLong(optarg, l) || l <= 0 || l > COUNT_MAX) return bad("baud", optarg);
                cfg.baud = static_cast<uint32_t>(l);
                break;
            case OPT_FPS:
                if (!toFloat(optarg, f) || f <= 0.0f) return bad("fps", optarg);
                cfg.fps = f;
                break;
            case OPT_LCD_CONTRAST:
                if (!toLong(optarg, l)) return bad("lcd-contrast", optarg);
                cfg.lcd_contrast = static_cast<int>(l);
                break;
            case OPT_BACKLIGHT: cfg.backlight = optarg; break;
            case OPT_GAMMA:
                if (!toFloat(optarg, f)) return bad("gamma", optarg);
                cfg.processing.gamma = f;
                break;
            case OPT_BRIGHTNESS:
                if (!toLong(optarg, l)) return bad("brightness", optarg);
                cfg.processing.brightness = static_cast<int>(std::max(-100000L, std::min(l, 100000L)));
                break;
            case OPT_CONTRAST:
                if (!toFloat(optarg, f)) return bad("contrast", optarg);
                cfg.processing.contrast = f;
                break;
            case OPT_DITHER:
                if (!imgproc::ParseDitherMode(optarg, cfg.processing.dither)) return bad("dither", optarg);
                break;
            case OPT_SCALE_FLAGS: cfg.scale_flags = optarg; break;
            case OPT_MODE:
                if (!ParseScaleMode(optarg, cfg.mode)) return bad("mode", optarg);
                break;
            case OPT_INVERT:    cfg.processing.invert = true; break;
            case OPT_ROTATE180: cfg.processing.rotate180 = true; break;
            case OPT_SEEK:
                if (!toFloat(optarg, f)) return bad("seek", optarg);
                cfg.seek_s = f;
                break;
            case OPT_FRAMES:
                if (!toLong(optarg, l) || l < 0 || l > COUNT_MAX) return bad("frames", optarg);
                cfg.frames = static_cast<uint32_t>(l);
                break;
            case OPT_INTERACTIVE:  cfg.interactive = true; break;
            case OPT_DROP_FRAMES:  cfg.drop_frames = true; break;
            case OPT_PREVIEW:      cfg.preview = true; break;
            case OPT_PREVIEW_MUTE: cfg.preview_mute = true; break;
            case OPT_PREVIEW_OFFSET:
                if (!toFloat(optarg, f)) return bad("preview-offset", optarg);
                cfg.preview_offset = f;
                break;
            case OPT_NO_REALTIME: cfg.realtime = false; break;
            case OPT_INPUT:       cfg.input = optarg; break;
            case OPT_RAW:         cfg.raw_path = optarg; break;
            case OPT_HELP:
                PrintStreamUsage(argv[0]);
                return ParseResult::HELP;
            default:
                // getopt already printed the complaint
                return ParseResult::ERROR;
        }
    }

    if (optind < argc) {
        std::cerr << "[HOST] unexpected argument '" << argv[optind] << "'\n";
        return ParseResult::ERROR;
    }
    if (cfg.port.empty()) {
        std::cerr << "[HOST] --port is required\n";
        return ParseResult::ERROR;
    }

    cfg.processing = imgproc::sanitise(cfg.processing);
    const imgproc::ConfigStatus st = imgproc::Validate(cfg.processing);
    if (st != imgproc::ConfigStatus::OK) {
        std::cerr << "[HOST] processing config rejected: " << imgproc::ConfigStatusStr(st) << "\n";
        return ParseResult::ERROR;
    }

    out = cfg;
    return ParseResult::OK;
}

void PrintStreamUsage(const char* prog) {
    std::cerr <<
        "usage: " << (prog ? prog : "pagestream") << " --port DEV [options]\n"
        "\n"
        "  --port DEV             serial port of the display board (required)\n"
        "  --baud N               baud rate (default 500000)\n"
        "  --fps F                playback rate (default 15)\n"
        "  --lcd-contrast N       send !contrast N before playback (0..63)\n"
        "  --backlight V          send !bl V before playback (0..100 %, raw duty, or 0.0..1.0)\n"
        "  --gamma F              gamma (>0, default 1.0)\n"
        "  --brightness N         brightness shift (-255..255)\n"
        "  --contrast F           contrast multiplier (>0, default 1.0)\n"
        "  --dither MODE          bayer | fs | atkinson (default bayer)\n"
        "  --scale-flags S        ffmpeg scale flags (default lanczos)\n"
        "  --mode M               crop | fit (default crop)\n"
        "  --invert               swap black and white\n"
        "  --rotate180            rotate frames 180 degrees\n"
        "  --seek S               start S seconds into the input\n"
        "  --frames N             stop after N frames (0 = until EOF)\n"
        "  --interactive          read !device and @host commands from stdin\n"
        "  --drop-frames          skip input frames when behind real time\n"
        "  --preview              play the input locally with ffplay, in sync\n"
        "  --preview-mute         no audio in the preview\n"
        "  --preview-offset S     preview starts at seek+S seconds\n"
        "  --no-realtime          send as fast as possible\n"
        "  --input PATH           input video (default bee_movie.mp4)\n"
        "  --raw PATH|-           read raw 128x64 GRAY8 frames instead of decoding\n";
}

DecoderConfig ToDecoderConfig(const StreamConfig& cfg) {
    DecoderConfig d;
    d.input       = cfg.input;
    d.fps         = cfg.fps;
    d.mode        = cfg.mode;
    d.seek_s      = cfg.seek_s;
    d.scale_flags = cfg.scale_flags;
    d.geometry    = msg::PANEL_GEOMETRY;
    return d;
}

PacingConfig ToPacingConfig(const StreamConfig& cfg) {
    PacingConfig p;
    p.fps         = cfg.fps;
    p.realtime    = cfg.realtime;
    p.drop_frames = cfg.drop_frames;
    p.max_frames  = cfg.frames;
    return p;
}

} // namespace host
