// pagestream: decode a video, dither it to 1 bit and stream it to the
// ST7567 board over a serial line, in real time.
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "apps/host/ChildProcess.hpp"
#include "apps/host/ControlChannel.hpp"
#include "apps/host/FrameSource.hpp"
#include "apps/host/PacingController.hpp"
#include "apps/host/SerialLink.hpp"
#include "apps/host/StreamConfig.hpp"
#include "apps/imgproc/ImageProcessor.hpp"
#include "msg/Commands.hpp"
#include "platform/linux/PosixSerialPort.hpp"

namespace {

// Preview player, launched by the pacing loop on its first frame.
struct PreviewCtx {
    std::vector<std::string> args;
    host::ChildProcess proc;
};

static void LaunchPreview(void* arg) {
    auto* ctx = static_cast<PreviewCtx*>(arg);
    if (!ctx || ctx->args.empty()) return;

    if (!ctx->proc.Spawn(ctx->args, host::ChildProcess::Stdio::INHERIT, host::ChildProcess::Stdio::INHERIT)) {
        std::cerr << "[HOST] failed to start preview player: "
                  << host::ChildProcess::StatusStr(ctx->proc.lastStatus()) << "\n";
    }
}

static bool SendStartupCommands(host::SerialLink& link, const host::StreamConfig& cfg) {
    if (cfg.lcd_contrast >= 0) {
        msg::ControlCommand c;
        c.name = "contrast";
        c.args[0] = std::to_string(cfg.lcd_contrast);
        c.argc = 1;
        if (!link.SendCommand(c)) return false;
    }
    if (!cfg.backlight.empty()) {
        msg::ControlCommand c;
        c.name = "bl";
        c.args[0] = cfg.backlight;
        c.argc = 1;
        if (!link.SendCommand(c)) return false;
    }
    return true;
}

} // anonymous namespace

int main(int argc, char** argv) {
    host::StreamConfig cfg;
    switch (host::ParseStreamArgs(argc, argv, cfg)) {
        case host::ParseResult::OK:    break;
        case host::ParseResult::HELP:  return 0;
        case host::ParseResult::ERROR:
        default:
            host::PrintStreamUsage(argv[0]);
            return 2;
    }

    const bool use_decoder = cfg.raw_path.empty();

    // ---- external tools ----
    if (use_decoder && !host::ChildProcess::FindInPath("ffmpeg")) {
        std::cerr << "ffmpeg not found in PATH.\n";
        return 2;
    }
    if (cfg.preview && !host::ChildProcess::FindInPath("ffplay")) {
        std::cerr << "ffplay not found in PATH (needed for --preview).\n";
        return 2;
    }
    if (cfg.interactive && cfg.raw_path == "-") {
        std::cerr << "[HOST] --interactive needs stdin, it cannot be combined with --raw -\n";
        return 2;
    }

    // ---- frame source ----
    std::unique_ptr<host::DecoderSource>   decoder;
    std::unique_ptr<host::RawStreamSource> raw_source;
    host::IFrameSource* source = nullptr;

    if (use_decoder) {
        decoder = std::make_unique<host::DecoderSource>(host::ToDecoderConfig(cfg));
        if (!decoder->Start()) return 1;
        source = decoder.get();
    } else {
        raw_source = std::make_unique<host::RawStreamSource>(cfg.raw_path);
        if (!raw_source->Open()) return 1;
        source = raw_source.get();
    }

    // ---- serial link ----
    platform::posix::SerialPortConfig port_cfg;
    port_cfg.path = cfg.port.c_str();
    port_cfg.baud = cfg.baud;

    platform::posix::PosixSerialPort port(port_cfg);
    if (!port.Open()) {
        std::cerr << "[SERIAL] cannot open " << cfg.port << ": "
                  << platform::posix::PosixSerialPort::StatusStr(port.lastStatus())
                  << " errno=" << port.lastErrno() << "\n";
        if (decoder) (void)decoder->Finish();
        return 1;
    }
    port.flushInput();

    host::SerialLink link(port);
    if (!SendStartupCommands(link, cfg)) {
        if (decoder) (void)decoder->Finish();
        return 1;
    }

    // ---- pipeline ----
    imgproc::ImageProcessor processor(msg::PANEL_GEOMETRY);
    imgproc::ProcessingConfig proc_cfg = cfg.processing;

    std::unique_ptr<host::ControlChannel> control;
    if (cfg.interactive) {
        control = std::make_unique<host::ControlChannel>(proc_cfg);
        if (!control->Start(stdin)) control.reset();
    }

    PreviewCtx preview;
    host::PacingConfig pacing_cfg = host::ToPacingConfig(cfg);
    if (cfg.preview) {
        preview.args = host::BuildPreviewArgs(cfg.input, cfg.seek_s, cfg.preview_offset, cfg.preview_mute);
        pacing_cfg.on_first_frame = &LaunchPreview;
        pacing_cfg.hook_ctx = &preview;
    }

    host::PacingController pacing(*source, processor, link, proc_cfg, pacing_cfg, control.get());
    const host::PacingController::Status st = pacing.Run();

    std::cerr << "\nDone. Total frames sent: " << pacing.framesSent()
              << " (dropped: " << pacing.framesDropped() << ")\n";
    std::cerr << "[LINK] bytes written: " << link.bytesWritten() << "\n";

    // ---- teardown ----
    int rc = 0;
    if (decoder) rc = decoder->Finish();
    (void)preview.proc.Terminate();

    if (host::PacingController::IsFatal(st)) {
        std::cerr << "[STREAM] aborted: " << host::PacingController::StatusStr(st) << "\n";
        return 1;
    }
    return rc;
}
