#pragma once
#include <cstdint>
#include <string>

#include "apps/host/FrameSource.hpp"
#include "apps/host/PacingController.hpp"
#include "apps/imgproc/ImageProcessor.hpp"

namespace host {

// Everything the streamer is told on its command line.
struct StreamConfig {
    // Link
    std::string port;                     // required
    uint32_t    baud = 500000;

    // Device set-up sent before playback
    int         lcd_contrast = -1;        // < 0: leave as is
    std::string backlight;                // empty: leave as is

    // Decode
    std::string input       = "bee_movie.mp4";
    std::string raw_path;                 // non-empty: read raw frames, no decoder
    float       fps         = 15.0f;
    ScaleMode   mode        = ScaleMode::CROP;
    std::string scale_flags = "lanczos";
    float       seek_s      = 0.0f;

    // Image
    imgproc::ProcessingConfig processing{};

    // Pacing
    uint32_t    frames      = 0;          // 0 = until EOF
    bool        realtime    = true;
    bool        drop_frames = false;
    bool        interactive = false;

    // Preview window
    bool        preview        = false;
    bool        preview_mute   = false;
    float       preview_offset = 0.0f;
};

enum class ParseResult : uint8_t {
    OK = 0,
    HELP,      // --help given, usage printed
    ERROR,     // message printed
};

ParseResult ParseStreamArgs(int argc, char** argv, StreamConfig& out);
void PrintStreamUsage(const char* prog);

DecoderConfig ToDecoderConfig(const StreamConfig& cfg);
PacingConfig  ToPacingConfig(const StreamConfig& cfg);

} // namespace host
