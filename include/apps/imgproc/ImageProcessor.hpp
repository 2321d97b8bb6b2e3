#pragma once
#include <cstdint>
#include <string>

#include <opencv2/core.hpp>

#include "msg/FrameGeometry.hpp"
#include "msg/PackedFrame.hpp"
#include "msg/RawFrame.hpp"

namespace imgproc {

enum class DitherMode : uint8_t {
    BAYER = 0,          // ordered 8x8 threshold tile
    FLOYD_STEINBERG,    // serpentine error diffusion
    ATKINSON,           // raster error diffusion, 2/8 of error dropped
};

const char* DitherModeStr(DitherMode m);

// Accepts "bayer"/"ordered", "fs"/"floyd"/"floyd-steinberg", "atkinson"
// (case-insensitive).
bool ParseDitherMode(const std::string& name, DitherMode& out);

// ---------------------------------------------------------------------------
// Processing parameters. Owned by the streaming loop, edited only through
// host::ControlChannel setters, validated when applied (not per frame).
// ---------------------------------------------------------------------------
struct ProcessingConfig {
    float      gamma      = 1.0f;   // > 0; <1 brightens mids, >1 darkens
    int        brightness = 0;      // -255..255, added after contrast
    float      contrast   = 1.0f;   // > 0, multiplier around mid-gray (128)
    DitherMode dither     = DitherMode::BAYER;
    bool       invert     = false;
    bool       rotate180  = false;
};

enum class ConfigStatus : uint8_t {
    OK = 0,
    BAD_GAMMA,
    BAD_CONTRAST,
    BAD_DITHER,
    BAD_VALUE,      // unparseable value for a known key
    UNKNOWN_KEY,
};

const char* ConfigStatusStr(ConfigStatus s);

ConfigStatus Validate(const ProcessingConfig& cfg);

// Clamp brightness into range. Gamma/contrast are rejected by Validate()
// rather than repaired.
ProcessingConfig sanitise(const ProcessingConfig& in);

// Optional per-frame diagnostics for the error-diffusion modes.
struct DitherStats {
    uint64_t quant_error_abs   = 0;  // sum |old - new| over all pixels
    uint64_t carried_error_abs = 0;  // sum of |error| actually pushed to neighbours
};

// ---------------------------------------------------------------------------
// ImageProcessor: GRAY8 frame -> packed 1-bit frame.
//
// Stage order is fixed:
//   rotate180 -> brightness/contrast -> gamma -> dither -> invert -> pack
//
// The tone stages are folded into one 256-entry LUT, rebuilt only when the
// tone parameters change. Work buffers are reused between frames, so one
// instance must not be shared between threads; independent instances are
// fully independent.
// ---------------------------------------------------------------------------
class ImageProcessor {
public:
    explicit ImageProcessor(const msg::FrameGeometry& geometry = msg::PANEL_GEOMETRY);

    bool Process(const msg::RawFrame& raw, const ProcessingConfig& cfg,
                 msg::PackedFrame& out, DitherStats* stats = nullptr);

    // mask: CV_8UC1 of geometry size, non-zero = pixel on.
    static void Pack(const cv::Mat& mask, msg::PackedFrame& out);
    // Inverse of Pack(): 255 = on, 0 = off.
    static void Unpack(const msg::PackedFrame& packed, cv::Mat& mask);

    // 8x8 Bayer index matrix (0..63) tiled and scaled to thresholds (v*4+2).
    const cv::Mat& bayerThreshold() const { return m_bayer_thr; }

    const msg::FrameGeometry& geometry() const { return m_geo; }

    enum class Status : uint8_t {
        OK = 0,
        SHAPE_MISMATCH,   // raw buffer length != width*height
        BAD_GEOMETRY,     // height not a multiple of 8
        BAD_CONFIG,       // tone parameters rejected while building the LUT
    };

    static const char* StatusStr(Status s);
    Status lastStatus() const { return m_status; }

private:
    msg::FrameGeometry m_geo{};

    cv::Mat m_bayer_thr;   // CV_8UC1, geometry size
    cv::Mat m_rotated;     // CV_8UC1
    cv::Mat m_toned;       // CV_8UC1
    cv::Mat m_accum;       // CV_32SC1, error-diffusion accumulator
    cv::Mat m_mask;        // CV_8UC1, 255 = on

    // Tone LUT cache
    cv::Mat m_lut;         // 1x256 CV_8UC1
    bool    m_lut_identity = true;
    bool    m_lut_valid    = false;
    float   m_lut_gamma    = 1.0f;
    int     m_lut_brightness = 0;
    float   m_lut_contrast = 1.0f;

    Status m_status = Status::OK;

    bool buildToneLut(const ProcessingConfig& cfg);

    void ditherBayer(const cv::Mat& src);
    void ditherFloydSteinberg(const cv::Mat& src, DitherStats* stats);
    void ditherAtkinson(const cv::Mat& src, DitherStats* stats);

    bool fail(Status s);
};

} // namespace imgproc
