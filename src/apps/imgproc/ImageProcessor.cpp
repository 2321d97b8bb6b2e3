// ImageProcessor.cpp
#include "apps/imgproc/ImageProcessor.hpp"

#include <opencv2/core.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace {

// 8x8 Bayer index matrix, values 0..63
static const uint8_t BAYER8[8][8] = {
    { 0, 48, 12, 60,  3, 51, 15, 63},
    {32, 16, 44, 28, 35, 19, 47, 31},
    { 8, 56,  4, 52, 11, 59,  7, 55},
    {40, 24, 36, 20, 43, 27, 39, 23},
    { 2, 50, 14, 62,  1, 49, 13, 61},
    {34, 18, 46, 30, 33, 17, 45, 29},
    {10, 58,  6, 54,  9, 57,  5, 53},
    {42, 26, 38, 22, 41, 25, 37, 21},
};

static constexpr int32_t MID   = 128;
static constexpr int32_t WHITE = 255;
static constexpr uint8_t ON    = 255;

static inline float clip255(float v) {
    return v < 0.0f ? 0.0f : (v > 255.0f ? 255.0f : v);
}

// Quantise one accumulator cell to {0,255}; returns the signed error.
static inline int32_t quantise(int32_t& cell, uint8_t& mask_px) {
    const int32_t old_v = cell;
    const int32_t new_v = old_v < MID ? 0 : WHITE;
    cell = new_v;
    mask_px = (new_v < MID) ? ON : 0;
    return old_v - new_v;
}

// Add a share of the error to a neighbour, tracking what was carried.
static inline void carry(int32_t& cell, int32_t share, uint64_t& carried) {
    cell += share;
    carried += static_cast<uint64_t>(share < 0 ? -share : share);
}

} // anonymous namespace

namespace imgproc {

const char* DitherModeStr(DitherMode m) {
    switch (m) {
        case DitherMode::BAYER:           return "bayer";
        case DitherMode::FLOYD_STEINBERG: return "fs";
        case DitherMode::ATKINSON:        return "atkinson";
        default:                          return "unknown";
    }
}

bool ParseDitherMode(const std::string& name, DitherMode& out) {
    std::string n = name;
    for (auto& c : n) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (n == "bayer" || n == "ordered") { out = DitherMode::BAYER; return true; }
    if (n == "fs" || n == "floyd" || n == "floyd-steinberg") { out = DitherMode::FLOYD_STEINBERG; return true; }
    if (n == "atkinson") { out = DitherMode::ATKINSON; return true; }
    return false;
}

const char* ConfigStatusStr(ConfigStatus s) {
    switch (s) {
        case ConfigStatus::OK:           return "OK";
        case ConfigStatus::BAD_GAMMA:    return "BAD_GAMMA";
        case ConfigStatus::BAD_CONTRAST: return "BAD_CONTRAST";
        case ConfigStatus::BAD_DITHER:   return "BAD_DITHER";
        case ConfigStatus::BAD_VALUE:    return "BAD_VALUE";
        case ConfigStatus::UNKNOWN_KEY:  return "UNKNOWN_KEY";
        default:                         return "UNKNOWN";
    }
}

ConfigStatus Validate(const ProcessingConfig& cfg) {
    if (!(cfg.gamma > 0.0f) || !std::isfinite(cfg.gamma)) return ConfigStatus::BAD_GAMMA;
    if (!(cfg.contrast > 0.0f) || !std::isfinite(cfg.contrast)) return ConfigStatus::BAD_CONTRAST;
    switch (cfg.dither) {
        case DitherMode::BAYER:
        case DitherMode::FLOYD_STEINBERG:
        case DitherMode::ATKINSON:
            break;
        default:
            return ConfigStatus::BAD_DITHER;
    }
    return ConfigStatus::OK;
}

ProcessingConfig sanitise(const ProcessingConfig& in) {
    ProcessingConfig cfg = in;
    if (cfg.brightness < -255) cfg.brightness = -255;
    if (cfg.brightness > 255)  cfg.brightness = 255;
    return cfg;
}

ImageProcessor::ImageProcessor(const msg::FrameGeometry& geometry)
: m_geo(geometry) {
    m_status = Status::OK;

    if (!m_geo.valid()) {
        fail(Status::BAD_GEOMETRY);
        return;
    }

    const int w = static_cast<int>(m_geo.width);
    const int h = static_cast<int>(m_geo.height);

    // Precompute the tiled threshold plane once; per frame it is one compare.
    m_bayer_thr.create(h, w, CV_8UC1);
    for (int y = 0; y < h; ++y) {
        uint8_t* row = m_bayer_thr.ptr<uint8_t>(y);
        for (int x = 0; x < w; ++x) {
            row[x] = static_cast<uint8_t>(BAYER8[y & 7][x & 7] * 4 + 2);
        }
    }

    m_lut.create(1, 256, CV_8UC1);
}

bool ImageProcessor::Process(const msg::RawFrame& raw, const ProcessingConfig& cfg,
                             msg::PackedFrame& out, DitherStats* stats) {
    if (!m_geo.valid()) return fail(Status::BAD_GEOMETRY);
    if (!raw.data || raw.size != m_geo.rawBytes()) return fail(Status::SHAPE_MISMATCH);

    m_status = Status::OK;
    if (stats) *stats = DitherStats{};

    const int w = static_cast<int>(m_geo.width);
    const int h = static_cast<int>(m_geo.height);

    // Non-owning view over the decoder buffer; never written to.
    const cv::Mat src(h, w, CV_8UC1, const_cast<uint8_t*>(raw.data));
    cv::Mat img = src;

    // ---- 1) rotate 180 ----
    if (cfg.rotate180) {
        cv::flip(img, m_rotated, -1);
        img = m_rotated;
    }

    // ---- 2+3) brightness/contrast, gamma ----
    if (!buildToneLut(cfg)) return false;
    if (!m_lut_identity) {
        cv::LUT(img, m_lut, m_toned);
        img = m_toned;
    }

    // ---- 4) dither to on/off mask ----
    switch (cfg.dither) {
        case DitherMode::BAYER:           ditherBayer(img); break;
        case DitherMode::FLOYD_STEINBERG: ditherFloydSteinberg(img, stats); break;
        case DitherMode::ATKINSON:        ditherAtkinson(img, stats); break;
        default:                          return fail(Status::BAD_CONFIG);
    }

    // ---- 5) invert ----
    if (cfg.invert) {
        cv::bitwise_not(m_mask, m_mask);
    }

    // ---- 6) pack ----
    Pack(m_mask, out);
    if (!out.shapeOk()) return fail(Status::SHAPE_MISMATCH);
    return true;
}

// -------------------- packing --------------------

void ImageProcessor::Pack(const cv::Mat& mask, msg::PackedFrame& out) {
    const int w = mask.cols;
    const int h = mask.rows;
    const int pages = h / 8;

    out.geometry.width  = static_cast<uint32_t>(w);
    out.geometry.height = static_cast<uint32_t>(h);
    out.bytes.assign(static_cast<std::size_t>(w) * pages, 0);

    for (int p = 0; p < pages; ++p) {
        uint8_t* dst = out.bytes.data() + static_cast<std::size_t>(p) * w;
        for (int bit = 0; bit < 8; ++bit) {
            const uint8_t* row = mask.ptr<uint8_t>(p * 8 + bit);
            const uint8_t  m   = static_cast<uint8_t>(1u << bit);
            for (int x = 0; x < w; ++x) {
                if (row[x]) dst[x] |= m;
            }
        }
    }
}

void ImageProcessor::Unpack(const msg::PackedFrame& packed, cv::Mat& mask) {
    const int w = static_cast<int>(packed.geometry.width);
    const int h = static_cast<int>(packed.geometry.height);
    mask.create(h, w, CV_8UC1);

    for (int y = 0; y < h; ++y) {
        const uint8_t* src = packed.page(static_cast<uint32_t>(y / 8));
        const uint8_t  m   = static_cast<uint8_t>(1u << (y & 7));
        uint8_t* row = mask.ptr<uint8_t>(y);
        for (int x = 0; x < w; ++x) {
            row[x] = (src[x] & m) ? ON : 0;
        }
    }
}

// -------------------- private helpers --------------------

bool ImageProcessor::buildToneLut(const ProcessingConfig& cfg) {
    if (m_lut_valid && cfg.gamma == m_lut_gamma && cfg.brightness == m_lut_brightness
        && cfg.contrast == m_lut_contrast) {
        return true;
    }

    if (!(cfg.gamma > 0.0f) || !(cfg.contrast > 0.0f)) {
        m_lut_valid = false;
        return fail(Status::BAD_CONFIG);
    }

    const bool affine = (cfg.brightness != 0) || (cfg.contrast != 1.0f);
    const bool gamma  = (cfg.gamma != 1.0f);

    uint8_t* lut = m_lut.ptr<uint8_t>(0);
    for (int v = 0; v < 256; ++v) {
        uint8_t t = static_cast<uint8_t>(v);

        // Each stage truncates back to 8 bits before the next one.
        if (affine) {
            float f = static_cast<float>(t);
            if (cfg.contrast != 1.0f) f = (f - 128.0f) * cfg.contrast + 128.0f;
            if (cfg.brightness != 0)  f = f + static_cast<float>(cfg.brightness);
            t = static_cast<uint8_t>(clip255(f));
        }
        if (gamma) {
            const float f = std::pow(static_cast<float>(t) / 255.0f, cfg.gamma) * 255.0f;
            t = static_cast<uint8_t>(clip255(f));
        }
        lut[v] = t;
    }

    m_lut_identity   = !affine && !gamma;
    m_lut_gamma      = cfg.gamma;
    m_lut_brightness = cfg.brightness;
    m_lut_contrast   = cfg.contrast;
    m_lut_valid      = true;
    return true;
}

void ImageProcessor::ditherBayer(const cv::Mat& src) {
    // on iff value < threshold (strict)
    cv::compare(src, m_bayer_thr, m_mask, cv::CMP_LT);
}

void ImageProcessor::ditherFloydSteinberg(const cv::Mat& src, DitherStats* stats) {
    const int w = src.cols;
    const int h = src.rows;

    src.convertTo(m_accum, CV_32S);
    m_mask.create(h, w, CV_8UC1);

    uint64_t quant = 0;
    uint64_t carried = 0;

    for (int y = 0; y < h; ++y) {
        int32_t* row  = m_accum.ptr<int32_t>(y);
        int32_t* next = (y + 1 < h) ? m_accum.ptr<int32_t>(y + 1) : nullptr;
        uint8_t* mrow = m_mask.ptr<uint8_t>(y);

        // Serpentine: even rows left->right, odd rows right->left.
        const bool reverse = (y & 1) != 0;
        const int  dir     = reverse ? -1 : 1;

        for (int i = 0; i < w; ++i) {
            const int x = reverse ? (w - 1 - i) : i;

            const int32_t err = quantise(row[x], mrow[x]);
            quant += static_cast<uint64_t>(err < 0 ? -err : err);

            // Truncating division; out-of-frame shares are simply dropped.
            const int xn = x + dir;
            const int xp = x - dir;
            const bool xn_in = (xn >= 0 && xn < w);
            const bool xp_in = (xp >= 0 && xp < w);

            if (xn_in) carry(row[xn], (err * 7) / 16, carried);
            if (next) {
                carry(next[x], (err * 5) / 16, carried);
                if (xp_in) carry(next[xp], (err * 3) / 16, carried);
                if (xn_in) carry(next[xn], (err * 1) / 16, carried);
            }
        }
    }

    if (stats) {
        stats->quant_error_abs   = quant;
        stats->carried_error_abs = carried;
    }
}

void ImageProcessor::ditherAtkinson(const cv::Mat& src, DitherStats* stats) {
    const int w = src.cols;
    const int h = src.rows;

    src.convertTo(m_accum, CV_32S);
    m_mask.create(h, w, CV_8UC1);

    uint64_t quant = 0;
    uint64_t carried = 0;

    for (int y = 0; y < h; ++y) {
        int32_t* row   = m_accum.ptr<int32_t>(y);
        int32_t* next  = (y + 1 < h) ? m_accum.ptr<int32_t>(y + 1) : nullptr;
        int32_t* next2 = (y + 2 < h) ? m_accum.ptr<int32_t>(y + 2) : nullptr;
        uint8_t* mrow  = m_mask.ptr<uint8_t>(y);

        for (int x = 0; x < w; ++x) {
            const int32_t err = quantise(row[x], mrow[x]);
            quant += static_cast<uint64_t>(err < 0 ? -err : err);

            // Six neighbours get err/8 each; the remaining 2/8 is discarded.
            const int32_t q = err / 8;

            if (x + 1 < w) carry(row[x + 1], q, carried);
            if (x + 2 < w) carry(row[x + 2], q, carried);
            if (next) {
                if (x - 1 >= 0) carry(next[x - 1], q, carried);
                carry(next[x], q, carried);
                if (x + 1 < w) carry(next[x + 1], q, carried);
            }
            if (next2) carry(next2[x], q, carried);
        }
    }

    if (stats) {
        stats->quant_error_abs   = quant;
        stats->carried_error_abs = carried;
    }
}

// FDIR

bool ImageProcessor::fail(Status s) {
    m_status = s;
    return false;
}

const char* ImageProcessor::StatusStr(ImageProcessor::Status s) {
    switch (s) {
        case ImageProcessor::Status::OK:             return "OK";
        case ImageProcessor::Status::SHAPE_MISMATCH: return "SHAPE_MISMATCH";
        case ImageProcessor::Status::BAD_GEOMETRY:   return "BAD_GEOMETRY";
        case ImageProcessor::Status::BAD_CONFIG:     return "BAD_CONFIG";
        default:                                     return "UNKNOWN";
    }
}

} // namespace imgproc
