// test/imgproc_dither_test.cpp
//
// ImageProcessor tone + dither stages on small synthetic frames.

#include <iostream>
#include <vector>

#include "apps/imgproc/ImageProcessor.hpp"

static int g_failures = 0;

static void check(bool ok, int line, const char* what) {
    if (ok) return;
    std::cout << "  FAIL " << line << ": " << what << "\n";
    ++g_failures;
}

static msg::RawFrame view(const std::vector<uint8_t>& px, const msg::FrameGeometry& g) {
    msg::RawFrame raw;
    raw.data = px.data();
    raw.size = px.size();
    raw.geometry = g;
    return raw;
}

static bool allBytes(const msg::PackedFrame& f, uint8_t v) {
    for (uint8_t b : f.bytes) if (b != v) return false;
    return true;
}

static int popcount(const msg::PackedFrame& f) {
    int n = 0;
    for (uint8_t b : f.bytes) for (int i = 0; i < 8; ++i) n += (b >> i) & 1;
    return n;
}

static void testUniform() {
    std::cout << "-- uniform white/black, every mode\n";
    const msg::FrameGeometry g = msg::PANEL_GEOMETRY;
    imgproc::ImageProcessor proc(g);

    const std::vector<uint8_t> white(g.rawBytes(), 255);
    const std::vector<uint8_t> black(g.rawBytes(), 0);

    const imgproc::DitherMode modes[] = {
        imgproc::DitherMode::BAYER,
        imgproc::DitherMode::FLOYD_STEINBERG,
        imgproc::DitherMode::ATKINSON,
    };
    for (auto m : modes) {
        imgproc::ProcessingConfig cfg;
        cfg.dither = m;

        msg::PackedFrame out;
        check(proc.Process(view(white, g), cfg, out), __LINE__, "proc.Process(view(white, g), cfg, out)");
        check(out.bytes.size() == 1024, __LINE__, "out.bytes.size() == 1024");
        check(allBytes(out, 0x00), __LINE__, "allBytes(out, 0x00)");

        check(proc.Process(view(black, g), cfg, out), __LINE__, "proc.Process(view(black, g), cfg, out)");
        check(allBytes(out, 0xFF), __LINE__, "allBytes(out, 0xFF)");

        cfg.invert = true;
        check(proc.Process(view(white, g), cfg, out), __LINE__, "proc.Process(view(white, g), cfg, out)");
        check(allBytes(out, 0xFF), __LINE__, "allBytes(out, 0xFF)");
    }
}

static void testBayer() {
    std::cout << "-- bayer threshold plane\n";
    const msg::FrameGeometry g = msg::PANEL_GEOMETRY;
    imgproc::ImageProcessor proc(g);

    const cv::Mat& thr = proc.bayerThreshold();
    check(thr.rows == 64 && thr.cols == 128, __LINE__, "thr.rows == 64 && thr.cols == 128");
    check(thr.at<uint8_t>(0, 0) == 2, __LINE__, "thr.at<uint8_t>(0, 0) == 2");
    check(thr.at<uint8_t>(0, 1) == 48 * 4 + 2, __LINE__, "thr.at<uint8_t>(0, 1) == 48 * 4 + 2");
    check(thr.at<uint8_t>(8, 8) == 2, __LINE__, "thr.at<uint8_t>(8, 8) == 2");
    check(thr.at<uint8_t>(7, 7) == 21 * 4 + 2, __LINE__, "thr.at<uint8_t>(7, 7) == 21 * 4 + 2");

    // 39 of every 64 thresholds exceed 100.
    const std::vector<uint8_t> gray(g.rawBytes(), 100);
    imgproc::ProcessingConfig cfg;
    msg::PackedFrame a, b;
    check(proc.Process(view(gray, g), cfg, a), __LINE__, "proc.Process(view(gray, g), cfg, a)");
    check(proc.Process(view(gray, g), cfg, b), __LINE__, "proc.Process(view(gray, g), cfg, b)");
    check(a.bytes == b.bytes, __LINE__, "a.bytes == b.bytes");
    check(popcount(a) == 39 * 128, __LINE__, "popcount(a) == 39 * 128");
}

static void testErrorDiffusion() {
    std::cout << "-- error diffusion on a 1x8 column of 100\n";
    const msg::FrameGeometry g{1, 8};
    check(g.valid(), __LINE__, "g.valid()");
    imgproc::ImageProcessor proc(g);

    const std::vector<uint8_t> col(8, 100);
    imgproc::ProcessingConfig cfg;
    msg::PackedFrame out;
    imgproc::DitherStats fs, atk;

    cfg.dither = imgproc::DitherMode::FLOYD_STEINBERG;
    check(proc.Process(view(col, g), cfg, out, &fs), __LINE__, "proc.Process(view(col, g), cfg, out, &fs)");
    check(out.bytes.size() == 1, __LINE__, "out.bytes.size() == 1");
    check(out.bytes[0] == 0x6D, __LINE__, "out.bytes[0] == 0x6D");
    check(fs.quant_error_abs == 825, __LINE__, "fs.quant_error_abs == 825");
    check(fs.carried_error_abs == 218, __LINE__, "fs.carried_error_abs == 218");

    cfg.dither = imgproc::DitherMode::ATKINSON;
    check(proc.Process(view(col, g), cfg, out, &atk), __LINE__, "proc.Process(view(col, g), cfg, out, &atk)");
    check(out.bytes[0] == 0xF7, __LINE__, "out.bytes[0] == 0xF7");
    check(atk.quant_error_abs == 912, __LINE__, "atk.quant_error_abs == 912");
    check(atk.carried_error_abs == 175, __LINE__, "atk.carried_error_abs == 175");

    // Atkinson drops a quarter of each error.
    check(atk.carried_error_abs < fs.carried_error_abs, __LINE__, "atk.carried_error_abs < fs.carried_error_abs");
}

static void testErrorDiffusionFullFrame() {
    std::cout << "-- carried error over a full frame, fs vs atkinson\n";
    const msg::FrameGeometry g = msg::PANEL_GEOMETRY;
    imgproc::ImageProcessor proc(g);

    std::vector<uint8_t> gradient(g.rawBytes());
    for (uint32_t y = 0; y < g.height; ++y)
        for (uint32_t x = 0; x < g.width; ++x)
            gradient[y * g.width + x] = static_cast<uint8_t>(x * 255 / (g.width - 1));

    const std::vector<uint8_t> inputs[] = {
        std::vector<uint8_t>(g.rawBytes(), 100),
        gradient,
    };
    for (const auto& px : inputs) {
        imgproc::ProcessingConfig cfg;
        msg::PackedFrame out;
        imgproc::DitherStats fs, atk;

        cfg.dither = imgproc::DitherMode::FLOYD_STEINBERG;
        check(proc.Process(view(px, g), cfg, out, &fs), __LINE__, "proc.Process(view(px, g), cfg, out, &fs)");
        cfg.dither = imgproc::DitherMode::ATKINSON;
        check(proc.Process(view(px, g), cfg, out, &atk), __LINE__, "proc.Process(view(px, g), cfg, out, &atk)");

        check(fs.carried_error_abs > 0, __LINE__, "fs.carried_error_abs > 0");
        check(atk.carried_error_abs < fs.carried_error_abs, __LINE__, "atk.carried_error_abs < fs.carried_error_abs");
    }
}

static void testTone() {
    std::cout << "-- tone stages\n";
    const msg::FrameGeometry g = msg::PANEL_GEOMETRY;
    imgproc::ImageProcessor proc(g);
    const std::vector<uint8_t> gray(g.rawBytes(), 100);
    msg::PackedFrame out;

    imgproc::ProcessingConfig cfg;
    cfg.brightness = 255;
    check(proc.Process(view(gray, g), cfg, out), __LINE__, "proc.Process(view(gray, g), cfg, out)");
    check(allBytes(out, 0x00), __LINE__, "allBytes(out, 0x00)");

    cfg.brightness = -255;
    check(proc.Process(view(gray, g), cfg, out), __LINE__, "proc.Process(view(gray, g), cfg, out)");
    check(allBytes(out, 0xFF), __LINE__, "allBytes(out, 0xFF)");

    // Strong contrast pushes 100 to black: (100-128)*10+128 < 0.
    cfg = imgproc::ProcessingConfig{};
    cfg.contrast = 10.0f;
    check(proc.Process(view(gray, g), cfg, out), __LINE__, "proc.Process(view(gray, g), cfg, out)");
    check(allBytes(out, 0xFF), __LINE__, "allBytes(out, 0xFF)");

    // gamma < 1 brightens: (100/255)^0.1*255 = 232, only thresholds 234.. light up.
    cfg = imgproc::ProcessingConfig{};
    cfg.gamma = 0.1f;
    check(proc.Process(view(gray, g), cfg, out), __LINE__, "proc.Process(view(gray, g), cfg, out)");
    check(popcount(out) == 6 * 128, __LINE__, "popcount(out) == 6 * 128");
}

static void testRotate() {
    std::cout << "-- rotate180\n";
    const msg::FrameGeometry g = msg::PANEL_GEOMETRY;
    imgproc::ImageProcessor proc(g);

    std::vector<uint8_t> px(g.rawBytes(), 255);
    px[0] = 0;   // top-left dark

    imgproc::ProcessingConfig cfg;
    msg::PackedFrame out;
    check(proc.Process(view(px, g), cfg, out), __LINE__, "proc.Process(view(px, g), cfg, out)");
    check(out.bytes[0] == 0x01, __LINE__, "out.bytes[0] == 0x01");
    check(popcount(out) == 1, __LINE__, "popcount(out) == 1");

    cfg.rotate180 = true;
    check(proc.Process(view(px, g), cfg, out), __LINE__, "proc.Process(view(px, g), cfg, out)");
    check(out.bytes[0] == 0x00, __LINE__, "out.bytes[0] == 0x00");
    check(out.bytes[7 * 128 + 127] == 0x80, __LINE__, "out.bytes[7 * 128 + 127] == 0x80");
    check(popcount(out) == 1, __LINE__, "popcount(out) == 1");
}

static void testConfig() {
    std::cout << "-- config parsing and validation\n";
    imgproc::DitherMode m = imgproc::DitherMode::BAYER;
    check(imgproc::ParseDitherMode("Floyd-Steinberg", m) && m == imgproc::DitherMode::FLOYD_STEINBERG, __LINE__, "imgproc::ParseDitherMode(\"Floyd-Steinberg\", m) && m == imgproc::DitherMode::FLOYD_STEINBERG");
    check(imgproc::ParseDitherMode("fs", m) && m == imgproc::DitherMode::FLOYD_STEINBERG, __LINE__, "imgproc::ParseDitherMode(\"fs\", m) && m == imgproc::DitherMode::FLOYD_STEINBERG");
    check(imgproc::ParseDitherMode("ATKINSON", m) && m == imgproc::DitherMode::ATKINSON, __LINE__, "imgproc::ParseDitherMode(\"ATKINSON\", m) && m == imgproc::DitherMode::ATKINSON");
    check(imgproc::ParseDitherMode("ordered", m) && m == imgproc::DitherMode::BAYER, __LINE__, "imgproc::ParseDitherMode(\"ordered\", m) && m == imgproc::DitherMode::BAYER");
    check(!imgproc::ParseDitherMode("random", m), __LINE__, "!imgproc::ParseDitherMode(\"random\", m)");
    check(m == imgproc::DitherMode::BAYER, __LINE__, "m == imgproc::DitherMode::BAYER");

    imgproc::ProcessingConfig cfg;
    check(imgproc::Validate(cfg) == imgproc::ConfigStatus::OK, __LINE__, "imgproc::Validate(cfg) == imgproc::ConfigStatus::OK");
    cfg.gamma = 0.0f;
    check(imgproc::Validate(cfg) == imgproc::ConfigStatus::BAD_GAMMA, __LINE__, "imgproc::Validate(cfg) == imgproc::ConfigStatus::BAD_GAMMA");
    cfg.gamma = 1.0f;
    cfg.contrast = -1.0f;
    check(imgproc::Validate(cfg) == imgproc::ConfigStatus::BAD_CONTRAST, __LINE__, "imgproc::Validate(cfg) == imgproc::ConfigStatus::BAD_CONTRAST");

    cfg = imgproc::ProcessingConfig{};
    cfg.brightness = 900;
    check(imgproc::sanitise(cfg).brightness == 255, __LINE__, "imgproc::sanitise(cfg).brightness == 255");
    cfg.brightness = -900;
    check(imgproc::sanitise(cfg).brightness == -255, __LINE__, "imgproc::sanitise(cfg).brightness == -255");
}

static void testShape() {
    std::cout << "-- shape and geometry gates\n";
    const msg::FrameGeometry g = msg::PANEL_GEOMETRY;
    imgproc::ImageProcessor proc(g);
    const std::vector<uint8_t> short_buf(g.rawBytes() - 1, 0);
    msg::PackedFrame out;

    check(!proc.Process(view(short_buf, g), imgproc::ProcessingConfig{}, out), __LINE__, "!proc.Process(view(short_buf, g), imgproc::ProcessingConfig{}, out)");
    check(proc.lastStatus() == imgproc::ImageProcessor::Status::SHAPE_MISMATCH, __LINE__, "proc.lastStatus() == imgproc::ImageProcessor::Status::SHAPE_MISMATCH");

    const msg::FrameGeometry bad{128, 60};
    imgproc::ImageProcessor odd(bad);
    check(odd.lastStatus() == imgproc::ImageProcessor::Status::BAD_GEOMETRY, __LINE__, "odd.lastStatus() == imgproc::ImageProcessor::Status::BAD_GEOMETRY");
    const std::vector<uint8_t> px(bad.rawBytes(), 0);
    check(!odd.Process(view(px, bad), imgproc::ProcessingConfig{}, out), __LINE__, "!odd.Process(view(px, bad), imgproc::ProcessingConfig{}, out)");
}

int main() {
    std::cout << "=== IMGPROC DITHER TEST ===\n";
    testUniform();
    testBayer();
    testErrorDiffusion();
    testErrorDiffusionFullFrame();
    testTone();
    testRotate();
    testConfig();
    testShape();

    std::cout << (g_failures == 0 ? "PASS" : "FAIL") << "\n";
    return g_failures == 0 ? 0 : 1;
}
