#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

#include "apps/host/ChildProcess.hpp"
#include "msg/FrameGeometry.hpp"

namespace host {

// Supplier of fixed-size GRAY8 frames.
class IFrameSource {
public:
    // Fill dst with exactly n bytes. False on a short read: end of stream.
    virtual bool ReadFrame(uint8_t* dst, std::size_t n) = 0;
    virtual ~IFrameSource() = default;
};

enum class ScaleMode : uint8_t {
    CROP = 0,   // fill the panel, cut the overflow
    FIT,        // letterbox
};

const char* ScaleModeStr(ScaleMode m);
bool ParseScaleMode(const std::string& name, ScaleMode& out);

struct DecoderConfig {
    std::string input       = "bee_movie.mp4";
    float       fps         = 15.0f;
    ScaleMode   mode        = ScaleMode::CROP;
    float       seek_s      = 0.0f;          // <= 0: from the start
    std::string scale_flags = "lanczos";
    msg::FrameGeometry geometry{};
};

// ffmpeg argv producing raw GRAY8 frames of `geometry` on stdout.
std::vector<std::string> BuildDecoderArgs(const DecoderConfig& cfg);

// ffplay argv for the local preview window.
std::vector<std::string> BuildPreviewArgs(const std::string& input, float seek_s, float offset_s, bool mute);

// ---------------------------------------------------------------------------
// DecoderSource: frames from an ffmpeg child process.
// ---------------------------------------------------------------------------
class DecoderSource : public IFrameSource {
public:
    explicit DecoderSource(const DecoderConfig& cfg);

    bool Start();
    bool ReadFrame(uint8_t* dst, std::size_t n) override;

    // Stop the decoder (terminate -> 2 s -> kill). Prints its stderr if it
    // failed. Returns its exit code, 0 if it ended cleanly or was stopped.
    int Finish();

private:
    DecoderConfig m_cfg{};
    ChildProcess  m_proc;
};

// ---------------------------------------------------------------------------
// RawStreamSource: pre-decoded frames from a file, or stdin for "-".
// ---------------------------------------------------------------------------
class RawStreamSource : public IFrameSource {
public:
    explicit RawStreamSource(const std::string& path);
    ~RawStreamSource() override;

    RawStreamSource(const RawStreamSource&) = delete;
    RawStreamSource& operator=(const RawStreamSource&) = delete;

    bool Open();
    bool ReadFrame(uint8_t* dst, std::size_t n) override;

    int lastErrno() const { return m_errno; }

private:
    std::string m_path;
    int  m_fd = -1;
    bool m_owns_fd = false;
    int  m_errno = 0;
};

} // namespace host
