#pragma once
#include <cstdint>
#include <fstream>
#include <string>
#include "host_capture.pb.h"

// Appends frames as [u64 timestamp][u32 size][serialized HostFrame].
class CaptureWriter
{
private:
    std::ofstream file;
    std::size_t frames = 0;

public:
    explicit CaptureWriter(std::string const& path);

    void append(transit_capture::HostFrame const& frame);
    [[nodiscard]] std::size_t written() const noexcept { return frames; }
};
