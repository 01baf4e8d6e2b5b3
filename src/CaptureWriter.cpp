#include "CaptureWriter.hpp"

#include <stdexcept>

CaptureWriter::CaptureWriter(std::string const& path)
    : file(path, std::ios::binary | std::ios::app)
{
    if (!file.is_open())
        throw std::runtime_error("Failed to open capture file: " + path);
}

void CaptureWriter::append(transit_capture::HostFrame const& frame)
{
    std::string data;
    if (!frame.SerializeToString(&data))
        throw std::runtime_error("Failed to serialize host frame");

    std::uint64_t timestamp = frame.timestamp();
    std::uint32_t size = static_cast<std::uint32_t>(data.size());
    file.write(reinterpret_cast<const char*>(&timestamp), sizeof(timestamp));
    file.write(reinterpret_cast<const char*>(&size), sizeof(size));
    file.write(data.data(), size);
    file.flush();

    if (!file.good())
        throw std::runtime_error("Failed to write host frame");
    ++frames;
}
