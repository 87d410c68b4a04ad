/**
 * @file json_sink.cpp
 * @brief RotatingFileSink.
 * @author log_courier contributors
 */

#include "telemetry/json_sink.hpp"

#include <system_error>

namespace log_courier {

namespace fs = std::filesystem;

RotatingFileSink::RotatingFileSink(fs::path dir, std::string prefix,
                                   uint32_t max_file_size_mb, uint32_t generations)
    : dir_(std::move(dir))
    , prefix_(std::move(prefix))
    , limit_bytes_(static_cast<uint64_t>(max_file_size_mb) << 20)
    , generations_(generations) {
    std::error_code ec;
    fs::create_directories(dir_, ec);

    const auto path = current_path();
    const auto existing = fs::file_size(path, ec);
    written_ = ec ? 0 : existing;
    out_.open(path, std::ios::app);
}

RotatingFileSink::~RotatingFileSink() {
    if (out_.is_open()) out_.flush();
}

fs::path RotatingFileSink::current_path() const {
    return dir_ / (prefix_ + ".ndjson");
}

fs::path RotatingFileSink::generation_path(uint32_t n) const {
    return dir_ / (prefix_ + "." + std::to_string(n) + ".ndjson");
}

void RotatingFileSink::write(std::string_view json_line) {
    const uint64_t line_bytes = json_line.size() + 1;
    if (written_ > 0 && written_ + line_bytes > limit_bytes_) rotate();
    if (!out_.is_open()) return;

    out_ << json_line << '\n';
    written_ += line_bytes;
}

void RotatingFileSink::flush() {
    if (out_.is_open()) out_.flush();
}

void RotatingFileSink::rotate() {
    out_.close();

    std::error_code ec;
    if (generations_ > 0) {
        fs::remove(generation_path(generations_), ec);
        for (uint32_t n = generations_; n > 1; --n) {
            fs::rename(generation_path(n - 1), generation_path(n), ec);
        }
        fs::rename(current_path(), generation_path(1), ec);
    }

    out_.open(current_path(), std::ios::trunc);
    written_ = 0;
    ++rotations_;
}

}  // namespace log_courier
