/**
 * @file json_sink.hpp
 * @brief Where diagnostics lines go: size-bounded files or a stream.
 * @author log_courier contributors
 */

#pragma once

#include "core/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <ostream>
#include <string>

namespace log_courier {

/**
 * @brief NDJSON files under a directory, rotated by size.
 *
 * Lines go to `<dir>/<prefix>.ndjson`. A write that would push the file past
 * the size limit first shifts it to `<prefix>.1.ndjson` (older generations
 * move up by one) and starts an empty file. At most `generations` rotated
 * files are kept; zero means the active file is simply truncated.
 */
class RotatingFileSink : public ILogSink {
public:
    RotatingFileSink(std::filesystem::path dir, std::string prefix,
                     uint32_t max_file_size_mb = 10, uint32_t generations = 3);
    ~RotatingFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] std::filesystem::path current_path() const;
    [[nodiscard]] uint32_t rotations() const noexcept { return rotations_; }

    void set_max_file_size_bytes(uint64_t bytes) noexcept { limit_bytes_ = bytes; }

private:
    void rotate();
    [[nodiscard]] std::filesystem::path generation_path(uint32_t n) const;

    std::filesystem::path dir_;
    std::string prefix_;
    uint64_t limit_bytes_;
    uint32_t generations_;
    std::ofstream out_;
    uint64_t written_ = 0;
    uint32_t rotations_ = 0;
};

/// One line per write to a caller-owned stream (std::clog for the CLI).
class StreamSink : public ILogSink {
public:
    explicit StreamSink(std::ostream& out) : out_(out) {}

    void write(std::string_view json_line) override { out_ << json_line << '\n'; }
    void flush() override { out_.flush(); }

private:
    std::ostream& out_;
};

}  // namespace log_courier
