/**
 * @file json_sink.hpp
 * @brief NDJSON log sinks: rotating file, stdout, null and in-memory.
 */

#pragma once

#include "core/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace cluster_scaler {

/**
 * @brief Writes NDJSON to size-rotated log files.
 *
 * The active file is <prefix>.ndjson; rotated files are <prefix>.1.ndjson
 * (newest) up to <prefix>.<max_files>.ndjson (oldest, then dropped).
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    /// Byte limit is exposed so tests can rotate with tiny files.
    void set_max_file_size_bytes(uint64_t bytes) noexcept { max_file_size_bytes_ = bytes; }

    [[nodiscard]] std::filesystem::path active_path() const;

private:
    void rotate_if_needed();
    [[nodiscard]] std::filesystem::path rotated_path(uint32_t index) const;

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stdout.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

/**
 * @brief Keeps every record in memory; used by tests to assert on log output.
 *
 * The line buffer is shared so a test can keep a handle after handing the
 * sink itself to a Logger.
 */
class MemorySink : public ILogSink {
public:
    struct Buffer {
        mutable std::mutex mutex;
        std::vector<std::string> lines;

        [[nodiscard]] std::vector<std::string> snapshot() const;
        [[nodiscard]] size_t count_containing(std::string_view needle) const;
    };

    MemorySink();

    void write(std::string_view json_line) override;
    void flush() override {}

    [[nodiscard]] std::shared_ptr<Buffer> buffer() const { return buffer_; }

private:
    std::shared_ptr<Buffer> buffer_;
};

}  // namespace cluster_scaler
