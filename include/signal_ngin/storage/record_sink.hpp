// include/signal_ngin/storage/record_sink.hpp
#pragma once

#include <fstream>
#include <memory>
#include <string>
#include "signal_ngin/core/error.hpp"

namespace signal_ngin {

/**
 * @brief Line-oriented append-only destination for persisted records
 */
class RecordSink {
public:
    virtual ~RecordSink() = default;

    /**
     * @brief Append one line (without trailing newline) and make it durable
     */
    virtual Result<void> write_line(const std::string& line) = 0;

    virtual Result<void> flush() = 0;

    virtual std::string describe() const = 0;
};

/**
 * @brief RecordSink backed by a new file
 *
 * The file must not exist yet; a run never appends to an earlier run's file.
 */
class FileRecordSink : public RecordSink {
public:
    /**
     * @return FILE_IO_ERROR if the file exists or cannot be created
     */
    static Result<std::unique_ptr<FileRecordSink>> create(const std::string& path);

    ~FileRecordSink() override;

    Result<void> write_line(const std::string& line) override;
    Result<void> flush() override;

    std::string describe() const override {
        return path_;
    }

private:
    explicit FileRecordSink(std::string path);

    std::string path_;
    std::ofstream file_;
};

}  // namespace signal_ngin
