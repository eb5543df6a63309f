// src/storage/record_sink.cpp

#include "signal_ngin/storage/record_sink.hpp"
#include <filesystem>
#include <memory>

namespace signal_ngin {

FileRecordSink::FileRecordSink(std::string path) : path_(std::move(path)) {}

FileRecordSink::~FileRecordSink() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

Result<std::unique_ptr<FileRecordSink>> FileRecordSink::create(const std::string& path) {
    namespace fs = std::filesystem;
    std::error_code ec;

    fs::path target(path);
    if (fs::exists(target, ec)) {
        return make_error<std::unique_ptr<FileRecordSink>>(
            ErrorCode::FILE_IO_ERROR, "Refusing to reuse existing record file: " + path,
            "FileRecordSink");
    }
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return make_error<std::unique_ptr<FileRecordSink>>(
                ErrorCode::FILE_IO_ERROR,
                "Failed to create directory " + target.parent_path().string() + ": " +
                    ec.message(),
                "FileRecordSink");
        }
    }

    std::unique_ptr<FileRecordSink> sink(new FileRecordSink(path));
    sink->file_.open(path, std::ios::out | std::ios::app);
    if (!sink->file_.is_open()) {
        return make_error<std::unique_ptr<FileRecordSink>>(
            ErrorCode::FILE_IO_ERROR, "Failed to open record file: " + path, "FileRecordSink");
    }
    return Result<std::unique_ptr<FileRecordSink>>(std::move(sink));
}

Result<void> FileRecordSink::write_line(const std::string& line) {
    file_ << line << '\n';
    file_.flush();
    if (!file_.good()) {
        file_.clear();
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Write failed on " + path_,
                                "FileRecordSink");
    }
    return Result<void>();
}

Result<void> FileRecordSink::flush() {
    file_.flush();
    if (!file_.good()) {
        file_.clear();
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Flush failed on " + path_,
                                "FileRecordSink");
    }
    return Result<void>();
}

}  // namespace signal_ngin
