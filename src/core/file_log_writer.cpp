#include "core/file_log_writer.h"
#include <filesystem>
#include <iostream>
#include <system_error>

FileLogWriter::FileLogWriter(const std::string &fileName, size_t maxFileSize,
                             int maxBackupFiles)
    : fileName_(fileName), maxFileSize_(maxFileSize),
      maxBackupFiles_(maxBackupFiles < 1 ? 1 : maxBackupFiles) {
  file_.open(fileName_, std::ios::app);
  if (!file_.is_open()) {
    std::cerr << "FileLogWriter: could not open log file '" << fileName_
              << "'" << std::endl;
  }
}

bool FileLogWriter::write(const std::string &formattedMessage) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!file_.is_open())
    return false;

  checkAndRotateUnlocked();
  if (!file_.is_open())
    return false;

  file_ << formattedMessage << '\n';
  return file_.good();
}

void FileLogWriter::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open())
    file_.flush();
}

void FileLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

bool FileLogWriter::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return file_.is_open();
}

void FileLogWriter::checkAndRotateUnlocked() {
  file_.flush();

  std::error_code ec;
  auto fileSize = std::filesystem::file_size(fileName_, ec);
  if (!ec && fileSize >= maxFileSize_) {
    rotateUnlocked();
  }
}

// Shifts name.i to name.(i+1), dropping the oldest backup, then moves the
// live file to name.1 and reopens a fresh one. Filesystem errors leave the
// current file in place rather than losing log lines.
void FileLogWriter::rotateUnlocked() {
  file_.close();

  std::error_code ec;
  std::string oldest = fileName_ + "." + std::to_string(maxBackupFiles_);
  std::filesystem::remove(oldest, ec);

  for (int i = maxBackupFiles_ - 1; i > 0; --i) {
    std::string from = fileName_ + "." + std::to_string(i);
    std::string to = fileName_ + "." + std::to_string(i + 1);
    if (std::filesystem::exists(from, ec)) {
      std::filesystem::rename(from, to, ec);
    }
  }

  std::filesystem::rename(fileName_, fileName_ + ".1", ec);
  if (ec) {
    std::cerr << "FileLogWriter: rotation failed for '" << fileName_
              << "': " << ec.message() << std::endl;
  }

  file_.open(fileName_, std::ios::app);
}
