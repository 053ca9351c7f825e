#ifndef LOG_WRITER_H
#define LOG_WRITER_H

#include <ostream>
#include <string>

// Destination for formatted log lines. write() returns false when the line
// could not be stored, in which case the logger falls back to stderr.
class ILogWriter {
public:
  virtual ~ILogWriter() = default;

  virtual bool write(const std::string &formattedMessage) = 0;
  virtual void flush() = 0;
  virtual void close() = 0;
  virtual bool isOpen() const = 0;
};

// Writes to a stream owned by the caller, which must outlive the writer.
class StreamLogWriter : public ILogWriter {
  std::ostream *out_;

public:
  explicit StreamLogWriter(std::ostream &out) : out_(&out) {}

  bool write(const std::string &formattedMessage) override {
    if (!out_)
      return false;
    *out_ << formattedMessage << '\n';
    return out_->good();
  }
  void flush() override {
    if (out_)
      out_->flush();
  }
  void close() override {
    flush();
    out_ = nullptr;
  }
  bool isOpen() const override { return out_ != nullptr; }
};

#endif
