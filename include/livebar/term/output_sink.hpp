#pragma once

#include "livebar/common/types.hpp"
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>

namespace livebar {
namespace term {

class OutputSink {
public:
    virtual ~OutputSink() = default;

    // Both throw BarError (STREAM_WRITE_FAILED / STREAM_FLUSH_FAILED).
    virtual void write(const std::string& data) = 0;
    virtual void flush() = 0;

    virtual bool isTerminal() const = 0;
    virtual int columns() const = 0;
};

class FileSink : public OutputSink {
public:
    FileSink(FILE* stream, std::string name);

    void write(const std::string& data) override;
    void flush() override;

    bool isTerminal() const override;
    int columns() const override;

private:
    FILE* stream_;
    std::string name_;
    int fallback_columns_;
};

// In-memory destination with a fixed terminal flag and width.
class MemorySink : public OutputSink {
public:
    explicit MemorySink(bool terminal = true, int columns = 80);

    void write(const std::string& data) override;
    void flush() override;

    bool isTerminal() const override { return terminal_; }
    int columns() const override { return columns_; }

    std::string str() const;
    void clear();
    size_t flushCount() const;

private:
    bool terminal_;
    int columns_;
    mutable std::mutex mutex_;
    std::string buffer_;
    size_t flushes_ = 0;
};

// Destinations and clocks a bar or group renders with. Renders go to
// `render`; fallback status lines go to `log`.
struct Environment {
    std::shared_ptr<OutputSink> render;
    std::shared_ptr<OutputSink> log;
    common::ClockFn clock;
    common::WallClockFn wall_clock;

    static Environment standard();
};

}}
