#include "livebar/term/output_sink.hpp"
#include "livebar/common/config.hpp"
#include "livebar/common/error_codes.hpp"
#include <cerrno>
#include <cstring>
#include <sys/ioctl.h>
#include <unistd.h>

namespace livebar {
namespace term {

namespace {

common::ErrorContext streamContext(const std::string& name, int error_number) {
    common::ErrorContext ctx;
    ctx.component = "OutputSink";
    ctx.details["stream"] = name;
    ctx.details["errno"] = std::strerror(error_number);
    return ctx;
}

}

FileSink::FileSink(FILE* stream, std::string name)
    : stream_(stream),
      name_(std::move(name)),
      fallback_columns_(common::Config::instance().global().render.fallback_columns) {}

void FileSink::write(const std::string& data) {
    if (data.empty()) {
        return;
    }
    errno = 0;
    size_t written = std::fwrite(data.data(), 1, data.size(), stream_);
    if (written != data.size() || std::ferror(stream_)) {
        int error_number = errno != 0 ? errno : EIO;
        std::clearerr(stream_);
        throw common::BarError(common::BarErrorCode::STREAM_WRITE_FAILED,
                               streamContext(name_, error_number));
    }
}

void FileSink::flush() {
    errno = 0;
    if (std::fflush(stream_) != 0) {
        int error_number = errno != 0 ? errno : EIO;
        std::clearerr(stream_);
        throw common::BarError(common::BarErrorCode::STREAM_FLUSH_FAILED,
                               streamContext(name_, error_number));
    }
}

bool FileSink::isTerminal() const {
    return isatty(fileno(stream_)) != 0;
}

int FileSink::columns() const {
    struct winsize w;
    if (ioctl(fileno(stream_), TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return w.ws_col;
    }
    return fallback_columns_ > 0 ? fallback_columns_ : 80;
}

MemorySink::MemorySink(bool terminal, int columns)
    : terminal_(terminal), columns_(columns) {}

void MemorySink::write(const std::string& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_ += data;
}

void MemorySink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++flushes_;
}

std::string MemorySink::str() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_;
}

void MemorySink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.clear();
}

size_t MemorySink::flushCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return flushes_;
}

Environment Environment::standard() {
    Environment env;
    env.render = std::make_shared<FileSink>(stdout, "stdout");
    env.log = std::make_shared<FileSink>(stderr, "stderr");
    env.clock = []() { return common::SteadyClock::now(); };
    env.wall_clock = []() { return std::chrono::system_clock::now(); };
    return env;
}

}}
