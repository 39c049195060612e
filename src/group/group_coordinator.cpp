#include "livebar/group/group_coordinator.hpp"
#include "livebar/common/constants.hpp"
#include "livebar/common/error_codes.hpp"
#include "livebar/common/logger.hpp"
#include <spdlog/fmt/fmt.h>

namespace livebar {
namespace group {

namespace {

constexpr size_t NO_TICK = static_cast<size_t>(-1);

}

GroupCoordinator::GroupCoordinator(term::Environment env, bool thread_safe)
    : env_(std::move(env)),
      gate_(*env_.render),
      guard_(thread_safe) {}

std::string GroupCoordinator::cursorUp(int lines) {
    return lines > 0 ? fmt::format("\033[{}A", lines) : std::string();
}

std::string GroupCoordinator::cursorDown(int lines) {
    return lines > 0 ? fmt::format("\033[{}B", lines) : std::string();
}

int GroupCoordinator::findRow(const Renderable* row) const {
    for (size_t i = 0; i < rows_.size(); ++i) {
        if (rows_[i].source == row) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

int GroupCoordinator::offsetOf(size_t index) const {
    int offset = 0;
    for (size_t i = 0; i < index && i < rows_.size(); ++i) {
        offset += rows_[i].height;
    }
    return offset;
}

void GroupCoordinator::recomputeHeight() {
    block_height_ = offsetOf(rows_.size());
}

common::FramePhase GroupCoordinator::phaseFor(const Row& row, common::FramePhase live) const {
    return row.finalized ? common::FramePhase::FINAL : live;
}

std::string GroupCoordinator::appendLines(const format::RenderFrame& frame) const {
    std::string out;
    for (const auto& line : frame.lines) {
        out += line;
        out += "\n";
    }
    return out;
}

std::string GroupCoordinator::reprintFrom(size_t index, common::TimePoint now, int columns,
                                          size_t ticking) {
    std::string out;
    for (size_t i = index; i < rows_.size(); ++i) {
        auto live = i == ticking ? common::FramePhase::LIVE_TICK : common::FramePhase::LIVE_STATIC;
        auto frame = rows_[i].source->renderFrame(now, columns, phaseFor(rows_[i], live));
        rows_[i].height = frame.rows(columns);
        out += appendLines(frame);
    }
    recomputeHeight();
    return out;
}

void GroupCoordinator::emit(const std::string& data) {
    env_.render->write(data);
    env_.render->flush();
}

void GroupCoordinator::emitStatus(Row& row, common::TimePoint now, bool final) {
    env_.log->write(row.source->renderStatus(now, final) + "\n");
    env_.log->flush();
}

void GroupCoordinator::attach(Renderable* row) {
    auto lock = guard_.acquire();

    if (findRow(row) >= 0) {
        return;
    }

    auto now = env_.clock();
    rows_.push_back(Row{row, 0, finalized_});
    size_t index = rows_.size() - 1;
    gate_.admit(row->throttle(), now, common::RedrawReason::START);

    try {
        if (finalized_) {
            return;
        }
        if (gate_.animated()) {
            int columns = env_.render->columns();
            std::string out = cursorUp(block_height_);
            out += "\r";
            out += constants::ansi::CLEAR_DOWN;
            out += reprintFrom(0, now, columns, index);
            emit(out);
        } else {
            emitStatus(rows_[index], now, false);
        }
    } catch (const common::BarError&) {
        rows_.erase(rows_.begin() + index);
        recomputeHeight();
        throw;
    }

    common::Logger::instance().debug("[GroupCoordinator] Row attached | rows={} | height={} | mode={}",
                                     rows_.size(), block_height_, common::to_string(gate_.mode()));
}

bool GroupCoordinator::detach(Renderable* row) {
    auto lock = guard_.acquire();

    int index = findRow(row);
    if (index < 0) {
        return false;
    }

    if (finalized_ || !gate_.animated()) {
        rows_.erase(rows_.begin() + index);
        recomputeHeight();
        return true;
    }

    auto now = env_.clock();
    int columns = env_.render->columns();
    int up = block_height_ - offsetOf(index);

    rows_.erase(rows_.begin() + index);

    std::string out = cursorUp(up);
    out += "\r";
    out += constants::ansi::CLEAR_DOWN;
    out += reprintFrom(index, now, columns, NO_TICK);
    emit(out);

    common::Logger::instance().debug("[GroupCoordinator] Row detached | index={} | rows={} | height={}",
                                     index, rows_.size(), block_height_);
    return true;
}

void GroupCoordinator::redraw(Renderable* row, common::RedrawReason reason) {
    auto lock = guard_.acquire();

    if (finalized_) {
        return;
    }
    int index = findRow(row);
    if (index < 0 || rows_[index].finalized) {
        return;
    }

    Row& entry = rows_[index];
    auto now = env_.clock();
    if (!gate_.admit(entry.source->throttle(), now, reason)) {
        return;
    }

    if (!gate_.animated()) {
        emitStatus(entry, now, false);
        return;
    }

    int columns = env_.render->columns();
    auto frame = entry.source->renderFrame(now, columns, common::FramePhase::LIVE_TICK);
    int height = frame.rows(columns);
    int up = block_height_ - offsetOf(index);

    std::string out = cursorUp(up);
    if (height == entry.height && height == static_cast<int>(frame.lines.size())) {
        for (const auto& line : frame.lines) {
            out += "\r";
            out += constants::ansi::CLEAR_LINE;
            out += line;
            out += "\n";
        }
        out += cursorDown(up - height);
    } else {
        out += "\r";
        out += constants::ansi::CLEAR_DOWN;
        entry.height = height;
        out += appendLines(frame);
        out += reprintFrom(index + 1, now, columns, NO_TICK);
    }
    emit(out);
}

void GroupCoordinator::refreshAll() {
    auto lock = guard_.acquire();

    if (finalized_ || rows_.empty()) {
        return;
    }

    auto now = env_.clock();
    if (!gate_.animated()) {
        for (auto& row : rows_) {
            if (!row.finalized &&
                gate_.admit(row.source->throttle(), now, common::RedrawReason::REFRESH)) {
                emitStatus(row, now, false);
            }
        }
        return;
    }

    int columns = env_.render->columns();
    std::string out = cursorUp(block_height_);
    out += "\r";
    out += constants::ansi::CLEAR_DOWN;
    for (size_t i = 0; i < rows_.size(); ++i) {
        gate_.admit(rows_[i].source->throttle(), now, common::RedrawReason::REFRESH);
        auto frame = rows_[i].source->renderFrame(now, columns,
                                                  phaseFor(rows_[i], common::FramePhase::LIVE_TICK));
        rows_[i].height = frame.rows(columns);
        out += appendLines(frame);
    }
    recomputeHeight();
    emit(out);
}

void GroupCoordinator::println(const std::string& text) {
    auto lock = guard_.acquire();

    std::string line = text;
    if (line.empty() || line.back() != '\n') {
        line += "\n";
    }

    if (finalized_ || !gate_.animated() || rows_.empty()) {
        emit(line);
        return;
    }

    auto now = env_.clock();
    int columns = env_.render->columns();
    std::string out = cursorUp(block_height_);
    out += "\r";
    out += constants::ansi::CLEAR_DOWN;
    out += line;
    out += reprintFrom(0, now, columns, NO_TICK);
    emit(out);
}

void GroupCoordinator::finalizeRow(Renderable* row) {
    auto lock = guard_.acquire();

    if (finalized_) {
        return;
    }
    int index = findRow(row);
    if (index < 0 || rows_[index].finalized) {
        return;
    }

    Row& entry = rows_[index];
    entry.finalized = true;
    auto now = env_.clock();
    gate_.admit(entry.source->throttle(), now, common::RedrawReason::FINALIZE);

    if (!gate_.animated()) {
        emitStatus(entry, now, true);
        return;
    }

    int columns = env_.render->columns();
    int up = block_height_ - offsetOf(index);
    std::string out = cursorUp(up);
    out += "\r";
    out += constants::ansi::CLEAR_DOWN;
    out += reprintFrom(index, now, columns, NO_TICK);
    emit(out);
}

void GroupCoordinator::finalize() {
    auto lock = guard_.acquire();

    if (finalized_) {
        return;
    }
    finalized_ = true;

    auto now = env_.clock();
    if (!gate_.animated()) {
        for (auto& row : rows_) {
            if (!row.finalized) {
                row.finalized = true;
                gate_.admit(row.source->throttle(), now, common::RedrawReason::FINALIZE);
                emitStatus(row, now, true);
            }
        }
        return;
    }

    if (rows_.empty()) {
        return;
    }

    int columns = env_.render->columns();
    std::string out = cursorUp(block_height_);
    out += "\r";
    out += constants::ansi::CLEAR_DOWN;
    for (auto& row : rows_) {
        row.finalized = true;
        gate_.admit(row.source->throttle(), now, common::RedrawReason::FINALIZE);
    }
    out += reprintFrom(0, now, columns, NO_TICK);
    emit(out);

    common::Logger::instance().debug("[GroupCoordinator] Block finalized | rows={} | height={}",
                                     rows_.size(), block_height_);
}

bool GroupCoordinator::finalized() const {
    auto lock = guard_.acquire();
    return finalized_;
}

size_t GroupCoordinator::rowCount() const {
    auto lock = guard_.acquire();
    return rows_.size();
}

int GroupCoordinator::rowOffset(const Renderable* row) const {
    auto lock = guard_.acquire();
    int index = findRow(row);
    return index < 0 ? -1 : offsetOf(index);
}

int GroupCoordinator::blockHeight() const {
    auto lock = guard_.acquire();
    return block_height_;
}

}}
