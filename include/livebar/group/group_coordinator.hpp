#pragma once

#include "livebar/common/types.hpp"
#include "livebar/core/sync_guard.hpp"
#include "livebar/format/frame_renderer.hpp"
#include "livebar/term/output_sink.hpp"
#include "livebar/term/tty_gate.hpp"
#include <string>
#include <vector>

namespace livebar {
namespace group {

// A row the coordinator can draw. Implementations guard their own state;
// the coordinator calls in while holding its write lock, never the reverse.
class Renderable {
public:
    virtual ~Renderable() = default;

    virtual format::RenderFrame renderFrame(common::TimePoint now, int columns,
                                            common::FramePhase phase) = 0;
    virtual std::string renderStatus(common::TimePoint now, bool final) = 0;
    virtual term::RowThrottle& throttle() = 0;
};

// Owns the rendered block of one or more rows sharing an output stream.
//
// Rows are stacked top to bottom in attach order. Between writes the
// cursor rests at column 0 of the line below the block, so every redraw
// moves up to its row, rewrites it and comes back down. Callers printing
// through println() land above the block, which is then redrawn below.
class GroupCoordinator {
public:
    GroupCoordinator(term::Environment env, bool thread_safe);

    GroupCoordinator(const GroupCoordinator&) = delete;
    GroupCoordinator& operator=(const GroupCoordinator&) = delete;

    // Appends a row and redraws the whole block once. In fallback mode the
    // row's first status line is written instead.
    void attach(Renderable* row);

    // Collapses the block: the removed row and everything below it are
    // cleared and the rows below are reprinted one slot higher. Returns false
    // when the row is not attached.
    bool detach(Renderable* row);

    void redraw(Renderable* row, common::RedrawReason reason);
    void refreshAll();
    void println(const std::string& text);

    // Final rendering for one row; later redraws of that row keep its final
    // form.
    void finalizeRow(Renderable* row);

    // One final redraw of the whole block, each line newline-terminated.
    // Later calls are no-ops.
    void finalize();

    bool finalized() const;
    size_t rowCount() const;
    int rowOffset(const Renderable* row) const;
    int blockHeight() const;

    common::DisplayMode mode() const { return gate_.mode(); }
    const term::Environment& environment() const { return env_; }
    common::TimePoint now() const { return env_.clock(); }

private:
    struct Row {
        Renderable* source;
        int height;
        bool finalized;
    };

    term::Environment env_;
    term::TtyGate gate_;
    core::SyncGuard guard_;
    std::vector<Row> rows_;
    int block_height_ = 0;
    bool finalized_ = false;

    int findRow(const Renderable* row) const;
    int offsetOf(size_t index) const;
    void recomputeHeight();

    common::FramePhase phaseFor(const Row& row, common::FramePhase live) const;
    std::string reprintFrom(size_t index, common::TimePoint now, int columns, size_t ticking);
    std::string appendLines(const format::RenderFrame& frame) const;

    void emit(const std::string& data);
    void emitStatus(Row& row, common::TimePoint now, bool final);

    static std::string cursorUp(int lines);
    static std::string cursorDown(int lines);
};

}}
