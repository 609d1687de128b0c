#include "tile_develop/edit/history.hpp"

#include <chrono>

#include <catch2/catch_test_macros.hpp>

using namespace tile_develop::edit;
using std::chrono::milliseconds;

namespace {

EditState with_exposure(float ev) {
    EditState s;
    AdjustmentGroup g;
    g.id = 1;
    g.adjustments.push_back(Exposure{ev});
    s.add_group(g);
    return s;
}

EditOrigin origin(const std::string& path, Clock::time_point t) {
    return EditOrigin{path, t};
}

} // namespace

TEST_CASE("history_undo_all_returns_initial_state") {
    const EditState initial;
    HistoryStack history(initial);
    for (int i = 1; i <= 5; ++i) {
        history.commit(with_exposure(0.1f * static_cast<float>(i)));
    }
    REQUIRE(history.size() == 6);
    REQUIRE(history.current() == with_exposure(0.5f));

    int undone = 0;
    while (history.undo()) {
        ++undone;
    }
    REQUIRE(undone == 5);
    REQUIRE(history.current() == initial);
    REQUIRE_FALSE(history.can_undo());

    for (int i = 0; i < 5; ++i) {
        REQUIRE(history.redo());
    }
    REQUIRE(history.current() == with_exposure(0.5f));
    REQUIRE_FALSE(history.redo());
}

TEST_CASE("history_commit_after_undo_truncates_redo_tail") {
    HistoryStack history(EditState{});
    history.commit(with_exposure(1.0f));
    history.commit(with_exposure(2.0f));
    history.undo();
    REQUIRE(history.can_redo());

    history.commit(with_exposure(3.0f));
    REQUIRE_FALSE(history.can_redo());
    REQUIRE(history.size() == 3);
    REQUIRE(history.current() == with_exposure(3.0f));
}

TEST_CASE("history_coalesces_slider_drag_within_window") {
    HistoryStack history(EditState{}, milliseconds(400));
    const auto t0 = Clock::now();
    history.commit(with_exposure(0.1f), origin("group:1/exposure/ev", t0));
    history.commit(with_exposure(0.2f), origin("group:1/exposure/ev", t0 + milliseconds(100)));
    history.commit(with_exposure(0.3f), origin("group:1/exposure/ev", t0 + milliseconds(250)));

    REQUIRE(history.size() == 2);
    REQUIRE(history.current() == with_exposure(0.3f));
    history.undo();
    REQUIRE(history.current() == EditState{});
}

TEST_CASE("history_does_not_coalesce_across_parameters_or_window") {
    HistoryStack history(EditState{}, milliseconds(400));
    const auto t0 = Clock::now();
    history.commit(with_exposure(0.1f), origin("group:1/exposure/ev", t0));
    history.commit(with_exposure(0.2f), origin("group:1/contrast/amount", t0 + milliseconds(10)));
    REQUIRE(history.size() == 3);

    history.commit(with_exposure(0.3f),
                   origin("group:1/contrast/amount", t0 + milliseconds(2000)));
    REQUIRE(history.size() == 4);

    history.commit(with_exposure(0.4f));
    REQUIRE(history.size() == 5);
}

TEST_CASE("history_does_not_coalesce_after_undo") {
    HistoryStack history(EditState{}, milliseconds(400));
    const auto t0 = Clock::now();
    history.commit(with_exposure(0.1f), origin("p", t0));
    history.commit(with_exposure(0.2f), origin("q", t0 + milliseconds(10)));
    history.undo();
    history.commit(with_exposure(0.3f), origin("q", t0 + milliseconds(20)));
    REQUIRE(history.size() == 3);
    history.undo();
    REQUIRE(history.current() == with_exposure(0.1f));
}

TEST_CASE("history_sequence_is_monotonic") {
    HistoryStack history(EditState{});
    const uint64_t s0 = history.sequence();
    history.commit(with_exposure(1.0f));
    REQUIRE(history.sequence() > s0);
    history.undo();
    REQUIRE(history.sequence() == s0);
}

TEST_CASE("history_drops_oldest_entries_beyond_limit") {
    HistoryStack history(EditState{}, milliseconds(0), 3);
    for (int i = 1; i <= 5; ++i) {
        history.commit(with_exposure(static_cast<float>(i) * 0.5f));
    }
    REQUIRE(history.size() == 3);
    REQUIRE(history.current() == with_exposure(2.5f));
    history.undo();
    history.undo();
    REQUIRE_FALSE(history.can_undo());
    REQUIRE(history.current() == with_exposure(1.5f));
}

TEST_CASE("history_entries_share_immutable_snapshots") {
    HistoryStack history(EditState{});
    history.commit(with_exposure(1.0f));
    const auto snapshot = history.current_ptr();
    history.commit(with_exposure(2.0f));
    history.undo();
    REQUIRE(history.current_ptr() == snapshot);
}
