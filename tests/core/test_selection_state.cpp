#include "gridpick/core/selection_state.hpp"
#include <gtest/gtest.h>

#include <random>

namespace gridpick {

class SelectionStateTest : public ::testing::Test {
protected:
    auto make_state(std::vector<std::string> items) -> SelectionState {
        return SelectionState(std::move(items), [this]() { return size_; });
    }

    // "it00" .. "it<n-1>", all four cells wide
    static auto numbered_items(size_t count) -> std::vector<std::string> {
        std::vector<std::string> items;
        for (size_t i = 0; i < count; ++i) {
            items.push_back((i < 10 ? "it0" : "it") + std::to_string(i));
        }
        return items;
    }

    auto expect_cursor_on_visible_page(SelectionState& state) -> void {
        auto layout = state.prepare_frame();
        auto capacity = layout.page_capacity();
        ASSERT_GT(capacity, 0u);
        EXPECT_EQ(state.viewport_offset() % capacity, 0u);
        if (state.visible_count() == 0) {
            EXPECT_EQ(state.cursor(), 0u);
            EXPECT_EQ(state.viewport_offset(), 0u);
            return;
        }
        EXPECT_LT(state.cursor(), state.visible_count());
        EXPECT_GE(state.cursor(), state.viewport_offset());
        EXPECT_LT(state.cursor(), state.viewport_offset() + capacity);
    }

    TerminalSize size_{.width = 80, .height = 24};
};

TEST_F(SelectionStateTest, StartsWithEverythingVisible)
{
    auto state = make_state({"a", "b", "c"});

    EXPECT_EQ(state.filtered_indices(), (std::vector<size_t>{0, 1, 2}));
    EXPECT_EQ(state.cursor(), 0u);
    EXPECT_EQ(state.viewport_offset(), 0u);
    EXPECT_FALSE(state.search_active());
    EXPECT_TRUE(state.search_query().empty());
    EXPECT_EQ(state.selected_count(), 0u);
    EXPECT_TRUE(state.filter_matches_full_list());
}

TEST_F(SelectionStateTest, PreselectChecksKnownItemsOnly)
{
    auto state = make_state({"W", "X", "Y", "Z"});
    std::vector<std::string> previous = {"Z", "missing", "X"};
    state.preselect(previous);

    EXPECT_EQ(state.selected_indices(), (std::set<size_t>{1, 3}));
}

TEST_F(SelectionStateTest, SelectItemIgnoresOutOfRangeIndex)
{
    auto state = make_state({"a", "b"});
    state.select_item(5);
    EXPECT_EQ(state.selected_count(), 0u);
}

TEST_F(SelectionStateTest, FinishReturnsSelectionInOriginalOrder)
{
    auto state = make_state({"W", "X", "Y", "Z"});
    std::vector<std::string> previous = {"Z", "X"};
    state.preselect(previous);

    auto result = std::move(state).finish();
    EXPECT_EQ(result, (std::vector<std::string>{"X", "Z"}));
}

TEST_F(SelectionStateTest, FinishWithNothingSelectedIsEmpty)
{
    auto state = make_state({"a", "b"});
    EXPECT_TRUE(std::move(state).finish().empty());
}

TEST_F(SelectionStateTest, HorizontalMovesClampAtEnds)
{
    auto state = make_state({"a", "b", "c"});

    state.move_left();
    EXPECT_EQ(state.cursor(), 0u);

    state.move_right();
    state.move_right();
    state.move_right();
    EXPECT_EQ(state.cursor(), 2u);
}

TEST_F(SelectionStateTest, VerticalMovesStepByColumnCount)
{
    size_ = TerminalSize{.width = 22, .height = 8};  // 2 columns of 8, 3 rows
    auto state = make_state(numbered_items(30));
    ASSERT_EQ(state.layout().columns, 2u);

    state.move_down();
    EXPECT_EQ(state.cursor(), 2u);

    state.move_up();
    EXPECT_EQ(state.cursor(), 0u);

    // Already on the first row
    state.move_right();
    state.move_up();
    EXPECT_EQ(state.cursor(), 1u);
}

TEST_F(SelectionStateTest, MoveDownClampsToLastItem)
{
    size_ = TerminalSize{.width = 22, .height = 8};
    auto state = make_state(numbered_items(29));

    state.move_end();
    EXPECT_EQ(state.cursor(), 28u);
    state.move_left();
    state.move_down();
    EXPECT_EQ(state.cursor(), 28u);
}

TEST_F(SelectionStateTest, PagingMovesByPageCapacity)
{
    size_ = TerminalSize{.width = 22, .height = 8};
    auto state = make_state(numbered_items(30));
    ASSERT_EQ(state.layout().page_capacity(), 6u);

    state.page_down();
    EXPECT_EQ(state.cursor(), 6u);
    EXPECT_EQ(state.viewport_offset(), 6u);

    state.page_down();
    EXPECT_EQ(state.cursor(), 12u);
    EXPECT_EQ(state.viewport_offset(), 12u);

    state.page_up();
    EXPECT_EQ(state.cursor(), 6u);
    EXPECT_EQ(state.viewport_offset(), 6u);

    state.move_end();
    EXPECT_EQ(state.cursor(), 29u);
    EXPECT_EQ(state.viewport_offset(), 24u);

    state.page_down();
    EXPECT_EQ(state.cursor(), 29u);

    state.move_home();
    EXPECT_EQ(state.cursor(), 0u);
    EXPECT_EQ(state.viewport_offset(), 0u);
}

TEST_F(SelectionStateTest, PageUpNearTopGoesToFirstItem)
{
    size_ = TerminalSize{.width = 22, .height = 8};
    auto state = make_state(numbered_items(30));

    state.move_right();
    state.move_right();
    state.move_right();
    state.page_up();
    EXPECT_EQ(state.cursor(), 0u);
}

TEST_F(SelectionStateTest, CursorStaysOnVisiblePageThroughMixedOperations)
{
    auto state = make_state(numbered_items(57));
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> pick(0, 11);
    const std::vector<TerminalSize> sizes = {
        {.width = 22, .height = 8}, {.width = 80, .height = 24}, {.width = 5, .height = 3},
        {.width = 40, .height = 10}};

    for (int step = 0; step < 500; ++step) {
        switch (pick(rng)) {
        case 0: state.move_up(); break;
        case 1: state.move_down(); break;
        case 2: state.move_left(); break;
        case 3: state.move_right(); break;
        case 4: state.page_up(); break;
        case 5: state.page_down(); break;
        case 6: state.move_home(); break;
        case 7: state.move_end(); break;
        case 8: state.toggle_current(); break;
        case 9:
            size_ = sizes[static_cast<size_t>(step) % sizes.size()];
            state.invalidate_layout();
            break;
        case 10: state.set_query(step % 3 == 0 ? "" : "1", false); break;
        case 11: state.set_query(step % 2 == 0 ? "it4" : "nothing", true); break;
        }
        expect_cursor_on_visible_page(state);
    }
}

TEST_F(SelectionStateTest, ToggleRecordsCanonicalIndex)
{
    auto state = make_state({"alpha", "beta", "gamma", "delta"});
    state.set_query("ta", true);
    ASSERT_EQ(state.filtered_indices(), (std::vector<size_t>{1, 3}));

    state.move_right();
    ASSERT_EQ(state.current_item_index(), 3u);
    state.toggle_current();

    state.set_query("", true);
    EXPECT_TRUE(state.is_selected(3));
    EXPECT_FALSE(state.is_selected(1));
    EXPECT_EQ(state.selected_count(), 1u);
}

TEST_F(SelectionStateTest, ToggleTwiceRestoresSelection)
{
    auto state = make_state({"a", "b"});
    state.toggle_current();
    EXPECT_TRUE(state.is_selected(0));
    state.toggle_current();
    EXPECT_FALSE(state.is_selected(0));
}

TEST_F(SelectionStateTest, ToggleOnEmptyViewDoesNothing)
{
    auto state = make_state({"a", "b"});
    state.set_query("zzz", true);
    ASSERT_EQ(state.visible_count(), 0u);
    EXPECT_FALSE(state.current_item_index().has_value());

    state.toggle_current();
    EXPECT_EQ(state.selected_count(), 0u);
}

TEST_F(SelectionStateTest, SelectAllWithoutFilterSelectsEverything)
{
    auto state = make_state({"a", "b", "c"});
    state.select_all();
    EXPECT_EQ(state.selected_indices(), (std::set<size_t>{0, 1, 2}));
}

TEST_F(SelectionStateTest, SelectAllUnderFilterKeepsHiddenSelections)
{
    auto state = make_state({"A", "B", "C"});
    std::vector<std::string> previous = {"B"};
    state.preselect(previous);

    state.set_query("A", true);
    state.select_all();

    EXPECT_EQ(state.selected_indices(), (std::set<size_t>{0, 1}));
}

TEST_F(SelectionStateTest, ClearAllUnderFilterOnlyClearsVisible)
{
    auto state = make_state({"A", "B", "C"});
    state.select_all();

    state.set_query("b", true);
    state.clear_all();

    EXPECT_EQ(state.selected_indices(), (std::set<size_t>{0, 2}));
}

TEST_F(SelectionStateTest, ClearAllWithoutFilterClearsEverything)
{
    auto state = make_state({"A", "B", "C"});
    state.select_all();
    state.clear_all();
    EXPECT_EQ(state.selected_count(), 0u);
}

TEST_F(SelectionStateTest, ResizeKeepsCursorAndSelection)
{
    auto state = make_state(numbered_items(30));
    for (int i = 0; i < 20; ++i) {
        state.move_right();
    }
    state.toggle_current();
    ASSERT_EQ(state.layout().columns, 9u);

    size_ = TerminalSize{.width = 22, .height = 8};
    state.invalidate_layout();
    EXPECT_FALSE(state.has_cached_layout());

    auto layout = state.prepare_frame();
    EXPECT_EQ(layout.columns, 2u);
    EXPECT_EQ(layout.visible_rows, 3u);
    EXPECT_EQ(state.cursor(), 20u);
    EXPECT_EQ(state.viewport_offset(), 18u);
    EXPECT_EQ(state.selected_indices(), (std::set<size_t>{20}));
}

TEST_F(SelectionStateTest, QueryChangeRecomputesColumnWidth)
{
    auto state = make_state({"a", "much-longer-item"});
    EXPECT_EQ(state.layout().column_width, 20u);
    EXPECT_TRUE(state.has_cached_layout());

    state.set_query("a", true);
    EXPECT_FALSE(state.has_cached_layout());
    EXPECT_EQ(state.layout().column_width, 5u);
}

TEST_F(SelectionStateTest, QueryWithResetReturnsToTop)
{
    auto state = make_state({"apple", "apricot", "banana", "avocado"});
    state.move_end();

    state.set_query("a", true);
    EXPECT_EQ(state.cursor(), 0u);
    EXPECT_EQ(state.viewport_offset(), 0u);
}

TEST_F(SelectionStateTest, QueryWithoutResetClampsCursor)
{
    auto state = make_state({"apple", "apricot", "banana", "avocado", "blueberry"});
    state.move_right();
    state.move_right();
    state.move_right();

    state.set_query("a", false);
    EXPECT_EQ(state.visible_count(), 4u);
    EXPECT_EQ(state.cursor(), 3u);

    state.set_query("ap", false);
    EXPECT_EQ(state.visible_count(), 2u);
    EXPECT_EQ(state.cursor(), 1u);
}

TEST_F(SelectionStateTest, FilterReportsPartialView)
{
    auto state = make_state({"apple", "banana"});
    state.set_query("ban", true);
    EXPECT_FALSE(state.filter_matches_full_list());
    EXPECT_EQ(state.visible_count(), 1u);
    EXPECT_EQ(state.total_count(), 2u);
}

} // namespace gridpick
