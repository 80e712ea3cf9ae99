#include "gridpick/ui/multi_select.hpp"
#include "../mock_terminal.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>

namespace gridpick {

using ::testing::_;
using ::testing::Return;

class MultiSelectTest : public ::testing::Test {
protected:
    void SetUp() override {
        ON_CALL(terminal_, size()).WillByDefault([this]() { return size_; });
        ON_CALL(terminal_, write(_)).WillByDefault(Return(WriteStatus::OK));
        EXPECT_CALL(terminal_, size()).Times(::testing::AnyNumber());
        EXPECT_CALL(terminal_, write(_)).Times(::testing::AnyNumber());
    }

    // Live session that ends with exactly one restore
    auto expect_session() -> void {
        EXPECT_CALL(terminal_, enter()).WillOnce(Return(true));
        EXPECT_CALL(terminal_, exit()).Times(1);
    }

    auto script(std::vector<InputEvent> events) -> void {
        ::testing::Sequence sequence;
        for (auto& event : events) {
            EXPECT_CALL(terminal_, read_event()).InSequence(sequence).WillOnce(Return(event));
        }
    }

    std::vector<std::string> items_ = {"W", "X", "Y", "Z"};
    TerminalSize size_{.width = 80, .height = 24};
    ::testing::NiceMock<MockTerminal> terminal_;
};

TEST_F(MultiSelectTest, EmptyListConfirmsWithoutTouchingTerminal)
{
    EXPECT_CALL(terminal_, enter()).Times(0);
    EXPECT_CALL(terminal_, read_event()).Times(0);

    auto outcome = select_items(terminal_, {}, {});

    EXPECT_EQ(outcome.status, SelectionStatus::CONFIRMED);
    EXPECT_TRUE(outcome.selected.empty());
}

TEST_F(MultiSelectTest, UnavailableTerminalIsReported)
{
    EXPECT_CALL(terminal_, enter()).WillOnce(Return(false));
    EXPECT_CALL(terminal_, exit()).Times(0);
    EXPECT_CALL(terminal_, read_event()).Times(0);

    auto outcome = select_items(terminal_, items_, {});

    EXPECT_EQ(outcome.status, SelectionStatus::TERMINAL_UNAVAILABLE);
}

TEST_F(MultiSelectTest, ConfirmReturnsPreviousSelectionUnchanged)
{
    expect_session();
    script({key_event(KeyCode::ENTER)});

    std::vector<std::string> previous = {"Z", "X"};
    auto outcome = select_items(terminal_, items_, previous);

    EXPECT_EQ(outcome.status, SelectionStatus::CONFIRMED);
    EXPECT_EQ(outcome.selected, (std::vector<std::string>{"X", "Z"}));
}

TEST_F(MultiSelectTest, ToggleAndConfirm)
{
    expect_session();
    script({char_event(" "), key_event(KeyCode::ARROW_RIGHT), key_event(KeyCode::ARROW_RIGHT),
            char_event(" "), key_event(KeyCode::ENTER)});

    auto outcome = select_items(terminal_, items_, {});

    EXPECT_EQ(outcome.status, SelectionStatus::CONFIRMED);
    EXPECT_EQ(outcome.selected, (std::vector<std::string>{"W", "Y"}));
}

TEST_F(MultiSelectTest, EscapeCancelsWithoutSelection)
{
    expect_session();
    script({char_event(" "), key_event(KeyCode::ESCAPE)});

    auto outcome = select_items(terminal_, items_, {});

    EXPECT_EQ(outcome.status, SelectionStatus::CANCELLED);
    EXPECT_TRUE(outcome.selected.empty());
}

TEST_F(MultiSelectTest, QCancels)
{
    expect_session();
    script({char_event("q")});

    EXPECT_EQ(select_items(terminal_, items_, {}).status, SelectionStatus::CANCELLED);
}

TEST_F(MultiSelectTest, EnterWhileSearchingOnlyLeavesSearch)
{
    expect_session();
    script({char_event("x"), key_event(KeyCode::ENTER), char_event(" "),
            key_event(KeyCode::ENTER)});

    auto outcome = select_items(terminal_, items_, {});

    EXPECT_EQ(outcome.status, SelectionStatus::CONFIRMED);
    EXPECT_EQ(outcome.selected, (std::vector<std::string>{"X"}));
}

TEST_F(MultiSelectTest, SelectAllUnderFilterKeepsHiddenSelection)
{
    items_ = {"A", "B", "C"};
    expect_session();
    script({char_event("a"), ctrl_event('a'), key_event(KeyCode::ENTER),
            key_event(KeyCode::ENTER)});

    std::vector<std::string> previous = {"B"};
    auto outcome = select_items(terminal_, items_, previous);

    EXPECT_EQ(outcome.status, SelectionStatus::CONFIRMED);
    EXPECT_EQ(outcome.selected, (std::vector<std::string>{"A", "B"}));
}

TEST_F(MultiSelectTest, ResizeKeepsCursorAndSelection)
{
    expect_session();
    EXPECT_CALL(terminal_, read_event())
        .WillOnce(Return(key_event(KeyCode::ARROW_RIGHT)))
        .WillOnce([this]() {
            size_ = TerminalSize{.width = 10, .height = 6};
            return InputEvent::resize();
        })
        .WillOnce(Return(char_event(" ")))
        .WillOnce([this]() {
            size_ = TerminalSize{.width = 3, .height = 2};
            return InputEvent::resize();
        })
        .WillOnce(Return(key_event(KeyCode::ENTER)));

    auto outcome = select_items(terminal_, items_, {});

    EXPECT_EQ(outcome.status, SelectionStatus::CONFIRMED);
    EXPECT_EQ(outcome.selected, (std::vector<std::string>{"X"}));
}

TEST_F(MultiSelectTest, ClosedOutputStopsSession)
{
    expect_session();
    EXPECT_CALL(terminal_, write(_)).WillOnce(Return(WriteStatus::CLOSED));
    EXPECT_CALL(terminal_, read_event()).Times(0);

    auto outcome = select_items(terminal_, items_, {});

    EXPECT_EQ(outcome.status, SelectionStatus::OUTPUT_CLOSED);
    EXPECT_TRUE(outcome.selected.empty());
}

TEST_F(MultiSelectTest, FailedWriteIsDistinguishedFromClosedOutput)
{
    expect_session();
    EXPECT_CALL(terminal_, write(_)).WillOnce(Return(WriteStatus::FAILED));

    EXPECT_EQ(select_items(terminal_, items_, {}).status, SelectionStatus::OUTPUT_FAILED);
}

TEST_F(MultiSelectTest, EndOfInputAbandonsSession)
{
    expect_session();
    script({char_event(" "), InputEvent::end_of_input()});

    auto outcome = select_items(terminal_, items_, {});

    EXPECT_EQ(outcome.status, SelectionStatus::INPUT_CLOSED);
    EXPECT_TRUE(outcome.selected.empty());
}

TEST_F(MultiSelectTest, FrameIsRedrawnAfterEveryEvent)
{
    expect_session();
    script({key_event(KeyCode::ARROW_DOWN), key_event(KeyCode::ENTER)});
    EXPECT_CALL(terminal_, write(_)).Times(2).WillRepeatedly(Return(WriteStatus::OK));

    select_items(terminal_, items_, {});
}

TEST(HandleKeyTest, NavigationKeysMoveCursor)
{
    SelectionState state({"a", "b", "c", "d"}, []() { return TerminalSize{}; });

    EXPECT_EQ(handle_key(state, KeyEvent::key(KeyCode::END)), SessionAction::CONTINUE);
    EXPECT_EQ(state.cursor(), 3u);
    handle_key(state, KeyEvent::key(KeyCode::HOME));
    EXPECT_EQ(state.cursor(), 0u);
    handle_key(state, KeyEvent::text("l"));
    EXPECT_EQ(state.cursor(), 1u);
    handle_key(state, KeyEvent::key(KeyCode::ARROW_LEFT));
    EXPECT_EQ(state.cursor(), 0u);
}

TEST(HandleKeyTest, UnboundKeysAreIgnored)
{
    SelectionState state({"a", "b"}, []() { return TerminalSize{}; });

    EXPECT_EQ(handle_key(state, KeyEvent::key(KeyCode::TAB)), SessionAction::CONTINUE);
    EXPECT_EQ(handle_key(state, KeyEvent::ctrl('z')), SessionAction::CONTINUE);
    EXPECT_EQ(handle_key(state, KeyEvent::key(KeyCode::UNKNOWN)), SessionAction::CONTINUE);
    EXPECT_EQ(state.cursor(), 0u);
    EXPECT_EQ(state.selected_count(), 0u);
    EXPECT_FALSE(state.search_active());
}

} // namespace gridpick
