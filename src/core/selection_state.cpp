#include "gridpick/core/selection_state.hpp"
#include "gridpick/core/item_filter.hpp"
#include "gridpick/core/text.hpp"

#include <algorithm>
#include <unordered_set>

namespace gridpick {

namespace {

// U+3000 IDEOGRAPHIC SPACE, what a space bar sends under some CJK input methods
constexpr std::string_view IDEOGRAPHIC_SPACE = "\xE3\x80\x80";

} // namespace

SelectionState::SelectionState(std::vector<std::string> items, SizeProvider size_provider)
    : items_(std::move(items)), size_provider_(std::move(size_provider)) {
    item_widths_.reserve(items_.size());
    for (const auto& item : items_) {
        item_widths_.push_back(text::display_width(item));
    }
    refresh_filter(true);
}

auto SelectionState::select_item(size_t index) -> void {
    if (index < items_.size()) {
        selected_.insert(index);
    }
}

auto SelectionState::preselect(std::span<const std::string> previous_selection) -> void {
    std::unordered_set<std::string_view> previous(previous_selection.begin(),
                                                  previous_selection.end());
    for (size_t i = 0; i < items_.size(); ++i) {
        if (previous.contains(items_[i])) {
            select_item(i);
        }
    }
}

auto SelectionState::invalidate_layout() -> void { cached_layout_.reset(); }

auto SelectionState::layout() -> GridLayout {
    if (!cached_layout_) {
        cached_layout_ = compute_grid_layout(size_provider_(), widest_filtered_item(),
                                             visible_count());
    }
    return *cached_layout_;
}

auto SelectionState::prepare_frame() -> GridLayout {
    auto current = layout();
    ensure_visible(current);
    return current;
}

auto SelectionState::set_query(std::string query, bool reset_position) -> void {
    search_query_ = std::move(query);
    refresh_filter(reset_position);
}

auto SelectionState::refresh_filter(bool reset_position) -> void {
    filtered_indices_ = filter_items(items_, search_query_);
    invalidate_layout();

    if (reset_position || filtered_indices_.empty()) {
        cursor_ = 0;
        viewport_offset_ = 0;
        return;
    }

    cursor_ = std::min(cursor_, filtered_indices_.size() - 1);
    ensure_visible(layout());
}

auto SelectionState::ensure_visible(const GridLayout& layout) -> void {
    auto visible = visible_count();
    if (visible == 0) {
        cursor_ = 0;
        viewport_offset_ = 0;
        return;
    }

    if (cursor_ >= visible) {
        cursor_ = visible - 1;
    }

    auto capacity = layout.page_capacity();
    if (capacity == 0) {
        viewport_offset_ = 0;
        return;
    }

    // Pages are row-major runs of `capacity` cells
    viewport_offset_ = (cursor_ / capacity) * capacity;
}

auto SelectionState::widest_filtered_item() const -> size_t {
    size_t widest = 0;
    for (auto index : filtered_indices_) {
        widest = std::max(widest, item_widths_[index]);
    }
    return widest;
}

auto SelectionState::current_item_index() const -> std::optional<size_t> {
    if (cursor_ < filtered_indices_.size()) {
        return filtered_indices_[cursor_];
    }
    return std::nullopt;
}

// --- Search entry ---

auto SelectionState::enter_search_mode() -> void { search_active_ = true; }

auto SelectionState::exit_search_mode() -> void { search_active_ = false; }

auto SelectionState::push_search_char(std::string_view ch) -> void {
    search_query_.append(ch);
    refresh_filter(true);
}

auto SelectionState::pop_search_char() -> void {
    text::pop_last_codepoint(search_query_);
    refresh_filter(true);
}

auto SelectionState::clear_search() -> void {
    if (!search_query_.empty()) {
        search_query_.clear();
        refresh_filter(true);
    }
    search_active_ = false;
}

auto SelectionState::is_typable(const KeyEvent& key) -> bool {
    return key.code == KeyCode::CHARACTER && !text::is_control_character(key.character)
           && (key.modifiers.none() || key.modifiers.shift_only());
}

auto SelectionState::is_toggle_key(const KeyEvent& key) -> bool {
    return key.code == KeyCode::CHARACTER && key.modifiers.none()
           && (key.character == " " || key.character == IDEOGRAPHIC_SPACE);
}

auto SelectionState::is_reserved_hotkey(const KeyEvent& key) -> bool {
    if (is_toggle_key(key)) {
        return true;
    }
    return key.is_char('q') || key.is_char('h') || key.is_char('j') || key.is_char('k')
           || key.is_char('l');
}

auto SelectionState::handle_search_key(const KeyEvent& key) -> bool {
    if (search_active_) {
        switch (key.code) {
        case KeyCode::ESCAPE:
        case KeyCode::DELETE:
            clear_search();
            return true;
        case KeyCode::BACKSPACE:
            if (search_query_.empty()) {
                exit_search_mode();
            } else {
                pop_search_char();
            }
            return true;
        case KeyCode::ENTER:
            // Leaves text entry only; confirming the session takes a second Enter
            exit_search_mode();
            return true;
        case KeyCode::CHARACTER:
            if (is_typable(key)) {
                push_search_char(key.character);
                return true;
            }
            break;
        default:
            break;
        }
        return false;
    }

    if (key.is_char('/') && key.modifiers.none()) {
        enter_search_mode();
        return true;
    }

    if (is_typable(key) && !is_reserved_hotkey(key)) {
        search_query_.clear();
        enter_search_mode();
        push_search_char(key.character);
        return true;
    }

    return false;
}

// --- Navigation ---

auto SelectionState::move_up() -> void {
    auto current = layout();
    if (cursor_ >= current.columns) {
        cursor_ -= current.columns;
    }
    ensure_visible(current);
}

auto SelectionState::move_down() -> void {
    auto current = layout();
    auto visible = visible_count();
    if (visible == 0) {
        return;
    }
    if (cursor_ + current.columns < visible) {
        cursor_ += current.columns;
    } else {
        cursor_ = visible - 1;
    }
    ensure_visible(current);
}

auto SelectionState::move_left() -> void {
    if (cursor_ > 0) {
        --cursor_;
    }
    ensure_visible(layout());
}

auto SelectionState::move_right() -> void {
    if (cursor_ + 1 < visible_count()) {
        ++cursor_;
    }
    ensure_visible(layout());
}

auto SelectionState::page_up() -> void {
    auto current = layout();
    auto step = current.page_capacity();
    cursor_ = cursor_ > step ? cursor_ - step : 0;
    ensure_visible(current);
}

auto SelectionState::page_down() -> void {
    auto current = layout();
    auto visible = visible_count();
    if (visible == 0) {
        return;
    }
    auto step = current.page_capacity();
    if (cursor_ + step < visible) {
        cursor_ += step;
    } else {
        cursor_ = visible - 1;
    }
    ensure_visible(current);
}

auto SelectionState::move_home() -> void {
    cursor_ = 0;
    ensure_visible(layout());
}

auto SelectionState::move_end() -> void {
    auto visible = visible_count();
    if (visible > 0) {
        cursor_ = visible - 1;
        ensure_visible(layout());
    }
}

// --- Selection ---

auto SelectionState::toggle_current() -> void {
    auto index = current_item_index();
    if (!index) {
        return;
    }
    if (selected_.contains(*index)) {
        selected_.erase(*index);
    } else {
        selected_.insert(*index);
    }
}

auto SelectionState::select_all() -> void {
    if (filter_matches_full_list()) {
        selected_.clear();
    }
    selected_.insert(filtered_indices_.begin(), filtered_indices_.end());
}

auto SelectionState::clear_all() -> void {
    if (filter_matches_full_list()) {
        selected_.clear();
        return;
    }
    for (auto index : filtered_indices_) {
        selected_.erase(index);
    }
}

auto SelectionState::finish() && -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(selected_.size());
    for (auto index : selected_) {
        result.push_back(std::move(items_[index]));
    }
    return result;
}

} // namespace gridpick
